#include "util/link.hpp"

#include <string_view>
#include <vector>

namespace ferry::util {

static bool hasAccessCode(const std::string& link) {
    return link.find("?pwd=") != std::string::npos || link.find("&pwd=") != std::string::npos;
}

SplitLink splitAccessCode(const std::string& link) {
    if (!hasAccessCode(link)) return {link, ""};

    const auto q = link.find('?');
    if (q == std::string::npos) return {link, ""};

    const auto hash = link.find('#', q);
    const std::string path = link.substr(0, q);
    const std::string fragment = hash == std::string::npos ? "" : link.substr(hash);
    std::string_view query(link);
    query = query.substr(q + 1, hash == std::string::npos ? std::string::npos : hash - q - 1);

    SplitLink out;
    std::vector<std::string_view> kept;
    while (!query.empty()) {
        const auto amp = query.find('&');
        std::string_view part = query.substr(0, amp);
        if (amp == std::string_view::npos) query = {};
        else query.remove_prefix(amp + 1);

        if (part.empty()) continue;

        const auto eq = part.find('=');
        const std::string_view key = part.substr(0, eq);
        if (key == "pwd") {
            // first occurrence wins
            if (out.code.empty() && eq != std::string_view::npos) out.code = std::string(part.substr(eq + 1));
            continue;
        }
        kept.push_back(part);
    }

    out.base = path;
    for (size_t i = 0; i < kept.size(); ++i) {
        out.base += i == 0 ? '?' : '&';
        out.base += kept[i];
    }
    out.base += fragment;
    return out;
}

std::string withAccessCode(const std::string& base, const std::string& code) {
    if (code.empty() || hasAccessCode(base)) return base;

    // the code belongs to the query, ahead of any fragment
    const auto hash = base.find('#');
    std::string out = base.substr(0, hash);
    out += out.find('?') == std::string::npos ? '?' : '&';
    out += "pwd=" + code;
    if (hash != std::string::npos) out += base.substr(hash);
    return out;
}

} // namespace ferry::util
