#include "remote/ErrorCodes.hpp"

#include <unordered_map>

namespace ferry::remote {

static const std::unordered_map<int, std::string>& descriptions() {
    static const std::unordered_map<int, std::string> table{
        {kSuccess, "success"},
        {kGenericFailure, "generic failure"},
        {-3, "file does not exist"},
        {kNotLoggedIn, "not logged in"},
        {-6, "session invalid, log in again"},
        {-7, "link or file name invalid"},
        {kDuplicateName, "a file with the same name already exists in the destination"},
        {kLinkExpired, "link expired, or access code missing or incorrect"},
        {kInsufficientCapacity, "insufficient storage capacity"},
        {kAccessCodeRejected, "access code verification failed"},
        {-21, "share has been cancelled"},
        {kTooManyAccesses, "link accessed too many times"},
        {kBadParameter, "bad parameter"},
        {4, "duplicate file in destination"},
        {12, "batch operation failed"},
        {105, "malformed share link"},
        {110, "sharing too frequently"},
        {115, "file is not allowed to be shared"},
        {kCallTimedOut, "remote call timed out"},
    };
    return table;
}

std::string describe(const int code) {
    const auto& table = descriptions();
    if (const auto it = table.find(code); it != table.end()) return it->second;
    return "unknown error";
}

const std::unordered_set<int>& skipSet() {
    static const std::unordered_set<int> set{
        kNotLoggedIn,
        kDuplicateName,
        kLinkExpired,
        kInsufficientCapacity,
        kAccessCodeRejected,
        kTooManyAccesses,
        kBadParameter,
    };
    return set;
}

bool isSkippable(const int code) { return skipSet().contains(code); }

} // namespace ferry::remote
