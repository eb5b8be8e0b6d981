#pragma once

#include <string>

namespace ferry::util {

struct SplitLink {
    std::string base;
    std::string code;
};

// Strips the `pwd` query parameter from a share link. Other parameters keep
// their order. Links without "?pwd=" or "&pwd=" come back untouched.
SplitLink splitAccessCode(const std::string& link);

// Appends `pwd=<code>` unless the code is empty or the link already has one.
std::string withAccessCode(const std::string& base, const std::string& code);

} // namespace ferry::util
