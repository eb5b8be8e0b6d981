#pragma once

#include <cstddef>
#include <string>

namespace ferry::crypto {

// Access code for a new share, drawn from [a-z0-9] with libsodium.
std::string generateSharePassword(std::size_t length = 4);

} // namespace ferry::crypto
