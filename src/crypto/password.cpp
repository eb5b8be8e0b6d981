#include "crypto/password.hpp"

#include <sodium.h>
#include <stdexcept>
#include <string_view>

namespace ferry::crypto {

std::string generateSharePassword(const std::size_t length) {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");

    constexpr std::string_view alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";

    std::string password;
    password.reserve(length);
    for (size_t i = 0; i < length; ++i) password.push_back(alphabet[randombytes_uniform(alphabet.size())]);
    return password;
}

} // namespace ferry::crypto
