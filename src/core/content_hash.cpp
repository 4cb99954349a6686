#include "core/content_hash.hpp"

#include <sodium.h>

#include <array>
#include <stdexcept>

namespace vaultsync {

Result<void, Error> init_hashing() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

std::string content_hash(std::string_view content) {
    static const bool initialized = sodium_init() >= 0;
    if (!initialized) {
        throw std::runtime_error("libsodium is not available");
    }

    std::array<unsigned char, crypto_generichash_BYTES> digest{};
    crypto_generichash(digest.data(), digest.size(),
                       reinterpret_cast<const unsigned char*>(content.data()),
                       content.size(), nullptr, 0);

    std::string hex(digest.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.pop_back();
    return hex;
}

} // namespace vaultsync
