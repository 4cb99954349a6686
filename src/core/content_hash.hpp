#pragma once

#include "core/result.hpp"
#include <string>
#include <string_view>

namespace vaultsync {

// Length of the hex digest returned by content_hash().
constexpr size_t CONTENT_HASH_HEX_SIZE = 64;

/**
 * Initialize libsodium. Safe to call more than once and from several threads.
 */
[[nodiscard]] Result<void, Error> init_hashing();

/**
 * BLAKE2b-256 digest of a note body, lowercase hex.
 *
 * This is the value stored as a note's common-ancestor hash and compared
 * against what the provider reports for the vault copy.
 */
[[nodiscard]] std::string content_hash(std::string_view content);

} // namespace vaultsync
