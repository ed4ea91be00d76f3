/**
 * ChunkDrive - Digest and randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace chunkdrive::crypto
{

    void ensure_sodium_init();

    // Lowercase hex SHA-256 digests.
    std::string sha256_hex(std::span<const std::byte> data);
    std::string sha256_hex(std::string_view text);

    /// Hex encoding of byte_count random bytes from the system CSPRNG.
    std::string random_hex(std::size_t byte_count);

} // namespace chunkdrive::crypto
