/**
 * Chunkwise - Digest and randomness helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

#include <sodium.h>

namespace chunkwise::crypto
{

    void ensure_sodium_init();

    /// BLAKE2b digest of a buffer, lowercase hex.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    /// `byte_count` random bytes rendered as lowercase hex.
    std::string random_hex(std::size_t byte_count);

    /// Incremental BLAKE2b digest; produces the same value as hash_bytes over the concatenated input.
    class StreamingHash
    {
    public:
        StreamingHash();

        void update(std::span<const std::byte> data);

        std::string finish();

    private:
        crypto_generichash_state state_{};
        bool finished_{false};
    };

} // namespace chunkwise::crypto
