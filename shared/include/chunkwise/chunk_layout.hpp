/**
 * Chunkwise - Geometry of a file split into fixed-size chunks.
 */
#pragma once

#include <cstdint>
#include <stdexcept>

namespace chunkwise
{

    struct ChunkLayout
    {
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};

        /// ceil(total_size / chunk_size); zero for an empty file.
        constexpr std::uint64_t total_chunks() const
        {
            if (chunk_size == 0)
            {
                throw std::invalid_argument("chunk size must be positive");
            }
            return total_size / chunk_size + (total_size % chunk_size == 0 ? 0 : 1);
        }

        constexpr std::uint64_t chunk_offset(std::uint64_t index) const
        {
            return index * chunk_size;
        }

        /// Expected byte length of chunk `index`; only the last chunk may be short.
        constexpr std::uint64_t chunk_length(std::uint64_t index) const
        {
            const auto count = total_chunks();
            if (index >= count)
            {
                throw std::out_of_range("chunk index outside layout");
            }
            if (index + 1 < count)
            {
                return chunk_size;
            }
            return total_size - chunk_size * (count - 1);
        }
    };

} // namespace chunkwise
