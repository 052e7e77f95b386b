#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chunkwise::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    /// Throws std::invalid_argument on characters outside the alphabet or a truncated quantum.
    std::vector<std::byte> decode_base64(std::string_view input);

} // namespace chunkwise::encoding
