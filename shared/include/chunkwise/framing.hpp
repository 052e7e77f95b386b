/**
 * Chunkwise - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace chunkwise::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Large enough for a 32 MiB chunk after base64 expansion plus envelope.
    inline constexpr std::uint32_t kMaxFramePayload = 48u * 1024u * 1024u;

    // Room kept in a frame for the request envelope around the base64 chunk data.
    inline constexpr std::uint32_t kEnvelopeAllowance = 64u * 1024u;

    // Largest raw chunk whose base64 form still fits in one frame.
    inline constexpr std::uint64_t kMaxChunkBytes = (kMaxFramePayload - kEnvelopeAllowance) / 4u * 3u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

    std::uint32_t decode_frame_header(const std::array<std::uint8_t, kFrameHeaderSize> &header);

} // namespace chunkwise::protocol
