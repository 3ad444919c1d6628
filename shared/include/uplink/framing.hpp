/**
 * Uplink - Length-prefixed JSON framing helpers.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <nlohmann/json.hpp>

namespace uplink::protocol
{

    inline constexpr std::size_t kFrameHeaderSize = sizeof(std::uint32_t);

    // Largest accepted JSON body; a 64 MiB chunk in base64 plus envelope fits.
    inline constexpr std::uint32_t kMaxFrameSize = 96u * 1024u * 1024u;

    struct DecodedFrame
    {
        nlohmann::json message;
        std::size_t bytes_consumed{};
    };

    std::vector<std::uint8_t> encode_frame(const nlohmann::json &message);

    std::optional<DecodedFrame> try_decode_frame(std::span<const std::uint8_t> buffer);

    /// Body length announced by a frame header. Throws std::length_error above kMaxFrameSize.
    std::uint32_t decode_frame_header(const std::array<std::uint8_t, kFrameHeaderSize> &header);

} // namespace uplink::protocol
