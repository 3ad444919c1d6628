#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uplink::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // std::nullopt when `input` is not valid padded base64.
    std::optional<std::vector<std::byte>> decode_base64(std::string_view input);

} // namespace uplink::encoding
