#include "uplink/encoding/base64.hpp"

#include <sodium.h>

#include "uplink/crypto.hpp"

namespace uplink::encoding
{

    namespace
    {
        constexpr int kVariant = sodium_base64_VARIANT_ORIGINAL;
    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        crypto::ensure_sodium_init();
        const auto encoded_len = sodium_base64_ENCODED_LEN(data.size(), kVariant);
        std::string output(encoded_len, '\0');
        sodium_bin2base64(output.data(), output.size(), reinterpret_cast<const unsigned char *>(data.data()),
                          data.size(), kVariant);
        // encoded_len counts the terminating NUL written by libsodium
        output.resize(encoded_len - 1);
        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        crypto::ensure_sodium_init();
        std::vector<std::byte> output((input.size() / 4) * 3 + 3);
        std::size_t decoded_len = 0;
        const char *end = nullptr;
        if (sodium_base642bin(reinterpret_cast<unsigned char *>(output.data()), output.size(), input.data(),
                              input.size(), nullptr, &decoded_len, &end, kVariant) != 0)
        {
            return std::nullopt;
        }
        if (end != input.data() + input.size())
        {
            return std::nullopt;
        }
        output.resize(decoded_len);
        return output;
    }

} // namespace uplink::encoding
