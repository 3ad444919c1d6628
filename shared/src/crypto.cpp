#include "uplink/crypto.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace uplink::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

    } // namespace

    struct Hasher::State
    {
        crypto_generichash_state sodium{};
    };

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash(digest.data(), digest.size(),
                               reinterpret_cast<const unsigned char *>(data.data()), data.size(), nullptr, 0) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return to_hex(digest);
    }

    std::string hash_stream(std::istream &input)
    {
        Hasher hasher;
        std::vector<char> buffer(64 * 1024);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hasher.update(std::as_bytes(std::span(buffer.data(), read_count)));
            }
        }
        if (input.bad())
        {
            throw std::runtime_error("Read error while hashing stream");
        }
        return hasher.finish();
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return hash_stream(file);
    }

    Hasher::Hasher() : state_(std::make_unique<State>())
    {
        ensure_initialized_once();
        if (crypto_generichash_init(&state_->sodium, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    Hasher::~Hasher() = default;

    void Hasher::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("Hasher already finished");
        }
        if (crypto_generichash_update(&state_->sodium, reinterpret_cast<const unsigned char *>(data.data()),
                                      data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string Hasher::finish()
    {
        if (finished_)
        {
            throw std::logic_error("Hasher already finished");
        }
        std::vector<unsigned char> digest(crypto_generichash_BYTES);
        if (crypto_generichash_final(&state_->sodium, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        finished_ = true;
        return to_hex(digest);
    }

    std::string random_hex(std::size_t bytes)
    {
        ensure_initialized_once();
        std::vector<unsigned char> buffer(bytes);
        randombytes_buf(buffer.data(), buffer.size());
        return to_hex(buffer);
    }

} // namespace uplink::crypto
