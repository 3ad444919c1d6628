/**
 * Uplink - Hashing and identifier helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string>

namespace uplink::crypto
{

    void ensure_sodium_init();

    /// BLAKE2b digest of `data`, lower-case hex.
    std::string hash_bytes(std::span<const std::byte> data);

    std::string hash_stream(std::istream &input);

    std::string hash_file(const std::filesystem::path &path);

    /// Incremental form of hash_bytes; feeding the same bytes in any split yields the same digest.
    class Hasher
    {
    public:
        Hasher();
        ~Hasher();

        Hasher(const Hasher &) = delete;
        Hasher &operator=(const Hasher &) = delete;

        void update(std::span<const std::byte> data);
        std::string finish();

    private:
        struct State;
        std::unique_ptr<State> state_;
        bool finished_{false};
    };

    /// Hex string of `bytes` random bytes from the libsodium CSPRNG.
    std::string random_hex(std::size_t bytes);

} // namespace uplink::crypto
