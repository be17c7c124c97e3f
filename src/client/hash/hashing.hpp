#pragma once

#include <cstddef>
#include <string>

namespace hashing
{
    // Lower-case hex SHA-256 of a byte range (OpenSSL EVP).
    std::string sha256Hex(const char *data, std::size_t size);
    std::string sha256Hex(const std::string &data);

    // Incremental digest for inputs that arrive in pieces.
    class Sha256
    {
    public:
        Sha256();
        ~Sha256();

        Sha256(const Sha256 &) = delete;
        Sha256 &operator=(const Sha256 &) = delete;

        void update(const char *data, std::size_t size);
        void update(const std::string &data);
        std::string hexDigest();

    private:
        struct Impl;
        Impl *impl_;
    };

    // Base64 for binary fields carried inside JSON payloads.
    std::string base64Encode(const std::string &data);
    // Throws std::invalid_argument on malformed input.
    std::string base64Decode(const std::string &encoded);
}
