#include "hashing.hpp"

#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace hashing
{
    namespace
    {
        std::string toHex(const unsigned char *md, unsigned int md_len)
        {
            std::stringstream ss;
            for (unsigned int i = 0; i < md_len; ++i)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << (int)md[i];
            }
            return ss.str();
        }
    }

    struct Sha256::Impl
    {
        EVP_MD_CTX *ctx = nullptr;
        bool finished = false;
    };

    Sha256::Sha256() : impl_(new Impl)
    {
        impl_->ctx = EVP_MD_CTX_new();
        if (!impl_->ctx)
        {
            delete impl_;
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
        if (EVP_DigestInit_ex(impl_->ctx, EVP_sha256(), nullptr) != 1)
        {
            EVP_MD_CTX_free(impl_->ctx);
            delete impl_;
            throw std::runtime_error("Failed to initialize SHA-256 context");
        }
    }

    Sha256::~Sha256()
    {
        EVP_MD_CTX_free(impl_->ctx);
        delete impl_;
    }

    void Sha256::update(const char *data, std::size_t size)
    {
        if (impl_->finished)
        {
            throw std::logic_error("SHA-256 digest already finalized");
        }
        if (size == 0)
            return;
        if (EVP_DigestUpdate(impl_->ctx, data, size) != 1)
        {
            throw std::runtime_error("Failed to update SHA-256 hash");
        }
    }

    void Sha256::update(const std::string &data)
    {
        update(data.data(), data.size());
    }

    std::string Sha256::hexDigest()
    {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(impl_->ctx, md, &md_len) != 1)
        {
            throw std::runtime_error("Failed to finalize SHA-256 hash");
        }
        impl_->finished = true;
        return toHex(md, md_len);
    }

    std::string sha256Hex(const char *data, std::size_t size)
    {
        Sha256 digest;
        digest.update(data, size);
        return digest.hexDigest();
    }

    std::string sha256Hex(const std::string &data)
    {
        return sha256Hex(data.data(), data.size());
    }

    std::string base64Encode(const std::string &data)
    {
        if (data.empty())
            return "";
        std::string out(4 * ((data.size() + 2) / 3), '\0');
        int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                      reinterpret_cast<const unsigned char *>(data.data()),
                                      static_cast<int>(data.size()));
        out.resize(static_cast<std::size_t>(written));
        return out;
    }

    std::string base64Decode(const std::string &encoded)
    {
        if (encoded.empty())
            return "";
        if (encoded.size() % 4 != 0)
        {
            throw std::invalid_argument("base64 input length is not a multiple of 4");
        }
        std::string out(3 * encoded.size() / 4, '\0');
        int written = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                                      reinterpret_cast<const unsigned char *>(encoded.data()),
                                      static_cast<int>(encoded.size()));
        if (written < 0)
        {
            throw std::invalid_argument("malformed base64 input");
        }
        // EVP_DecodeBlock counts the padding as zero bytes.
        std::size_t padding = 0;
        if (encoded[encoded.size() - 1] == '=')
            ++padding;
        if (encoded[encoded.size() - 2] == '=')
            ++padding;
        out.resize(static_cast<std::size_t>(written) - padding);
        return out;
    }
}
