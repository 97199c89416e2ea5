#ifndef SYNAPSE_CRYPTO_HASHERIMPL_HPP_
#define SYNAPSE_CRYPTO_HASHERIMPL_HPP_

#include <glog/logging.h>
#include <openssl/evp.h>

#include "defer.hpp"
#include "hasher.hpp"

namespace synapse::crypto
{
class HasherImpl : public Hasher
{
public:
    std::vector<Byte> hash(SHA1_t, const Byte *data, size_t len) override;
    std::vector<Byte> hash(SHA256_t, const Byte *data, size_t len) override;
    std::vector<Byte> hash(SHA1_t, InputStream &is) override;
    std::vector<Byte> hash(SHA256_t, InputStream &is) override;

private:
    // Feed is called repeatedly with an update function until it returns false
    template<typename Feed>
    static std::vector<Byte> hash(const EVP_MD *algorithm, Feed &&feed)
    {
        auto ctx = EVP_MD_CTX_new();
        if (!ctx)
        {
            LOG(FATAL) << "EVP_MD_CTX_new failed";
        }
        DEFER(EVP_MD_CTX_free(ctx));

        if (!EVP_DigestInit_ex(ctx, algorithm, nullptr))
        {
            LOG(FATAL) << "EVP_DigestInit_ex failed";
        }

        auto update = [ctx](const Byte *data, size_t len) {
            if (len != 0 && !EVP_DigestUpdate(ctx, data, len))
            {
                LOG(FATAL) << "EVP_DigestUpdate failed";
            }
        };
        while (feed(update))
        {
        }

        std::vector<Byte> out(size_t(EVP_MD_size(algorithm)));
        if (!EVP_DigestFinal_ex(ctx, out.data(), nullptr))
        {
            LOG(FATAL) << "EVP_DigestFinal_ex failed";
        }

        return out;
    }

    static std::vector<Byte> hash_buffer(const EVP_MD *algorithm, const Byte *data, size_t len);
    static std::vector<Byte> hash_stream(const EVP_MD *algorithm, InputStream &is);

    static constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;  // 64 KiB
};
}  // namespace synapse::crypto

#endif  // SYNAPSE_CRYPTO_HASHERIMPL_HPP_
