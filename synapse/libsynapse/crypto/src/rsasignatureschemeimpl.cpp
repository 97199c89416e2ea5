#include "rsasignatureschemeimpl.hpp"

#include <glog/logging.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "defer.hpp"

namespace synapse::crypto
{
namespace
{
bool read_bio(BIO *bio, std::string &out)
{
    int len = BIO_pending(bio);
    if (len < 0)
    {
        return false;
    }
    out.resize(size_t(len));
    return len == 0 || BIO_read(bio, out.data(), len) == len;
}
}  // namespace

RSASignatureSchemeImpl::RSASignatureSchemeImpl(int modulus_bits)
    : modulus_bits_ {modulus_bits}
{}

bool RSASignatureSchemeImpl::generate_key_pair(Key &public_key, Key &private_key) const
{
    EVP_PKEY_CTX *ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (ctx == nullptr)
    {
        LOG(FATAL) << "EVP_PKEY_CTX_new_id failed";
    }
    DEFER(EVP_PKEY_CTX_free(ctx));

    if (EVP_PKEY_keygen_init(ctx) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, modulus_bits_) <= 0)
    {
        LOG(ERROR) << "Cannot initialize RSA key generation";
        return false;
    }

    EVP_PKEY *pkey = nullptr;
    if (EVP_PKEY_keygen(ctx, &pkey) <= 0)
    {
        LOG(ERROR) << "EVP_PKEY_keygen failed";
        return false;
    }
    DEFER(EVP_PKEY_free(pkey));

    BIO *pub = BIO_new(BIO_s_mem());
    if (pub == nullptr)
    {
        LOG(FATAL) << "BIO_new failed";
    }
    DEFER(BIO_vfree(pub));

    BIO *pri = BIO_new(BIO_s_mem());
    if (pri == nullptr)
    {
        LOG(FATAL) << "BIO_new failed";
    }
    DEFER(BIO_vfree(pri));

    if (PEM_write_bio_PUBKEY(pub, pkey) != 1)
    {
        LOG(ERROR) << "PEM_write_bio_PUBKEY failed";
        return false;
    }
    if (PEM_write_bio_PrivateKey(pri, pkey, nullptr, nullptr, 0, nullptr, nullptr) != 1)
    {
        LOG(ERROR) << "PEM_write_bio_PrivateKey failed";
        return false;
    }

    if (!read_bio(pub, public_key) || !read_bio(pri, private_key))
    {
        LOG(ERROR) << "BIO_read failed";
        return false;
    }

    return true;
}

SignatureScheme::ByteVector RSASignatureSchemeImpl::sign(
    const Key &private_key, const std::string &payload) const
{
    BIO *kb = BIO_new_mem_buf(private_key.data(), int(private_key.size()));
    if (kb == nullptr)
    {
        LOG(FATAL) << "BIO_new_mem_buf failed";
    }
    DEFER(BIO_vfree(kb));

    EVP_PKEY *pkey = PEM_read_bio_PrivateKey(kb, nullptr, nullptr, nullptr);
    if (pkey == nullptr)
    {
        LOG(ERROR) << "Cannot parse private key";
        return {};
    }
    DEFER(EVP_PKEY_free(pkey));

    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    if (ctx == nullptr)
    {
        LOG(FATAL) << "EVP_MD_CTX_new failed";
    }
    DEFER(EVP_MD_CTX_free(ctx));

    auto   data    = reinterpret_cast<const unsigned char *>(payload.data());
    size_t sig_len = 0;
    if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, pkey) != 1 ||
        EVP_DigestSign(ctx, nullptr, &sig_len, data, payload.size()) != 1)
    {
        LOG(ERROR) << "Cannot initialize signing";
        return {};
    }

    ByteVector signature(sig_len);
    if (EVP_DigestSign(ctx, signature.data(), &sig_len, data, payload.size()) != 1)
    {
        LOG(ERROR) << "EVP_DigestSign failed";
        return {};
    }
    signature.resize(sig_len);

    return signature;
}

bool RSASignatureSchemeImpl::verify(
    const Key &public_key, const std::string &payload, const ByteVector &signature) const
{
    BIO *kb = BIO_new_mem_buf(public_key.data(), int(public_key.size()));
    if (kb == nullptr)
    {
        LOG(FATAL) << "BIO_new_mem_buf failed";
    }
    DEFER(BIO_vfree(kb));

    EVP_PKEY *pkey = PEM_read_bio_PUBKEY(kb, nullptr, nullptr, nullptr);
    if (pkey == nullptr)
    {
        LOG(WARNING) << "Cannot parse public key";
        return false;
    }
    DEFER(EVP_PKEY_free(pkey));

    EVP_MD_CTX *ctx = EVP_MD_CTX_new();
    if (ctx == nullptr)
    {
        LOG(FATAL) << "EVP_MD_CTX_new failed";
    }
    DEFER(EVP_MD_CTX_free(ctx));

    if (EVP_DigestVerifyInit(ctx, nullptr, EVP_sha256(), nullptr, pkey) != 1)
    {
        LOG(ERROR) << "EVP_DigestVerifyInit failed";
        return false;
    }

    return EVP_DigestVerify(ctx, signature.data(), signature.size(),
               reinterpret_cast<const unsigned char *>(payload.data()), payload.size()) == 1;
}
}  // namespace synapse::crypto
