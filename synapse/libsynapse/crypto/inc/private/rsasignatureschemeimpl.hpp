#ifndef SYNAPSE_CRYPTO_RSASIGNATURESCHEMEIMPL_HPP_
#define SYNAPSE_CRYPTO_RSASIGNATURESCHEMEIMPL_HPP_

#include "signaturescheme.hpp"

namespace synapse::crypto
{
// RSA with SHA-256 digests (PKCS#1 v1.5 padding)
class RSASignatureSchemeImpl : public SignatureScheme
{
public:
    explicit RSASignatureSchemeImpl(int modulus_bits = 2048);

    bool generate_key_pair(Key &public_key, Key &private_key) const override;
    [[nodiscard]] ByteVector sign(
        const Key &private_key, const std::string &payload) const override;
    [[nodiscard]] bool verify(const Key &public_key, const std::string &payload,
        const ByteVector &signature) const override;

private:
    const int modulus_bits_;
};
}  // namespace synapse::crypto

#endif  // SYNAPSE_CRYPTO_RSASIGNATURESCHEMEIMPL_HPP_
