#ifndef SYNAPSE_CRYPTO_SIGNATURESCHEME_HPP_
#define SYNAPSE_CRYPTO_SIGNATURESCHEME_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace synapse::crypto
{
/*
 * Producer signature capability. Keys travel as PEM text. Implementations may throw on malformed
 * input; callers that gate on verification treat an exception as a failed verification.
 */
class SignatureScheme
{
public:
    using Key        = std::string;
    using ByteVector = std::vector<uint8_t>;

    virtual ~SignatureScheme() = default;

    virtual bool generate_key_pair(Key &public_key, Key &private_key) const = 0;

    // Returns an empty vector if signing fails
    [[nodiscard]] virtual ByteVector sign(
        const Key &private_key, const std::string &payload) const = 0;

    [[nodiscard]] virtual bool verify(const Key &public_key, const std::string &payload,
        const ByteVector &signature) const = 0;
};
}  // namespace synapse::crypto

#endif  // SYNAPSE_CRYPTO_SIGNATURESCHEME_HPP_
