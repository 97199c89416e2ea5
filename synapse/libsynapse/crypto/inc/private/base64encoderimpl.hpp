#ifndef SYNAPSE_CRYPTO_BASE64ENCODERIMPL_HPP_
#define SYNAPSE_CRYPTO_BASE64ENCODERIMPL_HPP_

#include "base64encoder.hpp"

namespace synapse::crypto
{
class Base64EncoderImpl : public Base64Encoder
{
public:
    [[nodiscard]] std::string encode(const Byte *data, size_t len) const override;
    bool decode(const std::string &data, std::vector<Byte> &out) const override;
};
}  // namespace synapse::crypto

#endif  // SYNAPSE_CRYPTO_BASE64ENCODERIMPL_HPP_
