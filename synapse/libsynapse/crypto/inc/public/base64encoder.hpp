#ifndef SYNAPSE_CRYPTO_BASE64ENCODER_HPP_
#define SYNAPSE_CRYPTO_BASE64ENCODER_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace synapse::crypto
{
class Base64Encoder
{
public:
    using Byte = uint8_t;

    virtual ~Base64Encoder() = default;

    [[nodiscard]] virtual std::string encode(const Byte *data, size_t len) const = 0;
    virtual bool decode(const std::string &data, std::vector<Byte> &out) const   = 0;
};
}  // namespace synapse::crypto

#endif  // SYNAPSE_CRYPTO_BASE64ENCODER_HPP_
