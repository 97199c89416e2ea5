#ifndef SYNAPSE_CRYPTO_HASHER_HPP_
#define SYNAPSE_CRYPTO_HASHER_HPP_

#include <cstdint>
#include <istream>
#include <vector>

#include "hashalgorithm.hpp"

namespace synapse::crypto
{
struct SHA1_t
{};
constexpr SHA1_t SHA1 {};

struct SHA256_t
{};
constexpr SHA256_t SHA256 {};

class Hasher
{
public:
    using Byte        = uint8_t;
    using InputStream = std::istream;

    virtual ~Hasher() = default;

    virtual std::vector<Byte> hash(SHA1_t, const Byte *data, size_t len)   = 0;
    virtual std::vector<Byte> hash(SHA256_t, const Byte *data, size_t len) = 0;
    virtual std::vector<Byte> hash(SHA1_t, InputStream &is)                = 0;
    virtual std::vector<Byte> hash(SHA256_t, InputStream &is)              = 0;

    std::vector<Byte> digest(HashAlgorithm algorithm, const Byte *data, size_t len)
    {
        switch (algorithm)
        {
            case HashAlgorithm::SHA1: return hash(SHA1, data, len);
            case HashAlgorithm::SHA256: return hash(SHA256, data, len);
        }
        return {};
    }

    std::vector<Byte> digest(HashAlgorithm algorithm, InputStream &is)
    {
        switch (algorithm)
        {
            case HashAlgorithm::SHA1: return hash(SHA1, is);
            case HashAlgorithm::SHA256: return hash(SHA256, is);
        }
        return {};
    }
};
}  // namespace synapse::crypto

#endif  // SYNAPSE_CRYPTO_HASHER_HPP_
