#ifndef SYNAPSE_CRYPTO_HASHALGORITHM_HPP_
#define SYNAPSE_CRYPTO_HASHALGORITHM_HPP_

#include <cstddef>
#include <optional>
#include <string>

namespace synapse::crypto
{
enum class HashAlgorithm
{
    SHA1,
    SHA256
};

// The algorithm of a content hash is identified solely by the length of its hex representation
[[nodiscard]] std::optional<HashAlgorithm> algorithm_for_hex_length(size_t hex_length);
[[nodiscard]] size_t                       hex_digest_length(HashAlgorithm algorithm);
[[nodiscard]] std::string                  to_string(HashAlgorithm algorithm);
[[nodiscard]] std::optional<HashAlgorithm> parse_hash_algorithm(const std::string &name);
}  // namespace synapse::crypto

#endif  // SYNAPSE_CRYPTO_HASHALGORITHM_HPP_
