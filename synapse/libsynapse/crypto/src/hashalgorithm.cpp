#include "hashalgorithm.hpp"

#include <array>
#include <utility>

#include "hexencoding.hpp"

namespace synapse::crypto
{
namespace
{
struct AlgorithmTraits
{
    HashAlgorithm algorithm;
    size_t        hex_length;
    const char   *name;
};

constexpr std::array<AlgorithmTraits, 2> known_algorithms {{
    {HashAlgorithm::SHA1, 40, "sha1"},
    {HashAlgorithm::SHA256, 64, "sha256"},
}};
}  // namespace

std::optional<HashAlgorithm> algorithm_for_hex_length(size_t hex_length)
{
    for (const auto &traits : known_algorithms)
    {
        if (traits.hex_length == hex_length)
        {
            return traits.algorithm;
        }
    }
    return std::nullopt;
}

size_t hex_digest_length(HashAlgorithm algorithm)
{
    for (const auto &traits : known_algorithms)
    {
        if (traits.algorithm == algorithm)
        {
            return traits.hex_length;
        }
    }
    return 0;
}

std::string to_string(HashAlgorithm algorithm)
{
    for (const auto &traits : known_algorithms)
    {
        if (traits.algorithm == algorithm)
        {
            return traits.name;
        }
    }
    return "unknown";
}

std::optional<HashAlgorithm> parse_hash_algorithm(const std::string &name)
{
    auto lower = utils::to_lower_ascii(name);
    for (const auto &traits : known_algorithms)
    {
        if (lower == traits.name)
        {
            return traits.algorithm;
        }
    }
    return std::nullopt;
}
}  // namespace synapse::crypto
