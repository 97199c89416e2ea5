#ifndef SYNAPSE_TRUST_TRUSTGATE_HPP_
#define SYNAPSE_TRUST_TRUSTGATE_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "attestation.hpp"
#include "error.hpp"
#include "hashalgorithm.hpp"
#include "shard.hpp"

namespace synapse::crypto
{
// Forward declarations
class Hasher;
class SignatureScheme;
}  // namespace synapse::crypto

namespace synapse::trust
{
// Forward declarations
class Identity;
class TrustTracker;

/*
 * Acceptance checks a consumer runs on received data. None of them mutate state; the caller decides
 * what to do with a negative answer. Every check returns false instead of throwing and describes
 * the reason in the error out-parameter.
 */
class TrustGate
{
public:
    struct Policy
    {
        double min_trust_score    = 0.6;
        bool   require_signatures = false;
    };

    TrustGate(std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<const crypto::SignatureScheme> signature_scheme, Policy policy);
    ~TrustGate();

    bool verify_integrity(const uint8_t *data, size_t len, const std::string &expected_hash,
        model::Error &error) const;
    bool verify_integrity(const std::vector<uint8_t> &bytes, const std::string &expected_hash,
        model::Error &error) const;
    bool verify_signature(const model::Shard &shard, model::Error &error) const;
    bool verify_reputation(
        const model::Shard &shard, const TrustTracker &trust_tracker, model::Error &error) const;
    bool verify_reputation(const model::Shard &shard, const TrustTracker &trust_tracker,
        double min_score, model::Error &error) const;

    [[nodiscard]] Attestation create_attestation(const model::Shard &shard, double rating,
        std::string feedback, const Identity &identity) const;

    [[nodiscard]] const Policy &policy() const;

    // Picks the digest algorithm from the length of a hex hash
    static std::optional<crypto::HashAlgorithm> select_algorithm(
        const std::string &expected_hash, model::Error &error);
    static bool hashes_equal(const std::string &lhs, const std::string &rhs);

private:
    const std::shared_ptr<crypto::Hasher>                hasher_;
    const std::shared_ptr<const crypto::SignatureScheme> signature_scheme_;
    const Policy                                         policy_;
};
}  // namespace synapse::trust

#endif  // SYNAPSE_TRUST_TRUSTGATE_HPP_
