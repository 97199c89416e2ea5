#include "trustgate.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>

#include <glog/logging.h>

#include "hasher.hpp"
#include "hexencoding.hpp"
#include "identity.hpp"
#include "signaturescheme.hpp"
#include "timeformat.hpp"
#include "trusttracker.hpp"

namespace synapse::trust
{
TrustGate::TrustGate(std::shared_ptr<crypto::Hasher> hasher,
    std::shared_ptr<const crypto::SignatureScheme> signature_scheme, Policy policy)
    : hasher_ {std::move(hasher)}
    , signature_scheme_ {std::move(signature_scheme)}
    , policy_ {policy}
{}

TrustGate::~TrustGate() = default;

bool TrustGate::verify_integrity(const uint8_t *data, size_t len,
    const std::string &expected_hash, model::Error &error) const
{
    auto algorithm = select_algorithm(expected_hash, error);
    if (!algorithm)
    {
        return false;
    }

    auto actual_hash = utils::to_hex(hasher_->digest(*algorithm, data, len));
    if (!hashes_equal(actual_hash, expected_hash))
    {
        error.set(model::ErrorCode::INTEGRITY,
            "Content hash mismatch: expected " + expected_hash + ", got " + actual_hash);
        return false;
    }

    return true;
}

bool TrustGate::verify_integrity(const std::vector<uint8_t> &bytes,
    const std::string &expected_hash, model::Error &error) const
{
    return verify_integrity(bytes.data(), bytes.size(), expected_hash, error);
}

bool TrustGate::verify_signature(const model::Shard &shard, model::Error &error) const
{
    if (!shard.signature || !shard.creator_public_key)
    {
        if (policy_.require_signatures)
        {
            bool partial = shard.signature || shard.creator_public_key;
            error.set(model::ErrorCode::SIGNATURE,
                "Shard " + shard.content_hash +
                    (partial ? " has incomplete signature data" : " is unsigned"));
            return false;
        }

        LOG(WARNING) << "Accepting unsigned shard " << shard.content_hash;
        return true;
    }

    bool valid = false;
    try
    {
        valid = signature_scheme_->verify(
            *shard.creator_public_key, shard.signed_payload(), *shard.signature);
    }
    catch (const std::exception &e)
    {
        error.set(model::ErrorCode::SIGNATURE,
            std::string {"Signature verification raised an error: "} + e.what());
        LOG(WARNING) << error.message;
        return false;
    }

    if (!valid)
    {
        error.set(model::ErrorCode::SIGNATURE, "Invalid signature on shard " + shard.content_hash);
        return false;
    }

    return true;
}

bool TrustGate::verify_reputation(
    const model::Shard &shard, const TrustTracker &trust_tracker, model::Error &error) const
{
    return verify_reputation(shard, trust_tracker, policy_.min_trust_score, error);
}

bool TrustGate::verify_reputation(const model::Shard &shard, const TrustTracker &trust_tracker,
    double min_score, model::Error &error) const
{
    if (!shard.creator_id)
    {
        return true;
    }

    double score = 0;
    try
    {
        score = trust_tracker.get_trust_score(*shard.creator_id);
    }
    catch (const std::exception &e)
    {
        error.set(model::ErrorCode::TRUST_REJECTED,
            "Trust score of " + *shard.creator_id + " unavailable: " + e.what());
        LOG(WARNING) << error.message;
        return false;
    }

    if (!std::isfinite(score))
    {
        error.set(model::ErrorCode::TRUST_REJECTED,
            "Trust score of " + *shard.creator_id + " is not finite");
        LOG(WARNING) << error.message;
        return false;
    }
    score = std::clamp(score, 0.0, 1.0);

    if (score < min_score)
    {
        error.set(model::ErrorCode::TRUST_REJECTED,
            "Trust score " + std::to_string(score) + " of " + *shard.creator_id +
                " is below " + std::to_string(min_score));
        LOG(WARNING) << error.message;
        return false;
    }

    return true;
}

Attestation TrustGate::create_attestation(const model::Shard &shard, double rating,
    std::string feedback, const Identity &identity) const
{
    Attestation attestation;
    attestation.shard_hash        = shard.content_hash;
    attestation.provider_agent_id = shard.creator_id.value_or("unknown");
    attestation.consumer_agent_id = identity.agent_id();
    attestation.rating            = std::clamp(rating, 0.0, 1.0);
    attestation.feedback          = std::move(feedback);
    attestation.timestamp         = utils::format_iso8601(std::chrono::system_clock::now());
    attestation.signature         = identity.sign(attestation.signed_payload());

    if (attestation.signature.empty())
    {
        LOG(WARNING) << "Attestation for " << shard.content_hash << " could not be signed";
    }

    return attestation;
}

const TrustGate::Policy &TrustGate::policy() const
{
    return policy_;
}

std::optional<crypto::HashAlgorithm> TrustGate::select_algorithm(
    const std::string &expected_hash, model::Error &error)
{
    auto algorithm = crypto::algorithm_for_hex_length(expected_hash.size());
    if (!algorithm || !utils::is_hex_string(expected_hash))
    {
        error.set(model::ErrorCode::UNSUPPORTED_HASH,
            "Unsupported hash \"" + expected_hash + "\" (" +
                std::to_string(expected_hash.size()) + " characters)");
        LOG(WARNING) << error.message;
        return std::nullopt;
    }
    return algorithm;
}

bool TrustGate::hashes_equal(const std::string &lhs, const std::string &rhs)
{
    return utils::to_lower_ascii(lhs) == utils::to_lower_ascii(rhs);
}
}  // namespace synapse::trust
