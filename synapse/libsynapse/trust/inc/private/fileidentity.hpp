#ifndef SYNAPSE_TRUST_FILEIDENTITY_HPP_
#define SYNAPSE_TRUST_FILEIDENTITY_HPP_

#include <memory>
#include <string>

#include "error.hpp"
#include "identity.hpp"

namespace synapse::crypto
{
// Forward declarations
class Hasher;
class SignatureScheme;
}  // namespace synapse::crypto

namespace synapse::trust
{
/*
 * Signing identity kept in a directory:
 *   agent_private.key  PEM private key, owner read/write only
 *   agent_public.key   PEM public key
 *   agent_id.txt       agent id derived from the public key
 */
class FileIdentity : public Identity
{
public:
    FileIdentity(std::string agent_id, std::string public_key, std::string private_key,
        std::shared_ptr<const crypto::SignatureScheme> signature_scheme);

    static std::unique_ptr<FileIdentity> load(const std::string &identity_dir,
        std::shared_ptr<const crypto::SignatureScheme> signature_scheme, model::Error &error);
    static std::unique_ptr<FileIdentity> generate(const std::string &identity_dir,
        std::shared_ptr<const crypto::SignatureScheme> signature_scheme, crypto::Hasher &hasher,
        bool overwrite, model::Error &error);

    // Lower case, unpadded base32 of the first 10 bytes of SHA-256(public key)
    static std::string derive_agent_id(const std::string &public_key, crypto::Hasher &hasher);

    [[nodiscard]] std::string          agent_id() const override;
    [[nodiscard]] std::string          public_key() const override;
    [[nodiscard]] std::vector<uint8_t> sign(const std::string &payload) const override;

    static constexpr char const *private_key_file_name = "agent_private.key";
    static constexpr char const *public_key_file_name  = "agent_public.key";
    static constexpr char const *agent_id_file_name    = "agent_id.txt";

private:
    const std::string                                    agent_id_;
    const std::string                                    public_key_;
    const std::string                                    private_key_;
    const std::shared_ptr<const crypto::SignatureScheme> signature_scheme_;
};
}  // namespace synapse::trust

#endif  // SYNAPSE_TRUST_FILEIDENTITY_HPP_
