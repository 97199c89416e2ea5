#ifndef SYNAPSE_STORAGE_CONTENTHASHERIMPL_HPP_
#define SYNAPSE_STORAGE_CONTENTHASHERIMPL_HPP_

#include <memory>

#include "contenthasher.hpp"

namespace synapse::crypto
{
// Forward declarations
class Hasher;
}  // namespace synapse::crypto

namespace synapse::storage
{
class ContentHasherImpl : public ContentHasher
{
public:
    explicit ContentHasherImpl(std::shared_ptr<crypto::Hasher> hasher);
    ~ContentHasherImpl() override;

    [[nodiscard]] std::future<bool> create_hash(const std::string &file_path,
        crypto::HashAlgorithm algorithm, std::string &out,
        utils::Executer &executer) const override;

private:
    const std::shared_ptr<crypto::Hasher> hasher_;
};
}  // namespace synapse::storage

#endif  // SYNAPSE_STORAGE_CONTENTHASHERIMPL_HPP_
