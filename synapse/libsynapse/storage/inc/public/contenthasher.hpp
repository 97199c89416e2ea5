#ifndef SYNAPSE_STORAGE_CONTENTHASHER_HPP_
#define SYNAPSE_STORAGE_CONTENTHASHER_HPP_

#include <future>
#include <string>

#include "hashalgorithm.hpp"

namespace synapse::utils
{
// Forward declarations
class Executer;
}  // namespace synapse::utils

namespace synapse::storage
{
class ContentHasher
{
public:
    virtual ~ContentHasher() = default;

    // Writes the lower case hex digest of the whole file into out once the future yields true
    [[nodiscard]] virtual std::future<bool> create_hash(const std::string &file_path,
        crypto::HashAlgorithm algorithm, std::string &out, utils::Executer &executer) const = 0;
};
}  // namespace synapse::storage

#endif  // SYNAPSE_STORAGE_CONTENTHASHER_HPP_
