#include "contenthasherimpl.hpp"

#include <fstream>

#include <glog/logging.h>

#include "defer.hpp"
#include "executer.hpp"
#include "hasher.hpp"
#include "hexencoding.hpp"

namespace synapse::storage
{
ContentHasherImpl::ContentHasherImpl(std::shared_ptr<crypto::Hasher> hasher)
    : hasher_ {std::move(hasher)}
{}

ContentHasherImpl::~ContentHasherImpl() = default;

std::future<bool> ContentHasherImpl::create_hash(const std::string &file_path,
    crypto::HashAlgorithm algorithm, std::string &out, utils::Executer &executer) const
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto hasher  = hasher_;

    executer.add_job(
        [file_path, algorithm, promise, hasher, &out](const utils::CompletionToken &token) {
            bool success = false;
            DEFER(promise->set_value(success));

            std::ifstream fs {file_path, std::ios::in | std::ios::binary};
            if (!fs)
            {
                LOG(ERROR) << "Cannot open file " << file_path << " for reading";
                return;
            }

            auto digest = hasher->digest(algorithm, fs);
            if (fs.bad())
            {
                LOG(ERROR) << "Read error while hashing " << file_path;
                return;
            }

            if (token.is_cancelled())
            {
                return;
            }

            out     = utils::to_hex(digest);
            success = true;
        });

    return promise->get_future();
}
}  // namespace synapse::storage
