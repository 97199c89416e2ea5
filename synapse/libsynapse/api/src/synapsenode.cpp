#include "synapsenode.hpp"

#include <filesystem>

#include "config.hpp"
#include "defaultconfigvalues.hpp"
#include "identity.hpp"
#include "jsonconfigloader.hpp"
#include "synapsenodeimpl.hpp"
#include "transferengine.hpp"

namespace synapse
{
SynapseNode::SynapseNode(const std::string &data_dir, const std::string &config_file_name,
    std::shared_ptr<transfer::TransferEngine> transfer_engine)
    : impl_ {std::make_unique<SynapseNodeImpl>(
          config::Config {config::JSONConfigLoader {
                              (std::filesystem::path {data_dir} / config_file_name).string()},
              std::make_unique<DefaultConfigValues>(data_dir)},
          nullptr, std::move(transfer_engine))}
{}

SynapseNode::SynapseNode(SynapseNode &&other) noexcept
    : impl_ {std::move(other.impl_)}
{}

SynapseNode &SynapseNode::operator=(SynapseNode &&rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

SynapseNode::~SynapseNode() = default;

std::string SynapseNode::node_id() const
{
    return impl_->node_id();
}

bool SynapseNode::create_shard(const ShardOptions &options, model::Shard &out, model::Error &error)
{
    return impl_->create_shard(options, out, error);
}

bool SynapseNode::load_shard(
    const std::string &artifact_path, model::Shard &out, model::Error &error)
{
    return impl_->load_shard(artifact_path, out, error);
}

std::optional<model::Link> SynapseNode::announce(
    model::Shard &shard, const std::vector<std::string> &trackers, model::Error &error)
{
    return impl_->announce(shard, trackers, error);
}

std::optional<std::string> SynapseNode::request(const model::Link &link,
    const std::string &output_dir, const ProgressCallback &on_progress, model::Error &error)
{
    return impl_->request(link, output_dir, on_progress, error);
}

std::string SynapseNode::encode_link(const model::Link &link) const
{
    return impl_->encode_link(link);
}

bool SynapseNode::decode_link(const std::string &uri, model::Link &out, model::Error &error) const
{
    return impl_->decode_link(uri, out, error);
}

bool SynapseNode::verify_file_integrity(
    const std::string &file_path, const std::string &expected_hash, model::Error &error) const
{
    return impl_->verify_file_integrity(file_path, expected_hash, error);
}

bool SynapseNode::verify_session(const std::string &content_hash, model::Error &error)
{
    return impl_->verify_session(content_hash, error);
}

bool SynapseNode::verify_signature(const model::Shard &shard, model::Error &error) const
{
    return impl_->verify_signature(shard, error);
}

bool SynapseNode::verify_reputation(const model::Shard &shard, model::Error &error) const
{
    return impl_->verify_reputation(shard, error);
}

bool SynapseNode::generate_identity(bool overwrite, std::string &agent_id, model::Error &error)
{
    auto identity = impl_->generate_identity(overwrite, error);
    if (!identity)
    {
        return false;
    }
    agent_id = identity->agent_id();
    return true;
}

bool SynapseNode::sign_shard(model::Shard &shard, model::Error &error)
{
    return impl_->sign_shard(shard, error);
}

bool SynapseNode::attest(const model::Shard &shard, double rating, const std::string &feedback,
    nlohmann::json &out, model::Error &error) const
{
    auto identity = impl_->load_identity(error);
    if (!identity)
    {
        return false;
    }
    out = impl_->attestation_to_json(impl_->create_attestation(shard, rating, feedback, *identity));
    return true;
}

std::optional<transfer::SessionStatus> SynapseNode::get_status(
    const std::string &content_hash) const
{
    return impl_->get_status(content_hash);
}

std::vector<transfer::SessionStatus> SynapseNode::list_sessions() const
{
    return impl_->list_sessions();
}

bool SynapseNode::stop(const std::string &content_hash)
{
    return impl_->stop(content_hash);
}

bool SynapseNode::remove(const std::string &content_hash, bool delete_file)
{
    return impl_->remove(content_hash, delete_file);
}

NodeStatistics SynapseNode::statistics() const
{
    return impl_->statistics();
}

void SynapseNode::shutdown()
{
    impl_->shutdown();
}
}  // namespace synapse
