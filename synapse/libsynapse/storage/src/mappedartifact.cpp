#include "mappedartifact.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <glog/logging.h>

namespace synapse::storage
{
MappedArtifact MappedArtifact::open(std::string path)
{
    MappedArtifact artifact {std::move(path), false};
    artifact.mapped_ = artifact.map();
    return artifact;
}

MappedArtifact MappedArtifact::allocate(std::string path, unsigned long long size)
{
    MappedArtifact artifact {std::move(path), true};

    if (!std::ofstream {artifact.path_, std::ios::binary | std::ios::trunc})
    {
        LOG(ERROR) << "Cannot create artifact " << artifact.path_;
        return artifact;
    }

    std::error_code ec;
    std::filesystem::resize_file(artifact.path_, size, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot allocate " << size << " bytes for " << artifact.path_ << ": "
                   << ec.message();
        return artifact;
    }

    artifact.mapped_ = artifact.map();
    return artifact;
}

MappedArtifact::MappedArtifact(std::string path, bool writable)
    : path_ {std::move(path)}
    , writable_ {writable}
    , mapped_ {false}
{}

MappedArtifact::MappedArtifact(MappedArtifact &&other) noexcept
    : path_ {std::move(other.path_)}
    , writable_ {other.writable_}
    , mapped_ {other.mapped_}
    , mapping_ {std::move(other.mapping_)}
    , region_ {std::move(other.region_)}
{
    other.mapped_ = false;
}

MappedArtifact::operator bool() const
{
    return mapped_;
}

size_t MappedArtifact::size() const
{
    return region_.get_size();
}

size_t MappedArtifact::read(size_t offset, size_t amount, uint8_t *out) const
{
    if (!mapped_ || offset >= size())
    {
        return 0;
    }

    auto count = std::min(amount, size() - offset);
    std::copy_n(static_cast<const uint8_t *>(region_.get_address()) + offset, count, out);
    return count;
}

size_t MappedArtifact::write(size_t offset, size_t amount, const uint8_t *in)
{
    if (!mapped_ || !writable_)
    {
        LOG(ERROR) << "Artifact " << path_ << " is not writable";
        return 0;
    }
    if (offset >= size())
    {
        LOG(ERROR) << "Write past the end of " << path_ << " (offset " << offset << ", size "
                   << size() << ")";
        return 0;
    }

    auto count = std::min(amount, size() - offset);
    std::copy_n(in, count, static_cast<uint8_t *>(region_.get_address()) + offset);
    return count;
}

bool MappedArtifact::flush()
{
    if (!mapped_ || !writable_ || size() == 0)
    {
        return mapped_;
    }
    return region_.flush();
}

bool MappedArtifact::map()
{
    std::error_code ec;
    auto            file_size = std::filesystem::file_size(path_, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot stat artifact " << path_ << ": " << ec.message();
        return false;
    }
    if (file_size == 0)
    {
        // mapped_region refuses empty mappings
        return true;
    }

    auto access = writable_ ? boost::interprocess::read_write : boost::interprocess::read_only;
    try
    {
        mapping_ = {path_.c_str(), access};
        region_  = {mapping_, access};
    }
    catch (const boost::interprocess::interprocess_exception &e)
    {
        LOG(ERROR) << "Cannot map artifact " << path_ << ": " << e.what();
        return false;
    }
    return true;
}
}  // namespace synapse::storage
