#ifndef SYNAPSE_STORAGE_MAPPEDARTIFACT_HPP_
#define SYNAPSE_STORAGE_MAPPEDARTIFACT_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

namespace synapse::storage
{
/*
 * Whole-file memory mapping of a shard artifact. An artifact is either opened read only, as a
 * seeder serves it, or allocated at its announced size and filled in place by a download. An
 * empty artifact is valid but has nothing mapped.
 */
class MappedArtifact
{
public:
    static MappedArtifact open(std::string path);
    static MappedArtifact allocate(std::string path, unsigned long long size);

    MappedArtifact(MappedArtifact &&other) noexcept;
    MappedArtifact(const MappedArtifact &) = delete;
    MappedArtifact &operator=(const MappedArtifact &) = delete;

    [[nodiscard]] explicit operator bool() const;
    [[nodiscard]] size_t   size() const;

    // Both return the number of bytes copied, which is short at the end of the artifact
    size_t read(size_t offset, size_t amount, uint8_t *out) const;
    size_t write(size_t offset, size_t amount, const uint8_t *in);

    bool flush();

private:
    MappedArtifact(std::string path, bool writable);

    bool map();

    std::string                        path_;
    bool                               writable_;
    bool                               mapped_;
    boost::interprocess::file_mapping  mapping_;
    boost::interprocess::mapped_region region_;
};
}  // namespace synapse::storage

#endif  // SYNAPSE_STORAGE_MAPPEDARTIFACT_HPP_
