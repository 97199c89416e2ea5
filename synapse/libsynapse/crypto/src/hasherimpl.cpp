#include "hasherimpl.hpp"

#include <algorithm>

namespace synapse::crypto
{
std::vector<Hasher::Byte> HasherImpl::hash(SHA1_t, const Byte *data, size_t len)
{
    return hash_buffer(EVP_sha1(), data, len);
}

std::vector<Hasher::Byte> HasherImpl::hash(SHA256_t, const Byte *data, size_t len)
{
    return hash_buffer(EVP_sha256(), data, len);
}

std::vector<Hasher::Byte> HasherImpl::hash(SHA1_t, InputStream &is)
{
    return hash_stream(EVP_sha1(), is);
}

std::vector<Hasher::Byte> HasherImpl::hash(SHA256_t, InputStream &is)
{
    return hash_stream(EVP_sha256(), is);
}

std::vector<Hasher::Byte> HasherImpl::hash_buffer(
    const EVP_MD *algorithm, const Byte *data, size_t len)
{
    size_t offset = 0;
    return hash(algorithm, [&](auto &&update) {
        size_t cnt = std::min(len - offset, DEFAULT_BUFFER_SIZE);
        update(data + offset, cnt);
        offset += cnt;
        return offset != len;
    });
}

std::vector<Hasher::Byte> HasherImpl::hash_stream(const EVP_MD *algorithm, InputStream &is)
{
    std::vector<char> buffer(DEFAULT_BUFFER_SIZE);
    return hash(algorithm, [&](auto &&update) {
        is.read(buffer.data(), std::streamsize(buffer.size()));
        auto cnt = is.gcount();
        update(reinterpret_cast<const Byte *>(buffer.data()), size_t(cnt));
        return bool(is);
    });
}
}  // namespace synapse::crypto
