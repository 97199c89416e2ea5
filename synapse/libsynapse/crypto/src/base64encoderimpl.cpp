#include "base64encoderimpl.hpp"

#include <limits>

#include <glog/logging.h>
#include <openssl/evp.h>

namespace synapse::crypto
{
std::string Base64EncoderImpl::encode(const Byte *data, size_t len) const
{
    if (len == 0)
    {
        return {};
    }

    constexpr auto max_data_len = size_t(std::numeric_limits<int>::max() / 4 * 3);
    if (len > max_data_len)
    {
        LOG(ERROR) << "Input too large. Maximum supported is " << max_data_len << ".";
        return {};
    }

    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data, int(len));
    if (written < 0)
    {
        LOG(FATAL) << "EVP_EncodeBlock failed";
    }
    out.resize(size_t(written));

    return out;
}

bool Base64EncoderImpl::decode(const std::string &data, std::vector<Byte> &out) const
{
    out.clear();
    if (data.empty())
    {
        return true;
    }

    if (data.size() % 4 != 0 || data.size() > size_t(std::numeric_limits<int>::max()))
    {
        return false;
    }

    out.resize(data.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char *>(data.data()), int(data.size()));
    if (decoded < 0)
    {
        out.clear();
        return false;
    }

    // EVP_DecodeBlock keeps the zero bytes produced by the padding characters
    size_t padding = 0;
    for (auto it = data.rbegin(); it != data.rend() && *it == '=' && padding != 2; ++it)
    {
        ++padding;
    }
    out.resize(size_t(decoded) - padding);

    return true;
}
}  // namespace synapse::crypto
