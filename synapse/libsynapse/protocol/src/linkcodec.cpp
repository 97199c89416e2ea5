#include "linkcodec.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <glog/logging.h>

#include "base64encoder.hpp"
#include "hashalgorithm.hpp"
#include "hexencoding.hpp"

namespace synapse::protocol
{
namespace
{
constexpr char const *scheme_prefix = "magnet:?";
constexpr char const *urn_prefix    = "urn:btih:";

constexpr char const *param_hash    = "xt";
constexpr char const *param_name    = "dn";
constexpr char const *param_size    = "xl";
constexpr char const *param_tracker = "tr";
constexpr char const *param_model   = "x.model";
constexpr char const *param_dims    = "x.dims";
constexpr char const *param_tags    = "x.tags";
constexpr char const *param_creator = "x.creator";
constexpr char const *param_pubkey  = "x.pubkey";

std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> parts;
    std::string              part;
    std::istringstream       ss {str};
    while (std::getline(ss, part, delimiter))
    {
        parts.push_back(part);
    }
    return parts;
}

bool parse_unsigned(const std::string &str, unsigned long long &out)
{
    auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
    if (str.empty() || !std::all_of(str.cbegin(), str.cend(), is_digit))
    {
        return false;
    }

    try
    {
        out = std::stoull(str);
    }
    catch (const std::out_of_range &)
    {
        return false;
    }
    return true;
}
}  // namespace

LinkCodec::LinkCodec(std::shared_ptr<const crypto::Base64Encoder> b64)
    : b64_ {std::move(b64)}
{}

LinkCodec::~LinkCodec() = default;

std::string LinkCodec::encode(const model::Link &link) const
{
    std::ostringstream ss;

    ss << scheme_prefix << param_hash << '=' << urn_prefix
       << utils::to_lower_ascii(link.content_hash);
    ss << '&' << param_name << '=' << percent_encode(link.display_name);
    ss << '&' << param_size << '=' << link.file_size;

    for (const auto &tracker : link.trackers)
    {
        ss << '&' << param_tracker << '=' << percent_encode(tracker);
    }

    if (link.embedding_model)
    {
        ss << '&' << param_model << '=' << percent_encode(*link.embedding_model);
    }
    if (link.dimensions)
    {
        ss << '&' << param_dims << '=' << *link.dimensions;
    }
    if (!link.tags.empty())
    {
        ss << '&' << param_tags << '=';
        bool first = true;
        for (const auto &tag : link.tags)
        {
            ss << (first ? "" : ",") << percent_encode(tag);
            first = false;
        }
    }
    if (link.creator_id)
    {
        ss << '&' << param_creator << '=' << percent_encode(*link.creator_id);
    }
    if (link.creator_public_key)
    {
        const auto &key = *link.creator_public_key;
        ss << '&' << param_pubkey << '='
           << percent_encode(b64_->encode(
                  reinterpret_cast<const crypto::Base64Encoder::Byte *>(key.data()), key.size()));
    }

    return ss.str();
}

bool LinkCodec::decode(const std::string &uri, model::Link &out, model::Error &error) const
{
    const std::string prefix {scheme_prefix};
    if (uri.compare(0, prefix.size(), prefix) != 0)
    {
        error.set(model::ErrorCode::FORMAT, "Not a magnet URI");
        return false;
    }

    model::Link link;
    bool        has_hash = false;

    for (const auto &param : split(uri.substr(prefix.size()), '&'))
    {
        if (param.empty())
        {
            continue;
        }

        auto        eq    = param.find('=');
        std::string key   = param.substr(0, eq);
        std::string raw   = eq == std::string::npos ? "" : param.substr(eq + 1);
        std::string value;

        if (key != param_tags && !percent_decode(raw, value))
        {
            error.set(model::ErrorCode::FORMAT, "Malformed percent-encoding in parameter " + key);
            return false;
        }

        if (key == param_hash)
        {
            const std::string urn {urn_prefix};
            if (value.compare(0, urn.size(), urn) != 0)
            {
                error.set(model::ErrorCode::FORMAT, "Unsupported exact topic " + value);
                return false;
            }

            auto hash = utils::to_lower_ascii(value.substr(urn.size()));
            if (!utils::is_hex_string(hash) || !crypto::algorithm_for_hex_length(hash.size()))
            {
                error.set(model::ErrorCode::FORMAT, "Invalid content hash " + hash);
                return false;
            }
            link.content_hash = std::move(hash);
            has_hash          = true;
        }
        else if (key == param_name)
        {
            link.display_name = std::move(value);
        }
        else if (key == param_size)
        {
            if (!parse_unsigned(value, link.file_size))
            {
                error.set(model::ErrorCode::FORMAT, "Invalid file size " + value);
                return false;
            }
        }
        else if (key == param_tracker)
        {
            link.trackers.push_back(std::move(value));
        }
        else if (key == param_model)
        {
            link.embedding_model = std::move(value);
        }
        else if (key == param_dims)
        {
            unsigned long long dims = 0;
            if (!parse_unsigned(value, dims) || dims > std::numeric_limits<unsigned>::max())
            {
                error.set(model::ErrorCode::FORMAT, "Invalid dimension count " + value);
                return false;
            }
            link.dimensions = unsigned(dims);
        }
        else if (key == param_tags)
        {
            for (const auto &raw_tag : split(raw, ','))
            {
                std::string tag;
                if (!percent_decode(raw_tag, tag))
                {
                    error.set(model::ErrorCode::FORMAT, "Malformed tag " + raw_tag);
                    return false;
                }
                if (!tag.empty())
                {
                    link.tags.insert(std::move(tag));
                }
            }
        }
        else if (key == param_creator)
        {
            link.creator_id = std::move(value);
        }
        else if (key == param_pubkey)
        {
            std::vector<crypto::Base64Encoder::Byte> key_bytes;
            if (!b64_->decode(value, key_bytes))
            {
                error.set(model::ErrorCode::FORMAT, "Malformed creator public key");
                return false;
            }
            link.creator_public_key = std::string(key_bytes.cbegin(), key_bytes.cend());
        }
        else
        {
            VLOG(1) << "Ignoring unknown magnet parameter " << key;
        }
    }

    if (!has_hash)
    {
        error.set(model::ErrorCode::FORMAT, "Magnet URI has no content hash");
        return false;
    }

    out = std::move(link);
    return true;
}

std::string LinkCodec::percent_encode(const std::string &in)
{
    constexpr char hex_digits[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(in.size());
    for (char c : in)
    {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '.' || c == '_' || c == '~')
        {
            out.push_back(c);
        }
        else
        {
            out.push_back('%');
            out.push_back(hex_digits[uc >> 4]);
            out.push_back(hex_digits[uc & 0x0f]);
        }
    }
    return out;
}

bool LinkCodec::percent_decode(const std::string &in, std::string &out)
{
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i)
    {
        if (in[i] == '+')
        {
            out.push_back(' ');
        }
        else if (in[i] == '%')
        {
            std::vector<uint8_t> byte;
            if (i + 2 >= in.size())
            {
                return false;
            }
            if (!utils::from_hex(in.substr(i + 1, 2), byte))
            {
                return false;
            }
            out.push_back(char(byte.front()));
            i += 2;
        }
        else
        {
            out.push_back(in[i]);
        }
    }
    return true;
}
}  // namespace synapse::protocol
