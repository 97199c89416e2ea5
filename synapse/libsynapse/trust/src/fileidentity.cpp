#include "fileidentity.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <glog/logging.h>

#include "hasher.hpp"
#include "signaturescheme.hpp"

namespace synapse::trust
{
namespace
{
constexpr size_t agent_id_source_bytes = 10;

bool read_file(const std::filesystem::path &path, std::string &out)
{
    std::ifstream fs {path, std::ios::in | std::ios::binary};
    if (!fs)
    {
        return false;
    }
    std::ostringstream ss;
    ss << fs.rdbuf();
    out = ss.str();
    return true;
}

bool write_file(const std::filesystem::path &path, const std::string &content)
{
    std::ofstream fs {path, std::ios::out | std::ios::binary | std::ios::trunc};
    if (!fs)
    {
        return false;
    }
    fs << content;
    return bool(fs.flush());
}

std::string trim(const std::string &str)
{
    auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }
    auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string base32_lower(const uint8_t *data, size_t len)
{
    constexpr char alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";

    std::string out;
    unsigned    buffer = 0;
    int         bits   = 0;
    for (size_t i = 0; i != len; ++i)
    {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5)
        {
            out.push_back(alphabet[(buffer >> (bits - 5)) & 0x1f]);
            bits -= 5;
        }
    }
    if (bits > 0)
    {
        out.push_back(alphabet[(buffer << (5 - bits)) & 0x1f]);
    }
    return out;
}
}  // namespace

FileIdentity::FileIdentity(std::string agent_id, std::string public_key, std::string private_key,
    std::shared_ptr<const crypto::SignatureScheme> signature_scheme)
    : agent_id_ {std::move(agent_id)}
    , public_key_ {std::move(public_key)}
    , private_key_ {std::move(private_key)}
    , signature_scheme_ {std::move(signature_scheme)}
{}

std::unique_ptr<FileIdentity> FileIdentity::load(const std::string &identity_dir,
    std::shared_ptr<const crypto::SignatureScheme> signature_scheme, model::Error &error)
{
    std::filesystem::path dir {identity_dir};
    std::string           private_key;
    std::string           public_key;
    std::string           agent_id;

    if (!read_file(dir / private_key_file_name, private_key) ||
        !read_file(dir / public_key_file_name, public_key) ||
        !read_file(dir / agent_id_file_name, agent_id))
    {
        error.set(model::ErrorCode::NOT_FOUND, "No identity found in " + identity_dir);
        return nullptr;
    }

    agent_id = trim(agent_id);
    if (agent_id.empty())
    {
        error.set(model::ErrorCode::FORMAT, "Empty agent id in " + identity_dir);
        return nullptr;
    }

    return std::make_unique<FileIdentity>(std::move(agent_id), std::move(public_key),
        std::move(private_key), std::move(signature_scheme));
}

std::unique_ptr<FileIdentity> FileIdentity::generate(const std::string &identity_dir,
    std::shared_ptr<const crypto::SignatureScheme> signature_scheme, crypto::Hasher &hasher,
    bool overwrite, model::Error &error)
{
    std::filesystem::path dir {identity_dir};

    if (!overwrite && std::filesystem::exists(dir / private_key_file_name))
    {
        error.set(model::ErrorCode::IO, "An identity already exists in " + identity_dir);
        return nullptr;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        error.set(model::ErrorCode::IO, "Cannot create " + identity_dir + ": " + ec.message());
        return nullptr;
    }

    std::string public_key;
    std::string private_key;
    if (!signature_scheme->generate_key_pair(public_key, private_key))
    {
        error.set(model::ErrorCode::IO, "Key pair generation failed");
        return nullptr;
    }

    auto agent_id = derive_agent_id(public_key, hasher);

    auto private_key_path = dir / private_key_file_name;
    if (!write_file(private_key_path, private_key))
    {
        error.set(model::ErrorCode::IO, "Cannot write " + private_key_path.string());
        return nullptr;
    }
    std::filesystem::permissions(private_key_path,
        std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
        std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        LOG(WARNING) << "Cannot restrict permissions of " << private_key_path << ": "
                     << ec.message();
    }

    if (!write_file(dir / public_key_file_name, public_key) ||
        !write_file(dir / agent_id_file_name, agent_id + "\n"))
    {
        error.set(model::ErrorCode::IO, "Cannot write identity files to " + identity_dir);
        return nullptr;
    }

    LOG(INFO) << "Generated identity " << agent_id << " in " << identity_dir;

    return std::make_unique<FileIdentity>(std::move(agent_id), std::move(public_key),
        std::move(private_key), std::move(signature_scheme));
}

std::string FileIdentity::derive_agent_id(const std::string &public_key, crypto::Hasher &hasher)
{
    auto digest = hasher.hash(crypto::SHA256,
        reinterpret_cast<const crypto::Hasher::Byte *>(public_key.data()), public_key.size());
    return base32_lower(digest.data(), std::min(digest.size(), agent_id_source_bytes));
}

std::string FileIdentity::agent_id() const
{
    return agent_id_;
}

std::string FileIdentity::public_key() const
{
    return public_key_;
}

std::vector<uint8_t> FileIdentity::sign(const std::string &payload) const
{
    return signature_scheme_->sign(private_key_, payload);
}
}  // namespace synapse::trust
