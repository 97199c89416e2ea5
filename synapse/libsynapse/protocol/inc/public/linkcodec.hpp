#ifndef SYNAPSE_PROTOCOL_LINKCODEC_HPP_
#define SYNAPSE_PROTOCOL_LINKCODEC_HPP_

#include <memory>
#include <string>

#include "error.hpp"
#include "link.hpp"

namespace synapse::crypto
{
// Forward declarations
class Base64Encoder;
}  // namespace synapse::crypto

namespace synapse::protocol
{
/*
 * Magnet style URI encoding of a Link:
 *   magnet:?xt=urn:btih:<hash>&dn=<name>&xl=<size>&tr=<tracker>...
 *          &x.model=<model>&x.dims=<n>&x.tags=<tag>,<tag>&x.creator=<id>&x.pubkey=<base64>
 * Values are percent-encoded. Tracker order is kept.
 */
class LinkCodec
{
public:
    explicit LinkCodec(std::shared_ptr<const crypto::Base64Encoder> b64);
    ~LinkCodec();

    [[nodiscard]] std::string encode(const model::Link &link) const;
    bool decode(const std::string &uri, model::Link &out, model::Error &error) const;

    static std::string percent_encode(const std::string &in);
    static bool        percent_decode(const std::string &in, std::string &out);

private:
    const std::shared_ptr<const crypto::Base64Encoder> b64_;
};
}  // namespace synapse::protocol

#endif  // SYNAPSE_PROTOCOL_LINKCODEC_HPP_
