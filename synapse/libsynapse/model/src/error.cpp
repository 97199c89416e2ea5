#include "error.hpp"

namespace synapse::model
{
std::string to_string(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::FORMAT: return "FORMAT";
        case ErrorCode::IO: return "IO";
        case ErrorCode::NO_PEERS: return "NO_PEERS";
        case ErrorCode::INTEGRITY: return "INTEGRITY";
        case ErrorCode::UNSUPPORTED_HASH: return "UNSUPPORTED_HASH";
        case ErrorCode::SIGNATURE: return "SIGNATURE";
        case ErrorCode::TRUST_REJECTED: return "TRUST_REJECTED";
    }
    return "UNKNOWN";
}
}  // namespace synapse::model
