#ifndef SYNAPSE_MODEL_ERROR_HPP_
#define SYNAPSE_MODEL_ERROR_HPP_

#include <string>

namespace synapse::model
{
enum class ErrorCode
{
    NONE,
    NOT_FOUND,
    FORMAT,
    IO,
    NO_PEERS,
    INTEGRITY,
    UNSUPPORTED_HASH,
    SIGNATURE,
    TRUST_REJECTED
};

[[nodiscard]] std::string to_string(ErrorCode code);

struct Error
{
    ErrorCode   code = ErrorCode::NONE;
    std::string message;

    explicit operator bool() const
    {
        return code != ErrorCode::NONE;
    }

    void set(ErrorCode c, std::string msg)
    {
        code    = c;
        message = std::move(msg);
    }

    void clear()
    {
        code = ErrorCode::NONE;
        message.clear();
    }
};
}  // namespace synapse::model

#endif  // SYNAPSE_MODEL_ERROR_HPP_
