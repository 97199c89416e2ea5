#include "timeformat.hpp"

#include <ctime>

namespace synapse::utils
{
std::string format_iso8601(std::chrono::system_clock::time_point time_point)
{
    std::time_t t = std::chrono::system_clock::to_time_t(time_point);
    std::tm     tm {};
    gmtime_r(&t, &tm);

    char buf[32];
    size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, len);
}
}  // namespace synapse::utils
