#ifndef SYNAPSE_UTILS_TIMEFORMAT_HPP_
#define SYNAPSE_UTILS_TIMEFORMAT_HPP_

#include <chrono>
#include <string>

namespace synapse::utils
{
// ISO-8601 UTC, second resolution, e.g. 2024-03-01T12:00:00Z
std::string format_iso8601(std::chrono::system_clock::time_point time_point);
}  // namespace synapse::utils

#endif  // SYNAPSE_UTILS_TIMEFORMAT_HPP_
