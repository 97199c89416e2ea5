#ifndef SYNAPSE_UTILS_HEXENCODING_HPP_
#define SYNAPSE_UTILS_HEXENCODING_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace synapse::utils
{
std::string to_hex(const uint8_t *data, size_t len);
std::string to_hex(const std::vector<uint8_t> &data);
bool        from_hex(const std::string &hex, std::vector<uint8_t> &out);
bool        is_hex_string(const std::string &str);
std::string to_lower_ascii(std::string str);
}  // namespace synapse::utils

#endif  // SYNAPSE_UTILS_HEXENCODING_HPP_
