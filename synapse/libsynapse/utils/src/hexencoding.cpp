#include "hexencoding.hpp"

#include <algorithm>

namespace synapse::utils
{
namespace
{
constexpr char hex_digits[] = "0123456789abcdef";

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}
}  // namespace

std::string to_hex(const uint8_t *data, size_t len)
{
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i != len; ++i)
    {
        out.push_back(hex_digits[data[i] >> 4]);
        out.push_back(hex_digits[data[i] & 0x0f]);
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t> &data)
{
    return to_hex(data.data(), data.size());
}

bool from_hex(const std::string &hex, std::vector<uint8_t> &out)
{
    if (hex.size() % 2 != 0)
    {
        return false;
    }

    out.clear();
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i != hex.size(); i += 2)
    {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0)
        {
            out.clear();
            return false;
        }
        out.push_back(uint8_t((hi << 4) | lo));
    }
    return true;
}

bool is_hex_string(const std::string &str)
{
    return !str.empty() &&
           std::all_of(str.cbegin(), str.cend(), [](char c) { return hex_value(c) >= 0; });
}

std::string to_lower_ascii(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
    });
    return str;
}
}  // namespace synapse::utils
