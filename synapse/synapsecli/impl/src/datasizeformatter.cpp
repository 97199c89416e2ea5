#include "datasizeformatter.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace synapsecli
{
namespace
{
const char *byte_unit_str(int unit_magnitude)
{
    switch (unit_magnitude)
    {
        case 0: return "B";
        case 1: return "KiB";
        case 2: return "MiB";
        case 3: return "GiB";
        case 4: return "TiB";
        case 5: return "PiB";
        case 6: return "EiB";
        default:
        {
            LOG(ERROR) << "Unit magnitude " << unit_magnitude << " out of range";
            return "?";
        }
    }
}

int digit_count(double value)
{
    return int(std::to_string(static_cast<unsigned long long>(std::floor(value))).size());
}
}  // namespace

std::string DataSizeFormatter::format(
    unsigned long long size, int integral_part_max_digits, int fractional_part_max_digits) const
{
    integral_part_max_digits   = std::max(integral_part_max_digits, 1);
    fractional_part_max_digits = std::max(fractional_part_max_digits, 0);

    int  unit_magnitude = 0;
    auto dbl_size       = double(size);
    int  integral_part_digits;
    while ((integral_part_digits = digit_count(dbl_size)) > integral_part_max_digits)
    {
        dbl_size /= 1024;
        ++unit_magnitude;
    }

    std::ostringstream ss;
    ss << std::setprecision(integral_part_digits + fractional_part_max_digits) << dbl_size << ' '
       << byte_unit_str(unit_magnitude);
    return ss.str();
}
}  // namespace synapsecli
