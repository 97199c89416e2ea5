#ifndef SYNAPSECLI_DATASIZEFORMATTER_HPP_
#define SYNAPSECLI_DATASIZEFORMATTER_HPP_

#include <string>

namespace synapsecli
{
class DataSizeFormatter
{
public:
    [[nodiscard]] std::string format(unsigned long long size, int integral_part_max_digits = 3,
        int fractional_part_max_digits = 3) const;
};
}  // namespace synapsecli

#endif  // SYNAPSECLI_DATASIZEFORMATTER_HPP_
