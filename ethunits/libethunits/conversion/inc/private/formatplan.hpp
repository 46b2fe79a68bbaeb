#ifndef ETHUNITS_CONVERSION_FORMATPLAN_HPP_
#define ETHUNITS_CONVERSION_FORMATPLAN_HPP_

#include <cstddef>
#include <string>

namespace ethunits::conversion
{
struct FormatPlan
{
    std::string digits;
    std::size_t unit_index        = 0;
    std::size_t target_unit_index = 0;
    long long   decimal_place     = 0;  // number of digits before the decimal point
};
}  // namespace ethunits::conversion

#endif  // ETHUNITS_CONVERSION_FORMATPLAN_HPP_
