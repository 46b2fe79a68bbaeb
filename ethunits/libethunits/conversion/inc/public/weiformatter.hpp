#ifndef ETHUNITS_CONVERSION_WEIFORMATTER_HPP_
#define ETHUNITS_CONVERSION_WEIFORMATTER_HPP_

#include <optional>
#include <string>

#include "ethunits/amount.hpp"

namespace ethunits::conversion
{
class WeiFormatter
{
public:
    /**
     * Formats a number of Wei in the most readable unit, e.g. "2.034 KWei" or "1 Ether".
     * In standard mode the output unit is restricted to Wei, KWei, MWei, GWei or Ether; values
     * below 0.001 Ether stay in GWei.
     * An absent or zero amount formats as "0", and values which do not fit the largest unit as a
     * number below 1000 format as "overflow" (only reachable when not in standard mode).
     * WeiParser never yields a negative amount; one built by the caller formats as its magnitude
     * with a leading '-', e.g. "-2.034 KWei".
     */
    [[nodiscard]] std::string format(const std::optional<Amount> &amount, bool standard) const;
};
}  // namespace ethunits::conversion

#endif  // ETHUNITS_CONVERSION_WEIFORMATTER_HPP_
