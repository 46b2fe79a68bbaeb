#ifndef ETHUNITS_CONVERSION_GWEICONVERTER_HPP_
#define ETHUNITS_CONVERSION_GWEICONVERTER_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "ethunits/amount.hpp"
#include "ethunits/conversionresult.hpp"
#include "weiformatter.hpp"
#include "weiparser.hpp"

namespace ethunits::conversion
{
// GWei based variants of WeiParser and WeiFormatter
class GWeiConverter
{
public:
    /**
     * Parses a value (see WeiParser) and returns it as a whole number of GWei.
     * Any part of the value below 1 GWei is discarded.
     */
    [[nodiscard]] ConversionResult<std::uint64_t> parse_to_gwei(const std::string &input) const;

    [[nodiscard]] std::string format_gwei(std::uint64_t gwei, bool standard) const;

    // Exact GWei rendering of a number of Wei, e.g. "999.00005 GWei". A negative amount renders
    // as its magnitude with a leading '-'.
    [[nodiscard]] std::string format_wei_as_gwei(const std::optional<Amount> &wei) const;

private:
    WeiParser    parser_;
    WeiFormatter formatter_;
};
}  // namespace ethunits::conversion

#endif  // ETHUNITS_CONVERSION_GWEICONVERTER_HPP_
