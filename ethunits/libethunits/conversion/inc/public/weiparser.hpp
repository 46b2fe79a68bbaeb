#ifndef ETHUNITS_CONVERSION_WEIPARSER_HPP_
#define ETHUNITS_CONVERSION_WEIPARSER_HPP_

#include <string>

#include "ethunits/amount.hpp"
#include "ethunits/conversionresult.hpp"

namespace ethunits::conversion
{
/**
 * Turns a string such as "1000000000000000", "21 Gwei" or "0.05 Ether" into an exact number of
 * Wei. Spaces and underscores are ignored anywhere in the input, unit names are case-insensitive
 * and the decimal separator is always the period.
 */
class WeiParser
{
public:
    [[nodiscard]] ConversionResult<Amount> parse(const std::string &input) const;

private:
    [[nodiscard]] ConversionResult<Amount> parse_integer(
        const std::string &literal, const std::string &unit) const;
    [[nodiscard]] ConversionResult<Amount> parse_decimal(
        const std::string &literal, const std::string &unit) const;
};
}  // namespace ethunits::conversion

#endif  // ETHUNITS_CONVERSION_WEIPARSER_HPP_
