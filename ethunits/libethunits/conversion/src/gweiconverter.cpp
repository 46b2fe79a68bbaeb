#include "gweiconverter.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>

#include <glog/logging.h>

namespace ethunits::conversion
{
namespace
{
constexpr std::uint64_t wei_per_gwei         = 1000000000ULL;
constexpr std::size_t   gwei_fraction_digits = 9;
}  // namespace

ConversionResult<std::uint64_t> GWeiConverter::parse_to_gwei(const std::string &input) const
{
    auto wei = parser_.parse(input);
    if (!wei)
    {
        return ConversionResult<std::uint64_t>::failure(wei);
    }

    Amount gwei = wei.value / wei_per_gwei;
    if (gwei > std::numeric_limits<std::uint64_t>::max())
    {
        LOG(WARNING) << "GWei value of " << input << " does not fit in 64 bits, truncating";
        gwei &= std::numeric_limits<std::uint64_t>::max();
    }

    return ConversionResult<std::uint64_t>::success(gwei.convert_to<std::uint64_t>());
}

std::string GWeiConverter::format_gwei(std::uint64_t gwei, bool standard) const
{
    Amount wei = Amount {gwei} * wei_per_gwei;
    return formatter_.format(wei, standard);
}

std::string GWeiConverter::format_wei_as_gwei(const std::optional<Amount> &wei) const
{
    if (!wei)
    {
        return "0";
    }

    Amount            magnitude = boost::multiprecision::abs(*wei);
    const std::string sign      = *wei < 0 ? "-" : "";

    Amount whole     = magnitude / wei_per_gwei;
    Amount remainder = magnitude % wei_per_gwei;
    if (remainder == 0)
    {
        return sign + whole.str() + " GWei";
    }

    std::string fraction = remainder.str();
    fraction.insert(0, gwei_fraction_digits - std::min(fraction.size(), gwei_fraction_digits), '0');
    fraction.erase(fraction.find_last_not_of('0') + 1);

    return sign + whole.str() + '.' + fraction + " GWei";
}
}  // namespace ethunits::conversion
