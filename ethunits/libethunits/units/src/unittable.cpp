#include "unittable.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

#include <glog/logging.h>

namespace ethunits::units
{
namespace
{
constexpr unsigned unit_step = 1000;

constexpr std::array<char const *, 11> display_names {"Wei", "KWei", "MWei", "GWei",
    "Microether", "Milliether", "Ether", "Kiloether", "Megaether", "Gigaether", "Teraether"};

// Unit name -> power of 1000
const std::unordered_map<std::string, unsigned> &known_units()
{
    static const std::unordered_map<std::string, unsigned> units {{"", 0}, {"wei", 0},
        {"ada", 1}, {"kwei", 1}, {"kilowei", 1}, {"babbage", 2}, {"mwei", 2}, {"megawei", 2},
        {"shannon", 3}, {"gwei", 3}, {"gigawei", 3}, {"szazbo", 4}, {"micro", 4},
        {"microether", 4}, {"finney", 5}, {"milli", 5}, {"milliether", 5}, {"eth", 6},
        {"ether", 6}, {"einstein", 7}, {"kilo", 7}, {"kiloether", 7}, {"mega", 8},
        {"megaether", 8}, {"giga", 9}, {"gigaether", 9}, {"tera", 10}, {"teraether", 10}};
    return units;
}

std::string to_lower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}
}  // namespace

ConversionResult<Amount> UnitTable::multiplier(const std::string &unit)
{
    const auto &units = known_units();
    auto        it    = units.find(to_lower(unit));
    if (it == units.end())
    {
        return ConversionResult<Amount>::failure(
            ConversionStatus::UNKNOWN_UNIT, "unknown unit " + unit);
    }
    return ConversionResult<Amount>::success(
        boost::multiprecision::pow(Amount {unit_step}, it->second));
}

std::size_t UnitTable::display_unit_count()
{
    return display_names.size();
}

const char *UnitTable::display_name(std::size_t index)
{
    if (index >= display_names.size())
    {
        LOG(ERROR) << "Unit index " << index << " out of range, returning null string";
        return nullptr;
    }
    return display_names[index];
}
}  // namespace ethunits::units
