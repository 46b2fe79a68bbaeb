#ifndef ETHUNITS_UNITS_UNITTABLE_HPP_
#define ETHUNITS_UNITS_UNITTABLE_HPP_

#include <cstddef>
#include <string>

#include "ethunits/amount.hpp"
#include "ethunits/conversionresult.hpp"

namespace ethunits::units
{
/**
 * Maps unit names and aliases to their value in Wei, and holds the ordered list of units used
 * for display. Every multiplier is a power of 1000 between 1 (Wei) and 10^30 (Teraether).
 */
class UnitTable
{
public:
    /**
     * Looks up a unit name, ignoring case. An empty name stands for Wei.
     * Fails with ConversionStatus::UNKNOWN_UNIT when the name is not recognized.
     */
    [[nodiscard]] static ConversionResult<Amount> multiplier(const std::string &unit);

    [[nodiscard]] static std::size_t display_unit_count();

    // Canonical name of the index-th unit in ascending order (Wei, KWei, ... Teraether)
    [[nodiscard]] static const char *display_name(std::size_t index);
};
}  // namespace ethunits::units

#endif  // ETHUNITS_UNITS_UNITTABLE_HPP_
