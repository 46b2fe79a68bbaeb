#include "weiformatter.hpp"

#include "formatplan.hpp"
#include "unittable.hpp"

namespace ethunits::conversion
{
namespace
{
constexpr char const *zero_output     = "0";
constexpr char const *overflow_output = "overflow";

constexpr std::size_t gwei_unit_index       = 3;
constexpr std::size_t microether_unit_index = 4;
constexpr std::size_t ether_unit_index      = 6;
constexpr int         digits_per_unit       = 3;

// Moves up one unit at a time while the value stays a whole number
std::size_t descale(Amount &value)
{
    std::size_t unit_index = 0;
    while (value >= 1000 && value % 1000 == 0)
    {
        value /= 1000;
        ++unit_index;
    }
    return unit_index;
}

FormatPlan plan_output_unit(const Amount &value, std::size_t unit_index, bool standard)
{
    FormatPlan plan;
    plan.digits            = value.str();
    plan.unit_index        = unit_index;
    plan.target_unit_index = unit_index;

    const std::size_t digit_count = plan.digits.size();
    if (digit_count > digits_per_unit)
    {
        plan.target_unit_index += digit_count / digits_per_unit;
        if (digit_count % digits_per_unit == 0)
        {
            --plan.target_unit_index;
        }
    }

    if (standard && plan.target_unit_index > gwei_unit_index)
    {
        // Anything below 0.001 Ether is still shown in GWei
        plan.target_unit_index = plan.target_unit_index == microether_unit_index ?
                                     gwei_unit_index :
                                     ether_unit_index;
    }

    plan.decimal_place = static_cast<long long>(digit_count);
    for (; plan.unit_index < plan.target_unit_index; ++plan.unit_index)
    {
        plan.decimal_place -= digits_per_unit;
    }

    return plan;
}

std::string render(FormatPlan &plan)
{
    for (; plan.unit_index > plan.target_unit_index; --plan.unit_index)
    {
        plan.digits.append(digits_per_unit, '0');
        plan.decimal_place += digits_per_unit;
    }

    // Decimal point placement is done on the digit string to stay exact
    std::string output = plan.digits;
    if (plan.decimal_place <= 0)
    {
        output = "0." + std::string(static_cast<std::size_t>(-plan.decimal_place), '0') + output;
    }
    else if (plan.decimal_place < static_cast<long long>(output.size()))
    {
        output.insert(static_cast<std::size_t>(plan.decimal_place), 1, '.');
    }

    if (output.find('.') != std::string::npos)
    {
        output.erase(output.find_last_not_of('0') + 1);
    }

    return output;
}
}  // namespace

std::string WeiFormatter::format(const std::optional<Amount> &amount, bool standard) const
{
    if (!amount || *amount == 0)
    {
        return zero_output;
    }

    Amount value    = *amount;
    bool   negative = value < 0;
    if (negative)
    {
        value = -value;
    }

    std::size_t unit_index = descale(value);
    FormatPlan  plan       = plan_output_unit(value, unit_index, standard);
    std::string output     = render(plan);

    if (plan.unit_index >= units::UnitTable::display_unit_count())
    {
        return overflow_output;
    }

    return (negative ? "-" : "") + output + ' ' + units::UnitTable::display_name(plan.unit_index);
}
}  // namespace ethunits::conversion
