#include "weiparser.hpp"

#include <algorithm>
#include <iterator>
#include <regex>

#include "unittable.hpp"

namespace ethunits::conversion
{
namespace
{
constexpr char const *empty_value_message    = "failed to parse empty value";
constexpr char const *invalid_format_message = "invalid format";
constexpr char const *negative_message       = "value resulted in negative number of Wei";
constexpr char const *fractional_message     = "value resulted in fractional number of Wei";

struct ParsedComponents
{
    bool        negative = false;
    std::string integer_digits;
    std::string fractional_digits;
};

ConversionResult<Amount> parse_failure(const std::string &literal, const std::string &unit)
{
    return ConversionResult<Amount>::failure(
        ConversionStatus::PARSE_FAILURE, "failed to parse " + literal + " " + unit);
}

std::string strip_separators(const std::string &input)
{
    std::string stripped;
    stripped.reserve(input.size());
    std::copy_if(input.cbegin(), input.cend(), std::back_inserter(stripped),
        [](char c) { return c != ' ' && c != '_'; });
    return stripped;
}

bool all_digits(const std::string &str)
{
    return std::all_of(str.cbegin(), str.cend(), [](char c) { return c >= '0' && c <= '9'; });
}

// Digits are accumulated one at a time; the string constructor of cpp_int would read a leading
// zero as an octal prefix.
Amount digits_to_amount(const std::string &digits)
{
    Amount value;
    for (char c : digits)
    {
        value *= 10;
        value += c - '0';
    }
    return value;
}

ParsedComponents split_literal(const std::string &literal)
{
    ParsedComponents components;

    std::string unsigned_literal = literal;
    if (!unsigned_literal.empty() && unsigned_literal.front() == '-')
    {
        components.negative = true;
        unsigned_literal.erase(0, 1);
    }

    auto point = unsigned_literal.find('.');
    components.integer_digits = unsigned_literal.substr(0, point);
    if (point != std::string::npos)
    {
        components.fractional_digits = unsigned_literal.substr(point + 1);
    }

    return components;
}
}  // namespace

ConversionResult<Amount> WeiParser::parse(const std::string &input) const
{
    if (input.empty())
    {
        return ConversionResult<Amount>::failure(
            ConversionStatus::EMPTY_VALUE, empty_value_message);
    }

    std::string stripped = strip_separators(input);

    // Numeric literal followed by an optional unit name
    static const std::regex value_rgx {R"(^(-?[0-9]*(?:\.[0-9]*)?)([A-Za-z]+)?$)"};
    std::smatch             match;
    if (!std::regex_match(stripped, match, value_rgx))
    {
        return ConversionResult<Amount>::failure(
            ConversionStatus::INVALID_FORMAT, invalid_format_message);
    }

    const std::string literal = match[1].str();
    const std::string unit    = match[2].str();

    auto result = literal.find('.') != std::string::npos ? parse_decimal(literal, unit) :
                                                           parse_integer(literal, unit);
    if (!result)
    {
        return result;
    }

    if (result.value < 0)
    {
        return ConversionResult<Amount>::failure(ConversionStatus::NEGATIVE, negative_message);
    }

    return result;
}

ConversionResult<Amount> WeiParser::parse_integer(
    const std::string &literal, const std::string &unit) const
{
    auto components = split_literal(literal);
    if (components.integer_digits.empty() || !all_digits(components.integer_digits))
    {
        return parse_failure(literal, unit);
    }

    auto multiplier = units::UnitTable::multiplier(unit);
    if (!multiplier)
    {
        return parse_failure(literal, unit);
    }

    Amount value = digits_to_amount(components.integer_digits) * multiplier.value;
    if (components.negative)
    {
        value = -value;
    }

    return ConversionResult<Amount>::success(std::move(value));
}

ConversionResult<Amount> WeiParser::parse_decimal(
    const std::string &literal, const std::string &unit) const
{
    // The integer and fractional parts are converted separately so that everything stays an
    // exact integer multiplication.
    auto components = split_literal(literal);
    if (!all_digits(components.integer_digits) || !all_digits(components.fractional_digits))
    {
        return parse_failure(literal, unit);
    }

    auto multiplier = units::UnitTable::multiplier(unit);
    if (!multiplier)
    {
        return parse_failure(literal, unit);
    }

    // An empty integer part (".5 ether") counts as zero, a lone sign ("-.5 ether") does not parse
    if (components.negative && components.integer_digits.empty())
    {
        return parse_failure(literal, unit);
    }

    // The sign belongs to the integer part only, the fraction always adds to it
    Amount value = digits_to_amount(components.integer_digits) * multiplier.value;
    if (components.negative)
    {
        value = -value;
    }

    std::string &fraction = components.fractional_digits;
    fraction.erase(fraction.find_last_not_of('0') + 1);
    if (!fraction.empty())
    {
        Amount fraction_multiplier = multiplier.value;
        for (size_t i = 0; i != fraction.size(); ++i)
        {
            fraction_multiplier /= 10;
        }

        if (fraction_multiplier == 0)
        {
            return ConversionResult<Amount>::failure(
                ConversionStatus::FRACTIONAL, fractional_message);
        }

        value += digits_to_amount(fraction) * fraction_multiplier;
    }

    return ConversionResult<Amount>::success(std::move(value));
}
}  // namespace ethunits::conversion
