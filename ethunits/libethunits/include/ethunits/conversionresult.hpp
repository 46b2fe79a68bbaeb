#ifndef LIBETHUNITS_CONVERSIONRESULT_HPP_
#define LIBETHUNITS_CONVERSIONRESULT_HPP_

#include <string>
#include <utility>

namespace ethunits
{
enum class ConversionStatus
{
    OK,
    EMPTY_VALUE,
    INVALID_FORMAT,
    UNKNOWN_UNIT,
    FRACTIONAL,
    NEGATIVE,
    PARSE_FAILURE
};

[[nodiscard]] const char *to_string(ConversionStatus status);

template<typename Value>
struct ConversionResult
{
    ConversionStatus status = ConversionStatus::OK;
    Value            value {};
    std::string      error_message;

    [[nodiscard]] bool ok() const
    {
        return status == ConversionStatus::OK;
    }

    explicit operator bool() const
    {
        return ok();
    }

    static ConversionResult success(Value v)
    {
        return {ConversionStatus::OK, std::move(v), {}};
    }

    static ConversionResult failure(ConversionStatus s, std::string message)
    {
        return {s, Value {}, std::move(message)};
    }

    // Carries the error of a result holding a different value type
    template<typename OtherValue>
    static ConversionResult failure(const ConversionResult<OtherValue> &other)
    {
        return {other.status, Value {}, other.error_message};
    }
};
}  // namespace ethunits

#endif  // LIBETHUNITS_CONVERSIONRESULT_HPP_
