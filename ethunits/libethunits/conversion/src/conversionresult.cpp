#include "ethunits/conversionresult.hpp"

#include <glog/logging.h>

namespace ethunits
{
const char *to_string(ConversionStatus status)
{
    switch (status)
    {
        case ConversionStatus::OK: return "OK";
        case ConversionStatus::EMPTY_VALUE: return "EMPTY_VALUE";
        case ConversionStatus::INVALID_FORMAT: return "INVALID_FORMAT";
        case ConversionStatus::UNKNOWN_UNIT: return "UNKNOWN_UNIT";
        case ConversionStatus::FRACTIONAL: return "FRACTIONAL";
        case ConversionStatus::NEGATIVE: return "NEGATIVE";
        case ConversionStatus::PARSE_FAILURE: return "PARSE_FAILURE";
        default:
        {
            LOG(ERROR) << "Unknown conversion status " << static_cast<int>(status);
            return "UNKNOWN";
        }
    }
}
}  // namespace ethunits
