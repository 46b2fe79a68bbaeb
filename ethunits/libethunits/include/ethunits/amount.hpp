#ifndef LIBETHUNITS_AMOUNT_HPP_
#define LIBETHUNITS_AMOUNT_HPP_

#include <boost/multiprecision/cpp_int.hpp>

namespace ethunits
{
// Exact quantity of Wei. Signed so that a negative intermediate result can be detected and
// rejected by the parser.
using Amount = boost::multiprecision::cpp_int;
}  // namespace ethunits

#endif  // LIBETHUNITS_AMOUNT_HPP_
