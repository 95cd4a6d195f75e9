/* ----------------------------------------------------------------------- *//**
 *
 * @file conversion.hpp
 *
 * @brief Conversion of loosely typed arguments, e.g., values read from a file
 *     or parsed from user input, into the argument types of the probability
 *     functions
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_MODULES_PROB_CONVERSION_HPP
#define DISCLIB_MODULES_PROB_CONVERSION_HPP

#include <boost/cstdint.hpp>

#include "geometric.hpp"

namespace disclib {

namespace modules {

namespace prob {

/**
 * @brief Map an integer code to a support convention
 *
 * @throws InvalidSupportException unless \c inCode is 0 or 1
 */
GeometricSupport toSupport(int inCode);

/**
 * @brief Convert a floating point value to a count
 *
 * The sign is not checked: Whether a negative count is admissible is up to the
 * probability function.
 *
 * @throws InvalidCountTypeException if \c inValue is not a finite whole number
 *     or does not fit into a 64-bit integer
 */
int64_t toCount(double inValue);

} // namespace prob

} // namespace modules

} // namespace disclib

#endif // defined(DISCLIB_MODULES_PROB_CONVERSION_HPP)
