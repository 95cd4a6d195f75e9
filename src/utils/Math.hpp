/* ----------------------------------------------------------------------- *//**
 *
 * @file Math.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_MATH_HPP
#define DISCLIB_MATH_HPP

#include <cmath>
#include <limits>

#include <boost/utility/enable_if.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

namespace disclib {

namespace utils {

/**
 * @brief Test if a floating point value is a finite whole number
 *
 * Negative zero counts as a whole number, infinities and NaN do not.
 */
template <class T>
inline
typename boost::enable_if_c<!std::numeric_limits<T>::is_integer, bool>::type
isWholeNumber(const T& inValue) {
    return boost::math::isfinite(inValue) && std::floor(inValue) == inValue;
}

} // namespace utils

} // namespace disclib

#endif // defined(DISCLIB_MATH_HPP)
