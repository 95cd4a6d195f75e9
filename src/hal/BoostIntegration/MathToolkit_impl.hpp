/* ----------------------------------------------------------------------- *//**
 *
 * @file MathToolkit_impl.hpp
 *
 * @brief User-defined error handling functions
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_BOOST_INTEGRATION_MATH_TOOLKIT_IMPL_HPP
#define DISCLIB_HAL_BOOST_INTEGRATION_MATH_TOOLKIT_IMPL_HPP

#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <stdexcept>
#include <string>

#include <boost/format.hpp>
#include <boost/math/policies/error_handling.hpp>
#include <boost/math/policies/policy.hpp>

namespace boost {

namespace math {

namespace policies {

/**
 * @brief Boost user-defined domain-error handling function
 *
 * This function is called by the domain_error<user_error> policy in case
 * function arguments (or parameters) are outside of the domain of the
 * probability function.
 *
 * Our policy is to let NaNs propagate. All other errors we handle by throwing
 * a std::domain_error containing the text supplied by boost.
 *
 * @param inFunction The name of the function that raised the error, this string
 *     contains one or more %1% format specifiers that should be replaced by the
 *     name of real type T, like float or double.
 * @param inMessage A message associated with the error, normally this contains
 *     a %1% format specifier that should be replaced with the value of value.
 * @param inVal The value that caused the error.
 */
template <class T>
inline
T
user_domain_error(const char*, const char* inMessage, const T& inVal) {
    if (std::isnan(inVal))
        return std::numeric_limits<T>::quiet_NaN();

    // The following line is taken from
    // http://www.boost.org/doc/libs/1_49_0/libs/math/doc/sf_and_dist/html/math_toolkit/policy/pol_tutorial/user_def_err_pol.html
    int prec = 2 + (std::numeric_limits<T>::digits * 30103UL) / 100000UL;

    std::string msg = (boost::format(inMessage)
            % boost::io::group(std::setprecision(prec), inVal)
        ).str();

    // Some Boost error messages contain a space before the punctuation mark,
    // which we will remove.
    if (msg.size() >= 2) {
        std::string::iterator lastChar = msg.end() - 1;
        std::string::iterator secondLastChar = msg.end() - 2;
        if (std::ispunct(static_cast<unsigned char>(*lastChar))
            && std::isspace(static_cast<unsigned char>(*secondLastChar)))
            msg.erase(secondLastChar, lastChar);
    }

    throw std::domain_error(msg);
}

} // namespace policies

} // namespace math

} // namespace boost

namespace disclib {

/**
 * @brief The policy every distribution object of this library is created with
 *
 * Domain errors go through user_domain_error() above. Overflow is not an error:
 * the result saturates to infinity. Discrete quantiles are rounded up, so they
 * land on the smallest outcome whose CDF reaches the requested level.
 */
typedef boost::math::policies::policy<
    boost::math::policies::domain_error<boost::math::policies::user_error>,
    boost::math::policies::overflow_error<boost::math::policies::ignore_error>,
    boost::math::policies::discrete_quantile<
        boost::math::policies::integer_round_up>
> boost_mathkit_policy;

} // namespace disclib

#endif // !defined(DISCLIB_HAL_BOOST_INTEGRATION_MATH_TOOLKIT_IMPL_HPP)
