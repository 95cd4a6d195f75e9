/* ----------------------------------------------------------------------- *//**
 *
 * @file binomial.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_MODULES_PROB_BINOMIAL_HPP
#define DISCLIB_MODULES_PROB_BINOMIAL_HPP

#include <boost/cstdint.hpp>

namespace disclib {

namespace modules {

namespace prob {

/**
 * @brief Expected number of successes in \f$ n \f$ trials
 *
 * @param n Number of trials, n > 0
 * @param p Success probability, 0 <= p <= 1
 */
double mean_binomial(int64_t n, double p);

/**
 * @brief Variance of the binomial distribution
 */
double variance_binomial(int64_t n, double p);

/**
 * @brief Binomial probability mass function \f$ P(X = k) \f$
 *
 * The binomial coefficient is never formed explicitly, so the result is
 * accurate also when \f$ n! \f$ is far outside the range of a double.
 */
double pmf_binomial(int64_t n, double p, int64_t k);

/**
 * @brief Binomial cumulative distribution function \f$ P(X \leq k) \f$
 */
double cdf_binomial(int64_t n, double p, int64_t k);

/**
 * @brief Binomial quantile function
 *
 * @return The smallest \f$ k \in \{0, \dots, n\} \f$ with
 *     \f$ P(X \leq k) \geq x \f$
 */
int64_t quantile_binomial(int64_t n, double p, double x);

} // namespace prob

} // namespace modules

} // namespace disclib

#endif // defined(DISCLIB_MODULES_PROB_BINOMIAL_HPP)
