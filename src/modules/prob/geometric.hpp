/* ----------------------------------------------------------------------- *//**
 *
 * @file geometric.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_MODULES_PROB_GEOMETRIC_HPP
#define DISCLIB_MODULES_PROB_GEOMETRIC_HPP

#include <boost/cstdint.hpp>

namespace disclib {

namespace modules {

namespace prob {

/**
 * @brief The two parameterizations of the geometric distribution
 *
 * The integer codes are part of the interface: see toSupport().
 */
enum GeometricSupport {
    /// Number of Bernoulli trials up to and including the first success,
    /// k = 1, 2, 3, ...
    kTrialsToSuccess = 0,
    /// Number of failures before the first success, k = 0, 1, 2, ...
    kFailuresBeforeSuccess = 1
};

/**
 * @brief Mean of the geometric distribution
 *
 * @param p Success probability, 0 < p <= 1
 * @param support Support convention
 */
double mean_geometric(double p, GeometricSupport support = kTrialsToSuccess);

/**
 * @brief Variance of the geometric distribution, which is the same for both
 *     support conventions
 */
double variance_geometric(double p,
    GeometricSupport support = kTrialsToSuccess);

/**
 * @brief Geometric probability mass function \f$ P(X = k) \f$
 */
double pmf_geometric(double p, int64_t k,
    GeometricSupport support = kTrialsToSuccess);

/**
 * @brief Geometric cumulative distribution function \f$ P(X \leq k) \f$
 */
double cdf_geometric(double p, int64_t k,
    GeometricSupport support = kTrialsToSuccess);

/**
 * @brief Geometric quantile function
 *
 * @return The smallest outcome \f$ k \f$ of the support with
 *     \f$ P(X \leq k) \geq x \f$. This is infinity if \f$ x = 1 \f$ and
 *     \f$ p < 1 \f$.
 */
double quantile_geometric(double p, double x,
    GeometricSupport support = kTrialsToSuccess);

} // namespace prob

} // namespace modules

} // namespace disclib

#endif // defined(DISCLIB_MODULES_PROB_GEOMETRIC_HPP)
