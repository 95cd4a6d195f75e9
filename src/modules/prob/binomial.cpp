/* ----------------------------------------------------------------------- *//**
 *
 * @file binomial.cpp
 *
 * @brief Probability mass and distribution functions of the binomial
 *     distribution, evaluated with Boost.
 *
 *//* ----------------------------------------------------------------------- */

#include <modules/common.hpp>
#include <modules/prob/boost.hpp>

#include "binomial.hpp"

namespace disclib {

namespace modules {

namespace prob {

#define BINOMIAL_DOMAIN_CHECK(n, p) \
    do { \
        if ( !(n > 0) ) { \
            throw InvalidCountRangeException((boost::format( \
                "Binomial distribution is undefined when n is not a positive " \
                "integer, but n was: %1%.") % n).str()); \
        } \
        else if ( !(p >= 0 && p <= 1) ) { \
            throw InvalidProbabilityException((boost::format( \
                "Binomial distribution is undefined when p doesn't conform " \
                "to (0 <= p <= 1), but p was: %1%.") % p).str()); \
        } \
    } while(0)

#define BINOMIAL_OUTCOME_CHECK(n, k) \
    do { \
        if ( k < 0 ) { \
            throw InvalidCountRangeException((boost::format( \
                "k can only be a non-negative integer, but k was: %1%.") \
                % k).str()); \
        } \
        else if ( k > n ) { \
            throw InvalidCountRangeException((boost::format( \
                "k cannot exceed the number of trials n = %1%, but k was: " \
                "%2%.") % n % k).str()); \
        } \
    } while(0)

#define BINOMIAL_LEVEL_CHECK(x) \
    do { \
        if ( !(0 <= x && x <= 1) ) { \
            throw InvalidProbabilityException((boost::format( \
                "Quantile of binomial distribution is undefined when x " \
                "doesn't conform to (0 <= x <= 1), but x was: %1%.") \
                % x).str()); \
        } \
    } while(0)

double
mean_binomial(int64_t n, double p) {
    BINOMIAL_DOMAIN_CHECK(n, p);

    return boost::math::mean(binomial(static_cast<double>(n), p));
}

double
variance_binomial(int64_t n, double p) {
    BINOMIAL_DOMAIN_CHECK(n, p);

    return boost::math::variance(binomial(static_cast<double>(n), p));
}

double
pmf_binomial(int64_t n, double p, int64_t k) {
    BINOMIAL_DOMAIN_CHECK(n, p);
    BINOMIAL_OUTCOME_CHECK(n, k);

    double mass = prob::pdf(binomial(static_cast<double>(n), p),
        static_cast<double>(k));

    if (mass == 0 && 0 < p && p < 1)
        warning((boost::format("Probability mass of binomial distribution "
            "(n = %1%, p = %2%) at k = %3% is below the smallest positive "
            "double and was rounded to 0.") % n % p % k).str());

    return mass;
}

double
cdf_binomial(int64_t n, double p, int64_t k) {
    BINOMIAL_DOMAIN_CHECK(n, p);
    BINOMIAL_OUTCOME_CHECK(n, k);

    return prob::cdf(binomial(static_cast<double>(n), p),
        static_cast<double>(k));
}

/**
 * Boost's estimate is only a starting point: we step to the smallest k whose
 * CDF reaches x, so that the result agrees with cdf_binomial() exactly.
 */
int64_t
quantile_binomial(int64_t n, double p, double x) {
    BINOMIAL_DOMAIN_CHECK(n, p);
    BINOMIAL_LEVEL_CHECK(x);

    binomial dist(static_cast<double>(n), p);
    double estimate = prob::quantile(dist, x);

    int64_t k = 0;
    if (estimate >= static_cast<double>(n))
        k = n;
    else if (estimate > 0)
        k = static_cast<int64_t>(estimate);

    while (k > 0 && prob::cdf(dist, static_cast<double>(k - 1)) >= x)
        --k;
    while (k < n && prob::cdf(dist, static_cast<double>(k)) < x)
        ++k;

    return k;
}

#undef BINOMIAL_LEVEL_CHECK
#undef BINOMIAL_OUTCOME_CHECK
#undef BINOMIAL_DOMAIN_CHECK

} // namespace prob

} // namespace modules

} // namespace disclib
