/* ----------------------------------------------------------------------- *//**
 *
 * @file geometric.cpp
 *
 * @brief Probability mass and distribution functions of the geometric
 *     distribution, evaluated with Boost.
 *
 *//* ----------------------------------------------------------------------- */

#include <modules/common.hpp>
#include <modules/prob/boost.hpp>

#include "geometric.hpp"

namespace disclib {

namespace modules {

namespace prob {

#define GEOMETRIC_DOMAIN_CHECK(p) \
    do { \
        if ( !(0 < p && p <= 1) ) { \
            throw InvalidProbabilityException((boost::format( \
                "Geometric distribution is undefined when p doesn't conform " \
                "to (0 < p <= 1), but p was: %1%.") % p).str()); \
        } \
    } while(0)

#define GEOMETRIC_SUPPORT_CHECK(support) \
    do { \
        if ( support != kTrialsToSuccess \
            && support != kFailuresBeforeSuccess ) { \
            throw InvalidSupportException((boost::format( \
                "Support can only be 0 (trials to the first success) or 1 " \
                "(failures before the first success), but was: %1%.") \
                % static_cast<int>(support)).str()); \
        } \
    } while(0)

#define GEOMETRIC_LEVEL_CHECK(x) \
    do { \
        if ( !(0 <= x && x <= 1) ) { \
            throw InvalidProbabilityException((boost::format( \
                "Quantile of geometric distribution is undefined when x " \
                "doesn't conform to (0 <= x <= 1), but x was: %1%.") \
                % x).str()); \
        } \
    } while(0)

namespace {

/**
 * @brief Smallest outcome of a support convention
 *
 * Boost counts failures, so this is also the shift between an outcome and the
 * random variate passed to Boost.
 */
inline
int64_t
geometric_support_min(GeometricSupport support) {
    return support == kTrialsToSuccess ? 1 : 0;
}

inline
void
geometric_outcome_check(int64_t k, GeometricSupport support) {
    if (k >= geometric_support_min(support))
        return;

    if (support == kTrialsToSuccess)
        throw InvalidCountRangeException((boost::format(
            "k can only be a positive integer when counting trials to the "
            "first success, but k was: %1%.") % k).str());
    else
        throw InvalidCountRangeException((boost::format(
            "k can only be a non-negative integer when counting failures "
            "before the first success, but k was: %1%.") % k).str());
}

} // anonymous namespace

double
mean_geometric(double p, GeometricSupport support) {
    GEOMETRIC_DOMAIN_CHECK(p);
    GEOMETRIC_SUPPORT_CHECK(support);

    return boost::math::mean(geometric(p))
        + static_cast<double>(geometric_support_min(support));
}

double
variance_geometric(double p, GeometricSupport support) {
    GEOMETRIC_DOMAIN_CHECK(p);
    GEOMETRIC_SUPPORT_CHECK(support);

    return boost::math::variance(geometric(p));
}

double
pmf_geometric(double p, int64_t k, GeometricSupport support) {
    GEOMETRIC_DOMAIN_CHECK(p);
    GEOMETRIC_SUPPORT_CHECK(support);
    geometric_outcome_check(k, support);

    return prob::pdf(geometric(p),
        static_cast<double>(k - geometric_support_min(support)));
}

double
cdf_geometric(double p, int64_t k, GeometricSupport support) {
    GEOMETRIC_DOMAIN_CHECK(p);
    GEOMETRIC_SUPPORT_CHECK(support);
    geometric_outcome_check(k, support);

    return prob::cdf(geometric(p),
        static_cast<double>(k - geometric_support_min(support)));
}

/**
 * Boost's geometric quantile is a real-valued estimate. We round it up and
 * then step to the smallest number of failures whose CDF reaches x, so that
 * the result agrees with cdf_geometric() exactly.
 *
 * From 2^53 on, consecutive doubles are more than one apart and the CDF is
 * flat to double precision, so the rounded estimate is returned unchanged.
 */
double
quantile_geometric(double p, double x, GeometricSupport support) {
    // Largest integer up to which every integer is exactly representable
    static const double kMaxExactInteger = 9007199254740992.0;

    GEOMETRIC_DOMAIN_CHECK(p);
    GEOMETRIC_LEVEL_CHECK(x);
    GEOMETRIC_SUPPORT_CHECK(support);

    geometric dist(p);
    double offset = static_cast<double>(geometric_support_min(support));

    if (x == 1 && p < 1) {
        warning((boost::format("Quantile of geometric distribution (p = %1%) "
            "at level 1 is infinite.") % p).str());
        return std::numeric_limits<double>::infinity();
    }

    double failures = std::max(0., std::ceil(prob::quantile(dist, x)));
    if (failures >= kMaxExactInteger)
        return failures + offset;

    while (failures > 0 && prob::cdf(dist, failures - 1) >= x)
        --failures;
    while (failures < kMaxExactInteger && prob::cdf(dist, failures) < x)
        ++failures;

    return failures + offset;
}

#undef GEOMETRIC_LEVEL_CHECK
#undef GEOMETRIC_SUPPORT_CHECK
#undef GEOMETRIC_DOMAIN_CHECK

} // namespace prob

} // namespace modules

} // namespace disclib
