/* ----------------------------------------------------------------------- *//**
 *
 * @file boost.hpp
 *
 * @brief Wrappers around the Boost discrete distributions
 *
 *//* ----------------------------------------------------------------------- */

#define LIST_DISCRETE_PROB_DISTR \
    DISCLIB_ITEM(binomial) \
    DISCLIB_ITEM(geometric)


#ifndef DISCLIB_MODULES_PROB_BOOST_HPP
#define DISCLIB_MODULES_PROB_BOOST_HPP

#include <cmath>

#include <boost/math/distributions/binomial.hpp>
#include <boost/math/distributions/geometric.hpp>

namespace disclib {

namespace modules {

namespace prob {

namespace {
// No need to make this visible beyond this translation unit.

enum ProbFnOverride {
    kResultIsReady = 0,
    kLetBoostCalculate,
    kLetBoostCalculateUsingValue
};

/**
 * @brief Via (partial) specialization, this class offers a way to override
 *     boost's domain checks
 *
 * Some boost functions have domain checks we would like to override. E.g.,
 * boost's CDF of the geometric distribution loses the single-point measure at
 * success probability 1, and boost's binomial pdf raises a domain error for
 * random variates above the number of trials. By using
 * disclib::modules::prob::cdf() (and pdf/quantile, respectively), these domain
 * checks can be overridden. Where the mathematically correct value is known,
 * we return it instead of raising an error.
 *
 * Every specialization provides cdf(), pdf() and quantile(). They return
 * \c kLetBoostCalculate if boost's implementation should be called,
 * \c kLetBoostCalculateUsingValue if it should be called with the random
 * variate stored in \c outResult, and \c kResultIsReady if the function
 * result has already been stored in \c outResult and boost's implementation
 * should not be called any more.
 */
template <class Distribution>
struct DomainCheck;

/**
 * @brief Domain-check overrides for distribution functions with support in
 *     \f$ \mathbb Z \f$
 */
template <class Distribution>
struct IntegerDomainCheck {
    typedef typename Distribution::value_type RealType;

    /**
     * Random variates are floored. NaN is passed to the policy's domain-error
     * handler, which lets it propagate.
     */
    static ProbFnOverride makeIntegral(const RealType& inX,
        RealType& outResult) {

        static const char* function = "disclib::modules::prob::<unnamed>::"
            "IntegerDomainCheck::makeIntegral(...)";

        if (std::isnan(inX)) {
            outResult = boost::math::policies::raise_domain_error<RealType>(
                function,
                "Random variate must be integral but was: %1%.",
                inX,
                typename Distribution::policy_type());
            return kResultIsReady;
        }
        outResult = std::floor(inX);
        return kLetBoostCalculateUsingValue;
    }

    static ProbFnOverride cdf(const Distribution&, const RealType& inX,
        RealType& outResult) {

        return makeIntegral(inX, outResult);
    }

    static ProbFnOverride pdf(const Distribution&, const RealType& inX,
        RealType& outResult) {

        return makeIntegral(inX, outResult);
    }

    static ProbFnOverride quantile(const Distribution&, const RealType&,
        RealType&) {

        return kLetBoostCalculate;
    }
};

/**
 * @brief Domain-check overrides for distribution functions with support in
 *     \f$ \mathbb N_0 \f$
 */
template <class Distribution>
struct NonNegativeIntegerDomainCheck : public IntegerDomainCheck<Distribution> {
    typedef IntegerDomainCheck<Distribution> Base;
    typedef typename Base::RealType RealType;

    static ProbFnOverride cdf(const Distribution& inDist, const RealType& inX,
        RealType& outResult) {

        if (inX < 0) {
            outResult = 0;
            return kResultIsReady;
        }
        return Base::cdf(inDist, inX, outResult);
    }

    static ProbFnOverride pdf(const Distribution& inDist, const RealType& inX,
        RealType& outResult) {

        if (inX < 0) {
            outResult = 0;
            return kResultIsReady;
        }
        return Base::pdf(inDist, inX, outResult);
    }
};

/**
 * @brief Boost only accepts a limited range for random variates
 *
 * Random variates outside of [0, trials] are not an error: the pdf is 0 there,
 * and the cdf is 0 or 1, respectively. At success probabilities 0 and 1 the
 * distribution is a single-point measure and boost's quantile search is not
 * needed.
 */
template <class RealType, class Policy>
struct DomainCheck<boost::math::binomial_distribution<RealType, Policy> >
  : public IntegerDomainCheck<
        boost::math::binomial_distribution<RealType, Policy>
    > {
    typedef boost::math::binomial_distribution<RealType, Policy> Distribution;
    typedef IntegerDomainCheck<Distribution> Base;

    static ProbFnOverride cdf(const Distribution& inDist, const RealType& inX,
        RealType& outResult) {

        static const char* function = "disclib::modules::prob::<unnamed>::"
            "DomainCheck<binomial_distribution<%1%> >::cdf(...)";

        if (!boost::math::binomial_detail::check_dist(function, inDist.trials(),
            inDist.success_fraction(), &outResult, Policy())) {
            return kResultIsReady;
        } else if (inX < 0) {
            outResult = 0;
            return kResultIsReady;
        } else if (inX > inDist.trials()) {
            outResult = 1;
            return kResultIsReady;
        }
        return Base::cdf(inDist, inX, outResult);
    }

    static ProbFnOverride pdf(const Distribution& inDist, const RealType& inX,
        RealType& outResult) {

        static const char* function = "disclib::modules::prob::<unnamed>::"
            "DomainCheck<binomial_distribution<%1%> >::pdf(...)";

        if (!boost::math::binomial_detail::check_dist(function, inDist.trials(),
            inDist.success_fraction(), &outResult, Policy())) {
            return kResultIsReady;
        } else if (inX < 0 || inX > inDist.trials()) {
            outResult = 0;
            return kResultIsReady;
        }
        return Base::pdf(inDist, inX, outResult);
    }

    static ProbFnOverride quantile(const Distribution& inDist,
        const RealType& inP, RealType& outResult) {

        static const char* function = "disclib::modules::prob::<unnamed>::"
            "DomainCheck<binomial_distribution<%1%> >::quantile(...)";

        if (!boost::math::binomial_detail::check_dist(function, inDist.trials(),
                inDist.success_fraction(), &outResult, Policy())
            || !boost::math::detail::check_probability(function, inP,
                &outResult, Policy())) {
            return kResultIsReady;
        } else if (inDist.success_fraction() == 1) {
            // distribution is single-point measure at the number of trials,
            // unless no mass at all is requested
            outResult = inP == 0 ? 0 : inDist.trials();
            return kResultIsReady;
        } else if (inDist.success_fraction() == 0) {
            // distribution is single-point measure
            outResult = 0;
            return kResultIsReady;
        }
        return Base::quantile(inDist, inP, outResult);
    }
};

/**
 * @brief Boost's geometric distribution counts failures before the first
 *     success, so its support is \f$ \mathbb N_0 \f$
 *
 * At success probability 1 the distribution is a single-point measure at 0.
 * Boost's quantile would report infinitely many failures for probability 1
 * even then.
 */
template <class RealType, class Policy>
struct DomainCheck<boost::math::geometric_distribution<RealType, Policy> >
  : public NonNegativeIntegerDomainCheck<
        boost::math::geometric_distribution<RealType, Policy>
    > {
    typedef boost::math::geometric_distribution<RealType, Policy> Distribution;
    typedef NonNegativeIntegerDomainCheck<Distribution> Base;

    static ProbFnOverride cdf(const Distribution& inDist, const RealType& inX,
        RealType& outResult) {

        if (inDist.success_fraction() == 1 && !std::isnan(inX)) {
            outResult = inX < 0 ? 0 : 1;
            return kResultIsReady;
        }
        return Base::cdf(inDist, inX, outResult);
    }

    static ProbFnOverride quantile(const Distribution& inDist,
        const RealType& inP, RealType& outResult) {

        static const char* function = "disclib::modules::prob::<unnamed>::"
            "DomainCheck<geometric_distribution<%1%> >::quantile(...)";

        if (!boost::math::detail::check_probability(function,
                inDist.success_fraction(), &outResult, Policy())
            || !boost::math::detail::check_probability(function, inP,
                &outResult, Policy())) {
            return kResultIsReady;
        } else if (inDist.success_fraction() == 1) {
            outResult = 0;
            return kResultIsReady;
        }
        return Base::quantile(inDist, inP, outResult);
    }
};

} // anonymous namespace

#define DEFINE_BOOST_WRAPPER(_dist, _what) \
    template <class RealType, class Policy> \
    inline \
    RealType \
    _what(const boost::math::_dist ## _distribution<RealType, Policy>& dist, \
        const RealType& x) { \
        \
        typedef boost::math::_dist ## _distribution<RealType, Policy> Dist; \
        RealType result; \
        switch (DomainCheck<Dist>::_what(dist, x, result)) { \
            case kResultIsReady: return result; \
            case kLetBoostCalculate: return boost::math::_what(dist, x); \
            case kLetBoostCalculateUsingValue: \
                return boost::math::_what(dist, result); \
            default: throw std::logic_error("Unexpected case detected in " \
                "domain-check override for a boost probability function."); \
        } \
    }

#define DEFINE_BOOST_PROBABILITY_DISTR(_dist) \
    typedef boost::math::_dist ## _distribution< \
        double, boost_mathkit_policy> _dist; \
    \
    DEFINE_BOOST_WRAPPER(_dist, cdf) \
    DEFINE_BOOST_WRAPPER(_dist, pdf) \
    DEFINE_BOOST_WRAPPER(_dist, quantile)


#define DISCLIB_ITEM(_dist) \
    DEFINE_BOOST_PROBABILITY_DISTR(_dist)

// Note that boost also uses the pdf() if actually a probability mass function
// is meant
LIST_DISCRETE_PROB_DISTR

#undef DISCLIB_ITEM
#undef DEFINE_BOOST_PROBABILITY_DISTR
#undef DEFINE_BOOST_WRAPPER

} // namespace prob

} // namespace modules

} // namespace disclib

#endif // defined(DISCLIB_MODULES_PROB_BOOST_HPP)
