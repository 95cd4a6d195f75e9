/* ----------------------------------------------------------------------- *//**
 *
 * @file conversion.cpp
 *
 *//* ----------------------------------------------------------------------- */

#include <modules/common.hpp>

#include "conversion.hpp"

namespace disclib {

namespace modules {

namespace prob {

GeometricSupport
toSupport(int inCode) {
    switch (inCode) {
        case kTrialsToSuccess:       return kTrialsToSuccess;
        case kFailuresBeforeSuccess: return kFailuresBeforeSuccess;
        default:
            throw InvalidSupportException((boost::format(
                "Support can only be 0 (trials to the first success) or 1 "
                "(failures before the first success), but was: %1%.")
                % inCode).str());
    }
}

int64_t
toCount(double inValue) {
    // 2^63 is exact in double precision; int64_t covers [-2^63, 2^63).
    static const double kUpperBound = 9223372036854775808.0;

    if (!utils::isWholeNumber(inValue))
        throw InvalidCountTypeException((boost::format(
            "Count argument must be an integer but was: %1%.")
            % inValue).str());

    if (inValue >= kUpperBound || inValue < -kUpperBound)
        throw InvalidCountTypeException((boost::format(
            "Count argument %1% does not fit into a 64-bit integer.")
            % inValue).str());

    return static_cast<int64_t>(inValue);
}

} // namespace prob

} // namespace modules

} // namespace disclib
