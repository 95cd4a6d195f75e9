/* ----------------------------------------------------------------------- *//**
 *
 * @file InvalidProbabilityException_proto.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_INVALIDPROBABILITYEXCEPTION_PROTO_HPP
#define DISCLIB_HAL_INVALIDPROBABILITYEXCEPTION_PROTO_HPP

namespace disclib {

namespace hal {

/**
 * @brief Exception indicating that a probability argument lies outside the interval
 *     required by the distribution, or is NaN
 */
class InvalidProbabilityException
  : public std::domain_error {

public:
    explicit
    InvalidProbabilityException()
      : std::domain_error("Probability argument is out of range.") { }

    explicit
    InvalidProbabilityException(const std::string& inMsg)
      : std::domain_error(inMsg) { }
};

} // namespace hal

} // namespace disclib

#endif // defined(DISCLIB_HAL_INVALIDPROBABILITYEXCEPTION_PROTO_HPP)
