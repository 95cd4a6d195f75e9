/* ----------------------------------------------------------------------- *//**
 *
 * @file InvalidCountRangeException_proto.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_INVALIDCOUNTRANGEEXCEPTION_PROTO_HPP
#define DISCLIB_HAL_INVALIDCOUNTRANGEEXCEPTION_PROTO_HPP

namespace disclib {

namespace hal {

/**
 * @brief Exception indicating that an integer argument lies outside the domain
 *     implied by the distribution, e.g., a negative outcome or k > n
 */
class InvalidCountRangeException
  : public std::domain_error {

public:
    explicit
    InvalidCountRangeException()
      : std::domain_error("Count argument is out of range.") { }

    explicit
    InvalidCountRangeException(const std::string& inMsg)
      : std::domain_error(inMsg) { }
};

} // namespace hal

} // namespace disclib

#endif // defined(DISCLIB_HAL_INVALIDCOUNTRANGEEXCEPTION_PROTO_HPP)
