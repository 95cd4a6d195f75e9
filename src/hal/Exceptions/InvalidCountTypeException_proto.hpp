/* ----------------------------------------------------------------------- *//**
 *
 * @file InvalidCountTypeException_proto.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_INVALIDCOUNTTYPEEXCEPTION_PROTO_HPP
#define DISCLIB_HAL_INVALIDCOUNTTYPEEXCEPTION_PROTO_HPP

namespace disclib {

namespace hal {

/**
 * @brief Exception indicating that a count argument is not a whole number
 *     representable as a 64-bit integer
 */
class InvalidCountTypeException
  : public std::domain_error {

public:
    explicit
    InvalidCountTypeException()
      : std::domain_error("Count argument must be an integer.") { }

    explicit
    InvalidCountTypeException(const std::string& inMsg)
      : std::domain_error(inMsg) { }
};

} // namespace hal

} // namespace disclib

#endif // defined(DISCLIB_HAL_INVALIDCOUNTTYPEEXCEPTION_PROTO_HPP)
