/* ----------------------------------------------------------------------- *//**
 *
 * @file InvalidSupportException_proto.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_INVALIDSUPPORTEXCEPTION_PROTO_HPP
#define DISCLIB_HAL_INVALIDSUPPORTEXCEPTION_PROTO_HPP

namespace disclib {

namespace hal {

/**
 * @brief Exception indicating an unknown support convention of the geometric
 *     distribution
 */
class InvalidSupportException
  : public std::domain_error {

public:
    explicit
    InvalidSupportException()
      : std::domain_error("Support can only be 0 or 1.") { }

    explicit
    InvalidSupportException(const std::string& inMsg)
      : std::domain_error(inMsg) { }
};

} // namespace hal

} // namespace disclib

#endif // defined(DISCLIB_HAL_INVALIDSUPPORTEXCEPTION_PROTO_HPP)
