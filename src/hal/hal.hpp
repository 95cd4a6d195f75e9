/* ----------------------------------------------------------------------- *//**
 *
 * @file hal.hpp
 *
 * @brief Header file for the host abstraction layer
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_HPP
#define DISCLIB_HAL_HPP

#include <ios>
#include <stdexcept>
#include <streambuf>
#include <string>

/**
 * @brief Host-independent abstractions
 */
namespace disclib {

namespace hal {

/**
 * @brief Severity of a message passed to a port's output stream buffer
 */
enum MessageLevel {
    kInfo = 0,
    kWarning
};

} // namespace hal

} // namespace disclib

// Boost integration is non-optional
#include "BoostIntegration/BoostIntegration.hpp"
#include "Exceptions/InvalidCountRangeException_proto.hpp"
#include "Exceptions/InvalidCountTypeException_proto.hpp"
#include "Exceptions/InvalidProbabilityException_proto.hpp"
#include "Exceptions/InvalidSupportException_proto.hpp"

#include "OutputStreamBufferBase_proto.hpp"

#endif // defined(DISCLIB_HAL_HPP)
