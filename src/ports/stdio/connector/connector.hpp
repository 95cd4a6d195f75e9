/* ----------------------------------------------------------------------- *//**
 *
 * @file connector.hpp
 *
 * @brief This file should be included by user code (and nothing else)
 *
 * The stdio port is the host layer for a library that is linked directly into
 * an application: messages go to the standard error stream.
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_STDIO_CONNECTOR_HPP
#define DISCLIB_STDIO_CONNECTOR_HPP

#include <boost/math/special_functions/fpclassify.hpp>
#include <boost/utility/enable_if.hpp>
#include <algorithm>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>

#include <hal/hal.hpp>
#include <utils/Math.hpp>

#include "OutputStreamBuffer_proto.hpp"

namespace disclib {

// Import exceptions into disclib namespace
using hal::InvalidCountRangeException;
using hal::InvalidCountTypeException;
using hal::InvalidProbabilityException;
using hal::InvalidSupportException;

namespace connector {

namespace stdio {

#ifndef NDEBUG
extern std::ostream libout;
extern std::ostream liberr;
#endif

void warning(const std::string& inMsg);

} // namespace stdio

} // namespace connector

#ifndef NDEBUG
// Import global streams into disclib namespace
using connector::stdio::libout;
using connector::stdio::liberr;
#endif

using connector::stdio::warning;

} // namespace disclib

#include <hal/hal_impl.hpp>

#include "OutputStreamBuffer_impl.hpp"

#endif // !defined(DISCLIB_STDIO_CONNECTOR_HPP)
