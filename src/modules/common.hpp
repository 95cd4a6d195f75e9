/* ----------------------------------------------------------------------- *//**
 *
 * @file common.hpp
 *
 * @brief Common header file all modules are supposed to include
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_MODULES_COMMON_HPP
#define DISCLIB_MODULES_COMMON_HPP

// Handle failed Boost assertions in a sophisticated way. This is implemented
// in assert.cpp. The build files define the macro for every target, so this
// only matters for translation units compiled outside of them.
#ifndef BOOST_ENABLE_ASSERT_HANDLER
#define BOOST_ENABLE_ASSERT_HANDLER
#endif

// Include the host abstraction layer through the port
#include <connector/connector.hpp>

// Import commonly used names into the modules namespace

namespace disclib {

namespace modules {

using namespace hal;

} // namespace modules

} // namespace disclib

#endif // defined(DISCLIB_MODULES_COMMON_HPP)
