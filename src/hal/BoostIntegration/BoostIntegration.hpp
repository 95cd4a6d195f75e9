/* ----------------------------------------------------------------------- *//**
 *
 * @file BoostIntegration.hpp
 *
 * The Boost assertion handlers are defined once, in modules/assert.cpp. Every
 * translation unit has to see BOOST_ENABLE_ASSERT_HANDLER before the first
 * Boost header, which the build files take care of.
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_BOOST_INTEGRATION_HPP
#define DISCLIB_HAL_BOOST_INTEGRATION_HPP

#include "MathToolkit_impl.hpp"

#endif // !defined(DISCLIB_HAL_BOOST_INTEGRATION_HPP)
