/* ----------------------------------------------------------------------- *//**
 *
 * @file hal_impl.hpp
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_HAL_IMPL_HPP
#define DISCLIB_HAL_IMPL_HPP

#include "OutputStreamBufferBase_impl.hpp"

#endif // defined(DISCLIB_HAL_IMPL_HPP)
