/* ----------------------------------------------------------------------- *//**
 *
 * @file modules.hpp
 *
 * @brief Umbrella header that includes all module headers
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_MODULES_MODULES_HPP
#define DISCLIB_MODULES_MODULES_HPP

#include <modules/prob/prob.hpp>

#endif // defined(DISCLIB_MODULES_MODULES_HPP)
