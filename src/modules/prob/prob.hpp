/* ----------------------------------------------------------------------- *//**
 *
 * @file prob.hpp
 *
 * @brief Umbrella header that includes all probability functions
 *
 *//* ----------------------------------------------------------------------- */

#ifndef DISCLIB_MODULES_PROB_PROB_HPP
#define DISCLIB_MODULES_PROB_PROB_HPP

#include "binomial.hpp"
#include "conversion.hpp"
#include "geometric.hpp"

#endif // defined(DISCLIB_MODULES_PROB_PROB_HPP)
