/*
 * helper.h
 *
 * This file contains functions that can be used everywhere
 * in the dispatch optimization.
 * They might make things more easy.
 */

#ifndef __HELPER_H_
#define __HELPER_H_

#include <cstddef>
#include <string>


/**
 * Rounds a double on n decimal places
 */
double round_double_n(double x, unsigned int decimal_places);

/**
 * Returns true, if |a - b| <= abs_tol + rel_tol * max(|a|, |b|)
 */
bool is_approx_equal(double a, double b, double abs_tol = 1e-6, double rel_tol = 1e-9);

/**
 * Returns a lower case copy of the given string with leading and trailing white spaces removed.
 */
std::string to_lower_trimmed(const std::string& str);

/*
 * Computes the hour of the day (in [0, 24)) at the start of time step t
 * for a horizon beginning at start_hour with steps of timestep_hours.
 */
double hour_of_day_at_step(std::size_t t, double timestep_hours, double start_hour);


#endif
