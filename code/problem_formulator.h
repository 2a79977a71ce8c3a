/*
 * problem_formulator.h
 *
 * Assembles the dispatch problem (variables, bounds, objective and all rows)
 * for a wired network.
 *
 */

#ifndef PROBLEM_FORMULATOR_H
#define PROBLEM_FORMULATOR_H

#include "global.h"
#include "network.h"
#include "optimization_problem.h"


/*!
 * A problem ready to be handed to a solver adapter.
 */
struct FormulatedProblem {
    LinearProblem problem;
    VariableLayout layout;
    global::ProblemClass problem_class;
};


/**
 * Decides whether the problem has to be solved as LP or as MILP.
 * If an LP is requested, but the network contains a link with exclusive modes,
 * the problem is promoted to a MILP and a warning is written to stderr.
 */
global::ProblemClass decide_problem_class(const Network& net, global::SolveMode mode);

/**
 * Formulates the dispatch problem for the given network.
 * The network is not modified.
 *
 * @param net: The wired network
 * @param mode: The requested solve mode
 * @param soc_boundary: The boundary policy for all storage units
 *
 * @return: Problem, variable layout and problem class
 */
FormulatedProblem formulate(const Network& net, global::SolveMode mode, global::SOCBoundaryPolicy soc_boundary);

#endif
