/*
 * constraint_generator.h
 *
 * Constraints spanning more than one device or more than one time step:
 * mode exclusivity of multi-mode links (heat pumps), SOC continuity of
 * storage units and the energy balance of every bus.
 *
 */

#ifndef CONSTRAINT_GENERATOR_H
#define CONSTRAINT_GENERATOR_H

#include "global.h"
#include "network.h"
#include "optimization_problem.h"


namespace constraints {

    /**
     * Adds the binary mode indicators and the exclusivity rows for every link with more than one mode:
     *
     *   sum_m on_m[t] <= 1
     *   flow_m[t] <= capacity * on_m[t]     (for every mode m)
     *   sum_m flow_m[t] <= capacity         (shared capacity)
     *
     * The mode flows have to exist in the layout already. The indicator variables are added to layout.
     */
    void add_mode_exclusivity(const Network& net, LinearProblem& problem, VariableLayout& layout);

    /**
     * Adds the SOC recurrence for all T time steps of every storage unit plus the boundary row
     * (cyclic: SOC[T] = SOC[0]; fixed initial: SOC[0] = initial_soc * E).
     */
    void add_storage_continuity(const Network& net, LinearProblem& problem, const VariableLayout& layout, global::SOCBoundaryPolicy policy);

    /**
     * Adds the energy balance for every bus and time step:
     *   sum(generation + discharge + link output) - sum(grid export + charge + link input) = demand[t]
     *
     * The balance row indices are stored in layout.balance_rows.
     * @throws std::logic_error: If a device is connected to a carrier without bus (i.e. a wiring error of the network)
     */
    void add_bus_balances(const Network& net, LinearProblem& problem, VariableLayout& layout);

}

#endif
