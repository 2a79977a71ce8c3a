/*
 * dispatch_logic.h
 *
 * This contains the complete dispatch pipeline: building the network,
 * formulating and solving the problem, extracting the results and
 * diagnosing infeasible problems.
 *
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "components.h"
#include "global.h"
#include "network.h"
#include "optimization_unit_general.hpp"
#include "problem_formulator.h"
#include "result_extraction.h"

namespace dispatch {

    /*!
     * All settings of a single solve.
     */
    struct SolveOptions {
        global::SolveMode mode = global::SolveMode::Auto;
        global::SOCBoundaryPolicy soc_boundary = global::SOCBoundaryPolicy::Cyclic;
        global::SolverBackend backend = global::SolverBackend::ORTools;
        std::string lp_solver   = "GLOP"; ///< OR-Tools backend for LP problems
        std::string milp_solver = "SCIP"; ///< OR-Tools backend for MILP problems
        double time_limit_s = 0.0;        ///< 0.0 means no limit
        double relative_mip_gap = 1e-4;
        bool   diagnose_infeasibility = true;
        double state_threshold_kW = 0.1;
    };

    /**
     * Returns the solve options as currently stored in class Global
     */
    SolveOptions default_solve_options_from_global();

    struct DispatchRequest {
        std::vector<DeviceSpec> devices;
        Scenario scenario;
        SolveOptions options;
    };

    /*!
     * A bus balance that cannot be met.
     * A positive amount is a shortfall (missing supply), a negative amount a surplus that cannot be absorbed.
     */
    struct BalanceViolation {
        Carrier carrier;
        std::size_t timestep;
        double amount_kW;
    };

    enum struct FailureKind : short {
        Infeasible,
        Unbounded,
        SolverError
    };

    const char* failure_kind_name(FailureKind kind);

    struct SolveFailure {
        FailureKind kind;
        std::string reason;  ///< "timeout" if the time limit was reached
        std::vector<BalanceViolation> violations; ///< Only for FailureKind::Infeasible, may be empty if the cause could not be determined
    };

    /*!
     * Either a result or a failure is set.
     */
    struct DispatchOutcome {
        std::optional<DispatchResult> result;
        std::optional<SolveFailure> failure;

        bool succeeded() const { return result.has_value(); }
    };


    /**
     * Runs the complete pipeline for one request with the solver backend named in the request options.
     *
     * @throws ConfigurationError: On invalid devices, parameters or scenario data
     * @throws TariffConfigError: On a malformed time-of-use schedule
     * @throws std::runtime_error: If the requested solver backend is not compiled in
     */
    DispatchOutcome run_dispatch(const DispatchRequest& request);

    /**
     * Same as run_dispatch(request), but uses the given solver adapter.
     */
    DispatchOutcome run_dispatch(const DispatchRequest& request, BaseSolverAdapter& adapter);

    /**
     * Returns the solver settings for a formulated problem (LP or MILP solver name, limits).
     */
    SolverSettings make_solver_settings(const SolveOptions& options, global::ProblemClass problem_class);

    /**
     * Solves an elastic copy of the problem: every balance row gets a shortfall and a surplus slack,
     * the original costs are removed and the sum of all slacks is minimized.
     * Returns all balance rows with non-zero slack.
     */
    std::vector<BalanceViolation> diagnose_infeasibility(const FormulatedProblem& fp, const SolveOptions& options, BaseSolverAdapter& adapter);

}
