/*
 * optimization_problem.h
 *
 * Solver independent representation of a linear (or mixed-integer linear)
 * minimization problem plus the layout that maps network devices and buses
 * to variables and rows.
 *
 */

#ifndef OPTIMIZATION_PROBLEM_H
#define OPTIMIZATION_PROBLEM_H

#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "components.h"


enum struct VariableType : short {
    Continuous,
    Binary
};

/*!
 * The role of a row inside the dispatch problem.
 * Used for diagnostics and for the elastic re-formulation of infeasible problems.
 */
enum struct RowKind : short {
    BusBalance,        ///< Supply = demand for one bus and one time step
    StorageContinuity, ///< SOC recurrence between two consecutive time steps
    StorageBoundary,   ///< Cyclic or fixed initial SOC
    ModeExclusivity,   ///< Sum of the mode indicators <= 1
    ModeIndicatorLink, ///< Mode flow <= capacity * mode indicator
    CapacitySharing    ///< Sum of the mode flows <= capacity
};

struct RowTag {
    RowKind kind;
    std::string entity;     ///< Device id or carrier name of the bus
    Carrier carrier;        ///< Only meaningful for RowKind::BusBalance
    std::size_t timestep;
};

struct ProblemVariable {
    std::string name;
    double lower;
    double upper;
    double objective;
    VariableType type;
};

struct ProblemRow {
    std::string name;
    double lower;
    double upper;
    std::vector<std::pair<std::size_t, double>> coefficients; ///< (variable index, coefficient)
    RowTag tag;
};


/*!
 * A minimization problem  min c'x  s.t.  lower <= Ax <= upper,  lb <= x <= ub.
 *
 * The problem is assembled by the formulator and handed read-only to the solver adapters.
 */
class LinearProblem {
    public:
        static constexpr double infinity() { return std::numeric_limits<double>::infinity(); }

        /**
         * Adds a new variable and returns its index
         */
        std::size_t add_variable(const std::string& name, double lower, double upper, double objective = 0.0, VariableType type = VariableType::Continuous);
        /**
         * Adds a new (empty) row and returns its index
         */
        std::size_t add_row(const std::string& name, double lower, double upper, const RowTag& tag);
        /**
         * Adds value to the coefficient of variable var in row row.
         * If the variable is not yet part of the row, it is added.
         */
        void add_to_coefficient(std::size_t row, std::size_t var, double value);
        void clear_objective(); ///< Sets all objective coefficients to 0

        const std::vector<ProblemVariable>& get_variables() const { return variables; }
        const std::vector<ProblemRow>& get_rows() const { return rows; }
        std::size_t n_variables() const { return variables.size(); }
        std::size_t n_rows() const { return rows.size(); }
        std::size_t n_binary_variables() const;
        bool has_integer_variables() const { return n_binary_variables() > 0; }

        double evaluate_objective(const std::vector<double>& values) const;
        std::vector<std::size_t> find_rows(RowKind kind) const;

    private:
        std::vector<ProblemVariable> variables;
        std::vector<ProblemRow> rows;
};


/*!
 * Marker for an unused variable index.
 */
const std::size_t NO_INDEX = std::numeric_limits<std::size_t>::max();

/*!
 * Variable indices of one device. Only the vectors fitting to the
 * capability of the device are filled, all others are empty.
 */
struct DeviceVariables {
    std::vector<std::size_t> output;      ///< Generator output or grid import per time step
    std::vector<std::size_t> grid_export; ///< Grid export per time step (grid tie with export only)
    std::vector<std::size_t> charge;      ///< Storage charging power per time step
    std::vector<std::size_t> discharge;   ///< Storage discharging power per time step
    std::vector<std::size_t> soc;         ///< Stored energy at the start of each time step plus the end of the horizon (T+1 values)
    std::vector<std::vector<std::size_t>> mode_flow; ///< Input flow of a link per mode (first index) and time step (second index)
    std::vector<std::vector<std::size_t>> mode_on;   ///< Binary mode indicators per mode and time step, only for links with mode exclusivity
};

/*!
 * Maps the network to the problem.
 */
struct VariableLayout {
    std::vector<DeviceVariables> devices;             ///< Same order as Network::get_devices()
    std::vector<std::vector<std::size_t>> balance_rows; ///< Balance row per bus (same order as Network::get_buses()) and time step
};

#endif
