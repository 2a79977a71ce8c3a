#include "optimization_problem.h"

#include <string>
#include <vector>

using namespace std;


// ----------------------------- //
//      Implementation of        //
//        LinearProblem          //
// ----------------------------- //

size_t LinearProblem::add_variable(const string& name, double lower, double upper, double objective, VariableType type) {
    variables.push_back({name, lower, upper, objective, type});
    return variables.size() - 1;
}

size_t LinearProblem::add_row(const string& name, double lower, double upper, const RowTag& tag) {
    rows.push_back({name, lower, upper, {}, tag});
    return rows.size() - 1;
}

void LinearProblem::add_to_coefficient(size_t row, size_t var, double value) {
    vector<pair<size_t, double>>& coefficients = rows.at(row).coefficients;
    for (auto& entry : coefficients) {
        if (entry.first == var) {
            entry.second += value;
            return;
        }
    }
    coefficients.emplace_back(var, value);
}

void LinearProblem::clear_objective() {
    for (ProblemVariable& v : variables)
        v.objective = 0.0;
}

size_t LinearProblem::n_binary_variables() const {
    size_t n = 0;
    for (const ProblemVariable& v : variables) {
        if (v.type == VariableType::Binary)
            n++;
    }
    return n;
}

double LinearProblem::evaluate_objective(const vector<double>& values) const {
    double obj = 0.0;
    for (size_t idx = 0; idx < variables.size() && idx < values.size(); idx++)
        obj += variables[idx].objective * values[idx];
    return obj;
}

vector<size_t> LinearProblem::find_rows(RowKind kind) const {
    vector<size_t> result;
    for (size_t idx = 0; idx < rows.size(); idx++) {
        if (rows[idx].tag.kind == kind)
            result.push_back(idx);
    }
    return result;
}
