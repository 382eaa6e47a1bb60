#include "echelon/nullspace.hpp"

#include "echelon/errors.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace echelon {

Vector SolutionSpace::linear_combination(RowCView coefs) const {
    if (coefs.size() != dim())
        throw InvalidDimensions("linear_combination: expected " + std::to_string(dim()) + " coefficients, got " +
                                std::to_string(coefs.size()));

    Vector out(unknowns());
    for (index_t k = 0; k < dim(); ++k)
        sub_scaled(out, -coefs[k], basis()[k]);
    return out;
}

Vector SolutionSpace::point(RowCView params) const {
    Vector out = linear_combination(params);
    out += particular();
    return out;
}

Matrix SolutionSpace::basis_matrix() const {
    if (basis().empty())
        return Matrix(unknowns(), 0);
    return Matrix::from_columns(basis());
}

bool SolutionSpace::contains(const Matrix& A, RowCView b, RowCView x, scalar_t tol) const {
    if (x.size() != unknowns())
        return false;
    return residual(A, b, x) <= tol;
}

scalar_t residual(const Matrix& A, RowCView b, RowCView x) {
    if (A.rows() != b.size())
        throw InvalidDimensions("residual: A and b differ in row count");
    return (A * x - b).max_abs();
}

static std::string format_vector(RowCView v, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << '[';
    for (index_t k = 0; k < v.size(); ++k) {
        // keep "-0.00" out of the output
        const scalar_t x = v[k] == 0.0 ? 0.0 : v[k];
        oss << (k ? ", " : "") << x;
    }
    oss << ']';
    return oss.str();
}

static std::string variable_list(const std::vector<index_t>& cols) {
    std::string out = "[";
    for (index_t k = 0; k < cols.size(); ++k)
        out += (k ? ", x" : "x") + std::to_string(cols[k] + 1);
    return out + "]";
}

std::string general_solution_string(const SolutionSet& solution, int precision) {
    std::string out = "x = " + format_vector(solution.particular, precision);

    const auto& free_cols = solution.classification.non_pivot_columns;
    for (index_t k = 0; k < solution.null_space_basis.size(); ++k) {
        const std::string param = k < free_cols.size() ? "x" + std::to_string(free_cols[k] + 1)
                                                       : "t" + std::to_string(k + 1);
        out += " + " + param + "*" + format_vector(solution.null_space_basis[k], precision);
    }
    return out;
}

std::string summary_string(const SolutionSet& solution, int precision) {
    return variable_list(solution.classification.pivot_columns) + " + " +
           format_vector(solution.particular, precision) + " + " +
           variable_list(solution.classification.non_pivot_columns);
}

std::ostream& operator<<(std::ostream& os, const SolutionSet& solution) {
    os << "particular solution: " << solution.particular << '\n';
    os << "null space basis (" << solution.null_space_basis.size() << "):";
    for (const auto& v : solution.null_space_basis)
        os << "\n  " << v;
    return os;
}

} // namespace echelon
