#pragma once

#include "algorithms.hpp"
#include "matrix.hpp"
#include "typedef.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace echelon {

// Affine solution set { p + sum t_k n_k } of a consistent system. Shares the solved result, so copies
// are cheap.
class SolutionSpace {
  public:
    explicit SolutionSpace(SolutionSet solution) : S_{std::make_shared<const SolutionSet>(std::move(solution))} {}
    SolutionSpace(const Matrix& A, RowCView b, const SolverConfig& config = {})
        : SolutionSpace(solve_linear_system(A, b, config)) {}

    [[nodiscard]] index_t dim() const noexcept { return S_->null_space_basis.size(); }
    [[nodiscard]] index_t unknowns() const noexcept { return S_->unknowns(); }
    [[nodiscard]] const Vector& particular() const noexcept { return S_->particular; }
    [[nodiscard]] const std::vector<Vector>& basis() const noexcept { return S_->null_space_basis; }
    [[nodiscard]] const ColumnClassification& classification() const noexcept { return S_->classification; }
    [[nodiscard]] const SolutionSet& solution() const noexcept { return *S_; }

    // sum t_k n_k
    [[nodiscard]] Vector linear_combination(RowCView coefs) const;
    // p + sum t_k n_k
    [[nodiscard]] Vector point(RowCView params) const;
    // basis as the columns of an unknowns x dim matrix
    [[nodiscard]] Matrix basis_matrix() const;

    [[nodiscard]] bool contains(const Matrix& A, RowCView b, RowCView x, scalar_t tol = 1e-9) const;

  private:
    std::shared_ptr<const SolutionSet> S_;
};

// max_i |(A x - b)_i|
scalar_t residual(const Matrix& A, RowCView b, RowCView x);

// x = [p] + x3*[n1] + ..., each parameter named after its free variable
std::string general_solution_string(const SolutionSet& solution, int precision = 4);
// [pivot variables] + [particular] + [free variables]
std::string summary_string(const SolutionSet& solution, int precision = 2);

std::ostream& operator<<(std::ostream& os, const SolutionSet& solution);

} // namespace echelon
