#pragma once
#include "errors.hpp"
#include "matrix.hpp"
#include "typedef.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace echelon {

constexpr scalar_t k_default_zero_tolerance = 1e-12;

struct SolverConfig {
    // relative: entries with |x| <= zero_tolerance * max|M| count as zero, M being the matrix a stage
    // receives (the forward pass also scales by what elimination subtracted from the row);
    // 0.0 gives the exact "first nonzero entry" rule
    scalar_t zero_tolerance    = k_default_zero_tolerance;
    bool     check_consistency = true;
    int      threads           = 1;
};

struct ColumnClassification {
    std::vector<index_t> pivot_columns;     // in order of the owning row
    std::vector<index_t> pivot_rows;        // pivot_rows[k] owns pivot_columns[k]
    std::vector<index_t> non_pivot_columns; // ascending
    std::vector<index_t> inconsistent_rows; // rows reading 0 ... 0 | c with c != 0

    index_t rank() const noexcept { return pivot_columns.size(); }
    index_t coefficient_cols() const noexcept { return pivot_columns.size() + non_pivot_columns.size(); }
    bool    consistent() const noexcept { return inconsistent_rows.empty(); }

    pivot_map pivot_row_of_col() const;
};

struct SolutionSet {
    Vector               particular;
    std::vector<Vector>  null_space_basis; // one per non-pivot column, same order
    ColumnClassification classification;

    index_t unknowns() const noexcept { return particular.size(); }
    index_t rank() const noexcept { return classification.rank(); }
    bool    unique() const noexcept { return null_space_basis.empty(); }
};

struct System {
    Matrix A;
    Vector b;
};

// result of one system in a batch solve; either solution or error is set
struct SolveOutcome {
    std::optional<SolutionSet> solution;
    std::optional<ErrorKind>   error;
    std::string                message;
    index_t                    row = npos;
    index_t                    col = npos;

    bool ok() const noexcept { return solution.has_value(); }
};

Matrix augment(const Matrix& A, RowCView b);

// in-place forms; the pure forms below copy their argument and call these.
// The forward pass sets every entry it treats as zero to exactly 0.0, so its output can be reduced
// and classified with tolerance 0.
void row_echelon_inplace(Matrix& matrix, scalar_t zero_tolerance = k_default_zero_tolerance);
void reduced_row_echelon_inplace(Matrix& matrix, scalar_t zero_tolerance = k_default_zero_tolerance);

[[nodiscard]] Matrix to_row_echelon(Matrix matrix, scalar_t zero_tolerance = k_default_zero_tolerance);
[[nodiscard]] Matrix to_reduced_row_echelon(Matrix matrix, scalar_t zero_tolerance = k_default_zero_tolerance);

ColumnClassification classify_columns(const Matrix& rref, scalar_t zero_tolerance = k_default_zero_tolerance);
void                 check_consistency(const ColumnClassification& classification);

SolutionSet assemble(const Matrix& rref, const ColumnClassification& classification,
                     const SolverConfig& config = {});

SolutionSet solve_linear_system(const Matrix& A, RowCView b, const SolverConfig& config = {});

std::vector<SolveOutcome> solve_linear_systems(const std::vector<System>& systems, const SolverConfig& config = {});

std::ostream& operator<<(std::ostream& os, const ColumnClassification& cls);
std::ostream& operator<<(std::ostream& os, const pivot_map& m);

} // namespace echelon
