#include "echelon/algorithms.hpp"

#include <algorithm>
#include <boost/dynamic_bitset.hpp>
#include <cmath>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace echelon {

pivot_map ColumnClassification::pivot_row_of_col() const {
    if (pivot_columns.size() != pivot_rows.size())
        throw InvalidDimensions("pivot_row_of_col: pivot columns and rows differ in length");

    pivot_map m;
    m.reserve(pivot_columns.size());
    for (index_t k = 0; k < pivot_columns.size(); ++k)
        m.insert_or_assign(pivot_columns[k], pivot_rows[k]);
    return m;
}

Matrix augment(const Matrix& A, RowCView b) {
    if (A.rows() != b.size())
        throw InvalidDimensions("augment: A has " + std::to_string(A.rows()) + " rows but b has " +
                                std::to_string(b.size()) + " entries");

    Matrix out = A;
    out.append_right_inplace(b);
    return out;
}

// zero_tolerance is relative to the largest entry of the matrix a stage receives
static scalar_t absolute_tolerance(const Matrix& matrix, scalar_t zero_tolerance) noexcept {
    return zero_tolerance * matrix.max_abs();
}

static void flush_small(RowView row, scalar_t tol) noexcept {
    for (index_t k = 0; k < row.size(); ++k)
        if (std::abs(row[k]) <= tol)
            row[k] = 0.0;
}

void row_echelon_inplace(Matrix& matrix, scalar_t zero_tolerance) {
    const index_t m = matrix.rows();

    // magnitude[i] bounds what has been subtracted from row i; rounding residue scales with it
    std::vector<scalar_t> magnitude(m, matrix.max_abs());

    for (index_t i = 0; i < m; ++i) {
        auto           row = matrix[i];
        const scalar_t tol = zero_tolerance * magnitude[i];

        // residue left by earlier eliminations must not survive the normalization below
        flush_small(row, tol);
        const index_t p = row.find_first(tol);
        if (p == RowView::npos)
            continue;

        const scalar_t inv = 1.0 / row[p];
        if (!std::isfinite(inv))
            throw SingularPivot("to_row_echelon: pivot too small to normalize", i, p);
        row.scale(inv);
        row[p] = 1.0;

        const scalar_t row_max = row.max_abs();
        for (index_t j = i + 1; j < m; ++j) {
            auto           below  = matrix[j];
            const scalar_t factor = below[p];
            if (factor == 0.0)
                continue;
            sub_scaled(below, factor, row);
            below[p]     = 0.0;
            magnitude[j] = std::max(magnitude[j], std::abs(factor) * row_max);
        }
    }
}

void reduced_row_echelon_inplace(Matrix& matrix, scalar_t zero_tolerance) {
    const scalar_t tol = absolute_tolerance(matrix, zero_tolerance);

    for (index_t i = matrix.rows(); i-- > 0;) {
        auto row = matrix[i];

        const index_t p = row.find_first(tol);
        if (p == RowView::npos)
            continue;
        if (std::abs(row[p] - 1.0) > std::max(tol, 1e-9))
            throw NotEchelonForm("to_reduced_row_echelon: unnormalized pivot, input is not in row-echelon form", i,
                                 p);

        for (index_t j = 0; j < i; ++j) {
            auto           above  = matrix[j];
            const scalar_t factor = above[p];
            if (factor == 0.0)
                continue;
            sub_scaled(above, factor, row);
            above[p] = 0.0;
        }
    }
}

Matrix to_row_echelon(Matrix matrix, scalar_t zero_tolerance) {
    row_echelon_inplace(matrix, zero_tolerance);
    return matrix;
}

Matrix to_reduced_row_echelon(Matrix matrix, scalar_t zero_tolerance) {
    reduced_row_echelon_inplace(matrix, zero_tolerance);
    return matrix;
}

ColumnClassification classify_columns(const Matrix& rref, scalar_t zero_tolerance) {
    if (rref.cols() == 0)
        throw InvalidDimensions("classify_columns: augmented matrix has no right-hand side column");

    const index_t  n   = rref.cols() - 1;
    const scalar_t tol = absolute_tolerance(rref, zero_tolerance);

    ColumnClassification    out;
    boost::dynamic_bitset<> is_pivot(n);

    for (index_t i = 0; i < rref.rows(); ++i) {
        const auto row = rref[i];

        const index_t p = row.find_first(tol);
        if (p == RowCView::npos)
            continue;
        if (p == n) {
            out.inconsistent_rows.push_back(i);
            continue;
        }
        if (is_pivot.test(p))
            throw NotEchelonForm("classify_columns: column holds two pivots, matrix is not in echelon form", i, p);
        is_pivot.set(p);
        out.pivot_columns.push_back(p);
        out.pivot_rows.push_back(i);
    }

    for (index_t j = 0; j < n; ++j)
        if (!is_pivot.test(j))
            out.non_pivot_columns.push_back(j);
    return out;
}

void check_consistency(const ColumnClassification& classification) {
    if (!classification.consistent())
        throw InconsistentSystem("system has no solution: zero coefficients with nonzero right-hand side",
                                 classification.inconsistent_rows.front());
}

SolutionSet assemble(const Matrix& rref, const ColumnClassification& classification, const SolverConfig& config) {
    if (rref.cols() == 0 || classification.coefficient_cols() != rref.cols() - 1)
        throw InvalidDimensions("assemble: classification does not cover the coefficient columns");
    if (config.check_consistency)
        check_consistency(classification);

    const index_t   n      = rref.cols() - 1;
    const pivot_map owners = classification.pivot_row_of_col();
    for (const auto& [col, row] : owners)
        if (row >= rref.rows() || col >= n)
            throw InvalidDimensions("assemble: pivot outside the matrix", row, col);

    SolutionSet out;
    out.particular = Vector(n);
    for (const auto& [col, row] : owners)
        out.particular[col] = rref(row, n);

    out.null_space_basis.reserve(classification.non_pivot_columns.size());
    for (index_t f : classification.non_pivot_columns) {
        Vector v(n);
        v[f] = 1.0;
        for (const auto& [col, row] : owners)
            v[col] = -rref(row, f);
        out.null_space_basis.push_back(std::move(v));
    }

    out.classification = classification;
    return out;
}

SolutionSet solve_linear_system(const Matrix& A, RowCView b, const SolverConfig& config) {
    // augment copies, so the caller's A and b are never touched
    Matrix work = augment(A, b);
    row_echelon_inplace(work, config.zero_tolerance);
    // every entry the forward pass treated as zero is now exactly 0.0
    reduced_row_echelon_inplace(work, 0.0);

    return assemble(work, classify_columns(work, 0.0), config);
}

std::vector<SolveOutcome> solve_linear_systems(const std::vector<System>& systems, const SolverConfig& config) {
    std::vector<SolveOutcome> out(systems.size());

#ifdef _OPENMP
    if (config.threads > 0)
        omp_set_num_threads(config.threads);
#pragma omp parallel for schedule(dynamic)
#endif
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(systems.size()); ++i) {
        const System& sys = systems[static_cast<std::size_t>(i)];
        SolveOutcome& res = out[static_cast<std::size_t>(i)];
        try {
            res.solution = solve_linear_system(sys.A, sys.b, config);
        } catch (const Error& e) {
            res.error   = e.kind();
            res.message = e.what();
            res.row     = e.row();
            res.col     = e.col();
        }
    }
    return out;
}

static std::ostream& print_indices(std::ostream& os, const std::vector<index_t>& v) {
    os << '[';
    for (index_t k = 0; k < v.size(); ++k)
        os << (k ? ", " : "") << v[k];
    return os << ']';
}

std::ostream& operator<<(std::ostream& os, const ColumnClassification& cls) {
    os << "pivot columns: ";
    print_indices(os, cls.pivot_columns) << "\nnon-pivot columns: ";
    print_indices(os, cls.non_pivot_columns) << "\nrank: " << cls.rank();
    if (!cls.consistent()) {
        os << "\ninconsistent rows: ";
        print_indices(os, cls.inconsistent_rows);
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const pivot_map& m) {
    std::vector<std::pair<index_t, index_t>> sorted(m.begin(), m.end());
    std::ranges::sort(sorted);
    os << '{';
    bool first = true;
    for (const auto& [k, v] : sorted) {
        if (!first)
            os << ", ";
        first = false;
        os << k << ':' << v;
    }
    return os << '}';
}

} // namespace echelon
