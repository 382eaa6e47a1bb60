#pragma once
#include "matrix.hpp"
#include "typedef.hpp"

namespace echelon {

struct QrResult {
    Matrix Q; // m x n, orthonormal columns
    Matrix R; // n x n, upper triangular
};

struct LuResult {
    Matrix L; // unit lower triangular
    Matrix U; // upper triangular
};

// classical Gram-Schmidt; linearly dependent columns raise SingularPivot
QrResult qr_decompose(const Matrix& A, scalar_t tol = 1e-12);
bool     columns_linearly_independent(const Matrix& A, scalar_t tol = 1e-12);

Matrix   cholesky(const Matrix& A);
LuResult lu_decompose(const Matrix& A);

bool     is_symmetric(const Matrix& A, scalar_t tol = 0.0) noexcept;
bool     is_positive_definite(const Matrix& A);
scalar_t determinant(const Matrix& A);

// elementary row-operation matrices: left-multiplying by them scales row, adds multiplier * source to
// target, or swaps two rows
Matrix elementary_scale(index_t n, index_t row, scalar_t scalar);
Matrix elementary_add(index_t n, index_t target, index_t source, scalar_t multiplier);
Matrix elementary_swap(index_t n, index_t row1, index_t row2);

} // namespace echelon
