#include "echelon/decompositions.hpp"

#include "echelon/errors.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace echelon {

static void require_square(const Matrix& A, const char* who) {
    if (A.rows() != A.cols())
        throw InvalidDimensions(std::string(who) + ": expected a square matrix, got " + std::to_string(A.rows()) +
                                "x" + std::to_string(A.cols()));
}

QrResult qr_decompose(const Matrix& A, scalar_t tol) {
    const index_t m = A.rows();
    const index_t n = A.cols();

    // columns of A and Q are kept as rows of the transposes
    const Matrix At = A.transpose();
    Matrix       Qt(n, m);
    Matrix       R(n, n);

    for (index_t j = 0; j < n; ++j) {
        Row v(At[j]);
        for (index_t i = 0; i < j; ++i) {
            R(i, j) = dot(Qt[i], At[j]);
            sub_scaled(v, R(i, j), Qt[i]);
        }

        const scalar_t norm = std::sqrt(dot(v, v));
        if (norm <= tol * std::max<scalar_t>(1.0, At[j].max_abs()))
            throw SingularPivot("qr_decompose: column is linearly dependent on the previous ones", npos, j);

        R(j, j) = norm;
        v *= 1.0 / norm;
        assign(Qt[j], v);
    }
    return {Qt.transpose(), std::move(R)};
}

bool columns_linearly_independent(const Matrix& A, scalar_t tol) {
    Matrix        work = A;
    const index_t m    = work.rows();
    index_t       rank = 0;

    for (index_t col = 0; col < work.cols(); ++col) {
        index_t pivot_row = npos;
        for (index_t r = rank; r < m; ++r) {
            if (std::abs(work(r, col)) > tol) {
                pivot_row = r;
                break;
            }
        }
        if (pivot_row == npos)
            return false;

        if (pivot_row != rank) {
            Row tmp(work[rank]);
            assign(work[rank], work[pivot_row]);
            assign(work[pivot_row], tmp);
        }

        const auto pivot = work[rank];
        for (index_t r = 0; r < m; ++r) {
            if (r == rank)
                continue;
            const scalar_t factor = work(r, col) / pivot[col];
            if (factor != 0.0)
                sub_scaled(work[r], factor, pivot);
        }
        ++rank;
    }
    return rank == work.cols();
}

Matrix cholesky(const Matrix& A) {
    require_square(A, "cholesky");
    if (!is_symmetric(A, 1e-12 * std::max<scalar_t>(1.0, A.max_abs())))
        throw std::invalid_argument("cholesky: matrix is not symmetric");

    const index_t n = A.rows();
    Matrix        L(n, n);

    for (index_t i = 0; i < n; ++i) {
        for (index_t j = 0; j <= i; ++j) {
            scalar_t sum = 0.0;
            for (index_t k = 0; k < j; ++k)
                sum += L(i, k) * L(j, k);

            if (i == j) {
                const scalar_t d = A(i, i) - sum;
                if (!(d > 0.0))
                    throw SingularPivot("cholesky: matrix is not positive definite", i, i);
                L(i, j) = std::sqrt(d);
            } else {
                L(i, j) = (A(i, j) - sum) / L(j, j);
            }
        }
    }
    return L;
}

LuResult lu_decompose(const Matrix& A) {
    require_square(A, "lu_decompose");
    if (!is_symmetric(A) || !is_positive_definite(A))
        throw std::invalid_argument("lu_decompose: matrix is not symmetric positive definite");

    const index_t n = A.rows();
    Matrix        L = Matrix::identity(n);
    Matrix        U(n, n);

    for (index_t k = 0; k < n; ++k) {
        for (index_t i = 0; i <= k; ++i) {
            scalar_t sum = 0.0;
            for (index_t j = 0; j < i; ++j)
                sum += L(i, j) * U(j, k);
            U(i, k) = A(i, k) - sum;
        }
        if (U(k, k) == 0.0)
            throw SingularPivot("lu_decompose: zero pivot", k, k);

        for (index_t i = k + 1; i < n; ++i) {
            scalar_t sum = 0.0;
            for (index_t j = 0; j < k; ++j)
                sum += L(i, j) * U(j, k);
            L(i, k) = (A(i, k) - sum) / U(k, k);
        }
    }
    return {std::move(L), std::move(U)};
}

bool is_symmetric(const Matrix& A, scalar_t tol) noexcept {
    if (A.rows() != A.cols())
        return false;
    for (index_t i = 0; i < A.rows(); ++i)
        for (index_t j = 0; j < i; ++j)
            if (std::abs(A(i, j) - A(j, i)) > tol)
                return false;
    return true;
}

// leading principal minors must all be positive
bool is_positive_definite(const Matrix& A) {
    if (!is_symmetric(A))
        return false;

    for (index_t k = 1; k <= A.rows(); ++k) {
        Matrix sub(k, k);
        for (index_t i = 0; i < k; ++i)
            std::copy_n(A[i].data(), k, sub[i].data());
        if (determinant(sub) <= 0.0)
            return false;
    }
    return true;
}

static Matrix minor_without(const Matrix& A, index_t skip_col) {
    const index_t n = A.rows();
    Matrix        out(n - 1, n - 1);
    for (index_t r = 1; r < n; ++r)
        for (index_t c = 0, oc = 0; c < n; ++c)
            if (c != skip_col)
                out(r - 1, oc++) = A(r, c);
    return out;
}

// cofactor expansion along the first row
scalar_t determinant(const Matrix& A) {
    require_square(A, "determinant");

    const index_t n = A.rows();
    if (n == 0)
        return 1.0;
    if (n == 1)
        return A(0, 0);
    if (n == 2)
        return A(0, 0) * A(1, 1) - A(0, 1) * A(1, 0);

    scalar_t det = 0.0;
    for (index_t i = 0; i < n; ++i) {
        if (A(0, i) == 0.0)
            continue;
        const scalar_t sign = (i % 2 == 0) ? 1.0 : -1.0;
        det += sign * A(0, i) * determinant(minor_without(A, i));
    }
    return det;
}

static void require_row(index_t n, index_t row, const char* who) {
    if (row >= n)
        throw InvalidDimensions(std::string(who) + ": row index out of range", row);
}

Matrix elementary_scale(index_t n, index_t row, scalar_t scalar) {
    require_row(n, row, "elementary_scale");
    Matrix E     = Matrix::identity(n);
    E(row, row) = scalar;
    return E;
}

Matrix elementary_add(index_t n, index_t target, index_t source, scalar_t multiplier) {
    require_row(n, target, "elementary_add");
    require_row(n, source, "elementary_add");
    Matrix E           = Matrix::identity(n);
    E(target, source) += multiplier;
    return E;
}

Matrix elementary_swap(index_t n, index_t row1, index_t row2) {
    require_row(n, row1, "elementary_swap");
    require_row(n, row2, "elementary_swap");
    Matrix E = Matrix::identity(n);
    if (row1 != row2) {
        Row tmp(E[row1]);
        assign(E[row1], E[row2]);
        assign(E[row2], tmp);
    }
    return E;
}

} // namespace echelon
