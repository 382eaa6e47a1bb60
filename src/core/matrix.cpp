#include "echelon/matrix.hpp"

#include "echelon/errors.hpp"

#include <algorithm>
#include <cnpy++.hpp>
#include <cstdint>
#include <cstring>

namespace echelon {

// ---------------- Row ----------------

Row Row::from_npy(const std::string& npy_path) {
    cnpypp::NpyArray arr = cnpypp::npy_load(npy_path);

    if (arr.word_sizes.back() != sizeof(scalar_t)) {
        throw InvalidDimensions("Row::from_npy: expected float64 .npy data");
    }
    if (arr.shape.size() != 1) {
        throw InvalidDimensions("Row::from_npy: expected 1D array in .npy");
    }

    const scalar_t* data = arr.data<scalar_t>();
    return Row(std::vector<scalar_t>(data, data + arr.shape[0]));
}

void Row::save_npy(const std::string& npy_path) const {
    std::vector<std::size_t> shape = {static_cast<std::size_t>(size())};
    cnpypp::npy_save(npy_path, v_.data(), shape, "w");
}

Row& Row::operator+=(RowCView rhs) {
    if (rhs.size() != size())
        throw InvalidDimensions("operator+=: dim mismatch");
    for (index_t k = 0; k < size(); ++k)
        v_[k] += rhs[k];
    return *this;
}

Row& Row::operator-=(RowCView rhs) {
    if (rhs.size() != size())
        throw InvalidDimensions("operator-=: dim mismatch");
    sub_scaled(v_.data(), 1.0, rhs.data(), size());
    return *this;
}

Row& Row::operator*=(scalar_t s) noexcept {
    view().scale(s);
    return *this;
}

Row operator+(RowCView a, RowCView b) {
    Row out(a);
    out += b;
    return out;
}

Row operator-(RowCView a, RowCView b) {
    Row out(a);
    out -= b;
    return out;
}

Row operator*(scalar_t s, RowCView a) {
    Row out(a);
    out *= s;
    return out;
}

// ---------------- Matrix ----------------

Matrix::Matrix(index_t rows, index_t cols) : rows_(rows), cols_(cols), data_(rows * cols, 0.0) {}

Matrix Matrix::identity(index_t n) {
    Matrix I(n, n);
    for (index_t i = 0; i < n; ++i)
        I(i, i) = 1.0;
    return I;
}

Matrix Matrix::from_rows(const std::vector<Row>& rows) {
    if (rows.empty())
        return Matrix();
    const index_t cols = rows[0].size();
    Matrix        M(rows.size(), cols);

    for (index_t r = 0; r < M.rows_; ++r) {
        if (rows[r].size() != cols)
            throw InvalidDimensions("from_rows: inconsistent row width", r);
        assign(M[r], rows[r].cview());
    }
    return M;
}

Matrix Matrix::from_rows(std::initializer_list<std::initializer_list<scalar_t>> rows) {
    std::vector<Row> out;
    out.reserve(rows.size());
    for (const auto& r : rows)
        out.emplace_back(r);
    return from_rows(out);
}

Matrix Matrix::from_columns(const std::vector<Row>& cols) { return from_rows(cols).transpose(); }

Matrix Matrix::from_npy(const std::string& npy_path) {
    cnpypp::NpyArray arr = cnpypp::npy_load(npy_path);

    if (arr.word_sizes.back() != sizeof(scalar_t)) {
        throw InvalidDimensions("Matrix::from_npy: expected float64 .npy data");
    }
    if (arr.shape.size() != 2) {
        throw InvalidDimensions("Matrix::from_npy: expected 2D array in .npy");
    }

    const std::size_t n_rows = arr.shape[0];
    const std::size_t n_cols = arr.shape[1];

    const scalar_t* data = arr.data<scalar_t>();

    // row-major layout in the .npy file
    Matrix mat(static_cast<index_t>(n_rows), static_cast<index_t>(n_cols));
    std::copy_n(data, n_rows * n_cols, mat.data_.begin());
    return mat;
}

void Matrix::save_npy(const std::string& npy_path) const {
    std::vector<std::size_t> shape = {static_cast<std::size_t>(rows_), static_cast<std::size_t>(cols_)};
    cnpypp::npy_save(npy_path, data_.data(), shape, "w");
}

RowCView Matrix::operator[](index_t i) const noexcept { return RowCView(data_.data() + i * cols_, cols_); }

RowView Matrix::operator[](index_t i) noexcept { return RowView(data_.data() + i * cols_, cols_); }

void Matrix::push_back(RowCView row) {
    if (rows_ == 0 && cols_ == 0)
        cols_ = row.size();
    if (row.size() != cols_)
        throw InvalidDimensions("push_back: wrong row width", rows_);

    data_.insert(data_.end(), row.begin(), row.end());
    ++rows_;
}

Row Matrix::column(index_t j) const {
    if (j >= cols_)
        throw InvalidDimensions("column: index out of range", npos, j);
    Row out(rows_);
    for (index_t r = 0; r < rows_; ++r)
        out[r] = (*this)(r, j);
    return out;
}

Matrix& Matrix::append_down_inplace(const Matrix& rhs) {
    if (rhs.rows_ == 0)
        return *this;
    if (rows_ == 0) {
        *this = rhs;
        return *this;
    }
    if (cols_ != rhs.cols_)
        throw InvalidDimensions("append_down_inplace: col mismatch");

    rows_ += rhs.rows_;
    data_.insert(data_.end(), rhs.data_.begin(), rhs.data_.end());
    return *this;
}

Matrix& Matrix::append_right_inplace(const Matrix& rhs) {
    if (rows_ != rhs.rows_)
        throw InvalidDimensions("append_right_inplace: row mismatch");
    if (rhs.cols_ == 0)
        return *this;

    const index_t new_cols = cols_ + rhs.cols_;

    std::vector<scalar_t> new_data(rows_ * new_cols, 0.0);
    for (index_t r = 0; r < rows_; ++r) {
        scalar_t* d = &new_data[r * new_cols];
        std::copy_n(data_.data() + r * cols_, cols_, d);
        std::copy_n(rhs.data_.data() + r * rhs.cols_, rhs.cols_, d + cols_);
    }

    cols_ = new_cols;
    data_.swap(new_data);
    return *this;
}

Matrix& Matrix::append_right_inplace(RowCView column) {
    if (rows_ != column.size())
        throw InvalidDimensions("append_right_inplace: row mismatch");

    Matrix col(rows_, 1);
    for (index_t r = 0; r < rows_; ++r)
        col(r, 0) = column[r];
    return append_right_inplace(col);
}

Matrix Matrix::transpose() const {
    Matrix T(cols_, rows_);
    for (index_t r = 0; r < rows_; ++r)
        for (index_t c = 0; c < cols_; ++c)
            T(c, r) = (*this)(r, c);
    return T;
}

Matrix& Matrix::operator+=(const Matrix& rhs) {
    if (rows_ != rhs.rows_ || cols_ != rhs.cols_)
        throw InvalidDimensions("operator+=: dim mismatch");

    for (index_t i = 0; i < data_.size(); ++i)
        data_[i] += rhs.data_[i];
    return *this;
}

Matrix& Matrix::operator-=(const Matrix& rhs) {
    if (rows_ != rhs.rows_ || cols_ != rhs.cols_)
        throw InvalidDimensions("operator-=: dim mismatch");

    sub_scaled(data_.data(), 1.0, rhs.data_.data(), data_.size());
    return *this;
}

Matrix Matrix::operator+(const Matrix& rhs) const {
    Matrix out = *this;
    out += rhs;
    return out;
}

Matrix Matrix::operator-(const Matrix& rhs) const {
    Matrix out = *this;
    out -= rhs;
    return out;
}

Row Matrix::operator*(RowCView v) const {
    if (v.size() != cols_)
        throw InvalidDimensions("A*v: dim mismatch");

    Row y(rows_);
    for (index_t r = 0; r < rows_; ++r)
        y[r] = dot((*this)[r], v);
    return y;
}

Matrix Matrix::operator*(const Matrix& rhs) const {
    if (cols_ != rhs.rows_)
        throw InvalidDimensions("A*B: dim mismatch");

    Matrix Bt = rhs.transpose();
    Matrix C(rows_, rhs.cols_);

    for (index_t i = 0; i < rows_; ++i)
        for (index_t j = 0; j < Bt.rows_; ++j)
            C(i, j) = dot((*this)[i], Bt[j]);
    return C;
}

bool Matrix::operator==(const Matrix& rhs) const noexcept {
    return rows_ == rhs.rows_ && cols_ == rhs.cols_ && data_ == rhs.data_;
}

scalar_t Matrix::max_abs() const noexcept {
    scalar_t m = 0.0;
    for (scalar_t x : data_)
        m = std::max(m, std::abs(x));
    return m;
}

bool approx_equal(const Matrix& lhs, const Matrix& rhs, scalar_t tol) noexcept {
    if (lhs.rows() != rhs.rows() || lhs.cols() != rhs.cols())
        return false;
    for (index_t r = 0; r < lhs.rows(); ++r)
        if (!approx_equal(lhs[r], rhs[r], tol))
            return false;
    return true;
}

std::ostream& operator<<(std::ostream& os, const Matrix& mat) {
    os << "[\n";
    for (index_t i = 0; i < mat.rows(); i++) {
        os << "  " << mat[i] << '\n';
    }
    return os << "]";
}
} // namespace echelon
