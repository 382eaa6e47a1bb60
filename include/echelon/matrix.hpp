#pragma once
#include "typedef.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

namespace echelon {

// -------------------- Views --------------------
template <class Ptr> class BasicRowView {
    Ptr     p_    = nullptr;
    index_t size_ = 0;

  public:
    static constexpr index_t npos = echelon::npos;

    BasicRowView() = default;
    BasicRowView(Ptr p, index_t size) noexcept : p_(p), size_(size) {}
    BasicRowView& operator=(const auto&) = delete;
    index_t       size() const noexcept { return size_; }

    const scalar_t* data() const noexcept { return p_; }

    // only for mutable view
    scalar_t* data() noexcept
        requires(!std::is_const_v<std::remove_pointer_t<Ptr>>)
    {
        return p_;
    }

    scalar_t operator[](index_t i) const noexcept { return p_[i]; }
    scalar_t& operator[](index_t i) noexcept
        requires(!std::is_const_v<std::remove_pointer_t<Ptr>>)
    {
        return p_[i];
    }

    const scalar_t* begin() const noexcept { return p_; }
    const scalar_t* end() const noexcept { return p_ + size_; }

    // first entry with |x| > tol, npos for a zero row
    index_t find_first(scalar_t tol = 0.0) const noexcept { return find_next_from(0, tol); }

    index_t find_next_from(index_t pos, scalar_t tol = 0.0) const noexcept {
        for (index_t k = pos; k < size_; ++k)
            if (std::abs(p_[k]) > tol)
                return k;
        return npos;
    }

    bool none(scalar_t tol = 0.0) const noexcept { return find_first(tol) == npos; }

    scalar_t max_abs() const noexcept {
        scalar_t m = 0.0;
        for (index_t k = 0; k < size_; ++k)
            m = std::max(m, std::abs(p_[k]));
        return m;
    }

    // only for mutable view
    void scale(scalar_t s) noexcept
        requires(!std::is_const_v<std::remove_pointer_t<Ptr>>)
    {
        for (index_t k = 0; k < size_; ++k)
            p_[k] *= s;
    }

    // implicit downgrade: RowView -> RowCView
    operator BasicRowView<const scalar_t*>() const noexcept { return {p_, size_}; }
};

using RowView  = BasicRowView<scalar_t*>;
using RowCView = BasicRowView<const scalar_t*>;

// -------------------- Concepts --------------------

template <class R>
concept ReadableRow = requires(const std::remove_cvref_t<R>& r) {
                          { r.size() } -> std::convertible_to<index_t>;
                          { r.data() } -> std::same_as<const scalar_t*>;
                      };

template <class R>
concept WritableRow = ReadableRow<R> && requires(std::remove_cvref_t<R>& r) {
                                            { r.data() } -> std::same_as<scalar_t*>;
                                        };

// ------------------- OPS --------------------------

inline static void sub_scaled(scalar_t* __restrict dst, scalar_t factor, const scalar_t* __restrict src,
                              index_t n) noexcept {
    for (index_t i = 0; i < n; ++i)
        dst[i] -= factor * src[i];
}

// lhs -= factor * rhs
template <WritableRow L, ReadableRow R> inline void sub_scaled(L&& lhs, scalar_t factor, const R& rhs) noexcept {
    assert(lhs.size() == rhs.size());
    assert(lhs.data() != rhs.data());
    sub_scaled(lhs.data(), factor, rhs.data(), lhs.size());
}

template <ReadableRow L, ReadableRow R> inline scalar_t dot(const L& lhs, const R& rhs) noexcept {
    assert(lhs.size() == rhs.size());
    scalar_t s = 0.0;
    for (index_t k = 0; k < lhs.size(); ++k)
        s += lhs.data()[k] * rhs.data()[k];
    return s;
}

template <ReadableRow L, ReadableRow R> inline bool operator==(const L& lhs, const R& rhs) noexcept {
    return lhs.size() == rhs.size() && std::equal(lhs.data(), lhs.data() + lhs.size(), rhs.data());
}

template <ReadableRow L, ReadableRow R> inline bool approx_equal(const L& lhs, const R& rhs, scalar_t tol) noexcept {
    if (lhs.size() != rhs.size())
        return false;
    for (index_t k = 0; k < lhs.size(); ++k)
        if (std::abs(lhs.data()[k] - rhs.data()[k]) > tol)
            return false;
    return true;
}

// used for view object which keep memories
template <WritableRow L, ReadableRow R> inline void assign(L&& lhs, const R& rhs) noexcept {
    assert(lhs.size() == rhs.size());
    std::copy_n(rhs.data(), rhs.size(), lhs.data());
}

// -------------------- Owning Row --------------------

class Row {
    std::vector<scalar_t> v_;

  public:
    static constexpr index_t npos = echelon::npos;

    Row() = default;
    template <ReadableRow T> Row(const T& readable_row) : v_(readable_row.data(), readable_row.data() + readable_row.size()) {}
    explicit Row(index_t size) : v_(size, 0.0) {}
    Row(std::initializer_list<scalar_t> values) : v_(values) {}
    explicit Row(std::vector<scalar_t> values) : v_(std::move(values)) {}
    static Row from_npy(const std::string& npy_path);
    void       save_npy(const std::string& npy_path) const;

    index_t         size() const noexcept { return v_.size(); }
    bool            empty() const noexcept { return v_.empty(); }
    scalar_t*       data() noexcept { return v_.data(); }
    const scalar_t* data() const noexcept { return v_.data(); }

    scalar_t& operator[](index_t i) noexcept { return v_[i]; }
    scalar_t  operator[](index_t i) const noexcept { return v_[i]; }

    index_t  find_first(scalar_t tol = 0.0) const noexcept { return cview().find_first(tol); }
    bool     none(scalar_t tol = 0.0) const noexcept { return cview().none(tol); }
    scalar_t max_abs() const noexcept { return cview().max_abs(); }

    RowView  view() noexcept { return RowView{v_.data(), v_.size()}; }
    RowCView cview() const noexcept { return RowCView{v_.data(), v_.size()}; }

    operator RowView() noexcept { return view(); }
    operator RowCView() const noexcept { return cview(); }

    Row& operator+=(RowCView rhs);
    Row& operator-=(RowCView rhs);
    Row& operator*=(scalar_t s) noexcept;
};

using Vector = Row;

Row operator+(RowCView a, RowCView b);
Row operator-(RowCView a, RowCView b);
Row operator*(scalar_t s, RowCView a);

// ------------------- MATRIX --------------------------

class Matrix {
  public:
    Matrix() = default;
    explicit Matrix(index_t rows, index_t cols);
    Matrix(const Matrix&) = default;
    Matrix(Matrix&&) noexcept = default;
    static Matrix identity(index_t n);
    static Matrix from_rows(const std::vector<Row>& rows);
    static Matrix from_rows(std::initializer_list<std::initializer_list<scalar_t>> rows);
    static Matrix from_columns(const std::vector<Row>& cols);
    static Matrix from_npy(const std::string& npy_path);
    void          save_npy(const std::string& npy_path) const;

    Matrix& operator=(const Matrix&) = default;
    Matrix& operator=(Matrix&&) noexcept = default;

    auto rows() const noexcept -> index_t { return rows_; }
    auto cols() const noexcept -> index_t { return cols_; }
    bool empty() const noexcept { return rows_ == 0 || cols_ == 0; }

    RowView  operator[](index_t i) noexcept;
    RowCView operator[](index_t i) const noexcept;
    scalar_t operator()(index_t i, index_t j) const noexcept { return data_[i * cols_ + j]; }
    scalar_t& operator()(index_t i, index_t j) noexcept { return data_[i * cols_ + j]; }

    auto column(index_t j) const -> Row;
    auto transpose() const -> Matrix;
    auto append_right_inplace(const Matrix& rhs) -> Matrix&;
    auto append_right_inplace(RowCView column) -> Matrix&;
    auto append_down_inplace(const Matrix& rhs) -> Matrix&;
    auto operator+=(const Matrix& rhs) -> Matrix&;
    auto operator-=(const Matrix& rhs) -> Matrix&;
    auto operator+(const Matrix& rhs) const -> Matrix;
    auto operator-(const Matrix& rhs) const -> Matrix;
    auto operator*(const Matrix& rhs) const -> Matrix;
    auto operator*(RowCView v) const -> Row;
    bool operator==(const Matrix& rhs) const noexcept;
    bool operator!=(const Matrix& rhs) const noexcept { return !(*this == rhs); }
    void push_back(RowCView row);

    scalar_t max_abs() const noexcept;

  private:
    index_t rows_ = 0;
    index_t cols_ = 0;
    // row-major contiguous storage: row i starts at data_[i * cols_]
    std::vector<scalar_t> data_;
};

bool approx_equal(const Matrix& lhs, const Matrix& rhs, scalar_t tol) noexcept;

template <ReadableRow T> std::ostream& operator<<(std::ostream& os, const T& row) {
    os << '[';
    for (index_t k = 0; k < row.size(); ++k) {
        if (k)
            os << ", ";
        os << row.data()[k];
    }
    return os << ']';
}
std::ostream& operator<<(std::ostream& os, const Matrix& mat);
} // namespace echelon
