#pragma once
#include "typedef.hpp"

#include <stdexcept>
#include <string>

namespace echelon {

enum class ErrorKind { InvalidDimensions, SingularPivot, InconsistentSystem, NotEchelonForm };

const char* to_string(ErrorKind kind) noexcept;

// Base for every failure raised by the solver. row()/col() locate the offending entry, npos when the
// condition is not tied to one.
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string& what, index_t row = npos, index_t col = npos);

    ErrorKind kind() const noexcept { return kind_; }
    index_t   row() const noexcept { return row_; }
    index_t   col() const noexcept { return col_; }

  private:
    ErrorKind kind_;
    index_t   row_;
    index_t   col_;
};

class InvalidDimensions final : public Error {
  public:
    explicit InvalidDimensions(const std::string& what, index_t row = npos, index_t col = npos)
        : Error(ErrorKind::InvalidDimensions, what, row, col) {}
};

class SingularPivot final : public Error {
  public:
    SingularPivot(const std::string& what, index_t row, index_t col = npos)
        : Error(ErrorKind::SingularPivot, what, row, col) {}
};

class InconsistentSystem final : public Error {
  public:
    InconsistentSystem(const std::string& what, index_t row)
        : Error(ErrorKind::InconsistentSystem, what, row, npos) {}
};

// a stage that expects (reduced) row-echelon input got something else
class NotEchelonForm final : public Error {
  public:
    NotEchelonForm(const std::string& what, index_t row, index_t col = npos)
        : Error(ErrorKind::NotEchelonForm, what, row, col) {}
};

} // namespace echelon
