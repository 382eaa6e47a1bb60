#include "echelon/errors.hpp"

namespace echelon {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::InvalidDimensions:
        return "InvalidDimensions";
    case ErrorKind::SingularPivot:
        return "SingularPivot";
    case ErrorKind::InconsistentSystem:
        return "InconsistentSystem";
    case ErrorKind::NotEchelonForm:
        return "NotEchelonForm";
    }
    return "Unknown";
}

static std::string located(const std::string& what, index_t row, index_t col) {
    if (row == npos && col == npos)
        return what;
    std::string out = what + " (";
    if (row != npos)
        out += "row " + std::to_string(row);
    if (row != npos && col != npos)
        out += ", ";
    if (col != npos)
        out += "column " + std::to_string(col);
    return out + ")";
}

Error::Error(ErrorKind kind, const std::string& what, index_t row, index_t col)
    : std::runtime_error(located(what, row, col)), kind_(kind), row_(row), col_(col) {}

} // namespace echelon
