#include "echelon/algorithms.hpp"
#include "echelon/decompositions.hpp"
#include "echelon/errors.hpp"
#include "echelon/matrix.hpp"
#include "echelon/nullspace.hpp"
#include "echelon/random.hpp"
#include "echelon/typedef.hpp"

#include <pybind11/numpy.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;
using namespace echelon;

template <class T> static std::string to_string_stream(const T& x) {
    std::ostringstream oss;
    oss << x;
    return oss.str();
}

using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

static Matrix matrix_from_numpy(DoubleArray A) {
    if (A.ndim() != 2)
        throw py::value_error("Matrix.from_numpy expects 2D array");
    Matrix M(A.shape(0), A.shape(1));
    auto   buf = A.unchecked<2>();
    for (index_t i = 0; i < M.rows(); ++i)
        for (index_t j = 0; j < M.cols(); ++j)
            M(i, j) = buf(i, j);
    return M;
}

static py::array_t<double> matrix_to_numpy(const Matrix& M) {
    py::array_t<double> out({M.rows(), M.cols()});
    auto                buf = out.mutable_unchecked<2>();
    for (index_t i = 0; i < M.rows(); ++i)
        for (index_t j = 0; j < M.cols(); ++j)
            buf(i, j) = M(i, j);
    return out;
}

static Vector vector_from_numpy(DoubleArray a) {
    if (a.ndim() != 1)
        throw py::value_error("expected 1D array");
    auto   r = a.unchecked<1>();
    Vector v(static_cast<index_t>(r.shape(0)));
    for (py::ssize_t i = 0; i < r.shape(0); ++i)
        v[static_cast<index_t>(i)] = r(i);
    return v;
}

static py::array_t<double> vector_to_numpy(const Vector& v) {
    py::array_t<double> out(v.size());
    auto                buf = out.mutable_unchecked<1>();
    for (index_t i = 0; i < v.size(); ++i)
        buf(i) = v[i];
    return out;
}

static py::list vectors_to_list(const std::vector<Vector>& vs) {
    py::list out;
    for (const auto& v : vs)
        out.append(vector_to_numpy(v));
    return out;
}

PYBIND11_MODULE(pyechelon, m) {
    auto base = py::register_exception<Error>(m, "EchelonError", PyExc_RuntimeError);
    py::register_exception<InvalidDimensions>(m, "InvalidDimensions", base.ptr());
    py::register_exception<SingularPivot>(m, "SingularPivot", base.ptr());
    py::register_exception<InconsistentSystem>(m, "InconsistentSystem", base.ptr());
    py::register_exception<NotEchelonForm>(m, "NotEchelonForm", base.ptr());

    py::class_<SolverConfig>(m, "SolverConfig")
        .def(py::init<>())
        .def_readwrite("zero_tolerance", &SolverConfig::zero_tolerance)
        .def_readwrite("check_consistency", &SolverConfig::check_consistency)
        .def_readwrite("threads", &SolverConfig::threads);

    py::class_<ColumnClassification>(m, "ColumnClassification")
        .def_readonly("pivot_columns", &ColumnClassification::pivot_columns)
        .def_readonly("pivot_rows", &ColumnClassification::pivot_rows)
        .def_readonly("non_pivot_columns", &ColumnClassification::non_pivot_columns)
        .def_readonly("inconsistent_rows", &ColumnClassification::inconsistent_rows)
        .def_property_readonly("rank", &ColumnClassification::rank)
        .def_property_readonly("consistent", &ColumnClassification::consistent)
        .def("__repr__", [](const ColumnClassification& c) { return to_string_stream(c); });

    py::class_<SolutionSet>(m, "SolutionSet")
        .def_property_readonly("particular", [](const SolutionSet& s) { return vector_to_numpy(s.particular); })
        .def_property_readonly("null_space_basis",
                               [](const SolutionSet& s) { return vectors_to_list(s.null_space_basis); })
        .def_readonly("classification", &SolutionSet::classification)
        .def_property_readonly("rank", &SolutionSet::rank)
        .def_property_readonly("unique", &SolutionSet::unique)
        .def("general_solution", &general_solution_string, py::arg("precision") = 4)
        .def("summary", &summary_string, py::arg("precision") = 2)
        .def("__repr__", [](const SolutionSet& s) { return to_string_stream(s); });

    m.def(
        "augment", [](DoubleArray A, DoubleArray b) { return matrix_to_numpy(augment(matrix_from_numpy(A), vector_from_numpy(b))); },
        py::arg("A"), py::arg("b"));
    m.def(
        "to_row_echelon",
        [](DoubleArray M, double tol) { return matrix_to_numpy(to_row_echelon(matrix_from_numpy(M), tol)); },
        py::arg("matrix"), py::arg("zero_tolerance") = k_default_zero_tolerance);
    m.def(
        "to_reduced_row_echelon",
        [](DoubleArray M, double tol) { return matrix_to_numpy(to_reduced_row_echelon(matrix_from_numpy(M), tol)); },
        py::arg("matrix"), py::arg("zero_tolerance") = k_default_zero_tolerance);
    m.def(
        "classify_columns", [](DoubleArray M, double tol) { return classify_columns(matrix_from_numpy(M), tol); },
        py::arg("rref"), py::arg("zero_tolerance") = k_default_zero_tolerance);
    m.def(
        "assemble",
        [](DoubleArray M, const ColumnClassification& cls, const SolverConfig& cfg) {
            return assemble(matrix_from_numpy(M), cls, cfg);
        },
        py::arg("rref"), py::arg("classification"), py::arg("config") = SolverConfig{});
    m.def(
        "solve",
        [](DoubleArray A, DoubleArray b, const SolverConfig& cfg) {
            return solve_linear_system(matrix_from_numpy(A), vector_from_numpy(b), cfg);
        },
        py::arg("A"), py::arg("b"), py::arg("config") = SolverConfig{});

    m.def("qr_decompose", [](DoubleArray A) {
        auto [Q, R] = qr_decompose(matrix_from_numpy(A));
        return py::make_tuple(matrix_to_numpy(Q), matrix_to_numpy(R));
    });
    m.def("columns_linearly_independent",
          [](DoubleArray A) { return columns_linearly_independent(matrix_from_numpy(A)); });
    m.def("cholesky", [](DoubleArray A) { return matrix_to_numpy(cholesky(matrix_from_numpy(A))); });
    m.def("lu_decompose", [](DoubleArray A) {
        auto [L, U] = lu_decompose(matrix_from_numpy(A));
        return py::make_tuple(matrix_to_numpy(L), matrix_to_numpy(U));
    });
    m.def("determinant", [](DoubleArray A) { return determinant(matrix_from_numpy(A)); });
    m.def("is_positive_definite", [](DoubleArray A) { return is_positive_definite(matrix_from_numpy(A)); });

    py::class_<Rng>(m, "RNG")
        .def(py::init<>())
        .def(py::init<index_t>(), py::arg("seed"))
        .def("rand_int", &Rng::rand_int)
        .def("rand_double", &Rng::rand_double, py::arg("low") = 0.0, py::arg("high") = 1.0)
        .def("seed", &Rng::seed)
        .def("random_raw", &Rng::random_raw)
        .def("sample_matrix",
             [](Rng& r, index_t rows, index_t cols) { return matrix_to_numpy(r.sample_matrix(rows, cols)); })
        .def("sample_low_rank_matrix", [](Rng& r, index_t rows, index_t cols, index_t rank) {
            return matrix_to_numpy(r.sample_low_rank_matrix(rows, cols, rank));
        });
}
