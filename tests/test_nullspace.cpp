#include "echelon/nullspace.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace echelon;

namespace {

const Matrix kA = Matrix::from_rows({{1, 1, 1}, {2, 1, 1}});
const Vector kB{3, 4};

} // namespace

TEST(SolutionSpace, DimensionMatchesFreeColumns) {
    const SolutionSpace space(kA, kB);
    EXPECT_EQ(space.dim(), 1u);
    EXPECT_EQ(space.unknowns(), 3u);
    EXPECT_EQ(space.particular(), (Vector{1, 2, 0}));
    EXPECT_EQ(space.classification().non_pivot_columns, (std::vector<index_t>{2}));
}

TEST(SolutionSpace, PointsSolveTheSystem) {
    const SolutionSpace space(kA, kB);
    for (scalar_t t : {-3.0, 0.0, 0.5, 2.0, 10.0}) {
        const Vector x = space.point(Vector{t});
        EXPECT_TRUE(space.contains(kA, kB, x)) << "t = " << t << ", x = " << x;
    }
    EXPECT_EQ(space.point(Vector{2}), (Vector{1, 0, 2}));
}

TEST(SolutionSpace, LinearCombinationIsInNullSpace) {
    const SolutionSpace space(kA, kB);
    const Vector        v = space.linear_combination(Vector{-4});
    EXPECT_EQ(v, (Vector{0, 4, -4}));
    EXPECT_DOUBLE_EQ((kA * v).max_abs(), 0.0);
}

TEST(SolutionSpace, RejectsWrongParameterCount) {
    const SolutionSpace space(kA, kB);
    EXPECT_THROW((void)space.point(Vector{1, 2}), InvalidDimensions);
    EXPECT_THROW((void)space.linear_combination(Vector{}), InvalidDimensions);
}

TEST(SolutionSpace, BasisMatrixHoldsBasisAsColumns) {
    const SolutionSpace space(Matrix::from_rows({{1, 2, 0, 3}, {0, 0, 1, 5}}), Vector{4, 6});
    const Matrix        N = space.basis_matrix();
    ASSERT_EQ(N.rows(), 4u);
    ASSERT_EQ(N.cols(), 2u);
    EXPECT_EQ(N.column(0), space.basis()[0]);
    EXPECT_EQ(N.column(1), space.basis()[1]);
}

TEST(SolutionSpace, UniqueSolutionHasEmptyBasis) {
    const SolutionSpace space(Matrix::from_rows({{2, 1}, {1, 3}}), Vector{3, 5});
    EXPECT_EQ(space.dim(), 0u);
    EXPECT_TRUE(space.solution().unique());
    EXPECT_NEAR(space.particular()[0], 0.8, 1e-12);
    EXPECT_NEAR(space.particular()[1], 1.4, 1e-12);
    EXPECT_EQ(space.point(Vector{}), space.particular());

    const Matrix N = space.basis_matrix();
    EXPECT_EQ(N.rows(), 2u);
    EXPECT_EQ(N.cols(), 0u);
}

TEST(SolutionSpace, CopiesShareTheSolution) {
    const SolutionSpace space(kA, kB);
    const SolutionSpace copy = space;
    EXPECT_EQ(&copy.solution(), &space.solution());
}

TEST(SolutionSpace, InconsistentSystemThrows) {
    EXPECT_THROW((void)SolutionSpace(Matrix::from_rows({{1, 1}, {2, 2}}), Vector{3, 7}), InconsistentSystem);
}

TEST(SolutionSpace, ContainsRejectsOtherPoints) {
    const SolutionSpace space(kA, kB);
    EXPECT_FALSE(space.contains(kA, kB, Vector{0, 0, 0}));
    EXPECT_FALSE(space.contains(kA, kB, Vector{1, 2}));
}

TEST(Residual, MaxAbsoluteDeviation) {
    EXPECT_DOUBLE_EQ(residual(kA, kB, Vector{0, 0, 0}), 4.0);
    EXPECT_DOUBLE_EQ(residual(kA, kB, Vector{1, 2, 0}), 0.0);
    EXPECT_THROW((void)residual(kA, Vector{1}, Vector{0, 0, 0}), InvalidDimensions);
}

TEST(Formatting, GeneralSolution) {
    const auto sol = solve_linear_system(kA, kB);
    EXPECT_EQ(general_solution_string(sol, 2), "x = [1.00, 2.00, 0.00] + x3*[0.00, -1.00, 1.00]");

    const auto other = solve_linear_system(Matrix::from_rows({{1, 5, 1}, {2, 11, 5}}), Vector{10, 11});
    EXPECT_EQ(general_solution_string(other, 1), "x = [55.0, -9.0, 0.0] + x3*[14.0, -3.0, 1.0]");
}

TEST(Formatting, GeneralSolutionOfUniqueSystem) {
    const auto sol = solve_linear_system(Matrix::identity(2), Vector{1.5, -2});
    EXPECT_EQ(general_solution_string(sol), "x = [1.5000, -2.0000]");
}

TEST(Formatting, Summary) {
    const auto sol = solve_linear_system(kA, kB);
    EXPECT_EQ(summary_string(sol), "[x1, x2] + [1.00, 2.00, 0.00] + [x3]");
}

TEST(Formatting, StreamsSolutionSet) {
    std::ostringstream oss;
    oss << solve_linear_system(Matrix::from_rows({{1, 5, 1}, {2, 11, 5}}), Vector{10, 11});
    EXPECT_EQ(oss.str(), "particular solution: [55, -9, 0]\nnull space basis (1):\n  [14, -3, 1]");
}
