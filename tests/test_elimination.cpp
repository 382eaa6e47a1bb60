#include "echelon/algorithms.hpp"
#include "echelon/random.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace echelon;

namespace {

constexpr scalar_t kTol = 1e-9;

// every nonzero row leads with 1 and every pivot column is clear below its pivot
void expect_row_echelon(const Matrix& M) {
    for (index_t i = 0; i < M.rows(); ++i) {
        const index_t p = M[i].find_first(kTol);
        if (p == npos)
            continue;
        EXPECT_NEAR(M(i, p), 1.0, kTol) << "row " << i;
        for (index_t j = i + 1; j < M.rows(); ++j)
            EXPECT_NEAR(M(j, p), 0.0, kTol) << "row " << j << " column " << p;
    }
}

void expect_reduced(const Matrix& M) {
    expect_row_echelon(M);
    for (index_t i = 0; i < M.rows(); ++i) {
        const index_t p = M[i].find_first(kTol);
        if (p == npos)
            continue;
        for (index_t j = 0; j < M.rows(); ++j)
            if (j != i)
                EXPECT_NEAR(M(j, p), 0.0, kTol) << "row " << j << " column " << p;
    }
}

} // namespace

TEST(Augment, AppendsRightHandSide) {
    const Matrix A   = Matrix::from_rows({{1, 1, 1}, {2, 1, 1}});
    const Matrix aug = augment(A, Row{3, 4});
    EXPECT_EQ(aug, Matrix::from_rows({{1, 1, 1, 3}, {2, 1, 1, 4}}));
    EXPECT_EQ(aug.cols(), A.cols() + 1);
    EXPECT_EQ(A.cols(), 3u);
}

TEST(Augment, RejectsMismatchedRightHandSide) {
    const Matrix A = Matrix::from_rows({{1, 1}, {2, 2}});
    EXPECT_THROW((void)augment(A, Row{1, 2, 3}), InvalidDimensions);
    EXPECT_THROW((void)augment(A, Row{}), InvalidDimensions);
}

TEST(RowEchelon, NormalizesAndClearsBelow) {
    const Matrix aug = Matrix::from_rows({{1, 1, 1, 3}, {2, 1, 1, 4}});
    const Matrix ref = to_row_echelon(aug);
    EXPECT_EQ(ref, Matrix::from_rows({{1, 1, 1, 3}, {0, 1, 1, 2}}));
    // input untouched
    EXPECT_EQ(aug, Matrix::from_rows({{1, 1, 1, 3}, {2, 1, 1, 4}}));
}

TEST(RowEchelon, PivotIsFirstNonzeroNotLargest) {
    const Matrix ref = to_row_echelon(Matrix::from_rows({{0.5, 100, 1}, {4, 1, 2}}));
    EXPECT_DOUBLE_EQ(ref(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(ref(0, 1), 200.0);
    EXPECT_DOUBLE_EQ(ref(1, 0), 0.0);
    expect_row_echelon(ref);
}

TEST(RowEchelon, ZeroRowStaysInPlace) {
    const Matrix ref = to_row_echelon(Matrix::from_rows({{1, 2, 3}, {2, 4, 6}, {0, 1, 5}}));
    EXPECT_TRUE(ref[1].none());
    EXPECT_EQ(ref[2].find_first(), 1u);
    expect_row_echelon(ref);
}

TEST(RowEchelon, RowsAreNeverSwapped) {
    const Matrix ref = to_row_echelon(Matrix::from_rows({{0, 2, 4}, {3, 0, 6}}));
    EXPECT_TRUE(approx_equal(ref, Matrix::from_rows({{0, 1, 2}, {1, 0, 2}}), kTol)) << ref;
}

TEST(RowEchelon, DenormalPivotIsSingular) {
    const Matrix M = Matrix::from_rows({{1, 2, 3}, {0, 1e-320, 1}});
    try {
        (void)to_row_echelon(M, 0.0);
        FAIL() << "expected SingularPivot";
    } catch (const SingularPivot& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SingularPivot);
        EXPECT_EQ(e.row(), 1u);
        EXPECT_EQ(e.col(), 1u);
    }
}

TEST(RowEchelon, ToleranceTreatsResidueAsZero) {
    const Matrix ref = to_row_echelon(Matrix::from_rows({{1e-14, 2, 4}}), 1e-12);
    EXPECT_EQ(ref(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(ref(0, 1), 1.0);
    EXPECT_DOUBLE_EQ(ref(0, 2), 2.0);
}

TEST(RowEchelon, ResidueIsClearedBeforeSmallPivotIsNormalized) {
    // scaling by 1/1e-3 would lift the 1e-13 residue above the tolerance
    const Matrix ref = to_row_echelon(Matrix::from_rows({{1e-13, 1e-3, 1}}));
    EXPECT_EQ(ref(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(ref(0, 1), 1.0);

    const Matrix rref = to_reduced_row_echelon(ref);
    const auto   cls  = classify_columns(rref);
    EXPECT_EQ(cls.pivot_columns, (std::vector<index_t>{1}));
    EXPECT_EQ(cls.non_pivot_columns, (std::vector<index_t>{0}));
}

TEST(RowEchelon, EliminationResidueBecomesExactZero) {
    // row 1 is 3 * row 0 up to rounding of the normalized entries
    const Matrix ref = to_row_echelon(Matrix::from_rows({{1e6, 3.3e6, 7.1e6, 2.2e6}, {3e6, 9.9e6, 21.3e6, 6.6e6}}));
    for (index_t j = 0; j < ref.cols(); ++j)
        EXPECT_EQ(ref(1, j), 0.0) << "column " << j;
}

TEST(RowEchelon, ToleranceFollowsMatrixScale) {
    const Matrix ref = to_row_echelon(Matrix::from_rows({{1e-13, 0, 1e-13}, {0, 1e-13, 2e-13}}));
    EXPECT_TRUE(approx_equal(ref, Matrix::from_rows({{1, 0, 1}, {0, 1, 2}}), kTol)) << ref;
}

TEST(ReducedRowEchelon, ClearsAbovePivots) {
    const Matrix rref = to_reduced_row_echelon(to_row_echelon(Matrix::from_rows({{1, 5, 1, 10}, {2, 11, 5, 11}})));
    EXPECT_EQ(rref, Matrix::from_rows({{1, 0, -14, 55}, {0, 1, 3, -9}}));
}

TEST(ReducedRowEchelon, LargerSystem) {
    const Matrix A = Matrix::from_rows({{1, 2, 3, 4, 5, 6, 7},
                                        {0, 1, 0, 1, 0, 1, 0},
                                        {2, 2, 2, 2, 2, 2, 2},
                                        {-1, 0, 1, -2, 1, 0, 1},
                                        {0, 0, 1, 1, 1, 1, 1}});
    const Matrix rref = to_reduced_row_echelon(to_row_echelon(augment(A, Row{10, 1, 14, -2, 5})));
    const Matrix expected = Matrix::from_rows({{1, 0, 0, 0, 0, -0.5, 0, 2.5},
                                               {0, 1, 0, 0, 0, 0.5, 0, -0.5},
                                               {0, 0, 1, 0, 0, -0.5, -1, 7.5},
                                               {0, 0, 0, 1, 0, 0.5, 0, 1.5},
                                               {0, 0, 0, 0, 1, 1, 2, -4}});
    EXPECT_TRUE(approx_equal(rref, expected, kTol)) << rref;
    expect_reduced(rref);
}

TEST(ReducedRowEchelon, IsIdempotent) {
    Rng rng(7);
    for (int trial = 0; trial < 20; ++trial) {
        const Matrix M     = rng.sample_low_rank_matrix(4, 6, static_cast<index_t>(trial % 5));
        const Matrix once  = to_reduced_row_echelon(to_row_echelon(M));
        const Matrix twice = to_reduced_row_echelon(once);
        EXPECT_EQ(once, twice) << "trial " << trial;
        expect_reduced(once);
    }
}

TEST(ReducedRowEchelon, RejectsUnnormalizedPivot) {
    try {
        (void)to_reduced_row_echelon(Matrix::from_rows({{2, 1, 0}, {0, 1, 1}}));
        FAIL() << "expected NotEchelonForm";
    } catch (const NotEchelonForm& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotEchelonForm);
        EXPECT_EQ(e.row(), 0u);
        EXPECT_EQ(e.col(), 0u);
    }
}

TEST(ReducedRowEchelon, InPlaceMatchesPureForm) {
    Matrix M = Matrix::from_rows({{1, 1, 1, 3}, {2, 1, 1, 4}});
    row_echelon_inplace(M);
    reduced_row_echelon_inplace(M);
    EXPECT_EQ(M, to_reduced_row_echelon(to_row_echelon(Matrix::from_rows({{1, 1, 1, 3}, {2, 1, 1, 4}}))));
}
