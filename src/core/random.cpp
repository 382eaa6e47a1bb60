#include "echelon/random.hpp"

#include <algorithm>
#include <cmath>

namespace echelon {

std::int64_t Rng::rand_int(std::int64_t low, std::int64_t high) {
    std::uniform_int_distribution<std::int64_t> dist(low, high);
    return dist(rng);
}

double Rng::rand_double(double low, double high) {
    std::uniform_real_distribution<double> dist(low, high);
    return dist(rng);
}

index_t Rng::random_raw() { return rng(); }

void Rng::seed(index_t seed_val) { rng.seed(static_cast<std::minstd_rand::result_type>(seed_val)); }

Vector Rng::sample_vector(index_t dim, scalar_t low, scalar_t high, bool integral) {
    Vector v(dim);
    for (index_t k = 0; k < dim; ++k)
        v[k] = integral ? static_cast<scalar_t>(rand_int(static_cast<std::int64_t>(std::ceil(low)),
                                                         static_cast<std::int64_t>(std::floor(high))))
                        : rand_double(low, high);
    return v;
}

Matrix Rng::sample_matrix(index_t rows, index_t cols, scalar_t low, scalar_t high, bool integral) {
    Matrix M(rows, cols);
    for (index_t r = 0; r < rows; ++r)
        assign(M[r], sample_vector(cols, low, high, integral));
    return M;
}

Matrix Rng::sample_low_rank_matrix(index_t rows, index_t cols, index_t rank) {
    rank = std::min({rank, rows, cols});
    if (rank == 0)
        return Matrix(rows, cols);
    return sample_matrix(rows, rank, -3.0, 3.0) * sample_matrix(rank, cols, -3.0, 3.0);
}

System Rng::sample_consistent_system(index_t rows, index_t cols, index_t rank) {
    Matrix A  = sample_low_rank_matrix(rows, cols, rank);
    Vector x0 = sample_vector(cols, -3.0, 3.0);
    Vector b  = A * x0;
    return {std::move(A), std::move(b)};
}

std::vector<System> Rng::sample_systems(index_t count, index_t rows, index_t cols) {
    std::vector<System> out;
    out.reserve(count);
    for (index_t i = 0; i < count; ++i) {
        const auto rank = static_cast<index_t>(rand_int(0, static_cast<std::int64_t>(std::min(rows, cols))));
        out.push_back(sample_consistent_system(rows, cols, rank));
    }
    return out;
}

} // namespace echelon
