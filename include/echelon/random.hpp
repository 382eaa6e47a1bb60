#pragma once
#include "algorithms.hpp"
#include "matrix.hpp"
#include "typedef.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace echelon {
class Rng {
  public:
    Rng(index_t seed = std::random_device{}()) : rng(seed) {}

    // entries are integers in [low, high] when integral is set, uniform reals otherwise
    Vector sample_vector(index_t dim, scalar_t low = -5.0, scalar_t high = 5.0, bool integral = true);
    Matrix sample_matrix(index_t rows, index_t cols, scalar_t low = -5.0, scalar_t high = 5.0, bool integral = true);
    // rows x cols integer matrix of rank at most `rank`
    Matrix sample_low_rank_matrix(index_t rows, index_t cols, index_t rank);
    // b is A times a random integer vector, so the system is always consistent
    System sample_consistent_system(index_t rows, index_t cols, index_t rank);
    std::vector<System> sample_systems(index_t count, index_t rows, index_t cols);

    std::int64_t rand_int(std::int64_t low, std::int64_t high);
    double       rand_double(double low, double high);
    index_t      random_raw();
    void         seed(index_t seed_val);

  private:
    std::minstd_rand rng;
};

}; // namespace echelon
