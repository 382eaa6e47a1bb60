#pragma once

#include <ankerl/unordered_dense.h>
#include <cstddef>
#include <limits>
#include <vector>

namespace echelon {
using index_t   = std::size_t;
using scalar_t  = double;
using pivot_map = ankerl::unordered_dense::map<index_t, index_t>;

constexpr index_t npos = std::numeric_limits<index_t>::max();
} // namespace echelon
