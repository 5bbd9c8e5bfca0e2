#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace lusolve {
// matrix and vector dimensions, 0 based element indices
using Index = std::uint16_t;

constexpr Index kMaxDim = 1024;
constexpr std::size_t kMaxEntries = static_cast<std::size_t>(kMaxDim) * static_cast<std::size_t>(kMaxDim);

// unit roundoff of the stored right-hand side in the stability bound
constexpr double kMachineEpsilon = std::numeric_limits<double>::epsilon();

// condition numbers above this lose more than half of the double digits
constexpr double kIllConditioned = 1e8;
} // namespace lusolve

// -----------------------------------------------------------------------------
// Feature flags
// -----------------------------------------------------------------------------
// the analyzer pulls in Eigen, explanations pull in the LaTeX writers.
// disabled features compile to stubs returning ErrorCode::FeatureDisabled
//
#ifndef LUSOLVE_ENABLE_CONDITION
#define LUSOLVE_ENABLE_CONDITION 1
#endif
#ifndef LUSOLVE_ENABLE_EXPLAIN
#define LUSOLVE_ENABLE_EXPLAIN 1
#endif
