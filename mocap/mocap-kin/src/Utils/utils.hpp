#ifndef MOCAP_KIN_UTILS_HPP
#define MOCAP_KIN_UTILS_HPP

#include <cmath>
#include <concepts>

namespace mocap_kin
{

// Helper function for comparing doubles with tolerance
constexpr double TOLERANCE = 1e-10;

// Norms below this are treated as zero-length vectors by the solver
constexpr double kDegenerateNorm = 1e-8;

template <std::floating_point T>
bool almostEqual(T a, T b, double tolerance = TOLERANCE)
{
  return std::abs(a - b) < tolerance;
}

}  // namespace mocap_kin

#endif  // MOCAP_KIN_UTILS_HPP
