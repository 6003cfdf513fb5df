// Ticket: 0004_root_frame

#ifndef MOCAP_KIN_ORTHONORMAL_BASIS_HPP
#define MOCAP_KIN_ORTHONORMAL_BASIS_HPP

#include <cmath>
#include <optional>

#include <Eigen/Dense>

#include "mocap-kin/src/DataTypes/Coordinate.hpp"
#include "mocap-kin/src/Utils/utils.hpp"

namespace mocap_kin
{

/**
 * @brief Right-handed orthonormal frame {e0, e1, e2}
 *
 * Invariants (enforced by the OrthonormalBasis builders):
 * - ||ei|| = 1
 * - ei . ej = 0 for i != j
 * - e2 = e0 x e1
 *
 * Thread safety: Value type, safe to copy across threads
 */
struct OrthonormalFrame
{
  Coordinate e0;
  Coordinate e1;
  Coordinate e2;

  /// Set when any axis had to be replaced by its fallback
  bool usedFallback{false};

  /// Frame axes as matrix columns [e0 e1 e2]
  [[nodiscard]] Eigen::Matrix3d matrix() const
  {
    Eigen::Matrix3d m;
    m.col(0) = e0;
    m.col(1) = e1;
    m.col(2) = e2;
    return m;
  }
};

/**
 * @brief Gram-Schmidt frame construction from two observed directions
 */
namespace OrthonormalBasis
{

/**
 * @brief Frame from a primary direction and a secondary hint, substituting a
 * fixed axis whenever a vector is too short to normalize
 *
 * Algorithm:
 * 1. e0 = unit(primary), or +X if ||primary|| < kDegenerateNorm
 * 2. e1 = unit(secondary), or +Y
 * 3. e1 = unit(e1 - (e1 . e0) e0), or +Y
 * 4. e2 = unit(e0 x e1), or +Z
 *
 * Never fails. With well-separated inputs the result is exactly orthonormal;
 * with degenerate inputs the fallback axes keep every component finite.
 *
 * @param primary Lateral direction (root to right hip)
 * @param secondary Vertical hint (root to neck)
 */
inline OrthonormalFrame withFallbackAxes(const Eigen::Vector3d& primary,
                                         const Eigen::Vector3d& secondary)
{
  OrthonormalFrame frame;

  auto unitOr = [&frame](const Eigen::Vector3d& v, const Eigen::Vector3d& fallback)
  {
    const double n = v.norm();
    if (n < kDegenerateNorm)
    {
      frame.usedFallback = true;
      return Eigen::Vector3d{fallback};
    }
    return Eigen::Vector3d{v / n};
  };

  const Eigen::Vector3d u = unitOr(primary, Eigen::Vector3d::UnitX());
  Eigen::Vector3d v = unitOr(secondary, Eigen::Vector3d::UnitY());
  v = unitOr(v - v.dot(u) * u, Eigen::Vector3d::UnitY());
  const Eigen::Vector3d w = unitOr(u.cross(v), Eigen::Vector3d::UnitZ());

  frame.e0 = u;
  frame.e1 = v;
  frame.e2 = w;
  return frame;
}

/**
 * @brief Strict frame from a forward direction and an up hint
 *
 * e0 = unit(forward), e1 = unit(up - (up . e0) e0), e2 = e0 x e1.
 *
 * @return std::nullopt if forward is too short or the up hint is (nearly)
 * parallel to it
 */
inline std::optional<OrthonormalFrame> fromForwardAndUp(
  const Eigen::Vector3d& forward,
  const Eigen::Vector3d& upHint)
{
  const double forwardNorm = forward.norm();
  if (forwardNorm < kDegenerateNorm)
  {
    return std::nullopt;
  }
  const Eigen::Vector3d f = forward / forwardNorm;

  const Eigen::Vector3d up = upHint - upHint.dot(f) * f;
  const double upNorm = up.norm();
  if (upNorm < kDegenerateNorm)
  {
    return std::nullopt;
  }
  const Eigen::Vector3d u = up / upNorm;

  return OrthonormalFrame{Coordinate{f}, Coordinate{u}, Coordinate{f.cross(u)}};
}

}  // namespace OrthonormalBasis

}  // namespace mocap_kin

#endif  // MOCAP_KIN_ORTHONORMAL_BASIS_HPP
