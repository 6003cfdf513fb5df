// Ticket: 0003_rotation_conventions

#ifndef MOCAP_KIN_ROTATION_HPP
#define MOCAP_KIN_ROTATION_HPP

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "mocap-kin/src/DataTypes/EulerZXY.hpp"

namespace mocap_kin
{

/**
 * @brief Rotation matrix and quaternion helpers for the fixed Z-X-Y Euler
 * convention
 *
 * Every function here is paired with the others: composeZXY() inverts
 * decomposeZXY() and toQuaternion() produces the quaternion of composeZXY().
 * Changing the order in one of them breaks round-tripping everywhere.
 *
 * Thread safety: Stateless functions, safe to call from multiple threads
 */
namespace Rotation
{

/// Elementary right-handed rotation about +X
Eigen::Matrix3d aboutX(double theta);

/// Elementary right-handed rotation about +Y
Eigen::Matrix3d aboutY(double theta);

/// Elementary right-handed rotation about +Z
Eigen::Matrix3d aboutZ(double theta);

/**
 * @brief Rotation matrix of an Euler triple: R = Rz(z) * Rx(x) * Ry(y)
 */
Eigen::Matrix3d composeZXY(const EulerZXY& euler);

/**
 * @brief Decompose a rotation matrix as Rz * Rx * Ry
 *
 *   z = atan2(-R01, R11)
 *   y = atan2(-R20, R22)
 *   x = atan2(R21, sqrt(R20^2 + R22^2))
 *
 * x is returned in [-pi/2, pi/2]; z and y in (-pi, pi].
 */
EulerZXY decomposeZXY(const Eigen::Matrix3d& rotation);

/**
 * @brief Minimal rotation taking the direction of `from` onto the direction of
 * `to` (Rodrigues' formula)
 *
 * Degenerate cases:
 * - either vector shorter than kDegenerateNorm: identity
 * - parallel vectors: identity
 * - anti-parallel vectors: 180 degree rotation about an axis perpendicular to
 *   `from` (from x X, or from x Y when `from` is close to X)
 *
 * @return Rotation R with R * unit(from) = unit(to)
 */
Eigen::Matrix3d alignVectors(const Eigen::Vector3d& from,
                             const Eigen::Vector3d& to);

/**
 * @brief Quaternion of an Euler triple, q = qz(yaw) * qx(pitch) * qy(roll)
 *
 * Uses the half-angle product expansion with (yaw, pitch, roll) = (z, x, y).
 */
Eigen::Quaterniond toQuaternion(const EulerZXY& euler);

}  // namespace Rotation

}  // namespace mocap_kin

#endif  // MOCAP_KIN_ROTATION_HPP
