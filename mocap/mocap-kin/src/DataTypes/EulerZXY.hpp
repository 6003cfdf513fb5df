// Ticket: 0003_rotation_conventions

#ifndef MOCAP_KIN_EULER_ZXY_HPP
#define MOCAP_KIN_EULER_ZXY_HPP

#include <cmath>

#include <Eigen/Dense>

#include "mocap-kin/src/DataTypes/ComponentFormatterBase.hpp"

namespace mocap_kin
{

/**
 * @brief Local joint rotation as an ordered Euler triple (radians)
 *
 * Composition order is fixed: R = Rz(z) * Rx(x) * Ry(y). The triple is
 * always stored and serialized in (z, x, y) order, which is also the
 * (yaw, pitch, roll) order of the quaternion conversion.
 *
 * A value-initialized EulerZXY is the identity rotation.
 */
struct EulerZXY
{
  double z{0.0};
  double x{0.0};
  double y{0.0};

  static EulerZXY identity()
  {
    return EulerZXY{};
  }

  /// Build from a vector laid out as (z, x, y)
  static EulerZXY fromVector(const Eigen::Vector3d& zxy)
  {
    return EulerZXY{zxy[0], zxy[1], zxy[2]};
  }

  /// Vector laid out as (z, x, y)
  [[nodiscard]] Eigen::Vector3d toVector() const
  {
    return Eigen::Vector3d{z, x, y};
  }

  [[nodiscard]] bool isFinite() const
  {
    return std::isfinite(z) && std::isfinite(x) && std::isfinite(y);
  }

  [[nodiscard]] double yaw() const
  {
    return z;
  }

  [[nodiscard]] double pitch() const
  {
    return x;
  }

  [[nodiscard]] double roll() const
  {
    return y;
  }
};

}  // namespace mocap_kin

template <>
struct fmt::formatter<mocap_kin::EulerZXY>
  : mocap_kin::detail::ComponentFormatterBase<mocap_kin::EulerZXY>
{
  auto format(const mocap_kin::EulerZXY& euler, fmt::format_context& ctx) const
  {
    return formatComponents(std::array<double, 3>{euler.z, euler.x, euler.y},
                            ctx);
  }
};

#endif  // MOCAP_KIN_EULER_ZXY_HPP
