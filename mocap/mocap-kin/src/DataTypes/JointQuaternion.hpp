#ifndef MOCAP_KIN_JOINT_QUATERNION_HPP
#define MOCAP_KIN_JOINT_QUATERNION_HPP

#include <utility>

#include <Eigen/Geometry>

#include "mocap-kin/src/DataTypes/ComponentFormatterBase.hpp"

namespace mocap_kin
{

/**
 * @brief Joint rotation quaternion tagged with the tracking confidence of the
 * joint it was computed for
 *
 * Wraps Eigen::Quaterniond via composition. Uses Eigen/Hamilton convention:
 * q = w + xi + yj + zk. Visibility is copied from the joint input and is 0.0
 * when the joint was not tracked this frame.
 */
class JointQuaternion
{
public:
  // Identity quaternion (w=1, x=y=z=0), zero visibility
  JointQuaternion() : quat_{Eigen::Quaterniond::Identity()}
  {
  }

  // Construct from components (w, x, y, z) - Eigen convention
  JointQuaternion(double w, double x, double y, double z, double visibility = 0.0)
    : quat_{w, x, y, z}, visibility_{visibility}
  {
  }

  explicit JointQuaternion(Eigen::Quaterniond quat, double visibility = 0.0)
    : quat_{std::move(quat)}, visibility_{visibility}
  {
  }

  [[nodiscard]] double w() const
  {
    return quat_.w();
  }
  [[nodiscard]] double x() const
  {
    return quat_.x();
  }
  [[nodiscard]] double y() const
  {
    return quat_.y();
  }
  [[nodiscard]] double z() const
  {
    return quat_.z();
  }

  [[nodiscard]] double visibility() const
  {
    return visibility_;
  }

  void setVisibility(double visibility)
  {
    visibility_ = visibility;
  }

  // Access underlying Eigen quaternion
  [[nodiscard]] const Eigen::Quaterniond& eigen() const
  {
    return quat_;
  }

  [[nodiscard]] Eigen::Matrix3d toRotationMatrix() const
  {
    return quat_.toRotationMatrix();
  }

  [[nodiscard]] double norm() const
  {
    return quat_.norm();
  }

private:
  Eigen::Quaterniond quat_;
  double visibility_{0.0};
};

}  // namespace mocap_kin

template <>
struct fmt::formatter<mocap_kin::JointQuaternion>
  : mocap_kin::detail::ComponentFormatterBase<mocap_kin::JointQuaternion>
{
  // Printed in the (x, y, z, w) order consumers receive
  auto format(const mocap_kin::JointQuaternion& quat,
              fmt::format_context& ctx) const
  {
    return formatComponents(
      std::array<double, 4>{quat.x(), quat.y(), quat.z(), quat.w()}, ctx);
  }
};

#endif  // MOCAP_KIN_JOINT_QUATERNION_HPP
