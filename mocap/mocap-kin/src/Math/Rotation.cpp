// Ticket: 0003_rotation_conventions

#include "mocap-kin/src/Math/Rotation.hpp"

#include <cmath>

#include "mocap-kin/src/Utils/utils.hpp"

namespace mocap_kin::Rotation
{

Eigen::Matrix3d aboutX(double theta)
{
  const double c = std::cos(theta);
  const double s = std::sin(theta);
  Eigen::Matrix3d r;
  r << 1.0, 0.0, 0.0,
       0.0, c, -s,
       0.0, s, c;
  return r;
}

Eigen::Matrix3d aboutY(double theta)
{
  const double c = std::cos(theta);
  const double s = std::sin(theta);
  Eigen::Matrix3d r;
  r << c, 0.0, s,
       0.0, 1.0, 0.0,
       -s, 0.0, c;
  return r;
}

Eigen::Matrix3d aboutZ(double theta)
{
  const double c = std::cos(theta);
  const double s = std::sin(theta);
  Eigen::Matrix3d r;
  r << c, -s, 0.0,
       s, c, 0.0,
       0.0, 0.0, 1.0;
  return r;
}

Eigen::Matrix3d composeZXY(const EulerZXY& euler)
{
  return aboutZ(euler.z) * aboutX(euler.x) * aboutY(euler.y);
}

EulerZXY decomposeZXY(const Eigen::Matrix3d& rotation)
{
  const double thetaZ = std::atan2(-rotation(0, 1), rotation(1, 1));
  const double thetaY = std::atan2(-rotation(2, 0), rotation(2, 2));
  const double thetaX =
    std::atan2(rotation(2, 1),
               std::sqrt(rotation(2, 0) * rotation(2, 0) +
                         rotation(2, 2) * rotation(2, 2)));
  return EulerZXY{thetaZ, thetaX, thetaY};
}

Eigen::Matrix3d alignVectors(const Eigen::Vector3d& from,
                             const Eigen::Vector3d& to)
{
  const double normFrom = from.norm();
  const double normTo = to.norm();
  if (normFrom < kDegenerateNorm || normTo < kDegenerateNorm)
  {
    return Eigen::Matrix3d::Identity();
  }

  const Eigen::Vector3d uFrom = from / normFrom;
  const Eigen::Vector3d uTo = to / normTo;

  const Eigen::Vector3d axis = uFrom.cross(uTo);
  const double s = axis.norm();
  const double c = uFrom.dot(uTo);

  if (s < kDegenerateNorm)
  {
    if (c > 0.0)
    {
      return Eigen::Matrix3d::Identity();
    }

    // Half turn about any axis perpendicular to `from`
    const Eigen::Vector3d helper = std::abs(uFrom.x()) < 0.9
                                     ? Eigen::Vector3d::UnitX()
                                     : Eigen::Vector3d::UnitY();
    const Eigen::Vector3d perp = uFrom.cross(helper).normalized();
    return 2.0 * perp * perp.transpose() - Eigen::Matrix3d::Identity();
  }

  Eigen::Matrix3d vx;
  vx << 0.0, -axis.z(), axis.y(),
        axis.z(), 0.0, -axis.x(),
        -axis.y(), axis.x(), 0.0;

  return Eigen::Matrix3d::Identity() + vx + vx * vx * ((1.0 - c) / (s * s));
}

Eigen::Quaterniond toQuaternion(const EulerZXY& euler)
{
  const double cy = std::cos(euler.yaw() / 2.0);
  const double sy = std::sin(euler.yaw() / 2.0);
  const double cp = std::cos(euler.pitch() / 2.0);
  const double sp = std::sin(euler.pitch() / 2.0);
  const double cr = std::cos(euler.roll() / 2.0);
  const double sr = std::sin(euler.roll() / 2.0);

  const double qx = cy * sp * cr - sy * cp * sr;
  const double qy = cy * cp * sr + sy * sp * cr;
  const double qz = cy * sp * sr + sy * cp * cr;
  const double qw = cy * cp * cr - sy * sp * sr;

  // Eigen takes (w, x, y, z)
  return Eigen::Quaterniond{qw, qx, qy, qz};
}

}  // namespace mocap_kin::Rotation
