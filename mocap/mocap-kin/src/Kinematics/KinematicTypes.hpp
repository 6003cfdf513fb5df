// Ticket: 0002_kinematic_state

#ifndef MOCAP_KIN_KINEMATIC_TYPES_HPP
#define MOCAP_KIN_KINEMATIC_TYPES_HPP

#include <vector>

#include "mocap-kin/src/DataTypes/Coordinate.hpp"
#include "mocap-kin/src/DataTypes/EulerZXY.hpp"
#include "mocap-kin/src/DataTypes/JointQuaternion.hpp"
#include "mocap-kin/src/Skeleton/Joint.hpp"

namespace mocap_kin
{

/**
 * @brief Raw per-joint sample as delivered by an upstream pose processor
 *
 * Components may be NaN or infinite when the processor lost the joint; such
 * samples are dropped during ingestion.
 */
struct JointInput
{
  double x{0.0};
  double y{0.0};
  double z{0.0};
  double visibility{0.0};
  double presence{0.0};
};

/// Validated joint position with its tracking confidence in [0, 1]
struct JointPosition
{
  Coordinate position;
  double visibility{1.0};
};

/// Joints available this frame. A missing key means "unavailable".
using JointFrame = JointMap<JointPosition>;

/// Local rotation per joint for one frame
using FrameRotations = JointMap<EulerZXY>;

/// Estimated bone length per non-root joint (joint to its direct parent)
using BoneLengths = JointMap<double>;

/// Rest-pose offset per joint (offset direction x bone length)
using BaseSkeleton = JointMap<Coordinate>;

/// Forward output: one quaternion per joint that received a rotation
using JointQuaternions = JointMap<JointQuaternion>;

/// Inverse output: reconstructed positions per requested joint
using JointCoordinates = JointMap<std::vector<Coordinate>>;

}  // namespace mocap_kin

#endif  // MOCAP_KIN_KINEMATIC_TYPES_HPP
