// Ticket: 0001_skeleton_model

#ifndef MOCAP_KIN_JOINT_HPP
#define MOCAP_KIN_JOINT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>

#include <fmt/format.h>

namespace mocap_kin
{

/**
 * @brief Joint identifiers of the solver skeleton
 *
 * Values index the static skeleton tables. New joints must be appended before
 * Count so that existing indices never change.
 */
enum class Joint : std::uint8_t
{
  HipCentre = 0,
  LeftHip,
  LeftKnee,
  LeftAnkle,
  LeftToe,
  RightHip,
  RightKnee,
  RightAnkle,
  RightToe,
  Neck,
  LeftShoulder,
  LeftElbow,
  LeftWrist,
  RightShoulder,
  RightElbow,
  RightWrist,
  LeftIndex,
  RightIndex,
  LeftThumb,
  RightThumb,
  Count
};

inline constexpr std::size_t kJointCount = static_cast<std::size_t>(Joint::Count);

/// The root of the hierarchy
inline constexpr Joint kRootJoint = Joint::HipCentre;

/// Ordered map keyed by joint; iteration follows enum order
template <typename T>
using JointMap = std::map<Joint, T>;

constexpr std::size_t toIndex(Joint joint)
{
  return static_cast<std::size_t>(joint);
}

/// All joints in enum order, for range-for loops
constexpr std::array<Joint, kJointCount> allJoints()
{
  std::array<Joint, kJointCount> joints{};
  for (std::size_t i = 0; i < kJointCount; ++i)
  {
    joints[i] = static_cast<Joint>(i);
  }
  return joints;
}

/**
 * @brief Wire name of a joint (e.g. "leftShoulder")
 *
 * These are the names used by the upstream pose processors and by consumers
 * of the quaternion output.
 */
std::string_view jointName(Joint joint);

/**
 * @brief Look up a joint by its wire name
 * @return The joint, or std::nullopt for names outside the solver vocabulary
 * (eyes, pinkies, ...)
 */
std::optional<Joint> jointFromName(std::string_view name);

}  // namespace mocap_kin

template <>
struct fmt::formatter<mocap_kin::Joint> : fmt::formatter<std::string_view>
{
  auto format(mocap_kin::Joint joint, fmt::format_context& ctx) const
  {
    return fmt::formatter<std::string_view>::format(mocap_kin::jointName(joint),
                                                    ctx);
  }
};

#endif  // MOCAP_KIN_JOINT_HPP
