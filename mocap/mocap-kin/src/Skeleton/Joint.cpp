// Ticket: 0001_skeleton_model

#include "mocap-kin/src/Skeleton/Joint.hpp"

namespace mocap_kin
{

namespace
{

constexpr std::array<std::string_view, kJointCount> kJointNames{
  "hipCentre",
  "leftHip",
  "leftKnee",
  "leftAnkle",
  "leftToe",
  "rightHip",
  "rightKnee",
  "rightAnkle",
  "rightToe",
  "neck",
  "leftShoulder",
  "leftElbow",
  "leftWrist",
  "rightShoulder",
  "rightElbow",
  "rightWrist",
  "leftIndex",
  "rightIndex",
  "leftThumb",
  "rightThumb",
};

}  // namespace

std::string_view jointName(Joint joint)
{
  const auto index = toIndex(joint);
  if (index >= kJointCount)
  {
    return "unknown";
  }
  return kJointNames[index];
}

std::optional<Joint> jointFromName(std::string_view name)
{
  for (std::size_t i = 0; i < kJointCount; ++i)
  {
    if (kJointNames[i] == name)
    {
      return static_cast<Joint>(i);
    }
  }
  return std::nullopt;
}

}  // namespace mocap_kin
