// Ticket: 0010_landmark_mapper

#include "mocap-kin/src/Input/LandmarkMapper.hpp"

#include <cmath>

namespace mocap_kin
{

namespace
{

constexpr std::array<std::string_view, kMediaPipeLandmarkCount> kLandmarkNames{
  "nose",           "left_eye_inner",  "left_eye",        "left_eye_outer",
  "right_eye_inner", "right_eye",      "right_eye_outer", "left_ear",
  "right_ear",      "mouth_left",      "mouth_right",     "left_shoulder",
  "right_shoulder", "left_elbow",      "right_elbow",     "left_wrist",
  "right_wrist",    "left_pinky",      "right_pinky",     "left_index",
  "right_index",    "left_thumb",      "right_thumb",     "left_hip",
  "right_hip",      "left_knee",       "right_knee",      "left_ankle",
  "right_ankle",    "left_heel",       "right_heel",      "left_foot_index",
  "right_foot_index"};

struct LandmarkSource
{
  std::array<std::size_t, 2> indices{};
  std::size_t count{0};
};

// Indexed by Joint
constexpr std::array<LandmarkSource, kJointCount> kSources{
  LandmarkSource{{23, 24}, 2},  // hipCentre
  LandmarkSource{{23, 0}, 1},   // leftHip
  LandmarkSource{{25, 0}, 1},   // leftKnee
  LandmarkSource{{27, 0}, 1},   // leftAnkle
  LandmarkSource{{31, 0}, 1},   // leftToe
  LandmarkSource{{24, 0}, 1},   // rightHip
  LandmarkSource{{26, 0}, 1},   // rightKnee
  LandmarkSource{{28, 0}, 1},   // rightAnkle
  LandmarkSource{{32, 0}, 1},   // rightToe
  LandmarkSource{{11, 12}, 2},  // neck
  LandmarkSource{{11, 0}, 1},   // leftShoulder
  LandmarkSource{{13, 0}, 1},   // leftElbow
  LandmarkSource{{15, 0}, 1},   // leftWrist
  LandmarkSource{{12, 0}, 1},   // rightShoulder
  LandmarkSource{{14, 0}, 1},   // rightElbow
  LandmarkSource{{16, 0}, 1},   // rightWrist
  LandmarkSource{{19, 0}, 1},   // leftIndex
  LandmarkSource{{20, 0}, 1},   // rightIndex
  LandmarkSource{{21, 0}, 1},   // leftThumb
  LandmarkSource{{22, 0}, 1},   // rightThumb
};

bool isFinite(const JointInput& input)
{
  return std::isfinite(input.x) && std::isfinite(input.y) &&
         std::isfinite(input.z);
}

std::optional<JointInput> averageSources(Joint joint, const MediaPipePose& pose)
{
  const auto sources = LandmarkMapper::sourceLandmarks(joint);
  if (sources.empty())
  {
    return std::nullopt;
  }

  JointInput mean;
  for (std::size_t index : sources)
  {
    const JointInput& landmark = pose[index];
    if (!isFinite(landmark))
    {
      return std::nullopt;
    }
    mean.x += landmark.x;
    mean.y += landmark.y;
    mean.z += landmark.z;
    mean.visibility += landmark.visibility;
    mean.presence += landmark.presence;
  }

  const auto n = static_cast<double>(sources.size());
  mean.x /= n;
  mean.y /= n;
  mean.z /= n;
  mean.visibility /= n;
  mean.presence /= n;
  return mean;
}

}  // namespace

namespace LandmarkMapper
{

std::string_view landmarkName(std::size_t index)
{
  if (index >= kMediaPipeLandmarkCount)
  {
    return "unknown";
  }
  return kLandmarkNames[index];
}

std::optional<std::size_t> landmarkIndex(std::string_view name)
{
  for (std::size_t i = 0; i < kMediaPipeLandmarkCount; ++i)
  {
    if (kLandmarkNames[i] == name)
    {
      return i;
    }
  }
  return std::nullopt;
}

std::span<const std::size_t> sourceLandmarks(Joint joint)
{
  const auto index = toIndex(joint);
  if (index >= kJointCount)
  {
    return {};
  }
  const LandmarkSource& source = kSources[index];
  return std::span<const std::size_t>{source.indices.data(), source.count};
}

std::map<std::string, JointInput> toNamedInputs(const MediaPipePose& pose)
{
  std::map<std::string, JointInput> named;
  for (Joint joint : allJoints())
  {
    if (auto mean = averageSources(joint, pose))
    {
      named.emplace(std::string{jointName(joint)}, *mean);
    }
  }
  return named;
}

JointFrame fromMediaPipe(const MediaPipePose& pose)
{
  JointFrame frame;
  for (Joint joint : allJoints())
  {
    if (auto mean = averageSources(joint, pose))
    {
      frame[joint] = JointPosition{Coordinate{mean->x, mean->y, mean->z},
                                   mean->visibility};
    }
  }
  return frame;
}

}  // namespace LandmarkMapper

}  // namespace mocap_kin
