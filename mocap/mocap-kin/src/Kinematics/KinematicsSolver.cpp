// Ticket: 0009_kinematics_solver

#include "mocap-kin/src/Kinematics/KinematicsSolver.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

#include "mocap-kin/src/Kinematics/BaseSkeletonBuilder.hpp"
#include "mocap-kin/src/Math/Rotation.hpp"
#include "mocap-kin/src/Utils/Logging.hpp"

namespace mocap_kin
{

namespace
{

/// Composite joints placed at the midpoint of two constituents
struct CompositeJoint
{
  Joint joint;
  Joint first;
  Joint second;
};

constexpr std::array<CompositeJoint, 2> kCompositeJoints{
  CompositeJoint{Joint::HipCentre, Joint::LeftHip, Joint::RightHip},
  CompositeJoint{Joint::Neck, Joint::LeftShoulder, Joint::RightShoulder}};

bool isFinite(const Coordinate& position)
{
  return std::isfinite(position.x()) && std::isfinite(position.y()) &&
         std::isfinite(position.z());
}

}  // namespace

KinematicsSolver::KinematicsSolver()
  : KinematicsSolver{Config{}}
{
}

KinematicsSolver::KinematicsSolver(Config config,
                                   std::shared_ptr<spdlog::logger> logger)
  : config_{config},
    logger_{logger ? std::move(logger) : getOrCreateLogger()},
    boneLengthEstimator_{BoneLengthEstimator::Config{config.boneLengthHistory}},
    forwardSolver_{logger_},
    wristRefiner_{logger_},
    inverseSolver_{logger_},
    baseSkeleton_{initialBaseSkeleton()}
{
}

JointQuaternions KinematicsSolver::forward(const JointFrame& frame)
{
  availableJoints_ = ingest(frame);

  if (!hasMinimumJoints(availableJoints_))
  {
    logger_->warn(
      "Insufficient joints to solve frame ({} available); need {} and a hip "
      "or shoulder",
      availableJoints_.size(),
      kRootJoint);
    clearFrame();
    return {};
  }

  boneLengths_ = boneLengthEstimator_.update(availableJoints_);
  baseSkeleton_ = BaseSkeletonBuilder::build(boneLengths_);

  ForwardSolver::Result result = forwardSolver_.solve(availableJoints_);

  if (config_.refineWrists)
  {
    const auto modes = wristRefiner_.refine(result.rootRelative, result.rotations);
    logger_->debug("Wrist refinement modes: left={}, right={}",
                   static_cast<int>(modes[0]),
                   static_cast<int>(modes[1]));
  }

  frameRotations_ = std::move(result.rotations);
  rootTrajectory_ = result.rootPosition;
  hasSolvedFrame_ = true;

  return toQuaternions(frameRotations_, availableJoints_);
}

std::map<std::string, JointQuaternion> KinematicsSolver::forward(
  const std::map<std::string, JointInput>& frame)
{
  JointFrame joints;
  for (const auto& [name, input] : frame)
  {
    const auto joint = jointFromName(name);
    if (!joint)
    {
      logger_->debug("Ignoring joint outside the solver vocabulary: {}", name);
      continue;
    }
    joints[*joint] =
      JointPosition{Coordinate{input.x, input.y, input.z}, input.visibility};
  }

  std::map<std::string, JointQuaternion> named;
  for (const auto& [joint, quat] : forward(joints))
  {
    named.emplace(std::string{jointName(joint)}, quat);
  }
  return named;
}

JointCoordinates KinematicsSolver::inverse(const FrameRotations& angles) const
{
  JointCoordinates coordinates = inverseSolver_.solve(angles, baseSkeleton_);

  if (config_.absoluteInverse)
  {
    for (auto& entry : coordinates)
    {
      for (Coordinate& position : entry.second)
      {
        position += rootTrajectory_;
      }
    }
  }

  return coordinates;
}

std::map<std::string, std::vector<Coordinate>> KinematicsSolver::inverse(
  const std::map<std::string, EulerZXY>& angles) const
{
  FrameRotations rotations;
  for (const auto& [name, euler] : angles)
  {
    const auto joint = jointFromName(name);
    if (!joint)
    {
      logger_->debug("Ignoring joint outside the solver vocabulary: {}", name);
      continue;
    }
    rotations[*joint] = euler;
  }

  std::map<std::string, std::vector<Coordinate>> named;
  for (auto& [joint, positions] : inverse(rotations))
  {
    named.emplace(std::string{jointName(joint)}, std::move(positions));
  }
  return named;
}

void KinematicsSolver::reset()
{
  boneLengthEstimator_.reset();
  availableJoints_.clear();
  clearFrame();
  baseSkeleton_ = initialBaseSkeleton();
  rootTrajectory_ = Coordinate{0.0, 0.0, 0.0};
  hasSolvedFrame_ = false;
}

JointQuaternions KinematicsSolver::toQuaternions(const FrameRotations& rotations,
                                                 const JointFrame& available)
{
  JointQuaternions quaternions;
  for (const auto& [joint, euler] : rotations)
  {
    auto it = available.find(joint);
    const double visibility = it != available.end() ? it->second.visibility : 0.0;
    quaternions.emplace(joint,
                        JointQuaternion{Rotation::toQuaternion(euler), visibility});
  }
  return quaternions;
}

JointFrame KinematicsSolver::ingest(const JointFrame& frame) const
{
  JointFrame available;

  for (const auto& [joint, sample] : frame)
  {
    if (toIndex(joint) >= kJointCount)
    {
      logger_->warn("Dropping joint with invalid id {}", toIndex(joint));
      continue;
    }
    if (!isFinite(sample.position))
    {
      logger_->warn("Dropping {}: non-finite coordinates", joint);
      continue;
    }
    const double visibility =
      std::isfinite(sample.visibility) ? sample.visibility : 0.0;
    available[joint] = JointPosition{sample.position, visibility};
  }

  for (const CompositeJoint& composite : kCompositeJoints)
  {
    auto first = available.find(composite.first);
    auto second = available.find(composite.second);
    if (first == available.end() || second == available.end())
    {
      continue;
    }

    if (available.contains(composite.joint))
    {
      logger_->debug("Replacing supplied {} with midpoint of {} and {}",
                     composite.joint,
                     composite.first,
                     composite.second);
    }

    const Coordinate midpoint{0.5 * (first->second.position +
                                     second->second.position)};
    const double visibility =
      0.5 * (first->second.visibility + second->second.visibility);
    available[composite.joint] = JointPosition{midpoint, visibility};
  }

  return available;
}

BaseSkeleton KinematicsSolver::initialBaseSkeleton()
{
  return BaseSkeletonBuilder::build(BoneLengths{});
}

bool KinematicsSolver::hasMinimumJoints(const JointFrame& available) const
{
  if (!available.contains(kRootJoint))
  {
    return false;
  }
  return std::any_of(SkeletonModel::kLimbAnchors.begin(),
                     SkeletonModel::kLimbAnchors.end(),
                     [&available](Joint anchor)
                     { return available.contains(anchor); });
}

void KinematicsSolver::clearFrame()
{
  frameRotations_.clear();
  boneLengths_.clear();
}

}  // namespace mocap_kin
