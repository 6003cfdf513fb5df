// Ticket: 0006_forward_solver

#include "mocap-kin/src/Kinematics/ForwardSolver.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "mocap-kin/src/Math/Rotation.hpp"
#include "mocap-kin/src/Utils/utils.hpp"

namespace mocap_kin
{

ForwardSolver::ForwardSolver(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("ForwardSolver: logger must not be null");
  }
}

ForwardSolver::Result ForwardSolver::solve(const JointFrame& frame) const
{
  auto rootIt = frame.find(kRootJoint);
  if (rootIt == frame.end())
  {
    throw std::invalid_argument(
      "ForwardSolver::solve: root joint missing from frame");
  }

  Result result;
  result.rootPosition = rootIt->second.position;

  // Root rotation seeds the walk
  result.root = RootFrameEstimator::estimate(frame);
  EulerZXY rootRotation = EulerZXY::identity();
  if (result.root)
  {
    rootRotation = result.root->rotation;
    if (result.root->usedFallback)
    {
      logger_->warn("Degenerate root axes; substituted fallback axis");
    }
  }
  else
  {
    logger_->warn("Cannot determine root frame: need {}, {} and {}",
                  kRootJoint,
                  SkeletonModel::kLateralReference,
                  SkeletonModel::kVerticalReference);
  }
  result.rotations[kRootJoint] = rootRotation;

  for (const auto& [joint, sample] : frame)
  {
    result.rootRelative[joint] =
      JointPosition{Coordinate{sample.position - result.rootPosition},
                    sample.visibility};
  }

  const std::vector<Joint> eligible = eligibleJoints(result.rootRelative);
  std::size_t maxDepth = 0;
  for (Joint joint : eligible)
  {
    maxDepth = std::max(maxDepth, SkeletonModel::depth(joint));
  }

  // Depth 1 joints hang off the root, whose rotation is already seeded
  for (std::size_t depth = 2; depth <= maxDepth; ++depth)
  {
    for (Joint joint : eligible)
    {
      if (SkeletonModel::depth(joint) != depth ||
          !SkeletonModel::drivesParentRotation(joint))
      {
        continue;
      }

      const auto parentRotation =
        parentRotationFromChild(joint, result.rootRelative, result.rotations);
      if (parentRotation)
      {
        result.rotations[SkeletonModel::ancestorChain(joint).parent()] =
          *parentRotation;
      }
    }
  }

  for (const auto& entry : result.rootRelative)
  {
    result.rotations.try_emplace(entry.first, EulerZXY::identity());
  }

  logger_->debug("Forward pass: {} available, {} eligible, {} rotations",
                 frame.size(),
                 eligible.size(),
                 result.rotations.size());

  return result;
}

std::vector<Joint> ForwardSolver::eligibleJoints(const JointFrame& frame)
{
  std::vector<Joint> eligible;
  eligible.reserve(frame.size());

  for (const auto& entry : frame)
  {
    const JointChain& chain = SkeletonModel::ancestorChain(entry.first);
    const bool complete = std::all_of(
      chain.begin(), chain.end(), [&frame](Joint ancestor)
      { return frame.contains(ancestor); });
    if (complete)
    {
      eligible.push_back(entry.first);
    }
  }

  return eligible;
}

Eigen::Matrix3d ForwardSolver::inverseAncestorRotation(
  const JointChain& chain,
  const FrameRotations& rotations)
{
  Eigen::Matrix3d inverse = Eigen::Matrix3d::Identity();
  for (std::size_t i = 1; i < chain.size(); ++i)
  {
    auto it = rotations.find(chain[i]);
    if (it == rotations.end())
    {
      continue;
    }
    inverse = inverse * Rotation::composeZXY(it->second).transpose();
  }
  return inverse;
}

std::optional<EulerZXY> ForwardSolver::parentRotationFromChild(
  Joint joint,
  const JointFrame& rootRelative,
  const FrameRotations& rotations) const
{
  const JointChain& chain = SkeletonModel::ancestorChain(joint);
  if (chain.empty())
  {
    return std::nullopt;
  }

  auto jointIt = rootRelative.find(joint);
  auto parentIt = rootRelative.find(chain.parent());
  if (jointIt == rootRelative.end() || parentIt == rootRelative.end())
  {
    return std::nullopt;
  }

  for (std::size_t i = 1; i < chain.size(); ++i)
  {
    if (!rotations.contains(chain[i]))
    {
      logger_->debug("Skipping {}: ancestor {} has no rotation yet",
                     joint,
                     chain[i]);
      return std::nullopt;
    }
  }

  if (!SkeletonModel::hasOffsetDirection(joint))
  {
    logger_->warn("Skipping {}: no offset direction", joint);
    return std::nullopt;
  }

  const Eigen::Vector3d observed =
    inverseAncestorRotation(chain, rotations) *
    (jointIt->second.position - parentIt->second.position);

  if (observed.norm() < kDegenerateNorm)
  {
    logger_->warn("Degenerate bone {} -> {}; using identity rotation",
                  chain.parent(),
                  joint);
    return EulerZXY::identity();
  }

  const Eigen::Matrix3d alignment =
    Rotation::alignVectors(SkeletonModel::offsetDirection(joint), observed);
  return Rotation::decomposeZXY(alignment);
}

}  // namespace mocap_kin
