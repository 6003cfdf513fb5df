// Ticket: 0008_inverse_solver

#include "mocap-kin/src/Kinematics/InverseSolver.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "mocap-kin/src/Math/Rotation.hpp"

namespace mocap_kin
{

InverseSolver::InverseSolver(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("InverseSolver: logger must not be null");
  }
}

JointCoordinates InverseSolver::solve(const FrameRotations& angles,
                                      const BaseSkeleton& baseSkeleton) const
{
  JointCoordinates coordinates;
  JointMap<std::optional<Coordinate>> memo;

  for (const auto& entry : angles)
  {
    const Joint joint = entry.first;
    try
    {
      const auto position = resolve(joint, angles, baseSkeleton, memo);
      if (position)
      {
        coordinates[joint].push_back(*position);
      }
      else
      {
        logger_->debug("Skipping {}: chain not covered by base skeleton", joint);
      }
    }
    catch (const std::invalid_argument& e)
    {
      logger_->warn("Error computing coordinates for {}: {}", joint, e.what());
    }
  }

  return coordinates;
}

Eigen::Matrix3d InverseSolver::chainRotation(const JointChain& chain,
                                             const FrameRotations& angles)
{
  Eigen::Matrix3d rotation = Eigen::Matrix3d::Identity();

  // Root first, direct parent last
  for (std::size_t i = chain.size(); i-- > 0;)
  {
    auto it = angles.find(chain[i]);
    if (it == angles.end())
    {
      continue;
    }
    if (!it->second.isFinite())
    {
      throw std::invalid_argument("non-finite rotation for " +
                                  std::string{jointName(chain[i])});
    }
    rotation = rotation * Rotation::composeZXY(it->second);
  }

  return rotation;
}

std::optional<Coordinate> InverseSolver::resolve(
  Joint joint,
  const FrameRotations& angles,
  const BaseSkeleton& baseSkeleton,
  JointMap<std::optional<Coordinate>>& memo) const
{
  if (auto cached = memo.find(joint); cached != memo.end())
  {
    return cached->second;
  }

  std::optional<Coordinate> position;
  const JointChain& chain = SkeletonModel::ancestorChain(joint);

  if (chain.empty())
  {
    position = Coordinate{0.0, 0.0, 0.0};
  }
  else if (auto offset = baseSkeleton.find(joint); offset != baseSkeleton.end())
  {
    const auto parentPosition =
      resolve(chain.parent(), angles, baseSkeleton, memo);
    if (parentPosition)
    {
      position = Coordinate{*parentPosition +
                            chainRotation(chain, angles) * offset->second};
    }
  }

  memo[joint] = position;
  return position;
}

}  // namespace mocap_kin
