// Ticket: 0004_root_frame

#include "mocap-kin/src/Kinematics/RootFrameEstimator.hpp"

#include "mocap-kin/src/Math/OrthonormalBasis.hpp"
#include "mocap-kin/src/Math/Rotation.hpp"
#include "mocap-kin/src/Skeleton/SkeletonModel.hpp"

namespace mocap_kin::RootFrameEstimator
{

std::optional<RootFrame> estimate(const JointFrame& frame)
{
  auto rootIt = frame.find(kRootJoint);
  auto lateralIt = frame.find(SkeletonModel::kLateralReference);
  auto verticalIt = frame.find(SkeletonModel::kVerticalReference);
  if (rootIt == frame.end() || lateralIt == frame.end() ||
      verticalIt == frame.end())
  {
    return std::nullopt;
  }

  const Coordinate& root = rootIt->second.position;
  const OrthonormalFrame axes = OrthonormalBasis::withFallbackAxes(
    lateralIt->second.position - root, verticalIt->second.position - root);

  RootFrame result;
  result.position = root;
  result.basis = axes.matrix();
  result.rotation = Rotation::decomposeZXY(result.basis);
  result.usedFallback = axes.usedFallback;
  return result;
}

}  // namespace mocap_kin::RootFrameEstimator
