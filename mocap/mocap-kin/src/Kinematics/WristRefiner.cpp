// Ticket: 0007_wrist_refinement

#include "mocap-kin/src/Kinematics/WristRefiner.hpp"

#include <stdexcept>
#include <utility>

#include "mocap-kin/src/Kinematics/ForwardSolver.hpp"
#include "mocap-kin/src/Math/OrthonormalBasis.hpp"
#include "mocap-kin/src/Math/Rotation.hpp"
#include "mocap-kin/src/Utils/utils.hpp"

namespace mocap_kin
{

WristRefiner::WristRefiner(std::shared_ptr<spdlog::logger> logger)
  : logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("WristRefiner: logger must not be null");
  }
}

std::array<WristRefiner::Mode, 2> WristRefiner::refine(
  const JointFrame& rootRelative,
  FrameRotations& rotations) const
{
  std::array<Mode, 2> modes{Mode::Skipped, Mode::Skipped};
  for (std::size_t i = 0; i < SkeletonModel::kHands.size(); ++i)
  {
    modes[i] = refineHand(SkeletonModel::kHands[i], rootRelative, rotations);
  }
  return modes;
}

WristRefiner::Mode WristRefiner::refineHand(const HandLandmarks& hand,
                                            const JointFrame& rootRelative,
                                            FrameRotations& rotations) const
{
  auto wristIt = rootRelative.find(hand.wrist);
  auto indexIt = rootRelative.find(hand.index);
  if (wristIt == rootRelative.end() || indexIt == rootRelative.end())
  {
    return Mode::Skipped;
  }

  // The index chain is [wrist, elbow, shoulder, neck, root]; everything past
  // the wrist must already be resolved.
  const JointChain& chain = SkeletonModel::ancestorChain(hand.index);
  for (std::size_t i = 1; i < chain.size(); ++i)
  {
    if (!rotations.contains(chain[i]))
    {
      return Mode::Skipped;
    }
  }

  const Eigen::Matrix3d toRestFrame =
    ForwardSolver::inverseAncestorRotation(chain, rotations);
  const Coordinate& wrist = wristIt->second.position;

  const Eigen::Vector3d forward =
    toRestFrame * (indexIt->second.position - wrist);
  if (forward.norm() < kDegenerateNorm)
  {
    logger_->warn("Degenerate {} -> {} vector; keeping generic wrist rotation",
                  hand.wrist,
                  hand.index);
    return Mode::Skipped;
  }

  const Coordinate restForward = SkeletonModel::offsetDirection(hand.index);
  const EulerZXY twoDof =
    Rotation::decomposeZXY(Rotation::alignVectors(restForward, forward));

  auto thumbIt = rootRelative.find(hand.thumb);
  if (thumbIt == rootRelative.end())
  {
    rotations[hand.wrist] = twoDof;
    return Mode::TwoDof;
  }

  const Eigen::Vector3d thumb = toRestFrame * (thumbIt->second.position - wrist);
  const auto observed = OrthonormalBasis::fromForwardAndUp(forward, thumb);
  const auto rest = OrthonormalBasis::fromForwardAndUp(
    restForward, SkeletonModel::offsetDirection(hand.thumb));

  if (!observed || !rest)
  {
    logger_->warn("{} is collinear with {}; wrist twist unknown, using 2-DOF",
                  hand.thumb,
                  hand.index);
    rotations[hand.wrist] = twoDof;
    return Mode::TwoDof;
  }

  const Eigen::Matrix3d rotation =
    observed->matrix() * rest->matrix().transpose();
  rotations[hand.wrist] = Rotation::decomposeZXY(rotation);
  return Mode::ThreeDof;
}

}  // namespace mocap_kin
