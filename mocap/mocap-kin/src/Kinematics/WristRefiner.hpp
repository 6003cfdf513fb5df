// Ticket: 0007_wrist_refinement

#ifndef MOCAP_KIN_WRIST_REFINER_HPP
#define MOCAP_KIN_WRIST_REFINER_HPP

#include <array>
#include <cstdint>
#include <memory>

#include <spdlog/spdlog.h>

#include "mocap-kin/src/Kinematics/KinematicTypes.hpp"
#include "mocap-kin/src/Skeleton/SkeletonModel.hpp"

namespace mocap_kin
{

/**
 * @brief Wrist orientation from finger landmarks
 *
 * The generic forward pass can only bend the wrist (2 DOF): a single index
 * finger direction says nothing about rotation around the forearm. When the
 * thumb is tracked as well, the wrist->thumb vector fixes that remaining axis
 * and the full 3-DOF orientation (including pronation/supination) is
 * recovered by aligning the observed hand basis with the bind-pose one:
 *
 *   B  = [f, u, f x u]    observed, in the wrist's rest frame
 *   B0 = [f0, u0, f0 x u0] from the index and thumb offset directions
 *   R  = B * B0^T
 *
 * Without a thumb the index-only 2-DOF estimate is used. Either way the
 * result overwrites the wrist rotation from the generic pass. Without an
 * index finger the wrist is left untouched.
 */
class WristRefiner
{
public:
  enum class Mode : std::uint8_t
  {
    Skipped,   ///< Index finger or an ancestor rotation unavailable
    TwoDof,    ///< Index direction only
    ThreeDof   ///< Index and thumb
  };

  explicit WristRefiner(std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Refine both wrists in place
   *
   * @param rootRelative Available joints with the root subtracted
   * @param rotations Rotations from the forward pass; wrist entries are
   * overwritten
   * @return Mode applied per hand, in SkeletonModel::kHands order
   */
  std::array<Mode, 2> refine(const JointFrame& rootRelative,
                             FrameRotations& rotations) const;

  /**
   * @brief Refine a single wrist in place
   */
  Mode refineHand(const HandLandmarks& hand,
                  const JointFrame& rootRelative,
                  FrameRotations& rotations) const;

private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace mocap_kin

#endif  // MOCAP_KIN_WRIST_REFINER_HPP
