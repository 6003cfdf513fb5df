// Ticket: 0008_inverse_solver

#ifndef MOCAP_KIN_INVERSE_SOLVER_HPP
#define MOCAP_KIN_INVERSE_SOLVER_HPP

#include <memory>
#include <optional>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "mocap-kin/src/Kinematics/KinematicTypes.hpp"
#include "mocap-kin/src/Skeleton/SkeletonModel.hpp"

namespace mocap_kin
{

/**
 * @brief Local joint rotations to root-relative positions
 *
 * Position of joint J with chain [P, ..., root]:
 *
 *   pos(J) = pos(P) + (R_root * ... * R_P) * base(J),   pos(root) = 0
 *
 * Ancestors without a rotation contribute the identity. A joint is skipped
 * when it or any non-root ancestor has no rest-pose offset, and when one of
 * the rotations it needs is not finite; other joints are unaffected.
 *
 * **Thread safety**: Stateless apart from the logger, safe for concurrent use.
 */
class InverseSolver
{
public:
  explicit InverseSolver(std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Reconstruct positions of the requested joints
   *
   * @param angles Rotation per joint; its keys are the joints to reconstruct
   * @param baseSkeleton Rest-pose offsets
   * @return One root-relative position per reconstructible requested joint
   */
  [[nodiscard]] JointCoordinates solve(const FrameRotations& angles,
                                       const BaseSkeleton& baseSkeleton) const;

  /**
   * @brief Cumulative rotation R_root * ... * R_parent for a joint's chain
   *
   * @throws std::invalid_argument if a rotation on the chain is not finite
   */
  static Eigen::Matrix3d chainRotation(const JointChain& chain,
                                       const FrameRotations& angles);

private:
  std::optional<Coordinate> resolve(Joint joint,
                                    const FrameRotations& angles,
                                    const BaseSkeleton& baseSkeleton,
                                    JointMap<std::optional<Coordinate>>& memo) const;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace mocap_kin

#endif  // MOCAP_KIN_INVERSE_SOLVER_HPP
