// Ticket: 0006_forward_solver

#ifndef MOCAP_KIN_FORWARD_SOLVER_HPP
#define MOCAP_KIN_FORWARD_SOLVER_HPP

#include <memory>
#include <optional>
#include <vector>

#include <Eigen/Dense>
#include <spdlog/spdlog.h>

#include "mocap-kin/src/Kinematics/KinematicTypes.hpp"
#include "mocap-kin/src/Kinematics/RootFrameEstimator.hpp"
#include "mocap-kin/src/Skeleton/SkeletonModel.hpp"

namespace mocap_kin
{

/**
 * @brief Coordinates to local joint rotations
 *
 * Walks the hierarchy outward from the root in order of chain depth. The
 * observed direction of a joint J, expressed in the rest frame of its parent
 * P, determines the rotation of P:
 *
 *   b    = (R_A1^T * R_A2^T * ... * R_root^T) * (J - P)
 *   R_P  = alignVectors(offsetDirection(J), b)
 *
 * where A1, A2, ... are the ancestors of P (nearest first). Processing in
 * increasing depth guarantees every A_k has been resolved before it is used.
 *
 * Partial data: only joints whose entire ancestor chain is available take
 * part. Available joints that never receive a rotation get the identity.
 *
 * **Thread safety**: Stateless apart from the logger, safe for concurrent use.
 */
class ForwardSolver
{
public:
  /// Result of one forward pass
  struct Result
  {
    FrameRotations rotations;        ///< Rotation per resolved/available joint
    JointFrame rootRelative;         ///< Input joints with the root subtracted
    Coordinate rootPosition;         ///< Root position that was subtracted
    std::optional<RootFrame> root;   ///< Empty if the root frame was unknown
  };

  explicit ForwardSolver(std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Resolve the local rotations of one frame
   *
   * The root joint must be present in `frame`; callers check the
   * minimum-joint precondition before calling.
   *
   * @param frame Validated available joints (absolute positions)
   * @return Rotations keyed by joint, seeded with the root rotation
   */
  [[nodiscard]] Result solve(const JointFrame& frame) const;

  /**
   * @brief Joints whose whole ancestor chain is available, in enum order
   */
  static std::vector<Joint> eligibleJoints(const JointFrame& frame);

  /**
   * @brief Net inverse of the resolved rotations of a chain's ancestors,
   * skipping the first element (the direct parent)
   *
   * Ancestors without a resolved rotation contribute the identity.
   */
  static Eigen::Matrix3d inverseAncestorRotation(const JointChain& chain,
                                                 const FrameRotations& rotations);

private:
  /**
   * @brief Rotation of the parent of `joint` implied by its observed direction
   *
   * @return std::nullopt when the joint cannot be resolved safely (missing
   * parent position, unresolved ancestor rotation, no offset direction);
   * identity when the observed or canonical vector is degenerate.
   */
  std::optional<EulerZXY> parentRotationFromChild(
    Joint joint,
    const JointFrame& rootRelative,
    const FrameRotations& rotations) const;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace mocap_kin

#endif  // MOCAP_KIN_FORWARD_SOLVER_HPP
