// Ticket: 0004_root_frame

#ifndef MOCAP_KIN_ROOT_FRAME_ESTIMATOR_HPP
#define MOCAP_KIN_ROOT_FRAME_ESTIMATOR_HPP

#include <optional>

#include <Eigen/Dense>

#include "mocap-kin/src/Kinematics/KinematicTypes.hpp"

namespace mocap_kin
{

/// World placement of the root joint for one frame
struct RootFrame
{
  Coordinate position;        ///< Root position in the input frame
  EulerZXY rotation;          ///< Root world rotation (Z-X-Y triple)
  Eigen::Matrix3d basis;      ///< Columns [U V W]: lateral, vertical, forward
  bool usedFallback{false};   ///< A degenerate axis was replaced
};

/**
 * @brief Root orientation from hip and neck landmarks
 *
 * U points from the root to the lateral reference (right hip), V from the
 * root to the vertical reference (neck), orthogonalized against U, and
 * W = U x V points forward. In the bind-pose T-pose this basis is the
 * identity.
 */
namespace RootFrameEstimator
{

/**
 * @brief Estimate the root frame
 *
 * @param frame Available joints (absolute positions)
 * @return std::nullopt if the root, right hip or neck is unavailable
 */
std::optional<RootFrame> estimate(const JointFrame& frame);

}  // namespace RootFrameEstimator

}  // namespace mocap_kin

#endif  // MOCAP_KIN_ROOT_FRAME_ESTIMATOR_HPP
