// Ticket: 0009_kinematics_solver

#ifndef MOCAP_KIN_KINEMATICS_SOLVER_HPP
#define MOCAP_KIN_KINEMATICS_SOLVER_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "mocap-kin/src/Kinematics/BoneLengthEstimator.hpp"
#include "mocap-kin/src/Kinematics/ForwardSolver.hpp"
#include "mocap-kin/src/Kinematics/InverseSolver.hpp"
#include "mocap-kin/src/Kinematics/KinematicTypes.hpp"
#include "mocap-kin/src/Kinematics/WristRefiner.hpp"

namespace mocap_kin
{

/**
 * @brief Per-stream skeletal kinematics solver
 *
 * Converts sparse 3D joint positions into hierarchical local rotations
 * (forward) and reconstructs positions from rotations (inverse). Stage order
 * inside forward():
 *
 * 1. Ingest: drop joints with non-finite coordinates
 * 2. Derive composites: hipCentre from the hips, neck from the shoulders
 * 3. Validate: root plus at least one limb anchor, else empty result
 * 4. Estimate bone lengths and rebuild the base skeleton
 * 5. Root frame and depth-ordered rotation resolution (ForwardSolver)
 * 6. Wrist refinement (WristRefiner), if enabled
 * 7. Quaternion conversion
 *
 * All derived state is recomputed every call; the solver only caches the last
 * computed frame for the accessors and for inverse().
 *
 * **Thread safety**: Not thread-safe. Use one instance per stream.
 */
class KinematicsSolver
{
public:
  struct Config
  {
    std::size_t boneLengthHistory{1};  ///< Median window per bone (>= 1)
    bool refineWrists{true};           ///< Run the thumb/index wrist refinement
    bool absoluteInverse{false};       ///< inverse() adds the root trajectory
  };

  /// Default configuration, shared "mocap-kin" logger
  KinematicsSolver();

  /**
   * @brief Construct with explicit configuration
   *
   * @param config Solver configuration
   * @param logger Logger to report to; nullptr selects the shared
   * "mocap-kin" logger
   * @throws std::invalid_argument if config.boneLengthHistory is 0
   */
  explicit KinematicsSolver(Config config,
                            std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Solve one frame of joint positions into local rotations
   *
   * @param frame Joint positions for this frame; missing joints are allowed
   * @return Quaternion per joint that received a rotation; empty if the frame
   * lacks the root or every limb anchor
   */
  JointQuaternions forward(const JointFrame& frame);

  /**
   * @brief Name-keyed variant of forward() for upstream pose processors
   *
   * Names outside the joint vocabulary are ignored.
   */
  std::map<std::string, JointQuaternion> forward(
    const std::map<std::string, JointInput>& frame);

  /**
   * @brief Reconstruct joint positions from local rotations
   *
   * Uses the base skeleton of the last forward() call. Positions are relative
   * to the root unless Config::absoluteInverse is set.
   *
   * @param angles Rotation per joint; its keys are the joints to reconstruct
   * @return One position per reconstructible requested joint
   */
  [[nodiscard]] JointCoordinates inverse(const FrameRotations& angles) const;

  /// Name-keyed variant of inverse(); unknown names are ignored
  [[nodiscard]] std::map<std::string, std::vector<Coordinate>> inverse(
    const std::map<std::string, EulerZXY>& angles) const;

  /// Local rotations of the last solved frame
  [[nodiscard]] const FrameRotations& frameRotations() const
  {
    return frameRotations_;
  }

  /// Bone lengths observed in the last solved frame
  [[nodiscard]] const BoneLengths& boneLengths() const
  {
    return boneLengths_;
  }

  /// Rest-pose offsets used by inverse()
  [[nodiscard]] const BaseSkeleton& baseSkeleton() const
  {
    return baseSkeleton_;
  }

  /// World position of the root in the last solved frame
  [[nodiscard]] const Coordinate& rootTrajectory() const
  {
    return rootTrajectory_;
  }

  /// Joints that were available (including composites) in the last call
  [[nodiscard]] const JointFrame& availableJoints() const
  {
    return availableJoints_;
  }

  /// Whether any forward() call has produced rotations yet
  [[nodiscard]] bool hasSolvedFrame() const
  {
    return hasSolvedFrame_;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  /// Forget all per-stream state, as if freshly constructed
  void reset();

  /**
   * @brief Quaternion per rotation, carrying the visibility of the
   * originating joint (0 if it was not available)
   */
  static JointQuaternions toQuaternions(const FrameRotations& rotations,
                                        const JointFrame& available);

  /**
   * @brief Validated joints of a frame with composites derived
   *
   * Joints with any non-finite coordinate are dropped; a non-finite
   * visibility is treated as 0.
   */
  JointFrame ingest(const JointFrame& frame) const;

private:
  /// Base skeleton before any frame has been solved
  static BaseSkeleton initialBaseSkeleton();

  bool hasMinimumJoints(const JointFrame& available) const;

  void clearFrame();

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;

  BoneLengthEstimator boneLengthEstimator_;
  ForwardSolver forwardSolver_;
  WristRefiner wristRefiner_;
  InverseSolver inverseSolver_;

  JointFrame availableJoints_;
  FrameRotations frameRotations_;
  BoneLengths boneLengths_;
  BaseSkeleton baseSkeleton_;
  Coordinate rootTrajectory_{0.0, 0.0, 0.0};
  bool hasSolvedFrame_{false};
};

}  // namespace mocap_kin

#endif  // MOCAP_KIN_KINEMATICS_SOLVER_HPP
