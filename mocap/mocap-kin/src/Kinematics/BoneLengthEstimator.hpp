// Ticket: 0005_bone_lengths

#ifndef MOCAP_KIN_BONE_LENGTH_ESTIMATOR_HPP
#define MOCAP_KIN_BONE_LENGTH_ESTIMATOR_HPP

#include <cstddef>
#include <deque>

#include "mocap-kin/src/Kinematics/KinematicTypes.hpp"

namespace mocap_kin
{

/**
 * @brief Per-bone length estimation from observed joint positions
 *
 * The length of the bone ending at joint J is the Euclidean distance between
 * J and its direct parent. Each bone keeps the last `historySize` samples and
 * reports their median; with the default history of one sample the estimate
 * is the instantaneous distance.
 *
 * A bone is only reported for frames in which both of its joints are
 * available. Older samples are never used to fill in an unobserved bone.
 *
 * Thread safety: Not thread-safe (owns sample history). One instance per
 * stream.
 */
class BoneLengthEstimator
{
public:
  struct Config
  {
    std::size_t historySize{1};  ///< Samples retained per bone (>= 1)
  };

  BoneLengthEstimator() = default;

  /**
   * @brief Construct with a given history window
   * @throws std::invalid_argument if config.historySize is 0
   */
  explicit BoneLengthEstimator(Config config);

  /**
   * @brief Record this frame's bone samples and return the current estimates
   *
   * @param frame Available joints this frame (absolute or root-relative)
   * @return Length per observed non-root joint
   */
  BoneLengths update(const JointFrame& frame);

  /// Drop all retained samples
  void reset();

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  /// Median of a sample set; mean of the two middle values for even counts
  static double median(std::deque<double> samples);

private:
  Config config_;
  JointMap<std::deque<double>> history_;
};

}  // namespace mocap_kin

#endif  // MOCAP_KIN_BONE_LENGTH_ESTIMATOR_HPP
