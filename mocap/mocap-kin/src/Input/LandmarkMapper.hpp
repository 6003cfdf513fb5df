// Ticket: 0010_landmark_mapper

#ifndef MOCAP_KIN_LANDMARK_MAPPER_HPP
#define MOCAP_KIN_LANDMARK_MAPPER_HPP

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "mocap-kin/src/Kinematics/KinematicTypes.hpp"

namespace mocap_kin
{

/// Landmarks per person in a MediaPipe pose result
inline constexpr std::size_t kMediaPipeLandmarkCount = 33;

/// One MediaPipe pose result, indexed by landmark id
using MediaPipePose = std::array<JointInput, kMediaPipeLandmarkCount>;

/**
 * @brief MediaPipe 33-landmark pose to solver joint vocabulary
 *
 * Every solver joint is the mean of one or two landmarks:
 * - hipCentre = mean(left_hip, right_hip)
 * - neck      = mean(left_shoulder, right_shoulder)
 * - leftToe / rightToe = left_foot_index / right_foot_index
 * - every other joint maps to the landmark of the same name
 *
 * Visibility and presence are averaged the same way as the coordinates.
 * Landmarks outside the vocabulary (face, pinkies, heels) are not mapped.
 */
namespace LandmarkMapper
{

/**
 * @brief MediaPipe landmark name (e.g. "left_foot_index")
 * @return "unknown" for indices >= kMediaPipeLandmarkCount
 */
std::string_view landmarkName(std::size_t index);

/// Landmark index of a MediaPipe name, std::nullopt if unknown
std::optional<std::size_t> landmarkIndex(std::string_view name);

/**
 * @brief Landmark indices averaged into a joint
 * @return Empty span for joints without a MediaPipe source
 */
std::span<const std::size_t> sourceLandmarks(Joint joint);

/**
 * @brief Map one pose into named joint inputs, the form pose processors hand
 * to KinematicsSolver::forward
 */
std::map<std::string, JointInput> toNamedInputs(const MediaPipePose& pose);

/**
 * @brief Map one pose into solver joints
 *
 * A joint is omitted when any of its source landmarks has a non-finite
 * coordinate.
 */
JointFrame fromMediaPipe(const MediaPipePose& pose);

}  // namespace LandmarkMapper

}  // namespace mocap_kin

#endif  // MOCAP_KIN_LANDMARK_MAPPER_HPP
