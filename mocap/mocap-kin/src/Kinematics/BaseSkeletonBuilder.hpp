// Ticket: 0005_bone_lengths

#ifndef MOCAP_KIN_BASE_SKELETON_BUILDER_HPP
#define MOCAP_KIN_BASE_SKELETON_BUILDER_HPP

#include "mocap-kin/src/Kinematics/KinematicTypes.hpp"

namespace mocap_kin
{

/**
 * @brief Rest-pose offsets from bind-pose directions and estimated lengths
 */
namespace BaseSkeletonBuilder
{

/// Length used for unpaired bones (neck) that were not observed
inline constexpr double kDefaultUnpairedLength = 1.0;

/**
 * @brief Build the rest-pose offset of every joint whose length is known or
 * can be inferred
 *
 * - Root: zero vector.
 * - Bilateral bones: mean of both sides when both are known; the known side's
 *   length mirrored onto the other side when only one is; omitted when
 *   neither is.
 * - Unpaired bones (neck): own estimate, or kDefaultUnpairedLength.
 *
 * An absent entry means "unknown"; no entry is ever NaN or negative.
 */
BaseSkeleton build(const BoneLengths& lengths);

}  // namespace BaseSkeletonBuilder

}  // namespace mocap_kin

#endif  // MOCAP_KIN_BASE_SKELETON_BUILDER_HPP
