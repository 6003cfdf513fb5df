// Ticket: 0001_skeleton_model

#ifndef MOCAP_KIN_SKELETON_MODEL_HPP
#define MOCAP_KIN_SKELETON_MODEL_HPP

#include <array>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <span>

#include "mocap-kin/src/DataTypes/Coordinate.hpp"
#include "mocap-kin/src/Skeleton/Joint.hpp"

namespace mocap_kin
{

/// Longest ancestor chain in the skeleton (index finger / thumb)
inline constexpr std::size_t kMaxChainLength = 5;

/**
 * @brief Ordered ancestor chain of a joint, nearest ancestor first
 *
 * The last element of every non-empty chain is the root. The root's own chain
 * is empty.
 */
struct JointChain
{
  std::array<Joint, kMaxChainLength> joints{};
  std::size_t length{0};

  constexpr JointChain() = default;

  constexpr JointChain(std::initializer_list<Joint> chain)
  {
    for (Joint joint : chain)
    {
      joints[length++] = joint;
    }
  }

  [[nodiscard]] constexpr std::size_t size() const
  {
    return length;
  }

  [[nodiscard]] constexpr bool empty() const
  {
    return length == 0;
  }

  /// Direct parent. Only valid on a non-empty chain.
  [[nodiscard]] constexpr Joint parent() const
  {
    return joints[0];
  }

  [[nodiscard]] constexpr Joint operator[](std::size_t i) const
  {
    return joints[i];
  }

  [[nodiscard]] std::span<const Joint> view() const
  {
    return std::span<const Joint>{joints.data(), length};
  }

  [[nodiscard]] const Joint* begin() const
  {
    return joints.data();
  }

  [[nodiscard]] const Joint* end() const
  {
    return joints.data() + length;
  }
};

/// Left/right joints sharing one canonical bone length
struct BilateralPair
{
  Joint left;
  Joint right;
};

/// Landmarks used to refine one wrist
struct HandLandmarks
{
  Joint wrist;
  Joint index;
  Joint thumb;
};

/**
 * @brief Static skeleton tables: hierarchy, bind-pose offset directions and
 * bone pairing
 *
 * Bind pose is a T-pose facing +Z with +Y up: the subject's left side lies
 * along -X, legs point along -Y, toes and thumbs point forward along +Z.
 * Offset directions are expressed in the local frame of the joint's direct
 * parent.
 *
 * Rotation convention shared by every solver stage: local rotations are
 * EulerZXY triples composed as R = Rz * Rx * Ry.
 */
namespace SkeletonModel
{

/// Joint whose direction from the root defines the lateral (U) root axis
inline constexpr Joint kLateralReference = Joint::RightHip;

/// Joint whose direction from the root defines the vertical (V) root axis
inline constexpr Joint kVerticalReference = Joint::Neck;

/// At least one of these (plus the root) is needed to solve a frame
inline constexpr std::array<Joint, 4> kLimbAnchors{Joint::LeftHip,
                                                   Joint::RightHip,
                                                   Joint::LeftShoulder,
                                                   Joint::RightShoulder};

inline constexpr std::array<HandLandmarks, 2> kHands{
  HandLandmarks{Joint::LeftWrist, Joint::LeftIndex, Joint::LeftThumb},
  HandLandmarks{Joint::RightWrist, Joint::RightIndex, Joint::RightThumb}};

/**
 * @brief Ancestor chain of a joint, nearest first
 * @return Empty chain for the root
 */
const JointChain& ancestorChain(Joint joint);

/**
 * @brief Direct parent of a joint
 * @return std::nullopt for the root
 */
std::optional<Joint> parentOf(Joint joint);

/// Chain length; 0 for the root, 1 for joints attached to the root
std::size_t depth(Joint joint);

/**
 * @brief Canonical unit offset of a joint from its parent at bind pose
 * @return Zero vector for the root
 */
Coordinate offsetDirection(Joint joint);

/// Whether the table carries a non-zero offset direction for this joint
bool hasOffsetDirection(Joint joint);

/**
 * @brief Whether this joint's observed direction determines its parent's
 * rotation in the generic depth-ordered pass
 *
 * False for thumbs: they are secondary landmarks used only by the wrist
 * refinement.
 */
bool drivesParentRotation(Joint joint);

/// Bilateral bone pairs sharing a canonical length
std::span<const BilateralPair> bilateralPairs();

/// Non-root joints without a mirrored counterpart
std::span<const Joint> unpairedJoints();

}  // namespace SkeletonModel

}  // namespace mocap_kin

#endif  // MOCAP_KIN_SKELETON_MODEL_HPP
