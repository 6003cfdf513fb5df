// Ticket: 0001_skeleton_model

#include "mocap-kin/src/Skeleton/SkeletonModel.hpp"

namespace mocap_kin::SkeletonModel
{

namespace
{

struct JointDefinition
{
  JointChain chain;
  std::array<double, 3> offset;
  bool drivesParent;
};

using J = Joint;

// Indexed by Joint. Rows must stay in enum order.
constexpr std::array<JointDefinition, kJointCount> kSkeleton{{
  /* HipCentre     */ {{}, {0.0, 0.0, 0.0}, false},
  /* LeftHip       */ {{J::HipCentre}, {-1.0, 0.0, 0.0}, true},
  /* LeftKnee      */ {{J::LeftHip, J::HipCentre}, {0.0, -1.0, 0.0}, true},
  /* LeftAnkle     */ {{J::LeftKnee, J::LeftHip, J::HipCentre}, {0.0, -1.0, 0.0}, true},
  /* LeftToe       */ {{J::LeftAnkle, J::LeftKnee, J::LeftHip, J::HipCentre}, {0.0, 0.0, 1.0}, true},
  /* RightHip      */ {{J::HipCentre}, {1.0, 0.0, 0.0}, true},
  /* RightKnee     */ {{J::RightHip, J::HipCentre}, {0.0, -1.0, 0.0}, true},
  /* RightAnkle    */ {{J::RightKnee, J::RightHip, J::HipCentre}, {0.0, -1.0, 0.0}, true},
  /* RightToe      */ {{J::RightAnkle, J::RightKnee, J::RightHip, J::HipCentre}, {0.0, 0.0, 1.0}, true},
  /* Neck          */ {{J::HipCentre}, {0.0, 1.0, 0.0}, true},
  /* LeftShoulder  */ {{J::Neck, J::HipCentre}, {-1.0, 0.0, 0.0}, true},
  /* LeftElbow     */ {{J::LeftShoulder, J::Neck, J::HipCentre}, {-1.0, 0.0, 0.0}, true},
  /* LeftWrist     */ {{J::LeftElbow, J::LeftShoulder, J::Neck, J::HipCentre}, {-1.0, 0.0, 0.0}, true},
  /* RightShoulder */ {{J::Neck, J::HipCentre}, {1.0, 0.0, 0.0}, true},
  /* RightElbow    */ {{J::RightShoulder, J::Neck, J::HipCentre}, {1.0, 0.0, 0.0}, true},
  /* RightWrist    */ {{J::RightElbow, J::RightShoulder, J::Neck, J::HipCentre}, {1.0, 0.0, 0.0}, true},
  /* LeftIndex     */ {{J::LeftWrist, J::LeftElbow, J::LeftShoulder, J::Neck, J::HipCentre}, {-1.0, 0.0, 0.0}, true},
  /* RightIndex    */ {{J::RightWrist, J::RightElbow, J::RightShoulder, J::Neck, J::HipCentre}, {1.0, 0.0, 0.0}, true},
  /* LeftThumb     */ {{J::LeftWrist, J::LeftElbow, J::LeftShoulder, J::Neck, J::HipCentre}, {0.0, 0.0, 1.0}, false},
  /* RightThumb    */ {{J::RightWrist, J::RightElbow, J::RightShoulder, J::Neck, J::HipCentre}, {0.0, 0.0, 1.0}, false},
}};

constexpr std::array<BilateralPair, 9> kBilateralPairs{{
  {J::LeftHip, J::RightHip},
  {J::LeftKnee, J::RightKnee},
  {J::LeftAnkle, J::RightAnkle},
  {J::LeftToe, J::RightToe},
  {J::LeftShoulder, J::RightShoulder},
  {J::LeftElbow, J::RightElbow},
  {J::LeftWrist, J::RightWrist},
  {J::LeftIndex, J::RightIndex},
  {J::LeftThumb, J::RightThumb},
}};

constexpr std::array<Joint, 1> kUnpaired{J::Neck};

// Every non-root chain is its parent followed by the parent's own chain, so
// chains end at the root and no joint is its own ancestor.
constexpr bool hierarchyIsConsistent()
{
  if (!kSkeleton[toIndex(kRootJoint)].chain.empty())
  {
    return false;
  }

  for (std::size_t i = 0; i < kJointCount; ++i)
  {
    if (static_cast<Joint>(i) == kRootJoint)
    {
      continue;
    }

    const JointChain& chain = kSkeleton[i].chain;
    if (chain.empty() || chain[chain.size() - 1] != kRootJoint)
    {
      return false;
    }

    const JointChain& parentChain = kSkeleton[toIndex(chain.parent())].chain;
    if (parentChain.size() + 1 != chain.size())
    {
      return false;
    }
    for (std::size_t k = 0; k < parentChain.size(); ++k)
    {
      if (parentChain[k] != chain[k + 1])
      {
        return false;
      }
    }
  }
  return true;
}

// Every non-root joint has an axis-aligned unit offset
constexpr bool offsetsAreUnit()
{
  for (std::size_t i = 0; i < kJointCount; ++i)
  {
    if (static_cast<Joint>(i) == kRootJoint)
    {
      continue;
    }
    const auto& o = kSkeleton[i].offset;
    if (o[0] * o[0] + o[1] * o[1] + o[2] * o[2] != 1.0)
    {
      return false;
    }
  }
  return true;
}

static_assert(hierarchyIsConsistent(),
              "skeleton hierarchy table is not a tree rooted at HipCentre");
static_assert(offsetsAreUnit(),
              "every non-root joint needs a unit offset direction");

}  // namespace

const JointChain& ancestorChain(Joint joint)
{
  return kSkeleton[toIndex(joint)].chain;
}

std::optional<Joint> parentOf(Joint joint)
{
  const JointChain& chain = ancestorChain(joint);
  if (chain.empty())
  {
    return std::nullopt;
  }
  return chain.parent();
}

std::size_t depth(Joint joint)
{
  return ancestorChain(joint).size();
}

Coordinate offsetDirection(Joint joint)
{
  const auto& o = kSkeleton[toIndex(joint)].offset;
  return Coordinate{o[0], o[1], o[2]};
}

bool hasOffsetDirection(Joint joint)
{
  const auto& o = kSkeleton[toIndex(joint)].offset;
  return o[0] != 0.0 || o[1] != 0.0 || o[2] != 0.0;
}

bool drivesParentRotation(Joint joint)
{
  return kSkeleton[toIndex(joint)].drivesParent;
}

std::span<const BilateralPair> bilateralPairs()
{
  return kBilateralPairs;
}

std::span<const Joint> unpairedJoints()
{
  return kUnpaired;
}

}  // namespace mocap_kin::SkeletonModel
