// Ticket: 0005_bone_lengths

#include "mocap-kin/src/Kinematics/BaseSkeletonBuilder.hpp"

#include <cmath>
#include <optional>

#include "mocap-kin/src/Skeleton/SkeletonModel.hpp"

namespace mocap_kin::BaseSkeletonBuilder
{

namespace
{

std::optional<double> usableLength(const BoneLengths& lengths, Joint joint)
{
  auto it = lengths.find(joint);
  if (it == lengths.end() || !std::isfinite(it->second) || it->second < 0.0)
  {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace

BaseSkeleton build(const BoneLengths& lengths)
{
  BaseSkeleton skeleton;
  skeleton[kRootJoint] = Coordinate{0.0, 0.0, 0.0};

  for (const BilateralPair& pair : SkeletonModel::bilateralPairs())
  {
    const auto left = usableLength(lengths, pair.left);
    const auto right = usableLength(lengths, pair.right);

    std::optional<double> shared;
    if (left && right)
    {
      shared = (*left + *right) / 2.0;
    }
    else if (left)
    {
      shared = left;
    }
    else if (right)
    {
      shared = right;
    }

    if (!shared)
    {
      continue;
    }

    skeleton[pair.left] = SkeletonModel::offsetDirection(pair.left) * *shared;
    skeleton[pair.right] = SkeletonModel::offsetDirection(pair.right) * *shared;
  }

  for (Joint joint : SkeletonModel::unpairedJoints())
  {
    const double length =
      usableLength(lengths, joint).value_or(kDefaultUnpairedLength);
    skeleton[joint] = SkeletonModel::offsetDirection(joint) * length;
  }

  return skeleton;
}

}  // namespace mocap_kin::BaseSkeletonBuilder
