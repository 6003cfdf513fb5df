// Ticket: 0001_skeleton_model

#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "mocap-kin/src/Skeleton/Joint.hpp"
#include "mocap-kin/src/Skeleton/SkeletonModel.hpp"

using namespace mocap_kin;

// ============================================================================
// Joint Names
// ============================================================================

TEST(JointTest, NamesRoundTripThroughLookup)
{
  for (Joint joint : allJoints())
  {
    const auto found = jointFromName(jointName(joint));
    ASSERT_TRUE(found.has_value()) << jointName(joint);
    EXPECT_EQ(*found, joint);
  }
}

TEST(JointTest, NamesAreUnique)
{
  std::set<std::string_view> names;
  for (Joint joint : allJoints())
  {
    EXPECT_TRUE(names.insert(jointName(joint)).second) << jointName(joint);
  }
}

TEST(JointTest, WireNames)
{
  EXPECT_EQ(jointName(Joint::HipCentre), "hipCentre");
  EXPECT_EQ(jointName(Joint::LeftToe), "leftToe");
  EXPECT_EQ(jointName(Joint::RightThumb), "rightThumb");
  EXPECT_EQ(fmt::format("{}", Joint::LeftShoulder), "leftShoulder");
}

TEST(JointTest, UnknownNamesAreRejected)
{
  EXPECT_FALSE(jointFromName("leftEye").has_value());
  EXPECT_FALSE(jointFromName("rightPinky").has_value());
  EXPECT_FALSE(jointFromName("").has_value());
  EXPECT_EQ(jointName(Joint::Count), "unknown");
}

// ============================================================================
// Hierarchy
// ============================================================================

TEST(SkeletonModelTest, RootHasEmptyChain)
{
  EXPECT_TRUE(SkeletonModel::ancestorChain(kRootJoint).empty());
  EXPECT_FALSE(SkeletonModel::parentOf(kRootJoint).has_value());
  EXPECT_EQ(SkeletonModel::depth(kRootJoint), 0u);
}

TEST(SkeletonModelTest, EveryNonRootChainEndsAtRoot)
{
  for (Joint joint : allJoints())
  {
    if (joint == kRootJoint)
    {
      continue;
    }
    const JointChain& chain = SkeletonModel::ancestorChain(joint);
    ASSERT_FALSE(chain.empty()) << jointName(joint);
    EXPECT_EQ(chain[chain.size() - 1], kRootJoint) << jointName(joint);
    EXPECT_EQ(SkeletonModel::parentOf(joint), chain.parent());
  }
}

TEST(SkeletonModelTest, ChainIsParentFollowedByParentChain)
{
  for (Joint joint : allJoints())
  {
    const auto parent = SkeletonModel::parentOf(joint);
    if (!parent)
    {
      continue;
    }
    const JointChain& chain = SkeletonModel::ancestorChain(joint);
    const JointChain& parentChain = SkeletonModel::ancestorChain(*parent);
    ASSERT_EQ(chain.size(), parentChain.size() + 1) << jointName(joint);
    EXPECT_TRUE(std::equal(parentChain.begin(), parentChain.end(), chain.begin() + 1))
      << jointName(joint);
  }
}

TEST(SkeletonModelTest, ExpectedChains)
{
  const JointChain& wrist = SkeletonModel::ancestorChain(Joint::LeftWrist);
  ASSERT_EQ(wrist.size(), 4u);
  EXPECT_EQ(wrist[0], Joint::LeftElbow);
  EXPECT_EQ(wrist[1], Joint::LeftShoulder);
  EXPECT_EQ(wrist[2], Joint::Neck);
  EXPECT_EQ(wrist[3], Joint::HipCentre);

  const JointChain& toe = SkeletonModel::ancestorChain(Joint::RightToe);
  ASSERT_EQ(toe.size(), 4u);
  EXPECT_EQ(toe[0], Joint::RightAnkle);
  EXPECT_EQ(toe[3], Joint::HipCentre);

  EXPECT_EQ(SkeletonModel::depth(Joint::RightIndex), kMaxChainLength);
  EXPECT_EQ(SkeletonModel::parentOf(Joint::LeftThumb), Joint::LeftWrist);
}

// ============================================================================
// Offsets
// ============================================================================

TEST(SkeletonModelTest, NonRootOffsetsAreUnit)
{
  for (Joint joint : allJoints())
  {
    if (joint == kRootJoint)
    {
      EXPECT_FALSE(SkeletonModel::hasOffsetDirection(joint));
      continue;
    }
    EXPECT_TRUE(SkeletonModel::hasOffsetDirection(joint)) << jointName(joint);
    EXPECT_NEAR(SkeletonModel::offsetDirection(joint).norm(), 1.0, 1e-12)
      << jointName(joint);
  }
}

TEST(SkeletonModelTest, BindPoseDirections)
{
  EXPECT_DOUBLE_EQ(SkeletonModel::offsetDirection(Joint::LeftHip).x(), -1.0);
  EXPECT_DOUBLE_EQ(SkeletonModel::offsetDirection(Joint::RightElbow).x(), 1.0);
  EXPECT_DOUBLE_EQ(SkeletonModel::offsetDirection(Joint::LeftKnee).y(), -1.0);
  EXPECT_DOUBLE_EQ(SkeletonModel::offsetDirection(Joint::Neck).y(), 1.0);
  EXPECT_DOUBLE_EQ(SkeletonModel::offsetDirection(Joint::RightToe).z(), 1.0);
  EXPECT_DOUBLE_EQ(SkeletonModel::offsetDirection(Joint::LeftThumb).z(), 1.0);
}

TEST(SkeletonModelTest, BilateralPairsMirrorAcrossX)
{
  for (const BilateralPair& pair : SkeletonModel::bilateralPairs())
  {
    const Coordinate left = SkeletonModel::offsetDirection(pair.left);
    const Coordinate right = SkeletonModel::offsetDirection(pair.right);
    EXPECT_DOUBLE_EQ(left.x(), -right.x()) << jointName(pair.left);
    EXPECT_DOUBLE_EQ(left.y(), right.y()) << jointName(pair.left);
    EXPECT_DOUBLE_EQ(left.z(), right.z()) << jointName(pair.left);
  }
}

TEST(SkeletonModelTest, EveryNonRootJointHasOneLengthSource)
{
  std::set<Joint> covered;
  for (const BilateralPair& pair : SkeletonModel::bilateralPairs())
  {
    EXPECT_TRUE(covered.insert(pair.left).second);
    EXPECT_TRUE(covered.insert(pair.right).second);
  }
  for (Joint joint : SkeletonModel::unpairedJoints())
  {
    EXPECT_TRUE(covered.insert(joint).second);
  }
  EXPECT_EQ(covered.size(), kJointCount - 1);
  EXPECT_FALSE(covered.contains(kRootJoint));
}

TEST(SkeletonModelTest, ThumbsDoNotDriveWrist)
{
  EXPECT_FALSE(SkeletonModel::drivesParentRotation(Joint::LeftThumb));
  EXPECT_FALSE(SkeletonModel::drivesParentRotation(Joint::RightThumb));
  EXPECT_TRUE(SkeletonModel::drivesParentRotation(Joint::LeftIndex));
  EXPECT_TRUE(SkeletonModel::drivesParentRotation(Joint::LeftElbow));
}
