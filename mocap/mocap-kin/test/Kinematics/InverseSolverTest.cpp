// Ticket: 0008_inverse_solver

#include <gtest/gtest.h>

#include <cmath>
#include <initializer_list>
#include <limits>
#include <stdexcept>

#include "mocap-kin/src/Kinematics/BaseSkeletonBuilder.hpp"
#include "mocap-kin/src/Kinematics/BoneLengthEstimator.hpp"
#include "mocap-kin/src/Kinematics/InverseSolver.hpp"
#include "mocap-kin/src/Utils/Logging.hpp"
#include "mocap-kin/test/Fixtures/PoseFixtures.hpp"

using namespace mocap_kin;
using namespace mocap_kin::test;

namespace
{

BaseSkeleton tPoseSkeleton()
{
  BoneLengthEstimator estimator;
  return BaseSkeletonBuilder::build(estimator.update(makeTPose()));
}

FrameRotations identityFor(std::initializer_list<Joint> joints)
{
  FrameRotations rotations;
  for (Joint joint : joints)
  {
    rotations[joint] = EulerZXY::identity();
  }
  return rotations;
}

}  // namespace

TEST(InverseSolverTest, NullLoggerThrows)
{
  EXPECT_THROW(InverseSolver{nullptr}, std::invalid_argument);
}

TEST(InverseSolverTest, RootIsOrigin)
{
  const InverseSolver solver{makeNullLogger()};
  const JointCoordinates result =
    solver.solve(identityFor({kRootJoint}), tPoseSkeleton());

  ASSERT_EQ(result.size(), 1u);
  ASSERT_EQ(result.at(kRootJoint).size(), 1u);
  EXPECT_TRUE(coordinatesEqual(result.at(kRootJoint).front(), Eigen::Vector3d::Zero()));
}

TEST(InverseSolverTest, IdentityRotationsRebuildBindPose)
{
  const JointFrame pose = makeTPose();
  FrameRotations rotations;
  for (const auto& entry : pose)
  {
    if (entry.first != Joint::LeftThumb && entry.first != Joint::RightThumb)
    {
      rotations[entry.first] = EulerZXY::identity();
    }
  }

  const InverseSolver solver{makeNullLogger()};
  const JointCoordinates result = solver.solve(rotations, tPoseSkeleton());

  ASSERT_EQ(result.size(), rotations.size());
  for (const auto& [joint, positions] : result)
  {
    SCOPED_TRACE(jointName(joint));
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_TRUE(coordinatesEqual(positions.front(), pose.at(joint).position, 1e-12));
  }
}

TEST(InverseSolverTest, MissingAncestorRotationsCountAsIdentity)
{
  const InverseSolver solver{makeNullLogger()};
  const JointCoordinates result =
    solver.solve(identityFor({Joint::LeftWrist}), tPoseSkeleton());

  ASSERT_TRUE(result.contains(Joint::LeftWrist));
  EXPECT_TRUE(coordinatesEqual(result.at(Joint::LeftWrist).front(),
                               Eigen::Vector3d{-0.8, 0.5, 0.0}));
}

TEST(InverseSolverTest, AncestorRotationsCompose)
{
  FrameRotations rotations = identityFor({Joint::LeftElbow, Joint::LeftWrist});
  rotations[Joint::HipCentre] = EulerZXY{0.0, 0.0, M_PI / 2.0};
  rotations[Joint::LeftShoulder] = EulerZXY{-M_PI / 2.0, 0.0, 0.0};

  const InverseSolver solver{makeNullLogger()};
  const JointCoordinates result = solver.solve(rotations, tPoseSkeleton());

  // The root turns about the vertical to face +X, so the left shoulder offset
  // (-0.2, 0, 0) becomes (0, 0, 0.2). The shoulder's own rotation then points
  // the upper arm straight up.
  const Eigen::Matrix3d root = Rotation::aboutY(M_PI / 2.0);
  const Eigen::Matrix3d shoulder = Rotation::aboutZ(-M_PI / 2.0);
  const Eigen::Vector3d shoulderPos =
    Eigen::Vector3d{0.0, 0.5, 0.0} + root * Eigen::Vector3d{-0.2, 0.0, 0.0};
  const Eigen::Vector3d elbowPos =
    shoulderPos + root * shoulder * Eigen::Vector3d{-0.3, 0.0, 0.0};
  const Eigen::Vector3d wristPos =
    elbowPos + root * shoulder * Eigen::Vector3d{-0.3, 0.0, 0.0};

  EXPECT_TRUE(coordinatesEqual(result.at(Joint::LeftElbow).front(), elbowPos));
  EXPECT_TRUE(coordinatesEqual(result.at(Joint::LeftWrist).front(), wristPos));
  EXPECT_TRUE(coordinatesEqual(result.at(Joint::LeftShoulder).front(), shoulderPos));
}

TEST(InverseSolverTest, JointWithoutBaseOffsetIsSkipped)
{
  BaseSkeleton skeleton = tPoseSkeleton();
  skeleton.erase(Joint::LeftElbow);

  const InverseSolver solver{makeNullLogger()};
  const JointCoordinates result = solver.solve(
    identityFor({Joint::LeftElbow, Joint::LeftWrist, Joint::RightWrist}), skeleton);

  EXPECT_FALSE(result.contains(Joint::LeftElbow));
  EXPECT_FALSE(result.contains(Joint::LeftWrist));
  EXPECT_TRUE(result.contains(Joint::RightWrist));
}

TEST(InverseSolverTest, NonFiniteRotationSkipsDependentJointsOnly)
{
  FrameRotations rotations =
    identityFor({Joint::LeftElbow, Joint::LeftWrist, Joint::RightElbow, Joint::LeftShoulder});
  rotations[Joint::LeftElbow] =
    EulerZXY{std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0};

  const InverseSolver solver{makeNullLogger()};
  const JointCoordinates result = solver.solve(rotations, tPoseSkeleton());

  // The elbow's own position only depends on its ancestors
  EXPECT_TRUE(result.contains(Joint::LeftElbow));
  EXPECT_FALSE(result.contains(Joint::LeftWrist));
  EXPECT_TRUE(result.contains(Joint::RightElbow));
  EXPECT_TRUE(result.contains(Joint::LeftShoulder));
}

TEST(InverseSolverTest, ChainRotationThrowsOnNonFinite)
{
  FrameRotations rotations;
  rotations[Joint::Neck] =
    EulerZXY{0.0, std::numeric_limits<double>::infinity(), 0.0};

  EXPECT_THROW(
    static_cast<void>(InverseSolver::chainRotation(
      SkeletonModel::ancestorChain(Joint::LeftShoulder), rotations)),
    std::invalid_argument);
}

TEST(InverseSolverTest, ChainRotationOrderIsRootFirst)
{
  FrameRotations rotations;
  rotations[Joint::HipCentre] = EulerZXY{0.3, 0.0, 0.0};
  rotations[Joint::Neck] = EulerZXY{0.0, 0.5, 0.0};
  rotations[Joint::LeftShoulder] = EulerZXY{0.0, 0.0, 0.7};

  const Eigen::Matrix3d expected = Rotation::composeZXY(rotations[Joint::HipCentre]) *
                                   Rotation::composeZXY(rotations[Joint::Neck]) *
                                   Rotation::composeZXY(rotations[Joint::LeftShoulder]);

  EXPECT_TRUE(matricesEqual(
    InverseSolver::chainRotation(SkeletonModel::ancestorChain(Joint::LeftElbow),
                                 rotations),
    expected));
}
