// Ticket: 0006_forward_solver

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "mocap-kin/src/Kinematics/ForwardSolver.hpp"
#include "mocap-kin/src/Utils/Logging.hpp"
#include "mocap-kin/test/Fixtures/PoseFixtures.hpp"

using namespace mocap_kin;
using namespace mocap_kin::test;

namespace
{

ForwardSolver makeSolver()
{
  return ForwardSolver{makeNullLogger()};
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(ForwardSolverTest, NullLoggerThrows)
{
  EXPECT_THROW(ForwardSolver{nullptr}, std::invalid_argument);
}

TEST(ForwardSolverTest, MissingRootThrows)
{
  JointFrame frame = makeTPose();
  frame.erase(kRootJoint);

  EXPECT_THROW(static_cast<void>(makeSolver().solve(frame)), std::invalid_argument);
}

// ============================================================================
// Bind Pose
// ============================================================================

TEST(ForwardSolverTest, TPoseIsIdentityEverywhere)
{
  const JointFrame frame = makeTPose();
  const ForwardSolver::Result result = makeSolver().solve(frame);

  ASSERT_TRUE(result.root.has_value());
  EXPECT_EQ(result.rotations.size(), frame.size());
  for (const auto& [joint, euler] : result.rotations)
  {
    SCOPED_TRACE(jointName(joint));
    expectIdentity(euler);
  }
}

TEST(ForwardSolverTest, RootRelativePositions)
{
  const JointFrame frame = transformFrame(
    makeTPose(), Eigen::Matrix3d::Identity(), Eigen::Vector3d{2.0, 1.0, -1.0});
  const ForwardSolver::Result result = makeSolver().solve(frame);

  EXPECT_TRUE(coordinatesEqual(result.rootPosition, Eigen::Vector3d{2.0, 1.0, -1.0}));
  EXPECT_TRUE(coordinatesEqual(result.rootRelative.at(kRootJoint).position,
                               Eigen::Vector3d::Zero()));
  EXPECT_TRUE(coordinatesEqual(result.rootRelative.at(Joint::LeftWrist).position,
                               Eigen::Vector3d{-0.8, 0.5, 0.0}));
  EXPECT_DOUBLE_EQ(result.rootRelative.at(Joint::LeftWrist).visibility, 0.9);
}

// ============================================================================
// Single Joint Rotations
// ============================================================================

TEST(ForwardSolverTest, BentElbowRotatesElbowJoint)
{
  // Left forearm points straight down instead of along -X
  JointFrame frame = makeTPose();
  frame[Joint::LeftWrist].position = Coordinate{-0.5, 0.2, 0.0};
  frame.erase(Joint::LeftIndex);
  frame.erase(Joint::LeftThumb);

  const ForwardSolver::Result result = makeSolver().solve(frame);

  const Eigen::Matrix3d elbow = Rotation::composeZXY(result.rotations.at(Joint::LeftElbow));
  EXPECT_TRUE(coordinatesEqual(elbow * Eigen::Vector3d{-1.0, 0.0, 0.0},
                               Eigen::Vector3d{0.0, -1.0, 0.0}));
  expectIdentity(result.rotations.at(Joint::LeftShoulder));
  expectIdentity(result.rotations.at(Joint::RightElbow));
}

TEST(ForwardSolverTest, ChildDirectionsAreExpressedInParentRestFrame)
{
  // Swing the whole left arm about Z at the shoulder; the shoulder carries the
  // rotation and the elbow stays straight relative to it.
  const Eigen::Matrix3d bend = Rotation::aboutZ(0.5);
  JointFrame frame = makeTPose();
  const Eigen::Vector3d shoulder = frame.at(Joint::LeftShoulder).position;
  for (Joint joint : {Joint::LeftElbow, Joint::LeftWrist})
  {
    frame[joint].position =
      Coordinate{shoulder + bend * (frame.at(joint).position - shoulder)};
  }
  frame.erase(Joint::LeftIndex);
  frame.erase(Joint::LeftThumb);

  const ForwardSolver::Result result = makeSolver().solve(frame);

  EXPECT_TRUE(matricesEqual(
    Rotation::composeZXY(result.rotations.at(Joint::LeftShoulder)), bend));
  expectIdentity(result.rotations.at(Joint::LeftElbow));
}

// ============================================================================
// Partial Data
// ============================================================================

TEST(ForwardSolverTest, BrokenChainGetsIdentity)
{
  JointFrame frame = makeTPose();
  frame[Joint::LeftWrist].position = Coordinate{-0.5, 0.2, 0.0};
  frame.erase(Joint::LeftElbow);

  const ForwardSolver::Result result = makeSolver().solve(frame);

  EXPECT_FALSE(result.rotations.contains(Joint::LeftElbow));
  expectIdentity(result.rotations.at(Joint::LeftShoulder));
  expectIdentity(result.rotations.at(Joint::LeftWrist));

  const auto eligible = ForwardSolver::eligibleJoints(result.rootRelative);
  EXPECT_EQ(std::find(eligible.begin(), eligible.end(), Joint::LeftWrist),
            eligible.end());
}

TEST(ForwardSolverTest, MissingRootFrameUsesIdentityRoot)
{
  JointFrame frame = makeTPose();
  frame.erase(Joint::RightHip);
  frame.erase(Joint::Neck);

  const ForwardSolver::Result result = makeSolver().solve(frame);

  EXPECT_FALSE(result.root.has_value());
  expectIdentity(result.rotations.at(kRootJoint));
}

TEST(ForwardSolverTest, DegenerateBoneGivesIdentity)
{
  JointFrame frame = makeTPose();
  frame[Joint::LeftElbow].position = frame.at(Joint::LeftShoulder).position;

  const ForwardSolver::Result result = makeSolver().solve(frame);

  expectIdentity(result.rotations.at(Joint::LeftShoulder));
  EXPECT_TRUE(result.rotations.at(Joint::LeftElbow).isFinite());
}

// ============================================================================
// Helpers
// ============================================================================

TEST(ForwardSolverTest, InverseAncestorRotationSkipsDirectParent)
{
  FrameRotations rotations;
  rotations[Joint::LeftElbow] = EulerZXY{0.3, 0.2, 0.1};
  rotations[Joint::LeftShoulder] = EulerZXY{0.0, 0.0, 0.7};
  rotations[Joint::HipCentre] = EulerZXY{1.0, 0.0, 0.0};

  const JointChain& chain = SkeletonModel::ancestorChain(Joint::LeftWrist);
  const Eigen::Matrix3d inverse = ForwardSolver::inverseAncestorRotation(chain, rotations);

  // Neck has no rotation and counts as identity
  const Eigen::Matrix3d forward = Rotation::composeZXY(rotations[Joint::HipCentre]) *
                                  Rotation::composeZXY(rotations[Joint::LeftShoulder]);
  EXPECT_TRUE(matricesEqual(inverse * forward, Eigen::Matrix3d::Identity()));
}
