/**
 * @file tpose_example.cpp
 * @brief Example solving a posed skeleton into joint rotations and back
 */

#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "mocap-kin/src/Kinematics/KinematicsSolver.hpp"
#include "mocap-kin/src/Math/Rotation.hpp"

using namespace mocap_kin;

int main()
{
  // Example 1: A standing figure with the left elbow bent forward
  JointFrame frame;
  auto put = [&frame](Joint joint, double x, double y, double z)
  { frame[joint] = JointPosition{Coordinate{x, y, z}, 0.95}; };

  put(Joint::LeftHip, -0.1, 0.0, 0.0);
  put(Joint::LeftKnee, -0.1, -0.45, 0.0);
  put(Joint::LeftAnkle, -0.1, -0.9, 0.0);
  put(Joint::RightHip, 0.1, 0.0, 0.0);
  put(Joint::RightKnee, 0.1, -0.45, 0.0);
  put(Joint::RightAnkle, 0.1, -0.9, 0.0);
  put(Joint::LeftShoulder, -0.2, 0.5, 0.0);
  put(Joint::LeftElbow, -0.5, 0.5, 0.0);
  put(Joint::LeftWrist, -0.5, 0.5, 0.3);
  put(Joint::RightShoulder, 0.2, 0.5, 0.0);
  put(Joint::RightElbow, 0.5, 0.5, 0.0);
  put(Joint::RightWrist, 0.8, 0.5, 0.0);

  KinematicsSolver::Config config;
  config.absoluteInverse = true;
  KinematicsSolver solver{config};

  // hipCentre and neck are derived from the hips and shoulders
  const JointQuaternions quaternions = solver.forward(frame);
  spdlog::info("Solved {} joint rotations", quaternions.size());

  for (const auto& [joint, quat] : quaternions)
  {
    fmt::print("{:<14} euler={:.3f}  quat={:.4f}\n",
               joint,
               solver.frameRotations().at(joint),
               quat);
  }

  // Example 2: Bone lengths and the rest pose used for reconstruction
  for (const auto& [joint, length] : solver.boneLengths())
  {
    fmt::print("{:<14} bone length {:.3f}\n", joint, length);
  }

  // Example 3: Reconstruct positions from the solved rotations
  const JointCoordinates positions = solver.inverse(solver.frameRotations());
  for (const auto& [joint, samples] : positions)
  {
    fmt::print("{:<14} position {:.3f}\n", joint, samples.front());
  }

  // Example 4: Turn the whole figure a quarter turn about the vertical axis
  JointFrame turned;
  const Eigen::Matrix3d turn = Rotation::aboutY(M_PI / 2.0);
  for (const auto& [joint, sample] : frame)
  {
    turned[joint] = JointPosition{Coordinate{turn * sample.position}, sample.visibility};
  }
  solver.forward(turned);

  // Only the root changes; its vertical component is the y entry
  spdlog::info("Root rotation after turning: {:.3f}",
               solver.frameRotations().at(kRootJoint));

  return 0;
}
