// Ticket: 0009_kinematics_solver

#include <benchmark/benchmark.h>
#include <random>
#include <vector>
#include "mocap-kin/src/Kinematics/KinematicsSolver.hpp"
#include "mocap-kin/src/Math/Rotation.hpp"
#include "mocap-kin/src/Utils/Logging.hpp"

using namespace mocap_kin;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

JointFrame makeTPose()
{
  JointFrame frame;
  auto put = [&frame](Joint joint, double x, double y, double z)
  { frame[joint] = JointPosition{Coordinate{x, y, z}, 1.0}; };

  put(Joint::HipCentre, 0.0, 0.0, 0.0);
  put(Joint::LeftHip, -0.1, 0.0, 0.0);
  put(Joint::LeftKnee, -0.1, -0.4, 0.0);
  put(Joint::LeftAnkle, -0.1, -0.8, 0.0);
  put(Joint::LeftToe, -0.1, -0.8, 0.1);
  put(Joint::RightHip, 0.1, 0.0, 0.0);
  put(Joint::RightKnee, 0.1, -0.4, 0.0);
  put(Joint::RightAnkle, 0.1, -0.8, 0.0);
  put(Joint::RightToe, 0.1, -0.8, 0.1);
  put(Joint::Neck, 0.0, 0.5, 0.0);
  put(Joint::LeftShoulder, -0.2, 0.5, 0.0);
  put(Joint::LeftElbow, -0.5, 0.5, 0.0);
  put(Joint::LeftWrist, -0.8, 0.5, 0.0);
  put(Joint::LeftIndex, -0.9, 0.5, 0.0);
  put(Joint::LeftThumb, -0.85, 0.5, 0.05);
  put(Joint::RightShoulder, 0.2, 0.5, 0.0);
  put(Joint::RightElbow, 0.5, 0.5, 0.0);
  put(Joint::RightWrist, 0.8, 0.5, 0.0);
  put(Joint::RightIndex, 0.9, 0.5, 0.0);
  put(Joint::RightThumb, 0.85, 0.5, 0.05);
  return frame;
}

// Jittered T-pose frames with fixed seed for reproducibility
std::vector<JointFrame> generateNoisyFrames(std::size_t count, double noise)
{
  static std::mt19937 rng{42};  // Fixed seed for deterministic benchmarks
  std::normal_distribution<double> jitter{0.0, noise};
  std::uniform_real_distribution<double> angle{-0.5, 0.5};

  const JointFrame base = makeTPose();
  std::vector<JointFrame> frames;
  frames.reserve(count);
  for (std::size_t i = 0; i < count; ++i)
  {
    const Eigen::Matrix3d turn =
      Rotation::composeZXY(EulerZXY{angle(rng), angle(rng), angle(rng)});
    JointFrame frame;
    for (const auto& [joint, sample] : base)
    {
      const Eigen::Vector3d offset{jitter(rng), jitter(rng), jitter(rng)};
      frame[joint] =
        JointPosition{Coordinate{turn * sample.position + offset}, sample.visibility};
    }
    frames.push_back(std::move(frame));
  }
  return frames;
}

}  // namespace

// ============================================================================
// Forward Benchmarks
// ============================================================================

/**
 * @brief Full-body forward solve over a stream of jittered frames.
 */
static void BM_KinematicsSolver_Forward(benchmark::State& state)
{
  const auto frames = generateNoisyFrames(256, 0.01);
  KinematicsSolver::Config config;
  config.boneLengthHistory = static_cast<std::size_t>(state.range(0));
  KinematicsSolver solver{config, makeNullLogger()};

  std::size_t i = 0;
  for (auto _ : state)
  {
    auto result = solver.forward(frames[i++ % frames.size()]);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_KinematicsSolver_Forward)
  ->Arg(1)    // Instantaneous bone lengths
  ->Arg(15)   // Half a second at 30 fps
  ->Arg(60);

static void BM_KinematicsSolver_ForwardNoWrists(benchmark::State& state)
{
  const auto frames = generateNoisyFrames(256, 0.01);
  KinematicsSolver::Config config;
  config.refineWrists = false;
  KinematicsSolver solver{config, makeNullLogger()};

  std::size_t i = 0;
  for (auto _ : state)
  {
    auto result = solver.forward(frames[i++ % frames.size()]);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_KinematicsSolver_ForwardNoWrists);

// ============================================================================
// Inverse Benchmarks
// ============================================================================

static void BM_KinematicsSolver_Inverse(benchmark::State& state)
{
  const auto frames = generateNoisyFrames(1, 0.01);
  KinematicsSolver solver{KinematicsSolver::Config{}, makeNullLogger()};
  solver.forward(frames.front());
  const FrameRotations rotations = solver.frameRotations();

  for (auto _ : state)
  {
    auto result = solver.inverse(rotations);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_KinematicsSolver_Inverse);

// ============================================================================
// Conversion Benchmarks
// ============================================================================

static void BM_Rotation_ToQuaternion(benchmark::State& state)
{
  std::mt19937 rng{42};
  std::uniform_real_distribution<double> angle{-3.0, 3.0};
  const EulerZXY euler{angle(rng), angle(rng), angle(rng)};

  for (auto _ : state)
  {
    auto q = Rotation::toQuaternion(euler);
    benchmark::DoNotOptimize(q);
  }
}
BENCHMARK(BM_Rotation_ToQuaternion);

BENCHMARK_MAIN();
