// Ticket: 0011_mocap_exe

#include <gtest/gtest.h>

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

#include "mocap-exe/src/FrameFileReader.hpp"
#include "mocap-kin/src/Kinematics/KinematicsSolver.hpp"
#include "mocap-kin/src/Utils/Logging.hpp"

using namespace mocap_exe;

TEST(FrameFileReaderTest, SplitsFramesOnBlankLines)
{
  std::istringstream input{
    "# two frames\n"
    "hipCentre 0 0 0\n"
    "leftHip -1 0 0 0.5\n"
    "\n"
    "\n"
    "hipCentre 0 0 1 0.9 0.8\n"};

  const auto frames = FrameFileReader::parse(input);

  ASSERT_EQ(frames.size(), 2u);
  ASSERT_EQ(frames[0].size(), 2u);
  EXPECT_DOUBLE_EQ(frames[0].at("leftHip").x, -1.0);
  EXPECT_DOUBLE_EQ(frames[0].at("leftHip").visibility, 0.5);
  EXPECT_DOUBLE_EQ(frames[0].at("leftHip").presence, 0.5);
  EXPECT_DOUBLE_EQ(frames[0].at("hipCentre").visibility, 1.0);

  EXPECT_DOUBLE_EQ(frames[1].at("hipCentre").z, 1.0);
  EXPECT_DOUBLE_EQ(frames[1].at("hipCentre").presence, 0.8);
}

TEST(FrameFileReaderTest, EmptyInputHasNoFrames)
{
  std::istringstream input{"\n# nothing here\n\n"};
  EXPECT_TRUE(FrameFileReader::parse(input).empty());
}

TEST(FrameFileReaderTest, AcceptsNonFiniteCoordinates)
{
  std::istringstream input{"leftWrist nan 0 inf\n"};

  const auto frames = FrameFileReader::parse(input);

  ASSERT_EQ(frames.size(), 1u);
  EXPECT_TRUE(std::isnan(frames[0].at("leftWrist").x));
  EXPECT_TRUE(std::isinf(frames[0].at("leftWrist").z));
}

TEST(FrameFileReaderTest, KeepsUnknownNames)
{
  std::istringstream input{"leftEye 0.1 0.2 0.3\n"};

  const auto frames = FrameFileReader::parse(input);

  ASSERT_EQ(frames.size(), 1u);
  EXPECT_TRUE(frames[0].contains("leftEye"));
}

TEST(FrameFileReaderTest, RejectsMissingFields)
{
  std::istringstream input{"hipCentre 0 0\n"};
  EXPECT_THROW(FrameFileReader::parse(input), std::runtime_error);
}

TEST(FrameFileReaderTest, RejectsTooManyFields)
{
  std::istringstream input{"hipCentre 0 0 0 1 1 1\n"};
  EXPECT_THROW(FrameFileReader::parse(input), std::runtime_error);
}

TEST(FrameFileReaderTest, RejectsNonNumericValue)
{
  std::istringstream input{"hipCentre 0 zero 0\n"};
  EXPECT_THROW(FrameFileReader::parse(input), std::runtime_error);

  std::istringstream trailing{"hipCentre 0 1.5m 0\n"};
  EXPECT_THROW(FrameFileReader::parse(trailing), std::runtime_error);
}

TEST(FrameFileReaderTest, RejectsDuplicateJointInFrame)
{
  std::istringstream input{"neck 0 1 0\nneck 0 1 0\n"};
  EXPECT_THROW(FrameFileReader::parse(input), std::runtime_error);
}

TEST(FrameFileReaderTest, ErrorNamesTheLine)
{
  std::istringstream input{"hipCentre 0 0 0\n\nneck 0 x 0\n"};
  try
  {
    FrameFileReader::parse(input);
    FAIL() << "expected std::runtime_error";
  }
  catch (const std::runtime_error& e)
  {
    EXPECT_NE(std::string{e.what()}.find("line 3"), std::string::npos);
  }
}

TEST(FrameFileReaderTest, MissingFileThrows)
{
  EXPECT_THROW(FrameFileReader::read("/nonexistent/mocap/frames.txt"),
               std::runtime_error);
}

TEST(FrameFileReaderTest, ParsedFrameFeedsSolver)
{
  std::istringstream input{
    "leftHip -1 0 0\n"
    "rightHip 1 0 0\n"
    "leftShoulder -1 1 0\n"
    "rightShoulder 1 1 0\n"};

  const auto frames = FrameFileReader::parse(input);
  ASSERT_EQ(frames.size(), 1u);

  mocap_kin::KinematicsSolver solver{mocap_kin::KinematicsSolver::Config{},
                                     mocap_kin::makeNullLogger()};
  const auto result = solver.forward(frames[0]);

  ASSERT_TRUE(result.contains("hipCentre"));
  EXPECT_NEAR(std::abs(result.at("hipCentre").w()), 1.0, 1e-9);
}
