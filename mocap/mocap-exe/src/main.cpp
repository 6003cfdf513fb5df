// Ticket: 0011_mocap_exe

#include <cstddef>
#include <exception>
#include <iostream>
#include <map>
#include <string>

#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "mocap-exe/src/FrameFileReader.hpp"
#include "mocap-kin/src/Kinematics/KinematicsSolver.hpp"
#include "mocap-kin/src/Utils/Logging.hpp"

namespace po = boost::program_options;

namespace
{

void printFrame(std::size_t index,
                const mocap_kin::KinematicsSolver& solver,
                const std::map<std::string, mocap_kin::JointQuaternion>& quaternions,
                bool printPositions)
{
  fmt::print("frame {}\n", index);
  if (quaternions.empty())
  {
    fmt::print("  insufficient data\n");
    return;
  }

  for (const auto& [name, quat] : quaternions)
  {
    fmt::print("  {:<14} q={:.5f} vis={:.2f}\n", name, quat, quat.visibility());
  }

  if (!printPositions)
  {
    return;
  }

  for (const auto& [joint, positions] : solver.inverse(solver.frameRotations()))
  {
    for (const auto& position : positions)
    {
      fmt::print("  {:<14} p={:.5f}\n", joint, position);
    }
  }
}

}  // namespace

int main(int argc, char* argv[])
{
  std::string inputPath;
  mocap_kin::KinematicsSolver::Config config;
  bool noWrists = false;
  bool noPositions = false;
  bool verbose = false;

  po::options_description desc("mocap-exe: solve joint recordings into rotations");
  desc.add_options()
    ("help,h", "Show this help")
    ("input,i", po::value<std::string>(&inputPath)->required(),
     "Frame file: '<joint> <x> <y> <z> [visibility [presence]]' per line, "
     "blank line between frames")
    ("history,n", po::value<std::size_t>(&config.boneLengthHistory)->default_value(1),
     "Bone-length median window in frames")
    ("no-wrists", po::bool_switch(&noWrists),
     "Disable thumb/index wrist refinement")
    ("absolute,a", po::bool_switch(&config.absoluteInverse),
     "Reconstruct world positions instead of root-relative ones")
    ("no-positions", po::bool_switch(&noPositions),
     "Print quaternions only")
    ("verbose,v", po::bool_switch(&verbose),
     "Log per-frame solver stages");

  po::positional_options_description positional;
  positional.add("input", 1);

  po::variables_map vm;
  try
  {
    po::store(po::command_line_parser(argc, argv)
                .options(desc)
                .positional(positional)
                .run(),
              vm);
    if (vm.count("help") != 0u)
    {
      std::cout << desc << '\n';
      return 0;
    }
    po::notify(vm);
  }
  catch (const po::error& e)
  {
    std::cerr << "Error: " << e.what() << "\n\n" << desc << '\n';
    return 1;
  }

  config.refineWrists = !noWrists;

  auto logger = mocap_kin::getOrCreateLogger();
  if (verbose)
  {
    logger->set_level(spdlog::level::debug);
  }

  try
  {
    const auto frames = mocap_exe::FrameFileReader::read(inputPath);
    logger->info("Read {} frames from {}", frames.size(), inputPath);

    mocap_kin::KinematicsSolver solver{config, logger};
    for (std::size_t i = 0; i < frames.size(); ++i)
    {
      const auto quaternions = solver.forward(frames[i]);
      printFrame(i, solver, quaternions, !noPositions);
    }
  }
  catch (const std::exception& e)
  {
    logger->error("{}", e.what());
    return 1;
  }

  return 0;
}
