// Ticket: 0011_mocap_exe

#ifndef MOCAP_EXE_FRAME_FILE_READER_HPP
#define MOCAP_EXE_FRAME_FILE_READER_HPP

#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "mocap-kin/src/Kinematics/KinematicTypes.hpp"

namespace mocap_exe
{

/// One frame as read from disk, keyed by joint wire name
using NamedFrame = std::map<std::string, mocap_kin::JointInput>;

/**
 * @brief Reader for plain-text joint recordings
 *
 * Format, one joint per line:
 *
 *     <jointName> <x> <y> <z> [visibility [presence]]
 *
 * Frames are separated by one or more blank lines. Lines starting with '#'
 * are comments. Visibility defaults to 1, presence defaults to the
 * visibility. Coordinates may be "nan" or "inf"; the solver drops those
 * joints. Names outside the solver vocabulary are kept and ignored later.
 */
class FrameFileReader
{
public:
  /**
   * @brief Parse every frame of a stream
   * @throws std::runtime_error on a malformed line or a joint listed twice in
   * the same frame
   */
  static std::vector<NamedFrame> parse(std::istream& input);

  /**
   * @brief Open and parse a recording
   * @throws std::runtime_error if the file cannot be opened or is malformed
   */
  static std::vector<NamedFrame> read(const std::filesystem::path& path);

private:
  static std::pair<std::string, mocap_kin::JointInput> parseLine(
    const std::string& line,
    std::size_t lineNumber);
};

}  // namespace mocap_exe

#endif  // MOCAP_EXE_FRAME_FILE_READER_HPP
