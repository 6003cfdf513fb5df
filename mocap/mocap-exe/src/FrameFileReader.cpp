// Ticket: 0011_mocap_exe

#include "mocap-exe/src/FrameFileReader.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace mocap_exe
{

namespace
{

bool isBlank(const std::string& line)
{
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

// strtod accepts "nan" and "inf", which operator>> does not
double parseNumber(const std::string& token,
                   std::size_t lineNumber,
                   std::string_view field)
{
  const char* begin = token.c_str();
  char* end = nullptr;
  errno = 0;
  const double value = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || errno == ERANGE)
  {
    throw std::runtime_error(fmt::format(
      "line {}: invalid {} value '{}'", lineNumber, field, token));
  }
  return value;
}

}  // namespace

std::vector<NamedFrame> FrameFileReader::parse(std::istream& input)
{
  std::vector<NamedFrame> frames;
  NamedFrame current;
  std::string line;
  std::size_t lineNumber = 0;

  while (std::getline(input, line))
  {
    ++lineNumber;
    if (isBlank(line))
    {
      if (!current.empty())
      {
        frames.push_back(std::move(current));
        current.clear();
      }
      continue;
    }

    const auto first = line.find_first_not_of(" \t");
    if (line[first] == '#')
    {
      continue;
    }

    auto [name, sample] = parseLine(line, lineNumber);
    if (!current.emplace(name, sample).second)
    {
      throw std::runtime_error(fmt::format(
        "line {}: joint '{}' listed twice in one frame", lineNumber, name));
    }
  }

  if (!current.empty())
  {
    frames.push_back(std::move(current));
  }
  return frames;
}

std::vector<NamedFrame> FrameFileReader::read(const std::filesystem::path& path)
{
  std::ifstream file{path};
  if (!file)
  {
    throw std::runtime_error(
      fmt::format("cannot open frame file '{}'", path.string()));
  }
  return parse(file);
}

std::pair<std::string, mocap_kin::JointInput> FrameFileReader::parseLine(
  const std::string& line,
  std::size_t lineNumber)
{
  std::istringstream fields{line};
  std::vector<std::string> tokens;
  std::string token;
  while (fields >> token)
  {
    tokens.push_back(token);
  }

  if (tokens.size() < 4 || tokens.size() > 6)
  {
    throw std::runtime_error(fmt::format(
      "line {}: expected '<joint> <x> <y> <z> [visibility [presence]]', got {} "
      "fields",
      lineNumber,
      tokens.size()));
  }

  mocap_kin::JointInput sample;
  sample.x = parseNumber(tokens[1], lineNumber, "x");
  sample.y = parseNumber(tokens[2], lineNumber, "y");
  sample.z = parseNumber(tokens[3], lineNumber, "z");
  sample.visibility =
    tokens.size() > 4 ? parseNumber(tokens[4], lineNumber, "visibility") : 1.0;
  sample.presence = tokens.size() > 5
                      ? parseNumber(tokens[5], lineNumber, "presence")
                      : sample.visibility;

  return {tokens[0], sample};
}

}  // namespace mocap_exe
