// Ticket: 0005_bone_lengths

#include "mocap-kin/src/Kinematics/BoneLengthEstimator.hpp"

#include <algorithm>
#include <stdexcept>

#include "mocap-kin/src/Skeleton/SkeletonModel.hpp"

namespace mocap_kin
{

BoneLengthEstimator::BoneLengthEstimator(Config config) : config_{config}
{
  if (config_.historySize == 0)
  {
    throw std::invalid_argument(
      "BoneLengthEstimator: historySize must be at least 1");
  }
}

BoneLengths BoneLengthEstimator::update(const JointFrame& frame)
{
  BoneLengths lengths;

  for (Joint joint : allJoints())
  {
    const auto parent = SkeletonModel::parentOf(joint);
    if (!parent)
    {
      continue;
    }

    auto jointIt = frame.find(joint);
    auto parentIt = frame.find(*parent);
    if (jointIt == frame.end() || parentIt == frame.end())
    {
      continue;
    }

    const double length =
      (jointIt->second.position - parentIt->second.position).norm();

    auto& samples = history_[joint];
    samples.push_back(length);
    while (samples.size() > config_.historySize)
    {
      samples.pop_front();
    }

    lengths[joint] = median(samples);
  }

  return lengths;
}

void BoneLengthEstimator::reset()
{
  history_.clear();
}

double BoneLengthEstimator::median(std::deque<double> samples)
{
  if (samples.empty())
  {
    throw std::invalid_argument("BoneLengthEstimator::median: no samples");
  }

  const std::size_t mid = samples.size() / 2;
  std::nth_element(samples.begin(), samples.begin() + mid, samples.end());
  const double upper = samples[mid];
  if (samples.size() % 2 == 1)
  {
    return upper;
  }

  const double lower = *std::max_element(samples.begin(), samples.begin() + mid);
  return (lower + upper) / 2.0;
}

}  // namespace mocap_kin
