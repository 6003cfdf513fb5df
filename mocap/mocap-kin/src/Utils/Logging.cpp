#include "mocap-kin/src/Utils/Logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace mocap_kin
{

std::shared_ptr<spdlog::logger> getOrCreateLogger(const std::string& name)
{
  if (auto existing = spdlog::get(name))
  {
    return existing;
  }

  try
  {
    auto logger = spdlog::stdout_color_mt(name);
    logger->set_level(spdlog::level::info);
    return logger;
  }
  catch (const spdlog::spdlog_ex&)
  {
    // Another thread registered the same name between get() and creation
    return spdlog::get(name);
  }
}

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name)
{
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>(name, sink);
}

}  // namespace mocap_kin
