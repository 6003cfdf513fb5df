#ifndef MOCAP_KIN_LOGGING_HPP
#define MOCAP_KIN_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace mocap_kin
{

/// Name of the logger shared by all solver instances unless one is injected
inline constexpr const char* kDefaultLoggerName = "mocap-kin";

/**
 * @brief Get a colored stdout logger by name, creating it on first use
 *
 * spdlog keeps a global registry of named loggers, so every solver instance
 * that asks for the same name gets the same (thread-safe) logger.
 *
 * @param name Logger name to look up or create
 * @return Shared pointer to the logger, never null
 */
std::shared_ptr<spdlog::logger> getOrCreateLogger(
  const std::string& name = kDefaultLoggerName);

/**
 * @brief Build a logger that discards everything
 *
 * Not registered with spdlog. Used by tests and benchmarks.
 */
std::shared_ptr<spdlog::logger> makeNullLogger(
  const std::string& name = "mocap-kin-null");

}  // namespace mocap_kin

#endif  // MOCAP_KIN_LOGGING_HPP
