// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace liveprobe {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Owns one logger per component ("default", "probe", "app"), all sharing
 * the same sinks. Console output is colourised; an optional rotating file
 * sink can be added at initialization.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Only the first call
   * performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "liveprobe.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("default", "probe", "app")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  // Names accepted by SetComponentLevel()
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace liveprobe

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  liveprobe::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  liveprobe::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  liveprobe::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  liveprobe::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  liveprobe::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_PROBE_TRACE(...)                                                   \
  liveprobe::util::LogManager::GetLogger("probe")->trace(__VA_ARGS__)
#define LOG_PROBE_DEBUG(...)                                                   \
  liveprobe::util::LogManager::GetLogger("probe")->debug(__VA_ARGS__)
#define LOG_PROBE_INFO(...)                                                    \
  liveprobe::util::LogManager::GetLogger("probe")->info(__VA_ARGS__)
#define LOG_PROBE_WARN(...)                                                    \
  liveprobe::util::LogManager::GetLogger("probe")->warn(__VA_ARGS__)
#define LOG_PROBE_ERROR(...)                                                   \
  liveprobe::util::LogManager::GetLogger("probe")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  liveprobe::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  liveprobe::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  liveprobe::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  liveprobe::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
