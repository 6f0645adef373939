// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace overlay {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the library.
 *
 * Thread-safety: All methods are thread-safe. Initialize() takes effect
 * once until Shutdown(); after Shutdown() it may be called again with a new
 * configuration. Logger access is protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "discovery.log");

  // Shutdown logging system (flushes buffers).
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for specific component ("default", "discovery").
  // Unknown components map to the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace overlay

// Convenience macros for logging
#define LOG_TRACE(...) overlay::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) overlay::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) overlay::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) overlay::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) overlay::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_DISC_TRACE(...) overlay::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...) overlay::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...) overlay::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...) overlay::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...) overlay::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)
