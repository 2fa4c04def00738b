// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace nvr {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * All loggers write to stderr. stdout is reserved for command output
 * (--serverlist, --remote-expr), so nothing diagnostic may end up there.
 *
 * Initialization is performed exactly once using std::call_once. Logger
 * access is protected by a mutex.
 */
class LogManager {
public:
  // Initialize logging with the specified minimum log level.
  // Only the first call performs initialization.
  static void Initialize(const std::string& log_level = "off");

  // Flush and drop all loggers. Subsequent logging calls auto-reinitialize.
  static void Shutdown();

  // Get logger for a specific component ("default", "rpc", "cli").
  // Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // True if level names one of spdlog's levels (trace, debug, info, warn, error, critical, off).
  static bool IsValidLevel(const std::string& level);
};

}  // namespace util
}  // namespace nvr

#define LOG_TRACE(...) nvr::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) nvr::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) nvr::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) nvr::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) nvr::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_RPC_TRACE(...) nvr::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...) nvr::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...) nvr::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...) nvr::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...) nvr::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#define LOG_CLI_TRACE(...) nvr::util::LogManager::GetLogger("cli")->trace(__VA_ARGS__)
#define LOG_CLI_DEBUG(...) nvr::util::LogManager::GetLogger("cli")->debug(__VA_ARGS__)
#define LOG_CLI_INFO(...) nvr::util::LogManager::GetLogger("cli")->info(__VA_ARGS__)
#define LOG_CLI_WARN(...) nvr::util::LogManager::GetLogger("cli")->warn(__VA_ARGS__)
#define LOG_CLI_ERROR(...) nvr::util::LogManager::GetLogger("cli")->error(__VA_ARGS__)
