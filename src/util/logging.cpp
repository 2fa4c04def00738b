// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <map>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace nvr {
namespace util {

namespace {

constexpr std::array<const char*, 3> kComponents = {"default", "rpc", "cli"};

std::once_flag g_init_flag;
std::mutex g_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

spdlog::level::level_enum ParseLevel(const std::string& level) {
  // spdlog::level::from_str returns off for unknown names
  return spdlog::level::from_str(level);
}

// Caller holds g_mutex
void CreateLoggers(spdlog::level::level_enum level) {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  sink->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");

  for (const char* name : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    g_loggers[name] = logger;
  }
}

}  // namespace

void LogManager::Initialize(const std::string& log_level) {
  std::call_once(g_init_flag, [&log_level]() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_loggers.empty()) {
      CreateLoggers(ParseLevel(log_level));
    }
  });
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  for (auto& [name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string& name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_loggers.empty()) {
    CreateLoggers(spdlog::level::off);
  }

  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string& level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_loggers.empty()) {
    CreateLoggers(ParseLevel(level));
    return;
  }
  auto parsed = ParseLevel(level);
  for (auto& [name, logger] : g_loggers) {
    logger->set_level(parsed);
  }
}

bool LogManager::IsValidLevel(const std::string& level) {
  if (level == "off") {
    return true;
  }
  return spdlog::level::from_str(level) != spdlog::level::off;
}

}  // namespace util
}  // namespace nvr
