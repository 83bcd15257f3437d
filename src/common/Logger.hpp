#pragma once

#include "common/Config.hpp"

#include <string>

namespace Pancake {
class Logger {
public:
  enum class Level { Debug, Info, Warn, Error, Off };

  static void Init(const std::string &log_file = default_log_file,
                   Level level = Level::Info);
  static void SetLevel(Level level);
  static void Shutdown();

  static void Info(const char *file, int line, const std::string &msg);
  static void Warn(const char *file, int line, const std::string &msg);
  static void Error(const char *file, int line, const std::string &msg);
  static void Debug(const char *file, int line, const std::string &msg);
};
} // namespace Pancake

#include "fmt/format.h"

#define LOG_INFO(...)                                                          \
  Pancake::Logger::Info(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_WARN(...)                                                          \
  Pancake::Logger::Warn(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_ERROR(...)                                                         \
  Pancake::Logger::Error(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_DEBUG(...)                                                         \
  Pancake::Logger::Debug(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
