/**
 * @file log.cpp
 * @brief Logging implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace capulin
{

namespace
{

const char* level_name(LogLevel level)
{
  switch (level)
  {
    case LTrace:
      return "trace";
    case LDebug:
      return "debug";
    case LInfo:
      return "info";
    case LWarn:
      return "warn";
    case LError:
      return "error";
    default:
      return "log";
  }
}

void stderr_sink(void*, LogLevel level, const char* message)
{
  std::fprintf(stderr, "[capulin %s] %s\n", level_name(level), message);
}

std::mutex sink_mutex;
LogSinkFn sink_fn = stderr_sink;
void* sink_user = nullptr;
std::atomic<LogLevel> min_level{LInfo};

}  // namespace

void set_log_sink(LogSinkFn sink, void* user)
{
  std::lock_guard<std::mutex> lock(sink_mutex);
  sink_fn = sink ? sink : stderr_sink;
  sink_user = sink ? user : nullptr;
}

void set_log_level(LogLevel level)
{
  min_level.store(level);
}

LogLevel log_level()
{
  return min_level.load();
}

namespace internal
{

void log_message(LogLevel level, const char* format, ...)
{
  char message[512];

  va_list args;
  va_start(args, format);
  std::vsnprintf(message, sizeof(message), format, args);
  va_end(args);

  std::lock_guard<std::mutex> lock(sink_mutex);
  sink_fn(sink_user, level, message);
}

}  // namespace internal
}  // namespace capulin
