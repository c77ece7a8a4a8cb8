/**
 * @file log.hpp
 * @brief Diagnostic output of the board driver
 *
 * Messages go to stderr unless the application installs its own sink.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

namespace capulin
{

enum LogLevel : char
{
  LTrace,
  LDebug,
  LInfo,
  LWarn,
  LError,
  LMaxLevel
};

/**
 * @brief Log sink callback function type
 *
 * @param user    User context pointer passed to set_log_sink
 * @param level   Severity of the message
 * @param message Formatted message, without trailing newline
 */
using LogSinkFn = void (*)(void* user, LogLevel level, const char* message);

/**
 * @brief Route messages to a custom sink
 *
 * @param sink Callback, or nullptr to restore the stderr sink
 * @param user User context pointer passed to the callback
 */
void set_log_sink(LogSinkFn sink, void* user = nullptr);

/**
 * @brief Drop messages below a level
 *
 * @param level Minimum level that is forwarded to the sink (default LInfo)
 */
void set_log_level(LogLevel level);

LogLevel log_level();

}  // namespace capulin
