/**
 * @file log.hpp
 * @brief Logging macros (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include "capulin/log.hpp"

namespace capulin
{
namespace internal
{

/**
 * @brief Format and forward a message to the installed sink
 *
 * @param level  Severity
 * @param format printf style format string
 */
void log_message(LogLevel level, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}  // namespace internal
}  // namespace capulin

#define CAPULIN_LOG(LEVEL, ...)                                \
  {                                                            \
    if (LEVEL >= ::capulin::log_level())                       \
      ::capulin::internal::log_message(LEVEL, __VA_ARGS__);    \
  }
