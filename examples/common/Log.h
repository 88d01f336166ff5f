/**
 * @file Log.h
 * @brief Serial logging macros for RX8010SJ examples.
 *
 * NOT part of the library API. The library itself never logs; it returns Status.
 */

#pragma once

#include <Arduino.h>

// ANSI colours (disable with -DLOG_NO_COLOR for plain terminals)
#ifndef LOG_NO_COLOR
#define LOG_COLOR_RESET  "\033[0m"
#define LOG_COLOR_RED    "\033[31m"
#define LOG_COLOR_GREEN  "\033[32m"
#define LOG_COLOR_YELLOW "\033[33m"
#define LOG_COLOR_CYAN   "\033[36m"
#else
#define LOG_COLOR_RESET  ""
#define LOG_COLOR_RED    ""
#define LOG_COLOR_GREEN  ""
#define LOG_COLOR_YELLOW ""
#define LOG_COLOR_CYAN   ""
#endif

/// Green on success, red on failure
#define LOG_COLOR_RESULT(ok) ((ok) ? LOG_COLOR_GREEN : LOG_COLOR_RED)

/// Green when healthy, yellow when degraded, red when offline
#define LOG_COLOR_STATE(online, failures) \
  (!(online) ? LOG_COLOR_RED : ((failures) > 0 ? LOG_COLOR_YELLOW : LOG_COLOR_GREEN))

#define LOGI(fmt, ...) \
  Serial.printf("%s[I]%s " fmt "\n", LOG_COLOR_GREEN, LOG_COLOR_RESET, ##__VA_ARGS__)
#define LOGW(fmt, ...) \
  Serial.printf("%s[W]%s " fmt "\n", LOG_COLOR_YELLOW, LOG_COLOR_RESET, ##__VA_ARGS__)
#define LOGE(fmt, ...) \
  Serial.printf("%s[E]%s " fmt "\n", LOG_COLOR_RED, LOG_COLOR_RESET, ##__VA_ARGS__)

inline const char* log_bool_str(bool value) {
  return value ? "true" : "false";
}
