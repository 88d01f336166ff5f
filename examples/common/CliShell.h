#pragma once

#include <Arduino.h>

namespace cli_shell {

static constexpr unsigned kMaxLineLength = 128;

/// Non-blocking line reader. Returns true once a complete, non-empty line is available.
inline bool readLine(String& outLine) {
  static String buffer;
  while (Serial.available() > 0) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\r' || c == '\n') {
      if (buffer.length() == 0) {
        continue;
      }
      outLine = buffer;
      buffer = "";
      outLine.trim();
      return true;
    }
    if (buffer.length() < kMaxLineLength) {
      buffer += c;
    }
  }
  return false;
}

}  // namespace cli_shell
