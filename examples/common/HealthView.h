#pragma once

#include <Arduino.h>

#include "Log.h"

template <typename DriverT>
inline void printHealthView(const DriverT& driver) {
  Serial.printf("%sstate=%d online=%s failures=%u totalFail=%lu totalOk=%lu%s\n",
                LOG_COLOR_STATE(driver.isOnline(), driver.consecutiveFailures()),
                static_cast<int>(driver.state()), log_bool_str(driver.isOnline()),
                static_cast<unsigned>(driver.consecutiveFailures()),
                static_cast<unsigned long>(driver.totalFailures()),
                static_cast<unsigned long>(driver.totalSuccess()),
                LOG_COLOR_RESET);
}
