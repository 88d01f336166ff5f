/**
 * @file Config.h
 * @brief Configuration for RX8010SJ RTC library
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Status.h"

namespace RX8010SJ {

/// @brief I2C write callback signature.
/// @note data[0] is the register pointer, the payload follows.
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// @brief I2C write-read callback signature (repeated start between legs).
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* tx, size_t txLen,
                                  uint8_t* rx, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/// @brief Optional millisecond clock used for health timestamps.
using NowMsFn = uint32_t (*)(void* user);

/**
 * @struct Config
 * @brief RTC configuration parameters
 *
 * The I2C bus is owned by the application. The library never initializes,
 * scans or resets the bus; it only issues transactions through the callbacks.
 */
struct Config {
  /// @brief I2C write callback (required).
  I2cWriteFn i2cWrite = nullptr;

  /// @brief I2C write-read callback (required).
  I2cWriteReadFn i2cWriteRead = nullptr;

  /// @brief User context passed to I2C callbacks (e.g., TwoWire*).
  void* i2cUser = nullptr;

  /// @brief 7-bit I2C address (default: 0x32, i.e. 8-bit write address 0x64 >> 1)
  /// @note Valid 7-bit range: 0x08-0x77. Override only when the device sits
  ///       behind an address translator.
  uint8_t i2cAddress = 0x32;

  /// @brief I2C transaction timeout in milliseconds (default: 50ms)
  /// @note Passed to the transport callback. The library never configures the bus.
  uint32_t i2cTimeoutMs = 50;

  /// @brief Year represented by year register value 00 (default: 2000)
  /// @note Applied on both read and write. Representable years are
  ///       yearBase .. yearBase + 99.
  uint16_t yearBase = 2000;

  /// @brief Write register blocks as one multi-byte transaction (default: false)
  /// @note When false, every register of a block is written with its own
  ///       transaction. A bus error part way through leaves the preceding
  ///       registers updated.
  bool burstWrites = false;

  /// @brief Consecutive failure threshold before transitioning to OFFLINE
  /// @note Default: 5. DEGRADED = [1, offlineThreshold-1], OFFLINE >= offlineThreshold.
  ///       Values < 1 are clamped to 1 during begin().
  uint8_t offlineThreshold = 5;

  /// @brief Millisecond clock for lastOkMs()/lastErrorMs() (optional, e.g. millis wrapper).
  NowMsFn nowMs = nullptr;

  /// @brief User context passed to nowMs.
  void* nowMsUser = nullptr;
};

}  // namespace RX8010SJ
