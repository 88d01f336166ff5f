/**
 * @file I2cTransport.h
 * @brief Wire-based I2C transport adapter for RX8010SJ examples.
 *
 * Bridges Arduino TwoWire to the driver's transport callbacks. The
 * endTransmission() result is kept in Status::detail so callers see the
 * native Wire error number.
 *
 * NOT part of the library API. Example-only.
 */

#pragma once

#include <Arduino.h>
#include <Wire.h>

#include "RX8010SJ/Status.h"

namespace transport {

namespace detail {

inline RX8010SJ::Status mapWireResult(uint8_t result) {
  switch (result) {
    case 0:
      return RX8010SJ::Status::Ok();
    case 1:
      return RX8010SJ::Status::Error(RX8010SJ::Err::I2C_ERROR, "I2C data too long", result);
    case 2:
      return RX8010SJ::Status::Error(RX8010SJ::Err::I2C_ERROR, "I2C address NACK", result);
    case 3:
      return RX8010SJ::Status::Error(RX8010SJ::Err::I2C_ERROR, "I2C data NACK", result);
    case 4:
      return RX8010SJ::Status::Error(RX8010SJ::Err::I2C_ERROR, "I2C bus error", result);
    case 5:
      return RX8010SJ::Status::Error(RX8010SJ::Err::TIMEOUT, "I2C timeout", result);
    default:
      return RX8010SJ::Status::Error(RX8010SJ::Err::I2C_ERROR, "I2C unknown error", result);
  }
}

inline void applyTimeout(TwoWire* wire, uint32_t timeoutMs) {
#if defined(ARDUINO_ARCH_ESP32)
  wire->setTimeOut(static_cast<uint16_t>(timeoutMs));
#else
  (void)wire;
  (void)timeoutMs;
#endif
}

}  // namespace detail

/**
 * @brief Wire-based I2C write implementation.
 *
 * Pass to Config::i2cWrite, and pass &Wire (or custom TwoWire*) to i2cUser.
 */
inline RX8010SJ::Status wireWrite(uint8_t addr, const uint8_t* data, size_t len,
                                  uint32_t timeoutMs, void* user) {
  TwoWire* wire = static_cast<TwoWire*>(user);
  if (wire == nullptr) {
    return RX8010SJ::Status::Error(RX8010SJ::Err::INVALID_CONFIG, "Wire instance is null");
  }
  if (!data || len == 0) {
    return RX8010SJ::Status::Error(RX8010SJ::Err::INVALID_PARAM, "Invalid I2C write params");
  }

  detail::applyTimeout(wire, timeoutMs);

  wire->beginTransmission(addr);
  size_t written = wire->write(data, len);
  if (written != len) {
    // Still end the transaction so the bus is released
    wire->endTransmission(true);
    return RX8010SJ::Status::Error(RX8010SJ::Err::I2C_ERROR, "I2C write incomplete",
                                   static_cast<int32_t>(written));
  }

  return detail::mapWireResult(wire->endTransmission(true));
}

/**
 * @brief Wire-based I2C write-read implementation (repeated start).
 *
 * Pass to Config::i2cWriteRead, and pass &Wire (or custom TwoWire*) to i2cUser.
 */
inline RX8010SJ::Status wireWriteRead(uint8_t addr, const uint8_t* tx, size_t txLen,
                                      uint8_t* rx, size_t rxLen, uint32_t timeoutMs,
                                      void* user) {
  TwoWire* wire = static_cast<TwoWire*>(user);
  if (wire == nullptr) {
    return RX8010SJ::Status::Error(RX8010SJ::Err::INVALID_CONFIG, "Wire instance is null");
  }
  if (!tx || txLen == 0 || !rx || rxLen == 0) {
    return RX8010SJ::Status::Error(RX8010SJ::Err::INVALID_PARAM, "Invalid I2C read params");
  }
  if (rxLen > 128) {
    return RX8010SJ::Status::Error(RX8010SJ::Err::INVALID_PARAM, "I2C read exceeds buffer",
                                   static_cast<int32_t>(rxLen));
  }

  detail::applyTimeout(wire, timeoutMs);

  wire->beginTransmission(addr);
  wire->write(tx, txLen);
  RX8010SJ::Status st = detail::mapWireResult(wire->endTransmission(false));
  if (!st.ok()) {
    return st;
  }

  size_t read = wire->requestFrom(addr, static_cast<uint8_t>(rxLen));
  if (read != rxLen) {
    return RX8010SJ::Status::Error(RX8010SJ::Err::I2C_ERROR, "I2C read length mismatch",
                                   static_cast<int32_t>(read));
  }

  for (size_t i = 0; i < rxLen; ++i) {
    if (!wire->available()) {
      return RX8010SJ::Status::Error(RX8010SJ::Err::I2C_ERROR, "I2C data not available");
    }
    rx[i] = static_cast<uint8_t>(wire->read());
  }

  return RX8010SJ::Status::Ok();
}

/// @brief millis() adapter for Config::nowMs.
inline uint32_t arduinoNowMs(void*) {
  return millis();
}

}  // namespace transport
