/**
 * @file Status.h
 * @brief Error status codes for RX8010SJ RTC library
 */

#pragma once

#include <stdint.h>

namespace RX8010SJ {

/**
 * @enum Err
 * @brief Error codes returned by library operations
 */
enum class Err : uint8_t {
  OK = 0,            ///< Operation successful
  NOT_INITIALIZED,   ///< Library not initialized (call begin() first)
  INVALID_CONFIG,    ///< Invalid configuration parameter
  I2C_ERROR,         ///< I2C communication failure (native code in detail)
  TIMEOUT,           ///< I2C transaction timed out (native code in detail)
  INVALID_PARAM,     ///< Invalid parameter value
  INVALID_DATETIME,  ///< Date/time outside the representable range
  DEVICE_NOT_FOUND   ///< RTC not responding on I2C bus (probe only)
};

/**
 * @struct Status
 * @brief Status result from library operations
 *
 * All library functions return Status to indicate success or failure.
 * Bus errors are the transport's own Status, returned unchanged.
 */
struct Status {
  Err code = Err::OK;      ///< Error category
  int32_t detail = 0;      ///< Native I2C error code or vendor-specific detail
  const char* msg = "";    ///< Static error message (never heap-allocated)

  constexpr Status() = default;

  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /**
   * @brief Check if operation succeeded
   * @return true if code == Err::OK
   */
  constexpr bool ok() const { return code == Err::OK; }

  /**
   * @brief Create successful status
   */
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /**
   * @brief Create error status
   * @param err Error code
   * @param message Static error message
   * @param detailCode Optional detail code
   */
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

}  // namespace RX8010SJ
