/**
 * @file RX8010SJ.h
 * @brief Driver for Epson RX-8010SJ real-time clock (RTC) module
 *
 * The RX-8010SJ keeps calendar time in BCD registers reachable over I2C.
 * This library covers:
 * - Reading and setting the calendar (seconds .. year)
 * - Starting and stopping the oscillator (STOP bit)
 * - Raw register access for diagnostics
 *
 * Alarms, timers and interrupt outputs are not handled.
 *
 * @par Thread Safety
 * Not thread-safe. External synchronization required when the bus is shared.
 *
 * @par Usage Example
 * @code
 * #include "RX8010SJ/RX8010SJ.h"
 *
 * RX8010SJ::RX8010SJ rtc;
 *
 * void setup() {
 *   Wire.begin();
 *
 *   RX8010SJ::Config cfg;
 *   cfg.i2cWrite = transport::wireWrite;
 *   cfg.i2cWriteRead = transport::wireWriteRead;
 *   cfg.i2cUser = &Wire;
 *
 *   RX8010SJ::Status st = rtc.begin(cfg);
 *   if (!st.ok()) {
 *     Serial.printf("RTC init failed: %s\n", st.msg);
 *     return;
 *   }
 *
 *   bool stopped = false;
 *   if (rtc.isStopped(stopped).ok() && stopped) {
 *     rtc.setStopped(false);
 *   }
 * }
 *
 * void loop() {
 *   RX8010SJ::DateTime dt;
 *   if (rtc.readTime(dt).ok()) {
 *     Serial.printf("%04u-%02u-%02u %02u:%02u:%02u\n",
 *                   dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
 *   }
 *   delay(1000);
 * }
 * @endcode
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "CommandTable.h"
#include "Config.h"
#include "Status.h"

namespace RX8010SJ {

/**
 * @enum Weekday
 * @brief Day of week, numbered as stored in the weekday register
 */
enum class Weekday : uint8_t {
  Sunday = 0,
  Monday = 1,
  Tuesday = 2,
  Wednesday = 3,
  Thursday = 4,
  Friday = 5,
  Saturday = 6
};

/**
 * @struct DateTime
 * @brief Date and time representation for RTC operations
 *
 * All values are in decimal (not BCD). Year is the full value (e.g., 2026).
 */
struct DateTime {
  uint16_t year = 0;                  ///< Year (full value, e.g., 2026)
  uint8_t month = 0;                  ///< Month (1-12, 1=January)
  uint8_t day = 0;                    ///< Day of month (1-31)
  uint8_t hour = 0;                   ///< Hour (0-23, 24-hour format)
  uint8_t minute = 0;                 ///< Minute (0-59)
  uint8_t second = 0;                 ///< Second (0-59)
  Weekday weekday = Weekday::Sunday;  ///< Day of week
};

/**
 * @struct RegisterBlock
 * @brief Fixed-size run of consecutive register values
 *
 * Size is a compile-time constant, so block transfers never allocate.
 */
template <size_t N>
struct RegisterBlock {
  uint8_t bytes[N] = {};

  static constexpr size_t size() { return N; }

  uint8_t& operator[](size_t i) { return bytes[i]; }
  const uint8_t& operator[](size_t i) const { return bytes[i]; }
};

/// @brief Raw time/calendar block, REG_SEC..REG_YEAR.
using TimeRegisters = RegisterBlock<cmd::TIME_BLOCK_LEN>;

/**
 * @enum DriverState
 * @brief Driver health as observed from bus transactions
 */
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called or end() called
  READY,     ///< Last transaction succeeded
  DEGRADED,  ///< 1 .. offlineThreshold-1 consecutive failures
  OFFLINE    ///< offlineThreshold or more consecutive failures
};

/**
 * @class RX8010SJ
 * @brief Driver for the RX-8010SJ real-time clock
 *
 * @par Timing
 * Every call is synchronous and returns when the transport returns.
 *
 * @par Resource Ownership
 * I2C interface passed via Config. No hardcoded pins or resources.
 *
 * @par Memory
 * Zero heap allocation.
 *
 * @par Error Handling
 * Bus errors are the transport's Status, returned unchanged. No retries.
 */
class RX8010SJ {
 public:
  /// @brief Year used when the calendar registers do not form a valid date.
  static constexpr uint16_t kFallbackYear = 1970;

  /// @brief Default year represented by year register 00.
  static constexpr uint16_t kDefaultYearBase = 2000;

  /**
   * @brief Initialize driver with configuration
   *
   * @param config Transport callbacks and behavior configuration
   * @return OK on success, INVALID_CONFIG on bad config,
   *         DEVICE_NOT_FOUND if the control register cannot be read
   * @note The bus must already be initialized by the application.
   */
  Status begin(const Config& config);

  /**
   * @brief Release the driver
   *
   * @note No bus traffic. Health counters are reset.
   */
  void end();

  bool isInitialized() const { return _initialized; }

  const Config& getConfig() const { return _config; }

  // ===== Oscillator Control =====

  /**
   * @brief Read the STOP flag
   *
   * @param[out] stopped true if the oscillator is halted
   * @return Status::Ok() on success, transport Status on bus failure
   */
  Status isStopped(bool& stopped);

  /**
   * @brief Set or clear the STOP flag
   *
   * Reads the control register, changes only the STOP bit and writes it back.
   * Other control bits are preserved.
   *
   * @param stopped true to halt the oscillator, false to run it
   * @return Status::Ok() on success, transport Status on bus failure
   * @note Not atomic. If the read fails no write is issued.
   */
  Status setStopped(bool stopped);

  // ===== Time/Date Operations =====

  /**
   * @brief Read current time and date from RTC
   *
   * One write-read transaction covering REG_SEC..REG_YEAR, mapped through
   * decodeTime(). Implausible register contents never fail this call; they
   * are replaced by the fallback date/time (see decodeTime()).
   *
   * @param[out] out Structure to receive current date/time
   * @return Status::Ok() on success, transport Status on bus failure
   */
  Status readTime(DateTime& out);

  /**
   * @brief Set RTC time and date
   *
   * @param time Date/time to write
   * @return Status::Ok() on success, transport Status on bus failure
   * @note Values are not range-checked; see encodeTime(). Call
   *       isValidDateTime() first if the input is untrusted.
   *       With the default per-register writes, a bus error part way
   *       through leaves earlier registers updated.
   */
  Status setTime(const DateTime& time);

  /**
   * @brief Read current time as Unix timestamp
   *
   * @param[out] out Seconds since 1970-01-01 00:00:00 (RTC time taken as UTC)
   * @return Status::Ok() on success, INVALID_DATETIME if the time cannot be
   *         expressed as a 32-bit Unix timestamp, transport Status on bus failure
   */
  Status readUnix(uint32_t& out);

  /**
   * @brief Set RTC time from Unix timestamp
   *
   * @param ts Unix timestamp (seconds since epoch)
   * @return Status::Ok() on success, INVALID_DATETIME if ts falls outside
   *         yearBase .. yearBase + 99, transport Status on bus failure
   */
  Status setUnix(uint32_t ts);

  // ===== Driver State and Health =====

  /**
   * @brief Check device presence by reading the control register
   *
   * @return OK if the device answers, DEVICE_NOT_FOUND on bus failure
   * @note Diagnostic only: does not update health counters.
   */
  Status probe();

  DriverState state() const { return _driverState; }

  /// @brief true when READY or DEGRADED
  bool isOnline() const {
    return _driverState == DriverState::READY || _driverState == DriverState::DEGRADED;
  }

  uint8_t consecutiveFailures() const { return _consecutiveFailures; }
  uint32_t totalFailures() const { return _totalFailures; }
  uint32_t totalSuccess() const { return _totalSuccess; }

  /// @brief Timestamp of last successful transaction (0 without Config::nowMs)
  uint32_t lastOkMs() const { return _lastOkMs; }

  /// @brief Timestamp of last failed transaction (0 without Config::nowMs)
  uint32_t lastErrorMs() const { return _lastErrorMs; }

  Status lastError() const { return _lastError; }

  // ===== Low-Level Operations =====

  /**
   * @brief Read single RTC register
   *
   * @param reg Register address
   * @param[out] value Register value read
   * @return Status::Ok() on success, error otherwise
   */
  Status readRegister(uint8_t reg, uint8_t& value);

  /**
   * @brief Write single RTC register
   *
   * @param reg Register address
   * @param value Value to write
   * @return Status::Ok() on success, error otherwise
   * @warning Direct register access can disrupt RTC operation if misused
   */
  Status writeRegister(uint8_t reg, uint8_t value);

  // ===== Register Codec =====

  /// @brief BCD to binary: high nibble * 10 + low nibble. Nibbles are not checked.
  static uint8_t bcdToBinary(uint8_t bcd);

  /// @brief Binary to BCD. Valid for 0-99; larger values wrap the tens nibble.
  static uint8_t binaryToBcd(uint8_t bin);

  /// @brief true if both nibbles are 0-9
  static bool isValidBcd(uint8_t v);

  /// @brief Month (1-12) to month register index (0-11)
  static uint8_t monthToRegister(uint8_t month);

  /// @brief Month register index (0-11) to month (1-12), 0 if not a month
  static uint8_t monthFromRegister(uint8_t reg);

  /**
   * @brief Map raw time registers to a DateTime
   *
   * This is not a validating parser. It never fails:
   * - if month/day do not form a calendar date for the decoded year,
   *   the date becomes kFallbackYear-01-01;
   * - if hour/minute/second do not form a time of day, the time becomes 00:00:00;
   * - the weekday register is used as-is when it holds 0-6 and the date was
   *   kept, otherwise the weekday is computed from the resulting date.
   *
   * @param regs Raw registers REG_SEC..REG_YEAR
   * @param yearBase Year represented by year register 00
   */
  static DateTime decodeTime(const TimeRegisters& regs,
                             uint16_t yearBase = kDefaultYearBase);

  /**
   * @brief Map a DateTime to raw time registers
   *
   * The weekday is computed from the date when it is a calendar date,
   * otherwise time.weekday is used. Out-of-range fields are truncated by
   * binaryToBcd(); the year register holds (year - yearBase) truncated to 8 bits.
   *
   * @param time Date/time to encode
   * @param yearBase Year represented by year register 00
   */
  static TimeRegisters encodeTime(const DateTime& time,
                                  uint16_t yearBase = kDefaultYearBase);

  // ===== Static Utility Functions =====

  /**
   * @brief Validate date/time structure against the register window
   *
   * @param time Date/time structure to validate
   * @param yearBase Year represented by year register 00
   * @return true if the calendar fields are valid and
   *         yearBase <= year <= yearBase + 99
   */
  static bool isValidDateTime(const DateTime& time,
                              uint16_t yearBase = kDefaultYearBase);

  /**
   * @brief Compute day of week from date (proleptic Gregorian)
   *
   * @param year Full year (e.g., 2026)
   * @param month Month (1-12)
   * @param day Day of month (1-31)
   * @return Weekday, Weekday::Sunday if month is out of range
   */
  static Weekday computeWeekday(uint16_t year, uint8_t month, uint8_t day);

  static bool isLeapYear(uint16_t year);

  /// @return Days in month, 0 if month is out of range
  static uint8_t daysInMonth(uint16_t year, uint8_t month);

  /**
   * @brief Convert Unix timestamp to DateTime
   *
   * @return Always true: every 32-bit timestamp falls in 1970 .. 2106
   */
  static bool unixToDateTime(uint32_t ts, DateTime& out);

  /**
   * @brief Convert DateTime to Unix timestamp
   *
   * @return false if the fields are not a valid calendar date/time or the
   *         date lies outside 1970-01-01 .. 2105-12-31
   */
  static bool dateTimeToUnix(const DateTime& time, uint32_t& out);

  /**
   * @brief Parse compiler build date/time into DateTime
   *
   * @param[out] out Structure to receive parsed date/time
   * @return true if parsing successful, false otherwise
   * @warning Time is local time of the build machine.
   */
  static bool parseBuildTime(DateTime& out);

 private:
  Config _config;
  bool _initialized = false;

  // Health tracking
  DriverState _driverState = DriverState::UNINIT;
  uint32_t _lastOkMs = 0;
  uint32_t _lastErrorMs = 0;
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;

  // Block transfers
  template <size_t N>
  Status readBlock(uint8_t reg, RegisterBlock<N>& out) {
    return readRegs(reg, out.bytes, N);
  }

  template <size_t N>
  Status writeBlock(uint8_t reg, const RegisterBlock<N>& data) {
    return writeRegs(reg, data.bytes, N);
  }

  Status readRegs(uint8_t reg, uint8_t* buf, size_t len);
  Status writeRegs(uint8_t reg, const uint8_t* buf, size_t len);

  // I2C transport wrappers
  Status _i2cWriteReadRaw(const uint8_t* txBuf, size_t txLen, uint8_t* rxBuf, size_t rxLen);
  Status _i2cWriteRaw(const uint8_t* buf, size_t len);
  Status _i2cWriteReadTracked(const uint8_t* txBuf, size_t txLen, uint8_t* rxBuf, size_t rxLen);
  Status _i2cWriteTracked(const uint8_t* buf, size_t len);
  Status _updateHealth(const Status& st);
  uint32_t _nowMs() const;
  void _resetHealth();

  // Conversion helpers
  static uint8_t bcdToBin(uint8_t v);
  static uint8_t binToBcd(uint8_t v);
  static bool isValidCalendar(const DateTime& time);
  static uint32_t dateToDays(uint16_t year, uint8_t month, uint8_t day);
};

}  // namespace RX8010SJ
