/**
 * @file RX8010SJ.cpp
 * @brief Implementation of RX-8010SJ RTC driver
 */

#include "RX8010SJ/RX8010SJ.h"
#include "RX8010SJ/CommandTable.h"
#include <cstdio>
#include <cstring>

namespace RX8010SJ {

// Implementation-only constants (not part of public API)
namespace {
constexpr uint16_t kUnixEpochYear = 1970;
constexpr uint16_t kUnixMaxYear = 2105;  // Last full year representable in uint32_t
constexpr uint16_t kMaxYearBase = 9900;
constexpr uint32_t kSecondsPerDay = 86400UL;

// 1 register pointer + 15 data bytes covers the 7-byte time block.
constexpr size_t kMaxWriteLen = 16;
constexpr size_t kMaxReadLen = 255;

bool isI2cFailure(const Status& st) {
  return st.code == Err::I2C_ERROR || st.code == Err::TIMEOUT;
}

Status mapPresenceError(const Status& st) {
  if (!st.ok() && isI2cFailure(st)) {
    return Status::Error(Err::DEVICE_NOT_FOUND, "RTC not responding", st.detail);
  }
  return st;
}
}  // namespace

// ===== Lifecycle Functions =====

Status RX8010SJ::begin(const Config& config) {
  if (_initialized) {
    end();
  }

  // Validate configuration before touching any state
  if (!config.i2cWrite || !config.i2cWriteRead) {
    return Status::Error(Err::INVALID_CONFIG, "I2C transport callbacks are null");
  }
  if (config.i2cAddress < cmd::I2C_ADDR_MIN || config.i2cAddress > cmd::I2C_ADDR_MAX) {
    return Status::Error(Err::INVALID_CONFIG, "I2C address outside 0x08-0x77",
                         config.i2cAddress);
  }
  if (config.i2cTimeoutMs == 0) {
    return Status::Error(Err::INVALID_CONFIG, "I2C timeout must be > 0");
  }
  if (config.yearBase > kMaxYearBase) {
    return Status::Error(Err::INVALID_CONFIG, "Year base too large", config.yearBase);
  }

  _config = config;
  if (_config.offlineThreshold < 1) {
    _config.offlineThreshold = 1;
  }
  _resetHealth();

  // Presence check uses raw I2C so a failed begin() leaves health untouched
  uint8_t control = 0;
  const uint8_t tx = cmd::REG_CONTROL;
  Status st = mapPresenceError(_i2cWriteReadRaw(&tx, 1, &control, 1));
  if (!st.ok()) {
    return st;
  }

  _initialized = true;
  _driverState = DriverState::READY;
  return Status::Ok();
}

void RX8010SJ::end() {
  _initialized = false;
  _resetHealth();
  // No resources to release (I2C managed by application)
}

// ===== Oscillator Control =====

Status RX8010SJ::isStopped(bool& stopped) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  uint8_t control = 0;
  Status st = readRegister(cmd::REG_CONTROL, control);
  if (!st.ok()) {
    return st;
  }

  stopped = (control & cmd::CTRL_STOP_MASK) != 0;
  return Status::Ok();
}

Status RX8010SJ::setStopped(bool stopped) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  uint8_t control = 0;
  Status st = readRegister(cmd::REG_CONTROL, control);
  if (!st.ok()) {
    return st;
  }

  if (stopped) {
    control = static_cast<uint8_t>(control | cmd::CTRL_STOP_MASK);
  } else {
    control = static_cast<uint8_t>(control & ~cmd::CTRL_STOP_MASK);
  }

  return writeRegister(cmd::REG_CONTROL, control);
}

// ===== Time/Date Operations =====

Status RX8010SJ::readTime(DateTime& out) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  TimeRegisters regs;
  Status st = readBlock(cmd::REG_SEC, regs);
  if (!st.ok()) {
    return st;
  }

  out = decodeTime(regs, _config.yearBase);
  return Status::Ok();
}

Status RX8010SJ::setTime(const DateTime& time) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  return writeBlock(cmd::REG_SEC, encodeTime(time, _config.yearBase));
}

Status RX8010SJ::readUnix(uint32_t& out) {
  DateTime dt;
  Status st = readTime(dt);
  if (!st.ok()) {
    return st;
  }

  if (!dateTimeToUnix(dt, out)) {
    return Status::Error(Err::INVALID_DATETIME, "RTC time outside Unix range", dt.year);
  }
  return Status::Ok();
}

Status RX8010SJ::setUnix(uint32_t ts) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  DateTime dt;
  if (!unixToDateTime(ts, dt) || !isValidDateTime(dt, _config.yearBase)) {
    return Status::Error(Err::INVALID_DATETIME, "Unix timestamp outside RTC year range");
  }
  return setTime(dt);
}

// ===== Driver State and Health =====

Status RX8010SJ::probe() {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }

  // Raw I2C: probe is diagnostic and must not move the health counters
  uint8_t control = 0;
  const uint8_t tx = cmd::REG_CONTROL;
  return mapPresenceError(_i2cWriteReadRaw(&tx, 1, &control, 1));
}

// ===== Low-Level Operations =====

Status RX8010SJ::readRegister(uint8_t reg, uint8_t& value) {
  RegisterBlock<1> buf;
  Status st = readBlock(reg, buf);
  if (st.ok()) {
    value = buf[0];
  }
  return st;
}

Status RX8010SJ::writeRegister(uint8_t reg, uint8_t value) {
  RegisterBlock<1> buf;
  buf[0] = value;
  return writeBlock(reg, buf);
}

// ===== Register Codec =====

uint8_t RX8010SJ::bcdToBinary(uint8_t bcd) {
  return bcdToBin(bcd);
}

uint8_t RX8010SJ::binaryToBcd(uint8_t bin) {
  return binToBcd(bin);
}

bool RX8010SJ::isValidBcd(uint8_t v) {
  uint8_t low = static_cast<uint8_t>(v & 0x0F);
  uint8_t high = static_cast<uint8_t>((v >> 4) & 0x0F);
  return (low <= 9) && (high <= 9);
}

uint8_t RX8010SJ::monthToRegister(uint8_t month) {
  return static_cast<uint8_t>(month - 1);
}

uint8_t RX8010SJ::monthFromRegister(uint8_t reg) {
  if (reg > 11) {
    return 0;
  }
  return static_cast<uint8_t>(reg + 1);
}

DateTime RX8010SJ::decodeTime(const TimeRegisters& regs, uint16_t yearBase) {
  const uint8_t second = bcdToBin(regs[cmd::TIME_IDX_SEC]);
  const uint8_t minute = bcdToBin(regs[cmd::TIME_IDX_MIN]);
  const uint8_t hour = bcdToBin(regs[cmd::TIME_IDX_HOUR]);
  const uint8_t weekday = bcdToBin(regs[cmd::TIME_IDX_WEEK]);
  const uint8_t day = bcdToBin(regs[cmd::TIME_IDX_DAY]);
  const uint8_t month = bcdToBin(regs[cmd::TIME_IDX_MONTH]);
  const uint8_t year = bcdToBin(regs[cmd::TIME_IDX_YEAR]);

  DateTime out;
  out.year = static_cast<uint16_t>(yearBase + year);
  out.month = monthFromRegister(month);
  out.day = day;

  bool dateReplaced = false;
  if (out.month == 0 || out.day < 1 || out.day > daysInMonth(out.year, out.month)) {
    out.year = kFallbackYear;
    out.month = 1;
    out.day = 1;
    dateReplaced = true;
  }

  if (dateReplaced || weekday > 6) {
    out.weekday = computeWeekday(out.year, out.month, out.day);
  } else {
    out.weekday = static_cast<Weekday>(weekday);
  }

  if (hour > 23 || minute > 59 || second > 59) {
    out.hour = 0;
    out.minute = 0;
    out.second = 0;
  } else {
    out.hour = hour;
    out.minute = minute;
    out.second = second;
  }

  return out;
}

TimeRegisters RX8010SJ::encodeTime(const DateTime& time, uint16_t yearBase) {
  Weekday weekday = time.weekday;
  if (time.day >= 1 && time.day <= daysInMonth(time.year, time.month)) {
    weekday = computeWeekday(time.year, time.month, time.day);
  }

  TimeRegisters regs;
  regs[cmd::TIME_IDX_SEC] = binToBcd(time.second);
  regs[cmd::TIME_IDX_MIN] = binToBcd(time.minute);
  regs[cmd::TIME_IDX_HOUR] = binToBcd(time.hour);
  regs[cmd::TIME_IDX_WEEK] = binToBcd(static_cast<uint8_t>(weekday));
  regs[cmd::TIME_IDX_DAY] = binToBcd(time.day);
  regs[cmd::TIME_IDX_MONTH] = binToBcd(monthToRegister(time.month));
  regs[cmd::TIME_IDX_YEAR] = binToBcd(static_cast<uint8_t>(time.year - yearBase));
  return regs;
}

// ===== Static Utility Functions =====

bool RX8010SJ::isValidDateTime(const DateTime& time, uint16_t yearBase) {
  if (time.year < yearBase || time.year > yearBase + 99) {
    return false;
  }
  if (static_cast<uint8_t>(time.weekday) > 6) {
    return false;
  }
  return isValidCalendar(time);
}

Weekday RX8010SJ::computeWeekday(uint16_t year, uint8_t month, uint8_t day) {
  // Sakamoto's method, 0 = Sunday
  static constexpr uint8_t kMonthOffset[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
  if (month < 1 || month > 12) {
    return Weekday::Sunday;
  }
  uint32_t y = year;
  if (month < 3 && y > 0) {
    y -= 1;
  }
  const uint32_t w = (y + y / 4 - y / 100 + y / 400 + kMonthOffset[month - 1] + day) % 7;
  return static_cast<Weekday>(w);
}

bool RX8010SJ::isLeapYear(uint16_t year) {
  return (year % 4 == 0) && ((year % 100 != 0) || (year % 400 == 0));
}

uint8_t RX8010SJ::daysInMonth(uint16_t year, uint8_t month) {
  static constexpr uint8_t kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 0 || month > 12) {
    return 0;
  }
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

bool RX8010SJ::unixToDateTime(uint32_t ts, DateTime& out) {
  uint32_t days = ts / kSecondsPerDay;
  uint32_t rem = ts % kSecondsPerDay;

  uint16_t year = kUnixEpochYear;
  for (;;) {
    const uint16_t daysInYear = isLeapYear(year) ? 366 : 365;
    if (days < daysInYear) {
      break;
    }
    days -= daysInYear;
    ++year;
  }

  // Every uint32_t fits before 2106-02-07, so December always absorbs the rest
  uint8_t month = 1;
  for (; month < 12; ++month) {
    const uint8_t dim = daysInMonth(year, month);
    if (days < dim) {
      break;
    }
    days -= dim;
  }

  out.year = year;
  out.month = month;
  out.day = static_cast<uint8_t>(days + 1);
  out.hour = static_cast<uint8_t>(rem / 3600UL);
  rem %= 3600UL;
  out.minute = static_cast<uint8_t>(rem / 60UL);
  out.second = static_cast<uint8_t>(rem % 60UL);
  out.weekday = computeWeekday(out.year, out.month, out.day);

  return true;
}

bool RX8010SJ::dateTimeToUnix(const DateTime& time, uint32_t& out) {
  if (time.year < kUnixEpochYear || time.year > kUnixMaxYear) {
    return false;
  }
  if (!isValidCalendar(time)) {
    return false;
  }
  const uint32_t days = dateToDays(time.year, time.month, time.day);
  out = days * kSecondsPerDay
      + static_cast<uint32_t>(time.hour) * 3600UL
      + static_cast<uint32_t>(time.minute) * 60UL
      + static_cast<uint32_t>(time.second);
  return true;
}

bool RX8010SJ::parseBuildTime(DateTime& out) {
  const char* dateStr = __DATE__;
  const char* timeStr = __TIME__;

  char monthStr[4] = {0};
  int day = 0;
  int year = 0;
  if (sscanf(dateStr, "%3s %d %d", monthStr, &day, &year) != 3) {
    return false;
  }

  int hour = 0;
  int minute = 0;
  int second = 0;
  if (sscanf(timeStr, "%d:%d:%d", &hour, &minute, &second) != 3) {
    return false;
  }

  const char* months = "JanFebMarAprMayJunJulAugSepOctNovDec";
  const char* pos = strstr(months, monthStr);
  if (!pos || ((pos - months) % 3) != 0) {
    return false;
  }

  DateTime dt;
  dt.year = static_cast<uint16_t>(year);
  dt.month = static_cast<uint8_t>((pos - months) / 3 + 1);
  dt.day = static_cast<uint8_t>(day);
  dt.hour = static_cast<uint8_t>(hour);
  dt.minute = static_cast<uint8_t>(minute);
  dt.second = static_cast<uint8_t>(second);
  if (!isValidCalendar(dt)) {
    return false;
  }
  dt.weekday = computeWeekday(dt.year, dt.month, dt.day);

  out = dt;
  return true;
}

// ===== Private Helper Functions =====

Status RX8010SJ::readRegs(uint8_t reg, uint8_t* buf, size_t len) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (!buf || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C read parameters");
  }
  if (len > kMaxReadLen) {
    return Status::Error(Err::INVALID_PARAM, "I2C read length too large");
  }

  uint8_t tx = reg;
  return _i2cWriteReadTracked(&tx, 1, buf, len);
}

Status RX8010SJ::writeRegs(uint8_t reg, const uint8_t* buf, size_t len) {
  if (!_initialized) {
    return Status::Error(Err::NOT_INITIALIZED, "Call begin() first");
  }
  if (!buf || len == 0) {
    return Status::Error(Err::INVALID_PARAM, "Invalid I2C write parameters");
  }
  if (len > (kMaxWriteLen - 1)) {
    return Status::Error(Err::INVALID_PARAM, "I2C write length exceeds 15 bytes");
  }

  if (_config.burstWrites) {
    uint8_t tx[kMaxWriteLen] = {0};
    tx[0] = reg;
    std::memcpy(&tx[1], buf, len);
    return _i2cWriteTracked(tx, len + 1);
  }

  // One transaction per register; stop at the first failure
  for (size_t i = 0; i < len; ++i) {
    const uint8_t tx[2] = {static_cast<uint8_t>(reg + i), buf[i]};
    Status st = _i2cWriteTracked(tx, sizeof(tx));
    if (!st.ok()) {
      return st;
    }
  }
  return Status::Ok();
}

// ===== I2C Transport Wrappers =====

Status RX8010SJ::_i2cWriteReadRaw(const uint8_t* txBuf, size_t txLen, uint8_t* rxBuf, size_t rxLen) {
  if (!_config.i2cWriteRead) {
    return Status::Error(Err::INVALID_CONFIG, "I2C read callback null");
  }
  return _config.i2cWriteRead(_config.i2cAddress, txBuf, txLen, rxBuf, rxLen,
                              _config.i2cTimeoutMs, _config.i2cUser);
}

Status RX8010SJ::_i2cWriteRaw(const uint8_t* buf, size_t len) {
  if (!_config.i2cWrite) {
    return Status::Error(Err::INVALID_CONFIG, "I2C write callback null");
  }
  return _config.i2cWrite(_config.i2cAddress, buf, len,
                          _config.i2cTimeoutMs, _config.i2cUser);
}

Status RX8010SJ::_i2cWriteReadTracked(const uint8_t* txBuf, size_t txLen, uint8_t* rxBuf, size_t rxLen) {
  Status st = _i2cWriteReadRaw(txBuf, txLen, rxBuf, rxLen);
  return _updateHealth(st);
}

Status RX8010SJ::_i2cWriteTracked(const uint8_t* buf, size_t len) {
  Status st = _i2cWriteRaw(buf, len);
  return _updateHealth(st);
}

Status RX8010SJ::_updateHealth(const Status& st) {
  if (st.ok()) {
    _lastOkMs = _nowMs();
    _consecutiveFailures = 0;
    if (_totalSuccess < UINT32_MAX) {
      ++_totalSuccess;
    }
    if (_initialized) {
      _driverState = DriverState::READY;
    }
  } else {
    _lastError = st;
    _lastErrorMs = _nowMs();
    if (_consecutiveFailures < 0xFFu) {
      ++_consecutiveFailures;
    }
    if (_totalFailures < UINT32_MAX) {
      ++_totalFailures;
    }

    if (_initialized) {
      if (_consecutiveFailures >= _config.offlineThreshold) {
        _driverState = DriverState::OFFLINE;
      } else {
        _driverState = DriverState::DEGRADED;
      }
    }
  }

  // Returned unchanged: the caller sees the transport's own Status
  return st;
}

uint32_t RX8010SJ::_nowMs() const {
  if (!_config.nowMs) {
    return 0;
  }
  return _config.nowMs(_config.nowMsUser);
}

void RX8010SJ::_resetHealth() {
  _driverState = DriverState::UNINIT;
  _lastOkMs = 0;
  _lastErrorMs = 0;
  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;
}

// ===== Conversion Helper Functions =====

uint8_t RX8010SJ::bcdToBin(uint8_t v) {
  return static_cast<uint8_t>(((v >> 4) & 0x0F) * 10 + (v & 0x0F));
}

uint8_t RX8010SJ::binToBcd(uint8_t v) {
  // Values above 99 wrap the tens nibble
  return static_cast<uint8_t>(((v / 10) << 4) | (v % 10));
}

bool RX8010SJ::isValidCalendar(const DateTime& time) {
  if (time.month < 1 || time.month > 12) {
    return false;
  }
  if (time.day < 1 || time.day > daysInMonth(time.year, time.month)) {
    return false;
  }
  if (time.hour > 23 || time.minute > 59 || time.second > 59) {
    return false;
  }
  return true;
}

uint32_t RX8010SJ::dateToDays(uint16_t year, uint8_t month, uint8_t day) {
  uint32_t days = 0;

  // Count days from 1970 to current year
  for (uint16_t y = kUnixEpochYear; y < year; ++y) {
    days += isLeapYear(y) ? 366 : 365;
  }

  static constexpr uint16_t kDaysBeforeMonth[] = {
    0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334
  };
  if (month >= 1 && month <= 12) {
    days += kDaysBeforeMonth[month - 1];
  }

  if (month > 2 && isLeapYear(year)) {
    days += 1;
  }

  if (day > 0) {
    days += static_cast<uint32_t>(day - 1);
  }

  return days;
}

}  // namespace RX8010SJ
