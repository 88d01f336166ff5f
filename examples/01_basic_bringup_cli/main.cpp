/**
 * @file main.cpp
 * @brief Interactive CLI example for RX8010SJ RTC
 *
 * Demonstrates:
 * - Time reading and setting (calendar, build timestamp, Unix time)
 * - Oscillator start/stop
 * - Raw register access
 * - Driver health tracking
 *
 * Type 'help' for available commands.
 */

#include <Arduino.h>
#include <Wire.h>
#include <cstdlib>

#include "examples/common/BoardConfig.h"
#include "examples/common/CliShell.h"
#include "examples/common/HealthView.h"
#include "examples/common/I2cTransport.h"
#include "examples/common/Log.h"
#include "RX8010SJ/CommandTable.h"
#include "RX8010SJ/RX8010SJ.h"
#include "RX8010SJ/Version.h"

static RX8010SJ::RX8010SJ g_rtc;
static bool g_verbose = false;

static const char* stateToStr(RX8010SJ::DriverState state) {
  switch (state) {
    case RX8010SJ::DriverState::UNINIT:   return "UNINIT";
    case RX8010SJ::DriverState::READY:    return "READY";
    case RX8010SJ::DriverState::DEGRADED: return "DEGRADED";
    case RX8010SJ::DriverState::OFFLINE:  return "OFFLINE";
    default: return "UNKNOWN";
  }
}

static const char* errToStr(RX8010SJ::Err code) {
  switch (code) {
    case RX8010SJ::Err::OK:               return "OK";
    case RX8010SJ::Err::NOT_INITIALIZED:  return "NOT_INITIALIZED";
    case RX8010SJ::Err::INVALID_CONFIG:   return "INVALID_CONFIG";
    case RX8010SJ::Err::I2C_ERROR:        return "I2C_ERROR";
    case RX8010SJ::Err::TIMEOUT:          return "TIMEOUT";
    case RX8010SJ::Err::INVALID_PARAM:    return "INVALID_PARAM";
    case RX8010SJ::Err::INVALID_DATETIME: return "INVALID_DATETIME";
    case RX8010SJ::Err::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
    default: return "UNKNOWN";
  }
}

static const char* weekdayToStr(RX8010SJ::Weekday weekday) {
  static const char* const kNames[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  const uint8_t idx = static_cast<uint8_t>(weekday);
  return (idx < 7) ? kNames[idx] : "???";
}

static const char* stateColor(RX8010SJ::DriverState state) {
  if (state == RX8010SJ::DriverState::UNINIT) {
    return LOG_COLOR_RESET;
  }
  return LOG_COLOR_STATE(g_rtc.isOnline(), g_rtc.consecutiveFailures());
}

static void print_verbose_status(const char* op, const RX8010SJ::Status& st) {
  if (!g_verbose) return;

  Serial.println(F("  --- Verbose Status ---"));
  Serial.printf("  Operation: %s\n", op);
  Serial.printf("  Result: %s%s%s (code=%s, detail=%ld)\n",
                LOG_COLOR_RESULT(st.ok()),
                st.ok() ? "OK" : "FAILED",
                LOG_COLOR_RESET,
                errToStr(st.code),
                static_cast<long>(st.detail));
  if (st.msg) {
    Serial.printf("  Message: %s\n", st.msg);
  }
  Serial.printf("  Driver State: %s%s%s\n",
                stateColor(g_rtc.state()), stateToStr(g_rtc.state()), LOG_COLOR_RESET);
  Serial.printf("  Consecutive Failures: %u\n",
                static_cast<unsigned>(g_rtc.consecutiveFailures()));
  Serial.println(F("  ----------------------"));
}

static void print_help() {
  auto helpSection = [](const char* title) {
    Serial.printf("\n%s[%s]%s\n", LOG_COLOR_GREEN, title, LOG_COLOR_RESET);
  };
  auto helpItem = [](const char* cmd, const char* desc) {
    Serial.printf("  %s%-32s%s - %s\n", LOG_COLOR_CYAN, cmd, LOG_COLOR_RESET, desc);
  };

  Serial.println();
  Serial.printf("%s=== RX8010SJ CLI Help ===%s\n", LOG_COLOR_CYAN, LOG_COLOR_RESET);
  Serial.printf("Version: %s\n", RX8010SJ::VERSION);
  Serial.printf("Built:   %s\n", RX8010SJ::BUILD_TIMESTAMP);

  helpSection("Common");
  helpItem("help / ?", "Show this help");
  helpItem("version / ver", "Print firmware and library version info");
  helpItem("time / read", "Read current time");
  helpItem("set [YYYY MM DD HH MM SS]", "Set time (no args = show)");
  helpItem("setbuild", "Set time to build timestamp");
  helpItem("unix [ts]", "Read or set Unix timestamp");

  helpSection("Oscillator");
  helpItem("stopped", "Show STOP flag");
  helpItem("stop", "Halt the clock (set STOP)");
  helpItem("start", "Run the clock (clear STOP)");

  helpSection("Registers");
  helpItem("reg <addr>", "Read register byte");
  helpItem("reg <addr> <val>", "Write register byte");
  helpItem("dump", "Dump time block and control register");

  helpSection("Diagnostics");
  helpItem("drv / cfg", "Show driver state, config and health");
  helpItem("probe", "Probe device (no health tracking)");
  helpItem("verbose [0|1]", "Enable verbose status output (no args = show)");
  helpItem("stress [N]", "Run N time reads (default 100)");
  Serial.println();
}

static void cmd_version() {
  Serial.println("=== Version Info ===");
  Serial.printf("  Example firmware build: %s %s\n", __DATE__, __TIME__);
  Serial.printf("  RX8010SJ library version: %s\n", RX8010SJ::VERSION);
  Serial.printf("  RX8010SJ library full: %s\n", RX8010SJ::VERSION_FULL);
}

static void print_datetime(const RX8010SJ::DateTime& dt) {
  Serial.printf("%04u-%02u-%02u %02u:%02u:%02u (%s)\n",
                dt.year, dt.month, dt.day,
                dt.hour, dt.minute, dt.second,
                weekdayToStr(dt.weekday));
}

static void cmd_time() {
  RX8010SJ::DateTime dt;
  RX8010SJ::Status st = g_rtc.readTime(dt);
  print_verbose_status("readTime", st);
  if (!st.ok()) {
    LOGE("readTime() failed: %s", st.msg);
    return;
  }
  Serial.print(F("Current time: "));
  print_datetime(dt);
}

/// @brief Log and return false if dt cannot be stored with the configured year base
static bool check_rtc_window(const RX8010SJ::DateTime& dt) {
  const uint16_t base = g_rtc.getConfig().yearBase;
  if (!RX8010SJ::RX8010SJ::isValidDateTime(dt, base)) {
    LOGE("Date/time out of range (years %u-%u)",
         static_cast<unsigned>(base), static_cast<unsigned>(base + 99));
    return false;
  }
  return true;
}

/**
 * @brief Handle 'set' command.
 * Example: "set 2026 01 10 15 30 00"
 */
static void cmd_set(const String& args) {
  if (args.length() == 0) {
    cmd_time();
    return;
  }

  int year, month, day, hour, minute, second;
  if (sscanf(args.c_str(), "%d %d %d %d %d %d",
             &year, &month, &day, &hour, &minute, &second) != 6) {
    LOGE("Invalid format. Usage: set YYYY MM DD HH MM SS");
    return;
  }

  RX8010SJ::DateTime dt;
  dt.year = static_cast<uint16_t>(year);
  dt.month = static_cast<uint8_t>(month);
  dt.day = static_cast<uint8_t>(day);
  dt.hour = static_cast<uint8_t>(hour);
  dt.minute = static_cast<uint8_t>(minute);
  dt.second = static_cast<uint8_t>(second);
  dt.weekday = RX8010SJ::RX8010SJ::computeWeekday(dt.year, dt.month, dt.day);

  // The driver writes whatever it is given; reject bad input here
  if (!check_rtc_window(dt)) {
    return;
  }

  RX8010SJ::Status st = g_rtc.setTime(dt);
  print_verbose_status("setTime", st);
  if (!st.ok()) {
    LOGE("setTime() failed: %s", st.msg);
  } else {
    LOGI("Time set successfully");
    print_datetime(dt);
  }
}

static void cmd_setbuild() {
  RX8010SJ::DateTime dt;
  if (!RX8010SJ::RX8010SJ::parseBuildTime(dt)) {
    LOGE("parseBuildTime() failed");
    return;
  }
  if (!check_rtc_window(dt)) {
    return;
  }

  RX8010SJ::Status st = g_rtc.setTime(dt);
  print_verbose_status("setTime", st);
  if (!st.ok()) {
    LOGE("setTime() failed: %s", st.msg);
  } else {
    LOGI("Time set to build timestamp:");
    print_datetime(dt);
  }
}

static void cmd_unix(const String& args) {
  if (args.length() == 0) {
    uint32_t ts = 0;
    RX8010SJ::Status st = g_rtc.readUnix(ts);
    print_verbose_status("readUnix", st);
    if (!st.ok()) {
      LOGE("readUnix() failed: %s", st.msg);
      return;
    }
    Serial.printf("Unix timestamp: %lu\n", static_cast<unsigned long>(ts));
    return;
  }

  const uint32_t ts = static_cast<uint32_t>(strtoul(args.c_str(), nullptr, 0));
  RX8010SJ::Status st = g_rtc.setUnix(ts);
  print_verbose_status("setUnix", st);
  if (!st.ok()) {
    LOGE("setUnix() failed: %s", st.msg);
    return;
  }
  LOGI("Unix timestamp set to %lu", static_cast<unsigned long>(ts));
}

static void cmd_stopped() {
  bool stopped = false;
  RX8010SJ::Status st = g_rtc.isStopped(stopped);
  print_verbose_status("isStopped", st);
  if (!st.ok()) {
    LOGE("isStopped() failed: %s", st.msg);
    return;
  }
  Serial.printf("Oscillator: %s%s%s\n",
                stopped ? LOG_COLOR_YELLOW : LOG_COLOR_GREEN,
                stopped ? "STOPPED" : "running",
                LOG_COLOR_RESET);
}

static void cmd_set_stopped(bool stopped) {
  RX8010SJ::Status st = g_rtc.setStopped(stopped);
  print_verbose_status("setStopped", st);
  if (!st.ok()) {
    LOGE("setStopped(%s) failed: %s", log_bool_str(stopped), st.msg);
    return;
  }
  LOGI("Oscillator %s", stopped ? "stopped" : "started");
}

static void cmd_reg(const String& args) {
  String trimmed = args;
  trimmed.trim();
  if (trimmed.length() == 0) {
    LOGE("Usage: reg <addr> [value]");
    return;
  }

  const int split = trimmed.indexOf(' ');
  const String addrTok = (split >= 0) ? trimmed.substring(0, split) : trimmed;
  String valueTok = (split >= 0) ? trimmed.substring(split + 1) : "";
  valueTok.trim();

  const unsigned long addrRaw = strtoul(addrTok.c_str(), nullptr, 0);
  if (addrRaw > 0xFFUL) {
    LOGE("Register address out of range");
    return;
  }
  const uint8_t reg = static_cast<uint8_t>(addrRaw);

  if (valueTok.length() == 0) {
    uint8_t value = 0;
    RX8010SJ::Status st = g_rtc.readRegister(reg, value);
    print_verbose_status("readRegister", st);
    if (!st.ok()) {
      LOGE("readRegister(0x%02X) failed: %s", reg, st.msg);
      return;
    }
    Serial.printf("reg[0x%02X] = 0x%02X\n", reg, value);
    return;
  }

  const unsigned long valueRaw = strtoul(valueTok.c_str(), nullptr, 0);
  if (valueRaw > 0xFFUL) {
    LOGE("Register value out of range");
    return;
  }

  RX8010SJ::Status st = g_rtc.writeRegister(reg, static_cast<uint8_t>(valueRaw));
  print_verbose_status("writeRegister", st);
  if (!st.ok()) {
    LOGE("writeRegister(0x%02X) failed: %s", reg, st.msg);
    return;
  }
  LOGI("reg[0x%02X] <= 0x%02lX", reg, valueRaw);
}

static void cmd_dump() {
  static const char* const kNames[] = {"SEC", "MIN", "HOUR", "WEEK", "DAY", "MONTH", "YEAR"};
  for (uint8_t i = 0; i < RX8010SJ::cmd::TIME_BLOCK_LEN; ++i) {
    const uint8_t reg = static_cast<uint8_t>(RX8010SJ::cmd::REG_SEC + i);
    uint8_t value = 0;
    RX8010SJ::Status st = g_rtc.readRegister(reg, value);
    if (!st.ok()) {
      LOGE("readRegister(0x%02X) failed: %s", reg, st.msg);
      return;
    }
    Serial.printf("  0x%02X %-5s = 0x%02X%s\n", reg, kNames[i], value,
                  RX8010SJ::RX8010SJ::isValidBcd(value) ? "" : "  (not BCD)");
  }

  uint8_t control = 0;
  RX8010SJ::Status st = g_rtc.readRegister(RX8010SJ::cmd::REG_CONTROL, control);
  if (!st.ok()) {
    LOGE("readRegister(CONTROL) failed: %s", st.msg);
    return;
  }
  Serial.printf("  0x%02X CTRL  = 0x%02X (STOP=%u)\n", RX8010SJ::cmd::REG_CONTROL, control,
                (control & RX8010SJ::cmd::CTRL_STOP_MASK) ? 1u : 0u);
}

static void cmd_drv() {
  Serial.println();
  Serial.println(F("=== Driver Health ==="));
  const RX8010SJ::DriverState state = g_rtc.state();
  const RX8010SJ::Config& cfg = g_rtc.getConfig();
  Serial.printf("State: %s%s%s\n", stateColor(state), stateToStr(state), LOG_COLOR_RESET);
  Serial.printf("isInitialized: %s\n", log_bool_str(g_rtc.isInitialized()));
  Serial.printf("Config: addr=0x%02X i2cTimeout=%lu yearBase=%u burstWrites=%s offlineThreshold=%u\n",
                static_cast<unsigned>(cfg.i2cAddress),
                static_cast<unsigned long>(cfg.i2cTimeoutMs),
                static_cast<unsigned>(cfg.yearBase),
                log_bool_str(cfg.burstWrites),
                static_cast<unsigned>(cfg.offlineThreshold));
  printHealthView(g_rtc);

  const uint32_t now = millis();
  if (g_rtc.lastOkMs() > 0) {
    Serial.printf("Last OK: %lu ms ago\n", static_cast<unsigned long>(now - g_rtc.lastOkMs()));
  } else {
    Serial.println(F("Last OK: never"));
  }
  if (g_rtc.lastErrorMs() > 0) {
    const RX8010SJ::Status lastError = g_rtc.lastError();
    Serial.printf("Last Error: %lu ms ago (%s: %s, detail=%ld)\n",
                  static_cast<unsigned long>(now - g_rtc.lastErrorMs()),
                  errToStr(lastError.code),
                  lastError.msg ? lastError.msg : "",
                  static_cast<long>(lastError.detail));
  } else {
    Serial.println(F("Last Error: never"));
  }
  Serial.println();
}

static void cmd_probe() {
  Serial.println(F("Probing device (no health tracking)..."));
  RX8010SJ::Status st = g_rtc.probe();
  if (st.ok()) {
    LOGI("Probe OK - device responding");
  } else {
    LOGE("Probe FAILED: %s (code=%s, detail=%ld)",
         st.msg, errToStr(st.code), static_cast<long>(st.detail));
  }
}

static void cmd_verbose(const String& args) {
  if (args.length() == 0) {
    Serial.printf("Verbose mode: %s\n", g_verbose ? "ON" : "OFF");
    return;
  }
  g_verbose = (args.toInt() != 0);
  LOGI("Verbose mode: %s", g_verbose ? "ON" : "OFF");
}

static void cmd_stress(const String& args) {
  long count = (args.length() > 0) ? args.toInt() : 100;
  if (count <= 0 || count > 100000) {
    LOGE("Count must be 1..100000");
    return;
  }

  const uint32_t failBefore = g_rtc.totalFailures();
  uint32_t okCount = 0;
  uint32_t failCount = 0;
  const uint32_t start = millis();
  for (long i = 0; i < count; ++i) {
    RX8010SJ::DateTime dt;
    if (g_rtc.readTime(dt).ok()) {
      ++okCount;
    } else {
      ++failCount;
    }
  }
  const uint32_t elapsed = millis() - start;

  Serial.printf("Stress: %sok=%lu%s %sfail=%lu%s in %lu ms\n",
                LOG_COLOR_GREEN, static_cast<unsigned long>(okCount), LOG_COLOR_RESET,
                LOG_COLOR_RESULT(failCount == 0), static_cast<unsigned long>(failCount),
                LOG_COLOR_RESET, static_cast<unsigned long>(elapsed));
  Serial.printf("Health failures delta: %lu\n",
                static_cast<unsigned long>(g_rtc.totalFailures() - failBefore));
}

static void process_command(const String& line) {
  const int spaceIdx = line.indexOf(' ');
  const String cmd = (spaceIdx >= 0) ? line.substring(0, spaceIdx) : line;
  const String args = (spaceIdx >= 0) ? line.substring(spaceIdx + 1) : "";

  if (cmd == "help" || cmd == "?") {
    print_help();
  } else if (cmd == "version" || cmd == "ver") {
    cmd_version();
  } else if (cmd == "time" || cmd == "read") {
    cmd_time();
  } else if (cmd == "set") {
    cmd_set(args);
  } else if (cmd == "setbuild") {
    cmd_setbuild();
  } else if (cmd == "unix") {
    cmd_unix(args);
  } else if (cmd == "stopped") {
    cmd_stopped();
  } else if (cmd == "stop") {
    cmd_set_stopped(true);
  } else if (cmd == "start") {
    cmd_set_stopped(false);
  } else if (cmd == "reg") {
    cmd_reg(args);
  } else if (cmd == "dump") {
    cmd_dump();
  } else if (cmd == "drv" || cmd == "cfg") {
    cmd_drv();
  } else if (cmd == "probe") {
    cmd_probe();
  } else if (cmd == "verbose") {
    cmd_verbose(args);
  } else if (cmd == "stress") {
    cmd_stress(args);
  } else {
    LOGW("Unknown command: '%s'. Type 'help' for available commands.", cmd.c_str());
  }
}

void setup() {
  delay(1000);  // USB-CDC enumeration delay
  Serial.begin(115200);
  while (!Serial && millis() < 4000) {
    delay(10);
  }

  print_help();

  LOGI("Initializing I2C (SDA=%d, SCL=%d)...", board::I2C_SDA, board::I2C_SCL);
  if (!board::initI2c()) {
    LOGE("I2C init failed");
    return;
  }

  LOGI("Initializing RTC...");
  RX8010SJ::Config cfg;
  cfg.i2cWrite = transport::wireWrite;
  cfg.i2cWriteRead = transport::wireWriteRead;
  cfg.i2cUser = &Wire;
  cfg.nowMs = transport::arduinoNowMs;

  RX8010SJ::Status st = g_rtc.begin(cfg);
  if (!st.ok()) {
    LOGE("RTC init failed: %s (code=%s, detail=%ld)",
         st.msg, errToStr(st.code), static_cast<long>(st.detail));
    LOGE("Check I2C wiring and RTC power");
    return;
  }

  LOGI("RTC initialized successfully");
  LOGI("Driver state: %s", stateToStr(g_rtc.state()));

  bool stopped = false;
  st = g_rtc.isStopped(stopped);
  if (st.ok() && stopped) {
    LOGW("Oscillator is stopped. Use 'set' then 'start'.");
  }
  Serial.print("> ");
}

void loop() {
  String line;
  if (cli_shell::readLine(line)) {
    process_command(line);
    Serial.print("> ");
  }
  delay(10);
}
