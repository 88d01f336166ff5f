/**
 * @file CommandTable.h
 * @brief RX-8010SJ register addresses and bit definitions.
 *
 * Covers the time/calendar block and the control register used by the
 * driver. Use for direct register access via readRegister()/writeRegister().
 *
 * @note Time registers are BCD. Weekday and month hold a 0-based index.
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

namespace RX8010SJ {

namespace cmd {

// ========== I2C Address ==========

/// @brief 8-bit write address from the datasheet (0x64)
static constexpr uint8_t I2C_ADDR_8BIT_WRITE = 0x64;

/// @brief Default 7-bit I2C address (0x32)
static constexpr uint8_t I2C_ADDR_7BIT = I2C_ADDR_8BIT_WRITE >> 1;

/// @brief Lowest non-reserved 7-bit address
static constexpr uint8_t I2C_ADDR_MIN = 0x08;

/// @brief Highest non-reserved 7-bit address
static constexpr uint8_t I2C_ADDR_MAX = 0x77;

// ========== Time / Calendar Registers (0x10-0x16) ==========

/// @brief Seconds register (0x10), BCD 00-59
static constexpr uint8_t REG_SEC = 0x10;

/// @brief Minutes register (0x11), BCD 00-59
static constexpr uint8_t REG_MIN = 0x11;

/// @brief Hours register (0x12), BCD 00-23 (24-hour)
static constexpr uint8_t REG_HOUR = 0x12;

/// @brief Weekday register (0x13), 0-6 (0=Sunday)
static constexpr uint8_t REG_WEEK = 0x13;

/// @brief Day-of-month register (0x14), BCD 01-31
static constexpr uint8_t REG_DAY = 0x14;

/// @brief Month register (0x15), 0-11 (0=January)
static constexpr uint8_t REG_MONTH = 0x15;

/// @brief Year register (0x16), BCD 00-99 relative to Config::yearBase
static constexpr uint8_t REG_YEAR = 0x16;

/// @brief Number of registers in the time block (REG_SEC..REG_YEAR)
static constexpr size_t TIME_BLOCK_LEN = 7;

// Offsets inside the time block
static constexpr size_t TIME_IDX_SEC = 0;
static constexpr size_t TIME_IDX_MIN = 1;
static constexpr size_t TIME_IDX_HOUR = 2;
static constexpr size_t TIME_IDX_WEEK = 3;
static constexpr size_t TIME_IDX_DAY = 4;
static constexpr size_t TIME_IDX_MONTH = 5;
static constexpr size_t TIME_IDX_YEAR = 6;

// ========== Control Register (0x1F) ==========

/// @brief Control register (0x1F)
/// Bit 6 = STOP. Remaining bits are preserved by the driver.
static constexpr uint8_t REG_CONTROL = 0x1F;

/// @brief STOP bit: 1 = oscillator/counting halted
static constexpr uint8_t CTRL_STOP_BIT = 6;

/// @brief STOP bit mask (0x40)
static constexpr uint8_t CTRL_STOP_MASK = static_cast<uint8_t>(1u << CTRL_STOP_BIT);

}  // namespace cmd

}  // namespace RX8010SJ
