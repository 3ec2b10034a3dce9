/*****************************************************************
 * File:      Hal.hpp
 * Category:  include/HAL
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Master HAL header that includes all HAL interfaces.
 *    Include this single header to access all HAL functionality.
 *
 * Architecture:
 *    HAL Layer (this) -> Drivers -> Application Layer
 *
 *    The HAL layer provides platform-independent interfaces that
 *    abstract hardware access. Drivers MUST NOT use platform-
 *    specific code or touch the bus directly.
 *
 *    Hardware implementations of these interfaces live in
 *    platform-specific directories (src/HAL/Linux) and are
 *    injected at runtime.
 *
 * Usage:
 *    #include "HAL/Hal.hpp"
 *
 *    void initDisplay(monoled::hal::IHalI2cOpener* opener,
 *                     monoled::hal::IHalLog* log);
 *****************************************************************/

#ifndef MONOLED_INCLUDE_HAL_HAL_HPP_
#define MONOLED_INCLUDE_HAL_HAL_HPP_

// ============================================================
// Core Type Definitions
// ============================================================
#include "HalTypes.hpp"

// ============================================================
// Logging
// ============================================================
#include "IHalLog.hpp"       // Logging

// ============================================================
// Communication Interfaces
// ============================================================
#include "IHalI2c.hpp"       // I2C device connections

// ============================================================
// Default Settings
// ============================================================

namespace monoled::hal::defaults{

/** I2C Device Addresses */
constexpr i2c_addr_t OLED_ADDRESS = 0x3C;    // SSD1306, 7-bit

/** Bus device node on Linux hosts */
constexpr const char* I2C_DEVICE = "/dev/i2c-1";

/** Display geometry when the caller gives none */
constexpr int16_t OLED_WIDTH = 128;
constexpr int16_t OLED_HEIGHT = 64;

} // namespace monoled::hal::defaults

#endif // MONOLED_INCLUDE_HAL_HAL_HPP_
