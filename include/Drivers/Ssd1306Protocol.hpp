/*****************************************************************
 * File:      Ssd1306Protocol.hpp
 * Category:  include/Drivers
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    SSD1306 command set and the fixed byte sequences sent to
 *    the controller: power-on initialization and the refresh
 *    framing that precedes every full-frame write.
 *
 * Note:
 *    Sequences are compile-time data. Only the geometry bytes
 *    (multiplex ratio, COM pins, last column) vary, and they are
 *    folded in by constexpr builders.
 *****************************************************************/

#ifndef MONOLED_INCLUDE_DRIVERS_SSD1306_PROTOCOL_HPP_
#define MONOLED_INCLUDE_DRIVERS_SSD1306_PROTOCOL_HPP_

#include "HAL/HalTypes.hpp"
#include <array>

namespace monoled::drivers::ssd1306{

// ============================================================
// Bus Constants
// ============================================================

constexpr hal::i2c_addr_t DEVICE_ADDRESS = 0x3C;  // 7-bit

/** Control byte that opens a pixel data stream (Co=0, D/C#=1) */
constexpr uint8_t DATA_MARKER = 0x40;

/** Controller GDDRAM limits */
constexpr int16_t MAX_WIDTH = 128;
constexpr int16_t MAX_HEIGHT = 64;
constexpr uint8_t LAST_PAGE = 7;

// ============================================================
// Fundamental Commands
// ============================================================

constexpr uint8_t CMD_DISPLAY_OFF           = 0xAE;
constexpr uint8_t CMD_DISPLAY_ON            = 0xAF;
constexpr uint8_t CMD_SET_CONTRAST          = 0x81;
constexpr uint8_t CMD_DISPLAY_ALL_ON_RESUME = 0xA4;  // Output follows RAM
constexpr uint8_t CMD_NORMAL_DISPLAY        = 0xA6;
constexpr uint8_t CMD_INVERT_DISPLAY        = 0xA7;

// ============================================================
// Addressing Commands
// ============================================================

constexpr uint8_t CMD_SET_LOW_COLUMN  = 0x00;
constexpr uint8_t CMD_SET_HIGH_COLUMN = 0x10;
constexpr uint8_t CMD_SET_MEMORY_MODE = 0x20;
constexpr uint8_t CMD_SET_COLUMN_ADDR = 0x21;
constexpr uint8_t CMD_SET_PAGE_ADDR   = 0x22;
constexpr uint8_t CMD_SET_START_LINE  = 0x40;

constexpr uint8_t MEMORY_MODE_HORIZONTAL = 0x00;

// ============================================================
// Hardware Configuration
// ============================================================

constexpr uint8_t CMD_SET_SEGMENT_REMAP  = 0xA0;
constexpr uint8_t CMD_SET_MULTIPLEX      = 0xA8;
constexpr uint8_t CMD_SET_COM_SCAN_DEC   = 0xC8;
constexpr uint8_t CMD_SET_DISPLAY_OFFSET = 0xD3;
constexpr uint8_t CMD_SET_COM_PINS       = 0xDA;

constexpr uint8_t COM_PINS_ALTERNATIVE = 0x12;  // 64-row panels
constexpr uint8_t COM_PINS_SEQUENTIAL  = 0x02;  // 32-row panels

// ============================================================
// Timing & Driving
// ============================================================

constexpr uint8_t CMD_SET_CLOCK_DIV     = 0xD5;
constexpr uint8_t CMD_SET_PRECHARGE     = 0xD9;
constexpr uint8_t CMD_SET_VCOM_DESELECT = 0xDB;
constexpr uint8_t CMD_CHARGE_PUMP       = 0x8D;

constexpr uint8_t CLOCK_DIV_VALUE     = 0x40;
constexpr uint8_t CHARGE_PUMP_ENABLE  = 0x14;
constexpr uint8_t DEFAULT_CONTRAST    = 0xCF;
constexpr uint8_t PRECHARGE_VALUE     = 0xF1;
constexpr uint8_t VCOM_DESELECT_VALUE = 0x40;

// ============================================================
// Scrolling Commands (no scroll support, opcodes for reference)
// ============================================================

constexpr uint8_t CMD_ACTIVATE_SCROLL                      = 0x2F;
constexpr uint8_t CMD_DEACTIVATE_SCROLL                    = 0x2E;
constexpr uint8_t CMD_SET_VERTICAL_SCROLL_AREA             = 0xA3;
constexpr uint8_t CMD_RIGHT_HORIZONTAL_SCROLL              = 0x26;
constexpr uint8_t CMD_LEFT_HORIZONTAL_SCROLL               = 0x27;
constexpr uint8_t CMD_VERTICAL_AND_RIGHT_HORIZONTAL_SCROLL = 0x29;
constexpr uint8_t CMD_VERTICAL_AND_LEFT_HORIZONTAL_SCROLL  = 0x2A;

// ============================================================
// Command Sequences
// ============================================================

constexpr size_t INIT_SEQUENCE_LENGTH = 28;
constexpr size_t REFRESH_FRAMING_LENGTH = 8;

using InitSequence = std::array<uint8_t, INIT_SEQUENCE_LENGTH>;
using RefreshFraming = std::array<uint8_t, REFRESH_FRAMING_LENGTH>;

/** COM pin layout for a panel height */
constexpr uint8_t comPinsFor(int16_t height){
  return height > 32 ? COM_PINS_ALTERNATIVE : COM_PINS_SEQUENTIAL;
}

/** Power-on sequence, sent as one write right after the bus opens */
constexpr InitSequence makeInitSequence(int16_t height){
  return InitSequence{{
    CMD_DISPLAY_OFF,
    CMD_SET_LOW_COLUMN | 0x00,              // Column offset low nibble
    CMD_SET_HIGH_COLUMN | 0x00,             // Column offset high nibble
    CMD_SET_CLOCK_DIV, CLOCK_DIV_VALUE,
    CMD_SET_MULTIPLEX, (uint8_t)(height - 1),
    CMD_SET_DISPLAY_OFFSET, 0x00,
    CMD_SET_START_LINE | 0,
    CMD_CHARGE_PUMP, CHARGE_PUMP_ENABLE,
    CMD_SET_MEMORY_MODE, MEMORY_MODE_HORIZONTAL,
    CMD_SET_SEGMENT_REMAP | 0x01,           // Column 127 mapped to SEG0
    CMD_SET_COM_SCAN_DEC,
    CMD_SET_COM_PINS, comPinsFor(height),
    CMD_SET_CONTRAST, DEFAULT_CONTRAST,
    CMD_SET_PRECHARGE, PRECHARGE_VALUE,
    CMD_SET_VCOM_DESELECT, VCOM_DESELECT_VALUE,
    CMD_DISPLAY_ALL_ON_RESUME,
    CMD_NORMAL_DISPLAY,
    CMD_DEACTIVATE_SCROLL,
    CMD_DISPLAY_ON
  }};
}

/** Addressing window sent before every full-frame write */
constexpr RefreshFraming makeRefreshFraming(int16_t width){
  return RefreshFraming{{
    CMD_DISPLAY_ALL_ON_RESUME,
    CMD_SET_START_LINE | 0,
    CMD_SET_COLUMN_ADDR, 0, (uint8_t)(width - 1),
    CMD_SET_PAGE_ADDR, 0, LAST_PAGE
  }};
}

/** Sequences for the default 128x64 panel */
constexpr InitSequence INIT_SEQUENCE_128X64 = makeInitSequence(64);
constexpr RefreshFraming REFRESH_FRAMING_128 = makeRefreshFraming(128);

} // namespace monoled::drivers::ssd1306

#endif // MONOLED_INCLUDE_DRIVERS_SSD1306_PROTOCOL_HPP_
