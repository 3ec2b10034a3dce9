/*****************************************************************
 * File:      HalTypes.hpp
 * Category:  include/HAL
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Common type definitions for the MonoOled HAL API.
 *    Result codes, colors and bus address types shared by the
 *    transport layer and the display drivers.
 *****************************************************************/

#ifndef MONOLED_INCLUDE_HAL_HAL_TYPES_HPP_
#define MONOLED_INCLUDE_HAL_HAL_TYPES_HPP_

#include <stdint.h>
#include <stddef.h>

namespace monoled::hal{

// ============================================================
// Result Types
// ============================================================

/** HAL operation result codes */
enum class HalResult : uint8_t{
  OK = 0,              // Operation successful
  ERROR,               // Generic error
  INVALID_PARAM,       // Invalid parameter or geometry
  OUT_OF_BOUNDS,       // Pixel coordinate or value out of range
  NOT_INITIALIZED,     // Module not opened yet
  ALREADY_INITIALIZED, // Already opened
  INVALID_STATE,       // Invalid state for operation (e.g. closed)
  NOT_SUPPORTED,       // Feature not supported
  NO_MEMORY,           // Memory allocation failed
  DEVICE_NOT_FOUND,    // Device not found on bus
  OPEN_FAILED,         // Transport could not be opened
  WRITE_FAILED,        // Transport write failed
  CLOSE_FAILED         // Transport close failed
};

/** True for every code raised by the bus transport */
inline bool isTransportError(HalResult result){
  switch(result){
    case HalResult::DEVICE_NOT_FOUND:
    case HalResult::OPEN_FAILED:
    case HalResult::WRITE_FAILED:
    case HalResult::CLOSE_FAILED:
      return true;
    default:
      return false;
  }
}

/** Convert HalResult to string */
inline const char* halResultToString(HalResult result){
  switch(result){
    case HalResult::OK:                  return "OK";
    case HalResult::ERROR:               return "ERROR";
    case HalResult::INVALID_PARAM:       return "INVALID_PARAM";
    case HalResult::OUT_OF_BOUNDS:       return "OUT_OF_BOUNDS";
    case HalResult::NOT_INITIALIZED:     return "NOT_INITIALIZED";
    case HalResult::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
    case HalResult::INVALID_STATE:       return "INVALID_STATE";
    case HalResult::NOT_SUPPORTED:       return "NOT_SUPPORTED";
    case HalResult::NO_MEMORY:           return "NO_MEMORY";
    case HalResult::DEVICE_NOT_FOUND:    return "DEVICE_NOT_FOUND";
    case HalResult::OPEN_FAILED:         return "OPEN_FAILED";
    case HalResult::WRITE_FAILED:        return "WRITE_FAILED";
    case HalResult::CLOSE_FAILED:        return "CLOSE_FAILED";
    default:                             return "UNKNOWN";
  }
}

// ============================================================
// Color Types
// ============================================================

/** RGB color structure (8-bit per channel) */
struct RGB{
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  RGB() = default;
  RGB(uint8_t red, uint8_t green, uint8_t blue)
    : r(red), g(green), b(blue){}

  /** Any non-black color counts as lit on a monochrome panel */
  bool isLit() const{ return (uint16_t)r + g + b > 0; }
};

// ============================================================
// Communication Types
// ============================================================

/** I2C address type (7-bit) */
using i2c_addr_t = uint8_t;

} // namespace monoled::hal

#endif // MONOLED_INCLUDE_HAL_HAL_TYPES_HPP_
