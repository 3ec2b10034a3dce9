/*****************************************************************
 * File:      IHalI2c.hpp
 * Category:  include/HAL
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    I2C Hardware Abstraction Layer interface.
 *    Write-only device connections as used by display
 *    controllers, plus the opener that creates them.
 *****************************************************************/

#ifndef MONOLED_INCLUDE_HAL_IHAL_I2C_HPP_
#define MONOLED_INCLUDE_HAL_IHAL_I2C_HPP_

#include "HalTypes.hpp"
#include <memory>

namespace monoled::hal{

// ============================================================
// I2C Configuration
// ============================================================

/** I2C configuration */
struct I2cConfig{
  const char* device_path = "/dev/i2c-1";
};

// ============================================================
// I2C Device Interface
// ============================================================

/** Connection to a single device on an I2C bus
 *
 * Display drivers only ever write; nothing is read back.
 */
class IHalI2cDevice{
public:
  virtual ~IHalI2cDevice() = default;

  /** Write data to the device as one bus transaction
   * @param data Data buffer to write
   * @param length Number of bytes to write
   * @return HalResult::OK on success, WRITE_FAILED on bus error
   */
  virtual HalResult write(const uint8_t* data, size_t length) = 0;

  /** Close the connection
   * @return HalResult::OK on success, CLOSE_FAILED on error
   */
  virtual HalResult close() = 0;

  /** Check if the connection is open
   * @return true while writes are possible
   */
  virtual bool isOpen() const = 0;

  /** Get the 7-bit address this connection talks to */
  virtual i2c_addr_t getAddress() const = 0;

  /** Diagnostic text of the last failure, empty if none */
  virtual const char* getLastErrorMessage() const = 0;
};

// ============================================================
// I2C Opener Interface
// ============================================================

/** Creates device connections on a bus */
class IHalI2cOpener{
public:
  virtual ~IHalI2cOpener() = default;

  /** Open a connection to a device
   * @param address 7-bit I2C address
   * @param device Receives the open connection on success
   * @return HalResult::OK on success, OPEN_FAILED or DEVICE_NOT_FOUND on error
   */
  virtual HalResult open(i2c_addr_t address, std::unique_ptr<IHalI2cDevice>& device) = 0;

  /** Diagnostic text of the last failed open, empty if none */
  virtual const char* getLastErrorMessage() const = 0;
};

} // namespace monoled::hal

#endif // MONOLED_INCLUDE_HAL_IHAL_I2C_HPP_
