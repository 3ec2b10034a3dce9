/*****************************************************************
 * File:      LinuxHalI2c.hpp
 * Category:  src/HAL/Linux
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Linux implementation of HAL I2C interface using the
 *    kernel i2c-dev character devices (/dev/i2c-N).
 *****************************************************************/

#ifndef MONOLED_SRC_HAL_LINUX_HAL_I2C_HPP_
#define MONOLED_SRC_HAL_LINUX_HAL_I2C_HPP_

#include "HAL/IHalI2c.hpp"
#include "HAL/IHalLog.hpp"
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

namespace monoled::hal::linux_hal{

/** Linux i2c-dev Device Connection
 *
 * Every write() call is one bus transaction addressed to the
 * slave selected with I2C_SLAVE at open time.
 */
class LinuxHalI2cDevice : public IHalI2cDevice{
private:
  static constexpr const char* TAG = "I2C";

  IHalLog* log_ = nullptr;
  int fd_ = -1;
  i2c_addr_t address_ = 0;
  char last_error_[128] = {0};

  void setError(const char* operation, int err){
    snprintf(last_error_, sizeof(last_error_), "%s 0x%02X: %s",
             operation, address_, strerror(err));
  }

public:
  LinuxHalI2cDevice(int fd, i2c_addr_t address, IHalLog* log = nullptr)
    : log_(log), fd_(fd), address_(address){}

  ~LinuxHalI2cDevice() override{
    if(fd_ >= 0) close();
  }

  LinuxHalI2cDevice(const LinuxHalI2cDevice&) = delete;
  LinuxHalI2cDevice& operator=(const LinuxHalI2cDevice&) = delete;

  HalResult write(const uint8_t* data, size_t length) override{
    if(fd_ < 0) return HalResult::INVALID_STATE;
    if(!data || length == 0) return HalResult::INVALID_PARAM;

    ssize_t written = ::write(fd_, data, length);

    if(written < 0){
      setError("write to", errno);
      if(log_) log_->error(TAG, "%s", last_error_);
      return HalResult::WRITE_FAILED;
    }
    if((size_t)written != length){
      snprintf(last_error_, sizeof(last_error_), "short write to 0x%02X: %zd of %zu bytes",
               address_, written, length);
      if(log_) log_->error(TAG, "%s", last_error_);
      return HalResult::WRITE_FAILED;
    }

    if(log_) log_->verbose(TAG, "Wrote %zu bytes to 0x%02X", length, address_);
    return HalResult::OK;
  }

  HalResult close() override{
    if(fd_ < 0) return HalResult::INVALID_STATE;

    int rc = ::close(fd_);
    fd_ = -1;

    if(rc != 0){
      setError("close of", errno);
      if(log_) log_->error(TAG, "%s", last_error_);
      return HalResult::CLOSE_FAILED;
    }

    if(log_) log_->debug(TAG, "Closed device 0x%02X", address_);
    return HalResult::OK;
  }

  bool isOpen() const override{
    return fd_ >= 0;
  }

  i2c_addr_t getAddress() const override{
    return address_;
  }

  const char* getLastErrorMessage() const override{
    return last_error_;
  }
};

/** Linux i2c-dev Opener
 *
 * Opens the configured bus node and binds it to one slave address.
 */
class LinuxHalI2cOpener : public IHalI2cOpener{
private:
  static constexpr const char* TAG = "I2C";

  IHalLog* log_ = nullptr;
  I2cConfig config_;
  char last_error_[128] = {0};

public:
  explicit LinuxHalI2cOpener(const I2cConfig& config, IHalLog* log = nullptr)
    : log_(log), config_(config){}

  HalResult open(i2c_addr_t address, std::unique_ptr<IHalI2cDevice>& device) override{
    if(!config_.device_path || address > 0x7F){
      snprintf(last_error_, sizeof(last_error_), "invalid bus path or address 0x%02X", address);
      if(log_) log_->error(TAG, "%s", last_error_);
      return HalResult::INVALID_PARAM;
    }

    int fd = ::open(config_.device_path, O_RDWR);
    if(fd < 0){
      int err = errno;
      snprintf(last_error_, sizeof(last_error_), "open %s: %s",
               config_.device_path, strerror(err));
      if(log_) log_->error(TAG, "%s", last_error_);
      return err == ENOENT ? HalResult::DEVICE_NOT_FOUND : HalResult::OPEN_FAILED;
    }

    if(ioctl(fd, I2C_SLAVE, (unsigned long)address) < 0){
      int err = errno;
      ::close(fd);
      snprintf(last_error_, sizeof(last_error_), "select slave 0x%02X on %s: %s",
               address, config_.device_path, strerror(err));
      if(log_) log_->error(TAG, "%s", last_error_);
      return HalResult::OPEN_FAILED;
    }

    device.reset(new LinuxHalI2cDevice(fd, address, log_));
    last_error_[0] = '\0';

    if(log_) log_->info(TAG, "Opened %s, slave 0x%02X", config_.device_path, address);
    return HalResult::OK;
  }

  const char* getLastErrorMessage() const override{
    return last_error_;
  }

  const I2cConfig& getConfig() const{
    return config_;
  }
};

} // namespace monoled::hal::linux_hal

#endif // MONOLED_SRC_HAL_LINUX_HAL_I2C_HPP_
