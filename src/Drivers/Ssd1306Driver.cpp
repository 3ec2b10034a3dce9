/*****************************************************************
 * File:      Ssd1306Driver.cpp
 * Category:  src/Drivers
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Implementation of the SSD1306 driver: lifecycle, command
 *    framing and full-frame refresh.
 *
 *    Errors are returned to the caller, never retried. Only
 *    lifecycle events are logged here; the transport logs its own
 *    bus failures.
 *****************************************************************/

#include "Drivers/Ssd1306Driver.hpp"
#include <stdio.h>
#include <utility>

namespace monoled::drivers{

using hal::HalResult;

Ssd1306Driver::~Ssd1306Driver(){
  if(state_ == DriverState::OPEN && owned_device_){
    HalResult result = close();
    if(result != HalResult::OK && log_){
      log_->warn(TAG, "Close on destruction failed: %s", halResultToString(result));
    }
  }
}

bool Ssd1306Driver::isSupportedGeometry(const OledGeometry& geometry){
  return OledFrameBuffer::isValidGeometry(geometry.width, geometry.height)
      && geometry.width <= ssd1306::MAX_WIDTH
      && geometry.height <= ssd1306::MAX_HEIGHT;
}

// ============================================================
// Internal Helpers
// ============================================================

HalResult Ssd1306Driver::checkOpen() const{
  switch(state_){
    case DriverState::OPEN:     return HalResult::OK;
    case DriverState::UNOPENED: return HalResult::NOT_INITIALIZED;
    default:                    return HalResult::INVALID_STATE;
  }
}

void Ssd1306Driver::recordError(const char* message){
  snprintf(last_error_, sizeof(last_error_), "%s", message ? message : "");
}

HalResult Ssd1306Driver::sendBytes(const uint8_t* data, size_t length){
  HalResult result = device_->write(data, length);
  if(result != HalResult::OK){
    recordError(device_->getLastErrorMessage());
  }
  return result;
}

void Ssd1306Driver::attach(hal::IHalI2cDevice* device, const OledGeometry& geometry){
  device_ = device;
  geometry_ = geometry;
  framing_ = ssd1306::makeRefreshFraming(geometry.width);
  last_error_[0] = '\0';
  state_ = DriverState::OPEN;
}

// ============================================================
// Lifecycle
// ============================================================

HalResult Ssd1306Driver::open(hal::IHalI2cOpener& opener, const OledGeometry& geometry){
  if(state_ == DriverState::OPEN) return HalResult::ALREADY_INITIALIZED;
  if(state_ == DriverState::CLOSED) return HalResult::INVALID_STATE;
  if(!isSupportedGeometry(geometry)) return HalResult::INVALID_PARAM;

  std::unique_ptr<hal::IHalI2cDevice> device;
  HalResult result = opener.open(ssd1306::DEVICE_ADDRESS, device);
  if(result != HalResult::OK){
    recordError(opener.getLastErrorMessage());
    return result;
  }
  if(!device){
    recordError("opener returned no device");
    return HalResult::OPEN_FAILED;
  }

  const ssd1306::InitSequence init_seq = ssd1306::makeInitSequence(geometry.height);
  result = device->write(init_seq.data(), init_seq.size());
  if(result != HalResult::OK){
    recordError(device->getLastErrorMessage());
    HalResult close_result = device->close();
    if(close_result != HalResult::OK && log_){
      log_->warn(TAG, "Close after failed init: %s", halResultToString(close_result));
    }
    return result;
  }

  result = buffer_.init(geometry.width, geometry.height);
  if(result != HalResult::OK){
    HalResult close_result = device->close();
    if(close_result != HalResult::OK && log_){
      log_->warn(TAG, "Close after failed allocation: %s", halResultToString(close_result));
    }
    return result;
  }

  owned_device_ = std::move(device);
  attach(owned_device_.get(), geometry);

  if(log_) log_->info(TAG, "SSD1306 opened: %dx%d at 0x%02X, %zu byte frame",
                      geometry.width, geometry.height, ssd1306::DEVICE_ADDRESS, buffer_.size());
  return HalResult::OK;
}

HalResult Ssd1306Driver::openWithExistingTransport(hal::IHalI2cDevice* device, int16_t height){
  if(state_ == DriverState::OPEN) return HalResult::ALREADY_INITIALIZED;
  if(state_ == DriverState::CLOSED) return HalResult::INVALID_STATE;
  if(!device) return HalResult::INVALID_PARAM;
  if(!device->isOpen()) return HalResult::INVALID_STATE;

  OledGeometry geometry;
  geometry.width = ssd1306::MAX_WIDTH;
  geometry.height = height;
  if(!isSupportedGeometry(geometry)) return HalResult::INVALID_PARAM;

  HalResult result = buffer_.init(geometry.width, geometry.height);
  if(result != HalResult::OK) return result;

  attach(device, geometry);

  if(log_) log_->info(TAG, "SSD1306 attached to shared bus: %dx%d at 0x%02X",
                      geometry.width, geometry.height, device->getAddress());
  return HalResult::OK;
}

HalResult Ssd1306Driver::close(){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;

  result = device_->close();
  if(result != HalResult::OK){
    recordError(device_->getLastErrorMessage());
  }

  device_ = nullptr;
  owned_device_.reset();
  buffer_.release();
  state_ = DriverState::CLOSED;

  if(log_) log_->info(TAG, "SSD1306 closed");
  return result;
}

// ============================================================
// Panel Commands
// ============================================================

HalResult Ssd1306Driver::turnOn(){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;

  const uint8_t cmd = ssd1306::CMD_DISPLAY_ON;
  return sendBytes(&cmd, 1);
}

HalResult Ssd1306Driver::turnOff(){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;

  const uint8_t cmd = ssd1306::CMD_DISPLAY_OFF;
  return sendBytes(&cmd, 1);
}

HalResult Ssd1306Driver::setContrast(uint8_t contrast){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;

  const uint8_t cmds[2] = {ssd1306::CMD_SET_CONTRAST, contrast};
  result = sendBytes(cmds, sizeof(cmds));

  if(result == HalResult::OK && log_) log_->debug(TAG, "Contrast set to %d", contrast);
  return result;
}

HalResult Ssd1306Driver::setInverted(bool invert){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;

  const uint8_t cmd = invert ? ssd1306::CMD_INVERT_DISPLAY : ssd1306::CMD_NORMAL_DISPLAY;
  return sendBytes(&cmd, 1);
}

HalResult Ssd1306Driver::enableScroll(uint8_t /*start_page*/, uint8_t /*end_page*/){
  return HalResult::NOT_SUPPORTED;
}

HalResult Ssd1306Driver::disableScroll(){
  return HalResult::NOT_SUPPORTED;
}

// ============================================================
// Drawing
// ============================================================

HalResult Ssd1306Driver::setPixel(int16_t x, int16_t y, bool on){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;
  return buffer_.setPixel(x, y, on);
}

HalResult Ssd1306Driver::setPixelValue(int16_t x, int16_t y, uint8_t value){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;
  return buffer_.setPixelValue(x, y, value);
}

HalResult Ssd1306Driver::blitImage(int16_t x, int16_t y, const IImageSource& source){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;
  return buffer_.blitImage(x, y, source);
}

HalResult Ssd1306Driver::flush(){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;

  result = sendBytes(framing_.data(), framing_.size());
  if(result != HalResult::OK) return result;

  result = sendBytes(buffer_.data(), buffer_.size());

  if(result == HalResult::OK && log_) log_->verbose(TAG, "Frame flushed (%zu bytes)", buffer_.size());
  return result;
}

HalResult Ssd1306Driver::clearAndDraw(){
  HalResult result = checkOpen();
  if(result != HalResult::OK) return result;

  result = buffer_.clear();
  if(result != HalResult::OK) return result;

  return flush();
}

} // namespace monoled::drivers
