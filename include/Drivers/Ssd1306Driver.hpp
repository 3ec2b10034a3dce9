/*****************************************************************
 * File:      Ssd1306Driver.hpp
 * Category:  include/Drivers
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    SSD1306 OLED driver over an injected I2C transport.
 *    Owns the device connection and the frame buffer, issues the
 *    power-on sequence and repaints the full frame on flush().
 *
 * Usage:
 *    linux_hal::LinuxHalI2cOpener opener(I2cConfig{"/dev/i2c-1"}, &log);
 *    Ssd1306Driver oled(&log);
 *
 *    if(oled.open(opener) != HalResult::OK) return;
 *    oled.setPixel(10, 10, true);
 *    oled.flush();
 *    oled.close();
 *
 * Note:
 *    Pixel calls only touch memory. Nothing reaches the panel
 *    until flush() or clearAndDraw(). One owner at a time; the
 *    driver does no locking.
 *****************************************************************/

#ifndef MONOLED_INCLUDE_DRIVERS_SSD1306_DRIVER_HPP_
#define MONOLED_INCLUDE_DRIVERS_SSD1306_DRIVER_HPP_

#include "HAL/IHalI2c.hpp"
#include "HAL/IHalLog.hpp"
#include "Drivers/ImageSource.hpp"
#include "Drivers/OledFrameBuffer.hpp"
#include "Drivers/Ssd1306Protocol.hpp"
#include <memory>

namespace monoled::drivers{

/** Panel geometry in pixels */
struct OledGeometry{
  int16_t width = 128;
  int16_t height = 64;
};

/** Driver lifecycle, strictly UNOPENED -> OPEN -> CLOSED */
enum class DriverState : uint8_t{
  UNOPENED,
  OPEN,
  CLOSED
};

class Ssd1306Driver{
public:
  explicit Ssd1306Driver(hal::IHalLog* log = nullptr) : log_(log){}

  /** Closes a connection the driver opened itself */
  ~Ssd1306Driver();

  Ssd1306Driver(const Ssd1306Driver&) = delete;
  Ssd1306Driver& operator=(const Ssd1306Driver&) = delete;

  // ============================================================
  // Lifecycle
  // ============================================================

  /** Open the panel at 0x3C and send the power-on sequence
   * @param opener Bus used to create the connection
   * @param geometry Panel size, at most 128x64, height a multiple of 8
   * @return OK; INVALID_PARAM for bad geometry; the opener's error;
   *         WRITE_FAILED if the init sequence is rejected. On failure
   *         the driver stays UNOPENED and keeps nothing.
   */
  hal::HalResult open(hal::IHalI2cOpener& opener, const OledGeometry& geometry = OledGeometry());

  /** Attach to a connection the caller already opened
   *
   * The init sequence is NOT sent; the caller is expected to have
   * brought the panel up already. Width is 128. The driver does not
   * take ownership, but close() still closes the connection.
   */
  hal::HalResult openWithExistingTransport(hal::IHalI2cDevice* device, int16_t height);

  /** Close the connection and drop the buffer; no re-open afterwards */
  hal::HalResult close();

  DriverState getState() const{ return state_; }
  bool isOpen() const{ return state_ == DriverState::OPEN; }

  // ============================================================
  // Panel Commands
  // ============================================================

  hal::HalResult turnOn();
  hal::HalResult turnOff();

  hal::HalResult setContrast(uint8_t contrast);
  hal::HalResult setInverted(bool invert);

  /** Scrolling is not implemented; both return NOT_SUPPORTED */
  hal::HalResult enableScroll(uint8_t start_page, uint8_t end_page);
  hal::HalResult disableScroll();

  // ============================================================
  // Drawing (buffer only, call flush() to show)
  // ============================================================

  hal::HalResult setPixel(int16_t x, int16_t y, bool on);
  hal::HalResult setPixelValue(int16_t x, int16_t y, uint8_t value);
  hal::HalResult blitImage(int16_t x, int16_t y, const IImageSource& source);

  /** Send the addressing window, then the whole buffer
   *
   * Two writes. The buffer is never modified, so a failed flush can
   * simply be retried by the caller.
   */
  hal::HalResult flush();

  /** Clear the buffer and flush it */
  hal::HalResult clearAndDraw();

  // ============================================================
  // Accessors
  // ============================================================

  int16_t getWidth() const{ return geometry_.width; }
  int16_t getHeight() const{ return geometry_.height; }
  const OledFrameBuffer& getBuffer() const{ return buffer_; }

  /** Transport diagnostic of the last failed bus operation */
  const char* getLastErrorMessage() const{ return last_error_; }

  static bool isSupportedGeometry(const OledGeometry& geometry);

private:
  static constexpr const char* TAG = "SSD1306";

  hal::HalResult checkOpen() const;
  hal::HalResult sendBytes(const uint8_t* data, size_t length);
  void recordError(const char* message);
  void attach(hal::IHalI2cDevice* device, const OledGeometry& geometry);

  hal::IHalLog* log_ = nullptr;
  std::unique_ptr<hal::IHalI2cDevice> owned_device_;
  hal::IHalI2cDevice* device_ = nullptr;

  OledGeometry geometry_;
  OledFrameBuffer buffer_;
  ssd1306::RefreshFraming framing_{};

  DriverState state_ = DriverState::UNOPENED;
  char last_error_[128] = {0};
};

} // namespace monoled::drivers

#endif // MONOLED_INCLUDE_DRIVERS_SSD1306_DRIVER_HPP_
