/*****************************************************************
 * File:      OledFrameBuffer.hpp
 * Category:  include/Drivers
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Packed 1-bit frame buffer mirroring SSD1306 display RAM.
 *    Never touches the bus; the driver sends data() as-is.
 *
 * Layout:
 *    byte 0              data-stream marker (0x40), not a pixel
 *    byte 1 + x + p*W    column x of page p (rows 8p .. 8p+7)
 *    bit (y % 8)         row y within the page, bit 0 = top
 *
 *    128x64 -> 1 + 128*8 = 1025 bytes
 *    128x32 -> 1 + 128*4 =  513 bytes
 *****************************************************************/

#ifndef MONOLED_INCLUDE_DRIVERS_OLED_FRAME_BUFFER_HPP_
#define MONOLED_INCLUDE_DRIVERS_OLED_FRAME_BUFFER_HPP_

#include "HAL/HalTypes.hpp"
#include "Drivers/ImageSource.hpp"
#include <vector>

namespace monoled::drivers{

class OledFrameBuffer{
public:
  OledFrameBuffer() = default;

  /** Allocate a zeroed buffer with the marker byte set
   * @param width Width in pixels, > 0
   * @param height Height in pixels, positive multiple of 8
   * @return HalResult::OK, or INVALID_PARAM on bad geometry (buffer untouched)
   */
  hal::HalResult init(int16_t width, int16_t height);

  /** Drop the storage; the buffer reports isAllocated() == false */
  void release();

  bool isAllocated() const{ return !buffer_.empty(); }

  /** Set or clear one pixel
   * @return OUT_OF_BOUNDS if (x, y) is outside the geometry; nothing changes
   */
  hal::HalResult setPixel(int16_t x, int16_t y, bool on);

  /** Raw form of setPixel taking 0 or 1
   * @return OUT_OF_BOUNDS for coordinates or for a value above 1
   */
  hal::HalResult setPixelValue(int16_t x, int16_t y, uint8_t value);

  /** Read back one pixel; false outside the geometry */
  bool getPixel(int16_t x, int16_t y) const;

  /** All pixels off, marker preserved */
  hal::HalResult clear();

  /** All pixels on or off, marker preserved */
  hal::HalResult fill(bool on);

  /** Copy an RGB source with its top-left corner at (x, y)
   *
   * A source pixel is lit when r + g + b > 0. Unlike setPixel,
   * destinations outside the buffer are skipped without error, so
   * an origin past the right or bottom edge is simply a no-op.
   */
  hal::HalResult blitImage(int16_t x, int16_t y, const IImageSource& source);

  /** Transmission payload, marker included */
  const uint8_t* data() const{ return buffer_.data(); }
  size_t size() const{ return buffer_.size(); }

  int16_t getWidth() const{ return width_; }
  int16_t getHeight() const{ return height_; }
  int16_t getPageCount() const{ return height_ / 8; }

  // Addressing helpers

  static bool isValidGeometry(int16_t width, int16_t height);
  static size_t bufferSizeFor(int16_t width, int16_t height);

  /** Index of the byte holding (x, y), counted from the marker */
  static size_t byteIndex(int16_t x, int16_t y, int16_t width){
    return 1 + (size_t)x + (size_t)(y / 8) * width;
  }

  static uint8_t bitMask(int16_t y){
    return (uint8_t)(1u << (y & 7));
  }

private:
  bool contains(int32_t x, int32_t y) const{
    return x >= 0 && x < width_ && y >= 0 && y < height_;
  }

  void writeBit(int16_t x, int16_t y, bool on);

  int16_t width_ = 0;
  int16_t height_ = 0;
  std::vector<uint8_t> buffer_;
};

} // namespace monoled::drivers

#endif // MONOLED_INCLUDE_DRIVERS_OLED_FRAME_BUFFER_HPP_
