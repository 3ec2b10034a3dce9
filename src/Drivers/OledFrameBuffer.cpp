/*****************************************************************
 * File:      OledFrameBuffer.cpp
 * Category:  src/Drivers
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Implementation of the packed SSD1306 frame buffer.
 *****************************************************************/

#include "Drivers/OledFrameBuffer.hpp"
#include "Drivers/Ssd1306Protocol.hpp"
#include <algorithm>

namespace monoled::drivers{

using hal::HalResult;

// ============================================================
// Geometry
// ============================================================

bool OledFrameBuffer::isValidGeometry(int16_t width, int16_t height){
  return width > 0 && height > 0 && (height % 8) == 0;
}

size_t OledFrameBuffer::bufferSizeFor(int16_t width, int16_t height){
  if(!isValidGeometry(width, height)) return 0;
  return 1 + (size_t)width * (size_t)(height / 8);
}

HalResult OledFrameBuffer::init(int16_t width, int16_t height){
  if(!isValidGeometry(width, height)) return HalResult::INVALID_PARAM;

  buffer_.assign(bufferSizeFor(width, height), 0x00);
  buffer_[0] = ssd1306::DATA_MARKER;
  width_ = width;
  height_ = height;
  return HalResult::OK;
}

void OledFrameBuffer::release(){
  buffer_.clear();
  buffer_.shrink_to_fit();
  width_ = 0;
  height_ = 0;
}

// ============================================================
// Pixel Access
// ============================================================

void OledFrameBuffer::writeBit(int16_t x, int16_t y, bool on){
  size_t index = byteIndex(x, y, width_);

  if(on){
    buffer_[index] |= bitMask(y);
  } else{
    buffer_[index] &= (uint8_t)~bitMask(y);
  }
}

HalResult OledFrameBuffer::setPixel(int16_t x, int16_t y, bool on){
  if(!isAllocated()) return HalResult::NOT_INITIALIZED;
  if(!contains(x, y)) return HalResult::OUT_OF_BOUNDS;

  writeBit(x, y, on);
  return HalResult::OK;
}

HalResult OledFrameBuffer::setPixelValue(int16_t x, int16_t y, uint8_t value){
  if(value > 1) return HalResult::OUT_OF_BOUNDS;
  return setPixel(x, y, value == 1);
}

bool OledFrameBuffer::getPixel(int16_t x, int16_t y) const{
  if(!isAllocated() || !contains(x, y)) return false;
  return (buffer_[byteIndex(x, y, width_)] & bitMask(y)) != 0;
}

HalResult OledFrameBuffer::clear(){
  return fill(false);
}

HalResult OledFrameBuffer::fill(bool on){
  if(!isAllocated()) return HalResult::NOT_INITIALIZED;
  std::fill(buffer_.begin() + 1, buffer_.end(), (uint8_t)(on ? 0xFF : 0x00));
  return HalResult::OK;
}

// ============================================================
// Image Blit
// ============================================================

HalResult OledFrameBuffer::blitImage(int16_t x, int16_t y, const IImageSource& source){
  if(!isAllocated()) return HalResult::NOT_INITIALIZED;

  const int32_t src_w = source.getWidth();
  const int32_t src_h = source.getHeight();

  for(int32_t sy = 0; sy < src_h; sy++){
    int32_t dy = (int32_t)y + sy;
    if(dy < 0) continue;
    if(dy >= height_) break;

    for(int32_t sx = 0; sx < src_w; sx++){
      int32_t dx = (int32_t)x + sx;
      if(dx < 0) continue;
      if(dx >= width_) break;

      bool lit = source.getPixel((int16_t)sx, (int16_t)sy).isLit();
      writeBit((int16_t)dx, (int16_t)dy, lit);
    }
  }

  return HalResult::OK;
}

} // namespace monoled::drivers
