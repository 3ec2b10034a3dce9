/*****************************************************************
 * File:      ImageSource.hpp
 * Category:  include/Drivers
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Rectangular RGB pixel sources that can be blitted into a
 *    monochrome frame buffer. Decoding image files is left to
 *    the host; anything that can answer getPixel() will do.
 *****************************************************************/

#ifndef MONOLED_INCLUDE_DRIVERS_IMAGE_SOURCE_HPP_
#define MONOLED_INCLUDE_DRIVERS_IMAGE_SOURCE_HPP_

#include "HAL/HalTypes.hpp"
#include <vector>

namespace monoled::drivers{

/** Read-only RGB raster, origin at top-left */
class IImageSource{
public:
  virtual ~IImageSource() = default;

  virtual int16_t getWidth() const = 0;
  virtual int16_t getHeight() const = 0;

  /** Color at (x, y); callers stay within getWidth() x getHeight() */
  virtual hal::RGB getPixel(int16_t x, int16_t y) const = 0;
};

/** In-memory RGB image */
class RgbImage : public IImageSource{
private:
  int16_t width_ = 0;
  int16_t height_ = 0;
  std::vector<hal::RGB> pixels_;

public:
  RgbImage() = default;

  RgbImage(int16_t width, int16_t height, const hal::RGB& color = hal::RGB())
    : width_(width > 0 ? width : 0),
      height_(height > 0 ? height : 0),
      pixels_((size_t)width_ * height_, color){}

  int16_t getWidth() const override{ return width_; }
  int16_t getHeight() const override{ return height_; }

  hal::RGB getPixel(int16_t x, int16_t y) const override{
    if(x < 0 || x >= width_ || y < 0 || y >= height_) return hal::RGB();
    return pixels_[(size_t)y * width_ + x];
  }

  hal::HalResult setPixel(int16_t x, int16_t y, const hal::RGB& color){
    if(x < 0 || x >= width_ || y < 0 || y >= height_) return hal::HalResult::OUT_OF_BOUNDS;
    pixels_[(size_t)y * width_ + x] = color;
    return hal::HalResult::OK;
  }

  void fill(const hal::RGB& color){
    for(auto& px : pixels_){
      px = color;
    }
  }
};

} // namespace monoled::drivers

#endif // MONOLED_INCLUDE_DRIVERS_IMAGE_SOURCE_HPP_
