/*****************************************************************
 * File:      OledDemo.cpp
 * Category:  src
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Demo application for an SSD1306 panel on a Linux I2C bus.
 *    Opens the panel, draws a border and a checker block, blits a
 *    small image, flushes and closes.
 *
 * Hardware:
 *    - SSD1306 128x64 or 128x32 monochrome at 0x3C
 *
 * Usage:
 *    monoled_demo [i2c-device] [height]
 *    monoled_demo /dev/i2c-1 32
 *****************************************************************/

#include <stdio.h>
#include <stdlib.h>
#include <time.h>

#include "HAL/Hal.hpp"
#include "HAL/Linux/LinuxHalLog.hpp"
#include "HAL/Linux/LinuxHalI2c.hpp"
#include "Drivers/Ssd1306Driver.hpp"

using namespace monoled;
using hal::HalResult;

static const char* TAG = "OledDemo";

static void sleepMs(long ms){
  timespec ts;
  ts.tv_sec = ms / 1000;
  ts.tv_nsec = (ms % 1000) * 1000000L;
  nanosleep(&ts, nullptr);
}

static HalResult drawBorder(drivers::Ssd1306Driver& oled){
  const int16_t w = oled.getWidth();
  const int16_t h = oled.getHeight();

  for(int16_t x = 0; x < w; x++){
    HalResult result = oled.setPixel(x, 0, true);
    if(result == HalResult::OK) result = oled.setPixel(x, h - 1, true);
    if(result != HalResult::OK) return result;
  }
  for(int16_t y = 0; y < h; y++){
    HalResult result = oled.setPixel(0, y, true);
    if(result == HalResult::OK) result = oled.setPixel(w - 1, y, true);
    if(result != HalResult::OK) return result;
  }
  return HalResult::OK;
}

static HalResult drawChecker(drivers::Ssd1306Driver& oled, int16_t x0, int16_t y0, int16_t size){
  for(int16_t y = 0; y < size; y++){
    for(int16_t x = 0; x < size; x++){
      HalResult result = oled.setPixelValue(x0 + x, y0 + y, ((x / 4) + (y / 4)) % 2);
      if(result != HalResult::OK) return result;
    }
  }
  return HalResult::OK;
}

/** Dark square with a lit diagonal, partly off the right edge */
static drivers::RgbImage makeBadge(){
  drivers::RgbImage badge(20, 20);
  for(int16_t i = 0; i < 20; i++){
    badge.setPixel(i, i, hal::RGB(255, 255, 255));
    badge.setPixel(19 - i, i, hal::RGB(255, 255, 255));
  }
  return badge;
}

int main(int argc, char** argv){
  hal::linux_hal::LinuxHalLog log;
  log.init(hal::LogLevel::DEBUG);

  hal::I2cConfig config;
  config.device_path = argc > 1 ? argv[1] : hal::defaults::I2C_DEVICE;

  drivers::OledGeometry geometry;
  geometry.width = hal::defaults::OLED_WIDTH;
  geometry.height = argc > 2 ? (int16_t)atoi(argv[2]) : hal::defaults::OLED_HEIGHT;

  if(!drivers::Ssd1306Driver::isSupportedGeometry(geometry)){
    log.error(TAG, "Unsupported panel height %d", geometry.height);
    return 2;
  }

  hal::linux_hal::LinuxHalI2cOpener opener(config, &log);
  drivers::Ssd1306Driver oled(&log);

  HalResult result = oled.open(opener, geometry);
  if(result != HalResult::OK){
    log.error(TAG, "Failed to open %s: %s (%s)", config.device_path,
              hal::halResultToString(result), oled.getLastErrorMessage());
    return 1;
  }

  // Blank, then draw
  result = oled.clearAndDraw();
  if(result == HalResult::OK) result = drawBorder(oled);
  if(result == HalResult::OK) result = drawChecker(oled, 8, 8, 16);
  if(result == HalResult::OK) result = oled.blitImage(oled.getWidth() - 12, 4, makeBadge());
  if(result == HalResult::OK) result = oled.flush();
  log.logResult(result, TAG, "Draw pattern");

  if(result == HalResult::OK){
    sleepMs(1000);
    result = oled.setInverted(true);
    if(result == HalResult::OK){
      sleepMs(1000);
      result = oled.setInverted(false);
    }
    log.logResult(result, TAG, "Invert");
  }

  HalResult scroll = oled.enableScroll(0, 7);
  log.info(TAG, "Scroll: %s", hal::halResultToString(scroll));

  HalResult closed = oled.close();
  log.logResult(closed, TAG, "Close");
  log.flush();

  return (result == HalResult::OK && closed == HalResult::OK) ? 0 : 1;
}
