/*****************************************************************
 * File:      LinuxHalLog.hpp
 * Category:  src/HAL/Linux
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Linux implementation of HAL logging interface using
 *    stdio streams for output.
 *****************************************************************/

#ifndef MONOLED_SRC_HAL_LINUX_HAL_LOG_HPP_
#define MONOLED_SRC_HAL_LINUX_HAL_LOG_HPP_

#include "HAL/IHalLog.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>

namespace monoled::hal::linux_hal{

/** Console Logger Implementation
 *
 * Lines look like "[I][1234][SSD1306] message", where the number
 * is milliseconds since init().
 */
class LinuxHalLog : public IHalLog{
private:
  static constexpr size_t LOG_BUFFER_SIZE = 256;

  FILE* stream_ = stderr;
  LogLevel level_ = LogLevel::INFO;
  char buffer_[LOG_BUFFER_SIZE];
  bool initialized_ = false;
  uint64_t start_ms_ = 0;

  static uint64_t monotonicMs(){
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (uint64_t)ts.tv_sec * 1000u + (uint64_t)ts.tv_nsec / 1000000u;
  }

  void printLog(LogLevel lvl, const char* tag, const char* format, va_list args){
    if(lvl > level_ || !initialized_) return;

    unsigned long ms = (unsigned long)(monotonicMs() - start_ms_);
    int len = snprintf(buffer_, LOG_BUFFER_SIZE, "[%c][%lu][%s] ",
                       logLevelChar(lvl), ms, tag);

    if(len > 0 && len < (int)LOG_BUFFER_SIZE - 1){
      vsnprintf(buffer_ + len, LOG_BUFFER_SIZE - len, format, args);
    }

    fprintf(stream_, "%s\n", buffer_);
  }

public:
  explicit LinuxHalLog(FILE* stream = stderr) : stream_(stream){}

  HalResult init(LogLevel level = LogLevel::INFO) override{
    if(!stream_) return HalResult::INVALID_PARAM;
    level_ = level;
    start_ms_ = monotonicMs();
    initialized_ = true;
    return HalResult::OK;
  }

  void setLevel(LogLevel level) override{
    level_ = level;
  }

  LogLevel getLevel() const override{
    return level_;
  }

  void error(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::ERROR, tag, format, args);
    va_end(args);
  }

  void warn(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::WARN, tag, format, args);
    va_end(args);
  }

  void info(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::INFO, tag, format, args);
    va_end(args);
  }

  void debug(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::DEBUG, tag, format, args);
    va_end(args);
  }

  void verbose(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(LogLevel::VERBOSE, tag, format, args);
    va_end(args);
  }

  void log(LogLevel level, const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    printLog(level, tag, format, args);
    va_end(args);
  }

  void logResult(HalResult result, const char* tag, const char* operation) override{
    if(result == HalResult::OK){
      info(tag, "%s: OK", operation);
    }else{
      error(tag, "%s: FAILED (%s)", operation, halResultToString(result));
    }
  }

  void flush() override{
    fflush(stream_);
  }
};

} // namespace monoled::hal::linux_hal

#endif // MONOLED_SRC_HAL_LINUX_HAL_LOG_HPP_
