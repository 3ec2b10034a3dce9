/*****************************************************************
 * File:      IHalLog.hpp
 * Category:  include/HAL
 * Author:    XCR1793 (Feather Forge)
 *
 * Purpose:
 *    Logging Hardware Abstraction Layer interface.
 *    Provides platform-independent logging for the transport
 *    implementations and the display drivers.
 *****************************************************************/

#ifndef MONOLED_INCLUDE_HAL_IHAL_LOG_HPP_
#define MONOLED_INCLUDE_HAL_IHAL_LOG_HPP_

#include "HalTypes.hpp"

namespace monoled::hal{

// ============================================================
// Log Levels
// ============================================================

/** Log severity levels */
enum class LogLevel : uint8_t{
  NONE = 0,     // No logging
  ERROR = 1,    // Errors only
  WARN = 2,     // Warnings and errors
  INFO = 3,     // Info, warnings, errors
  DEBUG = 4,    // Debug and above
  VERBOSE = 5   // All messages
};

// ============================================================
// Log Interface
// ============================================================

/** Logging Hardware Abstraction Interface
 *
 * Implementations can output to a console, a file, syslog, etc.
 * Components take an optional IHalLog*; a null logger means silent.
 */
class IHalLog{
public:
  virtual ~IHalLog() = default;

  /** Initialize logging system
   * @param level Minimum log level to output
   * @return HalResult::OK on success
   */
  virtual HalResult init(LogLevel level = LogLevel::INFO) = 0;

  /** Set log level
   * @param level New log level
   */
  virtual void setLevel(LogLevel level) = 0;

  /** Get current log level
   * @return Current log level
   */
  virtual LogLevel getLevel() const = 0;

  /** Log error message
   * @param tag Module tag
   * @param format Printf-style format string
   */
  virtual void error(const char* tag, const char* format, ...) = 0;

  /** Log warning message */
  virtual void warn(const char* tag, const char* format, ...) = 0;

  /** Log info message */
  virtual void info(const char* tag, const char* format, ...) = 0;

  /** Log debug message */
  virtual void debug(const char* tag, const char* format, ...) = 0;

  /** Log verbose message */
  virtual void verbose(const char* tag, const char* format, ...) = 0;

  /** Log with specified level
   * @param level Log level
   * @param tag Module tag
   * @param format Printf-style format string
   */
  virtual void log(LogLevel level, const char* tag, const char* format, ...) = 0;

  /** Log HalResult with context
   * @param result Result code to log
   * @param tag Module tag
   * @param operation Description of operation
   */
  virtual void logResult(HalResult result, const char* tag, const char* operation) = 0;

  /** Flush log output (if buffered) */
  virtual void flush() = 0;
};

// ============================================================
// Helper Functions
// ============================================================

/** Convert LogLevel to string */
inline const char* logLevelToString(LogLevel level){
  switch(level){
    case LogLevel::NONE:    return "NONE";
    case LogLevel::ERROR:   return "ERROR";
    case LogLevel::WARN:    return "WARN";
    case LogLevel::INFO:    return "INFO";
    case LogLevel::DEBUG:   return "DEBUG";
    case LogLevel::VERBOSE: return "VERBOSE";
    default:                return "UNKNOWN";
  }
}

/** Get log level prefix character */
inline char logLevelChar(LogLevel level){
  switch(level){
    case LogLevel::ERROR:   return 'E';
    case LogLevel::WARN:    return 'W';
    case LogLevel::INFO:    return 'I';
    case LogLevel::DEBUG:   return 'D';
    case LogLevel::VERBOSE: return 'V';
    default:                return '?';
  }
}

} // namespace monoled::hal

#endif // MONOLED_INCLUDE_HAL_IHAL_LOG_HPP_
