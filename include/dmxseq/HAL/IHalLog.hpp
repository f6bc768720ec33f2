/*****************************************************************
 * File:      IHalLog.hpp
 * Category:  include/dmxseq/HAL
 *
 * Purpose:
 *    Diagnostic logging interface used by every component,
 *    plus the level and result-code name helpers.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_HAL_IHAL_LOG_HPP_
#define DMXSEQ_INCLUDE_HAL_IHAL_LOG_HPP_

#include "HalTypes.hpp"

namespace dmxseq::hal{

// ============================================================
// Log Levels
// ============================================================

/** Threshold: a message prints when its level <= the configured one */
enum class LogLevel : uint8_t{
  NONE = 0,
  ERROR = 1,
  WARN = 2,
  INFO = 3,
  DEBUG = 4,
  VERBOSE = 5
};

// ============================================================
// Log Interface
// ============================================================

/** Diagnostic log sink
 *
 * Messages are printf-style and carry the TAG of the module that
 * wrote them. Calls arrive from the engine worker and from control
 * calls at the same time, so implementations serialize output.
 */
class IHalLog{
public:
  virtual ~IHalLog() = default;

  /** Prepare the output and set the threshold */
  virtual HalResult init(LogLevel level = LogLevel::INFO) = 0;

  virtual void setLevel(LogLevel level) = 0;
  virtual LogLevel getLevel() const = 0;

  virtual void error(const char* tag, const char* format, ...) = 0;
  virtual void warn(const char* tag, const char* format, ...) = 0;
  virtual void info(const char* tag, const char* format, ...) = 0;
  virtual void debug(const char* tag, const char* format, ...) = 0;
  virtual void verbose(const char* tag, const char* format, ...) = 0;

  /** "<operation>: OK" at INFO, or "<operation>: FAILED (<code>)" at ERROR */
  virtual void logResult(HalResult result, const char* tag, const char* operation) = 0;

  virtual void flush() = 0;
};

// ============================================================
// Helper Functions
// ============================================================

inline const char* halResultToString(HalResult result){
  switch(result){
    case HalResult::OK:                  return "OK";
    case HalResult::TIMEOUT:             return "TIMEOUT";
    case HalResult::INVALID_PARAM:       return "INVALID_PARAM";
    case HalResult::NOT_INITIALIZED:     return "NOT_INITIALIZED";
    case HalResult::NOT_SUPPORTED:       return "NOT_SUPPORTED";
    case HalResult::KEY_NOT_FOUND:       return "KEY_NOT_FOUND";
    case HalResult::HARDWARE_FAULT:      return "HARDWARE_FAULT";
    case HalResult::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
    case HalResult::NO_MEMORY:           return "NO_MEMORY";
    case HalResult::WRITE_FAILED:        return "WRITE_FAILED";
    default:                             return "UNKNOWN";
  }
}

/** Single character used as the level column of a log line */
inline char logLevelChar(LogLevel level){
  switch(level){
    case LogLevel::ERROR:   return 'E';
    case LogLevel::WARN:    return 'W';
    case LogLevel::INFO:    return 'I';
    case LogLevel::DEBUG:   return 'D';
    case LogLevel::VERBOSE: return 'V';
    default:                return '-';
  }
}

/** Parse a level name ("ERROR", "warn", "Info", ...)
 * @param name Level name, case-insensitive
 * @param out Receives the level when recognised
 * @return true if the name was recognised
 */
inline bool parseLogLevel(const char* name, LogLevel* out){
  if(!name || !out) return false;

  struct Entry{ const char* name; LogLevel level; };
  static constexpr Entry LEVELS[] = {
    {"NONE", LogLevel::NONE},
    {"ERROR", LogLevel::ERROR},
    {"WARN", LogLevel::WARN},
    {"WARNING", LogLevel::WARN},
    {"INFO", LogLevel::INFO},
    {"DEBUG", LogLevel::DEBUG},
    {"VERBOSE", LogLevel::VERBOSE}
  };

  for(const Entry& entry : LEVELS){
    const char* a = name;
    const char* b = entry.name;
    while(*a && *b){
      char c = *a;
      if(c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
      if(c != *b) break;
      a++;
      b++;
    }
    if(*a == '\0' && *b == '\0'){
      *out = entry.level;
      return true;
    }
  }
  return false;
}

} // namespace dmxseq::hal

#endif // DMXSEQ_INCLUDE_HAL_IHAL_LOG_HPP_
