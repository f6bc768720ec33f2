/*****************************************************************
 * File:      Esp32HalLog.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of the HAL logging interface. Lines
 *    go to the Arduino Serial port as
 *        [L][millis][TAG] message
 *    A FreeRTOS mutex keeps lines from the engine worker and
 *    the main loop from interleaving.
 *****************************************************************/

#ifndef DMXSEQ_SRC_HAL_ESP32_HAL_LOG_HPP_
#define DMXSEQ_SRC_HAL_ESP32_HAL_LOG_HPP_

#include "dmxseq/HAL/IHalLog.hpp"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <atomic>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

namespace dmxseq::hal::esp32{

class Esp32HalLog : public IHalLog{
public:
  Esp32HalLog() = default;

  ~Esp32HalLog() override{
    if(mutex_) vSemaphoreDelete(mutex_);
  }

  HalResult init(LogLevel level = LogLevel::INFO) override{
    if(!mutex_){
      mutex_ = xSemaphoreCreateMutex();
      if(!mutex_) return HalResult::NO_MEMORY;
    }
    level_ = level;
    return HalResult::OK;
  }

  void setLevel(LogLevel level) override{ level_ = level; }
  LogLevel getLevel() const override{ return level_; }

  void error(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    write(LogLevel::ERROR, tag, format, args);
    va_end(args);
  }

  void warn(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    write(LogLevel::WARN, tag, format, args);
    va_end(args);
  }

  void info(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    write(LogLevel::INFO, tag, format, args);
    va_end(args);
  }

  void debug(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    write(LogLevel::DEBUG, tag, format, args);
    va_end(args);
  }

  void verbose(const char* tag, const char* format, ...) override{
    va_list args;
    va_start(args, format);
    write(LogLevel::VERBOSE, tag, format, args);
    va_end(args);
  }

  void logResult(HalResult result, const char* tag, const char* operation) override{
    if(result == HalResult::OK) info(tag, "%s: OK", operation);
    else error(tag, "%s: FAILED (%s)", operation, halResultToString(result));
  }

  void flush() override{
    if(!mutex_ || xSemaphoreTake(mutex_, portMAX_DELAY) != pdTRUE) return;
    Serial.flush();
    xSemaphoreGive(mutex_);
  }

private:
  static constexpr size_t LINE_MAX = 256;
  static constexpr const char* ELLIPSIS = "...";

  void write(LogLevel level, const char* tag, const char* format, va_list args){
    // Nothing prints before init(); the mutex doubles as the ready flag
    if(!mutex_ || level == LogLevel::NONE || level > level_.load()) return;

    // Formatted on the caller's stack so the lock covers only the UART write
    char line[LINE_MAX];
    int prefix = snprintf(line, sizeof(line), "[%c][%lu][%s] ",
                          logLevelChar(level), (unsigned long)::millis(), tag ? tag : "?");
    if(prefix < 0) return;
    if(static_cast<size_t>(prefix) < sizeof(line)){
      int body = vsnprintf(line + prefix, sizeof(line) - prefix, format, args);
      if(body >= 0 && static_cast<size_t>(prefix + body) >= sizeof(line)){
        memcpy(line + sizeof(line) - 1 - strlen(ELLIPSIS), ELLIPSIS, strlen(ELLIPSIS));
      }
    }

    if(xSemaphoreTake(mutex_, portMAX_DELAY) != pdTRUE) return;
    Serial.println(line);
    xSemaphoreGive(mutex_);
  }

  std::atomic<LogLevel> level_{LogLevel::INFO};
  SemaphoreHandle_t mutex_ = nullptr;
};

} // namespace dmxseq::hal::esp32

#endif // DMXSEQ_SRC_HAL_ESP32_HAL_LOG_HPP_
