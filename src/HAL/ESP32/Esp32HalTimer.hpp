/*****************************************************************
 * File:      Esp32HalTimer.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of the HAL timer interface.
 *    micros() comes from the 64-bit esp_timer so DMX edge
 *    deadlines never wrap; millisecond delays yield to
 *    FreeRTOS, microsecond delays busy-wait.
 *****************************************************************/

#ifndef DMXSEQ_SRC_HAL_ESP32_HAL_TIMER_HPP_
#define DMXSEQ_SRC_HAL_ESP32_HAL_TIMER_HPP_

#include "dmxseq/HAL/IHalTimer.hpp"
#include <Arduino.h>
#include <esp_timer.h>

namespace dmxseq::hal::esp32{

class Esp32HalSystemTimer : public IHalSystemTimer{
public:
  timestamp_ms_t millis() const override{
    return static_cast<timestamp_ms_t>(esp_timer_get_time() / 1000);
  }

  timestamp_us_t micros() const override{
    return static_cast<timestamp_us_t>(esp_timer_get_time());
  }

  void delayMs(uint32_t ms) override{ ::delay(ms); }
  void delayUs(uint32_t us) override{ ::delayMicroseconds(us); }
};

} // namespace dmxseq::hal::esp32

#endif // DMXSEQ_SRC_HAL_ESP32_HAL_TIMER_HPP_
