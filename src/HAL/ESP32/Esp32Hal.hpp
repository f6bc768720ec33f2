/*****************************************************************
 * File:      Esp32Hal.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    Pulls in the ESP32 drivers and bundles them for main.cpp.
 *****************************************************************/

#ifndef DMXSEQ_SRC_HAL_ESP32_HAL_HPP_
#define DMXSEQ_SRC_HAL_ESP32_HAL_HPP_

#include "Esp32HalAudioPlayer.hpp"
#include "Esp32HalGpio.hpp"
#include "Esp32HalI2s.hpp"
#include "Esp32HalLog.hpp"
#include "Esp32HalTimer.hpp"
#include "Esp32SdCard.hpp"

namespace dmxseq::hal::esp32{

/** Every driver of the controller board, wired to the shared log
 *
 * Bring-up order: initCore() first so later steps can log,
 * then initStorage() and, when the board has a DAC, initAudio().
 */
struct Esp32HalFactory{
  Esp32HalLog log;
  Esp32HalSystemTimer timer;
  Esp32HalGpio gpio;
  Esp32HalI2s i2s;
  Esp32HalAudioPlayer audio;
  Esp32SdCard sd;

  Esp32HalFactory()
    : gpio(&log), i2s(&log), audio(&i2s, &log), sd(&log){}

  HalResult initCore(LogLevel level){
    HalResult result = log.init(level);
    return result == HalResult::OK ? gpio.init() : result;
  }

  HalResult initStorage(const SdCardConfig& config){ return sd.init(config); }
  HalResult initAudio(const I2sConfig& config){ return i2s.init(config); }
};

} // namespace dmxseq::hal::esp32

#endif // DMXSEQ_SRC_HAL_ESP32_HAL_HPP_
