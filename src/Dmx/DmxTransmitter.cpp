/*****************************************************************
 * File:      DmxTransmitter.cpp
 * Category:  src/Dmx
 *
 * Purpose:
 *    Bit-banged DMX512 frame output over the GPIO HAL.
 *****************************************************************/

#include "dmxseq/Dmx/DmxTransmitter.hpp"

namespace dmxseq::dmx{

using hal::GpioMode;
using hal::GpioState;
using hal::HalResult;
using hal::timestamp_us_t;

DmxTransmitter::DmxTransmitter(hal::IHalGpio* gpio, hal::IHalSystemTimer* timer, hal::IHalLog* log)
  : gpio_(gpio), timer_(timer), log_(log){}

// ============================================================
// Setup
// ============================================================

HalResult DmxTransmitter::init(const DmxLineConfig& config){
  config_ = config;
  line_ok_ = false;
  unavailable_logged_ = false;

  if(config_.break_us < DMX_MIN_BREAK_US){
    if(log_) log_->warn(TAG, "Break %lu us below minimum, using %lu us",
                        (unsigned long)config_.break_us, (unsigned long)DMX_MIN_BREAK_US);
    config_.break_us = DMX_MIN_BREAK_US;
  }
  if(config_.mab_us < DMX_MIN_MAB_US){
    if(log_) log_->warn(TAG, "MAB %lu us below minimum, using %lu us",
                        (unsigned long)config_.mab_us, (unsigned long)DMX_MIN_MAB_US);
    config_.mab_us = DMX_MIN_MAB_US;
  }
  if(config_.bit_us == 0){
    config_.bit_us = DMX_BIT_US;
  }

  if(!gpio_ || !timer_){
    if(log_) log_->error(TAG, "No GPIO driver, DMX output disabled");
    return HalResult::NOT_INITIALIZED;
  }

  HalResult result = gpio_->pinMode(config_.data_pin, GpioMode::GPIO_OUTPUT);
  if(result != HalResult::OK){
    if(log_) log_->error(TAG, "Cannot configure data pin %d: %s",
                         config_.data_pin, hal::halResultToString(result));
    return result;
  }

  // Idle state is mark (high)
  result = gpio_->digitalWrite(config_.data_pin, GpioState::GPIO_HIGH);
  if(result != HalResult::OK){
    if(log_) log_->error(TAG, "Cannot drive data pin %d: %s",
                         config_.data_pin, hal::halResultToString(result));
    return result;
  }
  level_high_ = true;

  if(config_.control_pin != hal::GPIO_PIN_NONE){
    HalResult ctrl = gpio_->pinMode(config_.control_pin, GpioMode::GPIO_OUTPUT);
    if(ctrl == HalResult::OK){
      ctrl = gpio_->digitalWrite(config_.control_pin, GpioState::GPIO_LOW);
    }
    if(ctrl != HalResult::OK){
      if(log_) log_->warn(TAG, "Control pin %d unavailable: %s",
                          config_.control_pin, hal::halResultToString(ctrl));
      config_.control_pin = hal::GPIO_PIN_NONE;
    }
  }
  control_active_ = false;

  line_ok_ = true;
  if(log_) log_->info(TAG, "DMX line on GPIO %d (break=%lu us, MAB=%lu us, frame~%lu us)",
                      config_.data_pin, (unsigned long)config_.break_us,
                      (unsigned long)config_.mab_us, (unsigned long)nominalFrameUs(config_));
  return HalResult::OK;
}

// ============================================================
// Frame Operations
// ============================================================

void DmxTransmitter::writeChannel(int32_t address, int32_t value){
  frame_.set(address, value);
  transmitFrame();
}

void DmxTransmitter::resetAll(){
  frame_.clear();
  transmitFrame();
}

HalResult DmxTransmitter::transmitFrame(){
  if(!line_ok_){
    if(!unavailable_logged_){
      if(log_) log_->warn(TAG, "DMX line unavailable, frame not sent");
      unavailable_logged_ = true;
    }
    return HalResult::NOT_INITIALIZED;
  }

  const timestamp_us_t start = timer_->micros();
  timestamp_us_t edge = start;

  // Break
  if(!setLevel(false)) return HalResult::WRITE_FAILED;
  edge += config_.break_us;
  waitUntil(edge);

  // Mark after break
  if(!setLevel(true)) return HalResult::WRITE_FAILED;
  edge += config_.mab_us;
  waitUntil(edge);

  const uint8_t* data = frame_.data();
  for(size_t i = 0; i < DMX_FRAME_SIZE; i++){
    if(!sendSlot(data[i], &edge)) return HalResult::WRITE_FAILED;
  }

  transmit_count_++;
  last_frame_us_ = static_cast<uint32_t>(timer_->micros() - start);
  return HalResult::OK;
}

// ============================================================
// Control Signal
// ============================================================

void DmxTransmitter::setControlSignal(bool active){
  if(!gpio_ || config_.control_pin == hal::GPIO_PIN_NONE) return;

  HalResult result = gpio_->digitalWrite(config_.control_pin,
                                         active ? GpioState::GPIO_HIGH : GpioState::GPIO_LOW);
  if(result != HalResult::OK){
    if(log_) log_->warn(TAG, "Control pin %d write failed: %s",
                        config_.control_pin, hal::halResultToString(result));
    return;
  }
  control_active_ = active;
  if(log_) log_->debug(TAG, "Control signal %s", active ? "on" : "off");
}

void DmxTransmitter::releaseLine(){
  setControlSignal(false);
  if(!gpio_ || level_high_) return;

  // A line left low reads as a Break; try the mark even after a failure
  if(line_ok_){
    setLevel(true);
  }else if(gpio_->digitalWrite(config_.data_pin, GpioState::GPIO_HIGH) == HalResult::OK){
    level_high_ = true;
  }
}

// ============================================================
// Line Helpers
// ============================================================

bool DmxTransmitter::setLevel(bool high){
  if(high == level_high_) return true;

  HalResult result = gpio_->digitalWrite(config_.data_pin,
                                         high ? GpioState::GPIO_HIGH : GpioState::GPIO_LOW);
  if(result != HalResult::OK){
    markLineFailed(result, "digitalWrite");
    return false;
  }
  level_high_ = high;
  return true;
}

void DmxTransmitter::waitUntil(timestamp_us_t deadline){
  timestamp_us_t now = timer_->micros();
  if(deadline > now){
    timer_->delayUs(static_cast<uint32_t>(deadline - now));
  }
}

bool DmxTransmitter::sendSlot(uint8_t value, timestamp_us_t* edge){
  // Start bit
  if(!setLevel(false)) return false;
  *edge += config_.bit_us;
  waitUntil(*edge);

  // Data bits, LSB first
  for(uint8_t bit = 0; bit < 8; bit++){
    if(!setLevel(((value >> bit) & 0x01) != 0)) return false;
    *edge += config_.bit_us;
    waitUntil(*edge);
  }

  // Two stop bits
  if(!setLevel(true)) return false;
  *edge += 2 * config_.bit_us;
  waitUntil(*edge);
  return true;
}

void DmxTransmitter::markLineFailed(HalResult result, const char* operation){
  line_ok_ = false;
  unavailable_logged_ = true;
  if(log_) log_->error(TAG, "%s failed mid-frame (%s), DMX line disabled",
                       operation, hal::halResultToString(result));
}

} // namespace dmxseq::dmx
