/*****************************************************************
 * File:      Esp32HalGpio.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of the HAL GPIO interface. Pins are
 *    configured through the ESP-IDF GPIO driver; writes use
 *    gpio_set_level, which is fast enough for 4 us DMX bits.
 *****************************************************************/

#ifndef DMXSEQ_SRC_HAL_ESP32_HAL_GPIO_HPP_
#define DMXSEQ_SRC_HAL_ESP32_HAL_GPIO_HPP_

#include "dmxseq/HAL/IHalGpio.hpp"
#include "dmxseq/HAL/IHalLog.hpp"
#include <Arduino.h>
#include <driver/gpio.h>

namespace dmxseq::hal::esp32{

/** ESP32 GPIO Implementation */
class Esp32HalGpio : public IHalGpio{
private:
  static constexpr const char* TAG = "GPIO";
  IHalLog* log_ = nullptr;
  bool initialized_ = false;

public:
  explicit Esp32HalGpio(IHalLog* log = nullptr) : log_(log){}

  HalResult init() override{
    initialized_ = true;
    if(log_) log_->info(TAG, "GPIO initialized");
    return HalResult::OK;
  }

  HalResult pinMode(gpio_pin_t pin, GpioMode mode) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;

    gpio_num_t num = static_cast<gpio_num_t>(pin);
    if(mode == GpioMode::GPIO_OUTPUT && !GPIO_IS_VALID_OUTPUT_GPIO(num)){
      if(log_) log_->error(TAG, "Pin %d cannot drive an output", pin);
      return HalResult::INVALID_PARAM;
    }
    if(!GPIO_IS_VALID_GPIO(num)){
      if(log_) log_->error(TAG, "Pin %d does not exist", pin);
      return HalResult::INVALID_PARAM;
    }

    gpio_config_t io = {};
    io.pin_bit_mask = 1ULL << pin;
    io.intr_type = GPIO_INTR_DISABLE;
    io.pull_up_en = GPIO_PULLUP_DISABLE;
    io.pull_down_en = GPIO_PULLDOWN_DISABLE;

    switch(mode){
      case GpioMode::GPIO_INPUT:
        io.mode = GPIO_MODE_INPUT;
        break;
      case GpioMode::GPIO_OUTPUT:
        io.mode = GPIO_MODE_OUTPUT;
        break;
      default:
        return HalResult::INVALID_PARAM;
    }

    esp_err_t err = gpio_config(&io);
    if(err != ESP_OK){
      if(log_) log_->error(TAG, "gpio_config(%d) failed: %s", pin, esp_err_to_name(err));
      return HalResult::HARDWARE_FAULT;
    }
    if(log_) log_->debug(TAG, "Pin %d mode set to %d", pin, (int)mode);
    return HalResult::OK;
  }

  HalResult digitalWrite(gpio_pin_t pin, GpioState state) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    esp_err_t err = gpio_set_level(static_cast<gpio_num_t>(pin), state == GpioState::GPIO_HIGH ? 1 : 0);
    return err == ESP_OK ? HalResult::OK : HalResult::WRITE_FAILED;
  }
};

} // namespace dmxseq::hal::esp32

#endif // DMXSEQ_SRC_HAL_ESP32_HAL_GPIO_HPP_
