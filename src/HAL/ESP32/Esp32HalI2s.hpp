/*****************************************************************
 * File:      Esp32HalI2s.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    ESP32 implementation of the I2S output interface using the
 *    legacy ESP-IDF I2S driver. Transmit only, 16-bit samples;
 *    the clock follows each clip through setFormat().
 *****************************************************************/

#ifndef DMXSEQ_SRC_HAL_ESP32_HAL_I2S_HPP_
#define DMXSEQ_SRC_HAL_ESP32_HAL_I2S_HPP_

#include "dmxseq/HAL/IHalI2s.hpp"
#include "dmxseq/HAL/IHalLog.hpp"
#include <Arduino.h>
#include <driver/i2s.h>

namespace dmxseq::hal::esp32{

class Esp32HalI2s : public IHalI2s{
public:
  explicit Esp32HalI2s(IHalLog* log = nullptr) : log_(log){}

  ~Esp32HalI2s() override{
    if(initialized_) deinit();
  }

  HalResult init(const I2sConfig& config) override{
    if(initialized_) return HalResult::ALREADY_INITIALIZED;
    config_ = config;

    HalResult result = installDriver();
    if(result != HalResult::OK) return result;

    result = routePins();
    if(result != HalResult::OK){
      i2s_driver_uninstall(port());
      return result;
    }

    initialized_ = true;
    if(log_) log_->info(TAG, "Audio out on I2S%d (BCK=%d WS=%d DOUT=%d)",
                        config_.port, config_.bck_pin, config_.ws_pin, config_.data_pin);
    return HalResult::OK;
  }

  HalResult deinit() override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    i2s_driver_uninstall(port());
    initialized_ = false;
    return HalResult::OK;
  }

  bool isInitialized() const override{ return initialized_; }

  HalResult write(const int16_t* buffer, size_t samples, size_t* samples_written, uint32_t timeout_ms = 0) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    if(!buffer) return HalResult::INVALID_PARAM;

    const size_t bytes = samples * sizeof(int16_t);
    size_t sent = 0;
    esp_err_t err = i2s_write(port(), buffer, bytes, &sent,
                              timeout_ms == 0 ? portMAX_DELAY : pdMS_TO_TICKS(timeout_ms));
    if(samples_written) *samples_written = sent / sizeof(int16_t);

    if(err != ESP_OK) return HalResult::WRITE_FAILED;
    return sent < bytes ? HalResult::TIMEOUT : HalResult::OK;
  }

  HalResult setFormat(uint32_t sample_rate, I2sChannelMode channel_mode) override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    if(sample_rate == 0) return HalResult::INVALID_PARAM;
    if(sample_rate == config_.sample_rate && channel_mode == config_.channel_mode) return HalResult::OK;

    i2s_channel_t channels = channel_mode == I2sChannelMode::MONO ? I2S_CHANNEL_MONO : I2S_CHANNEL_STEREO;
    esp_err_t err = i2s_set_clk(port(), sample_rate, I2S_BITS_PER_SAMPLE_16BIT, channels);
    if(err != ESP_OK){
      if(log_) log_->error(TAG, "Clock change to %lu Hz failed: %s",
                           (unsigned long)sample_rate, esp_err_to_name(err));
      return HalResult::HARDWARE_FAULT;
    }
    config_.sample_rate = sample_rate;
    config_.channel_mode = channel_mode;
    return HalResult::OK;
  }

  HalResult silence() override{
    if(!initialized_) return HalResult::NOT_INITIALIZED;
    return i2s_zero_dma_buffer(port()) == ESP_OK ? HalResult::OK : HalResult::WRITE_FAILED;
  }

private:
  static constexpr const char* TAG = "I2S";
  static constexpr int DMA_BUFFERS = 8;

  i2s_port_t port() const{
    return config_.port == 0 ? I2S_NUM_0 : I2S_NUM_1;
  }

  HalResult installDriver(){
    i2s_config_t cfg = {};
    cfg.mode = static_cast<i2s_mode_t>(I2S_MODE_MASTER | I2S_MODE_TX);
    cfg.sample_rate = config_.sample_rate;
    cfg.bits_per_sample = I2S_BITS_PER_SAMPLE_16BIT;
    cfg.channel_format = config_.channel_mode == I2sChannelMode::MONO
                         ? I2S_CHANNEL_FMT_ONLY_LEFT : I2S_CHANNEL_FMT_RIGHT_LEFT;
    cfg.communication_format = I2S_COMM_FORMAT_STAND_I2S;
    cfg.intr_alloc_flags = ESP_INTR_FLAG_LEVEL1;
    cfg.dma_buf_count = DMA_BUFFERS;
    cfg.dma_buf_len = static_cast<int>(config_.buffer_size);
    cfg.tx_desc_auto_clear = true;  // underrun plays silence instead of repeating

    esp_err_t err = i2s_driver_install(port(), &cfg, 0, nullptr);
    if(err != ESP_OK){
      if(log_) log_->error(TAG, "i2s_driver_install: %s", esp_err_to_name(err));
      return HalResult::HARDWARE_FAULT;
    }
    return HalResult::OK;
  }

  HalResult routePins(){
    i2s_pin_config_t pins = {};
    pins.mck_io_num = I2S_PIN_NO_CHANGE;
    pins.bck_io_num = config_.bck_pin;
    pins.ws_io_num = config_.ws_pin;
    pins.data_out_num = config_.data_pin;
    pins.data_in_num = I2S_PIN_NO_CHANGE;

    esp_err_t err = i2s_set_pin(port(), &pins);
    if(err != ESP_OK){
      if(log_) log_->error(TAG, "i2s_set_pin: %s", esp_err_to_name(err));
      return HalResult::HARDWARE_FAULT;
    }
    return HalResult::OK;
  }

  IHalLog* log_ = nullptr;
  I2sConfig config_;
  bool initialized_ = false;
};

} // namespace dmxseq::hal::esp32

#endif // DMXSEQ_SRC_HAL_ESP32_HAL_I2S_HPP_
