/*****************************************************************
 * File:      Esp32SdCard.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    SD card storage over SPI using the ESP-IDF FAT VFS.
 *    Sequences, sounds and config.json live under /sdcard and
 *    are reached with plain POSIX file calls once mounted.
 *****************************************************************/

#ifndef DMXSEQ_SRC_HAL_ESP32_SDCARD_HPP_
#define DMXSEQ_SRC_HAL_ESP32_SDCARD_HPP_

#include "dmxseq/HAL/IHalStorage.hpp"
#include "dmxseq/HAL/IHalLog.hpp"
#include "esp_vfs_fat.h"
#include "sdmmc_cmd.h"
#include "driver/sdspi_host.h"
#include "driver/spi_common.h"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace dmxseq::hal::esp32{

/** ESP32 SD Card HAL Implementation */
class Esp32SdCard : public IHalStorage{
private:
  static constexpr const char* TAG = "SDCARD";
  static constexpr const char* MOUNT_POINT = "/sdcard";
  static constexpr int MOUNT_RETRIES = 3;
  static constexpr uint32_t RETRY_DELAY_MS = 500;

  IHalLog* log_ = nullptr;
  SdCardConfig config_;
  bool bus_ready_ = false;
  bool mounted_ = false;
  sdmmc_card_t* card_ = nullptr;
  spi_host_device_t host_id_ = SPI2_HOST;

  HalResult mount(){
    esp_vfs_fat_sdmmc_mount_config_t mount_config = {};
    mount_config.format_if_mount_failed = false;
    mount_config.max_files = 6;
    mount_config.allocation_unit_size = 16 * 1024;

    sdspi_device_config_t slot_config = SDSPI_DEVICE_CONFIG_DEFAULT();
    slot_config.gpio_cs = static_cast<gpio_num_t>(config_.cs_pin);
    slot_config.host_id = host_id_;

    sdmmc_host_t host = SDSPI_HOST_DEFAULT();
    host.slot = host_id_;
    host.max_freq_khz = config_.frequency_khz;

    // Cards can need a moment after power-up
    esp_err_t ret = ESP_FAIL;
    for(int attempt = 1; attempt <= MOUNT_RETRIES; attempt++){
      ret = esp_vfs_fat_sdspi_mount(MOUNT_POINT, &host, &slot_config, &mount_config, &card_);
      if(ret == ESP_OK) break;

      if(log_) log_->warn(TAG, "Mount attempt %d/%d failed: %s",
                          attempt, MOUNT_RETRIES, esp_err_to_name(ret));
      if(attempt < MOUNT_RETRIES) vTaskDelay(pdMS_TO_TICKS(RETRY_DELAY_MS));
    }

    if(ret != ESP_OK) return HalResult::HARDWARE_FAULT;

    mounted_ = true;
    if(log_) log_->info(TAG, "Mounted at %s, %llu MB", MOUNT_POINT,
                        (unsigned long long)(getTotalSize() / (1024 * 1024)));
    return HalResult::OK;
  }

public:
  explicit Esp32SdCard(IHalLog* log = nullptr) : log_(log){}

  ~Esp32SdCard() override{
    if(bus_ready_) deinit();
  }

  HalResult init(const SdCardConfig& config) override{
    if(bus_ready_) return HalResult::ALREADY_INITIALIZED;

    config_ = config;
    if(log_) log_->info(TAG, "SPI bus MISO=%d MOSI=%d CLK=%d CS=%d",
                        config_.miso_pin, config_.mosi_pin, config_.clk_pin, config_.cs_pin);

    spi_bus_config_t bus_cfg = {};
    bus_cfg.mosi_io_num = config_.mosi_pin;
    bus_cfg.miso_io_num = config_.miso_pin;
    bus_cfg.sclk_io_num = config_.clk_pin;
    bus_cfg.quadwp_io_num = -1;
    bus_cfg.quadhd_io_num = -1;
    bus_cfg.max_transfer_sz = 4000;

    esp_err_t ret = spi_bus_initialize(host_id_, &bus_cfg, SDSPI_DEFAULT_DMA);
    if(ret != ESP_OK){
      if(log_) log_->error(TAG, "SPI bus init failed: %s", esp_err_to_name(ret));
      return HalResult::HARDWARE_FAULT;
    }
    bus_ready_ = true;

    HalResult result = mount();
    if(result != HalResult::OK){
      if(log_) log_->error(TAG, "SD card not usable (%s)", halResultToString(result));
      spi_bus_free(host_id_);
      bus_ready_ = false;
    }
    return result;
  }

  HalResult deinit() override{
    if(!bus_ready_) return HalResult::NOT_INITIALIZED;

    if(mounted_){
      esp_vfs_fat_sdcard_unmount(MOUNT_POINT, card_);
      card_ = nullptr;
      mounted_ = false;
    }
    spi_bus_free(host_id_);
    bus_ready_ = false;

    if(log_) log_->info(TAG, "SD card released");
    return HalResult::OK;
  }

  bool isMounted() const override{
    return mounted_;
  }

  const char* getMountPoint() const override{
    return MOUNT_POINT;
  }

  uint64_t getTotalSize() const override{
    if(!mounted_ || !card_) return 0;
    return (uint64_t)card_->csd.capacity * card_->csd.sector_size;
  }

  uint64_t getFreeSpace() const override{
    if(!mounted_) return 0;

    FATFS* fs;
    DWORD free_clusters;
    if(f_getfree("0:", &free_clusters, &fs) != FR_OK) return 0;
    return (uint64_t)free_clusters * fs->csize * 512;
  }
};

} // namespace dmxseq::hal::esp32

#endif // DMXSEQ_SRC_HAL_ESP32_SDCARD_HPP_
