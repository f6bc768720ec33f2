/*****************************************************************
 * File:      Esp32HalAudioPlayer.hpp
 * Category:  src/HAL/ESP32
 *
 * Purpose:
 *    Background PCM WAV player feeding the I2S output.
 *    play() parses the header on the caller's thread and then
 *    hands the file to a FreeRTOS task that streams it with
 *    software volume until EOF or stop().
 *****************************************************************/

#ifndef DMXSEQ_SRC_HAL_ESP32_HAL_AUDIO_PLAYER_HPP_
#define DMXSEQ_SRC_HAL_ESP32_HAL_AUDIO_PLAYER_HPP_

#include "dmxseq/HAL/IHalAudio.hpp"
#include "dmxseq/HAL/IHalI2s.hpp"
#include "dmxseq/HAL/IHalLog.hpp"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <atomic>
#include <cstdio>
#include <cstring>

namespace dmxseq::hal::esp32{

/** ESP32 WAV Player over I2S */
class Esp32HalAudioPlayer : public IHalAudioPlayer{
private:
  static constexpr const char* TAG = "AUDIO";
  static constexpr size_t CHUNK_SAMPLES = 512;
  static constexpr uint32_t TASK_STACK = 4096;
  static constexpr UBaseType_t TASK_PRIORITY = 4;
  static constexpr uint32_t STOP_WAIT_MS = 500;

  /** Stream description taken from the fmt chunk */
  struct WavFormat{
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    uint32_t data_bytes = 0;
  };

  IHalI2s* i2s_ = nullptr;
  IHalLog* log_ = nullptr;

  FILE* file_ = nullptr;
  uint32_t remaining_bytes_ = 0;
  int32_t gain_q15_ = 32767;
  std::atomic<bool> playing_{false};
  std::atomic<bool> stop_requested_{false};
  int16_t chunk_[CHUNK_SAMPLES];

  static uint16_t readLe16(const uint8_t* p){
    return (uint16_t)(p[0] | (p[1] << 8));
  }

  static uint32_t readLe32(const uint8_t* p){
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
  }

  /** Walk RIFF chunks up to the start of the sample data
   * @return true if the file is 16-bit PCM with 1 or 2 channels
   */
  static bool parseHeader(FILE* f, WavFormat* fmt){
    uint8_t riff[12];
    if(fread(riff, 1, sizeof(riff), f) != sizeof(riff)) return false;
    if(memcmp(riff, "RIFF", 4) != 0 || memcmp(riff + 8, "WAVE", 4) != 0) return false;

    bool have_fmt = false;
    uint8_t header[8];
    while(fread(header, 1, sizeof(header), f) == sizeof(header)){
      uint32_t size = readLe32(header + 4);

      if(memcmp(header, "fmt ", 4) == 0){
        uint8_t body[16];
        if(size < sizeof(body) || fread(body, 1, sizeof(body), f) != sizeof(body)) return false;
        if(readLe16(body) != 1) return false;   // PCM only
        fmt->channels = readLe16(body + 2);
        fmt->sample_rate = readLe32(body + 4);
        fmt->bits_per_sample = readLe16(body + 14);
        have_fmt = true;
        size -= sizeof(body);
      }else if(memcmp(header, "data", 4) == 0){
        fmt->data_bytes = size;
        return have_fmt && fmt->bits_per_sample == 16 &&
               (fmt->channels == 1 || fmt->channels == 2) && fmt->sample_rate > 0;
      }

      // Chunks are word aligned
      if(fseek(f, (long)(size + (size & 1)), SEEK_CUR) != 0) return false;
    }
    return false;
  }

  static void streamTask(void* arg){
    static_cast<Esp32HalAudioPlayer*>(arg)->stream();
  }

  void stream(){
    while(!stop_requested_.load() && remaining_bytes_ > 0){
      size_t want = CHUNK_SAMPLES * sizeof(int16_t);
      if(want > remaining_bytes_) want = remaining_bytes_;

      size_t got = fread(chunk_, 1, want, file_);
      if(got < sizeof(int16_t)) break;
      remaining_bytes_ -= got;

      size_t samples = got / sizeof(int16_t);
      for(size_t i = 0; i < samples; i++){
        chunk_[i] = (int16_t)(((int32_t)chunk_[i] * gain_q15_) >> 15);
      }

      size_t written = 0;
      HalResult result = i2s_->write(chunk_, samples, &written, 1000);
      if(result != HalResult::OK){
        if(log_) log_->error(TAG, "I2S write failed: %s", halResultToString(result));
        break;
      }
    }

    i2s_->silence();
    fclose(file_);
    file_ = nullptr;
    playing_.store(false);
    vTaskDelete(nullptr);
  }

public:
  Esp32HalAudioPlayer(IHalI2s* i2s, IHalLog* log = nullptr) : i2s_(i2s), log_(log){}

  ~Esp32HalAudioPlayer() override{
    stop();
  }

  HalResult play(const char* path, float volume) override{
    if(!i2s_ || !i2s_->isInitialized()) return HalResult::NOT_INITIALIZED;
    if(!path) return HalResult::INVALID_PARAM;

    HalResult stopped = stop();
    if(stopped != HalResult::OK) return stopped;

    FILE* f = fopen(path, "rb");
    if(!f){
      if(log_) log_->warn(TAG, "Cannot open %s", path);
      return HalResult::KEY_NOT_FOUND;
    }

    WavFormat fmt;
    if(!parseHeader(f, &fmt)){
      fclose(f);
      if(log_) log_->warn(TAG, "%s is not 16-bit PCM WAV", path);
      return HalResult::NOT_SUPPORTED;
    }

    HalResult result = i2s_->setFormat(fmt.sample_rate,
                                       fmt.channels == 1 ? I2sChannelMode::MONO : I2sChannelMode::STEREO);
    if(result != HalResult::OK){
      fclose(f);
      return result;
    }

    if(volume < 0.0f) volume = 0.0f;
    if(volume > 1.0f) volume = 1.0f;
    gain_q15_ = (int32_t)(volume * 32767.0f);

    file_ = f;
    remaining_bytes_ = fmt.data_bytes;
    stop_requested_.store(false);
    playing_.store(true);

    if(xTaskCreate(streamTask, "audio", TASK_STACK, this, TASK_PRIORITY, nullptr) != pdPASS){
      playing_.store(false);
      fclose(file_);
      file_ = nullptr;
      if(log_) log_->error(TAG, "Audio task not created");
      return HalResult::NO_MEMORY;
    }

    if(log_) log_->debug(TAG, "Playing %s (%lu Hz, %u ch)", path,
                         (unsigned long)fmt.sample_rate, fmt.channels);
    return HalResult::OK;
  }

  HalResult stop() override{
    if(!playing_.load()) return HalResult::OK;

    stop_requested_.store(true);
    for(uint32_t waited = 0; playing_.load(); waited++){
      if(waited >= STOP_WAIT_MS){
        if(log_) log_->error(TAG, "Audio task did not stop");
        return HalResult::TIMEOUT;
      }
      vTaskDelay(pdMS_TO_TICKS(1));
    }
    return HalResult::OK;
  }

  bool isPlaying() const override{
    return playing_.load();
  }
};

} // namespace dmxseq::hal::esp32

#endif // DMXSEQ_SRC_HAL_ESP32_HAL_AUDIO_PLAYER_HPP_
