/*****************************************************************
 * File:      IHalI2s.hpp
 * Category:  include/dmxseq/HAL
 *
 * Purpose:
 *    I2S output to an external DAC or amplifier, carrying the
 *    show soundtrack.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_HAL_IHAL_I2S_HPP_
#define DMXSEQ_INCLUDE_HAL_IHAL_I2S_HPP_

#include "HalTypes.hpp"

namespace dmxseq::hal{

// ============================================================
// I2S Configuration
// ============================================================

/** I2S channel layout */
enum class I2sChannelMode : uint8_t{
  MONO,
  STEREO
};

/** I2S output configuration */
struct I2sConfig{
  uint8_t port = 0;
  gpio_pin_t bck_pin = 26;    // Bit clock (BCLK/SCK)
  gpio_pin_t ws_pin = 25;     // Word select (LRCLK)
  gpio_pin_t data_pin = 22;   // Data out (DOUT)
  uint32_t sample_rate = 44100;
  I2sChannelMode channel_mode = I2sChannelMode::STEREO;
  size_t buffer_size = 512;   // DMA buffer length in frames
};

// ============================================================
// I2S Interface
// ============================================================

/** Audio sample sink
 *
 * Samples are signed 16-bit PCM; stereo data is interleaved
 * left/right. Only the audio player task writes.
 */
class IHalI2s{
public:
  virtual ~IHalI2s() = default;

  virtual HalResult init(const I2sConfig& config) = 0;
  virtual HalResult deinit() = 0;
  virtual bool isInitialized() const = 0;

  /** Queue samples for output, blocking while the DMA ring is full
   * @param samples Count of int16_t values, not frames
   * @param samples_written Optional count actually queued
   * @param timeout_ms 0 waits indefinitely
   * @return TIMEOUT if only part of the buffer was queued
   */
  virtual HalResult write(const int16_t* buffer, size_t samples, size_t* samples_written, uint32_t timeout_ms = 0) = 0;

  /** Retune the clock for the next clip */
  virtual HalResult setFormat(uint32_t sample_rate, I2sChannelMode channel_mode) = 0;

  /** Replace queued audio with silence (used on stop) */
  virtual HalResult silence() = 0;
};

} // namespace dmxseq::hal

#endif // DMXSEQ_INCLUDE_HAL_IHAL_I2S_HPP_
