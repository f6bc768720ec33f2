/*****************************************************************
 * File:      DmxTransmitter.hpp
 * Category:  include/dmxseq/Dmx
 *
 * Purpose:
 *    Bit-banged DMX512 transmitter. Reproduces 250 kbit/s 8N2
 *    UART framing on a single GPIO, preceded by the Break and
 *    Mark-After-Break, with edges scheduled against the frame
 *    start so per-bit delay error does not accumulate.
 *
 *    Waveform (per frame):
 *      BREAK low (>= 88 us) | MAB high (>= 8 us) |
 *      513 x [ start(0) d0..d7 stop stop ]  (4 us per bit)
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_DMX_DMX_TRANSMITTER_HPP_
#define DMXSEQ_INCLUDE_DMX_DMX_TRANSMITTER_HPP_

#include "dmxseq/Dmx/DmxFrame.hpp"
#include "dmxseq/HAL/IHalGpio.hpp"
#include "dmxseq/HAL/IHalLog.hpp"
#include "dmxseq/HAL/IHalTimer.hpp"

namespace dmxseq::dmx{

// ============================================================
// Line Configuration
// ============================================================

constexpr uint32_t DMX_MIN_BREAK_US = 88;
constexpr uint32_t DMX_MIN_MAB_US = 8;
constexpr uint32_t DMX_BIT_US = 4;
constexpr uint32_t DMX_BITS_PER_SLOT = 11;

/** Electrical and timing parameters of the DMX line */
struct DmxLineConfig{
  hal::gpio_pin_t data_pin = 17;
  hal::gpio_pin_t control_pin = hal::GPIO_PIN_NONE;  // Driver enable, optional
  uint32_t break_us = 100;
  uint32_t mab_us = 12;
  uint32_t bit_us = DMX_BIT_US;
};

/** Nominal frame duration for a configuration, in microseconds */
constexpr uint32_t nominalFrameUs(const DmxLineConfig& config){
  return config.break_us + config.mab_us
       + static_cast<uint32_t>(DMX_FRAME_SIZE) * DMX_BITS_PER_SLOT * config.bit_us;
}

// ============================================================
// Transmitter
// ============================================================

/** DMX512 software transmitter
 *
 * Owns the persistent frame. Not thread-safe: exactly one
 * thread may drive it at a time.
 */
class DmxTransmitter{
public:
  /** Create a transmitter
   * @param gpio GPIO driver, may be null (transmits become no-ops)
   * @param timer Timer used for bit timing, may be null
   * @param log Optional logger
   */
  DmxTransmitter(hal::IHalGpio* gpio, hal::IHalSystemTimer* timer, hal::IHalLog* log = nullptr);

  /** Configure pins and drive the line to idle (mark)
   * @param config Line configuration; break/MAB are clamped to the DMX512 minimums
   * @return HalResult::OK when the line is usable. Any failure leaves
   *         the transmitter usable as a frame store only.
   */
  hal::HalResult init(const DmxLineConfig& config);

  /** Whether frames actually reach the GPIO */
  bool isLineAvailable() const{ return line_ok_; }

  /** Update one channel and transmit the whole frame
   * @param address Channel 1..512 (clamped)
   * @param value Level 0..255 (clamped)
   */
  void writeChannel(int32_t address, int32_t value);

  /** Zero channels 1..512 and transmit once */
  void resetAll();

  /** Put the current frame on the line
   * @return HalResult::OK when the full frame was sent
   */
  hal::HalResult transmitFrame();

  /** Drive the optional driver-enable pin
   * @param active true asserts the line driver
   */
  void setControlSignal(bool active);

  /** Drop the control signal and leave the data line at mark */
  void releaseLine();

  const DmxFrame& frame() const{ return frame_; }
  uint8_t getChannel(int32_t address) const{ return frame_.get(address); }
  const DmxLineConfig& getConfig() const{ return config_; }

  /** Frames fully put on the line since construction */
  uint32_t getTransmitCount() const{ return transmit_count_; }

  /** Measured duration of the last completed frame */
  uint32_t getLastFrameDurationUs() const{ return last_frame_us_; }

private:
  static constexpr const char* TAG = "DMX";

  bool setLevel(bool high);
  void waitUntil(hal::timestamp_us_t deadline);
  bool sendSlot(uint8_t value, hal::timestamp_us_t* edge);
  void markLineFailed(hal::HalResult result, const char* operation);

  hal::IHalGpio* gpio_;
  hal::IHalSystemTimer* timer_;
  hal::IHalLog* log_;

  DmxLineConfig config_;
  DmxFrame frame_;

  bool line_ok_ = false;
  bool level_high_ = true;
  bool control_active_ = false;
  bool unavailable_logged_ = false;

  uint32_t transmit_count_ = 0;
  uint32_t last_frame_us_ = 0;
};

} // namespace dmxseq::dmx

#endif // DMXSEQ_INCLUDE_DMX_DMX_TRANSMITTER_HPP_
