/*****************************************************************
 * File:      IHalTimer.hpp
 * Category:  include/dmxseq/HAL
 *
 * Purpose:
 *    Monotonic clock and blocking delays used for DMX bit
 *    timing, sequence sleeps and log timestamps.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_HAL_IHAL_TIMER_HPP_
#define DMXSEQ_INCLUDE_HAL_IHAL_TIMER_HPP_

#include "HalTypes.hpp"

namespace dmxseq::hal{

/** Clock shared by every thread; all methods are thread safe */
class IHalSystemTimer{
public:
  virtual ~IHalSystemTimer() = default;

  virtual timestamp_ms_t millis() const = 0;

  /** Resolution the DMX transmitter schedules its edges against */
  virtual timestamp_us_t micros() const = 0;

  /** Block the calling thread; other threads keep running */
  virtual void delayMs(uint32_t ms) = 0;

  /** Busy-wait for short intervals (bit times, break) */
  virtual void delayUs(uint32_t us) = 0;
};

} // namespace dmxseq::hal

#endif // DMXSEQ_INCLUDE_HAL_IHAL_TIMER_HPP_
