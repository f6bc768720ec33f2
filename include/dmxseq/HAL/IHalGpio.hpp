/*****************************************************************
 * File:      IHalGpio.hpp
 * Category:  include/dmxseq/HAL
 *
 * Purpose:
 *    Digital output pins. The DMX transmitter toggles one data
 *    pin and an optional driver-enable pin through this
 *    interface; nothing in the show reads pins.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_HAL_IHAL_GPIO_HPP_
#define DMXSEQ_INCLUDE_HAL_IHAL_GPIO_HPP_

#include "HalTypes.hpp"

namespace dmxseq::hal{

class IHalGpio{
public:
  virtual ~IHalGpio() = default;

  virtual HalResult init() = 0;

  /** Configure a pin
   * @return INVALID_PARAM if the pin cannot take the mode
   */
  virtual HalResult pinMode(gpio_pin_t pin, GpioMode mode) = 0;

  /** Drive a pin
   *
   * Called once per level change inside a DMX frame, so
   * implementations must not block or log on success.
   *
   * @return WRITE_FAILED if the level could not be set
   */
  virtual HalResult digitalWrite(gpio_pin_t pin, GpioState state) = 0;
};

} // namespace dmxseq::hal

#endif // DMXSEQ_INCLUDE_HAL_IHAL_GPIO_HPP_
