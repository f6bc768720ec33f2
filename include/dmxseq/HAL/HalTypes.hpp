/*****************************************************************
 * File:      HalTypes.hpp
 * Category:  include/dmxseq/HAL
 *
 * Purpose:
 *    Status codes, clock and pin types shared by the HAL
 *    interfaces, the show core and the ESP32 platform layer.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_HAL_HAL_TYPES_HPP_
#define DMXSEQ_INCLUDE_HAL_HAL_TYPES_HPP_

#include <stdint.h>
#include <stddef.h>

namespace dmxseq::hal{

// ============================================================
// Result Types
// ============================================================

/** Outcome of a driver call */
enum class HalResult : uint8_t{
  OK = 0,
  TIMEOUT,             // Playback or task did not stop in time
  INVALID_PARAM,       // Bad pin, path or format argument
  NOT_INITIALIZED,     // Driver not started, or DMX line disabled
  NOT_SUPPORTED,       // Sound file in a format the player cannot decode
  KEY_NOT_FOUND,       // File missing on the card
  HARDWARE_FAULT,      // Driver or bus reported an error
  ALREADY_INITIALIZED,
  NO_MEMORY,
  WRITE_FAILED         // Pin level or sample write rejected
};

// ============================================================
// Clock
// ============================================================

using timestamp_ms_t = uint32_t;   // Since boot, wraps after ~49 days
using timestamp_us_t = uint64_t;   // Since boot

// ============================================================
// Pins
// ============================================================

using gpio_pin_t = uint8_t;

/** Optional pin left unwired (e.g. no RS-485 driver enable) */
constexpr gpio_pin_t GPIO_PIN_NONE = 0xFF;

enum class GpioMode : uint8_t{
  GPIO_INPUT,
  GPIO_OUTPUT
};

enum class GpioState : uint8_t{
  GPIO_LOW = 0,
  GPIO_HIGH = 1
};

} // namespace dmxseq::hal

#endif // DMXSEQ_INCLUDE_HAL_HAL_TYPES_HPP_
