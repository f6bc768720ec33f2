/*****************************************************************
 * File:      DmxFrame.hpp
 * Category:  include/dmxseq/Dmx
 *
 * Purpose:
 *    The 513-byte DMX512 universe: start code plus 512 channel
 *    levels. Levels persist until explicitly reset.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_DMX_DMX_FRAME_HPP_
#define DMXSEQ_INCLUDE_DMX_DMX_FRAME_HPP_

#include <stdint.h>
#include <stddef.h>
#include <string.h>

namespace dmxseq::dmx{

// ============================================================
// Constants
// ============================================================

constexpr uint16_t DMX_CHANNEL_COUNT = 512;
constexpr size_t DMX_FRAME_SIZE = DMX_CHANNEL_COUNT + 1;
constexpr uint8_t DMX_START_CODE = 0x00;

constexpr uint16_t DMX_MIN_ADDRESS = 1;
constexpr uint16_t DMX_MAX_ADDRESS = DMX_CHANNEL_COUNT;

/** Clamp any integer into the valid channel address range */
constexpr uint16_t clampAddress(int32_t address){
  return address < DMX_MIN_ADDRESS ? DMX_MIN_ADDRESS
       : address > DMX_MAX_ADDRESS ? DMX_MAX_ADDRESS
       : static_cast<uint16_t>(address);
}

/** Clamp any integer into the valid channel level range */
constexpr uint8_t clampLevel(int32_t value){
  return value < 0 ? 0 : value > 255 ? 255 : static_cast<uint8_t>(value);
}

// ============================================================
// DMX Frame
// ============================================================

/** One DMX512 universe
 *
 * Slot 0 holds the null start code and is never writable.
 * Slots 1..512 hold channel levels.
 */
class DmxFrame{
public:
  DmxFrame(){
    clear();
  }

  /** Set a channel level; address and value are clamped */
  void set(int32_t address, int32_t value){
    data_[clampAddress(address)] = clampLevel(value);
  }

  /** Read a channel level; out-of-range addresses are clamped */
  uint8_t get(int32_t address) const{
    return data_[clampAddress(address)];
  }

  /** Zero every channel; the start code stays 0 */
  void clear(){
    memset(data_, 0, sizeof(data_));
    data_[0] = DMX_START_CODE;
  }

  /** True if every channel is zero */
  bool isBlackout() const{
    for(size_t i = 1; i < DMX_FRAME_SIZE; i++){
      if(data_[i] != 0) return false;
    }
    return true;
  }

  const uint8_t* data() const{ return data_; }
  static constexpr size_t size(){ return DMX_FRAME_SIZE; }

private:
  uint8_t data_[DMX_FRAME_SIZE];
};

} // namespace dmxseq::dmx

#endif // DMXSEQ_INCLUDE_DMX_DMX_FRAME_HPP_
