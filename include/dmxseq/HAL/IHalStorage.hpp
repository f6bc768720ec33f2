/*****************************************************************
 * File:      IHalStorage.hpp
 * Category:  include/dmxseq/HAL
 *
 * Purpose:
 *    Removable storage Hardware Abstraction Layer interface.
 *    Once mounted, files are reached through the platform's
 *    POSIX layer under getMountPoint().
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_HAL_IHAL_STORAGE_HPP_
#define DMXSEQ_INCLUDE_HAL_IHAL_STORAGE_HPP_

#include "HalTypes.hpp"

namespace dmxseq::hal{

/** SD card SPI wiring */
struct SdCardConfig{
  int8_t miso_pin = 19;
  int8_t mosi_pin = 23;
  int8_t clk_pin = 18;
  int8_t cs_pin = 5;
  uint32_t frequency_khz = 20000;
};

/** Storage Hardware Abstraction Interface */
class IHalStorage{
public:
  virtual ~IHalStorage() = default;

  /** Bring up the bus and mount the filesystem
   * @param config Card wiring
   * @return HalResult::OK when mounted
   */
  virtual HalResult init(const SdCardConfig& config) = 0;

  /** Unmount and release the bus */
  virtual HalResult deinit() = 0;

  virtual bool isMounted() const = 0;

  /** Filesystem root, e.g. "/sdcard" */
  virtual const char* getMountPoint() const = 0;

  /** Card capacity in bytes (0 if unknown) */
  virtual uint64_t getTotalSize() const = 0;

  /** Free space in bytes (0 if unknown) */
  virtual uint64_t getFreeSpace() const = 0;
};

} // namespace dmxseq::hal

#endif // DMXSEQ_INCLUDE_HAL_IHAL_STORAGE_HPP_
