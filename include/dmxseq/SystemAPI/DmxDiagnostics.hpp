/*****************************************************************
 * File:      DmxDiagnostics.hpp
 * Category:  include/dmxseq/SystemAPI
 *
 * Purpose:
 *    Line test patterns for commissioning a DMX installation.
 *    Patterns run synchronously on the caller's thread and
 *    must only be started while no show is running.
 *
 * Patterns:
 *    BASIC   channels 1..5 = 255, 128, 64, 32, 16
 *    CHASE   channels 1..8 on then off, one at a time
 *    SWEEP   one channel at full across 1..16
 *    FADE    channel 1 up and down in steps of 16
 *    TIMING  N frames, measured against the nominal duration
 *
 *    Every pattern ends with all channels at zero.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_SYSTEMAPI_DMX_DIAGNOSTICS_HPP_
#define DMXSEQ_INCLUDE_SYSTEMAPI_DMX_DIAGNOSTICS_HPP_

#include "dmxseq/Dmx/DmxTransmitter.hpp"
#include "dmxseq/Engine/ActionLog.hpp"
#include "dmxseq/HAL/IHalLog.hpp"
#include "dmxseq/HAL/IHalTimer.hpp"
#include "dmxseq/ShowResult.hpp"

namespace dmxseq::api{

enum class DiagnosticPattern : uint8_t{
  BASIC,
  CHASE,
  SWEEP,
  FADE,
  TIMING
};

const char* diagnosticPatternToString(DiagnosticPattern pattern);

/** Case-insensitive lookup ("chase", "TIMING", ...) */
bool parseDiagnosticPattern(const char* name, DiagnosticPattern* out);

struct DiagnosticSettings{
  uint16_t chase_channels = 8;
  uint32_t chase_step_ms = 500;
  uint16_t sweep_channels = 16;
  uint32_t sweep_step_ms = 500;
  uint8_t fade_step = 16;
  uint32_t fade_step_ms = 100;
  uint32_t fade_hold_ms = 500;
  uint32_t basic_hold_ms = 1000;
  uint32_t timing_frames = 10;
};

struct DiagnosticReport{
  DiagnosticPattern pattern = DiagnosticPattern::BASIC;
  bool line_available = false;
  uint32_t frames_sent = 0;
  uint32_t nominal_frame_us = 0;
  uint32_t min_frame_us = 0;      // TIMING only
  uint32_t avg_frame_us = 0;      // TIMING only
  uint32_t max_frame_us = 0;      // TIMING only
};

class DmxDiagnostics{
public:
  DmxDiagnostics(dmx::DmxTransmitter& transmitter, hal::IHalSystemTimer& timer,
                 engine::ActionLog* actions = nullptr, hal::IHalLog* log = nullptr);

  void setSettings(const DiagnosticSettings& settings){ settings_ = settings; }
  const DiagnosticSettings& getSettings() const{ return settings_; }

  /** Run one pattern to completion
   * @param pattern Pattern to run
   * @param report Optional frame statistics
   * @return ShowResult::OK, or IO_ERROR when the DMX line is unavailable
   */
  ShowResult run(DiagnosticPattern pattern, DiagnosticReport* report = nullptr);

private:
  static constexpr const char* TAG = "DmxTest";

  void runBasic();
  void runChase();
  void runSweep();
  void runFade();
  void runTiming(DiagnosticReport* report);

  dmx::DmxTransmitter& transmitter_;
  hal::IHalSystemTimer& timer_;
  engine::ActionLog* actions_;
  hal::IHalLog* log_;
  DiagnosticSettings settings_;
};

} // namespace dmxseq::api

#endif // DMXSEQ_INCLUDE_SYSTEMAPI_DMX_DIAGNOSTICS_HPP_
