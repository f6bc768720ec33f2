/*****************************************************************
 * File:      DmxDiagnostics.cpp
 * Category:  src/SystemAPI
 *
 * Purpose:
 *    DMX line test patterns.
 *****************************************************************/

#include "dmxseq/SystemAPI/DmxDiagnostics.hpp"

#include <string>

namespace dmxseq::api{

using engine::ActionCategory;

namespace{

struct PatternName{
  DiagnosticPattern pattern;
  const char* name;
};

constexpr PatternName PATTERNS[] = {
  {DiagnosticPattern::BASIC,  "basic"},
  {DiagnosticPattern::CHASE,  "chase"},
  {DiagnosticPattern::SWEEP,  "sweep"},
  {DiagnosticPattern::FADE,   "fade"},
  {DiagnosticPattern::TIMING, "timing"}
};

bool equalsIgnoreCase(const char* a, const char* b){
  while(*a && *b){
    char x = *a;
    char y = *b;
    if(x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
    if(y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
    if(x != y) return false;
    a++;
    b++;
  }
  return *a == *b;
}

} // namespace

const char* diagnosticPatternToString(DiagnosticPattern pattern){
  for(const PatternName& entry : PATTERNS){
    if(entry.pattern == pattern) return entry.name;
  }
  return "unknown";
}

bool parseDiagnosticPattern(const char* name, DiagnosticPattern* out){
  if(!name) return false;
  for(const PatternName& entry : PATTERNS){
    if(equalsIgnoreCase(name, entry.name)){
      if(out) *out = entry.pattern;
      return true;
    }
  }
  return false;
}

DmxDiagnostics::DmxDiagnostics(dmx::DmxTransmitter& transmitter, hal::IHalSystemTimer& timer,
                               engine::ActionLog* actions, hal::IHalLog* log)
  : transmitter_(transmitter), timer_(timer), actions_(actions), log_(log){}

ShowResult DmxDiagnostics::run(DiagnosticPattern pattern, DiagnosticReport* report){
  DiagnosticReport local;
  local.pattern = pattern;
  local.nominal_frame_us = dmx::nominalFrameUs(transmitter_.getConfig());
  local.line_available = transmitter_.isLineAvailable();

  if(!local.line_available){
    if(log_) log_->error(TAG, "DMX line unavailable, %s test skipped", diagnosticPatternToString(pattern));
    if(actions_) actions_->append(ActionCategory::ERROR, "DMX test skipped, line unavailable",
                                  {{"pattern", diagnosticPatternToString(pattern)}});
    if(report) *report = local;
    return ShowResult::IO_ERROR;
  }

  if(log_) log_->info(TAG, "Running %s test", diagnosticPatternToString(pattern));
  if(actions_) actions_->append(ActionCategory::SYSTEM, "DMX test started",
                                {{"pattern", diagnosticPatternToString(pattern)}});

  const uint32_t frames_before = transmitter_.getTransmitCount();

  switch(pattern){
    case DiagnosticPattern::BASIC:  runBasic(); break;
    case DiagnosticPattern::CHASE:  runChase(); break;
    case DiagnosticPattern::SWEEP:  runSweep(); break;
    case DiagnosticPattern::FADE:   runFade(); break;
    case DiagnosticPattern::TIMING: runTiming(&local); break;
  }

  transmitter_.resetAll();

  local.frames_sent = transmitter_.getTransmitCount() - frames_before;
  local.line_available = transmitter_.isLineAvailable();

  if(log_) log_->info(TAG, "%s test done, %lu frames", diagnosticPatternToString(pattern),
                      (unsigned long)local.frames_sent);
  if(actions_) actions_->append(ActionCategory::SYSTEM, "DMX test finished",
                                {{"pattern", diagnosticPatternToString(pattern)},
                                 {"frames", std::to_string(local.frames_sent)}});
  if(report) *report = local;
  return local.line_available ? ShowResult::OK : ShowResult::IO_ERROR;
}

// ============================================================
// Patterns
// ============================================================

void DmxDiagnostics::runBasic(){
  static constexpr uint8_t LEVELS[] = {255, 128, 64, 32, 16};
  for(size_t i = 0; i < sizeof(LEVELS); i++){
    transmitter_.writeChannel(static_cast<int32_t>(i + 1), LEVELS[i]);
  }
  timer_.delayMs(settings_.basic_hold_ms);
}

void DmxDiagnostics::runChase(){
  for(uint16_t ch = 1; ch <= settings_.chase_channels && ch <= dmx::DMX_CHANNEL_COUNT; ch++){
    transmitter_.writeChannel(ch, 255);
    timer_.delayMs(settings_.chase_step_ms);
    transmitter_.writeChannel(ch, 0);
  }
}

void DmxDiagnostics::runSweep(){
  for(uint16_t ch = 1; ch <= settings_.sweep_channels && ch <= dmx::DMX_CHANNEL_COUNT; ch++){
    if(ch > 1) transmitter_.writeChannel(ch - 1, 0);
    transmitter_.writeChannel(ch, 255);
    timer_.delayMs(settings_.sweep_step_ms);
  }
}

void DmxDiagnostics::runFade(){
  const int32_t step = settings_.fade_step == 0 ? 1 : settings_.fade_step;

  for(int32_t level = 0; level <= 255; level += step){
    transmitter_.writeChannel(1, level);
    timer_.delayMs(settings_.fade_step_ms);
  }
  timer_.delayMs(settings_.fade_hold_ms);
  for(int32_t level = 255; level >= 0; level -= step){
    transmitter_.writeChannel(1, level);
    timer_.delayMs(settings_.fade_step_ms);
  }
}

void DmxDiagnostics::runTiming(DiagnosticReport* report){
  uint64_t total = 0;
  uint32_t sent = 0;
  uint32_t min_us = 0xFFFFFFFFu;
  uint32_t max_us = 0;

  for(uint32_t i = 0; i < settings_.timing_frames; i++){
    if(transmitter_.transmitFrame() != hal::HalResult::OK) break;
    uint32_t us = transmitter_.getLastFrameDurationUs();
    total += us;
    if(us < min_us) min_us = us;
    if(us > max_us) max_us = us;
    sent++;
  }

  if(sent == 0) return;

  report->min_frame_us = min_us;
  report->max_frame_us = max_us;
  report->avg_frame_us = static_cast<uint32_t>(total / sent);

  if(log_) log_->info(TAG, "Frame time min/avg/max %lu/%lu/%lu us (nominal %lu us)",
                      (unsigned long)min_us, (unsigned long)report->avg_frame_us,
                      (unsigned long)max_us, (unsigned long)report->nominal_frame_us);
  if(actions_) actions_->append(ActionCategory::DMX, "Frame timing measured",
                                {{"min_us", std::to_string(min_us)},
                                 {"avg_us", std::to_string(report->avg_frame_us)},
                                 {"max_us", std::to_string(max_us)},
                                 {"nominal_us", std::to_string(report->nominal_frame_us)}});
}

} // namespace dmxseq::api
