/*****************************************************************
 * File:      ExecutionEngine.cpp
 * Category:  src/Engine
 *
 * Purpose:
 *    Sequence interpreter and run lifecycle.
 *****************************************************************/

#include "dmxseq/Engine/ExecutionEngine.hpp"

#include <chrono>
#include <cmath>
#include <stdio.h>
#include <system_error>

namespace dmxseq::engine{

using hal::HalResult;
using sequence::Command;
using sequence::CommandOp;

const char* runModeToString(RunMode mode){
  switch(mode){
    case RunMode::ONCE: return "once";
    case RunMode::LOOP: return "loop";
    default:            return "unknown";
  }
}

namespace{

std::string formatNumber(double value){
  char buffer[32];
  snprintf(buffer, sizeof(buffer), "%g", value);
  return buffer;
}

/** Sound names must stay inside the sounds directory */
bool isSafeSoundName(const std::string& file){
  if(file.empty() || file[0] == '/') return false;
  size_t start = 0;
  while(start <= file.size()){
    size_t slash = file.find('/', start);
    std::string part = file.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    if(part == "..") return false;
    if(slash == std::string::npos) break;
    start = slash + 1;
  }
  return true;
}

} // namespace

ExecutionEngine::ExecutionEngine(dmx::DmxTransmitter& transmitter, hal::IHalAudioPlayer* audio,
                                 hal::IHalSystemTimer& timer, ActionLog& actions,
                                 const EngineConfig& config, hal::IHalLog* log)
  : transmitter_(transmitter), audio_(audio), timer_(timer), actions_(actions),
    config_(config), log_(log){
  if(config_.wait_poll_ms == 0) config_.wait_poll_ms = 1;
}

ExecutionEngine::~ExecutionEngine(){
  shutdown();
}

// ============================================================
// Control
// ============================================================

ShowResult ExecutionEngine::start(const sequence::Sequence& sequence, RunMode mode){
  std::lock_guard<std::mutex> control(control_mutex_);

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if(running_){
      if(log_) log_->warn(TAG, "Start of '%s' refused, '%s' is running",
                          sequence.name.c_str(), sequence_name_.c_str());
      return ShowResult::ALREADY_RUNNING;
    }
  }

  if(sequence.commands.empty()){
    if(log_) log_->warn(TAG, "Sequence '%s' has no commands", sequence.name.c_str());
    return ShowResult::INVALID_PARAM;
  }

  // Previous worker has finished teardown; reap it
  joinWorker();

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = true;
    mode_ = mode;
    sequence_name_ = sequence.name;
    loop_count_ = 0;
    since_ = timer_.millis();
  }
  stop_requested_ = false;

  actions_.append(ActionCategory::SEQUENCE, "Sequence started: " + sequence.name,
                  {{"sequence", sequence.name}, {"mode", runModeToString(mode)},
                   {"commands", std::to_string(sequence.commands.size())}});

  try{
    worker_ = std::thread(&ExecutionEngine::run, this, sequence, mode);
  }catch(const std::system_error& e){
    if(log_) log_->error(TAG, "Cannot create worker thread: %s", e.what());
    actions_.append(ActionCategory::ERROR, "Cannot start sequence: " + sequence.name,
                    {{"sequence", sequence.name}, {"reason", e.what()}});
    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = false;
    sequence_name_.clear();
    return ShowResult::BUSY;
  }

  if(log_) log_->info(TAG, "Started '%s' (%s, %u commands)", sequence.name.c_str(),
                      runModeToString(mode), (unsigned)sequence.commands.size());
  return ShowResult::OK;
}

void ExecutionEngine::requestStop(){
  if(!isRunning()) return;
  bool already = stop_requested_.exchange(true);
  if(!already){
    if(log_) log_->debug(TAG, "Stop requested");
  }
}

ShowResult ExecutionEngine::stop(){
  std::lock_guard<std::mutex> control(control_mutex_);

  if(!isRunning()){
    joinWorker();
    return ShowResult::OK;
  }

  requestStop();

  bool idle;
  {
    std::unique_lock<std::mutex> lock(state_mutex_);
    idle = idle_cv_.wait_for(lock, std::chrono::milliseconds(config_.join_timeout_ms),
                             [this]{ return !running_; });
  }

  if(idle){
    joinWorker();
  }else if(log_){
    log_->warn(TAG, "Worker still busy after %lu ms, it will stop at its next checkpoint",
               (unsigned long)config_.join_timeout_ms);
  }
  return ShowResult::OK;
}

void ExecutionEngine::shutdown(){
  std::lock_guard<std::mutex> control(control_mutex_);
  stop_requested_ = true;
  joinWorker();
}

bool ExecutionEngine::waitUntilIdle(uint32_t timeout_ms){
  std::unique_lock<std::mutex> lock(state_mutex_);
  return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                           [this]{ return !running_; });
}

EngineStatus ExecutionEngine::status() const{
  EngineStatus snapshot;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    snapshot.running = running_;
    snapshot.mode = mode_;
    snapshot.sequence_name = sequence_name_;
    snapshot.loop_count = loop_count_;
    snapshot.since = since_;
  }
  snapshot.sound_playing = audio_ ? audio_->isPlaying() : false;
  return snapshot;
}

bool ExecutionEngine::isRunning() const{
  std::lock_guard<std::mutex> lock(state_mutex_);
  return running_;
}

void ExecutionEngine::joinWorker(){
  if(worker_.joinable() && worker_.get_id() != std::this_thread::get_id()){
    worker_.join();
  }
}

// ============================================================
// Worker
// ============================================================

void ExecutionEngine::run(sequence::Sequence sequence, RunMode mode){
  transmitter_.setControlSignal(true);

  const char* reason = "completed";
  while(true){
    bool failed = false;
    for(const Command& cmd : sequence.commands){
      if(!execute(cmd)){
        failed = true;
        break;
      }
    }
    if(failed){
      reason = "error";
      break;
    }

    uint32_t completed;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      completed = ++loop_count_;
    }

    if(mode == RunMode::ONCE){
      if(stop_requested_) reason = "stopped";
      break;
    }

    actions_.append(ActionCategory::LOOP, "Loop " + std::to_string(completed) + " completed",
                    {{"sequence", sequence.name}, {"loop", std::to_string(completed)}});

    // Pass boundary checkpoint
    if(stop_requested_){
      reason = "stopped";
      break;
    }
  }

  teardown(sequence.name, reason);
}

bool ExecutionEngine::execute(const Command& cmd){
  if(!cmd.isWellFormed()){
    actions_.append(ActionCategory::ERROR, "Malformed command on line " + std::to_string(cmd.line),
                    {{"op", sequence::commandOpName(cmd.op)}, {"line", std::to_string(cmd.line)}});
    if(log_) log_->error(TAG, "Malformed %s command on line %lu, aborting run",
                         sequence::commandOpName(cmd.op), (unsigned long)cmd.line);
    return false;
  }

  switch(cmd.op){
    case CommandOp::WRITE_DMX:
      transmitter_.writeChannel(cmd.address, cmd.value);
      actions_.append(ActionCategory::DMX,
                      "Channel " + std::to_string(cmd.address) + " = " + std::to_string(cmd.value),
                      {{"channel", std::to_string(cmd.address)}, {"value", std::to_string(cmd.value)}});
      break;

    case CommandOp::SLEEP:
      sleepFor(cmd.seconds);
      break;

    case CommandOp::PLAY_SOUND:
      playSound(cmd);
      break;

    case CommandOp::WAIT_FOR_SOUND:
      waitForSound();
      break;

    case CommandOp::STOP_SOUND:
      stopSound(false);
      break;
  }
  return true;
}

void ExecutionEngine::sleepFor(double seconds){
  if(seconds <= 0.0) return;

  actions_.append(ActionCategory::SLEEP, "Sleep " + formatNumber(seconds) + "s",
                  {{"seconds", formatNumber(seconds)}});

  // Capped before any cast so huge values cannot wrap to a short delay
  uint32_t whole_ms = MAX_SLEEP_MS;
  uint32_t rest_us = 0;
  if(seconds * 1000.0 < static_cast<double>(MAX_SLEEP_MS)){
    const double total_us = std::round(seconds * 1000000.0);
    whole_ms = static_cast<uint32_t>(total_us / 1000.0);
    rest_us = static_cast<uint32_t>(std::fmod(total_us, 1000.0));
  }else if(log_){
    log_->warn(TAG, "Sleep of %gs capped at %lu ms", seconds, (unsigned long)MAX_SLEEP_MS);
  }

  if(whole_ms > 0) timer_.delayMs(whole_ms);
  if(rest_us > 0) timer_.delayUs(rest_us);
}

void ExecutionEngine::playSound(const Command& cmd){
  if(!audio_){
    actions_.append(ActionCategory::ERROR, "No audio output for " + cmd.file, {{"file", cmd.file}});
    return;
  }
  if(!isSafeSoundName(cmd.file)){
    actions_.append(ActionCategory::ERROR, "Rejected sound path " + cmd.file, {{"file", cmd.file}});
    if(log_) log_->warn(TAG, "Sound path '%s' leaves the sounds directory", cmd.file.c_str());
    return;
  }

  float volume = cmd.volume < 0.0f ? 0.0f : cmd.volume > 1.0f ? 1.0f : cmd.volume;
  const std::string path = config_.sounds_directory + "/" + cmd.file;

  HalResult result = audio_->play(path.c_str(), volume);
  if(result == HalResult::KEY_NOT_FOUND){
    actions_.append(ActionCategory::ERROR, "Sound file not found: " + cmd.file, {{"file", cmd.file}});
    return;
  }
  if(result != HalResult::OK){
    actions_.append(ActionCategory::ERROR, "Playback failed: " + cmd.file,
                    {{"file", cmd.file}, {"result", hal::halResultToString(result)}});
    if(log_) log_->error(TAG, "play(%s): %s", path.c_str(), hal::halResultToString(result));
    return;
  }

  actions_.append(ActionCategory::SOUND, "Playing " + cmd.file,
                  {{"file", cmd.file}, {"volume", formatNumber(volume)}});
}

void ExecutionEngine::waitForSound(){
  if(!audio_) return;

  actions_.append(ActionCategory::SOUND, "Waiting for sound");
  while(audio_->isPlaying()){
    // Checkpoint
    if(stop_requested_){
      HalResult result = audio_->stop();
      if(result != HalResult::OK && log_) log_->logResult(result, TAG, "audio stop");
      actions_.append(ActionCategory::SOUND, "Wait cancelled, sound stopped");
      return;
    }
    timer_.delayMs(config_.wait_poll_ms);
  }
}

void ExecutionEngine::stopSound(bool log_when_idle){
  if(!audio_) return;
  if(!audio_->isPlaying()){
    if(log_when_idle) actions_.append(ActionCategory::SOUND, "No sound playing");
    return;
  }
  HalResult result = audio_->stop();
  if(result != HalResult::OK){
    actions_.append(ActionCategory::ERROR, "Could not stop sound",
                    {{"result", hal::halResultToString(result)}});
    return;
  }
  actions_.append(ActionCategory::SOUND, "Sound stopped");
}

void ExecutionEngine::teardown(const std::string& name, const char* reason){
  // Each step runs regardless of the others
  stopSound(false);
  transmitter_.resetAll();
  transmitter_.releaseLine();

  uint32_t loops;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    loops = loop_count_;
  }

  actions_.append(ActionCategory::SYSTEM,
                  "Sequence " + name + " ended (" + reason + ") after " + std::to_string(loops) + " loop(s)",
                  {{"sequence", name}, {"reason", reason}, {"loops", std::to_string(loops)}});
  if(log_) log_->info(TAG, "'%s' ended: %s, %lu loop(s)", name.c_str(), reason, (unsigned long)loops);

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    running_ = false;
    sequence_name_.clear();
    loop_count_ = 0;
    since_ = 0;
  }
  stop_requested_ = false;
  idle_cv_.notify_all();
}

} // namespace dmxseq::engine
