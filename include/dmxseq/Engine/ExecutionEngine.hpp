/*****************************************************************
 * File:      ExecutionEngine.hpp
 * Category:  include/dmxseq/Engine
 *
 * Purpose:
 *    Runs one compiled sequence at a time on a worker thread,
 *    driving the DMX transmitter and the audio player and
 *    recording every step in the action log.
 *
 * State machine:
 *    Idle --start()--> Running(loop_count = 0)
 *    Running --stop | completion | malformed command--> Idle
 *
 *    Cancellation is cooperative. The worker checks for a stop
 *    request at the end of every pass and while waiting for
 *    sound; sleeps and frame transmits are never interrupted.
 *    The worker performs its own teardown, so it remains the
 *    only thread touching the DMX line and the audio player.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_ENGINE_EXECUTION_ENGINE_HPP_
#define DMXSEQ_INCLUDE_ENGINE_EXECUTION_ENGINE_HPP_

#include "dmxseq/Dmx/DmxTransmitter.hpp"
#include "dmxseq/Engine/ActionLog.hpp"
#include "dmxseq/HAL/IHalAudio.hpp"
#include "dmxseq/HAL/IHalLog.hpp"
#include "dmxseq/HAL/IHalTimer.hpp"
#include "dmxseq/Sequence/Command.hpp"
#include "dmxseq/ShowResult.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace dmxseq::engine{

// ============================================================
// Types
// ============================================================

enum class RunMode : uint8_t{
  ONCE,
  LOOP
};

const char* runModeToString(RunMode mode);

struct EngineConfig{
  std::string sounds_directory = "sounds";
  uint32_t wait_poll_ms = 100;        // WaitForSound polling interval
  uint32_t join_timeout_ms = 2000;    // Bound on stop()
};

/** Consistent snapshot of the engine state */
struct EngineStatus{
  bool running = false;
  RunMode mode = RunMode::ONCE;
  std::string sequence_name;
  uint32_t loop_count = 0;            // Completed passes
  bool sound_playing = false;
  hal::timestamp_ms_t since = 0;      // Start time of the current run
};

// ============================================================
// Execution Engine
// ============================================================

class ExecutionEngine{
public:
  /**
   * @param transmitter DMX output, driven only by the worker
   * @param audio Audio player, may be null (sound commands log errors)
   * @param timer Clock used for sleeps, polling and timestamps
   * @param actions Show event log
   * @param config Engine settings
   * @param log Optional diagnostic logger
   */
  ExecutionEngine(dmx::DmxTransmitter& transmitter, hal::IHalAudioPlayer* audio,
                  hal::IHalSystemTimer& timer, ActionLog& actions,
                  const EngineConfig& config, hal::IHalLog* log = nullptr);
  ~ExecutionEngine();

  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;

  /** Begin running a sequence and return immediately
   * @return ALREADY_RUNNING if a run is active (it is left untouched)
   *         INVALID_PARAM if the sequence has no commands
   */
  ShowResult start(const sequence::Sequence& sequence, RunMode mode);

  /** Ask the worker to stop at its next checkpoint. Non-blocking. */
  void requestStop();

  /** Stop the current run and wait for it (bounded by join_timeout_ms)
   *
   * Idempotent; returns OK when idle. If the worker is still inside
   * a long sleep when the timeout expires it finishes teardown on
   * its own at the next checkpoint.
   */
  ShowResult stop();

  /** Stop and wait for the worker without a time bound */
  void shutdown();

  /** Block until idle
   * @return true if the engine became idle within timeout_ms
   */
  bool waitUntilIdle(uint32_t timeout_ms);

  EngineStatus status() const;
  bool isRunning() const;
  const EngineConfig& getConfig() const{ return config_; }

private:
  static constexpr const char* TAG = "Engine";
  static constexpr uint32_t MAX_SLEEP_MS = 0xFFFFFFFFu;   // one wrap of the ms clock

  void run(sequence::Sequence sequence, RunMode mode);
  bool execute(const sequence::Command& cmd);
  void playSound(const sequence::Command& cmd);
  void waitForSound();
  void stopSound(bool log_when_idle);
  void sleepFor(double seconds);
  void teardown(const std::string& name, const char* reason);
  void joinWorker();

  dmx::DmxTransmitter& transmitter_;
  hal::IHalAudioPlayer* audio_;
  hal::IHalSystemTimer& timer_;
  ActionLog& actions_;
  EngineConfig config_;
  hal::IHalLog* log_;

  std::mutex control_mutex_;          // Serializes start/stop/shutdown
  mutable std::mutex state_mutex_;
  std::condition_variable idle_cv_;

  bool running_ = false;
  RunMode mode_ = RunMode::ONCE;
  std::string sequence_name_;
  uint32_t loop_count_ = 0;
  hal::timestamp_ms_t since_ = 0;

  std::atomic<bool> stop_requested_{false};
  std::thread worker_;
};

} // namespace dmxseq::engine

#endif // DMXSEQ_INCLUDE_ENGINE_EXECUTION_ENGINE_HPP_
