/*****************************************************************
 * File:      ShowController.hpp
 * Category:  include/dmxseq/SystemAPI
 *
 * Purpose:
 *    Control surface of the sequencer. Front ends (serial
 *    console, web UI, buttons) talk to the show exclusively
 *    through this facade; it composes the compiler, the engine,
 *    the action log and the DMX line tests.
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_SYSTEMAPI_SHOW_CONTROLLER_HPP_
#define DMXSEQ_INCLUDE_SYSTEMAPI_SHOW_CONTROLLER_HPP_

#include "dmxseq/Engine/ActionLog.hpp"
#include "dmxseq/Engine/ExecutionEngine.hpp"
#include "dmxseq/HAL/IHalLog.hpp"
#include "dmxseq/Sequence/SequenceCompiler.hpp"
#include "dmxseq/ShowResult.hpp"
#include "dmxseq/SystemAPI/DmxDiagnostics.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace dmxseq::api{

class ShowController{
public:
  /**
   * @param compiler Sequence store
   * @param engine The single execution engine
   * @param actions Show event log
   * @param diagnostics Optional line tests
   * @param log Optional diagnostic logger
   */
  ShowController(sequence::SequenceCompiler& compiler, engine::ExecutionEngine& engine,
                 engine::ActionLog& actions, DmxDiagnostics* diagnostics = nullptr,
                 hal::IHalLog* log = nullptr);

  // ========== Playback ==========

  /** Load a saved sequence and start it
   * @return NOT_FOUND, CORRUPT_ARTIFACT, ALREADY_RUNNING, BUSY (line test active)
   */
  ShowResult start(const std::string& name, engine::RunMode mode = engine::RunMode::LOOP);

  ShowResult stop();
  engine::EngineStatus status() const;

  // ========== Sequences ==========

  sequence::ValidationReport validate(const std::string& text) const;
  sequence::GenerateResult save(const std::string& name, const std::string& text);
  ShowResult load(const std::string& name, std::string* text) const;

  /** Delete a sequence, stopping any running show first */
  ShowResult remove(const std::string& name);

  ShowResult list(std::vector<sequence::SequenceInfo>* out) const;

  const std::vector<sequence::ExampleSequence>& examples() const;

  /** Save the built-in examples that are not on the card yet
   * @param installed Optional count of examples written
   */
  ShowResult installExamples(size_t* installed = nullptr);

  // ========== Action Log ==========

  std::vector<engine::ActionLogEntry> getRecentLog(size_t n) const;
  std::vector<engine::ActionLogEntry> getLogSince(uint64_t last_id) const;
  void clearLog();

  // ========== Line Tests ==========

  /** Run a DMX test pattern; refused while a show runs
   * @return BUSY while a show runs, NOT_FOUND without diagnostics
   */
  ShowResult runDiagnostic(DiagnosticPattern pattern, DiagnosticReport* report = nullptr);

private:
  static constexpr const char* TAG = "Show";

  sequence::SequenceCompiler& compiler_;
  engine::ExecutionEngine& engine_;
  engine::ActionLog& actions_;
  DmxDiagnostics* diagnostics_;
  hal::IHalLog* log_;

  std::mutex line_mutex_;           // Guards diagnostic_active_ against start()
  bool diagnostic_active_ = false;
};

} // namespace dmxseq::api

#endif // DMXSEQ_INCLUDE_SYSTEMAPI_SHOW_CONTROLLER_HPP_
