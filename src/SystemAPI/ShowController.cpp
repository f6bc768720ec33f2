/*****************************************************************
 * File:      ShowController.cpp
 * Category:  src/SystemAPI
 *
 * Purpose:
 *    Control surface facade.
 *****************************************************************/

#include "dmxseq/SystemAPI/ShowController.hpp"

namespace dmxseq::api{

using engine::ActionCategory;

ShowController::ShowController(sequence::SequenceCompiler& compiler, engine::ExecutionEngine& engine,
                               engine::ActionLog& actions, DmxDiagnostics* diagnostics,
                               hal::IHalLog* log)
  : compiler_(compiler), engine_(engine), actions_(actions), diagnostics_(diagnostics), log_(log){}

// ============================================================
// Playback
// ============================================================

ShowResult ShowController::start(const std::string& name, engine::RunMode mode){
  if(!sequence::SequenceCompiler::isValidName(name)) return ShowResult::INVALID_NAME;

  std::lock_guard<std::mutex> lock(line_mutex_);
  if(diagnostic_active_){
    if(log_) log_->warn(TAG, "Line test in progress, '%s' not started", name.c_str());
    return ShowResult::BUSY;
  }
  if(engine_.isRunning()) return ShowResult::ALREADY_RUNNING;

  sequence::Sequence seq;
  ShowResult result = compiler_.loadSequence(name, &seq);
  if(result != ShowResult::OK){
    if(result == ShowResult::CORRUPT_ARTIFACT){
      actions_.append(ActionCategory::ERROR, "Sequence " + name + " is corrupt", {{"sequence", name}});
    }
    if(log_) log_->warn(TAG, "Cannot start '%s': %s", name.c_str(), showResultToString(result));
    return result;
  }

  return engine_.start(seq, mode);
}

ShowResult ShowController::stop(){
  return engine_.stop();
}

engine::EngineStatus ShowController::status() const{
  return engine_.status();
}

// ============================================================
// Sequences
// ============================================================

sequence::ValidationReport ShowController::validate(const std::string& text) const{
  return compiler_.validate(text);
}

sequence::GenerateResult ShowController::save(const std::string& name, const std::string& text){
  return compiler_.generate(name, text);
}

ShowResult ShowController::load(const std::string& name, std::string* text) const{
  return compiler_.load(name, text);
}

ShowResult ShowController::remove(const std::string& name){
  if(!sequence::SequenceCompiler::isValidName(name)) return ShowResult::INVALID_NAME;
  if(!compiler_.exists(name)) return ShowResult::NOT_FOUND;

  if(engine_.isRunning()){
    if(log_) log_->info(TAG, "Stopping running show before deleting '%s'", name.c_str());
    ShowResult stopped = engine_.stop();
    if(stopped != ShowResult::OK) return stopped;
  }
  return compiler_.remove(name);
}

ShowResult ShowController::list(std::vector<sequence::SequenceInfo>* out) const{
  return compiler_.list(out);
}

const std::vector<sequence::ExampleSequence>& ShowController::examples() const{
  return sequence::SequenceCompiler::exampleSequences();
}

ShowResult ShowController::installExamples(size_t* installed){
  size_t count = 0;
  for(const sequence::ExampleSequence& example : examples()){
    if(compiler_.exists(example.name)) continue;

    sequence::GenerateResult result = compiler_.generate(example.name, example.source);
    if(result.result != ShowResult::OK){
      if(log_) log_->error(TAG, "Example '%s' not installed: %s",
                           example.name, showResultToString(result.result));
      if(installed) *installed = count;
      return result.result;
    }
    count++;
  }

  if(count > 0 && log_) log_->info(TAG, "Installed %u example sequence(s)", (unsigned)count);
  if(installed) *installed = count;
  return ShowResult::OK;
}

// ============================================================
// Action Log
// ============================================================

std::vector<engine::ActionLogEntry> ShowController::getRecentLog(size_t n) const{
  return actions_.getRecent(n);
}

std::vector<engine::ActionLogEntry> ShowController::getLogSince(uint64_t last_id) const{
  return actions_.getSince(last_id);
}

void ShowController::clearLog(){
  actions_.clear();
}

// ============================================================
// Line Tests
// ============================================================

ShowResult ShowController::runDiagnostic(DiagnosticPattern pattern, DiagnosticReport* report){
  if(!diagnostics_) return ShowResult::NOT_FOUND;

  {
    std::lock_guard<std::mutex> lock(line_mutex_);
    if(diagnostic_active_ || engine_.isRunning()) return ShowResult::BUSY;
    diagnostic_active_ = true;
  }

  ShowResult result = diagnostics_->run(pattern, report);

  {
    std::lock_guard<std::mutex> lock(line_mutex_);
    diagnostic_active_ = false;
  }
  return result;
}

} // namespace dmxseq::api
