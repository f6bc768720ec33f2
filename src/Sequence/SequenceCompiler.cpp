/*****************************************************************
 * File:      SequenceCompiler.cpp
 * Category:  src/Sequence
 *
 * Purpose:
 *    DSL validation, compilation and sequence persistence.
 *    Artifacts are written to a temporary file and renamed over
 *    the target so a reader never sees a partial sequence.
 *****************************************************************/

#include "dmxseq/Sequence/SequenceCompiler.hpp"
#include "DslParser.hpp"
#include "SequenceArtifact.hpp"
#include "dmxseq/Dmx/DmxFrame.hpp"

#include <algorithm>
#include <cmath>
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace dmxseq::sequence{

using dsl::Literal;
using dsl::ParsedLine;

// ============================================================
// Diagnostics
// ============================================================

const char* diagnosticCodeToString(DiagnosticCode code){
  switch(code){
    case DiagnosticCode::INPUT_REJECTED:       return "INPUT_REJECTED";
    case DiagnosticCode::INVALID_CALL:         return "INVALID_CALL";
    case DiagnosticCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
    case DiagnosticCode::WRONG_ARITY:          return "WRONG_ARITY";
    case DiagnosticCode::ADDRESS_OUT_OF_RANGE: return "ADDRESS_OUT_OF_RANGE";
    case DiagnosticCode::VALUE_OUT_OF_RANGE:   return "VALUE_OUT_OF_RANGE";
    case DiagnosticCode::NEGATIVE_SLEEP:       return "NEGATIVE_SLEEP";
    case DiagnosticCode::LONG_SLEEP:           return "LONG_SLEEP";
    case DiagnosticCode::VOLUME_OUT_OF_RANGE:  return "VOLUME_OUT_OF_RANGE";
    case DiagnosticCode::UNSUPPORTED_FORMAT:   return "UNSUPPORTED_FORMAT";
    case DiagnosticCode::UNKNOWN_FUNCTION:     return "UNKNOWN_FUNCTION";
    default:                                   return "UNKNOWN";
  }
}

std::string Diagnostic::toString() const{
  return "Line " + std::to_string(line) + ": " + message;
}

namespace{

void addError(ValidationReport* report, uint32_t line, DiagnosticCode code, const std::string& message){
  report->errors.push_back(Diagnostic{line, code, message});
}

void addWarning(ValidationReport* report, uint32_t line, DiagnosticCode code, const std::string& message){
  report->warnings.push_back(Diagnostic{line, code, message});
}

std::string lowerExtension(const std::string& file){
  size_t dot = file.find_last_of('.');
  size_t slash = file.find_last_of('/');
  if(dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
  std::string ext = file.substr(dot);
  for(char& c : ext){
    if(c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return ext;
}

/** Check one integer operand of write_dmx
 * @return true if the operand is an in-range integer
 */
bool checkDmxOperand(const Literal& arg, int64_t min, int64_t max, const char* what,
                     DiagnosticCode range_code, uint32_t line, ValidationReport* report){
  if(arg.kind != Literal::Kind::INTEGER){
    addError(report, line, DiagnosticCode::INVALID_ARGUMENT,
             std::string(what) + " must be an integer, got " + arg.raw);
    return false;
  }
  if(arg.integer < min || arg.integer > max){
    addError(report, line, range_code,
             std::string(what) + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    return false;
  }
  return true;
}

// ============================================================
// Per-command checks
// ============================================================

void checkWriteDmx(const ParsedLine& call, uint32_t line, ValidationReport* report,
                   std::vector<Command>* commands){
  if(call.args.size() != 2){
    addError(report, line, DiagnosticCode::WRONG_ARITY, "write_dmx() requires 2 arguments");
    return;
  }
  // Both operands are checked so every failing argument is reported
  bool address_ok = checkDmxOperand(call.args[0], dmx::DMX_MIN_ADDRESS, dmx::DMX_MAX_ADDRESS,
                                    "DMX address", DiagnosticCode::ADDRESS_OUT_OF_RANGE, line, report);
  bool value_ok = checkDmxOperand(call.args[1], 0, 255,
                                  "DMX value", DiagnosticCode::VALUE_OUT_OF_RANGE, line, report);
  if(address_ok && value_ok && commands){
    commands->push_back(Command::writeDmx(static_cast<int32_t>(call.args[0].integer),
                                          static_cast<int32_t>(call.args[1].integer), line));
  }
}

void checkSleep(const ParsedLine& call, uint32_t line, ValidationReport* report,
                std::vector<Command>* commands){
  if(call.args.size() != 1){
    addError(report, line, DiagnosticCode::WRONG_ARITY, "sleep() requires 1 argument");
    return;
  }
  const Literal& arg = call.args[0];
  if(!arg.isNumeric() || !std::isfinite(arg.number)){
    addError(report, line, DiagnosticCode::INVALID_ARGUMENT, "Sleep time must be a number, got " + arg.raw);
    return;
  }
  if(arg.number < 0.0){
    addError(report, line, DiagnosticCode::NEGATIVE_SLEEP, "Sleep time cannot be negative");
    return;
  }
  if(arg.number > LONG_SLEEP_WARNING_S){
    char message[64];
    snprintf(message, sizeof(message), "Sleep time is very long (%gs)", arg.number);
    addWarning(report, line, DiagnosticCode::LONG_SLEEP, message);
  }
  if(commands) commands->push_back(Command::sleep(arg.number, line));
}

void checkPlaySound(const ParsedLine& call, uint32_t line, const CompilerConfig& config,
                    ValidationReport* report, std::vector<Command>* commands){
  if(call.args.empty() || call.args.size() > 2){
    addError(report, line, DiagnosticCode::WRONG_ARITY, "play_sound() requires 1-2 arguments");
    return;
  }

  bool ok = true;
  const Literal& file = call.args[0];
  if(file.kind != Literal::Kind::STRING){
    addError(report, line, DiagnosticCode::INVALID_ARGUMENT, "Sound filename must be a string");
    ok = false;
  }else if(file.text.empty()){
    addError(report, line, DiagnosticCode::INVALID_ARGUMENT, "Sound filename cannot be empty");
    ok = false;
  }

  double volume = 1.0;
  if(call.args.size() == 2){
    const Literal& vol = call.args[1];
    if(!vol.isNumeric() || !std::isfinite(vol.number)){
      addError(report, line, DiagnosticCode::INVALID_ARGUMENT, "Volume must be a number, got " + vol.raw);
      ok = false;
    }else if(vol.number < 0.0 || vol.number > 1.0){
      addError(report, line, DiagnosticCode::VOLUME_OUT_OF_RANGE, "Volume must be between 0.0 and 1.0");
      ok = false;
    }else{
      volume = vol.number;
    }
  }

  if(!ok) return;

  const std::string ext = lowerExtension(file.text);
  if(std::find(config.sound_formats.begin(), config.sound_formats.end(), ext) == config.sound_formats.end()){
    addWarning(report, line, DiagnosticCode::UNSUPPORTED_FORMAT, "Unsupported sound format: " + file.text);
  }

  if(commands) commands->push_back(Command::playSound(file.text, static_cast<float>(volume), line));
}

void checkNoArgs(const ParsedLine& call, CommandOp op, uint32_t line, ValidationReport* report,
                 std::vector<Command>* commands){
  if(!call.args.empty()){
    addError(report, line, DiagnosticCode::WRONG_ARITY, call.name + "() takes no arguments");
    return;
  }
  if(commands){
    commands->push_back(op == CommandOp::STOP_SOUND ? Command::stopSound(line) : Command::waitForSound(line));
  }
}

/** Shared body of validate() and compile() */
ValidationReport analyze(const std::string& text, const CompilerConfig& config,
                         std::vector<Command>* commands){
  ValidationReport report;

  if(text.size() > config.max_sequence_size){
    addError(&report, 0, DiagnosticCode::INPUT_REJECTED,
             "Sequence exceeds maximum size of " + std::to_string(config.max_sequence_size) + " bytes");
    return report;
  }
  if(text.find('\0') != std::string::npos){
    addError(&report, 0, DiagnosticCode::INPUT_REJECTED, "Sequence contains a NUL byte");
    return report;
  }

  const std::vector<std::string> lines = dsl::splitLines(text);
  for(size_t i = 0; i < lines.size(); i++){
    const uint32_t line = static_cast<uint32_t>(i + 1);
    const ParsedLine parsed = dsl::parseLine(lines[i]);

    if(parsed.kind == ParsedLine::Kind::BLANK) continue;
    if(parsed.kind == ParsedLine::Kind::MALFORMED){
      addError(&report, line, DiagnosticCode::INVALID_CALL, "Invalid function call: " + parsed.statement);
      continue;
    }

    CommandOp op = CommandOp::WAIT_FOR_SOUND;
    if(!commandOpFromName(parsed.name.c_str(), &op)){
      addWarning(&report, line, DiagnosticCode::UNKNOWN_FUNCTION, "Unknown function: " + parsed.name);
      continue;
    }

    switch(op){
      case CommandOp::WRITE_DMX:
        checkWriteDmx(parsed, line, &report, commands);
        break;
      case CommandOp::SLEEP:
        checkSleep(parsed, line, &report, commands);
        break;
      case CommandOp::PLAY_SOUND:
        checkPlaySound(parsed, line, config, &report, commands);
        break;
      case CommandOp::WAIT_FOR_SOUND:
      case CommandOp::STOP_SOUND:
        checkNoArgs(parsed, op, line, &report, commands);
        break;
    }
  }

  return report;
}

bool makeDirectories(const std::string& path){
  if(path.empty()) return false;

  struct stat st;
  if(stat(path.c_str(), &st) == 0) return S_ISDIR(st.st_mode);

  size_t slash = path.find_last_of('/');
  if(slash != std::string::npos && slash > 0){
    if(!makeDirectories(path.substr(0, slash))) return false;
  }
  return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
}

} // namespace

// ============================================================
// Sequence Compiler
// ============================================================

SequenceCompiler::SequenceCompiler(const CompilerConfig& config, hal::IHalLog* log)
  : config_(config), log_(log){
  while(config_.sequences_directory.size() > 1 && config_.sequences_directory.back() == '/'){
    config_.sequences_directory.pop_back();
  }
}

ValidationReport SequenceCompiler::validate(const std::string& text) const{
  return analyze(text, config_, nullptr);
}

ValidationReport SequenceCompiler::compile(const std::string& text, std::vector<Command>* commands) const{
  std::vector<Command> built;
  ValidationReport report = analyze(text, config_, &built);
  if(commands){
    if(report.isValid()){
      *commands = built;
    }else{
      commands->clear();
    }
  }
  return report;
}

GenerateResult SequenceCompiler::generate(const std::string& name, const std::string& text){
  GenerateResult result;

  if(!isValidName(name)){
    if(log_) log_->warn(TAG, "Rejected sequence name '%s'", name.c_str());
    result.result = ShowResult::INVALID_NAME;
    return result;
  }

  Sequence sequence;
  sequence.name = name;
  sequence.source = text;
  result.report = compile(text, &sequence.commands);

  if(!result.report.isValid()){
    if(log_) log_->info(TAG, "Sequence '%s' has %u error(s), not saved",
                        name.c_str(), (unsigned)result.report.errors.size());
    result.result = ShowResult::VALIDATION_FAILED;
    return result;
  }

  std::string json;
  if(!artifact::encode(sequence, &json)){
    if(log_) log_->error(TAG, "Out of memory encoding '%s'", name.c_str());
    result.result = ShowResult::IO_ERROR;
    return result;
  }

  std::lock_guard<std::mutex> lock(io_mutex_);

  if(!ensureDirectory()){
    result.result = ShowResult::IO_ERROR;
    return result;
  }

  const std::string path = artifactPath(name);
  const std::string tmp = path + ".tmp";

  FILE* f = fopen(tmp.c_str(), "wb");
  if(!f){
    if(log_) log_->error(TAG, "Cannot create %s: %s", tmp.c_str(), strerror(errno));
    result.result = ShowResult::IO_ERROR;
    return result;
  }

  size_t written = fwrite(json.data(), 1, json.size(), f);
  bool flushed = fflush(f) == 0;
  bool closed = fclose(f) == 0;

  if(written != json.size() || !flushed || !closed){
    if(log_) log_->error(TAG, "Write failed for %s", tmp.c_str());
    ::remove(tmp.c_str());
    result.result = ShowResult::IO_ERROR;
    return result;
  }

  if(rename(tmp.c_str(), path.c_str()) != 0){
    if(log_) log_->error(TAG, "Cannot replace %s: %s", path.c_str(), strerror(errno));
    ::remove(tmp.c_str());
    result.result = ShowResult::IO_ERROR;
    return result;
  }

  if(log_) log_->info(TAG, "Saved sequence '%s' (%u commands, %u warnings)",
                      name.c_str(), (unsigned)sequence.commands.size(),
                      (unsigned)result.report.warnings.size());
  result.result = ShowResult::OK;
  return result;
}

ShowResult SequenceCompiler::load(const std::string& name, std::string* text) const{
  if(!isValidName(name)) return ShowResult::INVALID_NAME;

  std::string json;
  ShowResult result = readArtifact(name, &json);
  if(result != ShowResult::OK) return result;

  std::string error;
  std::string source;
  if(!artifact::decodeSource(json, &source, &error)){
    if(log_) log_->error(TAG, "Sequence '%s' is corrupt: %s", name.c_str(), error.c_str());
    return ShowResult::CORRUPT_ARTIFACT;
  }
  if(text) *text = source;
  return ShowResult::OK;
}

ShowResult SequenceCompiler::loadSequence(const std::string& name, Sequence* out) const{
  if(!isValidName(name)) return ShowResult::INVALID_NAME;

  std::string json;
  ShowResult result = readArtifact(name, &json);
  if(result != ShowResult::OK) return result;

  std::string error;
  Sequence sequence;
  if(!artifact::decode(json, &sequence, &error)){
    if(log_) log_->error(TAG, "Sequence '%s' is corrupt: %s", name.c_str(), error.c_str());
    return ShowResult::CORRUPT_ARTIFACT;
  }
  sequence.name = name;
  if(out) *out = sequence;
  return ShowResult::OK;
}

ShowResult SequenceCompiler::remove(const std::string& name){
  if(!isValidName(name)) return ShowResult::INVALID_NAME;

  std::lock_guard<std::mutex> lock(io_mutex_);
  const std::string path = artifactPath(name);
  if(::remove(path.c_str()) != 0){
    if(errno == ENOENT) return ShowResult::NOT_FOUND;
    if(log_) log_->error(TAG, "Cannot delete %s: %s", path.c_str(), strerror(errno));
    return ShowResult::IO_ERROR;
  }

  if(log_) log_->info(TAG, "Deleted sequence '%s'", name.c_str());
  return ShowResult::OK;
}

ShowResult SequenceCompiler::list(std::vector<SequenceInfo>* out) const{
  if(!out) return ShowResult::INVALID_PARAM;
  out->clear();

  std::lock_guard<std::mutex> lock(io_mutex_);

  DIR* dir = opendir(config_.sequences_directory.c_str());
  if(!dir){
    if(errno == ENOENT) return ShowResult::OK;
    if(log_) log_->error(TAG, "Cannot open %s: %s", config_.sequences_directory.c_str(), strerror(errno));
    return ShowResult::IO_ERROR;
  }

  const size_t ext_len = strlen(ARTIFACT_EXT);
  struct dirent* entry;
  while((entry = readdir(dir)) != nullptr){
    std::string file = entry->d_name;
    if(file.size() <= ext_len || file.compare(file.size() - ext_len, ext_len, ARTIFACT_EXT) != 0){
      continue;
    }
    std::string name = file.substr(0, file.size() - ext_len);
    if(!isValidName(name)) continue;

    struct stat st;
    std::string path = config_.sequences_directory + "/" + file;
    if(stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;

    SequenceInfo info;
    info.name = name;
    info.size = static_cast<uint64_t>(st.st_size);
    info.modified = static_cast<int64_t>(st.st_mtime);
    out->push_back(info);
  }
  closedir(dir);

  std::sort(out->begin(), out->end(), [](const SequenceInfo& a, const SequenceInfo& b){
    if(a.modified != b.modified) return a.modified > b.modified;
    return a.name < b.name;
  });
  return ShowResult::OK;
}

bool SequenceCompiler::exists(const std::string& name) const{
  if(!isValidName(name)) return false;
  struct stat st;
  return stat(artifactPath(name).c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool SequenceCompiler::isValidName(const std::string& name){
  if(name.empty() || name.size() > MAX_SEQUENCE_NAME) return false;
  for(char c : name){
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
           || c == '_' || c == '-';
    if(!ok) return false;
  }
  return true;
}

std::string SequenceCompiler::artifactPath(const std::string& name) const{
  return config_.sequences_directory + "/" + name + ARTIFACT_EXT;
}

// ============================================================
// File Helpers
// ============================================================

bool SequenceCompiler::ensureDirectory() const{
  if(makeDirectories(config_.sequences_directory)) return true;
  if(log_) log_->error(TAG, "Cannot create directory %s: %s",
                       config_.sequences_directory.c_str(), strerror(errno));
  return false;
}

ShowResult SequenceCompiler::readArtifact(const std::string& name, std::string* json) const{
  std::lock_guard<std::mutex> lock(io_mutex_);

  const std::string path = artifactPath(name);
  FILE* f = fopen(path.c_str(), "rb");
  if(!f){
    if(errno == ENOENT) return ShowResult::NOT_FOUND;
    if(log_) log_->error(TAG, "Cannot open %s: %s", path.c_str(), strerror(errno));
    return ShowResult::IO_ERROR;
  }

  std::string data;
  char buffer[512];
  size_t n;
  while((n = fread(buffer, 1, sizeof(buffer), f)) > 0){
    data.append(buffer, n);
  }
  bool failed = ferror(f) != 0;
  fclose(f);

  if(failed){
    if(log_) log_->error(TAG, "Read failed for %s", path.c_str());
    return ShowResult::IO_ERROR;
  }
  *json = data;
  return ShowResult::OK;
}

// ============================================================
// Examples
// ============================================================

const std::vector<ExampleSequence>& SequenceCompiler::exampleSequences(){
  static const std::vector<ExampleSequence> examples = {
    {"simple_dmx", "One channel on, wait, off",
     "# Simple DMX example\n"
     "write_dmx(1, 255)  # Channel 1 full\n"
     "sleep(2)           # Hold for 2 seconds\n"
     "write_dmx(1, 0)    # Channel 1 off\n"},

    {"dmx_fade", "Fade channel 1 up and back down",
     "# Fade channel 1 in\n"
     "write_dmx(1, 0)\nsleep(0.1)\n"
     "write_dmx(1, 32)\nsleep(0.1)\n"
     "write_dmx(1, 64)\nsleep(0.1)\n"
     "write_dmx(1, 96)\nsleep(0.1)\n"
     "write_dmx(1, 128)\nsleep(0.1)\n"
     "write_dmx(1, 160)\nsleep(0.1)\n"
     "write_dmx(1, 192)\nsleep(0.1)\n"
     "write_dmx(1, 224)\nsleep(0.1)\n"
     "write_dmx(1, 255)\n"
     "sleep(1)\n"
     "\n"
     "# Fade channel 1 out\n"
     "write_dmx(1, 192)\nsleep(0.1)\n"
     "write_dmx(1, 128)\nsleep(0.1)\n"
     "write_dmx(1, 64)\nsleep(0.1)\n"
     "write_dmx(1, 0)\n"},

    {"sound_and_light", "Light on while a clip plays",
     "# Sound and light show\n"
     "play_sound('intro.wav', 0.8)  # Intro at 80% volume\n"
     "write_dmx(1, 255)             # Light on\n"
     "wait_for_sound()              # Until the clip ends\n"
     "write_dmx(1, 0)               # Light off\n"},

    {"complex_sequence", "Four channel build, strobe over music, blackout",
     "# Build up channels 1-4\n"
     "write_dmx(1, 64)\n"
     "write_dmx(2, 128)\n"
     "write_dmx(3, 192)\n"
     "write_dmx(4, 255)\n"
     "sleep(1)\n"
     "\n"
     "# Strobe channel 1 over music\n"
     "play_sound('music.mp3', 1.0)\n"
     "write_dmx(1, 255)\nsleep(0.1)\nwrite_dmx(1, 0)\nsleep(0.1)\n"
     "write_dmx(1, 255)\nsleep(0.1)\nwrite_dmx(1, 0)\nsleep(0.1)\n"
     "write_dmx(1, 255)\nsleep(0.1)\nwrite_dmx(1, 0)\nsleep(0.1)\n"
     "stop_sound()\n"
     "\n"
     "# Blackout\n"
     "write_dmx(1, 0)\n"
     "write_dmx(2, 0)\n"
     "write_dmx(3, 0)\n"
     "write_dmx(4, 0)\n"}
  };
  return examples;
}

} // namespace dmxseq::sequence
