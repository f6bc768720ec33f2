/*****************************************************************
 * File:      SequenceCompiler.hpp
 * Category:  include/dmxseq/Sequence
 *
 * Purpose:
 *    Validates show DSL text, compiles it into a command list
 *    and persists sequences as JSON artifacts, one file per
 *    sequence in the sequences directory.
 *
 * DSL (one call per line, literal arguments only):
 *    write_dmx(address, value)     address 1..512, value 0..255
 *    sleep(seconds)                seconds >= 0
 *    play_sound("file"[, volume])  volume 0.0..1.0
 *    wait_for_sound()
 *    stop_sound()
 *    # comment
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_SEQUENCE_SEQUENCE_COMPILER_HPP_
#define DMXSEQ_INCLUDE_SEQUENCE_SEQUENCE_COMPILER_HPP_

#include "dmxseq/HAL/IHalLog.hpp"
#include "dmxseq/Sequence/Command.hpp"
#include "dmxseq/ShowResult.hpp"

#include <stdint.h>
#include <mutex>
#include <string>
#include <vector>

namespace dmxseq::sequence{

// ============================================================
// Diagnostics
// ============================================================

/** Diagnostic codes reported by validation */
enum class DiagnosticCode : uint8_t{
  INPUT_REJECTED = 0,    // Whole source rejected (size, NUL byte)
  INVALID_CALL,          // Line is not a single function call
  INVALID_ARGUMENT,      // Argument is not a literal of the right type
  WRONG_ARITY,           // Wrong number of arguments
  ADDRESS_OUT_OF_RANGE,
  VALUE_OUT_OF_RANGE,
  NEGATIVE_SLEEP,
  LONG_SLEEP,            // Warning
  VOLUME_OUT_OF_RANGE,
  UNSUPPORTED_FORMAT,    // Warning
  UNKNOWN_FUNCTION       // Warning
};

const char* diagnosticCodeToString(DiagnosticCode code);

/** One line-numbered error or warning */
struct Diagnostic{
  uint32_t line = 0;       // 1-based, 0 for whole-input problems
  DiagnosticCode code = DiagnosticCode::INVALID_CALL;
  std::string message;

  /** "Line N: message" */
  std::string toString() const;
};

/** Outcome of validating a source */
struct ValidationReport{
  std::vector<Diagnostic> errors;
  std::vector<Diagnostic> warnings;

  bool isValid() const{ return errors.empty(); }
};

// ============================================================
// Compiler Types
// ============================================================

/** Sleeps longer than this are legal but flagged */
constexpr double LONG_SLEEP_WARNING_S = 3600.0;

constexpr size_t MAX_SEQUENCE_NAME = 64;

/** Current artifact format version */
constexpr int ARTIFACT_FORMAT = 1;

struct CompilerConfig{
  std::string sequences_directory = "sequences";
  size_t max_sequence_size = 1048576;
  std::vector<std::string> sound_formats = {".wav", ".mp3", ".ogg", ".flac", ".m4a"};
};

/** Listing entry */
struct SequenceInfo{
  std::string name;
  uint64_t size = 0;        // Artifact size in bytes
  int64_t modified = 0;     // Seconds since epoch
};

struct GenerateResult{
  ShowResult result = ShowResult::OK;
  ValidationReport report;
};

/** Built-in example script */
struct ExampleSequence{
  const char* name;
  const char* description;
  const char* source;
};

// ============================================================
// Sequence Compiler
// ============================================================

class SequenceCompiler{
public:
  explicit SequenceCompiler(const CompilerConfig& config, hal::IHalLog* log = nullptr);

  /** Validate DSL text. Pure and deterministic. */
  ValidationReport validate(const std::string& text) const;

  /** Validate and build the command list
   * @param text DSL source
   * @param commands Receives the commands; left empty when errors exist
   */
  ValidationReport compile(const std::string& text, std::vector<Command>* commands) const;

  /** Validate, compile and persist under a name
   *
   * Nothing is written unless validation reports zero errors.
   * An existing sequence of the same name is replaced atomically.
   */
  GenerateResult generate(const std::string& name, const std::string& text);

  /** Read back the source text exactly as it was saved */
  ShowResult load(const std::string& name, std::string* text) const;

  /** Decode the compiled sequence for execution
   * @return CORRUPT_ARTIFACT if the file is unreadable or a command
   *         fails its range checks
   */
  ShowResult loadSequence(const std::string& name, Sequence* out) const;

  /** Delete a sequence */
  ShowResult remove(const std::string& name);

  /** All sequences, most recently modified first */
  ShowResult list(std::vector<SequenceInfo>* out) const;

  bool exists(const std::string& name) const;

  /** Names are 1..64 characters of [A-Za-z0-9_-] */
  static bool isValidName(const std::string& name);

  static const std::vector<ExampleSequence>& exampleSequences();

  std::string artifactPath(const std::string& name) const;
  const CompilerConfig& getConfig() const{ return config_; }

private:
  static constexpr const char* TAG = "Compiler";
  static constexpr const char* ARTIFACT_EXT = ".json";

  bool ensureDirectory() const;
  ShowResult readArtifact(const std::string& name, std::string* json) const;

  CompilerConfig config_;
  hal::IHalLog* log_;
  mutable std::mutex io_mutex_;
};

} // namespace dmxseq::sequence

#endif // DMXSEQ_INCLUDE_SEQUENCE_SEQUENCE_COMPILER_HPP_
