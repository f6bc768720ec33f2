/*****************************************************************
 * File:      Command.hpp
 * Category:  include/dmxseq/Sequence
 *
 * Purpose:
 *    Compiled sequence commands. A sequence is an ordered list
 *    of commands interpreted by the execution engine; no script
 *    text is ever evaluated at run time.
 *
 * Opcodes:
 *    WRITE_DMX       address, value
 *    SLEEP           seconds
 *    PLAY_SOUND      file, volume
 *    WAIT_FOR_SOUND  -
 *    STOP_SOUND      -
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_SEQUENCE_COMMAND_HPP_
#define DMXSEQ_INCLUDE_SEQUENCE_COMMAND_HPP_

#include <stdint.h>
#include <string>
#include <vector>

namespace dmxseq::sequence{

// ============================================================
// Opcodes
// ============================================================

enum class CommandOp : uint8_t{
  WRITE_DMX = 0,
  SLEEP,
  PLAY_SOUND,
  WAIT_FOR_SOUND,
  STOP_SOUND
};

/** DSL / artifact name of an opcode ("write_dmx", ...) */
const char* commandOpName(CommandOp op);

/** Look up an opcode by its DSL name
 * @return true if the name is a known command
 */
bool commandOpFromName(const char* name, CommandOp* out);

// ============================================================
// Command
// ============================================================

/** One executable step
 *
 * Only the operand fields of the opcode are meaningful. Build
 * commands through the named factories.
 */
struct Command{
  CommandOp op = CommandOp::WAIT_FOR_SOUND;
  uint32_t line = 0;        // 1-based source line

  int32_t address = 0;      // WRITE_DMX
  int32_t value = 0;        // WRITE_DMX
  double seconds = 0.0;     // SLEEP
  std::string file;         // PLAY_SOUND
  float volume = 1.0f;      // PLAY_SOUND

  static Command writeDmx(int32_t address, int32_t value, uint32_t line = 0);
  static Command sleep(double seconds, uint32_t line = 0);
  static Command playSound(const std::string& file, float volume = 1.0f, uint32_t line = 0);
  static Command waitForSound(uint32_t line = 0);
  static Command stopSound(uint32_t line = 0);

  /** Check operands against the ranges the compiler enforces */
  bool isWellFormed() const;

  bool operator==(const Command& other) const;
  bool operator!=(const Command& other) const{ return !(*this == other); }
};

// ============================================================
// Sequence
// ============================================================

/** A named, compiled show */
struct Sequence{
  std::string name;
  std::string source;               // Literal DSL text as authored
  std::vector<Command> commands;
};

} // namespace dmxseq::sequence

#endif // DMXSEQ_INCLUDE_SEQUENCE_COMMAND_HPP_
