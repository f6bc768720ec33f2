/*****************************************************************
 * File:      Command.cpp
 * Category:  src/Sequence
 *
 * Purpose:
 *    Command factories, opcode names and operand checks.
 *****************************************************************/

#include "dmxseq/Sequence/Command.hpp"
#include "dmxseq/Dmx/DmxFrame.hpp"

#include <cmath>
#include <string.h>

namespace dmxseq::sequence{

namespace{

struct OpName{
  CommandOp op;
  const char* name;
};

constexpr OpName OP_NAMES[] = {
  {CommandOp::WRITE_DMX,      "write_dmx"},
  {CommandOp::SLEEP,          "sleep"},
  {CommandOp::PLAY_SOUND,     "play_sound"},
  {CommandOp::WAIT_FOR_SOUND, "wait_for_sound"},
  {CommandOp::STOP_SOUND,     "stop_sound"}
};

} // namespace

const char* commandOpName(CommandOp op){
  for(const OpName& entry : OP_NAMES){
    if(entry.op == op) return entry.name;
  }
  return "unknown";
}

bool commandOpFromName(const char* name, CommandOp* out){
  if(!name) return false;
  for(const OpName& entry : OP_NAMES){
    if(strcmp(entry.name, name) == 0){
      if(out) *out = entry.op;
      return true;
    }
  }
  return false;
}

// ============================================================
// Factories
// ============================================================

Command Command::writeDmx(int32_t address, int32_t value, uint32_t line){
  Command cmd;
  cmd.op = CommandOp::WRITE_DMX;
  cmd.line = line;
  cmd.address = address;
  cmd.value = value;
  return cmd;
}

Command Command::sleep(double seconds, uint32_t line){
  Command cmd;
  cmd.op = CommandOp::SLEEP;
  cmd.line = line;
  cmd.seconds = seconds;
  return cmd;
}

Command Command::playSound(const std::string& file, float volume, uint32_t line){
  Command cmd;
  cmd.op = CommandOp::PLAY_SOUND;
  cmd.line = line;
  cmd.file = file;
  cmd.volume = volume;
  return cmd;
}

Command Command::waitForSound(uint32_t line){
  Command cmd;
  cmd.op = CommandOp::WAIT_FOR_SOUND;
  cmd.line = line;
  return cmd;
}

Command Command::stopSound(uint32_t line){
  Command cmd;
  cmd.op = CommandOp::STOP_SOUND;
  cmd.line = line;
  return cmd;
}

// ============================================================
// Checks
// ============================================================

bool Command::isWellFormed() const{
  switch(op){
    case CommandOp::WRITE_DMX:
      return address >= dmx::DMX_MIN_ADDRESS && address <= dmx::DMX_MAX_ADDRESS
          && value >= 0 && value <= 255;
    case CommandOp::SLEEP:
      return std::isfinite(seconds) && seconds >= 0.0;
    case CommandOp::PLAY_SOUND:
      return !file.empty() && std::isfinite(volume) && volume >= 0.0f && volume <= 1.0f;
    case CommandOp::WAIT_FOR_SOUND:
    case CommandOp::STOP_SOUND:
      return true;
    default:
      return false;
  }
}

bool Command::operator==(const Command& other) const{
  if(op != other.op || line != other.line) return false;
  switch(op){
    case CommandOp::WRITE_DMX:
      return address == other.address && value == other.value;
    case CommandOp::SLEEP:
      return seconds == other.seconds;
    case CommandOp::PLAY_SOUND:
      return file == other.file && volume == other.volume;
    default:
      return true;
  }
}

} // namespace dmxseq::sequence
