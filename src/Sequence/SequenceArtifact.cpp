/*****************************************************************
 * File:      SequenceArtifact.cpp
 * Category:  src/Sequence
 *
 * Purpose:
 *    Sequence artifact JSON encode/decode.
 *****************************************************************/

#include "SequenceArtifact.hpp"
#include "dmxseq/Sequence/SequenceCompiler.hpp"

#include <cmath>
#include <stdlib.h>
#include "cJSON.h"

namespace dmxseq::sequence::artifact{

namespace{

cJSON* encodeCommand(const Command& cmd){
  cJSON* item = cJSON_CreateObject();
  if(!item) return nullptr;

  cJSON_AddStringToObject(item, "op", commandOpName(cmd.op));
  cJSON_AddNumberToObject(item, "line", cmd.line);

  switch(cmd.op){
    case CommandOp::WRITE_DMX:
      cJSON_AddNumberToObject(item, "address", cmd.address);
      cJSON_AddNumberToObject(item, "value", cmd.value);
      break;
    case CommandOp::SLEEP:
      cJSON_AddNumberToObject(item, "seconds", cmd.seconds);
      break;
    case CommandOp::PLAY_SOUND:
      cJSON_AddStringToObject(item, "file", cmd.file.c_str());
      cJSON_AddNumberToObject(item, "volume", cmd.volume);
      break;
    default:
      break;
  }
  return item;
}

bool readInt(const cJSON* object, const char* key, int32_t* out){
  const cJSON* item = cJSON_GetObjectItem(object, key);
  if(!item || !cJSON_IsNumber(item)) return false;
  double value = item->valuedouble;
  if(!std::isfinite(value) || value != std::floor(value)) return false;
  if(value < -2147483648.0 || value > 2147483647.0) return false;
  *out = static_cast<int32_t>(value);
  return true;
}

bool decodeCommand(const cJSON* item, Command* out, std::string* error){
  if(!cJSON_IsObject(item)){
    *error = "command is not an object";
    return false;
  }

  const cJSON* op = cJSON_GetObjectItem(item, "op");
  CommandOp code = CommandOp::WAIT_FOR_SOUND;
  if(!op || !cJSON_IsString(op) || !commandOpFromName(op->valuestring, &code)){
    *error = "unknown command";
    return false;
  }

  int32_t line = 0;
  if(!readInt(item, "line", &line) || line < 0){
    *error = "missing line number";
    return false;
  }

  Command cmd;
  switch(code){
    case CommandOp::WRITE_DMX:{
      int32_t address = 0;
      int32_t value = 0;
      if(!readInt(item, "address", &address) || !readInt(item, "value", &value)){
        *error = "write_dmx operands missing";
        return false;
      }
      cmd = Command::writeDmx(address, value, line);
      break;
    }
    case CommandOp::SLEEP:{
      const cJSON* seconds = cJSON_GetObjectItem(item, "seconds");
      if(!seconds || !cJSON_IsNumber(seconds)){
        *error = "sleep duration missing";
        return false;
      }
      cmd = Command::sleep(seconds->valuedouble, line);
      break;
    }
    case CommandOp::PLAY_SOUND:{
      const cJSON* file = cJSON_GetObjectItem(item, "file");
      const cJSON* volume = cJSON_GetObjectItem(item, "volume");
      if(!file || !cJSON_IsString(file) || !volume || !cJSON_IsNumber(volume)){
        *error = "play_sound operands missing";
        return false;
      }
      cmd = Command::playSound(file->valuestring, static_cast<float>(volume->valuedouble), line);
      break;
    }
    case CommandOp::WAIT_FOR_SOUND:
      cmd = Command::waitForSound(line);
      break;
    case CommandOp::STOP_SOUND:
      cmd = Command::stopSound(line);
      break;
  }

  if(!cmd.isWellFormed()){
    *error = "operand out of range on line " + std::to_string(line);
    return false;
  }

  *out = cmd;
  return true;
}

/** Parse the envelope shared by decode() and decodeSource() */
cJSON* parseEnvelope(const std::string& json, std::string* error){
  cJSON* root = cJSON_Parse(json.c_str());
  if(!root){
    *error = "not valid JSON";
    return nullptr;
  }

  const cJSON* format = cJSON_GetObjectItem(root, "format");
  if(!format || !cJSON_IsNumber(format) || format->valueint != ARTIFACT_FORMAT){
    *error = "unsupported artifact format";
    cJSON_Delete(root);
    return nullptr;
  }

  const cJSON* source = cJSON_GetObjectItem(root, "source");
  if(!source || !cJSON_IsString(source)){
    *error = "source text missing";
    cJSON_Delete(root);
    return nullptr;
  }
  return root;
}

} // namespace

// ============================================================
// Public API
// ============================================================

bool encode(const Sequence& sequence, std::string* out){
  cJSON* root = cJSON_CreateObject();
  if(!root) return false;

  cJSON_AddNumberToObject(root, "format", ARTIFACT_FORMAT);
  cJSON_AddStringToObject(root, "name", sequence.name.c_str());
  cJSON_AddStringToObject(root, "source", sequence.source.c_str());

  cJSON* commands = cJSON_CreateArray();
  if(!commands){
    cJSON_Delete(root);
    return false;
  }
  cJSON_AddItemToObject(root, "commands", commands);

  for(const Command& cmd : sequence.commands){
    cJSON* item = encodeCommand(cmd);
    if(!item){
      cJSON_Delete(root);
      return false;
    }
    cJSON_AddItemToArray(commands, item);
  }

  char* json = cJSON_Print(root);
  cJSON_Delete(root);
  if(!json) return false;

  out->assign(json);
  cJSON_free(json);
  return true;
}

bool decode(const std::string& json, Sequence* out, std::string* error){
  cJSON* root = parseEnvelope(json, error);
  if(!root) return false;

  Sequence sequence;
  const cJSON* name = cJSON_GetObjectItem(root, "name");
  if(name && cJSON_IsString(name)){
    sequence.name = name->valuestring;
  }
  sequence.source = cJSON_GetObjectItem(root, "source")->valuestring;

  const cJSON* commands = cJSON_GetObjectItem(root, "commands");
  if(!commands || !cJSON_IsArray(commands)){
    *error = "command list missing";
    cJSON_Delete(root);
    return false;
  }

  const cJSON* item = nullptr;
  cJSON_ArrayForEach(item, commands){
    Command cmd;
    if(!decodeCommand(item, &cmd, error)){
      cJSON_Delete(root);
      return false;
    }
    sequence.commands.push_back(cmd);
  }

  cJSON_Delete(root);
  *out = sequence;
  return true;
}

bool decodeSource(const std::string& json, std::string* source, std::string* error){
  cJSON* root = parseEnvelope(json, error);
  if(!root) return false;

  source->assign(cJSON_GetObjectItem(root, "source")->valuestring);
  cJSON_Delete(root);
  return true;
}

} // namespace dmxseq::sequence::artifact
