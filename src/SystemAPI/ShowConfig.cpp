/*****************************************************************
 * File:      ShowConfig.cpp
 * Category:  src/SystemAPI
 *
 * Purpose:
 *    JSON configuration loading (cJSON) and mapping onto the
 *    component settings.
 *****************************************************************/

#include "dmxseq/SystemAPI/ShowConfig.hpp"

#include <errno.h>
#include <initializer_list>
#include <stdio.h>
#include <string.h>
#include "cJSON.h"

namespace dmxseq::api{

namespace{

constexpr const char* TAG = "Config";

const cJSON* item(const cJSON* root, const char* key){
  return cJSON_GetObjectItem(root, key);
}

void readPin(const cJSON* root, const char* key, bool allow_unused, Pin* out, hal::IHalLog* log){
  const cJSON* value = item(root, key);
  if(!value) return;
  if(!cJSON_IsNumber(value)){
    if(log) log->warn(TAG, "%s must be a number, keeping %d", key, *out);
    return;
  }
  int pin = value->valueint;
  int min = allow_unused ? PIN_UNUSED : 0;
  if(pin < min || pin > PIN_MAX || value->valuedouble != static_cast<double>(pin)){
    if(log) log->warn(TAG, "%s=%g is not a usable pin, keeping %d", key, value->valuedouble, *out);
    return;
  }
  *out = static_cast<Pin>(pin);
}

void readUint(const cJSON* root, const char* key, uint32_t min, uint32_t max, uint32_t* out,
              hal::IHalLog* log){
  const cJSON* value = item(root, key);
  if(!value) return;
  if(!cJSON_IsNumber(value) || value->valuedouble < min || value->valuedouble > max){
    if(log) log->warn(TAG, "%s must be between %lu and %lu, keeping %lu", key,
                      (unsigned long)min, (unsigned long)max, (unsigned long)*out);
    return;
  }
  *out = static_cast<uint32_t>(value->valuedouble);
}

void readString(const cJSON* root, const char* key, std::string* out, hal::IHalLog* log){
  const cJSON* value = item(root, key);
  if(!value) return;
  if(!cJSON_IsString(value)){
    if(log) log->warn(TAG, "%s must be a string", key);
    return;
  }
  *out = value->valuestring;
}

void readBool(const cJSON* root, const char* key, bool* out, hal::IHalLog* log){
  const cJSON* value = item(root, key);
  if(!value) return;
  if(!cJSON_IsBool(value)){
    if(log) log->warn(TAG, "%s must be true or false", key);
    return;
  }
  *out = cJSON_IsTrue(value);
}

void readFormats(const cJSON* root, std::vector<std::string>* out, hal::IHalLog* log){
  const cJSON* value = item(root, "sound_formats");
  if(!value) return;
  if(!cJSON_IsArray(value)){
    if(log) log->warn(TAG, "sound_formats must be a list of extensions");
    return;
  }

  std::vector<std::string> formats;
  const cJSON* entry = nullptr;
  cJSON_ArrayForEach(entry, value){
    if(!cJSON_IsString(entry) || entry->valuestring[0] == '\0'){
      if(log) log->warn(TAG, "sound_formats entries must be non-empty strings");
      return;
    }
    std::string ext = entry->valuestring;
    for(char& c : ext){
      if(c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    if(ext[0] != '.') ext = "." + ext;
    formats.push_back(ext);
  }
  *out = formats;
}

} // namespace

// ============================================================
// Loading
// ============================================================

ShowResult parseShowConfig(const std::string& json, ShowConfig* config, hal::IHalLog* log){
  if(!config) return ShowResult::INVALID_PARAM;

  cJSON* root = cJSON_Parse(json.c_str());
  if(!root || !cJSON_IsObject(root)){
    if(log) log->error(TAG, "Configuration is not a JSON object, using defaults");
    cJSON_Delete(root);
    return ShowResult::INVALID_PARAM;
  }

  ShowConfig& c = *config;

  readPin(root, "dmx_data_pin", false, &c.dmx.data_pin, log);
  readPin(root, "control_pin", true, &c.dmx.control_pin, log);
  readUint(root, "dmx_break_us", dmx::DMX_MIN_BREAK_US, 1000000, &c.dmx.break_us, log);
  readUint(root, "dmx_mab_us", dmx::DMX_MIN_MAB_US, 1000000, &c.dmx.mab_us, log);

  readString(root, "sequences_directory", &c.storage.sequences_directory, log);
  readString(root, "sounds_directory", &c.storage.sounds_directory, log);
  uint32_t max_size = static_cast<uint32_t>(c.storage.max_sequence_size);
  readUint(root, "max_sequence_size", 1, 0x7FFFFFFF, &max_size, log);
  c.storage.max_sequence_size = max_size;
  readFormats(root, &c.storage.sound_formats, log);

  readUint(root, "wait_poll_ms", 1, 60000, &c.engine.wait_poll_ms, log);
  readUint(root, "join_timeout_ms", 0, 600000, &c.engine.join_timeout_ms, log);

  const cJSON* level = item(root, "log_level");
  if(level){
    hal::LogLevel parsed = c.log_level;
    if(cJSON_IsString(level) && hal::parseLogLevel(level->valuestring, &parsed)){
      c.log_level = parsed;
    }else if(log){
      log->warn(TAG, "log_level must be one of NONE, ERROR, WARN, INFO, DEBUG, VERBOSE");
    }
  }

  readString(root, "autostart_sequence", &c.boot.autostart_sequence, log);
  readBool(root, "autostart_loop", &c.boot.autostart_loop, log);
  readBool(root, "boot_self_test", &c.boot.self_test, log);

  readPin(root, "i2s_bck_pin", false, &c.i2s.bck_pin, log);
  readPin(root, "i2s_ws_pin", false, &c.i2s.ws_pin, log);
  readPin(root, "i2s_data_pin", false, &c.i2s.data_pin, log);

  readPin(root, "sd_miso_pin", false, &c.sd.miso_pin, log);
  readPin(root, "sd_mosi_pin", false, &c.sd.mosi_pin, log);
  readPin(root, "sd_clk_pin", false, &c.sd.clk_pin, log);
  readPin(root, "sd_cs_pin", false, &c.sd.cs_pin, log);

  cJSON_Delete(root);

  if(c.dmx.control_pin == c.dmx.data_pin){
    if(log) log->warn(TAG, "control_pin equals dmx_data_pin, control signal disabled");
    c.dmx.control_pin = PIN_UNUSED;
  }
  return ShowResult::OK;
}

ShowResult loadShowConfig(const char* path, ShowConfig* config, hal::IHalLog* log){
  if(!path || !config) return ShowResult::INVALID_PARAM;

  FILE* f = fopen(path, "rb");
  if(!f){
    if(errno == ENOENT){
      if(log) log->info(TAG, "%s not found, using defaults", path);
      return ShowResult::NOT_FOUND;
    }
    if(log) log->error(TAG, "Cannot open %s: %s", path, strerror(errno));
    return ShowResult::IO_ERROR;
  }

  std::string json;
  char buffer[256];
  size_t n;
  while((n = fread(buffer, 1, sizeof(buffer), f)) > 0){
    json.append(buffer, n);
  }
  bool failed = ferror(f) != 0;
  fclose(f);

  if(failed){
    if(log) log->error(TAG, "Read failed for %s", path);
    return ShowResult::IO_ERROR;
  }

  // Parse into a copy so a malformed file leaves config untouched
  ShowConfig merged = *config;
  ShowResult result = parseShowConfig(json, &merged, log);
  if(result != ShowResult::OK) return result;

  *config = merged;
  if(log) log->info(TAG, "Loaded %s", path);
  return ShowResult::OK;
}

ShowResult saveShowConfig(const char* path, const ShowConfig& config, hal::IHalLog* log){
  if(!path) return ShowResult::INVALID_PARAM;

  cJSON* root = cJSON_CreateObject();
  if(!root) return ShowResult::IO_ERROR;

  cJSON_AddNumberToObject(root, "dmx_data_pin", config.dmx.data_pin);
  cJSON_AddNumberToObject(root, "control_pin", config.dmx.control_pin);
  cJSON_AddNumberToObject(root, "dmx_break_us", config.dmx.break_us);
  cJSON_AddNumberToObject(root, "dmx_mab_us", config.dmx.mab_us);
  cJSON_AddStringToObject(root, "sequences_directory", config.storage.sequences_directory.c_str());
  cJSON_AddStringToObject(root, "sounds_directory", config.storage.sounds_directory.c_str());
  cJSON_AddNumberToObject(root, "max_sequence_size", static_cast<double>(config.storage.max_sequence_size));

  cJSON* formats = cJSON_CreateArray();
  for(const std::string& ext : config.storage.sound_formats){
    cJSON_AddItemToArray(formats, cJSON_CreateString(ext.c_str()));
  }
  cJSON_AddItemToObject(root, "sound_formats", formats);

  cJSON_AddNumberToObject(root, "wait_poll_ms", config.engine.wait_poll_ms);
  cJSON_AddNumberToObject(root, "join_timeout_ms", config.engine.join_timeout_ms);

  const char* level = "INFO";
  switch(config.log_level){
    case hal::LogLevel::NONE:    level = "NONE"; break;
    case hal::LogLevel::ERROR:   level = "ERROR"; break;
    case hal::LogLevel::WARN:    level = "WARN"; break;
    case hal::LogLevel::INFO:    level = "INFO"; break;
    case hal::LogLevel::DEBUG:   level = "DEBUG"; break;
    case hal::LogLevel::VERBOSE: level = "VERBOSE"; break;
  }
  cJSON_AddStringToObject(root, "log_level", level);

  cJSON_AddStringToObject(root, "autostart_sequence", config.boot.autostart_sequence.c_str());
  cJSON_AddBoolToObject(root, "autostart_loop", config.boot.autostart_loop);
  cJSON_AddBoolToObject(root, "boot_self_test", config.boot.self_test);

  cJSON_AddNumberToObject(root, "i2s_bck_pin", config.i2s.bck_pin);
  cJSON_AddNumberToObject(root, "i2s_ws_pin", config.i2s.ws_pin);
  cJSON_AddNumberToObject(root, "i2s_data_pin", config.i2s.data_pin);
  cJSON_AddNumberToObject(root, "sd_miso_pin", config.sd.miso_pin);
  cJSON_AddNumberToObject(root, "sd_mosi_pin", config.sd.mosi_pin);
  cJSON_AddNumberToObject(root, "sd_clk_pin", config.sd.clk_pin);
  cJSON_AddNumberToObject(root, "sd_cs_pin", config.sd.cs_pin);

  char* json = cJSON_Print(root);
  cJSON_Delete(root);
  if(!json) return ShowResult::IO_ERROR;

  FILE* f = fopen(path, "wb");
  if(!f){
    if(log) log->error(TAG, "Cannot create %s: %s", path, strerror(errno));
    cJSON_free(json);
    return ShowResult::IO_ERROR;
  }
  size_t len = strlen(json);
  bool ok = fwrite(json, 1, len, f) == len;
  ok = (fclose(f) == 0) && ok;
  cJSON_free(json);

  if(!ok){
    if(log) log->error(TAG, "Write failed for %s", path);
    return ShowResult::IO_ERROR;
  }
  if(log) log->info(TAG, "Wrote %s", path);
  return ShowResult::OK;
}

void resolveDirectories(ShowConfig* config, const std::string& base_dir){
  if(!config || base_dir.empty()) return;

  std::string base = base_dir;
  while(base.size() > 1 && base.back() == '/') base.pop_back();

  for(std::string* dir : {&config->storage.sequences_directory, &config->storage.sounds_directory}){
    if(dir->empty() || (*dir)[0] == '/') continue;
    *dir = base + "/" + *dir;
  }
}

// ============================================================
// Component Settings
// ============================================================

dmx::DmxLineConfig toLineConfig(const ShowConfig& config){
  dmx::DmxLineConfig line;
  line.data_pin = static_cast<hal::gpio_pin_t>(config.dmx.data_pin);
  line.control_pin = config.dmx.control_pin == PIN_UNUSED
                   ? hal::GPIO_PIN_NONE
                   : static_cast<hal::gpio_pin_t>(config.dmx.control_pin);
  line.break_us = config.dmx.break_us;
  line.mab_us = config.dmx.mab_us;
  return line;
}

sequence::CompilerConfig toCompilerConfig(const ShowConfig& config){
  sequence::CompilerConfig compiler;
  compiler.sequences_directory = config.storage.sequences_directory;
  compiler.max_sequence_size = config.storage.max_sequence_size;
  compiler.sound_formats = config.storage.sound_formats;
  return compiler;
}

engine::EngineConfig toEngineConfig(const ShowConfig& config){
  engine::EngineConfig engine;
  engine.sounds_directory = config.storage.sounds_directory;
  engine.wait_poll_ms = config.engine.wait_poll_ms;
  engine.join_timeout_ms = config.engine.join_timeout_ms;
  return engine;
}

} // namespace dmxseq::api
