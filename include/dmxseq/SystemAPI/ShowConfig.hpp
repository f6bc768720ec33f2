/*****************************************************************
 * File:      ShowConfig.hpp
 * Category:  include/dmxseq/SystemAPI
 *
 * Purpose:
 *    Device configuration: pins, directories, timing and boot
 *    behaviour. Loaded from a JSON file on the SD card and
 *    merged over built-in defaults; any key may be omitted.
 *
 * Example /sdcard/config.json:
 *    {
 *      "dmx_data_pin": 17, "control_pin": 4,
 *      "sequences_directory": "sequences",
 *      "sounds_directory": "sounds",
 *      "log_level": "INFO",
 *      "autostart_sequence": "intro", "autostart_loop": true
 *    }
 *****************************************************************/

#ifndef DMXSEQ_INCLUDE_SYSTEMAPI_SHOW_CONFIG_HPP_
#define DMXSEQ_INCLUDE_SYSTEMAPI_SHOW_CONFIG_HPP_

#include "dmxseq/Dmx/DmxTransmitter.hpp"
#include "dmxseq/Engine/ExecutionEngine.hpp"
#include "dmxseq/HAL/IHalLog.hpp"
#include "dmxseq/Sequence/SequenceCompiler.hpp"
#include "dmxseq/ShowResult.hpp"

#include <string>
#include <vector>

namespace dmxseq::api{

// ============================================================
// Pin Type
// ============================================================

/** GPIO pin as configured (-1 for unused) */
using Pin = int8_t;
constexpr Pin PIN_UNUSED = -1;
constexpr Pin PIN_MAX = 48;

constexpr const char* DEFAULT_CONFIG_PATH = "/sdcard/config.json";

// ============================================================
// Configuration
// ============================================================

struct ShowConfig{
  /** DMX line */
  struct Dmx{
    Pin data_pin = 17;
    Pin control_pin = 4;
    uint32_t break_us = 100;
    uint32_t mab_us = 12;
  } dmx;

  /** Sequence and sound storage */
  struct Storage{
    std::string sequences_directory = "sequences";
    std::string sounds_directory = "sounds";
    size_t max_sequence_size = 1048576;
    std::vector<std::string> sound_formats = {".wav", ".mp3", ".ogg", ".flac", ".m4a"};
  } storage;

  /** Execution engine */
  struct Engine{
    uint32_t wait_poll_ms = 100;
    uint32_t join_timeout_ms = 2000;
  } engine;

  hal::LogLevel log_level = hal::LogLevel::INFO;

  /** Startup behaviour */
  struct Boot{
    std::string autostart_sequence;
    bool autostart_loop = true;
    bool self_test = false;
  } boot;

  /** I2S audio output */
  struct I2s{
    Pin bck_pin = 26;
    Pin ws_pin = 25;
    Pin data_pin = 22;
  } i2s;

  /** SD card (SPI) */
  struct SdCard{
    Pin miso_pin = 19;
    Pin mosi_pin = 23;
    Pin clk_pin = 18;
    Pin cs_pin = 5;
  } sd;
};

// ============================================================
// Loading
// ============================================================

/** Merge a JSON document over a configuration
 *
 * Unknown keys are ignored. A key of the wrong type or out of
 * range is reported through the logger and keeps its previous
 * value. If the document does not parse, nothing is changed.
 *
 * @param json Document text
 * @param config Configuration to update
 * @param log Optional logger
 * @return ShowResult::OK, or INVALID_PARAM if the document is not a JSON object
 */
ShowResult parseShowConfig(const std::string& json, ShowConfig* config, hal::IHalLog* log = nullptr);

/** Load a configuration file over the defaults in config
 * @return NOT_FOUND if the file does not exist (defaults kept)
 *         INVALID_PARAM if it is malformed (defaults kept)
 *         IO_ERROR if it cannot be read
 */
ShowResult loadShowConfig(const char* path, ShowConfig* config, hal::IHalLog* log = nullptr);

/** Write a configuration as JSON (used to seed a fresh card) */
ShowResult saveShowConfig(const char* path, const ShowConfig& config, hal::IHalLog* log = nullptr);

/** Make relative directories absolute under base_dir */
void resolveDirectories(ShowConfig* config, const std::string& base_dir);

// ============================================================
// Component Settings
// ============================================================

dmx::DmxLineConfig toLineConfig(const ShowConfig& config);
sequence::CompilerConfig toCompilerConfig(const ShowConfig& config);
engine::EngineConfig toEngineConfig(const ShowConfig& config);

} // namespace dmxseq::api

#endif // DMXSEQ_INCLUDE_SYSTEMAPI_SHOW_CONFIG_HPP_
