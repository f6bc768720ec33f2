/*****************************************************************
 * File:      main.cpp
 * Category:  src
 *
 * Purpose:
 *    ESP32 show controller firmware entry point.
 *    Mounts the SD card, loads config.json, builds the show
 *    stack once and hands it to the control surface. Optional
 *    boot self test and autostart sequence.
 *****************************************************************/

#include "HAL/ESP32/Esp32Hal.hpp"
#include "dmxseq/Dmx/DmxTransmitter.hpp"
#include "dmxseq/Engine/ActionLog.hpp"
#include "dmxseq/Engine/ExecutionEngine.hpp"
#include "dmxseq/Sequence/SequenceCompiler.hpp"
#include "dmxseq/SystemAPI/DmxDiagnostics.hpp"
#include "dmxseq/SystemAPI/ShowConfig.hpp"
#include "dmxseq/SystemAPI/ShowController.hpp"

#include <Arduino.h>
#include <esp_pthread.h>
#include <memory>

using namespace dmxseq;
using namespace dmxseq::hal;

static constexpr const char* TAG = "MAIN";
static constexpr uint32_t STATUS_INTERVAL_MS = 10000;
static constexpr size_t ENGINE_STACK_SIZE = 8192;

// ============================================================
// Show Stack
// ============================================================

static esp32::Esp32HalFactory hal_factory;
static api::ShowConfig show_config;

static std::unique_ptr<dmx::DmxTransmitter> transmitter;
static std::unique_ptr<engine::ActionLog> action_log;
static std::unique_ptr<sequence::SequenceCompiler> compiler;
static std::unique_ptr<engine::ExecutionEngine> show_engine;
static std::unique_ptr<api::DmxDiagnostics> diagnostics;
static std::unique_ptr<api::ShowController> controller;

static uint32_t last_status_ms = 0;
static uint64_t last_reported_id = 0;

/** Load config.json, writing the defaults on a fresh card */
static void loadConfiguration(IHalLog* log){
  ShowResult result = api::loadShowConfig(api::DEFAULT_CONFIG_PATH, &show_config, log);
  if(result == ShowResult::NOT_FOUND){
    log->info(TAG, "No %s, writing defaults", api::DEFAULT_CONFIG_PATH);
    result = api::saveShowConfig(api::DEFAULT_CONFIG_PATH, show_config, log);
    if(result != ShowResult::OK){
      log->warn(TAG, "Default config not written: %s", showResultToString(result));
    }
  }else if(result != ShowResult::OK){
    log->warn(TAG, "Using default config (%s)", showResultToString(result));
  }
}

static void startAudio(IHalLog* log){
  I2sConfig i2s;
  i2s.bck_pin = (gpio_pin_t)show_config.i2s.bck_pin;
  i2s.ws_pin = (gpio_pin_t)show_config.i2s.ws_pin;
  i2s.data_pin = (gpio_pin_t)show_config.i2s.data_pin;

  if(show_config.i2s.bck_pin == api::PIN_UNUSED || show_config.i2s.data_pin == api::PIN_UNUSED){
    log->warn(TAG, "I2S pins not configured, sound commands will fail");
    return;
  }
  log->logResult(hal_factory.initAudio(i2s), TAG, "I2S init");
}

/** Copy new show events onto the serial log */
static void reportActions(IHalLog* log){
  for(const engine::ActionLogEntry& entry : controller->getLogSince(last_reported_id)){
    log->info("SHOW", "#%llu %s: %s", (unsigned long long)entry.id,
              engine::actionCategoryToString(entry.category), entry.message.c_str());
    last_reported_id = entry.id;
  }
}

// ============================================================
// Arduino Entry Points
// ============================================================

void setup(){
  Serial.begin(115200);
  delay(200);

  IHalLog* log = &hal_factory.log;
  if(hal_factory.initCore(LogLevel::INFO) != HalResult::OK){
    Serial.println("HAL core init failed");
    return;
  }
  log->info(TAG, "DMX sequencer starting");

  // Storage and configuration
  SdCardConfig sd;
  sd.miso_pin = show_config.sd.miso_pin;
  sd.mosi_pin = show_config.sd.mosi_pin;
  sd.clk_pin = show_config.sd.clk_pin;
  sd.cs_pin = show_config.sd.cs_pin;

  HalResult sd_result = hal_factory.initStorage(sd);
  log->logResult(sd_result, TAG, "SD card mount");
  if(sd_result == HalResult::OK){
    loadConfiguration(log);
    api::resolveDirectories(&show_config, hal_factory.sd.getMountPoint());
  }else{
    log->error(TAG, "No storage, sequences cannot be saved or loaded");
    api::resolveDirectories(&show_config, "/sdcard");
  }
  hal_factory.log.setLevel(show_config.log_level);

  startAudio(log);

  // The engine worker is a pthread; give it room for cJSON and logging
  esp_pthread_cfg_t thread_cfg = esp_pthread_get_default_config();
  thread_cfg.stack_size = ENGINE_STACK_SIZE;
  thread_cfg.thread_name = "show";
  esp_pthread_set_cfg(&thread_cfg);

  // Show stack, built once
  transmitter.reset(new dmx::DmxTransmitter(&hal_factory.gpio, &hal_factory.timer, log));
  log->logResult(transmitter->init(api::toLineConfig(show_config)), TAG, "DMX line init");

  action_log.reset(new engine::ActionLog(&hal_factory.timer));
  compiler.reset(new sequence::SequenceCompiler(api::toCompilerConfig(show_config), log));
  show_engine.reset(new engine::ExecutionEngine(*transmitter,
                                                hal_factory.i2s.isInitialized() ? &hal_factory.audio : nullptr,
                                                hal_factory.timer, *action_log,
                                                api::toEngineConfig(show_config), log));
  diagnostics.reset(new api::DmxDiagnostics(*transmitter, hal_factory.timer, action_log.get(), log));
  controller.reset(new api::ShowController(*compiler, *show_engine, *action_log, diagnostics.get(), log));

  if(sd_result == HalResult::OK){
    size_t installed = 0;
    ShowResult result = controller->installExamples(&installed);
    if(result != ShowResult::OK){
      log->warn(TAG, "Examples not installed: %s", showResultToString(result));
    }
  }

  // Boot behaviour
  if(show_config.boot.self_test){
    api::DiagnosticReport report;
    ShowResult result = controller->runDiagnostic(api::DiagnosticPattern::CHASE, &report);
    log->info(TAG, "Self test: %s, %lu frames", showResultToString(result),
              (unsigned long)report.frames_sent);
  }

  if(!show_config.boot.autostart_sequence.empty()){
    const std::string& name = show_config.boot.autostart_sequence;
    engine::RunMode mode = show_config.boot.autostart_loop ? engine::RunMode::LOOP : engine::RunMode::ONCE;
    ShowResult result = controller->start(name, mode);
    log->info(TAG, "Autostart '%s' (%s): %s", name.c_str(), engine::runModeToString(mode),
              showResultToString(result));
  }

  reportActions(log);
  log->info(TAG, "Ready");
}

void loop(){
  if(!controller){
    delay(1000);
    return;
  }

  IHalLog* log = &hal_factory.log;
  reportActions(log);

  uint32_t now = hal_factory.timer.millis();
  if(now - last_status_ms >= STATUS_INTERVAL_MS){
    last_status_ms = now;
    engine::EngineStatus status = controller->status();
    if(status.running){
      log->info(TAG, "Running '%s' (%s), %lu loop(s), sound %s", status.sequence_name.c_str(),
                engine::runModeToString(status.mode), (unsigned long)status.loop_count,
                status.sound_playing ? "on" : "off");
    }else{
      log->debug(TAG, "Idle, free heap %lu", (unsigned long)ESP.getFreeHeap());
    }
  }

  delay(50);
}
