#include "dmxseq/SystemAPI/ShowConfig.hpp"
#include "support/CaptureLog.hpp"
#include "support/TempDir.hpp"

#include <gtest/gtest.h>

using namespace dmxseq;
using namespace dmxseq::api;

TEST(ShowConfigTest, DefaultsMatchTheReferenceWiring){
  ShowConfig config;
  EXPECT_EQ(17, config.dmx.data_pin);
  EXPECT_EQ(4, config.dmx.control_pin);
  EXPECT_EQ(100u, config.dmx.break_us);
  EXPECT_EQ(12u, config.dmx.mab_us);
  EXPECT_EQ("sequences", config.storage.sequences_directory);
  EXPECT_EQ("sounds", config.storage.sounds_directory);
  EXPECT_EQ(1048576u, config.storage.max_sequence_size);
  EXPECT_EQ(100u, config.engine.wait_poll_ms);
  EXPECT_EQ(2000u, config.engine.join_timeout_ms);
  EXPECT_EQ(hal::LogLevel::INFO, config.log_level);
  EXPECT_TRUE(config.boot.autostart_sequence.empty());
}

TEST(ShowConfigTest, MergesKnownKeysOverDefaults){
  ShowConfig config;
  ASSERT_EQ(ShowResult::OK, parseShowConfig(
    "{\"dmx_data_pin\": 21, \"control_pin\": -1, \"dmx_break_us\": 176,"
    " \"sounds_directory\": \"audio\", \"sound_formats\": [\"WAV\", \"mp3\"],"
    " \"log_level\": \"debug\", \"autostart_sequence\": \"intro\", \"autostart_loop\": false,"
    " \"boot_self_test\": true, \"wait_poll_ms\": 50, \"unknown_key\": 1}", &config));

  EXPECT_EQ(21, config.dmx.data_pin);
  EXPECT_EQ(PIN_UNUSED, config.dmx.control_pin);
  EXPECT_EQ(176u, config.dmx.break_us);
  EXPECT_EQ(12u, config.dmx.mab_us);
  EXPECT_EQ("audio", config.storage.sounds_directory);
  EXPECT_EQ("sequences", config.storage.sequences_directory);
  ASSERT_EQ(2u, config.storage.sound_formats.size());
  EXPECT_EQ(".wav", config.storage.sound_formats[0]);
  EXPECT_EQ(".mp3", config.storage.sound_formats[1]);
  EXPECT_EQ(hal::LogLevel::DEBUG, config.log_level);
  EXPECT_EQ("intro", config.boot.autostart_sequence);
  EXPECT_FALSE(config.boot.autostart_loop);
  EXPECT_TRUE(config.boot.self_test);
  EXPECT_EQ(50u, config.engine.wait_poll_ms);
}

TEST(ShowConfigTest, BadValuesKeepPreviousSettings){
  test::CaptureLog log;
  ShowConfig config;
  ASSERT_EQ(ShowResult::OK, parseShowConfig(
    "{\"dmx_data_pin\": 99, \"dmx_break_us\": 20, \"log_level\": \"LOUD\","
    " \"autostart_loop\": \"yes\", \"sounds_directory\": 5}", &config, &log));

  EXPECT_EQ(17, config.dmx.data_pin);
  EXPECT_EQ(100u, config.dmx.break_us);
  EXPECT_EQ(hal::LogLevel::INFO, config.log_level);
  EXPECT_TRUE(config.boot.autostart_loop);
  EXPECT_EQ("sounds", config.storage.sounds_directory);
  EXPECT_EQ(5u, log.count(hal::LogLevel::WARN));
}

TEST(ShowConfigTest, ControlPinSharingDataPinIsDisabled){
  ShowConfig config;
  ASSERT_EQ(ShowResult::OK, parseShowConfig("{\"dmx_data_pin\": 4}", &config));
  EXPECT_EQ(4, config.dmx.data_pin);
  EXPECT_EQ(PIN_UNUSED, config.dmx.control_pin);
  EXPECT_EQ(hal::GPIO_PIN_NONE, toLineConfig(config).control_pin);
}

TEST(ShowConfigTest, MalformedDocumentChangesNothing){
  ShowConfig config;
  config.dmx.data_pin = 13;
  EXPECT_EQ(ShowResult::INVALID_PARAM, parseShowConfig("[1, 2]", &config));
  EXPECT_EQ(ShowResult::INVALID_PARAM, parseShowConfig("{ broken", &config));
  EXPECT_EQ(13, config.dmx.data_pin);
}

TEST(ShowConfigTest, LoadReportsMissingAndMalformedFiles){
  test::TempDir dir;
  ShowConfig config;

  EXPECT_EQ(ShowResult::NOT_FOUND, loadShowConfig(dir.file("none.json").c_str(), &config));

  ASSERT_TRUE(test::writeFile(dir.file("bad.json"), "{\"dmx_data_pin\": 21,"));
  EXPECT_EQ(ShowResult::INVALID_PARAM, loadShowConfig(dir.file("bad.json").c_str(), &config));
  EXPECT_EQ(17, config.dmx.data_pin);

  ASSERT_TRUE(test::writeFile(dir.file("good.json"), "{\"dmx_data_pin\": 21}"));
  EXPECT_EQ(ShowResult::OK, loadShowConfig(dir.file("good.json").c_str(), &config));
  EXPECT_EQ(21, config.dmx.data_pin);
}

TEST(ShowConfigTest, SavedConfigLoadsBack){
  test::TempDir dir;
  ShowConfig original;
  original.dmx.data_pin = 16;
  original.dmx.control_pin = PIN_UNUSED;
  original.storage.sound_formats = {".wav"};
  original.log_level = hal::LogLevel::WARN;
  original.boot.autostart_sequence = "finale";
  original.sd.cs_pin = 15;

  const std::string path = dir.file("config.json");
  ASSERT_EQ(ShowResult::OK, saveShowConfig(path.c_str(), original));

  ShowConfig loaded;
  ASSERT_EQ(ShowResult::OK, loadShowConfig(path.c_str(), &loaded));
  EXPECT_EQ(16, loaded.dmx.data_pin);
  EXPECT_EQ(PIN_UNUSED, loaded.dmx.control_pin);
  EXPECT_EQ(std::vector<std::string>{".wav"}, loaded.storage.sound_formats);
  EXPECT_EQ(hal::LogLevel::WARN, loaded.log_level);
  EXPECT_EQ("finale", loaded.boot.autostart_sequence);
  EXPECT_EQ(15, loaded.sd.cs_pin);
}

TEST(ShowConfigTest, RelativeDirectoriesResolveAgainstBase){
  ShowConfig config;
  config.storage.sounds_directory = "/abs/sounds";
  resolveDirectories(&config, "/sdcard/");
  EXPECT_EQ("/sdcard/sequences", config.storage.sequences_directory);
  EXPECT_EQ("/abs/sounds", config.storage.sounds_directory);

  EXPECT_EQ("/sdcard/sequences", toCompilerConfig(config).sequences_directory);
  EXPECT_EQ("/abs/sounds", toEngineConfig(config).sounds_directory);
}
