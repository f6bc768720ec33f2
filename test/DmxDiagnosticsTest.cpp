#include "dmxseq/SystemAPI/DmxDiagnostics.hpp"
#include "support/CaptureLog.hpp"
#include "support/FakeGpio.hpp"
#include "support/FakeTimers.hpp"

#include <gtest/gtest.h>

using namespace dmxseq;
using namespace dmxseq::api;
using dmxseq::engine::ActionCategory;
using dmxseq::engine::ActionLog;
using dmxseq::engine::ActionLogEntry;

namespace{

constexpr hal::gpio_pin_t DATA_PIN = 17;

class DmxDiagnosticsTest : public ::testing::Test{
protected:
  DmxDiagnosticsTest()
    : gpio_(&timer_), tx_(&gpio_, &timer_, &log_), actions_(&timer_),
      diagnostics_(tx_, timer_, &actions_, &log_){
    gpio_.setRecording(false);
  }

  void initLine(){
    dmx::DmxLineConfig cfg;
    cfg.data_pin = DATA_PIN;
    ASSERT_EQ(hal::HalResult::OK, tx_.init(cfg));
  }

  test::VirtualTimer timer_;
  test::FakeGpio gpio_;
  test::CaptureLog log_;
  dmx::DmxTransmitter tx_;
  ActionLog actions_;
  DmxDiagnostics diagnostics_;
};

} // namespace

TEST_F(DmxDiagnosticsTest, BasicHoldsLevelsThenBlacksOut){
  initLine();
  DiagnosticReport report;
  ASSERT_EQ(ShowResult::OK, diagnostics_.run(DiagnosticPattern::BASIC, &report));

  EXPECT_EQ(6u, report.frames_sent);   // five writes and the closing blackout
  EXPECT_EQ(1000u, timer_.totalDelayMs());
  EXPECT_TRUE(tx_.frame().isBlackout());
  EXPECT_TRUE(report.line_available);
}

TEST_F(DmxDiagnosticsTest, ChaseSweepAndFadeSendExpectedFrames){
  initLine();
  DiagnosticReport report;

  ASSERT_EQ(ShowResult::OK, diagnostics_.run(DiagnosticPattern::CHASE, &report));
  EXPECT_EQ(8u * 2 + 1, report.frames_sent);
  EXPECT_TRUE(tx_.frame().isBlackout());

  ASSERT_EQ(ShowResult::OK, diagnostics_.run(DiagnosticPattern::SWEEP, &report));
  EXPECT_EQ(16u + 15u + 1u, report.frames_sent);
  EXPECT_TRUE(tx_.frame().isBlackout());

  ASSERT_EQ(ShowResult::OK, diagnostics_.run(DiagnosticPattern::FADE, &report));
  EXPECT_EQ(16u + 16u + 1u, report.frames_sent);
  EXPECT_TRUE(tx_.frame().isBlackout());
}

TEST_F(DmxDiagnosticsTest, SettingsShapeThePattern){
  initLine();
  DiagnosticSettings settings;
  settings.chase_channels = 3;
  settings.chase_step_ms = 10;
  diagnostics_.setSettings(settings);

  DiagnosticReport report;
  ASSERT_EQ(ShowResult::OK, diagnostics_.run(DiagnosticPattern::CHASE, &report));
  EXPECT_EQ(7u, report.frames_sent);
  EXPECT_EQ(30u, timer_.totalDelayMs());
  EXPECT_EQ(3u, diagnostics_.getSettings().chase_channels);
}

TEST_F(DmxDiagnosticsTest, TimingReportsFrameStatistics){
  initLine();
  DiagnosticReport report;
  ASSERT_EQ(ShowResult::OK, diagnostics_.run(DiagnosticPattern::TIMING, &report));

  const uint32_t nominal = dmx::nominalFrameUs(tx_.getConfig());
  EXPECT_EQ(nominal, report.nominal_frame_us);
  EXPECT_EQ(nominal, report.min_frame_us);
  EXPECT_EQ(nominal, report.avg_frame_us);
  EXPECT_EQ(nominal, report.max_frame_us);
  EXPECT_EQ(11u, report.frames_sent);

  bool measured = false;
  for(const ActionLogEntry& entry : actions_.getRecent(10)){
    if(entry.message == "Frame timing measured"){
      measured = true;
      EXPECT_EQ(ActionCategory::DMX, entry.category);
      EXPECT_EQ(std::to_string(nominal), entry.field("avg_us"));
    }
  }
  EXPECT_TRUE(measured);
}

TEST_F(DmxDiagnosticsTest, UnavailableLineSkipsTheTest){
  gpio_.failPin(DATA_PIN);
  dmx::DmxLineConfig cfg;
  cfg.data_pin = DATA_PIN;
  EXPECT_NE(hal::HalResult::OK, tx_.init(cfg));

  DiagnosticReport report;
  EXPECT_EQ(ShowResult::IO_ERROR, diagnostics_.run(DiagnosticPattern::CHASE, &report));
  EXPECT_FALSE(report.line_available);
  EXPECT_EQ(0u, report.frames_sent);
  EXPECT_EQ(0u, timer_.totalDelayMs());

  std::vector<ActionLogEntry> entries = actions_.getRecent(1);
  ASSERT_EQ(1u, entries.size());
  EXPECT_EQ(ActionCategory::ERROR, entries[0].category);
  EXPECT_EQ("chase", entries[0].field("pattern"));
}

TEST_F(DmxDiagnosticsTest, LineLostDuringPatternIsReported){
  initLine();
  gpio_.failAfterWrites(500);
  DiagnosticReport report;
  EXPECT_EQ(ShowResult::IO_ERROR, diagnostics_.run(DiagnosticPattern::SWEEP, &report));
  EXPECT_FALSE(report.line_available);
  EXPECT_TRUE(tx_.frame().isBlackout());
}

TEST(DiagnosticPatternTest, NamesParseCaseInsensitively){
  DiagnosticPattern pattern = DiagnosticPattern::BASIC;
  EXPECT_TRUE(parseDiagnosticPattern("TIMING", &pattern));
  EXPECT_EQ(DiagnosticPattern::TIMING, pattern);
  EXPECT_TRUE(parseDiagnosticPattern("Chase", &pattern));
  EXPECT_EQ(DiagnosticPattern::CHASE, pattern);
  EXPECT_FALSE(parseDiagnosticPattern("strobe", &pattern));
  EXPECT_FALSE(parseDiagnosticPattern(nullptr, &pattern));
  EXPECT_STREQ("fade", diagnosticPatternToString(DiagnosticPattern::FADE));
}
