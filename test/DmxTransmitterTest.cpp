#include "dmxseq/Dmx/DmxTransmitter.hpp"
#include "support/CaptureLog.hpp"
#include "support/FakeGpio.hpp"
#include "support/FakeTimers.hpp"

#include <gtest/gtest.h>

using namespace dmxseq;
using dmxseq::dmx::DmxLineConfig;
using dmxseq::dmx::DmxTransmitter;
using dmxseq::hal::HalResult;
using dmxseq::hal::timestamp_us_t;

namespace{

constexpr hal::gpio_pin_t DATA_PIN = 17;
constexpr hal::gpio_pin_t CONTROL_PIN = 4;

/** Level of a pin at time t, reconstructed from recorded edges (idle high) */
bool levelAt(const std::vector<test::PinEdge>& edges, timestamp_us_t t){
  bool level = true;
  for(const test::PinEdge& e : edges){
    if(e.time_us > t) break;
    level = e.high;
  }
  return level;
}

/** Decoded view of one frame */
struct DecodedFrame{
  timestamp_us_t break_us = 0;
  timestamp_us_t mab_us = 0;
  std::vector<int> slots;       // -1 for a framing error
};

/** Decode a frame that starts at the first falling edge */
DecodedFrame decode(const std::vector<test::PinEdge>& edges, const DmxLineConfig& cfg){
  DecodedFrame out;
  if(edges.size() < 2 || edges[0].high || !edges[1].high) return out;

  const timestamp_us_t t0 = edges[0].time_us;
  out.break_us = edges[1].time_us - t0;

  size_t i = 2;
  while(i < edges.size() && edges[i].high) i++;
  if(i >= edges.size()) return out;
  out.mab_us = edges[i].time_us - edges[1].time_us;

  const timestamp_us_t first_slot = edges[i].time_us;
  const uint32_t bit = cfg.bit_us;
  for(size_t slot = 0; slot < dmx::DMX_FRAME_SIZE; slot++){
    timestamp_us_t s = first_slot + slot * dmx::DMX_BITS_PER_SLOT * bit;
    if(levelAt(edges, s + bit / 2)){
      out.slots.push_back(-1);
      continue;
    }
    int value = 0;
    for(int b = 0; b < 8; b++){
      if(levelAt(edges, s + (1 + b) * bit + bit / 2)) value |= (1 << b);
    }
    bool stop1 = levelAt(edges, s + 9 * bit + bit / 2);
    bool stop2 = levelAt(edges, s + 10 * bit + bit / 2);
    out.slots.push_back(stop1 && stop2 ? value : -1);
  }
  return out;
}

class DmxTransmitterTest : public ::testing::Test{
protected:
  DmxTransmitterTest() : gpio_(&timer_), tx_(&gpio_, &timer_, &log_){}

  DmxLineConfig lineConfig() const{
    DmxLineConfig cfg;
    cfg.data_pin = DATA_PIN;
    cfg.control_pin = CONTROL_PIN;
    return cfg;
  }

  test::VirtualTimer timer_;
  test::FakeGpio gpio_;
  test::CaptureLog log_;
  DmxTransmitter tx_;
};

} // namespace

TEST_F(DmxTransmitterTest, InitIdlesLineHighAndControlLow){
  ASSERT_EQ(HalResult::OK, tx_.init(lineConfig()));
  EXPECT_TRUE(tx_.isLineAvailable());
  EXPECT_TRUE(gpio_.isOutput(DATA_PIN));
  EXPECT_TRUE(gpio_.level(DATA_PIN));
  EXPECT_TRUE(gpio_.isOutput(CONTROL_PIN));
  EXPECT_FALSE(gpio_.level(CONTROL_PIN));
}

TEST_F(DmxTransmitterTest, WaveformCarriesFrameContents){
  ASSERT_EQ(HalResult::OK, tx_.init(lineConfig()));
  gpio_.clearEdges();

  tx_.writeChannel(1, 255);
  gpio_.clearEdges();
  tx_.writeChannel(3, 0xA5);

  DecodedFrame frame = decode(gpio_.edges(DATA_PIN), tx_.getConfig());
  EXPECT_GE(frame.break_us, dmx::DMX_MIN_BREAK_US);
  EXPECT_GE(frame.mab_us, dmx::DMX_MIN_MAB_US);
  ASSERT_EQ(dmx::DMX_FRAME_SIZE, frame.slots.size());

  EXPECT_EQ(0, frame.slots[0]);      // start code
  EXPECT_EQ(255, frame.slots[1]);    // persisted from the first write
  EXPECT_EQ(0, frame.slots[2]);
  EXPECT_EQ(0xA5, frame.slots[3]);
  for(size_t i = 4; i < frame.slots.size(); i++){
    ASSERT_EQ(0, frame.slots[i]) << "slot " << i;
  }
  EXPECT_TRUE(gpio_.level(DATA_PIN));  // back to mark after the frame
}

TEST_F(DmxTransmitterTest, FrameDurationMatchesNominal){
  ASSERT_EQ(HalResult::OK, tx_.init(lineConfig()));
  ASSERT_EQ(HalResult::OK, tx_.transmitFrame());
  EXPECT_EQ(dmx::nominalFrameUs(tx_.getConfig()), tx_.getLastFrameDurationUs());
  EXPECT_EQ(1u, tx_.getTransmitCount());
}

TEST_F(DmxTransmitterTest, ShortBreakAndMabAreRaisedToMinimum){
  DmxLineConfig cfg = lineConfig();
  cfg.break_us = 20;
  cfg.mab_us = 2;
  ASSERT_EQ(HalResult::OK, tx_.init(cfg));
  EXPECT_EQ(dmx::DMX_MIN_BREAK_US, tx_.getConfig().break_us);
  EXPECT_EQ(dmx::DMX_MIN_MAB_US, tx_.getConfig().mab_us);

  gpio_.clearEdges();
  tx_.transmitFrame();
  DecodedFrame frame = decode(gpio_.edges(DATA_PIN), tx_.getConfig());
  EXPECT_EQ(dmx::DMX_MIN_BREAK_US, frame.break_us);
  EXPECT_EQ(dmx::DMX_MIN_MAB_US, frame.mab_us);
}

TEST_F(DmxTransmitterTest, WriteChannelClampsInputs){
  ASSERT_EQ(HalResult::OK, tx_.init(lineConfig()));
  tx_.writeChannel(0, 999);
  tx_.writeChannel(600, -20);
  EXPECT_EQ(255, tx_.getChannel(1));
  EXPECT_EQ(0, tx_.getChannel(512));
  EXPECT_EQ(0, tx_.frame().data()[0]);
}

TEST_F(DmxTransmitterTest, ResetAllTransmitsExactlyOnce){
  ASSERT_EQ(HalResult::OK, tx_.init(lineConfig()));
  tx_.writeChannel(10, 200);
  tx_.writeChannel(11, 100);
  uint32_t before = tx_.getTransmitCount();

  tx_.resetAll();
  EXPECT_EQ(before + 1, tx_.getTransmitCount());
  EXPECT_TRUE(tx_.frame().isBlackout());
}

TEST_F(DmxTransmitterTest, UnavailableLineKeepsFrameAndLogsOnce){
  gpio_.failPin(DATA_PIN);
  EXPECT_NE(HalResult::OK, tx_.init(lineConfig()));
  EXPECT_FALSE(tx_.isLineAvailable());

  size_t warnings = log_.count(hal::LogLevel::WARN);
  tx_.writeChannel(5, 50);
  tx_.writeChannel(6, 60);
  EXPECT_EQ(HalResult::NOT_INITIALIZED, tx_.transmitFrame());

  EXPECT_EQ(50, tx_.getChannel(5));
  EXPECT_EQ(60, tx_.getChannel(6));
  EXPECT_EQ(0u, tx_.getTransmitCount());
  EXPECT_EQ(warnings + 1, log_.count(hal::LogLevel::WARN));
}

TEST_F(DmxTransmitterTest, WriteFailureMidFrameDisablesLine){
  ASSERT_EQ(HalResult::OK, tx_.init(lineConfig()));
  tx_.writeChannel(1, 0xFF);
  gpio_.failAfterWrites(10);

  EXPECT_EQ(HalResult::WRITE_FAILED, tx_.transmitFrame());
  EXPECT_FALSE(tx_.isLineAvailable());
  EXPECT_TRUE(log_.contains("DMX line disabled"));

  // Later operations are quiet no-ops
  EXPECT_EQ(HalResult::NOT_INITIALIZED, tx_.transmitFrame());
  tx_.resetAll();
  EXPECT_TRUE(tx_.frame().isBlackout());
}

TEST_F(DmxTransmitterTest, ReleaseRestoresMarkAfterFailureInBreak){
  ASSERT_EQ(HalResult::OK, tx_.init(lineConfig()));
  gpio_.failAfterWrites(1);   // break goes low, the mark write fails

  EXPECT_EQ(HalResult::WRITE_FAILED, tx_.transmitFrame());
  EXPECT_FALSE(tx_.isLineAvailable());
  EXPECT_FALSE(gpio_.level(DATA_PIN));

  gpio_.failAfterWrites(-1);
  tx_.releaseLine();
  EXPECT_TRUE(gpio_.level(DATA_PIN));
  EXPECT_FALSE(tx_.isLineAvailable());
  EXPECT_EQ(HalResult::NOT_INITIALIZED, tx_.transmitFrame());
}

TEST_F(DmxTransmitterTest, ControlPinFailureOnlyDisablesControlSignal){
  gpio_.failPin(CONTROL_PIN);
  ASSERT_EQ(HalResult::OK, tx_.init(lineConfig()));
  EXPECT_TRUE(tx_.isLineAvailable());
  EXPECT_EQ(hal::GPIO_PIN_NONE, tx_.getConfig().control_pin);

  tx_.setControlSignal(true);   // no-op, must not touch the data pin
  EXPECT_TRUE(gpio_.level(DATA_PIN));
}

TEST_F(DmxTransmitterTest, ControlSignalFollowsRequestsAndRelease){
  ASSERT_EQ(HalResult::OK, tx_.init(lineConfig()));
  tx_.setControlSignal(true);
  EXPECT_TRUE(gpio_.level(CONTROL_PIN));

  tx_.releaseLine();
  EXPECT_FALSE(gpio_.level(CONTROL_PIN));
  EXPECT_TRUE(gpio_.level(DATA_PIN));
}
