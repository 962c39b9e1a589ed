#include <gtest/gtest.h>
#include "anomaly.hpp"
#include "types.hpp"

using namespace std::chrono;

// Test SessionState naming
class SessionStateTest : public ::testing::Test {};

TEST_F(SessionStateTest, DefaultIsIdle) {
    SessionState s;
    EXPECT_TRUE(holds<session_state::Idle>(s));
    EXPECT_STREQ(state_name(s), "Idle");
}

TEST_F(SessionStateTest, Names) {
    EXPECT_STREQ(state_name(session_state::Preparing{}), "Preparing");
    EXPECT_STREQ(state_name(session_state::Connecting{}), "Connecting");
    EXPECT_STREQ(state_name(session_state::Streaming{}), "Streaming");
    EXPECT_STREQ(state_name(session_state::Reconnecting{}), "Reconnecting");
    EXPECT_STREQ(state_name(session_state::Error{"x"}), "Error");
}

TEST_F(SessionStateTest, DescribeCarriesPayload) {
    EXPECT_EQ(describe(session_state::Streaming{250000}), "Streaming(250000bps)");
    EXPECT_EQ(describe(session_state::Error{"authentication failed"}),
              "Error(authentication failed)");
    EXPECT_EQ(describe(session_state::Idle{}), "Idle");
}

// Test StreamSettings defaults
TEST(StreamSettingsTest, DefaultValues) {
    StreamSettings s;
    EXPECT_EQ(s.video_width, 1920);
    EXPECT_EQ(s.video_height, 1080);
    EXPECT_EQ(s.video_bitrate_kbps, 4000);
    EXPECT_EQ(s.video_fps, 30);
    EXPECT_EQ(s.audio_sample_rate, 44100);
    EXPECT_TRUE(s.audio_stereo);
    EXPECT_EQ(s.facing, CameraFacing::BACK);
    EXPECT_STREQ(facing_name(CameraFacing::FRONT), "front");
}

// Test Anomaly classification
class AnomalyTest : public ::testing::Test {};

TEST_F(AnomalyTest, SeverityByKind) {
    EXPECT_EQ(Anomaly(anomaly::ZeroBitrate{seconds(30)}).severity(), Severity::ERROR);
    EXPECT_EQ(Anomaly(anomaly::LowBitrate{50000, 100000}).severity(), Severity::WARNING);
    EXPECT_EQ(Anomaly(anomaly::BitrateFluctuation{1.0}).severity(), Severity::WARNING);
    EXPECT_EQ(Anomaly(anomaly::ConnectionStuck{seconds(12)}).severity(), Severity::CRITICAL);
    EXPECT_EQ(Anomaly(anomaly::StreamingTimeout{seconds(61)}).severity(), Severity::ERROR);
    EXPECT_EQ(Anomaly(anomaly::EncoderError{"boom"}).severity(), Severity::ERROR);
    EXPECT_EQ(Anomaly(anomaly::CameraDisconnected{}).severity(), Severity::CRITICAL);
}

TEST_F(AnomalyTest, DescriptionsDerivedFromPayload) {
    EXPECT_EQ(Anomaly(anomaly::ZeroBitrate{milliseconds(31500)}).description(),
              "zero bitrate for 31s");
    EXPECT_EQ(Anomaly(anomaly::LowBitrate{50000, 100000}).description(),
              "low bitrate: 50000bps < 100000bps");
    EXPECT_EQ(Anomaly(anomaly::BitrateFluctuation{1234.5678}).description(),
              "bitrate fluctuation: variance=1234.57");
    EXPECT_EQ(Anomaly(anomaly::ConnectionStuck{seconds(15)}).description(),
              "connection stuck for 15s");
    EXPECT_EQ(Anomaly(anomaly::StreamingTimeout{seconds(65)}).description(),
              "streaming timeout after 65s");
    EXPECT_EQ(Anomaly(anomaly::EncoderError{"encoder not running"}).description(),
              "encoder error: encoder not running");
    EXPECT_EQ(Anomaly(anomaly::CameraDisconnected{}).description(), "camera disconnected");
}

TEST_F(AnomalyTest, OnlyNoisyKindsAreDebounced) {
    EXPECT_TRUE(Anomaly(anomaly::LowBitrate{1, 2}).debounced());
    EXPECT_TRUE(Anomaly(anomaly::BitrateFluctuation{1.0}).debounced());
    EXPECT_FALSE(Anomaly(anomaly::ZeroBitrate{}).debounced());
    EXPECT_FALSE(Anomaly(anomaly::CameraDisconnected{}).debounced());
}

TEST_F(AnomalyTest, CopyKeepsPayload) {
    Anomaly a = anomaly::EncoderError{"x"};
    Anomaly b = a;
    ASSERT_TRUE(b.is<anomaly::EncoderError>());
    EXPECT_EQ(b.as<anomaly::EncoderError>().message, "x");
    EXPECT_STREQ(b.name(), "EncoderError");
    EXPECT_STREQ(severity_name(b.severity()), "ERROR");
}
