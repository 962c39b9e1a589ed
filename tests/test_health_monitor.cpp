#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <vector>
#include "health_monitor.hpp"
#include "test_support.hpp"

using namespace std::chrono;

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.check_interval = Millis{1000};
        cfg.startup_grace = Millis{0};
        cfg.first_bitrate_timeout = Millis{3000};
        cfg.bitrate_timeout = Millis{5000};
        cfg.zero_bitrate_duration = Millis{3000};
        cfg.low_bitrate_duration = Millis{2000};
        cfg.connection_grace = Millis{1000};
        cfg.connection_stuck_duration = Millis{2000};
        cfg.connection_timeout = Millis{10000};
        cfg.debounce_interval = Millis{5000};

        session = std::make_shared<FakeSession>();
        session->capturing = true;
        session->streaming = true;

        monitor = std::make_unique<HealthMonitor>(
            gate, exec, [this](const Anomaly& a) { seen.push_back(a); });
    }

    void TearDown() override { monitor.reset(); }

    void start_with_session() {
        gate.set(RunState::RUNNING);
        monitor->start(cfg, clock);
        monitor->set_session_handle(session);
    }

    size_t count(const char* name) const {
        size_t n = 0;
        for (const auto& a : seen) {
            if (std::string(a.name()) == name) ++n;
        }
        return n;
    }

    WatchdogConfig cfg;
    RunStateGate gate;
    ManualClock clock;
    ManualExecutor exec{clock};
    std::shared_ptr<FakeSession> session;
    std::vector<Anomaly> seen;
    std::unique_ptr<HealthMonitor> monitor;
};

TEST_F(HealthMonitorTest, DefaultValues) {
    WatchdogConfig d;
    EXPECT_EQ(d.check_interval, Millis{5000});
    EXPECT_EQ(d.bitrate_timeout, Millis{30000});
    EXPECT_EQ(d.zero_bitrate_threshold_bps, 10000);
    EXPECT_EQ(d.min_bitrate_threshold_bps, 100000);
    EXPECT_EQ(d.debounce_interval, Millis{30000});
    EXPECT_EQ(d.first_bitrate_timeout, Millis{15000});
    EXPECT_TRUE(d.enable_fluctuation_check);
}

TEST_F(HealthMonitorTest, StoppedGateNeverCountsEffectiveChecks) {
    monitor->start(cfg, clock);
    monitor->set_session_handle(session);
    session->capturing = false;  // would be CRITICAL if evaluated

    exec.advance(Millis{5000});

    auto s = monitor->stats();
    EXPECT_EQ(s.total_checks, 5u);
    EXPECT_EQ(s.skipped_checks, 5u);
    EXPECT_EQ(s.effective_checks, 0u);
    EXPECT_EQ(s.anomalies_detected, 0u);
    EXPECT_TRUE(seen.empty());
}

TEST_F(HealthMonitorTest, StartIsIdempotent) {
    monitor->start(cfg, clock);
    monitor->start(cfg, clock);
    exec.advance(Millis{1000});
    EXPECT_EQ(monitor->stats().total_checks, 1u);
    EXPECT_TRUE(monitor->is_active());
}

TEST_F(HealthMonitorTest, MissingSessionWhileRunningIsCameraDisconnected) {
    gate.set(RunState::RUNNING);
    monitor->start(cfg, clock);

    exec.advance(Millis{1000});

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_TRUE(seen[0].is<anomaly::CameraDisconnected>());
    EXPECT_EQ(monitor->stats().effective_checks, 1u);
}

TEST_F(HealthMonitorTest, FirstSampleTimeout) {
    cfg.startup_grace = Millis{2000};
    start_with_session();

    exec.advance(Millis{3000});
    EXPECT_EQ(count("ZeroBitrate"), 0u);

    exec.advance(Millis{1000});
    ASSERT_EQ(count("ZeroBitrate"), 1u);
    EXPECT_EQ(seen.back().description(), "zero bitrate for 4s");
    EXPECT_EQ(seen.back().severity(), Severity::ERROR);
}

TEST_F(HealthMonitorTest, AlternatingZeroAndSubThresholdSamplesFormOneRun) {
    start_with_session();

    // 0 and 5000 are both under the 10000bps zero threshold
    const int64_t samples[] = {0, 5000, 0, 5000};
    for (int i = 0; i < 3; ++i) {
        monitor->on_bitrate_sample(samples[i]);
        exec.advance(Millis{1000});
    }
    EXPECT_EQ(count("ZeroBitrate"), 0u);

    monitor->on_bitrate_sample(samples[3]);
    exec.advance(Millis{1000});
    ASSERT_EQ(count("ZeroBitrate"), 1u);
    EXPECT_EQ(seen.back().as<anomaly::ZeroBitrate>().duration, Millis{4000});
}

TEST_F(HealthMonitorTest, ZeroRunResetsOnRecoveredSample) {
    start_with_session();

    for (int i = 0; i < 3; ++i) {
        monitor->on_bitrate_sample(0);
        exec.advance(Millis{1000});
    }
    monitor->on_bitrate_sample(200000);
    exec.advance(Millis{1000});
    EXPECT_EQ(count("ZeroBitrate"), 0u);

    // A new run starts from scratch
    for (int i = 0; i < 3; ++i) {
        monitor->on_bitrate_sample(0);
        exec.advance(Millis{1000});
    }
    EXPECT_EQ(count("ZeroBitrate"), 0u);
    monitor->on_bitrate_sample(0);
    exec.advance(Millis{1000});
    EXPECT_EQ(count("ZeroBitrate"), 1u);
}

TEST_F(HealthMonitorTest, StaleSampleIsZeroBitrate) {
    start_with_session();
    monitor->on_bitrate_sample(500000);

    exec.advance(Millis{5000});
    EXPECT_EQ(count("ZeroBitrate"), 0u);

    exec.advance(Millis{1000});
    ASSERT_EQ(count("ZeroBitrate"), 1u);
    EXPECT_EQ(seen.back().description(), "zero bitrate for 6s");
}

TEST_F(HealthMonitorTest, LowBitrateIsDebounced) {
    start_with_session();

    for (int i = 0; i < 3; ++i) {
        monitor->on_bitrate_sample(50000);
        exec.advance(Millis{1000});
    }
    ASSERT_EQ(count("LowBitrate"), 1u);
    EXPECT_EQ(seen.back().description(), "low bitrate: 50000bps < 100000bps");
    EXPECT_EQ(seen.back().severity(), Severity::WARNING);

    // Suppressed for the rest of the debounce window
    for (int i = 0; i < 4; ++i) {
        monitor->on_bitrate_sample(50000);
        exec.advance(Millis{1000});
    }
    EXPECT_EQ(count("LowBitrate"), 1u);

    monitor->on_bitrate_sample(50000);
    exec.advance(Millis{1000});
    EXPECT_EQ(count("LowBitrate"), 2u);
}

TEST_F(HealthMonitorTest, ZeroBitrateIsReportedEveryTick) {
    start_with_session();

    for (int i = 0; i < 4; ++i) {
        monitor->on_bitrate_sample(0);
        exec.advance(Millis{1000});
    }
    ASSERT_EQ(count("ZeroBitrate"), 1u);
    ASSERT_FALSE(seen.back().debounced());

    // Well inside the debounce window, still reported
    for (int i = 0; i < 2; ++i) {
        monitor->on_bitrate_sample(0);
        exec.advance(Millis{1000});
    }
    EXPECT_EQ(count("ZeroBitrate"), 3u);
}

TEST_F(HealthMonitorTest, FluctuationNeedsEnoughSamples) {
    cfg.debounce_interval = Millis{60000};
    start_with_session();

    const int64_t swing[] = {200000, 2000000};
    for (int i = 0; i < 9; ++i) {
        monitor->on_bitrate_sample(swing[i % 2]);
        exec.advance(Millis{1000});
    }
    EXPECT_EQ(count("BitrateFluctuation"), 0u);

    monitor->on_bitrate_sample(swing[1]);
    exec.advance(Millis{1000});
    EXPECT_EQ(count("BitrateFluctuation"), 1u);
}

TEST_F(HealthMonitorTest, ConnectionStuckAfterGrace) {
    cfg.enable_bitrate_monitoring = false;
    cfg.enable_encoder_monitoring = false;
    session->streaming = false;
    start_with_session();

    exec.advance(Millis{4000});
    EXPECT_EQ(count("ConnectionStuck"), 0u);

    exec.advance(Millis{1000});
    ASSERT_EQ(count("ConnectionStuck"), 1u);
    EXPECT_EQ(seen.back().description(), "connection stuck for 3s");
    EXPECT_EQ(seen.back().severity(), Severity::CRITICAL);
}

TEST_F(HealthMonitorTest, ConnectionGoingLiveClearsStuckTimer) {
    cfg.enable_bitrate_monitoring = false;
    cfg.enable_encoder_monitoring = false;
    session->streaming = false;
    start_with_session();

    exec.advance(Millis{3000});
    session->streaming = true;
    exec.advance(Millis{1000});
    session->streaming = false;
    exec.advance(Millis{2000});
    EXPECT_EQ(count("ConnectionStuck"), 0u);
}

TEST_F(HealthMonitorTest, EncoderChecks) {
    cfg.enable_bitrate_monitoring = false;
    cfg.enable_connection_monitoring = false;
    start_with_session();

    session->streaming = false;
    exec.advance(Millis{1000});
    EXPECT_EQ(count("EncoderError"), 0u);  // still inside the connection grace

    exec.advance(Millis{1000});
    ASSERT_EQ(count("EncoderError"), 1u);
    EXPECT_EQ(seen.back().description(), "encoder error: encoder not running");

    session->capturing = false;
    exec.advance(Millis{1000});
    EXPECT_TRUE(seen.back().is<anomaly::CameraDisconnected>());
}

TEST_F(HealthMonitorTest, CheckExceptionBecomesEncoderError) {
    cfg.enable_bitrate_monitoring = false;
    start_with_session();
    session->throw_on_query = true;

    exec.advance(Millis{2000});

    ASSERT_FALSE(seen.empty());
    EXPECT_TRUE(seen[0].is<anomaly::EncoderError>());
    EXPECT_EQ(seen[0].as<anomaly::EncoderError>().message, "health check failed: engine gone");
    EXPECT_EQ(monitor->stats().total_checks, 2u);
}

TEST_F(HealthMonitorTest, StopCancelsTimerAndInFlightDispatch) {
    gate.set(RunState::RUNNING);
    monitor->start(cfg, clock);

    // Tick only; the anomaly dispatch is still queued
    ASSERT_TRUE(exec.step());
    EXPECT_EQ(monitor->stats().anomalies_detected, 1u);
    EXPECT_EQ(exec.pending(), 2u);

    monitor->stop();
    exec.advance(Millis{10000});

    EXPECT_TRUE(seen.empty());
    EXPECT_FALSE(monitor->is_active());
    EXPECT_EQ(monitor->stats().total_checks, 1u);
    EXPECT_FALSE(monitor->stats().running);
}

TEST_F(HealthMonitorTest, GateStoppedBeforeDispatchDropsAnomaly) {
    gate.set(RunState::RUNNING);
    monitor->start(cfg, clock);
    ASSERT_TRUE(exec.step());

    gate.set(RunState::STOPPED);
    exec.run_ready();

    EXPECT_TRUE(seen.empty());
}

TEST_F(HealthMonitorTest, UpdateConfigAppliesFromNextTick) {
    monitor->start(cfg, clock);
    exec.advance(Millis{1000});
    EXPECT_EQ(monitor->stats().total_checks, 1u);

    WatchdogConfig slower = cfg;
    slower.check_interval = Millis{3000};
    monitor->update_config(slower);

    // The tick already scheduled keeps its old deadline
    exec.advance(Millis{1000});
    EXPECT_EQ(monitor->stats().total_checks, 2u);
    exec.advance(Millis{2000});
    EXPECT_EQ(monitor->stats().total_checks, 2u);
    exec.advance(Millis{1000});
    EXPECT_EQ(monitor->stats().total_checks, 3u);
    EXPECT_EQ(monitor->config().check_interval, Millis{3000});
}

TEST_F(HealthMonitorTest, CounterOverflowResetsAndKeepsTicking) {
    monitor->start(cfg, clock);
    exec.advance(Millis{2000});
    monitor->seed_total_checks(std::numeric_limits<uint64_t>::max());

    EXPECT_NO_THROW(exec.advance(Millis{1000}));
    auto s = monitor->stats();
    EXPECT_EQ(s.total_checks, 0u);
    EXPECT_EQ(s.effective_checks, 0u);
    EXPECT_EQ(s.anomalies_detected, 0u);
    EXPECT_EQ(s.skipped_checks, 1u);

    exec.advance(Millis{1000});
    EXPECT_EQ(monitor->stats().total_checks, 1u);
}

TEST_F(HealthMonitorTest, SessionChangeKeepsCumulativeCounters) {
    start_with_session();
    monitor->on_bitrate_sample(300000);
    exec.advance(Millis{2000});

    monitor->set_session_handle(std::make_shared<FakeSession>());
    auto s = monitor->stats();
    EXPECT_EQ(s.total_checks, 2u);

    exec.advance(Millis{1000});
    s = monitor->stats();
    EXPECT_EQ(s.total_checks, 3u);
    EXPECT_EQ(s.current_bitrate, 0);
    EXPECT_TRUE(s.bitrate_history.empty());
}

TEST_F(HealthMonitorTest, StatsListenerSeesEveryTick) {
    int calls = 0;
    uint64_t last_total = 0;
    monitor->set_stats_listener([&](const WatchdogStats& s) {
        ++calls;
        last_total = s.total_checks;
    });
    monitor->start(cfg, clock);
    exec.advance(Millis{3000});
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(last_total, 3u);
}
