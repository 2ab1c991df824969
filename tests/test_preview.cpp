#include "asesweep/io/RunLog.hpp"
#include "asesweep/preview/LatestSlot.hpp"
#include "asesweep/preview/PreviewClient.hpp"
#include "asesweep/preview/PreviewPublisher.hpp"
#include "asesweep/preview/PreviewServer.hpp"
#include "asesweep/preview/SpectrumPlot.hpp"
#include "support/FakeDevices.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace asesweep;
using namespace asesweep::test;
using namespace std::chrono_literals;

namespace {

FramePtr curve(FrameKind kind, double level) {
    Frame f;
    for (int i = 0; i < 64; ++i) {
        f.wavelengthNm.push_back(420.0 + i);
        f.counts.push_back(level + (i == 32 ? 1000.0 : 0.0));
    }
    f.kind = kind;
    f.integrationTimeS = 0.1;
    f.angleDeg = 140.0;
    f.triggerOn = kind == FrameKind::Signal;
    f.timestamp = std::chrono::system_clock::now();
    return freeze(std::move(f));
}

PreviewUpdate update(std::size_t index) {
    PreviewUpdate u;
    u.index = index;
    u.total = 3;
    u.angleDeg = 140.0;
    u.integrationTimeS = 0.1;
    u.maxCount = 1600.0;
    u.state = "Sweeping";
    u.signal = curve(FrameKind::Signal, 600.0);
    u.background = curve(FrameKind::Background, 100.0);
    u.net = curve(FrameKind::Net, 0.0);
    return u;
}

template <class Pred>
bool waitFor(Pred p, std::chrono::milliseconds limit = 3000ms) {
    const auto end = std::chrono::steady_clock::now() + limit;
    while (!p()) {
        if (std::chrono::steady_clock::now() > end) return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

} // namespace

TEST(LatestSlot, KeepsOnlyNewest) {
    LatestSlot<int> slot;
    int v = 0;
    EXPECT_FALSE(slot.tryTake(v));

    slot.put(1);
    slot.put(2);
    slot.put(3);
    EXPECT_EQ(slot.overwritten(), 2u);
    EXPECT_EQ(slot.version(), 3u);
    ASSERT_TRUE(slot.tryTake(v));
    EXPECT_EQ(v, 3);
    EXPECT_FALSE(slot.tryTake(v));
}

TEST(LatestSlot, TakeTimesOutAndClose) {
    LatestSlot<int> slot;
    int v = 0;
    EXPECT_FALSE(slot.take(v, 10ms));

    std::thread t([&]{ std::this_thread::sleep_for(20ms); slot.close(); });
    EXPECT_FALSE(slot.take(v, 5s));
    t.join();
    EXPECT_TRUE(slot.closed());

    slot.put(7);
    ASSERT_TRUE(slot.take(v, 10ms));
    EXPECT_EQ(v, 7);
}

// Test: updates that arrive faster than the worker are coalesced
TEST(PreviewPublisher, DeliversLatest) {
    RunLog log(quietLog());
    PreviewPublisher pub(log);
    std::vector<std::size_t> seen;
    pub.addConsumer("record", [&](const PreviewUpdate& u) { seen.push_back(u.index); });

    pub.update(update(0));
    pub.update(update(1));
    pub.update(update(2));
    pub.start();
    pub.stop();

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], 2u);
    EXPECT_EQ(pub.overwritten(), 2u);
    EXPECT_EQ(pub.delivered(), 1u);
}

// Test: a throwing consumer is switched off after three failures, the others keep going
TEST(PreviewPublisher, DisablesBrokenConsumer) {
    RunLog log(quietLog());
    PreviewPublisher::Options opt;
    opt.pollMs = 5;
    PreviewPublisher pub(log, opt);

    std::atomic<int> broken{0}, healthy{0};
    pub.addConsumer("broken", [&](const PreviewUpdate&) {
        ++broken;
        throw std::runtime_error("display gone");
    });
    pub.addConsumer("healthy", [&](const PreviewUpdate&) { ++healthy; });
    pub.start();

    for (std::size_t i = 0; i < 5; ++i) {
        pub.update(update(i));
        ASSERT_TRUE(waitFor([&]{ return pub.delivered() >= i + 1; }));
    }
    pub.stop();

    EXPECT_EQ(broken.load(), 3);
    EXPECT_EQ(healthy.load(), 5);
    EXPECT_GE(log.warnings(), 4u);
}

TEST(PreviewPublisher, StopWithoutStartIsHarmless) {
    RunLog log(quietLog());
    PreviewPublisher pub(log);
    pub.update(update(0));
    EXPECT_NO_THROW(pub.stop());
    EXPECT_EQ(pub.delivered(), 0u);
}

// Test: states go straight to the state consumer; one that throws is dropped
TEST(PreviewPublisher, ForwardsStates) {
    RunLog log(quietLog());
    PreviewPublisher pub(log);
    pub.state("connecting"); // no consumer yet

    std::vector<std::string> seen;
    pub.setStateConsumer([&](const std::string& s) {
        if (s == "aborted") throw std::runtime_error("stream gone");
        seen.push_back(s);
    });
    pub.state("sweeping");
    pub.state("finalizing");
    pub.state("aborted");
    pub.state("completed");

    EXPECT_EQ(seen, (std::vector<std::string>{"sweeping", "finalizing"}));
    EXPECT_EQ(log.warnings(), 1u);
}

TEST(SpectrumPlot, RendersCanvas) {
    const cv::Mat img = renderSpectra(update(1));
    EXPECT_EQ(img.cols, 960);
    EXPECT_EQ(img.rows, 600);
    EXPECT_EQ(img.type(), CV_8UC3);
    // something other than the white background was drawn
    EXPECT_LT(cv::mean(img)[0], 255.0);

    const cv::Mat empty = renderSpectra(PreviewUpdate{});
    EXPECT_EQ(empty.cols, 960);
    EXPECT_EQ(empty.rows, 600);
}

TEST(SpectrumPlot, SavesPng) {
    TempDir tmp("png");
    RunLog log(quietLog());
    const auto path = tmp.path() / "preview.png";
    EXPECT_TRUE(savePreviewPng(renderSpectra(update(0)), path, log));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_FALSE(savePreviewPng(cv::Mat{}, tmp.path() / "none.png", log));
}

// Test: a watcher receives the published point over gRPC, curves intact
TEST(PreviewStream, ServerToClient) {
    RunLog log(quietLog());
    PreviewServer::Options sopt;
    sopt.heartbeatMs = 50;
    PreviewServer server(0, log, sopt);
    ASSERT_GT(server.port(), 0);

    PreviewClient::Options copt;
    copt.printHeartbeat = false;
    copt.name = "test";
    PreviewClient client("127.0.0.1:" + std::to_string(server.port()), copt);

    LatestSlot<PreviewUpdate> got;
    client.start([&](const PreviewUpdate& u) { got.put(u); });

    const PreviewUpdate sent = update(2);
    server.publish(sent);

    PreviewUpdate u;
    ASSERT_TRUE(got.take(u, 10s));
    client.shutdown();

    EXPECT_EQ(u.index, 2u);
    EXPECT_EQ(u.total, 3u);
    EXPECT_DOUBLE_EQ(u.angleDeg, 140.0);
    EXPECT_EQ(u.state, "Sweeping");
    ASSERT_TRUE(u.net);
    ASSERT_TRUE(u.signal);
    ASSERT_TRUE(u.background);
    EXPECT_EQ(u.net->counts, sent.net->counts);
    EXPECT_EQ(u.signal->wavelengthNm, sent.signal->wavelengthNm);
    EXPECT_EQ(client.rejected(), 0u);
    EXPECT_GE(client.received(), 1u);
}

// Test: a state pushed between spectra reaches the watcher on the next heartbeat
TEST(PreviewStream, StateRidesOnHeartbeat) {
    RunLog log(quietLog());
    PreviewServer::Options sopt;
    sopt.heartbeatMs = 50;
    PreviewServer server(0, log, sopt);

    PreviewClient::Options copt;
    copt.printHeartbeat = false;
    PreviewClient client("127.0.0.1:" + std::to_string(server.port()), copt);
    client.start([](const PreviewUpdate&) {});

    server.publishState("preconditioning");
    EXPECT_TRUE(waitFor([&]{ return client.lastState() == "preconditioning"; }, 10000ms));
    server.publishState("completed");
    EXPECT_TRUE(waitFor([&]{ return client.lastState() == "completed"; }, 10000ms));
    client.shutdown();
    EXPECT_EQ(client.received(), 0u);
}
