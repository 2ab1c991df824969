#include "asesweep/io/RunLog.hpp"
#include "asesweep/io/RunStore.hpp"
#include "asesweep/io/SpectrumRecorder.hpp"
#include "support/FakeDevices.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace asesweep;
using namespace asesweep::test;
namespace fs = std::filesystem;

namespace {

Frame frame(FrameKind kind, double level, double timeS, double angle, std::size_t n = 8) {
    Frame f;
    for (std::size_t i = 0; i < n; ++i) {
        f.wavelengthNm.push_back(440.0 + 0.5 * static_cast<double>(i));
        f.counts.push_back(level + static_cast<double>(i));
    }
    f.integrationTimeS = timeS;
    f.angleDeg = angle;
    f.kind = kind;
    f.triggerOn = kind == FrameKind::Signal;
    f.accumulations = 2;
    f.timestamp = std::chrono::system_clock::now();
    return f;
}

ScanPoint point(std::size_t index, double angle, double timeS) {
    ScanPoint sp;
    sp.index = index;
    sp.angleDeg = angle;
    sp.confirmedAngleDeg = angle;
    sp.integrationTimeS = timeS;
    sp.signal = freeze(frame(FrameKind::Signal, 500.0, timeS, angle));
    sp.background = freeze(frame(FrameKind::Background, 100.0, timeS, angle));
    sp.net = freeze(frame(FrameKind::Net, 400.0, timeS, angle));
    sp.maxCount = sp.signal->maxCount();
    sp.attemptedTimesS = {timeS};
    return sp;
}

RunHeader header() {
    RunHeader h;
    h.runId = "run-under-test";
    h.targetWavelengthNm = 450.0;
    h.grating = 1;
    h.startDeg = 85.0;
    h.endDeg = 280.0;
    h.count = 3;
    h.presetsS = {4.0, 0.1};
    h.saturationThreshold = 65530.0;
    h.config = "line one\nline \"two\"";
    return h;
}

std::string slurp(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream os;
    os << f.rdbuf();
    return os.str();
}

} // namespace

// Test: run directories are numbered from 1 and never reused
TEST(RunStore, CreatesNumberedRunDirectories) {
    TempDir tmp("dirs");
    const auto a = RunStore::createRunDirectory(tmp.path() / "runs", "20260131");
    const auto b = RunStore::createRunDirectory(tmp.path() / "runs", "20260131");
    EXPECT_EQ(a.filename().string(), "20260131_Measurement_1");
    EXPECT_EQ(b.filename().string(), "20260131_Measurement_2");
    EXPECT_TRUE(fs::is_directory(a / "Raw_Data"));
    EXPECT_TRUE(fs::is_directory(b / "Raw_Data"));
}

// Test: a completed run reads back in commit order with ok and failed points
TEST(RunStore, WritesAndReadsBackManifest) {
    TempDir tmp("manifest");
    RunStore store(tmp.path(), "20260131");
    store.open(header());
    EXPECT_TRUE(store.isOpen());

    store.commit(point(0, 85.0, 4.0));
    FailedPoint fp;
    fp.index = 1;
    fp.angleDeg = 140.0;
    fp.reason = "saturation persists";
    fp.attemptedTimesS = {4.0, 0.1};
    store.commitFailure(fp);
    store.commit(point(2, 280.0, 0.1));
    EXPECT_EQ(store.committed(), 3u);

    RunClosing c;
    c.outcome = "completed";
    c.attempted = 3;
    c.succeeded = 2;
    c.failed = 1;
    store.close(c);
    EXPECT_FALSE(store.isOpen());

    const auto m = readManifest(store.manifestPath());
    EXPECT_TRUE(m.hasHeader);
    EXPECT_EQ(m.runId, "run-under-test");
    EXPECT_TRUE(m.hasEnd);
    EXPECT_EQ(m.outcome, "completed");
    EXPECT_FALSE(m.truncatedTail);
    EXPECT_EQ(m.skippedLines, 0u);

    ASSERT_EQ(m.points.size(), 3u);
    EXPECT_DOUBLE_EQ(m.points[0].angleDeg, 85.0);
    EXPECT_DOUBLE_EQ(m.points[1].angleDeg, 140.0);
    EXPECT_DOUBLE_EQ(m.points[2].angleDeg, 280.0);
    EXPECT_TRUE(m.points[0].ok);
    EXPECT_FALSE(m.points[1].ok);
    EXPECT_TRUE(m.points[2].ok);
    EXPECT_EQ(m.points[1].error, "saturation_exhausted");
    EXPECT_EQ(m.points[1].reason, "saturation persists");
    EXPECT_DOUBLE_EQ(m.points[2].integrationTimeS, 0.1);

    for (std::size_t i : {0u, 2u}) {
        EXPECT_TRUE(fs::exists(store.runDir() / m.points[i].raw)) << m.points[i].raw;
        EXPECT_TRUE(fs::exists(store.runDir() / m.points[i].net)) << m.points[i].net;
    }
    EXPECT_EQ(m.points[0].raw, "Raw_Data/20260131_spectrum_001_angle_85.00deg_t_4s.spf");
    EXPECT_EQ(m.points[2].net, "Raw_Data/20260131_spectrum_003_angle_280.00deg_t_0.1s_net.txt");

    const std::string summary = slurp(store.summaryPath());
    EXPECT_NE(summary.find("\"outcome\": \"completed\""), std::string::npos);
    EXPECT_NE(summary.find("manifest.jsonl"), std::string::npos);
    EXPECT_NE(summary.find("\"sha256\""), std::string::npos);
}

// Test: the net text file has a commented header and one row per sample
TEST(RunStore, NetTextFormat) {
    TempDir tmp("net");
    RunStore store(tmp.path(), "20260131");
    store.open(header());
    const auto sp = point(0, 90.0, 0.1);
    store.commit(sp);

    const auto m = readManifest(store.manifestPath());
    ASSERT_EQ(m.points.size(), 1u);
    std::ifstream f(store.runDir() / m.points[0].net);
    std::string line;
    std::size_t headerLines = 0, rows = 0;
    while (std::getline(f, line)) {
        if (line.rfind("# ", 0) == 0) { ++headerLines; continue; }
        ++rows;
        EXPECT_NE(line.find(", "), std::string::npos);
    }
    EXPECT_GE(headerLines, 3u);
    EXPECT_EQ(rows, sp.net->size());
}

// Test: the .spf file holds the signal then the background, bit-exact
TEST(RunStore, RawFileHoldsSignalAndBackground) {
    TempDir tmp("raw");
    RunStore store(tmp.path(), "20260131");
    store.open(header());
    const auto sp = point(0, 85.0, 4.0);
    store.commit(sp);

    const auto m = readManifest(store.manifestPath());
    SpectrumReader r(store.runDir() / m.points[0].raw);
    ASSERT_TRUE(r.ok());
    Frame s, b, extra;
    ASSERT_TRUE(r.readNext(s));
    ASSERT_TRUE(r.readNext(b));
    EXPECT_FALSE(r.readNext(extra));
    EXPECT_FALSE(r.corrupt());

    EXPECT_EQ(s.kind, FrameKind::Signal);
    EXPECT_TRUE(s.triggerOn);
    EXPECT_EQ(s.counts, sp.signal->counts);
    EXPECT_EQ(s.wavelengthNm, sp.signal->wavelengthNm);
    EXPECT_EQ(b.kind, FrameKind::Background);
    EXPECT_EQ(b.counts, sp.background->counts);
    EXPECT_DOUBLE_EQ(b.integrationTimeS, 4.0);
    EXPECT_EQ(b.accumulations, 2);
}

// Test: killed after N of M points -> exactly N complete point records,
// a half-written tail is dropped
TEST(RunStore, CrashLeavesCommittedPrefix) {
    TempDir tmp("crash");
    fs::path manifest;
    {
        RunStore store(tmp.path(), "20260131");
        store.open(header());
        store.commit(point(0, 85.0, 4.0));
        store.commit(point(1, 90.0, 4.0));
        manifest = store.manifestPath();
        // destroyed without close(): no end record
    }
    {
        std::ofstream f(manifest, std::ios::app | std::ios::binary);
        f << "{\"type\":\"point\",\"index\":2,\"angle_deg\":95,\"sta";
    }

    const auto m = readManifest(manifest);
    EXPECT_TRUE(m.hasHeader);
    EXPECT_FALSE(m.hasEnd);
    EXPECT_TRUE(m.truncatedTail);
    ASSERT_EQ(m.points.size(), 2u);
    EXPECT_EQ(m.points[0].index, 0u);
    EXPECT_EQ(m.points[1].index, 1u);
    for (const auto& p : m.points) {
        EXPECT_TRUE(p.ok);
        EXPECT_TRUE(fs::exists(tmp.path() / p.raw));
        EXPECT_TRUE(fs::exists(tmp.path() / p.net));
    }
}

TEST(RunStore, RejectsUseOutsideOpenClose) {
    TempDir tmp("misuse");
    RunStore store(tmp.path(), "20260131");
    EXPECT_THROW(store.commit(point(0, 85.0, 4.0)), StorageError);
    store.open(header());
    EXPECT_THROW(store.open(header()), StorageError);

    ScanPoint broken = point(0, 85.0, 4.0);
    broken.background.reset();
    EXPECT_THROW(store.commit(broken), StorageError);
    EXPECT_EQ(store.committed(), 0u);
}

TEST(RunStore, MissingManifestIsStorageError) {
    TempDir tmp("missing");
    EXPECT_THROW((void)readManifest(tmp.path() / "manifest.jsonl"), StorageError);
}

// Test: quotes, control characters and non-ASCII text survive the manifest,
// and adapter details of a failure are kept
TEST(RunStore, FailureRecordKeepsDeviceDetails) {
    TempDir tmp("strings");
    RunStore store(tmp.path(), "20260131");
    store.open(header());

    FailedPoint fp;
    fp.index = 0;
    fp.angleDeg = 85.0;
    fp.kind = ErrorKind::DeviceTimeout;
    fp.reason = "spectrometer: \"acq\" stalled\tat 5\xc2\xb0\x01 C:\\drv";
    fp.device = "spectrometer";
    fp.deviceCode = 20013;
    fp.timeoutS = 9.5;
    store.commitFailure(fp);

    FailedPoint plain;
    plain.index = 1;
    plain.angleDeg = 90.0;
    plain.reason = "saturation persists";
    store.commitFailure(plain);

    const auto m = readManifest(store.manifestPath());
    EXPECT_EQ(m.skippedLines, 0u);
    ASSERT_EQ(m.points.size(), 2u);
    EXPECT_EQ(m.points[0].error, "device_timeout");
    EXPECT_EQ(m.points[0].reason, fp.reason);
    EXPECT_EQ(m.points[0].device, "spectrometer");
    EXPECT_EQ(m.points[0].deviceCode, 20013);
    EXPECT_DOUBLE_EQ(m.points[0].timeoutS, 9.5);
    EXPECT_TRUE(m.points[1].device.empty());
    EXPECT_EQ(m.points[1].deviceCode, 0);

    const std::string text = slurp(store.manifestPath());
    EXPECT_EQ(text.find("device_code", text.find("\"index\":1")), std::string::npos);
}

// Test: keys of nested objects and string contents are not taken for
// record fields; lines that are not usable records are counted and skipped
TEST(RunStore, ReaderIgnoresLookalikeKeys) {
    TempDir tmp("lookalike");
    const fs::path manifest = tmp.path() / "manifest.jsonl";
    {
        std::ofstream f(manifest, std::ios::binary);
        f << R"({"type":"run","extra":{"run_id":"nested"},"note":"\"run_id\":\"quoted\"","run_id":"outer"})" << '\n'
          << R"({"type":"point","index":0,"angle_deg":85,"status":"ok","raw":"a\u0041.spf"})" << '\n'
          << R"({"type":"point","index":"one","angle_deg":90,"status":"ok"})" << '\n'
          << R"({"type":"point","angle_deg":95,"status":"ok"})" << '\n'
          << R"(["type","point"])" << '\n'
          << R"({"type":"point","index":3,"angle_deg":100,)" << '\n'
          << R"({"type":"end","outcome":"completed","reason":""})" << '\n';
    }

    const auto m = readManifest(manifest);
    EXPECT_TRUE(m.hasHeader);
    EXPECT_EQ(m.runId, "outer");
    ASSERT_EQ(m.points.size(), 1u);
    EXPECT_EQ(m.points[0].raw, "aA.spf");
    EXPECT_EQ(m.skippedLines, 4u);
    EXPECT_TRUE(m.hasEnd);
    EXPECT_FALSE(m.truncatedTail);
}

// Test: once a point record is in the manifest its files are complete;
// a point whose files cannot be written leaves no record
TEST(RunStore, PointFilesCompleteBeforeRecord) {
    TempDir tmp("durable");
    RunStore store(tmp.path(), "20260131");
    store.open(header());
    store.commit(point(0, 85.0, 4.0));

    auto m = readManifest(store.manifestPath());
    ASSERT_EQ(m.points.size(), 1u);
    SpectrumReader r(store.runDir() / m.points[0].raw);
    ASSERT_TRUE(r.ok());
    Frame sig, bg;
    ASSERT_TRUE(r.readNext(sig));
    ASSERT_TRUE(r.readNext(bg));
    EXPECT_EQ(sig.kind, FrameKind::Signal);
    EXPECT_EQ(bg.kind, FrameKind::Background);

    std::ifstream net(store.runDir() / m.points[0].net);
    std::size_t rows = 0;
    for (std::string line; std::getline(net, line);) {
        if (!line.empty() && line[0] != '#') ++rows;
    }
    EXPECT_EQ(rows, 8u);

    fs::remove_all(store.rawDir());
    EXPECT_THROW(store.commit(point(1, 90.0, 4.0)), StorageError);
    m = readManifest(store.manifestPath());
    EXPECT_EQ(m.points.size(), 1u);
    EXPECT_EQ(store.committed(), 1u);
}

TEST(RunStore, UnsyncedStoreStillCommits) {
    TempDir tmp("nosync");
    RunStore::Options opt;
    opt.sync = false;
    RunStore store(tmp.path(), "20260131", opt);
    store.open(header());
    store.commit(point(0, 85.0, 0.1));
    const auto m = readManifest(store.manifestPath());
    ASSERT_EQ(m.points.size(), 1u);
    EXPECT_TRUE(fs::exists(store.runDir() / m.points[0].raw));
}

// Test: warnings and errors logged from several threads are all counted
TEST(RunLog, CountsAcrossThreads) {
    RunLog log(quietLog());
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&log] {
            for (int i = 0; i < 250; ++i) {
                log.warn("test", "w");
                if (i % 5 == 0) log.error("test", "e");
            }
        });
    }
    // readers run while the writers are still counting
    std::uint64_t seen = 0;
    while (seen < 1000) {
        const std::uint64_t w = log.warnings();
        EXPECT_GE(w, seen);
        if (w < seen) break;
        seen = w;
        std::this_thread::yield();
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(log.warnings(), 1000u);
    EXPECT_EQ(log.errors(), 200u);
}

// Test: a flipped payload byte is caught by the record CRC
TEST(SpectrumRecorder, DetectsCorruption) {
    TempDir tmp("spf");
    const fs::path p = tmp.path() / "x.spf";
    {
        SpectrumRecorder rec(p);
        ASSERT_TRUE(rec.ok());
        ASSERT_TRUE(rec.write(frame(FrameKind::Signal, 1000.0, 0.1, 85.0)));
        ASSERT_TRUE(rec.close());
    }
    {
        std::fstream f(p, std::ios::in | std::ios::out | std::ios::binary);
        f.seekp(8 + 40 + 3); // file header, record header, into the payload
        f.put('\x7f');
    }
    SpectrumReader r(p);
    ASSERT_TRUE(r.ok());
    Frame out;
    EXPECT_FALSE(r.readNext(out));
    EXPECT_TRUE(r.corrupt());
}

TEST(SpectrumRecorder, RejectsForeignFile) {
    TempDir tmp("foreign");
    const fs::path p = tmp.path() / "not.spf";
    std::ofstream(p) << "hello, world";
    SpectrumReader r(p);
    EXPECT_FALSE(r.ok());
}
