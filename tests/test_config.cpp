#include "asesweep/core/Args.hpp"
#include "asesweep/core/Config.hpp"
#include "asesweep/core/Errors.hpp"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

using namespace asesweep;

namespace {

/* argv as the CLI sees it: program, mode, then options. */
class Argv {
public:
    Argv(std::initializer_list<std::string> opts) {
        store_ = {"asesweep", "sweep"};
        store_.insert(store_.end(), opts.begin(), opts.end());
        for (auto& s : store_) ptrs_.push_back(s.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(store_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> store_;
    std::vector<char*> ptrs_;
};

AcquisitionConfig parse(std::initializer_list<std::string> opts) {
    Argv a(opts);
    return configFromArgs(a.argc(), a.argv());
}

} // namespace

// Test: defaults are a valid configuration
TEST(Config, DefaultsValidate) {
    AcquisitionConfig c;
    EXPECT_NO_THROW(c.validate());
    EXPECT_EQ(c.integrationPresetsS, (std::vector<double>{4.0, 0.1}));
    EXPECT_EQ(c.fatalRetries, 0);
    EXPECT_EQ(c.onCoolingTimeout, CoolingTimeoutPolicy::Abort);
}

TEST(Config, AnglePositionsInclusive) {
    AngleRange r;
    r.startDeg = 85.0;
    r.endDeg = 280.0;
    r.count = 3;
    const auto p = r.positions();
    ASSERT_EQ(p.size(), 3u);
    EXPECT_DOUBLE_EQ(p[0], 85.0);
    EXPECT_DOUBLE_EQ(p[1], 182.5);
    EXPECT_DOUBLE_EQ(p[2], 280.0);

    r.count = 1;
    EXPECT_EQ(r.positions(), std::vector<double>{85.0});
}

TEST(Config, ExplicitAngleListWins) {
    AngleRange r;
    r.listDeg = {85.0, 140.0, 280.0};
    EXPECT_EQ(r.positions(), (std::vector<double>{85.0, 140.0, 280.0}));
}

// Test: every rule of validate() trips on a bad value
TEST(Config, ValidateRejectsBadValues) {
    auto bad = [](auto mutate) {
        AcquisitionConfig c;
        mutate(c);
        EXPECT_THROW(c.validate(), ConfigError);
    };
    bad([](AcquisitionConfig& c) { c.saveDir.clear(); });
    bad([](AcquisitionConfig& c) { c.angles.count = 0; });
    bad([](AcquisitionConfig& c) { c.integrationPresetsS.clear(); });
    bad([](AcquisitionConfig& c) { c.integrationPresetsS = {0.1, 4.0}; });   // not longest first
    bad([](AcquisitionConfig& c) { c.integrationPresetsS = {4.0, 4.0}; });   // duplicate
    bad([](AcquisitionConfig& c) { c.integrationPresetsS = {4.0, -1.0}; });
    bad([](AcquisitionConfig& c) { c.accumulations = 0; });
    bad([](AcquisitionConfig& c) { c.saturationThreshold = -1.0; });
    bad([](AcquisitionConfig& c) { c.denoiseFactor = 101.0; });
    bad([](AcquisitionConfig& c) { c.pulseWidthS = 0.0; });
    bad([](AcquisitionConfig& c) { c.pulsePeriodS = c.pulseWidthS; });
    bad([](AcquisitionConfig& c) { c.coolingTargetC = c.coolingThresholdC + 1.0; });
    bad([](AcquisitionConfig& c) { c.coolingPollS = 0.0; });
    bad([](AcquisitionConfig& c) { c.settleAfterMoveS = -0.1; });
    bad([](AcquisitionConfig& c) { c.fatalRetries = -1; });
    bad([](AcquisitionConfig& c) { c.devices.motorTimeoutS = 0.0; });
    bad([](AcquisitionConfig& c) { c.previewPort = 70000; });
}

// Test: a zero saturation threshold is allowed (every frame saturates)
TEST(Config, ZeroSaturationIsValid) {
    AcquisitionConfig c;
    c.saturationThreshold = 0.0;
    EXPECT_NO_THROW(c.validate());
}

TEST(ConfigArgs, ParsesOptions) {
    const auto c = parse({"--save-dir=/tmp/x", "--start=90", "--end=100", "--count=5",
                          "--presets=2,0.5,0.05", "--saturation=1000", "--no-denoise",
                          "--exposure-resume=longest", "--reset-after-failure",
                          "--mirror=side", "--on-cooling-timeout=warn", "--fatal-retries=2",
                          "--sim-time-scale=0", "--preview-port=50051"});
    EXPECT_EQ(c.saveDir, "/tmp/x");
    EXPECT_DOUBLE_EQ(c.angles.startDeg, 90.0);
    EXPECT_DOUBLE_EQ(c.angles.endDeg, 100.0);
    EXPECT_EQ(c.angles.count, 5u);
    EXPECT_EQ(c.integrationPresetsS, (std::vector<double>{2.0, 0.5, 0.05}));
    EXPECT_DOUBLE_EQ(c.saturationThreshold, 1000.0);
    EXPECT_FALSE(c.denoise);
    EXPECT_EQ(c.exposureResume, ExposureResume::Longest);
    EXPECT_TRUE(c.resetAfterFailure);
    EXPECT_EQ(c.entranceMirror, MirrorPosition::Side);
    EXPECT_EQ(c.onCoolingTimeout, CoolingTimeoutPolicy::Warn);
    EXPECT_EQ(c.fatalRetries, 2);
    EXPECT_EQ(c.previewPort, 50051);
}

TEST(ConfigArgs, AngleListSetsRange) {
    const auto c = parse({"--angles=85,140,280"});
    EXPECT_EQ(c.angles.positions(), (std::vector<double>{85.0, 140.0, 280.0}));
    EXPECT_EQ(c.angles.count, 3u);
    EXPECT_DOUBLE_EQ(c.angles.startDeg, 85.0);
    EXPECT_DOUBLE_EQ(c.angles.endDeg, 280.0);
}

TEST(ConfigArgs, LastOccurrenceWins) {
    const auto c = parse({"--count=5", "--count=7"});
    EXPECT_EQ(c.angles.count, 7u);
}

TEST(ConfigArgs, RejectsUnknownAndMalformed) {
    EXPECT_THROW(parse({"--bogus=1"}), ConfigError);
    EXPECT_THROW(parse({"stray"}), ConfigError);
    EXPECT_THROW(parse({"--count=many"}), ConfigError);
    EXPECT_THROW(parse({"--count=0"}), ConfigError);
    EXPECT_THROW(parse({"--start=12x"}), ConfigError);
    EXPECT_THROW(parse({"--presets=4,,0.1"}), ConfigError);
    EXPECT_THROW(parse({"--presets=0.1,4"}), ConfigError);
    EXPECT_THROW(parse({"--mirror=up"}), ConfigError);
    EXPECT_THROW(parse({"--exposure-resume=sometimes"}), ConfigError);
}

TEST(Args, FlagsAndValues) {
    Argv a({"--view", "--no-view", "--name=x", "--n=3"});
    EXPECT_FALSE(argFlag(a.argc(), a.argv(), "view", true));
    EXPECT_TRUE(argHas(a.argc(), a.argv(), "view"));
    EXPECT_EQ(argValue(a.argc(), a.argv(), "name"), "x");
    EXPECT_EQ(argValue(a.argc(), a.argv(), "missing", "dflt"), "dflt");
    EXPECT_EQ(argValueInt(a.argc(), a.argv(), "n", 0), 3);
    EXPECT_EQ(argUnknown(a.argc(), a.argv(), {"view", "name", "n"}), "");
    EXPECT_EQ(argUnknown(a.argc(), a.argv(), {"view", "name"}), "--n=3");
}

TEST(Config, DescribeMentionsEveryGroup) {
    const std::string d = describe(AcquisitionConfig{});
    for (const char* key : {"save_dir=", "angles=", "presets_s=", "saturation=", "denoise=",
                            "pulse width=", "optics", "cooling", "settle", "fatal_retries=", "devices"}) {
        EXPECT_NE(d.find(key), std::string::npos) << key;
    }
}
