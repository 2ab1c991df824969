#include "asesweep/acq/ExposureSelector.hpp"
#include "asesweep/core/Errors.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace asesweep;

namespace {

bool inList(const std::vector<double>& list, double t) {
    return std::find(list.begin(), list.end(), t) != list.end();
}

} // namespace

// Test: first call of a run returns the longest preset
TEST(ExposureSelector, FirstCallReturnsLongest) {
    ExposureSelector sel({4.0, 1.0, 0.1});
    sel.beginPoint();
    EXPECT_DOUBLE_EQ(sel.next(false), 4.0);
    EXPECT_EQ(sel.currentIndex(), 0u);
}

// Test: saturated attempts walk the list towards shorter times, then throw
TEST(ExposureSelector, DescendsMonotonicallyUntilExhausted) {
    for (std::size_t n = 1; n <= 6; ++n) {
        std::vector<double> presets;
        for (std::size_t i = 0; i < n; ++i) presets.push_back(8.0 / static_cast<double>(1u << i));

        ExposureSelector sel(presets);
        sel.beginPoint();
        double t = sel.next(false);
        ASSERT_TRUE(inList(presets, t));
        std::size_t last = sel.currentIndex();

        for (std::size_t k = 1; k < n; ++k) {
            t = sel.next(true);
            EXPECT_TRUE(inList(presets, t));
            EXPECT_GT(sel.currentIndex(), last);
            last = sel.currentIndex();
        }
        EXPECT_THROW((void)sel.next(true), SaturationExhaustedError) << "n=" << n;
    }
}

// Test: exhaustion reports the shortest preset
TEST(ExposureSelector, ExhaustionCarriesShortestTime) {
    ExposureSelector sel({4.0, 0.1});
    sel.beginPoint();
    (void)sel.next(false);
    (void)sel.next(true);
    try {
        (void)sel.next(true);
        FAIL() << "expected ExhaustedPresetsError";
    } catch (const ExhaustedPresetsError& e) {
        EXPECT_DOUBLE_EQ(e.shortestS(), 0.1);
        EXPECT_EQ(e.kind(), ErrorKind::SaturationExhausted);
    }
}

// Test: an unsaturated retry call keeps the current time
TEST(ExposureSelector, UnsaturatedCallKeepsTime) {
    ExposureSelector sel({4.0, 1.0, 0.1});
    sel.beginPoint();
    (void)sel.next(false);
    EXPECT_DOUBLE_EQ(sel.next(true), 1.0);
    EXPECT_DOUBLE_EQ(sel.next(false), 1.0);
}

// Test: the next angle resumes at the time that worked
TEST(ExposureSelector, ResumesFromLastSuccessful) {
    ExposureSelector sel({4.0, 1.0, 0.1});
    sel.beginPoint();
    (void)sel.next(false);
    (void)sel.next(true);
    sel.commit(sel.currentIndex(), 1000.0);

    sel.beginPoint();
    EXPECT_DOUBLE_EQ(sel.next(false), 1.0);
    EXPECT_EQ(sel.hintIndex(), 1u);
}

// Test: 'longest' resume mode restarts every angle at presets[0]
TEST(ExposureSelector, LongestResumeAlwaysRestarts) {
    ExposureSelector::Options opt;
    opt.resume = ExposureResume::Longest;
    ExposureSelector sel({4.0, 1.0, 0.1}, opt);
    sel.beginPoint();
    (void)sel.next(false);
    (void)sel.next(true);
    sel.commit(sel.currentIndex(), 10.0);

    sel.beginPoint();
    EXPECT_DOUBLE_EQ(sel.next(false), 4.0);
}

// Test: a peak above the warning level moves the hint one preset down
TEST(ExposureSelector, WarningThresholdStepsHintDown) {
    ExposureSelector::Options opt;
    opt.warningThreshold = 50000.0;
    ExposureSelector sel({4.0, 1.0, 0.1}, opt);

    sel.beginPoint();
    (void)sel.next(false);
    sel.commit(sel.currentIndex(), 60000.0);
    EXPECT_EQ(sel.hintIndex(), 1u);

    sel.beginPoint();
    (void)sel.next(false);
    (void)sel.next(true);
    sel.commit(sel.currentIndex(), 60000.0); // already at the end: stays there
    EXPECT_EQ(sel.hintIndex(), 2u);
}

// Test: resetHint() sends the next angle back to the longest preset
TEST(ExposureSelector, ResetHint) {
    ExposureSelector sel({4.0, 0.1});
    sel.beginPoint();
    (void)sel.next(false);
    (void)sel.next(true);
    sel.commit(sel.currentIndex(), 1.0);
    ASSERT_EQ(sel.hintIndex(), 1u);

    sel.resetHint();
    sel.beginPoint();
    EXPECT_DOUBLE_EQ(sel.next(false), 4.0);
}

// Test: a single-preset list exhausts on the first saturation
TEST(ExposureSelector, SinglePreset) {
    ExposureSelector sel({0.5});
    sel.beginPoint();
    EXPECT_DOUBLE_EQ(sel.next(false), 0.5);
    EXPECT_THROW((void)sel.next(true), SaturationExhaustedError);
}

TEST(ExposureSelector, EmptyListRejected) {
    EXPECT_THROW((void)ExposureSelector(std::vector<double>{}), ConfigError);
}

TEST(ExposureSelector, IndexOfTolerance) {
    ExposureSelector sel({4.0, 0.1});
    EXPECT_EQ(sel.indexOf(0.1 + 1e-13), 1u);
    EXPECT_EQ(sel.indexOf(3.9999999999999), 0u);
    EXPECT_EQ(sel.indexOf(2.0), ExposureSelector::npos);
}
