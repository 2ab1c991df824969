#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace asesweep {

/* Where the next angle starts its exposure search. */
enum class ExposureResume : std::uint8_t {
    LastSuccessful = 0, // resume from the time that worked at the previous angle
    Longest = 1         // always restart from presets[0]
};

/* What to do when the detector does not cool down in time. */
enum class CoolingTimeoutPolicy : std::uint8_t {
    Abort = 0,
    Warn = 1            // log a warning and proceed with the sweep
};

/* Monochromator entrance mirror. */
enum class MirrorPosition : std::uint8_t {
    Front = 0,
    Side = 1
};

/* Linear angle sequence, inclusive on both ends, or an explicit list. */
struct AngleRange {
    double startDeg {85.0};
    double endDeg   {280.0};
    std::size_t count {50};
    std::vector<double> listDeg;   // non-empty: visited as given, start/end/count ignored

    [[nodiscard]] std::vector<double> positions() const;
};

/* Connection parameters handed to the adapters. */
struct DeviceParams {
    std::string motorPort        {"sim-motor"};
    std::string motorAddress     {"0"};
    double      motorTimeoutS    {180.0};
    std::string pulserPort       {"sim-pulser"};
    std::string spectrometerId   {"sim-ccd"};
    double      acqTimeoutMarginS {30.0}; // added to integration * accumulations
    double      simTimeScale {0.0};       // simulated backend only: 0 = no wall-clock pacing
};

/*
  Everything a run needs, read once at start.
  Defaults follow the bench the engine was written for.
*/
struct AcquisitionConfig {
    std::string saveDir {"runs"};          // parent of <date>_Measurement_<n>

    AngleRange angles{};

    // exposure auto-ranging
    std::vector<double> integrationPresetsS {4.0, 0.1}; // longest -> shortest
    int    accumulations {1};
    double saturationThreshold {65530.0};  // hard: above this the frame is discarded
    double saturationWarning   {50000.0};  // soft: step the next angle down one preset
    ExposureResume exposureResume {ExposureResume::LastSuccessful};
    bool   resetAfterFailure {false};      // failed point -> next angle starts at presets[0]

    // processing
    bool   denoise {true};
    double denoiseFactor {50.0};           // 0..100

    // pulser
    double pulseWidthS   {5e-6};
    double pulsePeriodS  {0.1};
    double pulseVoltageV {5.0};

    // spectrometer optics
    double targetWavelengthNm {450.0};
    int    targetGrating {1};
    MirrorPosition entranceMirror {MirrorPosition::Front};

    // detector cooling
    double coolingThresholdC {-50.0};
    double coolingTargetC    {-70.0};
    double coolingTimeoutS   {600.0};
    double coolingPollS      {5.0};
    CoolingTimeoutPolicy onCoolingTimeout {CoolingTimeoutPolicy::Abort};

    // settle times
    double settleAfterMoveS    {0.5};
    double settleAfterTriggerS {0.5};

    // fatal adapter error at one angle: retry the angle this many times, then abort
    int fatalRetries {0};

    DeviceParams devices{};

    // preview
    bool        view {false};
    int         previewPort {0};           // 0 = no gRPC preview stream
    bool        previewPng {false};        // save last preview as preview.png

    /* Throws ConfigError on the first inconsistent value. */
    void validate() const;
};

/*
  Builds a validated config from "--key=value" options (argv[2] onwards).
  Unknown options and unparsable values are ConfigErrors.
*/
AcquisitionConfig configFromArgs(int argc, char** argv);

/* One line per option, for the run log and the manifest header. */
std::string describe(const AcquisitionConfig& cfg);

const char* toString(ExposureResume r) noexcept;
const char* toString(CoolingTimeoutPolicy p) noexcept;
const char* toString(MirrorPosition m) noexcept;

} // namespace asesweep
