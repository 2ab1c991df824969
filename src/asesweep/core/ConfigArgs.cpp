#include "asesweep/core/Args.hpp"
#include "asesweep/core/Config.hpp"

namespace asesweep {

namespace {
const std::vector<std::string> kKeys = {
    "save-dir", "start", "end", "count", "angles", "presets", "accumulations",
    "saturation", "saturation-warning", "exposure-resume", "reset-after-failure",
    "denoise", "denoise-factor",
    "pulse-width", "pulse-period", "pulse-voltage",
    "wavelength", "grating", "mirror",
    "cooling-threshold", "cooling-target", "cooling-timeout", "cooling-poll", "on-cooling-timeout",
    "settle-after-move", "settle-after-trigger", "fatal-retries",
    "motor-port", "motor-address", "pulser-port", "spectrometer-id", "motor-timeout", "acq-timeout-margin",
    "view", "preview-port", "preview-png",
    "sim-time-scale", "backend", "verbose",
};
} // namespace

AcquisitionConfig configFromArgs(int argc, char** argv)
{
    if (const auto bad = argUnknown(argc, argv, kKeys); !bad.empty()) {
        throw ConfigError("unknown option " + bad);
    }

    AcquisitionConfig c;
    c.saveDir = argValue(argc, argv, "save-dir", c.saveDir);

    c.angles.startDeg = argValueDouble(argc, argv, "start", c.angles.startDeg);
    c.angles.endDeg   = argValueDouble(argc, argv, "end", c.angles.endDeg);
    const int count   = argValueInt(argc, argv, "count", static_cast<int>(c.angles.count));
    if (count < 1) throw ConfigError("--count must be >= 1");
    c.angles.count = static_cast<std::size_t>(count);
    c.angles.listDeg = argValueList(argc, argv, "angles", {});
    if (!c.angles.listDeg.empty()) {
        c.angles.startDeg = c.angles.listDeg.front();
        c.angles.endDeg = c.angles.listDeg.back();
        c.angles.count = c.angles.listDeg.size();
    }

    c.integrationPresetsS = argValueList(argc, argv, "presets", c.integrationPresetsS);
    c.accumulations       = argValueInt(argc, argv, "accumulations", c.accumulations);
    c.saturationThreshold = argValueDouble(argc, argv, "saturation", c.saturationThreshold);
    c.saturationWarning   = argValueDouble(argc, argv, "saturation-warning", c.saturationWarning);

    const std::string resume = argValue(argc, argv, "exposure-resume", toString(c.exposureResume));
    if      (resume == "last")    c.exposureResume = ExposureResume::LastSuccessful;
    else if (resume == "longest") c.exposureResume = ExposureResume::Longest;
    else throw ConfigError("--exposure-resume must be last or longest");
    c.resetAfterFailure = argFlag(argc, argv, "reset-after-failure", c.resetAfterFailure);

    c.denoise       = argFlag(argc, argv, "denoise", c.denoise);
    c.denoiseFactor = argValueDouble(argc, argv, "denoise-factor", c.denoiseFactor);

    c.pulseWidthS   = argValueDouble(argc, argv, "pulse-width", c.pulseWidthS);
    c.pulsePeriodS  = argValueDouble(argc, argv, "pulse-period", c.pulsePeriodS);
    c.pulseVoltageV = argValueDouble(argc, argv, "pulse-voltage", c.pulseVoltageV);

    c.targetWavelengthNm = argValueDouble(argc, argv, "wavelength", c.targetWavelengthNm);
    c.targetGrating      = argValueInt(argc, argv, "grating", c.targetGrating);
    const std::string mirror = argValue(argc, argv, "mirror", toString(c.entranceMirror));
    if      (mirror == "front") c.entranceMirror = MirrorPosition::Front;
    else if (mirror == "side")  c.entranceMirror = MirrorPosition::Side;
    else throw ConfigError("--mirror must be front or side");

    c.coolingThresholdC = argValueDouble(argc, argv, "cooling-threshold", c.coolingThresholdC);
    c.coolingTargetC    = argValueDouble(argc, argv, "cooling-target", c.coolingTargetC);
    c.coolingTimeoutS   = argValueDouble(argc, argv, "cooling-timeout", c.coolingTimeoutS);
    c.coolingPollS      = argValueDouble(argc, argv, "cooling-poll", c.coolingPollS);
    const std::string onTimeout = argValue(argc, argv, "on-cooling-timeout", toString(c.onCoolingTimeout));
    if      (onTimeout == "abort") c.onCoolingTimeout = CoolingTimeoutPolicy::Abort;
    else if (onTimeout == "warn")  c.onCoolingTimeout = CoolingTimeoutPolicy::Warn;
    else throw ConfigError("--on-cooling-timeout must be abort or warn");

    c.settleAfterMoveS    = argValueDouble(argc, argv, "settle-after-move", c.settleAfterMoveS);
    c.settleAfterTriggerS = argValueDouble(argc, argv, "settle-after-trigger", c.settleAfterTriggerS);
    c.fatalRetries        = argValueInt(argc, argv, "fatal-retries", c.fatalRetries);

    c.devices.motorPort         = argValue(argc, argv, "motor-port", c.devices.motorPort);
    c.devices.motorAddress      = argValue(argc, argv, "motor-address", c.devices.motorAddress);
    c.devices.pulserPort        = argValue(argc, argv, "pulser-port", c.devices.pulserPort);
    c.devices.spectrometerId    = argValue(argc, argv, "spectrometer-id", c.devices.spectrometerId);
    c.devices.motorTimeoutS     = argValueDouble(argc, argv, "motor-timeout", c.devices.motorTimeoutS);
    c.devices.acqTimeoutMarginS = argValueDouble(argc, argv, "acq-timeout-margin", c.devices.acqTimeoutMarginS);

    c.devices.simTimeScale      = argValueDouble(argc, argv, "sim-time-scale", c.devices.simTimeScale);

    c.view        = argFlag(argc, argv, "view", c.view);
    c.previewPort = argValueInt(argc, argv, "preview-port", c.previewPort);
    c.previewPng  = argFlag(argc, argv, "preview-png", c.previewPng);

    c.validate();
    return c;
}

} // namespace asesweep
