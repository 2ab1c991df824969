#include "asesweep/core/Config.hpp"
#include "asesweep/core/Errors.hpp"

#include <cmath>
#include <sstream>

namespace asesweep {

std::vector<double> AngleRange::positions() const {
    if (!listDeg.empty()) return listDeg;

    std::vector<double> out;
    if (count == 0) return out;
    out.reserve(count);
    if (count == 1) { out.push_back(startDeg); return out; }

    const double step = (endDeg - startDeg) / static_cast<double>(count - 1);
    for (std::size_t i = 0; i < count; ++i) {
        out.push_back(startDeg + step * static_cast<double>(i));
    }
    out.back() = endDeg; // no accumulated rounding on the last point
    return out;
}

namespace {
void require(bool ok, const std::string& msg) {
    if (!ok) throw ConfigError(msg);
}
bool finite(double v) { return std::isfinite(v); }
} // namespace

void AcquisitionConfig::validate() const {
    require(!saveDir.empty(), "save directory is empty");

    require(finite(angles.startDeg) && finite(angles.endDeg), "angle range is not finite");
    require(angles.count >= 1, "angle count must be >= 1");
    for (double a : angles.listDeg) require(finite(a), "angle list holds a non-finite value");

    require(!integrationPresetsS.empty(), "integration time preset list is empty");
    for (std::size_t i = 0; i < integrationPresetsS.size(); ++i) {
        const double t = integrationPresetsS[i];
        require(finite(t) && t > 0.0, "integration preset #" + std::to_string(i) + " must be > 0");
        if (i > 0) {
            require(t < integrationPresetsS[i - 1],
                    "integration presets must be strictly decreasing (longest first)");
        }
    }
    require(accumulations >= 1, "accumulations must be >= 1");

    require(finite(saturationThreshold) && saturationThreshold >= 0.0,
            "saturation threshold must be >= 0");
    require(finite(saturationWarning) && saturationWarning >= 0.0,
            "saturation warning threshold must be >= 0");

    require(denoiseFactor >= 0.0 && denoiseFactor <= 100.0, "denoise factor must be in [0, 100]");

    require(pulseWidthS > 0.0, "pulse width must be > 0");
    require(pulsePeriodS > pulseWidthS, "pulse period must exceed pulse width");
    require(pulseVoltageV > 0.0, "pulse voltage must be > 0");

    require(targetWavelengthNm > 0.0, "target wavelength must be > 0");
    require(targetGrating >= 0, "grating index must be >= 0");

    require(coolingTargetC <= coolingThresholdC, "cooling target must not be warmer than the threshold");
    require(coolingTimeoutS >= 0.0, "cooling timeout must be >= 0");
    require(coolingPollS > 0.0, "cooling poll interval must be > 0");

    require(settleAfterMoveS >= 0.0 && settleAfterTriggerS >= 0.0, "settle times must be >= 0");
    require(fatalRetries >= 0, "fatal retries must be >= 0");

    require(devices.motorTimeoutS > 0.0, "motor timeout must be > 0");
    require(devices.acqTimeoutMarginS >= 0.0, "acquisition timeout margin must be >= 0");

    require(devices.simTimeScale >= 0.0, "simulation time scale must be >= 0");
    require(previewPort >= 0 && previewPort <= 65535, "preview port out of range");
}

const char* toString(ExposureResume r) noexcept {
    switch (r) {
        case ExposureResume::LastSuccessful: return "last";
        case ExposureResume::Longest:        return "longest";
        default:                             return "?";
    }
}

const char* toString(CoolingTimeoutPolicy p) noexcept {
    switch (p) {
        case CoolingTimeoutPolicy::Abort: return "abort";
        case CoolingTimeoutPolicy::Warn:  return "warn";
        default:                          return "?";
    }
}

const char* toString(MirrorPosition m) noexcept {
    switch (m) {
        case MirrorPosition::Front: return "front";
        case MirrorPosition::Side:  return "side";
        default:                    return "?";
    }
}

std::string describe(const AcquisitionConfig& c) {
    std::ostringstream os;
    os << "save_dir=" << c.saveDir << "\n";
    if (c.angles.listDeg.empty()) {
        os << "angles=" << c.angles.startDeg << ".." << c.angles.endDeg << " x" << c.angles.count << "\n";
    } else {
        os << "angles=";
        for (std::size_t i = 0; i < c.angles.listDeg.size(); ++i) {
            if (i) os << ',';
            os << c.angles.listDeg[i];
        }
        os << "\n";
    }
    os << "presets_s=";
    for (std::size_t i = 0; i < c.integrationPresetsS.size(); ++i) {
        if (i) os << ',';
        os << c.integrationPresetsS[i];
    }
    os << "\n";
    os << "accumulations=" << c.accumulations << "\n";
    os << "saturation=" << c.saturationThreshold << " warning=" << c.saturationWarning << "\n";
    os << "exposure_resume=" << toString(c.exposureResume)
       << " reset_after_failure=" << (c.resetAfterFailure ? "on" : "off") << "\n";
    os << "denoise=" << (c.denoise ? "on" : "off") << " factor=" << c.denoiseFactor << "\n";
    os << "pulse width=" << c.pulseWidthS << "s period=" << c.pulsePeriodS
       << "s amplitude=" << c.pulseVoltageV << "V\n";
    os << "optics wavelength=" << c.targetWavelengthNm << "nm grating=" << c.targetGrating
       << " mirror=" << toString(c.entranceMirror) << "\n";
    os << "cooling threshold=" << c.coolingThresholdC << "C target=" << c.coolingTargetC
       << "C timeout=" << c.coolingTimeoutS << "s poll=" << c.coolingPollS
       << "s on_timeout=" << toString(c.onCoolingTimeout) << "\n";
    os << "settle move=" << c.settleAfterMoveS << "s trigger=" << c.settleAfterTriggerS << "s\n";
    os << "fatal_retries=" << c.fatalRetries << "\n";
    os << "devices motor=" << c.devices.motorPort << "/" << c.devices.motorAddress
       << " pulser=" << c.devices.pulserPort << " spectrometer=" << c.devices.spectrometerId << "\n";
    return os.str();
}

} // namespace asesweep
