#include "asesweep/acq/Preconditions.hpp"
#include "asesweep/core/Errors.hpp"
#include "asesweep/io/RunLog.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <thread>

namespace asesweep {

namespace {
constexpr std::string_view kTag = "precheck";

std::string degC(double c) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << c << " C";
    return os.str();
}
} // namespace

void waitForDetectorCooling(ISpectrometer& spec,
                            const AcquisitionConfig& cfg,
                            RunLog& log,
                            const CancelToken& cancel,
                            PreconditionReport& report)
{
    using clock = std::chrono::steady_clock;

    double t = spec.temperatureC();
    report.initialTemperatureC = t;
    log.info(kTag, "detector at " + degC(t) + ", threshold " + degC(cfg.coolingThresholdC));

    // setpoint is (re)applied either way so the detector keeps cooling during the sweep
    spec.setTemperatureSetpointC(cfg.coolingTargetC);

    if (t <= cfg.coolingThresholdC) {
        log.info(kTag, "already cold, setpoint " + degC(cfg.coolingTargetC) + " kept");
        report.finalTemperatureC = t;
        report.cooled = true;
        return;
    }

    log.info(kTag, "cooling to " + degC(cfg.coolingTargetC) + " (timeout " +
                   std::to_string(static_cast<long>(cfg.coolingTimeoutS)) + " s)");
    const auto t0 = clock::now();
    const auto poll = std::chrono::duration<double>(cfg.coolingPollS);

    while (t > cfg.coolingThresholdC) {
        const double waited = std::chrono::duration<double>(clock::now() - t0).count();
        if (waited >= cfg.coolingTimeoutS) {
            report.coolingWaitS = waited;
            report.finalTemperatureC = t;
            const std::string msg = "detector still at " + degC(t) + " after " +
                                    std::to_string(static_cast<long>(waited)) + " s";
            if (cfg.onCoolingTimeout == CoolingTimeoutPolicy::Warn) {
                log.warn(kTag, msg + ", proceeding anyway");
                report.cooled = false;
                return;
            }
            throw PreconditionTimeoutError(msg);
        }
        cancel.throwIfRequested();
        std::this_thread::sleep_for(poll);
        t = spec.temperatureC();
        log.debug(kTag, "... " + degC(t));
    }

    report.coolingWaitS = std::chrono::duration<double>(clock::now() - t0).count();
    report.finalTemperatureC = t;
    report.cooled = true;
    log.info(kTag, "detector cooled to " + degC(t));
}

PreconditionReport runPreconditions(DeviceSet devices,
                                    const AcquisitionConfig& cfg,
                                    RunLog& log,
                                    const CancelToken& cancel)
{
    PreconditionReport report;
    auto& spec = devices.spectrometer;

    waitForDetectorCooling(spec, cfg, log, cancel, report);
    cancel.throwIfRequested();

    // Grating report is informational; a driver that cannot list gratings still works.
    try {
        report.grating = spec.gratingInfo();
        for (std::size_t i = 0; i < report.grating.gratings.size(); ++i) {
            const auto& g = report.grating.gratings[i];
            log.info(kTag, "grating " + std::to_string(i) + ": " +
                           std::to_string(static_cast<int>(g.densityGrPerMm)) + " gr/mm, blaze " +
                           g.blaze + (g.description.empty() ? "" : " (" + g.description + ")"));
        }
    } catch (const DeviceCommunicationError& e) {
        log.warn(kTag, std::string("grating report unavailable: ") + e.what());
    }

    if (report.grating.currentIndex != cfg.targetGrating) {
        log.info(kTag, "moving grating " + std::to_string(report.grating.currentIndex) +
                       " -> " + std::to_string(cfg.targetGrating));
        spec.moveGrating(cfg.targetGrating);
        report.grating.currentIndex = cfg.targetGrating;
    } else {
        log.info(kTag, "grating already at " + std::to_string(cfg.targetGrating));
    }
    cancel.throwIfRequested();

    report.mirror = spec.entranceMirror();
    if (report.mirror != cfg.entranceMirror) {
        log.info(kTag, std::string("moving entrance mirror ") + toString(report.mirror) +
                       " -> " + toString(cfg.entranceMirror));
        spec.moveEntranceMirror(cfg.entranceMirror);
        report.mirror = cfg.entranceMirror;
    }
    cancel.throwIfRequested();

    report.wavelengthNm = spec.moveToWavelength(cfg.targetWavelengthNm);
    {
        std::ostringstream os;
        os << "centre wavelength confirmed at " << std::fixed << std::setprecision(2)
           << report.wavelengthNm << " nm";
        log.info(kTag, os.str());
    }
    cancel.throwIfRequested();

    log.info(kTag, "homing rotator");
    devices.rotator.home();
    return report;
}

} // namespace asesweep
