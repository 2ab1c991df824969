#pragma once

#include "asesweep/core/Cancel.hpp"
#include "asesweep/core/Config.hpp"
#include "asesweep/devices/Devices.hpp"

namespace asesweep {

class RunLog;

/* What the bench looked like when the sweep was allowed to start. */
struct PreconditionReport {
    double initialTemperatureC {0.0};
    double finalTemperatureC {0.0};
    bool   cooled {false};          // false only with CoolingTimeoutPolicy::Warn
    double coolingWaitS {0.0};
    GratingInfo grating{};
    MirrorPosition mirror {MirrorPosition::Front};
    double wavelengthNm {0.0};      // confirmed by the monochromator
};

/*
  Bring the bench into a state where a sweep is meaningful:
    1. detector cooling (bounded wait, PreconditionTimeoutError or warning),
    2. grating report (report only) and grating selection,
    3. entrance mirror,
    4. centre wavelength,
    5. rotator homing.
*/
PreconditionReport runPreconditions(DeviceSet devices,
                                    const AcquisitionConfig& cfg,
                                    RunLog& log,
                                    const CancelToken& cancel);

/* Step 1 alone. Polls every cfg.coolingPollS until at or below cfg.coolingThresholdC. */
void waitForDetectorCooling(ISpectrometer& spec,
                            const AcquisitionConfig& cfg,
                            RunLog& log,
                            const CancelToken& cancel,
                            PreconditionReport& report);

} // namespace asesweep
