#pragma once

#include "asesweep/acq/BackgroundCache.hpp"
#include "asesweep/acq/Denoiser.hpp"
#include "asesweep/acq/ExposureSelector.hpp"
#include "asesweep/acq/ScanPoint.hpp"
#include "asesweep/core/Cancel.hpp"
#include "asesweep/devices/Devices.hpp"

#include <cstddef>
#include <cstdint>

namespace asesweep {

class RunLog;

/* Sub-states of one angle. */
enum class PointStage : std::uint8_t {
    Idle = 0,
    Moving,
    Exposing,             // trigger on -> acquire -> trigger off
    CheckingSaturation,
    ResolvingBackground,
    ComputingNet,
    Done,
    Failed
};

const char* toString(PointStage s) noexcept;

/* Allowed edges of the per-angle state machine. */
[[nodiscard]] bool isAllowed(PointStage from, PointStage to) noexcept;

/*
  Measures one angle.

    move -> [trigger on, acquire signal, trigger off, saturation check]* ->
    background (cache or trigger-off acquisition) -> net = signal - background

  Exposure state and background cache belong to the caller and are passed in,
  so the pipeline itself keeps no memory between angles.

  Saturation at every preset yields a FailedPoint. Device errors and
  cancellation propagate as exceptions. The trigger is off on every exit.
*/
class ScanPointPipeline {
public:
    struct Options {
        double saturationThreshold {65530.0}; // counts; strictly above = saturated
        int    accumulations {1};
        double settleAfterMoveS {0.5};
        double settleAfterTriggerS {0.5};
        Denoiser::Options denoise{};
    };

    ScanPointPipeline(DeviceSet devices, const Options& opt, RunLog& log);

    [[nodiscard]] PointResult acquirePoint(std::size_t index, double angleDeg,
                                           ExposureSelector& exposure,
                                           BackgroundCache& cache,
                                           const CancelToken& cancel);

    /// Stage of the most recent acquirePoint() call.
    [[nodiscard]] PointStage stage() const noexcept { return stage_; }

    /// Signal / background acquisitions issued so far (for the run summary).
    [[nodiscard]] std::uint64_t signalAcquisitions() const noexcept { return signalAcqs_; }
    [[nodiscard]] std::uint64_t backgroundAcquisitions() const noexcept { return backgroundAcqs_; }

private:
    void enter(PointStage next);
    void settle(double seconds) const;

    FramePtr acquireSignal(double timeS, double confirmedAngle);
    FramePtr acquireBackground(double timeS, double confirmedAngle);
    FramePtr computeNet(const Frame& signal, const Frame& background) const;

    DeviceSet devices_;
    Options   opt_;
    RunLog&   log_;
    Denoiser  denoiser_;

    PointStage stage_{PointStage::Idle};
    std::uint64_t signalAcqs_{0};
    std::uint64_t backgroundAcqs_{0};
};

} // namespace asesweep
