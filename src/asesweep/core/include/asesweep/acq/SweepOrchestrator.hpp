#pragma once

#include "asesweep/acq/BackgroundCache.hpp"
#include "asesweep/acq/ExposureSelector.hpp"
#include "asesweep/acq/Preconditions.hpp"
#include "asesweep/acq/ScanPointPipeline.hpp"
#include "asesweep/core/Cancel.hpp"
#include "asesweep/core/Config.hpp"
#include "asesweep/core/Errors.hpp"
#include "asesweep/devices/Devices.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace asesweep {

class IPreviewSink;
class RunLog;
class RunStore;

/* Life of one run. Completed and Aborted are terminal. */
enum class SweepState : std::uint8_t {
    Idle = 0,
    Connecting,
    Preconditioning,
    Sweeping,
    Finalizing,
    Completed,
    Aborted
};

const char* toString(SweepState s) noexcept;

[[nodiscard]] bool isAllowed(SweepState from, SweepState to) noexcept;

/* What run() hands back. Same content as the manifest "end" record. */
struct RunOutcome {
    SweepState  terminal {SweepState::Aborted};
    ErrorKind   error {ErrorKind::None};
    std::string reason;

    std::size_t attempted {0};
    std::size_t succeeded {0};
    std::size_t failed {0};

    bool preconditionsDone {false};
    PreconditionReport preconditions{};

    [[nodiscard]] bool completed() const noexcept { return terminal == SweepState::Completed; }

    // 0 completed, 3 cancelled, 2 any other abort
    [[nodiscard]] int exitCode() const noexcept;
};

/*
  Drives one sweep:

    Idle -> Connecting -> Preconditioning -> Sweeping -> Finalizing -> Completed | Aborted

  Owns the exposure memory, the background cache and the point pipeline for
  the run; devices, store, log and preview sink are borrowed. Finalizing
  runs on every way out of Connecting / Preconditioning / Sweeping: rotator
  home, trigger off, adapters released, manifest closed. Each of those steps
  is attempted even if an earlier one fails.

  run() does not throw for device, precondition, storage or cancellation
  failures; they end up in RunOutcome. ConfigError is raised by the
  constructor, before any device is touched.
*/
class SweepOrchestrator {
public:
    struct Options {
        std::string commandLine;
        // files outside the store to fingerprint in run_summary.json: (path, kind)
        std::vector<std::pair<std::filesystem::path, std::string>> extraArtifacts;
    };

    SweepOrchestrator(const AcquisitionConfig& cfg, DeviceSet devices,
                      RunStore& store, RunLog& log, IPreviewSink& preview);
    SweepOrchestrator(const AcquisitionConfig& cfg, DeviceSet devices,
                      RunStore& store, RunLog& log, IPreviewSink& preview,
                      Options opt);

    SweepOrchestrator(const SweepOrchestrator&)            = delete;
    SweepOrchestrator& operator=(const SweepOrchestrator&) = delete;

    RunOutcome run();

    // Safe from any thread (signal watcher, GUI). Observed between steps.
    void requestCancel() noexcept { cancel_.request(); }
    [[nodiscard]] const CancelToken& cancelToken() const noexcept { return cancel_; }

    [[nodiscard]] SweepState state() const noexcept { return state_.load(); }
    // Every state entered by run(), in order.
    [[nodiscard]] const std::vector<SweepState>& history() const noexcept { return history_; }

    [[nodiscard]] const ExposureSelector& exposure() const noexcept { return exposure_; }
    [[nodiscard]] const BackgroundCache& cache() const noexcept { return cache_; }
    [[nodiscard]] const ScanPointPipeline& pipeline() const noexcept { return pipeline_; }

private:
    class Session;

    void enter(SweepState next);
    void sweep(RunOutcome& out);
    PointResult measure(std::size_t index, double angle, std::size_t total);
    void finalize(Session& session, RunOutcome& out);
    void publish(const ScanPoint& sp, std::size_t total);

    AcquisitionConfig cfg_;
    DeviceSet devices_;
    RunStore& store_;
    RunLog& log_;
    IPreviewSink& preview_;
    Options opt_;

    CancelToken cancel_;
    std::atomic<SweepState> state_{SweepState::Idle};
    std::vector<SweepState> history_;

    ExposureSelector exposure_;
    BackgroundCache cache_;
    ScanPointPipeline pipeline_;
};

} // namespace asesweep
