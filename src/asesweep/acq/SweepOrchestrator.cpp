#include "asesweep/acq/SweepOrchestrator.hpp"
#include "asesweep/io/RunInfo.hpp"
#include "asesweep/io/RunLog.hpp"
#include "asesweep/io/RunStore.hpp"
#include "asesweep/preview/PreviewSink.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace asesweep {

namespace {

constexpr std::string_view kTag = "sweep";

struct Edge { SweepState from, to; };

constexpr Edge kEdges[] = {
    {SweepState::Idle,            SweepState::Connecting},
    {SweepState::Connecting,      SweepState::Preconditioning},
    {SweepState::Connecting,      SweepState::Finalizing},
    {SweepState::Preconditioning, SweepState::Sweeping},
    {SweepState::Preconditioning, SweepState::Finalizing},
    {SweepState::Sweeping,        SweepState::Finalizing},
    {SweepState::Finalizing,      SweepState::Completed},
    {SweepState::Finalizing,      SweepState::Aborted},
};

const AcquisitionConfig& validated(const AcquisitionConfig& cfg) {
    cfg.validate();
    return cfg;
}

ExposureSelector::Options selectorOptions(const AcquisitionConfig& cfg) {
    ExposureSelector::Options o;
    o.resume = cfg.exposureResume;
    o.warningThreshold = cfg.saturationWarning;
    return o;
}

ScanPointPipeline::Options pipelineOptions(const AcquisitionConfig& cfg) {
    ScanPointPipeline::Options o;
    o.saturationThreshold = cfg.saturationThreshold;
    o.accumulations = cfg.accumulations;
    o.settleAfterMoveS = cfg.settleAfterMoveS;
    o.settleAfterTriggerS = cfg.settleAfterTriggerS;
    o.denoise.enabled = cfg.denoise;
    o.denoise.factor = cfg.denoiseFactor;
    return o;
}

std::string deg(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << v << " deg";
    return os.str();
}

} // namespace

const char* toString(SweepState s) noexcept {
    switch (s) {
        case SweepState::Idle:            return "idle";
        case SweepState::Connecting:      return "connecting";
        case SweepState::Preconditioning: return "preconditioning";
        case SweepState::Sweeping:        return "sweeping";
        case SweepState::Finalizing:      return "finalizing";
        case SweepState::Completed:       return "completed";
        case SweepState::Aborted:         return "aborted";
        default:                          return "?";
    }
}

bool isAllowed(SweepState from, SweepState to) noexcept {
    for (const auto& e : kEdges) {
        if (e.from == from && e.to == to) return true;
    }
    return false;
}

int RunOutcome::exitCode() const noexcept {
    if (terminal == SweepState::Completed) return 0;
    return error == ErrorKind::Cancelled ? 3 : 2;
}

//------------------------------------------------------------------------------
// Device session: claims the adapters in order, remembers which ones it got,
// and gives them back in reverse order. Release never throws.
//------------------------------------------------------------------------------
class SweepOrchestrator::Session {
public:
    Session(DeviceSet d, RunLog& log) : d_(d), log_(log) {}
    ~Session() { release(); }

    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;

    void connect() {
        log_.info(kTag, "connecting spectrometer");
        d_.spectrometer.connect();
        spectrometer_ = true;
        log_.info(kTag, "connecting rotator");
        d_.rotator.connect();
        rotator_ = true;
        log_.info(kTag, "connecting pulser");
        d_.pulser.connect();
        pulser_ = true;
    }

    [[nodiscard]] bool rotator() const noexcept { return rotator_; }
    [[nodiscard]] bool pulser() const noexcept { return pulser_; }

    void release() noexcept {
        step(pulser_,       "pulser",       [this]{ d_.pulser.disconnect(); });
        step(rotator_,      "rotator",      [this]{ d_.rotator.disconnect(); });
        step(spectrometer_, "spectrometer", [this]{ d_.spectrometer.disconnect(); });
    }

private:
    template <class F>
    void step(bool& held, const char* name, F&& f) noexcept {
        if (!held) return;
        held = false;
        try {
            f();
            log_.info(kTag, std::string(name) + " released");
        } catch (const std::exception& e) {
            log_.error(kTag, std::string(name) + " release failed: " + e.what());
        }
    }

    DeviceSet d_;
    RunLog& log_;
    bool spectrometer_{false};
    bool rotator_{false};
    bool pulser_{false};
};

//------------------------------------------------------------------------------

SweepOrchestrator::SweepOrchestrator(const AcquisitionConfig& cfg, DeviceSet devices,
                                     RunStore& store, RunLog& log, IPreviewSink& preview)
    : SweepOrchestrator(cfg, devices, store, log, preview, Options{}) {}

SweepOrchestrator::SweepOrchestrator(const AcquisitionConfig& cfg, DeviceSet devices,
                                     RunStore& store, RunLog& log, IPreviewSink& preview,
                                     Options opt)
    : cfg_(validated(cfg)),
      devices_(devices),
      store_(store),
      log_(log),
      preview_(preview),
      opt_(std::move(opt)),
      exposure_(cfg_.integrationPresetsS, selectorOptions(cfg_)),
      pipeline_(devices, pipelineOptions(cfg_), log)
{
    history_.push_back(SweepState::Idle);
}

void SweepOrchestrator::enter(SweepState next)
{
    const SweepState cur = state_.load();
    if (!isAllowed(cur, next)) {
        throw std::logic_error(std::string("sweep: illegal transition ") +
                               toString(cur) + " -> " + toString(next));
    }
    state_.store(next);
    history_.push_back(next);
    log_.debug(kTag, std::string("state ") + toString(cur) + " -> " + toString(next));
    preview_.state(toString(next));
}

RunOutcome SweepOrchestrator::run()
{
    if (state_.load() != SweepState::Idle) {
        throw std::logic_error("sweep: run() called twice");
    }

    RunOutcome out;
    Session session(devices_, log_);
    bool ok = false;

    try {
        enter(SweepState::Connecting);
        {
            RunHeader h;
            h.createdAt = info::iso_utc_now();
            h.commandLine = opt_.commandLine;
            h.config = describe(cfg_);
            h.targetWavelengthNm = cfg_.targetWavelengthNm;
            h.grating = cfg_.targetGrating;
            const auto angles = cfg_.angles.positions();
            h.startDeg = angles.front();
            h.endDeg = angles.back();
            h.count = angles.size();
            h.presetsS = cfg_.integrationPresetsS;
            h.saturationThreshold = cfg_.saturationThreshold;
            store_.open(h);
        }
        log_.info(kTag, "run directory " + store_.runDir().string());
        session.connect();
        cancel_.throwIfRequested();

        enter(SweepState::Preconditioning);
        out.preconditions = runPreconditions(devices_, cfg_, log_, cancel_);
        out.preconditionsDone = true;
        cancel_.throwIfRequested();

        enter(SweepState::Sweeping);
        sweep(out);
        ok = true;
    } catch (const CancelledError& e) {
        out.error = ErrorKind::Cancelled;
        out.reason = e.what();
        log_.warn(kTag, std::string("stopping: ") + e.what());
    } catch (const Error& e) {
        out.error = e.kind();
        out.reason = e.what();
        log_.error(kTag, std::string("aborting in ") + toString(state_.load()) + ": " + e.what());
    } catch (const std::exception& e) {
        out.error = ErrorKind::Internal;
        out.reason = e.what();
        log_.error(kTag, std::string("aborting in ") + toString(state_.load()) + ": " + e.what());
    }

    enter(SweepState::Finalizing);
    finalize(session, out);

    if (ok && out.error == ErrorKind::None) {
        out.terminal = SweepState::Completed;
    } else {
        out.terminal = SweepState::Aborted;
    }
    enter(out.terminal);

    std::ostringstream os;
    os << toString(out.terminal) << ": " << out.succeeded << " ok, " << out.failed << " failed of "
       << out.attempted << " attempted";
    if (!out.reason.empty()) os << " (" << out.reason << ")";
    if (out.completed()) log_.info(kTag, os.str());
    else                 log_.error(kTag, os.str());
    return out;
}

void SweepOrchestrator::sweep(RunOutcome& out)
{
    const auto angles = cfg_.angles.positions();
    const std::size_t total = angles.size();
    log_.info(kTag, "sweeping " + std::to_string(total) + " angles, " +
                    deg(angles.front()) + " -> " + deg(angles.back()));

    for (std::size_t i = 0; i < total; ++i) {
        cancel_.throwIfRequested();

        PointResult r;
        try {
            r = measure(i, angles[i], total);
        } catch (const StorageError&) {
            throw;
        } catch (const CancelledError&) {
            // interrupted, not attempted to the end: no record
            throw;
        } catch (const Error& e) {
            // the angle was attempted: it gets its record before the run aborts
            FailedPoint fp;
            fp.index = i;
            fp.angleDeg = angles[i];
            fp.kind = e.kind();
            fp.reason = e.what();
            if (const auto* de = dynamic_cast<const DeviceError*>(&e)) {
                fp.device = de->device();
                fp.deviceCode = de->code();
            }
            if (const auto* te = dynamic_cast<const DeviceTimeoutError*>(&e)) {
                fp.timeoutS = te->timeoutS();
            }
            ++out.attempted;
            ++out.failed;
            store_.commitFailure(fp);
            throw;
        }

        ++out.attempted;
        if (auto* sp = std::get_if<ScanPoint>(&r)) {
            store_.commit(*sp);
            ++out.succeeded;
            publish(*sp, total);
        } else {
            const auto& fp = std::get<FailedPoint>(r);
            store_.commitFailure(fp);
            ++out.failed;
            log_.warn(kTag, "#" + std::to_string(i + 1) + " at " + deg(fp.angleDeg) +
                            " recorded as failed, continuing");
            if (cfg_.resetAfterFailure) exposure_.resetHint();
        }
        log_.info(kTag, "progress " + std::to_string(i + 1) + "/" + std::to_string(total));
    }
}

PointResult SweepOrchestrator::measure(std::size_t index, double angle, std::size_t total)
{
    for (int attempt = 0;; ++attempt) {
        try {
            return pipeline_.acquirePoint(index, angle, exposure_, cache_, cancel_);
        } catch (const DeviceCommunicationError& e) {
            if (attempt >= cfg_.fatalRetries) throw;
            log_.warn(kTag, "#" + std::to_string(index + 1) + "/" + std::to_string(total) + ": " +
                            e.what() + ", retrying angle (" + std::to_string(attempt + 1) + "/" +
                            std::to_string(cfg_.fatalRetries) + ")");
        }
    }
}

void SweepOrchestrator::publish(const ScanPoint& sp, std::size_t total)
{
    PreviewUpdate u;
    u.index = sp.index;
    u.total = total;
    u.angleDeg = sp.confirmedAngleDeg;
    u.integrationTimeS = sp.integrationTimeS;
    u.maxCount = sp.maxCount;
    u.backgroundFromCache = sp.backgroundFromCache;
    u.state = toString(state_.load());
    u.signal = sp.signal;
    u.background = sp.background;
    u.net = sp.net;
    preview_.update(std::move(u));
}

void SweepOrchestrator::finalize(Session& session, RunOutcome& out)
{
    if (session.rotator()) {
        try {
            log_.info(kTag, "homing rotator");
            devices_.rotator.home();
        } catch (const std::exception& e) {
            log_.error(kTag, std::string("homing failed: ") + e.what());
        }
    }
    if (session.pulser()) {
        try {
            devices_.pulser.setTrigger(false);
        } catch (const std::exception& e) {
            log_.error(kTag, std::string("trigger off failed: ") + e.what());
        }
    }
    session.release();

    if (!store_.isOpen()) return;

    RunClosing c;
    const bool clean = out.error == ErrorKind::None;
    c.outcome = clean ? "completed" : "aborted";
    c.reason = out.reason;
    c.error = out.error;
    c.attempted = out.attempted;
    c.succeeded = out.succeeded;
    c.failed = out.failed;
    c.signalAcquisitions = pipeline_.signalAcquisitions();
    c.backgroundAcquisitions = pipeline_.backgroundAcquisitions();
    c.cacheHits = cache_.hits();
    c.cacheMisses = cache_.misses();
    c.warnings = log_.warnings();
    c.extraArtifacts = opt_.extraArtifacts;
    c.extraArtifacts.emplace_back(store_.logPath(), "log");

    try {
        store_.close(c);
    } catch (const std::exception& e) {
        log_.error(kTag, std::string("closing the manifest failed: ") + e.what());
        if (clean) {
            out.error = ErrorKind::Storage;
            out.reason = e.what();
        }
    }
}

} // namespace asesweep
