#include "asesweep/acq/ScanPointPipeline.hpp"
#include "asesweep/io/RunLog.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace asesweep {

namespace {

constexpr std::string_view kTag = "point";

struct Edge { PointStage from, to; };

constexpr Edge kEdges[] = {
    {PointStage::Idle,                PointStage::Moving},
    {PointStage::Done,                PointStage::Moving},
    {PointStage::Failed,              PointStage::Moving},
    {PointStage::Moving,              PointStage::Exposing},
    {PointStage::Exposing,            PointStage::CheckingSaturation},
    {PointStage::CheckingSaturation,  PointStage::Exposing},           // retry shorter
    {PointStage::CheckingSaturation,  PointStage::ResolvingBackground},
    {PointStage::CheckingSaturation,  PointStage::Failed},             // presets exhausted
    {PointStage::ResolvingBackground, PointStage::ComputingNet},
    {PointStage::ComputingNet,        PointStage::Done},
};

std::string fmt(double v, int prec = 2) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(prec) << v;
    return os.str();
}

std::string fmtTime(double s) {
    std::ostringstream os;
    os << s << " s";
    return os.str();
}

/*
  Keeps the excitation off on every way out of an exposure.
  off() reports failures; the destructor is the last resort and can only log.
*/
class TriggerGuard {
public:
    TriggerGuard(IPulser& p, RunLog& log) : pulser_{p}, log_{log} {}
    ~TriggerGuard() {
        if (!armed_) return;
        try {
            pulser_.setTrigger(false);
        } catch (const std::exception& e) {
            log_.error(kTag, std::string("trigger could not be disabled: ") + e.what());
        }
    }

    TriggerGuard(const TriggerGuard&)            = delete;
    TriggerGuard& operator=(const TriggerGuard&) = delete;

    void on()  { armed_ = true; pulser_.setTrigger(true); }
    void off() { pulser_.setTrigger(false); armed_ = false; }

private:
    IPulser& pulser_;
    RunLog&  log_;
    bool     armed_{false};
};

} // namespace

const char* toString(PointStage s) noexcept {
    switch (s) {
        case PointStage::Idle:                return "idle";
        case PointStage::Moving:              return "moving";
        case PointStage::Exposing:            return "exposing";
        case PointStage::CheckingSaturation:  return "checking_saturation";
        case PointStage::ResolvingBackground: return "resolving_background";
        case PointStage::ComputingNet:        return "computing_net";
        case PointStage::Done:                return "done";
        case PointStage::Failed:              return "failed";
        default:                              return "?";
    }
}

bool isAllowed(PointStage from, PointStage to) noexcept {
    for (const auto& e : kEdges) {
        if (e.from == from && e.to == to) return true;
    }
    return false;
}

ScanPointPipeline::ScanPointPipeline(DeviceSet devices, const Options& opt, RunLog& log)
    : devices_(devices), opt_(opt), log_(log), denoiser_(opt.denoise) {}

void ScanPointPipeline::enter(PointStage next) {
    if (!isAllowed(stage_, next)) {
        throw std::logic_error(std::string("scan point: illegal transition ") +
                               toString(stage_) + " -> " + toString(next));
    }
    stage_ = next;
}

void ScanPointPipeline::settle(double seconds) const {
    if (seconds <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

PointResult ScanPointPipeline::acquirePoint(std::size_t index, double angleDeg,
                                            ExposureSelector& exposure,
                                            BackgroundCache& cache,
                                            const CancelToken& cancel)
{
    // a previous point may have thrown half-way; start the graph over
    if (stage_ != PointStage::Done && stage_ != PointStage::Failed) stage_ = PointStage::Idle;

    // --- motion
    enter(PointStage::Moving);
    log_.info(kTag, "#" + std::to_string(index + 1) + " moving to " + fmt(angleDeg) + " deg");
    const double confirmed = devices_.rotator.moveTo(angleDeg);
    log_.info(kTag, "arrived at " + fmt(confirmed) + " deg");
    settle(opt_.settleAfterMoveS);

    // --- exposure attempts, longest allowed first
    std::vector<double> attempted;
    exposure.beginPoint();
    double timeS = exposure.next(false);
    FramePtr signal;

    while (true) {
        cancel.throwIfRequested();
        enter(PointStage::Exposing);
        attempted.push_back(timeS);
        log_.info(kTag, "signal at " + fmtTime(timeS));
        signal = acquireSignal(timeS, confirmed);

        enter(PointStage::CheckingSaturation);
        const double peak = signal->maxCount();
        if (peak <= opt_.saturationThreshold) break;

        log_.warn(kTag, "saturated at " + fmtTime(timeS) + " (max " + fmt(peak, 0) +
                        " > " + fmt(opt_.saturationThreshold, 0) + "), frame discarded");
        signal.reset();
        try {
            timeS = exposure.next(true);
        } catch (const SaturationExhaustedError& e) {
            enter(PointStage::Failed);
            log_.error(kTag, "angle " + fmt(angleDeg) + " deg failed: " + e.what());
            FailedPoint fp;
            fp.index = index;
            fp.angleDeg = angleDeg;
            fp.kind = e.kind();
            fp.reason = std::string(e.what()) + " (last max " + fmt(peak, 0) + " counts)";
            fp.attemptedTimesS = std::move(attempted);
            return fp;
        }
    }

    // --- background for exactly this integration time
    enter(PointStage::ResolvingBackground);
    FramePtr background;
    bool fromCache = false;
    if (auto hit = cache.get(timeS)) {
        background = hit->frame;
        fromCache = true;
        log_.info(kTag, "background for " + fmtTime(timeS) + " from cache");
    } else {
        cancel.throwIfRequested();
        log_.info(kTag, "background for " + fmtTime(timeS) + " not cached, acquiring");
        background = acquireBackground(timeS, confirmed);
    }

    // --- net signal
    enter(PointStage::ComputingNet);
    FramePtr net = computeNet(*signal, *background);
    // only a background that produced a net spectrum goes into the cache
    if (!fromCache) cache.put(timeS, background);

    ScanPoint sp;
    sp.index = index;
    sp.angleDeg = angleDeg;
    sp.confirmedAngleDeg = confirmed;
    sp.integrationTimeS = timeS;
    sp.maxCount = signal->maxCount();
    sp.backgroundFromCache = fromCache;
    sp.attemptedTimesS = std::move(attempted);
    sp.signal = std::move(signal);
    sp.background = std::move(background);
    sp.net = std::move(net);

    exposure.commit(exposure.currentIndex(), sp.maxCount);
    log_.info(kTag, "ok at " + fmtTime(timeS) + ", max " + fmt(sp.maxCount, 0) +
                    " counts; next angle starts at " + fmtTime(exposure.presets()[exposure.hintIndex()]));

    enter(PointStage::Done);
    return sp;
}

FramePtr ScanPointPipeline::acquireSignal(double timeS, double confirmedAngle) {
    TriggerGuard trigger(devices_.pulser, log_);
    trigger.on();
    settle(opt_.settleAfterTriggerS);

    Frame f = devices_.spectrometer.acquire(timeS, opt_.accumulations);
    ++signalAcqs_;
    trigger.off();

    f.integrationTimeS = timeS;
    f.angleDeg = confirmedAngle;
    f.accumulations = opt_.accumulations;
    f.triggerOn = true;
    f.kind = FrameKind::Signal;
    return freeze(std::move(f));
}

FramePtr ScanPointPipeline::acquireBackground(double timeS, double confirmedAngle) {
    devices_.pulser.setTrigger(false); // laser must be dark, whatever happened before
    settle(opt_.settleAfterTriggerS);

    Frame f = devices_.spectrometer.acquire(timeS, opt_.accumulations);
    ++backgroundAcqs_;

    f.integrationTimeS = timeS;
    f.angleDeg = confirmedAngle;
    f.accumulations = opt_.accumulations;
    f.triggerOn = false;
    f.kind = FrameKind::Background;
    return freeze(std::move(f));
}

FramePtr ScanPointPipeline::computeNet(const Frame& signal, const Frame& background) const {
    if (signal.size() != background.size()) {
        throw DeviceCommunicationError("spectrometer",
            "background has " + std::to_string(background.size()) +
            " samples, signal has " + std::to_string(signal.size()));
    }

    std::vector<double> diff(signal.size());
    for (std::size_t i = 0; i < diff.size(); ++i) {
        diff[i] = signal.counts[i] - background.counts[i];
    }

    Frame net;
    net.wavelengthNm = signal.wavelengthNm;
    net.counts = denoiser_.apply(diff);
    net.integrationTimeS = signal.integrationTimeS;
    net.angleDeg = signal.angleDeg;
    net.accumulations = signal.accumulations;
    net.triggerOn = false;
    net.kind = FrameKind::Net;
    net.timestamp = signal.timestamp;
    return freeze(std::move(net));
}

} // namespace asesweep
