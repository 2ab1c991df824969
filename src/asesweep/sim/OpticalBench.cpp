#include "asesweep/sim/SimulatedBench.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace asesweep::sim {

namespace {
double gauss(double x, double centre, double width) {
    const double d = (x - centre) / width;
    return std::exp(-0.5 * d * d);
}
} // namespace

const std::vector<GratingEntry>& gratingTable()
{
    static const std::vector<GratingEntry> table = {
        {150.0,  "500nm", "survey"},
        {600.0,  "500nm", ""},
        {1200.0, "HOLO",  "holographic"},
    };
    return table;
}

double dispersionNmPerPixel(int gratingIndex)
{
    const auto& t = gratingTable();
    if (gratingIndex < 0 || gratingIndex >= static_cast<int>(t.size())) return 0.1;
    return 0.1 * 600.0 / t[static_cast<std::size_t>(gratingIndex)].densityGrPerMm;
}

OpticalBench::OpticalBench(const BenchModel& model)
    : model_(model),
      angleDeg_(model.homeDeg + 17.0), // wherever the wheel was left
      temperatureC_(model.ambientC),
      setpointC_(model.ambientC),
      rng_(model.seed) {}

void OpticalBench::setFaults(const FaultPlan& f) { std::lock_guard<std::mutex> lk(m_); faults_ = f; }
FaultPlan OpticalBench::faults() const { std::lock_guard<std::mutex> lk(m_); return faults_; }

void OpticalBench::setAngle(double deg) { std::lock_guard<std::mutex> lk(m_); angleDeg_ = deg; }
double OpticalBench::angle() const { std::lock_guard<std::mutex> lk(m_); return angleDeg_; }

void OpticalBench::setTrigger(bool on) {
    std::lock_guard<std::mutex> lk(m_);
    if (on != trigger_) ++triggerSwitches_;
    trigger_ = on;
}
bool OpticalBench::trigger() const { std::lock_guard<std::mutex> lk(m_); return trigger_; }

void OpticalBench::setExcitationVoltage(double v) { std::lock_guard<std::mutex> lk(m_); voltageV_ = v; }

double OpticalBench::readTemperatureC()
{
    std::lock_guard<std::mutex> lk(m_);
    if (setpointActive_ && !faults_.neverCools) {
        const double step = model_.coolingStepC;
        if (temperatureC_ > setpointC_) temperatureC_ = std::max(setpointC_, temperatureC_ - step);
        else                            temperatureC_ = std::min(setpointC_, temperatureC_ + step);
    }
    return temperatureC_;
}

void OpticalBench::setSetpointC(double c) {
    std::lock_guard<std::mutex> lk(m_);
    setpointC_ = c;
    setpointActive_ = true;
}
double OpticalBench::setpointC() const { std::lock_guard<std::mutex> lk(m_); return setpointC_; }

void OpticalBench::setGrating(int index) { std::lock_guard<std::mutex> lk(m_); grating_ = index; }
int OpticalBench::grating() const { std::lock_guard<std::mutex> lk(m_); return grating_; }
void OpticalBench::setMirror(MirrorPosition m) { std::lock_guard<std::mutex> lk(m_); mirror_ = m; }
MirrorPosition OpticalBench::mirror() const { std::lock_guard<std::mutex> lk(m_); return mirror_; }
void OpticalBench::setCentreNm(double nm) { std::lock_guard<std::mutex> lk(m_); centreNm_ = nm; }
double OpticalBench::centreNm() const { std::lock_guard<std::mutex> lk(m_); return centreNm_; }

double OpticalBench::transmission(double angleDeg) const
{
    const double od = std::max(0.0, (angleDeg - model_.homeDeg) * model_.odPerDeg);
    return std::pow(10.0, -od);
}

Frame OpticalBench::expose(double integrationTimeS, int accumulations)
{
    std::lock_guard<std::mutex> lk(m_);

    const std::size_t n = model_.pixels;
    const double disp = dispersionNmPerPixel(grating_);
    const double first = centreNm_ - disp * static_cast<double>(n) / 2.0;

    // excitation reaching the sample
    double T = 0.0;
    if (trigger_ && model_.referenceVoltageV > 0.0) {
        T = transmission(angleDeg_) * std::clamp(voltageV_ / model_.referenceVoltageV, 0.0, 2.0);
    }
    const double above = std::max(0.0, T - model_.thresholdTransmission);
    const double plAmp = model_.plRatePerS * T;
    const double aseAmp = model_.aseRatePerS * above * above;

    std::normal_distribution<double> noise(0.0, model_.readNoise);

    Frame f;
    f.wavelengthNm.resize(n);
    f.counts.assign(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
        f.wavelengthNm[i] = first + disp * static_cast<double>(i);
    }

    const int acc = std::max(1, accumulations);
    for (int a = 0; a < acc; ++a) {
        for (std::size_t i = 0; i < n; ++i) {
            const double lam = f.wavelengthNm[i];
            const double rate = plAmp  * gauss(lam, model_.plCentreNm,  model_.plWidthNm)
                              + aseAmp * gauss(lam, model_.aseCentreNm, model_.aseWidthNm);
            double c = model_.darkOffset + (rate + model_.darkRatePerS) * integrationTimeS
                     + noise(rng_);
            f.counts[i] += std::clamp(std::round(c), 0.0, model_.fullWell);
        }
    }

    f.integrationTimeS = integrationTimeS;
    f.accumulations = acc;
    f.angleDeg = angleDeg_;
    f.triggerOn = trigger_;
    f.kind = trigger_ ? FrameKind::Signal : FrameKind::Background;
    f.timestamp = std::chrono::system_clock::now();
    return f;
}

long OpticalBench::nextAcquireCall() { std::lock_guard<std::mutex> lk(m_); return acquireCalls_++; }
long OpticalBench::nextMoveCall()    { std::lock_guard<std::mutex> lk(m_); return moveCalls_++; }
long OpticalBench::acquireCalls() const { std::lock_guard<std::mutex> lk(m_); return acquireCalls_; }
long OpticalBench::moveCalls() const    { std::lock_guard<std::mutex> lk(m_); return moveCalls_; }
long OpticalBench::triggerSwitches() const { std::lock_guard<std::mutex> lk(m_); return triggerSwitches_; }

void OpticalBench::pace(double seconds) const
{
    const double s = seconds * model_.timeScale;
    if (s <= 0.0) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(s));
}

} // namespace asesweep::sim
