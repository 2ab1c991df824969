#include "asesweep/sim/SimulatedBench.hpp"
#include "asesweep/core/Errors.hpp"

#include <cerrno>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace asesweep::sim {

//---------------- PortClaim ----------------

std::filesystem::path PortClaim::lockPath(const std::string& port)
{
    std::string name;
    name.reserve(port.size());
    for (char c : port) {
        const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
        name += keep ? c : '_';
    }
    return std::filesystem::temp_directory_path() / ("asesweep-" + name + ".lock");
}

PortClaim::~PortClaim() { release(); }

void PortClaim::acquire(const std::string& device, const std::string& port)
{
    if (fd_ >= 0) return;
    const auto path = lockPath(port);
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw DeviceUnavailableError(device, "cannot open " + path.string() + ": " + std::strerror(errno), errno);
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            throw DeviceUnavailableError(device, "port " + port + " is claimed by another session", err);
        }
        throw DeviceUnavailableError(device, "cannot lock " + port + ": " + std::strerror(err), err);
    }
    fd_ = fd;
}

void PortClaim::release() noexcept
{
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

//---------------- SimulatedSpectrometer ----------------

SimulatedSpectrometer::SimulatedSpectrometer(std::shared_ptr<OpticalBench> bench, const DeviceParams& params)
    : bench_(std::move(bench)), params_(params) {}

SimulatedSpectrometer::~SimulatedSpectrometer() { disconnect(); }

void SimulatedSpectrometer::connect()
{
    if (connected_) return;
    claim_.acquire("spectrometer", params_.spectrometerId);
    connected_ = true;
}

void SimulatedSpectrometer::disconnect()
{
    connected_ = false;
    claim_.release();
}

void SimulatedSpectrometer::requireConnected() const
{
    if (!connected_) throw DeviceCommunicationError("spectrometer", "not connected");
}

double SimulatedSpectrometer::temperatureC()
{
    requireConnected();
    return bench_->readTemperatureC();
}

void SimulatedSpectrometer::setTemperatureSetpointC(double c)
{
    requireConnected();
    bench_->setSetpointC(c);
}

GratingInfo SimulatedSpectrometer::gratingInfo()
{
    requireConnected();
    if (bench_->faults().gratingReportFails) {
        throw DeviceCommunicationError("spectrometer", "turret did not answer the grating query", 20202);
    }
    GratingInfo gi;
    gi.currentIndex = bench_->grating();
    gi.gratings = gratingTable();
    return gi;
}

void SimulatedSpectrometer::moveGrating(int index)
{
    requireConnected();
    if (index < 0 || index >= static_cast<int>(gratingTable().size())) {
        throw DeviceCommunicationError("spectrometer", "no grating at index " + std::to_string(index), 20266);
    }
    bench_->pace(8.0);
    bench_->setGrating(index);
}

MirrorPosition SimulatedSpectrometer::entranceMirror()
{
    requireConnected();
    return bench_->mirror();
}

void SimulatedSpectrometer::moveEntranceMirror(MirrorPosition pos)
{
    requireConnected();
    bench_->pace(1.0);
    bench_->setMirror(pos);
}

double SimulatedSpectrometer::moveToWavelength(double nm)
{
    requireConnected();
    if (!(nm > 0.0)) {
        throw DeviceCommunicationError("spectrometer", "wavelength out of range", 20266);
    }
    bench_->pace(2.0);
    // the drive settles on its step grid
    const double confirmed = std::round(nm * 100.0) / 100.0;
    bench_->setCentreNm(confirmed);
    return confirmed;
}

Frame SimulatedSpectrometer::acquire(double integrationTimeS, int accumulations)
{
    requireConnected();
    if (!(integrationTimeS > 0.0) || accumulations < 1) {
        throw DeviceCommunicationError("spectrometer", "invalid acquisition parameters", 20066);
    }

    const long call = bench_->nextAcquireCall();
    const FaultPlan faults = bench_->faults();
    const double limit = integrationTimeS * accumulations + params_.acqTimeoutMarginS;

    if (call == faults.acquireFailsAt) {
        if (faults.acquireTimesOut) {
            throw DeviceTimeoutError("spectrometer", "acquisition did not complete", limit);
        }
        throw DeviceCommunicationError("spectrometer", "acquisition aborted by the camera", 20013);
    }

    const double duration = (integrationTimeS + bench_->model().readoutS) * accumulations;
    if (duration > limit) {
        throw DeviceTimeoutError("spectrometer", "acquisition did not complete", limit);
    }
    bench_->pace(duration);
    return bench_->expose(integrationTimeS, accumulations);
}

//---------------- SimulatedRotator ----------------

SimulatedRotator::SimulatedRotator(std::shared_ptr<OpticalBench> bench, const DeviceParams& params)
    : bench_(std::move(bench)), params_(params) {}

SimulatedRotator::~SimulatedRotator() { disconnect(); }

void SimulatedRotator::connect()
{
    if (connected_) return;
    claim_.acquire("rotator", params_.motorPort);
    connected_ = true;
}

void SimulatedRotator::disconnect()
{
    connected_ = false;
    claim_.release();
}

void SimulatedRotator::requireConnected() const
{
    if (!connected_) throw DeviceCommunicationError("rotator", "not connected");
}

void SimulatedRotator::travel(double target)
{
    const auto& m = bench_->model();
    const double seconds = m.degPerS > 0.0 ? std::abs(target - bench_->angle()) / m.degPerS : 0.0;
    if (seconds > params_.motorTimeoutS) {
        throw DeviceTimeoutError("rotator", "move to " + std::to_string(target) + " deg not confirmed",
                                 params_.motorTimeoutS);
    }
    bench_->pace(seconds);
    bench_->setAngle(target);
}

void SimulatedRotator::home()
{
    requireConnected();
    travel(bench_->model().homeDeg);
}

double SimulatedRotator::moveTo(double angleDeg)
{
    requireConnected();
    const long call = bench_->nextMoveCall();
    if (call == bench_->faults().moveFailsAt) {
        throw DeviceCommunicationError("rotator", "controller reported a following error", 8);
    }
    // 0.01 deg encoder resolution
    const double target = std::round(angleDeg * 100.0) / 100.0;
    travel(target);
    return bench_->angle();
}

//---------------- SimulatedPulser ----------------

SimulatedPulser::SimulatedPulser(std::shared_ptr<OpticalBench> bench, const DeviceParams& params,
                                 double widthS, double periodS, double voltageV)
    : bench_(std::move(bench)), params_(params),
      widthS_(widthS), periodS_(periodS), voltageV_(voltageV) {}

SimulatedPulser::~SimulatedPulser() { disconnect(); }

void SimulatedPulser::connect()
{
    if (connected_) return;
    if (!(widthS_ > 0.0) || !(periodS_ > widthS_)) {
        throw DeviceUnavailableError("pulser", "refused pulse settings");
    }
    claim_.acquire("pulser", params_.pulserPort);
    // *RST, then program the pulse; the output stays disabled
    bench_->setTrigger(false);
    bench_->setExcitationVoltage(voltageV_);
    connected_ = true;
}

void SimulatedPulser::disconnect()
{
    if (connected_) bench_->setTrigger(false);
    connected_ = false;
    claim_.release();
}

void SimulatedPulser::setTrigger(bool on)
{
    if (!connected_) throw DeviceCommunicationError("pulser", "not connected");
    bench_->setTrigger(on);
}

} // namespace asesweep::sim
