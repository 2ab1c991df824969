#pragma once

#include "asesweep/devices/Devices.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace asesweep::sim {

/*
  Deterministic model of the ASE bench.

  The filter wheel is a linear variable ND disc: OD grows with the angle,
  transmission T = 10^-OD scales the excitation reaching the sample.
  Emitted spectrum (counts per second, before the detector):
      pl  * T * g(lambda; plCentre, plWidth)
    + ase * max(0, T - Tth)^2 * g(lambda; aseCentre, aseWidth)
  The detector adds a fixed offset, a dark rate and seeded gaussian noise,
  and clips every exposure at fullWell.
*/
struct BenchModel {
    // detector
    std::size_t pixels {1024};
    double fullWell {65535.0};
    double darkOffset {600.0};        // counts per exposure
    double darkRatePerS {5.0};
    double readNoise {8.0};           // counts rms
    std::uint32_t seed {0x5eed};

    // sample
    double plCentreNm {460.0};
    double plWidthNm {25.0};
    double plRatePerS {5000.0};
    double aseCentreNm {452.0};
    double aseWidthNm {2.5};
    double aseRatePerS {2.0e6};
    double thresholdTransmission {0.02};

    // filter wheel
    double odPerDeg {3.0 / 360.0};
    double referenceVoltageV {5.0};   // excitation scales with pulser amplitude

    // thermal: every temperature read moves the detector one step toward the setpoint
    double ambientC {20.0};
    double coolingStepC {5.0};

    // stage
    double homeDeg {0.0};
    double degPerS {30.0};

    // Wall-clock pacing: 0 never sleeps, 1 runs at the speed of the real bench.
    double timeScale {0.0};
    double readoutS {0.05};
};

/* Turret of the simulated monochromator; dispersion follows the groove density. */
const std::vector<GratingEntry>& gratingTable();
double dispersionNmPerPixel(int gratingIndex);

/* Scripted misbehaviour, counted in calls since the bench was built. */
struct FaultPlan {
    long acquireFailsAt {-1};         // n-th acquire() (0-based) throws
    bool acquireTimesOut {false};     // ...as DeviceTimeoutError instead of a plain communication error
    long moveFailsAt {-1};            // n-th moveTo()
    bool gratingReportFails {false};
    bool neverCools {false};
};

/*
  Shared physical state of the three simulated instruments.
  Thread-safe; the adapters call it from the control thread only, tests poke it from outside.
*/
class OpticalBench {
public:
    explicit OpticalBench(const BenchModel& model);

    [[nodiscard]] const BenchModel& model() const noexcept { return model_; }

    void setFaults(const FaultPlan& f);
    [[nodiscard]] FaultPlan faults() const;

    // --- state, as seen by the adapters
    void   setAngle(double deg);
    [[nodiscard]] double angle() const;
    void   setTrigger(bool on);
    [[nodiscard]] bool trigger() const;
    void   setExcitationVoltage(double v);

    [[nodiscard]] double readTemperatureC();
    void   setSetpointC(double c);
    [[nodiscard]] double setpointC() const;

    void   setGrating(int index);
    [[nodiscard]] int grating() const;
    void   setMirror(MirrorPosition m);
    [[nodiscard]] MirrorPosition mirror() const;
    void   setCentreNm(double nm);
    [[nodiscard]] double centreNm() const;

    // Transmission of the filter wheel at an angle.
    [[nodiscard]] double transmission(double angleDeg) const;

    // One exposure of the current scene; counts summed over accumulations.
    [[nodiscard]] Frame expose(double integrationTimeS, int accumulations);

    // Call counters, also used to trigger FaultPlan entries.
    long nextAcquireCall();
    long nextMoveCall();
    [[nodiscard]] long acquireCalls() const;
    [[nodiscard]] long moveCalls() const;
    [[nodiscard]] long triggerSwitches() const;

    // Sleep for a simulated duration, scaled by model().timeScale.
    void pace(double seconds) const;

private:
    BenchModel model_;
    mutable std::mutex m_;
    FaultPlan faults_{};

    double angleDeg_ {0.0};
    bool   trigger_ {false};
    double voltageV_ {0.0};
    double temperatureC_ {0.0};
    double setpointC_ {0.0};
    bool   setpointActive_ {false};
    int    grating_ {0};
    MirrorPosition mirror_ {MirrorPosition::Side};
    double centreNm_ {500.0};

    long acquireCalls_ {0};
    long moveCalls_ {0};
    long triggerSwitches_ {0};

    std::mt19937 rng_;
};

/*
  Exclusive claim on a named port, emulating the OS lock a serial port or
  camera handle gives the first process that opens it.
  Backed by flock() on <tmp>/asesweep-<port>.lock.
*/
class PortClaim {
public:
    PortClaim() = default;
    ~PortClaim();

    PortClaim(const PortClaim&)            = delete;
    PortClaim& operator=(const PortClaim&) = delete;

    // Throws DeviceUnavailableError if another handle holds the port.
    void acquire(const std::string& device, const std::string& port);
    void release() noexcept;
    [[nodiscard]] bool held() const noexcept { return fd_ >= 0; }

    static std::filesystem::path lockPath(const std::string& port);

private:
    int fd_ {-1};
};

class SimulatedSpectrometer final : public ISpectrometer {
public:
    SimulatedSpectrometer(std::shared_ptr<OpticalBench> bench, const DeviceParams& params);
    ~SimulatedSpectrometer() override;

    void connect() override;
    void disconnect() override;

    double temperatureC() override;
    void setTemperatureSetpointC(double c) override;

    GratingInfo gratingInfo() override;
    void moveGrating(int index) override;

    MirrorPosition entranceMirror() override;
    void moveEntranceMirror(MirrorPosition pos) override;

    double moveToWavelength(double nm) override;

    Frame acquire(double integrationTimeS, int accumulations) override;

private:
    void requireConnected() const;

    std::shared_ptr<OpticalBench> bench_;
    DeviceParams params_;
    PortClaim claim_;
    bool connected_ {false};
};

class SimulatedRotator final : public IRotator {
public:
    SimulatedRotator(std::shared_ptr<OpticalBench> bench, const DeviceParams& params);
    ~SimulatedRotator() override;

    void connect() override;
    void disconnect() override;
    void home() override;
    double moveTo(double angleDeg) override;

private:
    void requireConnected() const;
    void travel(double target);

    std::shared_ptr<OpticalBench> bench_;
    DeviceParams params_;
    PortClaim claim_;
    bool connected_ {false};
};

class SimulatedPulser final : public IPulser {
public:
    SimulatedPulser(std::shared_ptr<OpticalBench> bench, const DeviceParams& params,
                    double widthS, double periodS, double voltageV);
    ~SimulatedPulser() override;

    void connect() override;
    void disconnect() override;
    void setTrigger(bool on) override;

    [[nodiscard]] bool connected() const noexcept { return connected_; }

private:
    std::shared_ptr<OpticalBench> bench_;
    DeviceParams params_;
    double widthS_;
    double periodS_;
    double voltageV_;
    PortClaim claim_;
    bool connected_ {false};
};

} // namespace asesweep::sim
