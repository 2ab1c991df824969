#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "asesweep/core/Config.hpp"
#include "asesweep/core/Frame.hpp"

namespace asesweep {

/* One ruled grating on the monochromator turret. */
struct GratingEntry {
    double densityGrPerMm {0.0};
    std::string blaze;
    std::string description;
};

struct GratingInfo {
    int currentIndex {-1};
    std::vector<GratingEntry> gratings;
};

/*
  Device adapter interfaces.

  Every call blocks until the device confirms (or its timeout elapses).
  Failures are reported as DeviceError subclasses:
    - DeviceUnavailableError   from connect(): claimed elsewhere / unreachable
    - DeviceCommunicationError from everything else
    - DeviceTimeoutError       when a bounded wait expires
  disconnect() must be safe to call on an adapter that never connected.
*/
class ISpectrometer {
public:
    virtual ~ISpectrometer() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;

    [[nodiscard]] virtual double temperatureC() = 0;
    virtual void setTemperatureSetpointC(double c) = 0;

    [[nodiscard]] virtual GratingInfo gratingInfo() = 0;
    virtual void moveGrating(int index) = 0;

    [[nodiscard]] virtual MirrorPosition entranceMirror() = 0;
    virtual void moveEntranceMirror(MirrorPosition pos) = 0;

    // Returns the wavelength the monochromator confirms after the move.
    virtual double moveToWavelength(double nm) = 0;

    // Integrates for integrationTimeS * accumulations; triggerOn/angle are filled by the caller.
    [[nodiscard]] virtual Frame acquire(double integrationTimeS, int accumulations) = 0;
};

class IRotator {
public:
    virtual ~IRotator() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;

    virtual void home() = 0;

    // Returns the angle the stage reports after the move.
    virtual double moveTo(double angleDeg) = 0;
};

class IPulser {
public:
    virtual ~IPulser() = default;

    // Resets the generator and programs width / period / amplitude; output stays disabled.
    virtual void connect() = 0;
    virtual void disconnect() = 0;

    virtual void setTrigger(bool on) = 0;
};

/* Borrowed handles to the three instruments of one bench. */
struct DeviceSet {
    ISpectrometer& spectrometer;
    IRotator&      rotator;
    IPulser&       pulser;
};

/* Adapter implementation families. */
enum class DeviceBackend : std::uint8_t {
    Simulated = 0,
    Hardware  = 1
};

/* Owning bundle returned by the factory. */
struct DeviceBundle {
    std::unique_ptr<ISpectrometer> spectrometer;
    std::unique_ptr<IRotator>      rotator;
    std::unique_ptr<IPulser>       pulser;

    [[nodiscard]] DeviceSet borrow() { return {*spectrometer, *rotator, *pulser}; }
};

/* Factory for the adapters of the requested family. */
DeviceBundle makeDevices(DeviceBackend backend, const AcquisitionConfig& cfg);

} // namespace asesweep
