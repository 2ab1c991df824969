#include "asesweep/devices/Devices.hpp"
#include "asesweep/core/Errors.hpp"
#include "asesweep/sim/SimulatedBench.hpp"

#include <memory>

namespace asesweep {

DeviceBundle makeDevices(DeviceBackend backend, const AcquisitionConfig& cfg)
{
    switch (backend) {
        case DeviceBackend::Simulated: {
            sim::BenchModel model;
            model.timeScale = cfg.devices.simTimeScale;
            auto bench = std::make_shared<sim::OpticalBench>(model);
            DeviceBundle b;
            b.spectrometer = std::make_unique<sim::SimulatedSpectrometer>(bench, cfg.devices);
            b.rotator      = std::make_unique<sim::SimulatedRotator>(bench, cfg.devices);
            b.pulser       = std::make_unique<sim::SimulatedPulser>(bench, cfg.devices, cfg.pulseWidthS,
                                                                    cfg.pulsePeriodS, cfg.pulseVoltageV);
            return b;
        }

        case DeviceBackend::Hardware:
            throw DeviceUnavailableError("factory", "hardware drivers are not part of this build");
    }
    throw DeviceUnavailableError("factory", "unknown device backend");
}

} // namespace asesweep
