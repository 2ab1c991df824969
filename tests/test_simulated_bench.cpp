#include "asesweep/acq/SweepOrchestrator.hpp"
#include "asesweep/core/Errors.hpp"
#include "asesweep/io/RunLog.hpp"
#include "asesweep/io/RunStore.hpp"
#include "asesweep/preview/PreviewSink.hpp"
#include "asesweep/sim/SimulatedBench.hpp"
#include "support/FakeDevices.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

using namespace asesweep;
using namespace asesweep::sim;
using namespace asesweep::test;

namespace {

DeviceParams uniqueParams() {
    DeviceParams p;
    p.motorPort = uniquePort("motor");
    p.pulserPort = uniquePort("pulser");
    p.spectrometerId = uniquePort("ccd");
    return p;
}

} // namespace

// Test: a port can only be claimed once at a time
TEST(PortClaim, Exclusive) {
    const std::string port = uniquePort("claim");
    PortClaim a, b;
    a.acquire("rotator", port);
    EXPECT_TRUE(a.held());
    EXPECT_THROW(b.acquire("rotator", port), DeviceUnavailableError);
    EXPECT_FALSE(b.held());

    a.release();
    EXPECT_NO_THROW(b.acquire("rotator", port));
    EXPECT_TRUE(b.held());
}

TEST(PortClaim, LockPathIsSanitised) {
    const auto p = PortClaim::lockPath("/dev/ttyUSB0");
    EXPECT_EQ(p.filename().string(), "asesweep-_dev_ttyUSB0.lock");
}

// Test: second adapter on the same spectrometer id is refused at connect()
TEST(SimulatedDevices, SecondSessionIsUnavailable) {
    auto bench = std::make_shared<OpticalBench>(BenchModel{});
    const auto params = uniqueParams();
    SimulatedSpectrometer first(bench, params);
    SimulatedSpectrometer second(bench, params);

    first.connect();
    EXPECT_THROW(second.connect(), DeviceUnavailableError);
    first.disconnect();
    EXPECT_NO_THROW(second.connect());
}

TEST(SimulatedDevices, CallsBeforeConnectFail) {
    auto bench = std::make_shared<OpticalBench>(BenchModel{});
    const auto params = uniqueParams();
    SimulatedSpectrometer spec(bench, params);
    SimulatedRotator rot(bench, params);
    SimulatedPulser pulser(bench, params, 5e-6, 0.1, 5.0);

    EXPECT_THROW((void)spec.acquire(0.1, 1), DeviceCommunicationError);
    EXPECT_THROW((void)rot.moveTo(10.0), DeviceCommunicationError);
    EXPECT_THROW(pulser.setTrigger(true), DeviceCommunicationError);
    EXPECT_NO_THROW(spec.disconnect());
}

// Test: excitation only reaches the detector with the trigger on; long
// exposures at low OD clip at full well
TEST(SimulatedDevices, SignalDarkAndClipping) {
    auto bench = std::make_shared<OpticalBench>(BenchModel{});
    const auto params = uniqueParams();
    SimulatedSpectrometer spec(bench, params);
    SimulatedRotator rot(bench, params);
    SimulatedPulser pulser(bench, params, 5e-6, 0.1, 5.0);
    spec.connect();
    rot.connect();
    pulser.connect();
    EXPECT_FALSE(bench->trigger());

    (void)spec.moveToWavelength(450.0);
    EXPECT_DOUBLE_EQ(rot.moveTo(85.004), 85.0);

    const Frame dark = spec.acquire(0.1, 1);
    EXPECT_LT(dark.maxCount(), 800.0);
    EXPECT_FALSE(dark.triggerOn);

    pulser.setTrigger(true);
    const Frame lit = spec.acquire(0.1, 1);
    const Frame clipped = spec.acquire(4.0, 1);
    pulser.setTrigger(false);

    EXPECT_GT(lit.maxCount(), 3000.0);
    EXPECT_LT(lit.maxCount(), 65535.0);
    EXPECT_DOUBLE_EQ(clipped.maxCount(), bench->model().fullWell);
    EXPECT_EQ(lit.size(), bench->model().pixels);
    EXPECT_TRUE(std::is_sorted(lit.wavelengthNm.begin(), lit.wavelengthNm.end()));

    pulser.disconnect();
    EXPECT_FALSE(bench->trigger());
}

TEST(OpticalBench, TransmissionFallsWithAngle) {
    OpticalBench bench{BenchModel{}};
    EXPECT_DOUBLE_EQ(bench.transmission(0.0), 1.0);
    EXPECT_GT(bench.transmission(85.0), bench.transmission(140.0));
    EXPECT_GT(bench.transmission(140.0), bench.transmission(280.0));
}

TEST(OpticalBench, CoolsTowardSetpoint) {
    OpticalBench bench{BenchModel{}};
    EXPECT_DOUBLE_EQ(bench.readTemperatureC(), 20.0); // no setpoint yet
    bench.setSetpointC(-70.0);
    EXPECT_DOUBLE_EQ(bench.readTemperatureC(), 15.0);
    for (int i = 0; i < 40; ++i) (void)bench.readTemperatureC();
    EXPECT_DOUBLE_EQ(bench.readTemperatureC(), -70.0);
}

TEST(SimulatedDevices, InjectedFaults) {
    auto bench = std::make_shared<OpticalBench>(BenchModel{});
    const auto params = uniqueParams();
    SimulatedSpectrometer spec(bench, params);
    spec.connect();

    FaultPlan f;
    f.acquireFailsAt = 0;
    bench->setFaults(f);
    EXPECT_THROW((void)spec.acquire(0.1, 1), DeviceCommunicationError);

    f.acquireFailsAt = 1;
    f.acquireTimesOut = true;
    f.gratingReportFails = true;
    bench->setFaults(f);
    EXPECT_THROW((void)spec.acquire(0.1, 1), DeviceTimeoutError);
    EXPECT_THROW((void)spec.gratingInfo(), DeviceCommunicationError);
    EXPECT_NO_THROW((void)spec.acquire(0.1, 1));
}

// Test: travel longer than the motor timeout raises DeviceTimeoutError
TEST(SimulatedDevices, RotatorTimeout) {
    auto bench = std::make_shared<OpticalBench>(BenchModel{});
    auto params = uniqueParams();
    params.motorTimeoutS = 1.0; // 30 deg/s
    SimulatedRotator rot(bench, params);
    rot.connect();
    EXPECT_NO_THROW((void)rot.moveTo(40.0));
    EXPECT_THROW((void)rot.moveTo(200.0), DeviceTimeoutError);
}

TEST(SimulatedDevices, PulserRefusesBadSettings) {
    auto bench = std::make_shared<OpticalBench>(BenchModel{});
    SimulatedPulser pulser(bench, uniqueParams(), 0.2, 0.1, 5.0);
    EXPECT_THROW(pulser.connect(), DeviceUnavailableError);
    EXPECT_FALSE(pulser.connected());
}

TEST(DeviceFactory, HardwareBackendUnavailable) {
    AcquisitionConfig cfg;
    EXPECT_THROW((void)makeDevices(DeviceBackend::Hardware, cfg), DeviceUnavailableError);
}

// Test: a full run against the simulated bench completes and leaves the
// ports free for the next session
TEST(SimulatedSweep, EndToEnd) {
    TempDir tmp("simsweep");
    AcquisitionConfig cfg;
    cfg.devices = uniqueParams();
    cfg.angles.startDeg = 85.0;
    cfg.angles.endDeg = 280.0;
    cfg.angles.count = 3;
    cfg.settleAfterMoveS = 0.0;
    cfg.settleAfterTriggerS = 0.0;
    cfg.coolingPollS = 0.001;

    DeviceBundle devices = makeDevices(DeviceBackend::Simulated, cfg);
    RunStore store(tmp.path(), "20260131");
    RunLog log(quietLog());
    NullPreviewSink sink;
    SweepOrchestrator sweep(cfg, devices.borrow(), store, log, sink);

    const RunOutcome out = sweep.run();
    EXPECT_TRUE(out.completed()) << out.reason;
    EXPECT_EQ(out.succeeded, 3u);
    EXPECT_TRUE(out.preconditions.cooled);
    EXPECT_EQ(out.preconditions.grating.currentIndex, 1);

    const auto m = readManifest(store.manifestPath());
    ASSERT_EQ(m.points.size(), 3u);
    // 4 s clips at the first angle; the sweep falls back to 0.1 s
    EXPECT_DOUBLE_EQ(m.points[0].integrationTimeS, 0.1);
    for (const auto& p : m.points) EXPECT_TRUE(p.ok);

    PortClaim again;
    EXPECT_NO_THROW(again.acquire("rotator", cfg.devices.motorPort));
}
