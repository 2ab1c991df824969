#include "modes.hpp"

#include "asesweep/acq/SweepOrchestrator.hpp"
#include "asesweep/core/Args.hpp"
#include "asesweep/core/Config.hpp"
#include "asesweep/devices/Devices.hpp"
#include "asesweep/io/RunInfo.hpp"
#include "asesweep/io/RunLog.hpp"
#include "asesweep/io/RunStore.hpp"
#include "asesweep/preview/PreviewPublisher.hpp"
#include "asesweep/preview/PreviewServer.hpp"
#include "asesweep/preview/SpectrumPlot.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <unistd.h>

namespace {

// first Ctrl+C: graceful stop; second: leave now
std::atomic<asesweep::SweepOrchestrator*> g_sweep{nullptr};
volatile std::sig_atomic_t g_interrupts = 0;

void on_sigint(int)
{
    g_interrupts = g_interrupts + 1;
    if (g_interrupts >= 2) {
        static const char msg[] = "\n[sweep] second interrupt, exiting without cleanup\n";
        const ssize_t n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)n;
        std::_Exit(130);
    }
    static const char msg[] = "\n[sweep] interrupt: stopping after the current step (Ctrl+C again to force)\n";
    const ssize_t n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)n;
    if (auto* s = g_sweep.load()) s->requestCancel();
}

struct SigintScope {
    explicit SigintScope(asesweep::SweepOrchestrator& s) {
        g_interrupts = 0;
        g_sweep.store(&s);
        prev_ = std::signal(SIGINT, on_sigint);
    }
    ~SigintScope() {
        std::signal(SIGINT, prev_);
        g_sweep.store(nullptr);
    }
    SigintScope(const SigintScope&)            = delete;
    SigintScope& operator=(const SigintScope&) = delete;

private:
    void (*prev_)(int) = SIG_DFL;
};

} // namespace

int run_sweep(int argc, char** argv)
{
    using namespace asesweep;

    // 1) options
    AcquisitionConfig cfg;
    DeviceBackend backend = DeviceBackend::Simulated;
    RunLog::Options lo;
    try {
        cfg = configFromArgs(argc, argv);
        const std::string b = argValue(argc, argv, "backend", "sim");
        if      (b == "sim" || b == "simulated") backend = DeviceBackend::Simulated;
        else if (b == "hardware")                backend = DeviceBackend::Hardware;
        else throw ConfigError("--backend must be sim or hardware");
        if (argHas(argc, argv, "verbose")) lo.minLevel = RunLog::Level::Debug;
    } catch (const ConfigError& e) {
        std::cerr << "[sweep] " << e.what() << "\n";
        std::cerr << "[sweep] run 'asesweep help' for the option list\n";
        return 1;
    }

    RunLog log(lo);

    // 2) run directory + log file
    const std::string date = info::local_stamp("%Y%m%d");
    std::unique_ptr<RunStore> store;
    try {
        const auto dir = RunStore::createRunDirectory(cfg.saveDir, date);
        store = std::make_unique<RunStore>(dir, date);
        log.attachFile(store->logPath());
    } catch (const StorageError& e) {
        log.error("sweep", e.what());
        return 2;
    }

    log.info("sweep", std::string("asesweep ") + ASESWEEP_VERSION + " (" + ASESWEEP_GIT_SHA +
                      "), OpenCV " + CV_VERSION);
    {
        std::istringstream lines(describe(cfg));
        for (std::string line; std::getline(lines, line);) log.info("config", line);
    }

    // 3) devices
    DeviceBundle devices;
    try {
        devices = makeDevices(backend, cfg);
    } catch (const DeviceError& e) {
        log.error("sweep", e.what());
        return 2;
    }

    // 4) preview
    PreviewPublisher publisher(log);
    std::unique_ptr<PreviewServer> server;
    const auto pngPath = store->runDir() / "preview.png";

    if (cfg.view) {
        auto window = std::make_shared<std::unique_ptr<PreviewWindow>>();
        auto headless = std::make_shared<bool>(false);
        publisher.addConsumer("window", [window, headless, &log](const PreviewUpdate& u) {
            if (*headless) return;
            if (!*window) {
                try {
                    *window = std::make_unique<PreviewWindow>();
                } catch (const cv::Exception& e) {
                    log.warn("preview", std::string("no display, running headless: ") + e.what());
                    *headless = true;
                    return;
                }
            }
            (*window)->show(renderSpectra(u));
        });
        publisher.setIdleHook([window]{ if (*window) (*window)->poll(1); });
    }
    if (cfg.previewPng) {
        publisher.addConsumer("png", [pngPath, &log](const PreviewUpdate& u) {
            savePreviewPng(renderSpectra(u), pngPath, log);
        });
    }
    if (cfg.previewPort > 0) {
        try {
            server = std::make_unique<PreviewServer>(static_cast<std::uint16_t>(cfg.previewPort), log);
            PreviewServer* s = server.get();
            publisher.addConsumer("grpc", [s](const PreviewUpdate& u) { s->publish(u); });
            publisher.setStateConsumer([s](const std::string& state) { s->publishState(state); });
        } catch (const Error& e) {
            log.warn("preview", std::string(e.what()) + ", continuing without the stream");
        }
    }
    publisher.start();

    // 5) sweep
    SweepOrchestrator::Options so;
    so.commandLine = info::join_argv(argc, argv);
    if (cfg.previewPng) so.extraArtifacts.emplace_back(pngPath, "preview/png");

    RunOutcome outcome;
    try {
        SweepOrchestrator sweep(cfg, devices.borrow(), *store, log, publisher, so);
        SigintScope sigint(sweep);
        outcome = sweep.run();
    } catch (const ConfigError& e) {
        log.error("sweep", e.what());
        publisher.stop();
        return 1;
    }

    publisher.stop();
    server.reset();

    std::cout << "[sweep] " << toString(outcome.terminal)
              << ": " << outcome.succeeded << " ok, " << outcome.failed << " failed, "
              << outcome.attempted << " attempted\n";
    if (!outcome.reason.empty()) std::cout << "[sweep] reason: " << outcome.reason << "\n";
    std::cout << "[sweep] data in " << store->runDir().string() << "\n";
    log.detachFile();
    return outcome.exitCode();
}
