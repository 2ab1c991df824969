#include "modes.hpp"

#include "asesweep/core/Args.hpp"
#include "asesweep/core/Frame.hpp"
#include "asesweep/io/RunStore.hpp"
#include "asesweep/io/SpectrumRecorder.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>

namespace fs = std::filesystem;

namespace {

const char* kindName(asesweep::FrameKind k) {
    switch (k) {
        case asesweep::FrameKind::Signal:     return "signal";
        case asesweep::FrameKind::Background: return "background";
        case asesweep::FrameKind::Net:        return "net";
        default:                              return "?";
    }
}

// 0 ok, 2 unreadable or corrupt
int dump_file(const fs::path& p, bool quiet)
{
    asesweep::SpectrumReader rd(p);
    if (!rd.ok()) {
        std::cerr << "[inspect] " << p.string() << ": not an SPF1 file\n";
        return 2;
    }
    asesweep::Frame f;
    int n = 0;
    while (rd.readNext(f)) {
        if (!quiet) {
            std::cout << "  [" << n << "] " << std::left << std::setw(10) << kindName(f.kind) << std::right
                      << " samples=" << f.size()
                      << " t=" << f.integrationTimeS << "s"
                      << " acc=" << f.accumulations
                      << " angle=" << std::fixed << std::setprecision(2) << f.angleDeg << std::defaultfloat
                      << " trigger=" << (f.triggerOn ? "on" : "off")
                      << " max=" << std::fixed << std::setprecision(0) << f.maxCount() << std::defaultfloat
                      << "\n";
        }
        ++n;
    }
    if (rd.corrupt()) {
        std::cerr << "[inspect] " << p.string() << ": record " << n << " is corrupt (CRC or size)\n";
        return 2;
    }
    if (n == 0) {
        std::cerr << "[inspect] " << p.string() << ": no records\n";
        return 2;
    }
    return 0;
}

int check_run(const fs::path& dir)
{
    const auto mc = asesweep::readManifest(dir / "manifest.jsonl");

    std::cout << "[inspect] run " << (mc.runId.empty() ? "?" : mc.runId) << " in " << dir.string() << "\n";
    if (!mc.hasHeader) std::cerr << "[inspect] manifest has no run header\n";

    int rc = mc.hasHeader ? 0 : 2;
    std::size_t ok = 0, failed = 0;
    for (const auto& p : mc.points) {
        std::cout << "  #" << std::setw(3) << (p.index + 1)
                  << "  " << std::fixed << std::setprecision(2) << std::setw(8) << p.angleDeg << " deg  "
                  << std::defaultfloat;
        if (p.ok) {
            ++ok;
            std::cout << "ok      t=" << p.integrationTimeS << "s max=" << std::fixed << std::setprecision(0)
                      << p.maxCount << std::defaultfloat << (p.backgroundFromCache ? " bg=cached" : " bg=acquired")
                      << "\n";
            if (dump_file(dir / p.raw, true) != 0) rc = 2;
            if (!fs::exists(dir / p.net)) {
                std::cerr << "[inspect] missing " << p.net << "\n";
                rc = 2;
            }
        } else {
            ++failed;
            std::cout << "failed  " << p.error << ": " << p.reason;
            if (p.deviceCode) std::cout << " [" << p.device << " status " << p.deviceCode << "]";
            std::cout << "\n";
        }
    }

    std::cout << "[inspect] " << mc.points.size() << " point record(s): " << ok << " ok, " << failed << " failed\n";
    if (mc.truncatedTail) std::cout << "[inspect] dropped an incomplete trailing record\n";
    if (mc.skippedLines)  std::cout << "[inspect] skipped " << mc.skippedLines << " unreadable line(s)\n";
    if (mc.hasEnd) {
        std::cout << "[inspect] outcome: " << mc.outcome << (mc.reason.empty() ? "" : " (" + mc.reason + ")") << "\n";
    } else {
        std::cout << "[inspect] no end record: the run was interrupted\n";
    }
    return rc;
}

} // namespace

int run_inspect(int argc, char** argv)
{
    using namespace asesweep;

    std::string run, file;
    try {
        if (const auto bad = argUnknown(argc, argv, {"run", "file"}); !bad.empty()) {
            throw ConfigError("unknown option " + bad);
        }
        run  = argValue(argc, argv, "run");
        file = argValue(argc, argv, "file");
        if (run.empty() == file.empty()) throw ConfigError("give exactly one of --run=<dir> or --file=<spf>");
    } catch (const ConfigError& e) {
        std::cerr << "[inspect] " << e.what() << "\n";
        return 1;
    }

    try {
        if (!file.empty()) {
            std::cout << "[inspect] " << file << "\n";
            return dump_file(file, false);
        }
        return check_run(run);
    } catch (const StorageError& e) {
        std::cerr << "[inspect] " << e.what() << "\n";
        return 2;
    }
}
