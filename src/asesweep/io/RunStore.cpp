#include "asesweep/io/RunStore.hpp"
#include "asesweep/io/RunInfo.hpp"
#include "asesweep/io/SpectrumRecorder.hpp"

#include <nlohmann/json.hpp>
#include <opencv2/core/version.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace asesweep {

namespace {

// manifest lines keep the field order they were written in
using Record = nlohmann::ordered_json;

std::string dumpLine(const Record& r) {
    // device messages may carry bytes that are not UTF-8
    return r.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Flushes a finished file (or a directory entry) to stable storage.
void syncPath(const fs::path& p, bool directory) {
    const int fd = ::open(p.c_str(), (directory ? O_RDONLY | O_DIRECTORY : O_RDONLY) | O_CLOEXEC);
    if (fd < 0) throw StorageError("cannot open " + p.string() + " for fsync: " + std::strerror(errno));
    const int rc = ::fsync(fd);
    const int err = errno;
    ::close(fd);
    if (rc != 0) throw StorageError("fsync failed for " + p.string() + ": " + std::strerror(err));
}

} // namespace

//---------------- RunStore ----------------

fs::path RunStore::createRunDirectory(const fs::path& saveDir, const std::string& date)
{
    std::error_code ec;
    fs::create_directories(saveDir, ec);
    if (ec) throw StorageError("cannot create " + saveDir.string() + ": " + ec.message());

    for (int n = 1; n < 10000; ++n) {
        const fs::path dir = saveDir / (date + "_Measurement_" + std::to_string(n));
        // create_directory() is false for an existing directory: someone else's run
        if (!fs::create_directory(dir, ec)) {
            if (ec) throw StorageError("cannot create " + dir.string() + ": " + ec.message());
            continue;
        }
        fs::create_directory(dir / "Raw_Data", ec);
        if (ec) throw StorageError("cannot create " + (dir / "Raw_Data").string() + ": " + ec.message());
        return dir;
    }
    throw StorageError("no free run directory under " + saveDir.string());
}

RunStore::RunStore(fs::path runDir, std::string date, const Options& opt)
    : runDir_(std::move(runDir)), date_(std::move(date)), opt_(opt) {}

RunStore::~RunStore()
{
    // no end record: a reader sees an interrupted run
    if (fd_ >= 0) ::close(fd_);
}

void RunStore::appendRecord(const std::string& json)
{
    if (fd_ < 0) throw StorageError("manifest is not open");
    const std::string line = json + "\n";
    const char* p = line.data();
    std::size_t left = line.size();
    while (left > 0) {
        const ssize_t n = ::write(fd_, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageError(std::string("manifest write failed: ") + std::strerror(errno));
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    if (opt_.sync && ::fsync(fd_) != 0) {
        throw StorageError(std::string("manifest fsync failed: ") + std::strerror(errno));
    }
}

void RunStore::open(const RunHeader& h)
{
    if (fd_ >= 0) throw StorageError("manifest already open");

    std::error_code ec;
    fs::create_directories(rawDir(), ec);
    if (ec) throw StorageError("cannot create " + rawDir().string() + ": " + ec.message());

    const auto path = manifestPath();
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) throw StorageError("cannot open " + path.string() + ": " + std::strerror(errno));

    runId_ = h.runId.empty() ? info::rand_id() : h.runId;
    createdAt_ = h.createdAt.empty() ? info::iso_utc_now() : h.createdAt;

    Record r;
    r["type"] = "run";
    r["run_id"] = runId_;
    r["created_at"] = createdAt_;
    r["software"] = {{"name", "asesweep"}, {"version", ASESWEEP_VERSION},
                     {"git_sha", ASESWEEP_GIT_SHA}, {"opencv", CV_VERSION}};
    r["os"] = info::os_name();
    r["target_wavelength_nm"] = h.targetWavelengthNm;
    r["grating"] = h.grating;
    r["start_deg"] = h.startDeg;
    r["end_deg"] = h.endDeg;
    r["count"] = h.count;
    r["presets_s"] = h.presetsS;
    r["saturation"] = h.saturationThreshold;
    r["cli"] = h.commandLine;
    r["config"] = h.config;
    appendRecord(dumpLine(r));
    artifacts_.emplace_back(path, "manifest");
}

std::string RunStore::baseName(std::size_t index, double angleDeg, double timeS) const
{
    char idx[16];
    std::snprintf(idx, sizeof(idx), "%03zu", index + 1);
    char ang[32];
    std::snprintf(ang, sizeof(ang), "%.2f", angleDeg);
    std::ostringstream t;
    t << timeS;
    return date_ + "_spectrum_" + idx + "_angle_" + ang + "deg_t_" + t.str() + "s";
}

void RunStore::writeNetText(const fs::path& p, const ScanPoint& sp) const
{
    std::ofstream f(p, std::ios::trunc);
    if (!f) throw StorageError("cannot create " + p.string());

    const Frame& net = *sp.net;
    f << "# Date: " << info::local_stamp("%Y-%m-%d %H:%M:%S", net.timestamp) << "\n"
      << "# Angle: " << std::fixed << std::setprecision(2) << sp.confirmedAngleDeg << " deg\n"
      << std::defaultfloat
      << "# Integration time: " << sp.integrationTimeS << " s\n"
      << "# Accumulations: " << net.accumulations << "\n"
      << "# Background: " << (sp.backgroundFromCache ? "cached" : "acquired") << "\n"
      << "# Wavelength (nm), Net intensity (counts)\n";

    char row[96];
    for (std::size_t i = 0; i < net.size(); ++i) {
        std::snprintf(row, sizeof(row), "%.4f, %.2f\n", net.wavelengthNm[i], net.counts[i]);
        f << row;
    }
    f.flush();
    if (!f) throw StorageError("write failed: " + p.string());
}

void RunStore::commit(const ScanPoint& sp)
{
    if (fd_ < 0) throw StorageError("manifest is not open");
    if (!sp.signal || !sp.background || !sp.net) {
        throw StorageError("point " + std::to_string(sp.index) + " has missing frames");
    }

    const std::string base = baseName(sp.index, sp.angleDeg, sp.integrationTimeS);
    const fs::path raw = rawDir() / (base + ".spf");
    const fs::path net = rawDir() / (base + "_net.txt");

    {
        SpectrumRecorder rec(raw);
        if (!rec.write(*sp.signal) || !rec.write(*sp.background) || !rec.close()) {
            throw StorageError("write failed: " + raw.string());
        }
    }
    writeNetText(net, sp);
    if (opt_.sync) {
        // the files must be on disk before the record that points at them
        syncPath(raw, false);
        syncPath(net, false);
        syncPath(rawDir(), true);
    }

    Record r;
    r["type"] = "point";
    r["index"] = sp.index;
    r["angle_deg"] = sp.angleDeg;
    r["status"] = "ok";
    r["confirmed_angle_deg"] = sp.confirmedAngleDeg;
    r["integration_s"] = sp.integrationTimeS;
    r["max_count"] = sp.maxCount;
    r["background_cached"] = sp.backgroundFromCache;
    r["attempts_s"] = sp.attemptedTimesS;
    r["raw"] = fs::relative(raw, runDir_).generic_string();
    r["net"] = fs::relative(net, runDir_).generic_string();
    r["committed_at"] = info::iso_utc_now();
    appendRecord(dumpLine(r));

    artifacts_.emplace_back(raw, "raw/spf");
    artifacts_.emplace_back(net, "net/txt");
    ++committed_;
}

void RunStore::commitFailure(const FailedPoint& fp)
{
    Record r;
    r["type"] = "point";
    r["index"] = fp.index;
    r["angle_deg"] = fp.angleDeg;
    r["status"] = "failed";
    r["error"] = toString(fp.kind);
    r["reason"] = fp.reason;
    if (!fp.device.empty()) {
        r["device"] = fp.device;
        r["device_code"] = fp.deviceCode;
    }
    if (fp.timeoutS > 0.0) r["timeout_s"] = fp.timeoutS;
    r["attempts_s"] = fp.attemptedTimesS;
    r["committed_at"] = info::iso_utc_now();
    appendRecord(dumpLine(r));
    ++committed_;
}

void RunStore::close(const RunClosing& c)
{
    Record r;
    r["type"] = "end";
    r["outcome"] = c.outcome;
    r["reason"] = c.reason;
    r["error"] = toString(c.error);
    r["attempted"] = c.attempted;
    r["succeeded"] = c.succeeded;
    r["failed"] = c.failed;
    r["finished_at"] = info::iso_utc_now();
    appendRecord(dumpLine(r));

    ::close(fd_);
    fd_ = -1;

    writeSummary(c);
}

void RunStore::writeSummary(const RunClosing& c)
{
    Record artifacts = Record::array();
    const auto add = [&](const fs::path& p, const std::string& kind) {
        const info::Artifact a = info::describe_artifact(runDir_, p, kind);
        artifacts.push_back(Record{{"path", a.path}, {"kind", a.kind}, {"size", a.size},
                                   {"sha256", a.sha256}, {"crc32", a.crc32}});
    };
    for (const auto& [p, kind] : artifacts_) add(p, kind);
    for (const auto& [p, kind] : c.extraArtifacts) {
        if (fs::exists(p)) add(p, kind);
    }

    Record s;
    s["run_id"] = runId_;
    s["created_at"] = createdAt_;
    s["finished_at"] = info::iso_utc_now();
    s["software"] = {{"name", "asesweep"}, {"version", ASESWEEP_VERSION}, {"git_sha", ASESWEEP_GIT_SHA}};
    s["outcome"] = c.outcome;
    s["reason"] = c.reason;
    s["error"] = toString(c.error);
    s["points"] = {{"attempted", c.attempted}, {"succeeded", c.succeeded}, {"failed", c.failed}};
    s["acquisitions"] = {{"signal", c.signalAcquisitions}, {"background", c.backgroundAcquisitions}};
    s["background_cache"] = {{"hits", c.cacheHits}, {"misses", c.cacheMisses}};
    s["warnings"] = c.warnings;
    s["artifacts"] = std::move(artifacts);

    const fs::path path = summaryPath();
    std::ofstream f(path, std::ios::trunc);
    if (!f) throw StorageError("cannot create " + path.string());
    f << s.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    f.flush();
    if (!f) throw StorageError("write failed: " + path.string());
}

//---------------- reading back ----------------

namespace {

template <typename T>
void readField(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) out = j[key].get<T>();
}

} // namespace

ManifestContents readManifest(const fs::path& manifest)
{
    std::ifstream f(manifest, std::ios::binary);
    if (!f) throw StorageError("cannot open " + manifest.string());
    std::ostringstream buf;
    buf << f.rdbuf();
    const std::string text = buf.str();

    ManifestContents mc;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto nl = text.find('\n', start);
        if (nl == std::string::npos) {
            // writer died mid-record
            mc.truncatedTail = true;
            break;
        }
        const std::string line = text.substr(start, nl - start);
        start = nl + 1;
        if (line.empty()) continue;

        const nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("type") || !j["type"].is_string()) {
            ++mc.skippedLines;
            continue;
        }

        try {
            const std::string type = j["type"].get<std::string>();
            if (type == "run") {
                readField(j, "run_id", mc.runId);
                mc.hasHeader = true;
            } else if (type == "point") {
                if (!j.contains("index") || !j.contains("angle_deg") || !j.contains("status")) {
                    ++mc.skippedLines;
                    continue;
                }
                ManifestPoint p;
                p.index = j["index"].get<std::size_t>();
                p.angleDeg = j["angle_deg"].get<double>();
                p.ok = j["status"].get<std::string>() == "ok";
                readField(j, "integration_s", p.integrationTimeS);
                readField(j, "max_count", p.maxCount);
                readField(j, "background_cached", p.backgroundFromCache);
                readField(j, "raw", p.raw);
                readField(j, "net", p.net);
                readField(j, "error", p.error);
                readField(j, "reason", p.reason);
                readField(j, "device", p.device);
                readField(j, "device_code", p.deviceCode);
                readField(j, "timeout_s", p.timeoutS);
                mc.points.push_back(std::move(p));
            } else if (type == "end") {
                readField(j, "outcome", mc.outcome);
                readField(j, "reason", mc.reason);
                mc.hasEnd = true;
            } else {
                ++mc.skippedLines;
            }
        } catch (const nlohmann::json::exception&) {
            // a field of the wrong type: the record is unusable as a whole
            ++mc.skippedLines;
        }
    }
    return mc;
}

} // namespace asesweep
