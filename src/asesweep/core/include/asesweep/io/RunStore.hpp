#pragma once

#include "asesweep/acq/ScanPoint.hpp"
#include "asesweep/core/Errors.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace asesweep {

/* Run metadata, first line of the manifest. */
struct RunHeader {
    std::string runId;
    std::string createdAt;          // ISO-8601 UTC
    std::string commandLine;
    std::string config;             // describe(AcquisitionConfig)
    double targetWavelengthNm {0.0};
    int    grating {0};
    double startDeg {0.0};
    double endDeg {0.0};
    std::size_t count {0};
    std::vector<double> presetsS;
    double saturationThreshold {0.0};
};

/* Last line of the manifest and the body of run_summary.json. */
struct RunClosing {
    std::string outcome;            // "completed" | "aborted"
    std::string reason;
    ErrorKind   error {ErrorKind::None};
    std::size_t attempted {0};
    std::size_t succeeded {0};
    std::size_t failed {0};
    std::uint64_t signalAcquisitions {0};
    std::uint64_t backgroundAcquisitions {0};
    std::uint64_t cacheHits {0};
    std::uint64_t cacheMisses {0};
    std::uint64_t warnings {0};
    // extra files to fingerprint in the summary: (path, kind)
    std::vector<std::pair<std::filesystem::path, std::string>> extraArtifacts;
};

/*
  Durable, append-only store of one run.

  Layout under runDir():
    manifest.jsonl                 run / point / end records, one JSON object per line
    Raw_Data/<base>.spf            signal + background frames (SPF1)
    Raw_Data/<base>_net.txt        "# ..." header lines, then "wavelength, intensity" rows
    <date>_measurement.log         written by RunLog
    run_summary.json               written by close()

  A point's files are complete on disk before its manifest line is written:
  with Options::sync they and Raw_Data are fsync'ed first, and every
  manifest line goes out with a single write() followed by fsync().
  Anything going wrong is a StorageError.
*/
class RunStore {
public:
    struct Options {
        bool sync {true};           // fsync point files and every manifest record
    };

    // Creates <saveDir>/<date>_Measurement_<n>/Raw_Data with the first free n >= 1.
    static std::filesystem::path createRunDirectory(const std::filesystem::path& saveDir,
                                                    const std::string& date);

    RunStore(std::filesystem::path runDir, std::string date)
        : RunStore(std::move(runDir), std::move(date), Options{}) {}
    RunStore(std::filesystem::path runDir, std::string date, const Options& opt);
    ~RunStore();

    RunStore(const RunStore&)            = delete;
    RunStore& operator=(const RunStore&) = delete;

    void open(const RunHeader& header);
    void commit(const ScanPoint& p);
    void commitFailure(const FailedPoint& p);
    void close(const RunClosing& closing);

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::size_t committed() const noexcept { return committed_; }

    [[nodiscard]] const std::filesystem::path& runDir() const noexcept { return runDir_; }
    [[nodiscard]] std::filesystem::path rawDir() const { return runDir_ / "Raw_Data"; }
    [[nodiscard]] std::filesystem::path manifestPath() const { return runDir_ / "manifest.jsonl"; }
    [[nodiscard]] std::filesystem::path summaryPath() const { return runDir_ / "run_summary.json"; }
    [[nodiscard]] std::filesystem::path logPath() const { return runDir_ / (date_ + "_measurement.log"); }

private:
    void appendRecord(const std::string& json);
    [[nodiscard]] std::string baseName(std::size_t index, double angleDeg, double timeS) const;
    void writeNetText(const std::filesystem::path& p, const ScanPoint& sp) const;
    void writeSummary(const RunClosing& closing);

    std::filesystem::path runDir_;
    std::string date_;
    Options opt_;
    int fd_ {-1};
    std::size_t committed_ {0};
    std::string runId_;
    std::string createdAt_;
    std::vector<std::pair<std::filesystem::path, std::string>> artifacts_;
};

/* One point line of a manifest, as read back. */
struct ManifestPoint {
    std::size_t index {0};
    double angleDeg {0.0};
    bool ok {false};
    double integrationTimeS {0.0};
    double maxCount {0.0};
    bool backgroundFromCache {false};
    std::string raw;
    std::string net;
    std::string error;
    std::string reason;
    std::string device;             // failed records raised by an adapter
    int deviceCode {0};
    double timeoutS {0.0};
};

struct ManifestContents {
    bool hasHeader {false};
    std::string runId;
    std::vector<ManifestPoint> points;
    bool hasEnd {false};
    std::string outcome;
    std::string reason;
    bool truncatedTail {false};     // an unterminated last line was dropped
    std::size_t skippedLines {0};   // complete lines that did not parse
};

/* Committed records only. Throws StorageError if the file cannot be read. */
ManifestContents readManifest(const std::filesystem::path& manifest);

} // namespace asesweep
