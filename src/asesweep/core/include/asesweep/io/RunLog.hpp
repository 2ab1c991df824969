#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace asesweep {

/*
  Tagged run log.

  Console lines keep the familiar "[tag] message" shape (warnings and errors
  go to stderr); once a file is attached every line is also appended there as
    2026-01-31T10:00:00Z WARN  [tag] message
  Thread-safe; the preview thread logs through the same instance.
*/
class RunLog {
public:
    enum class Level : std::uint8_t { Debug = 0, Info, Warn, Error };

    struct Options {
        bool  console  {true};
        Level minLevel {Level::Info};
    };

    RunLog() : RunLog(Options{}) {}
    explicit RunLog(const Options& opt) : opt_(opt) {}

    RunLog(const RunLog&)            = delete;
    RunLog& operator=(const RunLog&) = delete;

    /// Start mirroring to 'path' (appends). Throws StorageError if it cannot be opened.
    void attachFile(const std::filesystem::path& path);
    void detachFile();

    void log(Level lvl, std::string_view tag, const std::string& msg);

    void debug(std::string_view tag, const std::string& msg) { log(Level::Debug, tag, msg); }
    void info (std::string_view tag, const std::string& msg) { log(Level::Info,  tag, msg); }
    void warn (std::string_view tag, const std::string& msg) { log(Level::Warn,  tag, msg); }
    void error(std::string_view tag, const std::string& msg) { log(Level::Error, tag, msg); }

    [[nodiscard]] std::uint64_t warnings() const noexcept { return warnings_; }
    [[nodiscard]] std::uint64_t errors() const noexcept { return errors_; }

private:
    Options opt_;
    std::mutex m_;
    std::ofstream file_;
    std::atomic<std::uint64_t> warnings_{0};
    std::atomic<std::uint64_t> errors_{0};
};

} // namespace asesweep
