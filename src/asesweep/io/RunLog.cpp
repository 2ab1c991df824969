#include "asesweep/io/RunLog.hpp"
#include "asesweep/io/RunInfo.hpp"
#include "asesweep/core/Errors.hpp"

#include <iostream>

namespace asesweep {

namespace {
const char* levelName(RunLog::Level l) {
    switch (l) {
        case RunLog::Level::Debug: return "DEBUG";
        case RunLog::Level::Info:  return "INFO ";
        case RunLog::Level::Warn:  return "WARN ";
        case RunLog::Level::Error: return "ERROR";
        default:                   return "?    ";
    }
}
} // namespace

void RunLog::attachFile(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lk(m_);
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::app);
    if (!file_) throw StorageError("cannot open log file " + path.string());
}

void RunLog::detachFile() {
    std::lock_guard<std::mutex> lk(m_);
    if (file_.is_open()) file_.close();
}

void RunLog::log(Level lvl, std::string_view tag, const std::string& msg) {
    if (lvl < opt_.minLevel) return;

    std::lock_guard<std::mutex> lk(m_);
    if (lvl == Level::Warn)  ++warnings_;
    if (lvl == Level::Error) ++errors_;

    if (opt_.console) {
        auto& os = (lvl >= Level::Warn) ? std::cerr : std::cout;
        os << "[" << tag << "] " << msg << "\n";
    }
    if (file_.is_open()) {
        file_ << info::iso_utc_now() << ' ' << levelName(lvl) << " [" << tag << "] " << msg << '\n';
        file_.flush();
    }
}

} // namespace asesweep
