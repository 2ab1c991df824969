#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#ifndef ASESWEEP_VERSION
#define ASESWEEP_VERSION "dev"
#endif
#ifndef ASESWEEP_GIT_SHA
#define ASESWEEP_GIT_SHA "unknown"
#endif

// Provenance helpers for the run directory: clocks, ids and file fingerprints.
namespace asesweep::info {

/* One file listed in run_summary.json. */
struct Artifact {
    std::string path;          // relative to the run directory
    std::string kind;          // "raw/spf", "net/txt", "log", "manifest", "preview/png"
    std::uintmax_t size{0};
    std::string sha256;        // hex, empty if unreadable
    std::string crc32;         // 8 hex digits, same polynomial as the .spf records
};

std::string iso_utc_now();

/* strftime pattern in local time, e.g. "%Y%m%d". */
std::string local_stamp(const char* fmt,
                        std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

/* 32 hex digits; run ids only. */
std::string rand_id();

std::uint32_t crc32_bytes(const void* data, std::size_t size);

/* Reads the file once; size 0 and empty digests if it cannot be read. */
Artifact describe_artifact(const std::filesystem::path& root,
                           const std::filesystem::path& p,
                           const std::string& kind);

std::string join_argv(int argc, char** argv);
std::string os_name();

} // namespace asesweep::info
