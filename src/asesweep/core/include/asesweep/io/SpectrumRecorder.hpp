#pragma once

#include "asesweep/core/Frame.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace asesweep {

// Raw spectrum file, format SPF1:
//
// Header:
//   char     magic[4] = 'S','P','F','1'
//   uint32_t version  = 1
//
// Per frame, one Record:
//   uint32_t samples
//   uint8_t  kind          (FrameKind)
//   uint8_t  trigger_on
//   uint16_t accumulations
//   double   integration_s
//   double   angle_deg
//   int64_t  timestamp_ns  (system clock, Unix epoch)
//   uint32_t crc32         (zlib, over data)
//   uint32_t data_size     (= 16 * samples)
//   double   data[2 * samples]   wavelengths first, then counts
//
// Everything little-endian (x86/amd64, aarch64).

class SpectrumRecorder {
public:
    explicit SpectrumRecorder(const std::filesystem::path& path);
    ~SpectrumRecorder();

    [[nodiscard]] bool ok() const noexcept { return ok_; }

    // false on I/O error; the file is then unusable
    bool write(const Frame& f);

    // flush and close; false if anything was lost on the way
    bool close();

private:
    std::ofstream ofs_;
    bool ok_{false};
};

class SpectrumReader {
public:
    explicit SpectrumReader(const std::filesystem::path& path);
    ~SpectrumReader();

    [[nodiscard]] bool ok() const noexcept { return ok_; }

    // Reads the next frame.
    // Returns false at end of file, on I/O error, or on a CRC mismatch (corrupt() tells which).
    bool readNext(Frame& out);

    [[nodiscard]] bool corrupt() const noexcept { return corrupt_; }

private:
    std::ifstream ifs_;
    bool ok_{false};
    bool corrupt_{false};
};

} // namespace asesweep
