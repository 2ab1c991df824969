#include "asesweep/io/SpectrumRecorder.hpp"
#include "asesweep/io/RunInfo.hpp"

#include <chrono>
#include <cstring>
#include <vector>

namespace asesweep {

namespace {
#pragma pack(push, 1)
struct FileHeader {
    char     magic[4];   // 'S','P','F','1'
    uint32_t version;    // 1
};
struct RecordHeader {
    uint32_t samples;        // 4
    uint8_t  kind;           // 1
    uint8_t  trigger_on;     // 1
    uint16_t accumulations;  // 2
    double   integration_s;  // 8
    double   angle_deg;      // 8
    int64_t  timestamp_ns;   // 8
    uint32_t crc32;          // 4
    uint32_t data_size;      // 4
}; // 40 bytes with pack(1)
#pragma pack(pop)

static_assert(sizeof(FileHeader)   == 8,  "FileHeader size unexpected");
static_assert(sizeof(RecordHeader) == 40, "RecordHeader size unexpected");

} // namespace

//---------------- SpectrumRecorder ----------------

SpectrumRecorder::SpectrumRecorder(const std::filesystem::path& path)
    : ofs_(path, std::ios::binary | std::ios::trunc)
{
    if (!ofs_) return;

    FileHeader h{};
    h.magic[0] = 'S'; h.magic[1] = 'P'; h.magic[2] = 'F'; h.magic[3] = '1';
    h.version  = 1u;
    ofs_.write(reinterpret_cast<const char*>(&h), sizeof(h));
    ok_ = static_cast<bool>(ofs_);
}

SpectrumRecorder::~SpectrumRecorder() = default;

bool SpectrumRecorder::write(const Frame& f)
{
    if (!ok_) return false;
    if (f.wavelengthNm.size() != f.counts.size()) { ok_ = false; return false; }

    // one contiguous payload so the CRC covers exactly what lands on disk
    std::vector<double> payload;
    payload.reserve(f.size() * 2);
    payload.insert(payload.end(), f.wavelengthNm.begin(), f.wavelengthNm.end());
    payload.insert(payload.end(), f.counts.begin(), f.counts.end());
    const std::size_t bytes = payload.size() * sizeof(double);

    RecordHeader rh{};
    rh.samples       = static_cast<std::uint32_t>(f.size());
    rh.kind          = static_cast<std::uint8_t>(f.kind);
    rh.trigger_on    = f.triggerOn ? 1 : 0;
    rh.accumulations = static_cast<std::uint16_t>(f.accumulations);
    rh.integration_s = f.integrationTimeS;
    rh.angle_deg     = f.angleDeg;
    rh.timestamp_ns  = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         f.timestamp.time_since_epoch()).count();
    rh.crc32         = bytes ? info::crc32_bytes(payload.data(), bytes) : 0;
    rh.data_size     = static_cast<std::uint32_t>(bytes);

    ofs_.write(reinterpret_cast<const char*>(&rh), sizeof(rh));
    if (!ofs_) { ok_ = false; return false; }

    if (bytes) {
        ofs_.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(bytes));
        if (!ofs_) { ok_ = false; return false; }
    }
    return true;
}

bool SpectrumRecorder::close()
{
    if (!ofs_.is_open()) return ok_;
    ofs_.flush();
    const bool good = ok_ && static_cast<bool>(ofs_);
    ofs_.close();
    ok_ = good && !ofs_.fail();
    return ok_;
}

//---------------- SpectrumReader ----------------

SpectrumReader::SpectrumReader(const std::filesystem::path& path)
    : ifs_(path, std::ios::binary)
{
    if (!ifs_) return;
    FileHeader h{};
    ifs_.read(reinterpret_cast<char*>(&h), sizeof(h));
    if (!ifs_) return;
    if (std::memcmp(h.magic, "SPF1", 4) != 0 || h.version != 1u) {
        return;
    }
    ok_ = true;
}

SpectrumReader::~SpectrumReader() = default;

bool SpectrumReader::readNext(Frame& out)
{
    if (!ok_) return false;

    RecordHeader rh{};
    ifs_.read(reinterpret_cast<char*>(&rh), sizeof(rh));
    if (!ifs_) return false;

    if (rh.data_size != static_cast<std::uint64_t>(rh.samples) * 2 * sizeof(double)) {
        corrupt_ = true;
        return false;
    }

    std::vector<double> payload(static_cast<std::size_t>(rh.samples) * 2);
    if (rh.data_size) {
        ifs_.read(reinterpret_cast<char*>(payload.data()), rh.data_size);
        if (!ifs_) { corrupt_ = true; return false; }
        if (info::crc32_bytes(payload.data(), rh.data_size) != rh.crc32) {
            corrupt_ = true;
            return false;
        }
    }

    out.wavelengthNm.assign(payload.begin(), payload.begin() + rh.samples);
    out.counts.assign(payload.begin() + rh.samples, payload.end());
    out.kind             = static_cast<FrameKind>(rh.kind);
    out.triggerOn        = rh.trigger_on != 0;
    out.accumulations    = rh.accumulations;
    out.integrationTimeS = rh.integration_s;
    out.angleDeg         = rh.angle_deg;
    out.timestamp        = std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(rh.timestamp_ns))};
    return true;
}

} // namespace asesweep
