#pragma once

#include "asesweep/preview/PreviewSink.hpp"
#include "asesweep.pb.h"

#include <zlib.h>

#include <chrono>
#include <cstdint>
#include <vector>

// Conversion between PreviewUpdate and its protobuf form.
namespace asesweep::wire_detail {

inline std::uint32_t countsCrc(const double* data, std::size_t n) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(n * sizeof(double)));
    return static_cast<std::uint32_t>(crc);
}

inline void toCurve(const Frame& f, wire::Curve* c) {
    c->mutable_wavelength_nm()->Add(f.wavelengthNm.begin(), f.wavelengthNm.end());
    c->mutable_counts()->Add(f.counts.begin(), f.counts.end());
}

inline FramePtr fromCurve(const wire::Curve& c, FrameKind kind, const wire::SpectrumUpdate& m) {
    Frame f;
    f.wavelengthNm.assign(c.wavelength_nm().begin(), c.wavelength_nm().end());
    f.counts.assign(c.counts().begin(), c.counts().end());
    f.kind = kind;
    f.integrationTimeS = m.integration_s();
    f.angleDeg = m.angle_deg();
    f.triggerOn = kind == FrameKind::Signal;
    f.timestamp = std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(m.timestamp_ns()))};
    return freeze(std::move(f));
}

inline wire::SpectrumUpdate toWire(const PreviewUpdate& u, std::uint64_t seq) {
    wire::SpectrumUpdate m;
    m.set_seq(seq);
    m.set_heartbeat(false);
    m.set_state(u.state);
    m.set_index(static_cast<std::uint32_t>(u.index));
    m.set_total(static_cast<std::uint32_t>(u.total));
    m.set_angle_deg(u.angleDeg);
    m.set_integration_s(u.integrationTimeS);
    m.set_max_count(u.maxCount);
    m.set_background_cached(u.backgroundFromCache);
    if (u.signal)     toCurve(*u.signal, m.mutable_signal());
    if (u.background) toCurve(*u.background, m.mutable_background());
    if (u.net) {
        toCurve(*u.net, m.mutable_net());
        m.set_crc32(countsCrc(u.net->counts.data(), u.net->counts.size()));
        m.set_timestamp_ns(std::chrono::duration_cast<std::chrono::nanoseconds>(
            u.net->timestamp.time_since_epoch()).count());
    }
    return m;
}

inline PreviewUpdate fromWire(const wire::SpectrumUpdate& m) {
    PreviewUpdate u;
    u.index = m.index();
    u.total = m.total();
    u.angleDeg = m.angle_deg();
    u.integrationTimeS = m.integration_s();
    u.maxCount = m.max_count();
    u.backgroundFromCache = m.background_cached();
    u.state = m.state();
    if (m.has_signal())     u.signal = fromCurve(m.signal(), FrameKind::Signal, m);
    if (m.has_background()) u.background = fromCurve(m.background(), FrameKind::Background, m);
    if (m.has_net())        u.net = fromCurve(m.net(), FrameKind::Net, m);
    return u;
}

inline bool crcMatches(const wire::SpectrumUpdate& m) {
    const auto& c = m.net().counts();
    return countsCrc(c.data(), static_cast<std::size_t>(c.size())) == m.crc32();
}

} // namespace asesweep::wire_detail
