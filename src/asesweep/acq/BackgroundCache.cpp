#include "asesweep/acq/BackgroundCache.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace asesweep {

bool BackgroundCache::sameTime(double a, double b) noexcept {
    // device round trips (4.0 -> 3.9999999999) must still hit
    const double scale = std::max(std::abs(a), std::abs(b));
    return std::abs(a - b) <= std::max(1e-12, 1e-9 * scale);
}

std::optional<BackgroundEntry> BackgroundCache::get(double integrationTimeS) {
    for (const auto& e : entries_) {
        if (sameTime(e.integrationTimeS, integrationTimeS)) {
            ++hits_;
            return e;
        }
    }
    ++misses_;
    return std::nullopt;
}

void BackgroundCache::put(double integrationTimeS, FramePtr frame) {
    for (auto& e : entries_) {
        if (sameTime(e.integrationTimeS, integrationTimeS)) {
            e.integrationTimeS = integrationTimeS;
            e.frame = std::move(frame);
            return;
        }
    }
    entries_.push_back(BackgroundEntry{integrationTimeS, std::move(frame)});
}

} // namespace asesweep
