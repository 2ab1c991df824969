#pragma once

#include "asesweep/core/Frame.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace asesweep {

/* A trigger-off frame and the integration time it was taken at. */
struct BackgroundEntry {
    double integrationTimeS {0.0};
    FramePtr frame;
};

/*
  Integration time -> latest background frame, for one run.

  Entries are trusted for the whole run (no dark-current drift check).
  put() replaces, never merges. The key space is the preset list,
  so there is no eviction.
*/
class BackgroundCache {
public:
    /// Entry for 'integrationTimeS' (float tolerant), if one was stored.
    [[nodiscard]] std::optional<BackgroundEntry> get(double integrationTimeS);

    void put(double integrationTimeS, FramePtr frame);

    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::uint64_t hits() const noexcept { return hits_; }
    [[nodiscard]] std::uint64_t misses() const noexcept { return misses_; }

    /// Key equality used by get()/put().
    [[nodiscard]] static bool sameTime(double a, double b) noexcept;

private:
    std::vector<BackgroundEntry> entries_;
    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
};

} // namespace asesweep
