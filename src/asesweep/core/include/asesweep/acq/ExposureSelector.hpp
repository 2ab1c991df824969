#pragma once

#include "asesweep/core/Config.hpp"

#include <cstddef>
#include <vector>

namespace asesweep {

/*
  Auto-ranging exposure policy.

  Presets are ordered longest -> shortest. Within one angle the selector only
  ever moves towards shorter times, so an angle costs at most presets().size()
  signal acquisitions. The start index of the next angle is remembered across
  angles (the "hint").

  Usage per angle:
      sel.beginPoint();
      double t = sel.next(false);          // first attempt
      while (saturated(t)) t = sel.next(true);  // throws SaturationExhaustedError
      sel.commit(sel.currentIndex(), maxCount);
*/
class ExposureSelector {
public:
    struct Options {
        ExposureResume resume {ExposureResume::LastSuccessful};
        double warningThreshold {0.0};  // 0 disables proactive step-down
    };

    explicit ExposureSelector(std::vector<double> presetsS);
    ExposureSelector(std::vector<double> presetsS, const Options& opt);

    /// Start the attempt sequence for a new angle.
    void beginPoint();

    /// Integration time for the next attempt. The first call after beginPoint()
    /// ignores its argument and returns the start preset.
    [[nodiscard]] double next(bool previousAttemptSaturated);

    /// Record the successful attempt; sets the hint for the next angle.
    void commit(std::size_t index, double maxCount);

    /// Forget the hint: next angle starts from presets[0].
    void resetHint() noexcept { hintIndex_ = 0; }

    [[nodiscard]] std::size_t currentIndex() const noexcept { return currentIndex_; }
    [[nodiscard]] std::size_t hintIndex() const noexcept { return hintIndex_; }
    [[nodiscard]] double current() const { return presets_.at(currentIndex_); }
    [[nodiscard]] const std::vector<double>& presets() const noexcept { return presets_; }

    /// Index of 'timeS' in the preset list (within float tolerance), or npos.
    [[nodiscard]] std::size_t indexOf(double timeS) const noexcept;

    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

private:
    std::vector<double> presets_;
    Options opt_;

    std::size_t hintIndex_{0};
    std::size_t currentIndex_{0};
    bool        fresh_{true};   // next() not yet called for this angle
};

} // namespace asesweep
