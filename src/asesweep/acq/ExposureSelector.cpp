#include "asesweep/acq/ExposureSelector.hpp"
#include "asesweep/core/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace asesweep {

ExposureSelector::ExposureSelector(std::vector<double> presetsS)
    : ExposureSelector(std::move(presetsS), Options{}) {}

ExposureSelector::ExposureSelector(std::vector<double> presetsS, const Options& opt)
    : presets_(std::move(presetsS)), opt_(opt)
{
    if (presets_.empty()) throw ConfigError("exposure selector needs at least one preset");
}

void ExposureSelector::beginPoint() {
    currentIndex_ = (opt_.resume == ExposureResume::LastSuccessful) ? hintIndex_ : 0;
    fresh_ = true;
}

double ExposureSelector::next(bool previousAttemptSaturated) {
    if (fresh_) {
        fresh_ = false;
        return presets_[currentIndex_];
    }
    if (!previousAttemptSaturated) return presets_[currentIndex_];

    if (currentIndex_ + 1 >= presets_.size()) {
        throw SaturationExhaustedError(presets_.back());
    }
    ++currentIndex_;
    return presets_[currentIndex_];
}

void ExposureSelector::commit(std::size_t index, double maxCount) {
    const std::size_t last = presets_.size() - 1;
    index = std::min(index, last);

    // Signal close to saturation: start one preset shorter at the next angle.
    if (opt_.warningThreshold > 0.0 && maxCount >= opt_.warningThreshold) {
        hintIndex_ = std::min(index + 1, last);
    } else {
        hintIndex_ = index;
    }
}

std::size_t ExposureSelector::indexOf(double timeS) const noexcept {
    for (std::size_t i = 0; i < presets_.size(); ++i) {
        const double p = presets_[i];
        if (std::abs(p - timeS) <= 1e-9 * std::max(1.0, std::abs(p))) return i;
    }
    return npos;
}

} // namespace asesweep
