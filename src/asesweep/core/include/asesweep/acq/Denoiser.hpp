#pragma once

#include <span>
#include <vector>

namespace asesweep {

/*
  Spectral denoiser applied to the net signal.

  Two passes over the 1-D intensity row:
    - 3-tap median (single-sample cosmic-ray spikes),
    - Gaussian smoothing, sigma grows linearly with 'factor' (0..100 -> 0..3 samples).
  factor == 0 keeps only the spike pass; enabled == false is a pass-through.
*/
class Denoiser {
public:
    struct Options {
        bool   enabled {true};
        double factor  {50.0};
    };

    Denoiser() : Denoiser(Options{}) {}
    explicit Denoiser(const Options& opt) : opt_(opt) {}

    [[nodiscard]] std::vector<double> apply(std::span<const double> in) const;

    [[nodiscard]] bool enabled() const noexcept { return opt_.enabled; }
    [[nodiscard]] double sigma() const noexcept;

private:
    Options opt_;
};

} // namespace asesweep
