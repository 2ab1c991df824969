#include "asesweep/acq/Denoiser.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace asesweep {

double Denoiser::sigma() const noexcept {
    return std::clamp(opt_.factor, 0.0, 100.0) * 0.03;
}

std::vector<double> Denoiser::apply(std::span<const double> in) const {
    std::vector<double> out(in.begin(), in.end());
    if (!opt_.enabled || in.size() < 3) return out;

    // medianBlur only takes 8U/16U/32F
    cv::Mat row64(1, static_cast<int>(in.size()), CV_64F, out.data());
    cv::Mat row32;
    row64.convertTo(row32, CV_32F);

    cv::Mat despiked;
    cv::medianBlur(row32, despiked, 3);

    cv::Mat smooth = despiked;
    const double s = sigma();
    if (s > 0.0) {
        int k = static_cast<int>(2.0 * std::ceil(3.0 * s) + 1.0);
        const int n = static_cast<int>(in.size());
        k = std::min(k, (n % 2) ? n : n - 1);
        cv::GaussianBlur(despiked, smooth, cv::Size(k, 1), s, 0.0, cv::BORDER_REFLECT);
    }

    smooth.convertTo(row64, CV_64F); // writes back into 'out'
    return out;
}

} // namespace asesweep
