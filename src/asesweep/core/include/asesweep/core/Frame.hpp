//====================================================================
// File: core/include/asesweep/core/Frame.hpp
//====================================================================
#pragma once


#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>


namespace asesweep {


/// What the frame holds; stored in the raw file header.
enum class FrameKind : std::uint8_t {
Signal = 0,     ///< pulser on
Background,     ///< pulser off, same integration time as its signal
Net             ///< signal - background (optionally denoised)
};


/// One captured spectrum. Immutable once built: share it as FramePtr.
struct Frame {
std::vector<double> wavelengthNm{};   ///< x axis, ascending
std::vector<double> counts{};         ///< intensity per sample
double integrationTimeS{0.0};
double angleDeg{0.0};
int accumulations{1};
bool triggerOn{false};
FrameKind kind{FrameKind::Signal};
std::chrono::system_clock::time_point timestamp{};


[[nodiscard]] std::size_t size() const noexcept { return counts.size(); }


[[nodiscard]] bool empty() const noexcept { return counts.empty(); }


/// Highest count in the frame, 0 for an empty frame.
[[nodiscard]] double maxCount() const noexcept {
if (counts.empty()) return 0.0;
return *std::max_element(counts.begin(), counts.end());
}
};


using FramePtr = std::shared_ptr<const Frame>;


/// Wrap a finished frame so nobody can mutate it afterwards.
inline FramePtr freeze(Frame&& f) {
return std::make_shared<const Frame>(std::move(f));
}


} // namespace asesweep
