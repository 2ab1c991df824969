#pragma once

#include "asesweep/core/Errors.hpp"
#include "asesweep/core/Frame.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace asesweep {

/*
  One successfully measured angle.
  signal->integrationTimeS == background->integrationTimeS == integrationTimeS.
*/
struct ScanPoint {
    std::size_t index {0};           // position in the sweep
    double angleDeg {0.0};           // commanded
    double confirmedAngleDeg {0.0};  // reported by the stage
    double integrationTimeS {0.0};
    double maxCount {0.0};           // of the raw signal
    bool   backgroundFromCache {false};
    std::vector<double> attemptedTimesS; // in order, the last one is integrationTimeS

    FramePtr signal;
    FramePtr background;              // shared with the background cache
    FramePtr net;
};

/* An angle that produced no usable spectrum; the sweep goes on. */
struct FailedPoint {
    std::size_t index {0};
    double angleDeg {0.0};
    ErrorKind kind {ErrorKind::SaturationExhausted};
    std::string reason;
    std::string device;               // set when an adapter raised the failure
    int deviceCode {0};               // driver status code, 0 if none
    double timeoutS {0.0};            // bound that was exceeded, DeviceTimeoutError only
    std::vector<double> attemptedTimesS;
};

using PointResult = std::variant<ScanPoint, FailedPoint>;

} // namespace asesweep
