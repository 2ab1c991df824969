#pragma once

#include "asesweep/core/Frame.hpp"

#include <cstddef>
#include <string>

namespace asesweep {

/* Snapshot of the last measured point, as shown to the operator. */
struct PreviewUpdate {
    std::size_t index {0};
    std::size_t total {0};
    double angleDeg {0.0};
    double integrationTimeS {0.0};
    double maxCount {0.0};
    bool   backgroundFromCache {false};
    std::string state;              // sweep state at publish time

    FramePtr signal;
    FramePtr background;
    FramePtr net;
};

/*
  Consumer of preview updates.
  update() must return quickly and must not throw; a slow or broken sink
  may lose updates but never stalls the sweep. state() gets every sweep
  state as it is entered ("connecting", ..., "completed"), same rules.
*/
class IPreviewSink {
public:
    virtual ~IPreviewSink() = default;
    virtual void update(PreviewUpdate u) noexcept = 0;
    virtual void state(const std::string&) noexcept {}
};

/* Sink for runs without a preview surface. */
class NullPreviewSink final : public IPreviewSink {
public:
    void update(PreviewUpdate) noexcept override {}
};

} // namespace asesweep
