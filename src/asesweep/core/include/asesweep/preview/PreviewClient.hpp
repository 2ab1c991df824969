#pragma once

#include "asesweep/preview/PreviewSink.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace asesweep {

class PreviewClient {
public:
    struct Options {
        int   reconnectInitialMs = 300;   // initial reconnect backoff (ms)
        int   reconnectMaxMs     = 8000;  // maximum reconnect backoff (ms)
        int   idleLogMs          = 2500;  // heartbeat log period when idle (ms)
        bool  printHeartbeat     = true;
        std::string name         = "watch";
    };

    using UpdateHandler = std::function<void(const PreviewUpdate&)>;

    explicit PreviewClient(const std::string& serverAddr);
    PreviewClient(const std::string& serverAddr, Options opt);
    ~PreviewClient();

    void start(UpdateHandler cb);
    void shutdown();

    [[nodiscard]] std::uint64_t received() const noexcept;
    [[nodiscard]] std::uint64_t rejected() const noexcept;   // CRC mismatch or stale seq
    // Sweep state from the newest update or heartbeat, "" before the first one.
    [[nodiscard]] std::string lastState() const;

    PreviewClient(const PreviewClient&)            = delete;
    PreviewClient& operator=(const PreviewClient&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace asesweep
