#pragma once

#include "asesweep/preview/PreviewSink.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace asesweep {

class RunLog;

/*
  gRPC endpoint streaming the latest preview to any number of watchers.
  Each watcher gets the newest update when it changes, or a heartbeat
  after heartbeatMs of silence. Nothing is queued per client.
*/
class PreviewServer {
public:
    struct Options {
        int heartbeatMs = 1000;
        std::string bindHost = "0.0.0.0";
    };

    // port 0 picks a free port; see port().
    PreviewServer(std::uint16_t port, RunLog& log);
    PreviewServer(std::uint16_t port, RunLog& log, Options opt);
    ~PreviewServer();

    PreviewServer(const PreviewServer&)            = delete;
    PreviewServer& operator=(const PreviewServer&) = delete;

    void publish(const PreviewUpdate& u);
    void publishState(const std::string& state);

    [[nodiscard]] int port() const noexcept;
    [[nodiscard]] std::uint64_t watchers() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> p_;
};

} // namespace asesweep
