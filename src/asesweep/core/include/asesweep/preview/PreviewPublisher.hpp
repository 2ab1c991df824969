#pragma once

#include "asesweep/preview/LatestSlot.hpp"
#include "asesweep/preview/PreviewSink.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace asesweep {

class RunLog;

/*
  Best-effort preview task.

  The control loop calls update(), which only drops the snapshot into a
  single-slot mailbox. A worker thread takes the newest snapshot and hands
  it to every consumer (window, PNG, gRPC stream) in turn. A consumer that
  throws is logged and, after three failures in a row, switched off.
*/
class PreviewPublisher final : public IPreviewSink {
public:
    using Consumer = std::function<void(const PreviewUpdate&)>;
    using StateConsumer = std::function<void(const std::string&)>;

    struct Options {
        int pollMs = 50;    // worker wake-up period when idle
    };

    explicit PreviewPublisher(RunLog& log) : PreviewPublisher(log, Options{}) {}
    PreviewPublisher(RunLog& log, Options opt);
    ~PreviewPublisher() override;

    PreviewPublisher(const PreviewPublisher&)            = delete;
    PreviewPublisher& operator=(const PreviewPublisher&) = delete;

    // Register before start().
    void addConsumer(std::string name, Consumer c);
    // Called on every worker tick, e.g. to pump GUI events.
    void setIdleHook(std::function<void()> hook);
    // Runs on the caller's thread of state(); keep it short.
    void setStateConsumer(StateConsumer c);

    void start();
    // Delivers what is still in the slot, then joins the worker.
    void stop();

    void update(PreviewUpdate u) noexcept override;
    void state(const std::string& s) noexcept override;

    [[nodiscard]] std::uint64_t delivered() const noexcept { return delivered_; }
    [[nodiscard]] std::uint64_t overwritten() const { return slot_.overwritten(); }

private:
    struct Entry {
        std::string name;
        Consumer fn;
        int failures {0};
        bool enabled {true};
    };

    void loop();
    void deliver(const PreviewUpdate& u);

    RunLog& log_;
    Options opt_;
    LatestSlot<PreviewUpdate> slot_;
    std::vector<Entry> consumers_;
    std::function<void()> idle_;
    StateConsumer stateConsumer_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::thread worker_;
};

} // namespace asesweep
