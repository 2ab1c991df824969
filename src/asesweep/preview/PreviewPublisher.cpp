#include "asesweep/preview/PreviewPublisher.hpp"
#include "asesweep/io/RunLog.hpp"

#include <chrono>
#include <exception>

namespace asesweep {

namespace {
constexpr std::string_view kTag = "preview";
constexpr int kMaxFailures = 3;
} // namespace

PreviewPublisher::PreviewPublisher(RunLog& log, Options opt)
    : log_(log), opt_(opt) {}

PreviewPublisher::~PreviewPublisher() { stop(); }

void PreviewPublisher::addConsumer(std::string name, Consumer c)
{
    consumers_.push_back(Entry{std::move(name), std::move(c)});
}

void PreviewPublisher::setIdleHook(std::function<void()> hook) { idle_ = std::move(hook); }

void PreviewPublisher::setStateConsumer(StateConsumer c) { stateConsumer_ = std::move(c); }

void PreviewPublisher::start()
{
    if (running_) return;
    running_ = true;
    worker_ = std::thread([this]{ loop(); });
}

void PreviewPublisher::stop()
{
    if (!running_.exchange(false)) return;
    slot_.close();
    if (worker_.joinable()) worker_.join();
    if (rejected_) log_.warn(kTag, std::to_string(rejected_.load()) + " updates rejected");
}

void PreviewPublisher::update(PreviewUpdate u) noexcept
{
    try {
        slot_.put(std::move(u));
    } catch (const std::exception&) {
        ++rejected_;
    }
}

void PreviewPublisher::state(const std::string& s) noexcept
{
    if (!stateConsumer_) return;
    try {
        stateConsumer_(s);
    } catch (const std::exception& e) {
        log_.warn(kTag, std::string("state consumer failed: ") + e.what());
        stateConsumer_ = nullptr;
    }
}

void PreviewPublisher::loop()
{
    const auto wait = std::chrono::milliseconds(opt_.pollMs);
    PreviewUpdate u;
    while (running_) {
        if (slot_.take(u, wait)) deliver(u);
        if (idle_) {
            try {
                idle_();
            } catch (const std::exception& e) {
                log_.warn(kTag, std::string("idle hook failed: ") + e.what());
                idle_ = nullptr;
            }
        }
    }
    // last point of the sweep must still reach the PNG / watchers
    if (slot_.tryTake(u)) deliver(u);
}

void PreviewPublisher::deliver(const PreviewUpdate& u)
{
    for (auto& c : consumers_) {
        if (!c.enabled) continue;
        try {
            c.fn(u);
            c.failures = 0;
        } catch (const std::exception& e) {
            log_.warn(kTag, c.name + " failed: " + e.what());
            if (++c.failures >= kMaxFailures) {
                c.enabled = false;
                log_.warn(kTag, c.name + " disabled after " + std::to_string(kMaxFailures) + " failures");
            }
        }
    }
    ++delivered_;
}

} // namespace asesweep
