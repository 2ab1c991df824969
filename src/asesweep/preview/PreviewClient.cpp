#include "asesweep/preview/PreviewClient.hpp"
#include "asesweep.grpc.pb.h"
#include "wire.hpp"

#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>

namespace asesweep {

class PreviewClient::Impl {
public:
    Impl(const std::string& addr, Options opt)
        : serverAddr_{addr}, opt_{std::move(opt)}
    {
        channel_ = grpc::CreateChannel(serverAddr_, grpc::InsecureChannelCredentials());
        stub_ = wire::PreviewStream::NewStub(channel_);
    }

    ~Impl() { shutdown(); }

    void start(UpdateHandler cb) {
        if (running_) return;
        cb_ = std::move(cb);
        running_ = true;
        worker_  = std::thread([this]{ loop(); });
    }

    void shutdown() {
        running_ = false;
        {
            std::lock_guard<std::mutex> lk(ctxMutex_);
            if (ctx_) ctx_->TryCancel();   // unblocks a pending Read()
        }
        if (worker_.joinable()) worker_.join();
    }

    std::uint64_t received() const noexcept { return received_; }
    std::uint64_t rejected() const noexcept { return rejected_; }

    std::string lastState() const {
        std::lock_guard<std::mutex> lk(stateMutex_);
        return state_;
    }

private:
    void noteState(const std::string& s) {
        if (s.empty()) return;
        std::lock_guard<std::mutex> lk(stateMutex_);
        state_ = s;
    }

    void loop() {
        using namespace std::chrono;

        std::uint64_t lastSeq = 0;
        auto backoff = milliseconds(opt_.reconnectInitialMs);

        while (running_) {
            grpc::ClientContext ctx;
            {
                std::lock_guard<std::mutex> lk(ctxMutex_);
                ctx_ = &ctx;
            }
            wire::WatchRequest req;
            req.set_client(opt_.name);
            auto reader = stub_->WatchSpectra(&ctx, req);

            bool announced = false;
            auto lastLog = steady_clock::now();

            wire::SpectrumUpdate msg;
            while (running_ && reader->Read(&msg)) {
                if (!announced) {
                    std::cout << "[watch] connected to " << serverAddr_ << "\n";
                    backoff = milliseconds(opt_.reconnectInitialMs);
                    announced = true;
                }

                if (msg.heartbeat()) {
                    noteState(msg.state());
                    if (opt_.printHeartbeat) {
                        const auto now = steady_clock::now();
                        if (duration_cast<milliseconds>(now - lastLog).count() >= opt_.idleLogMs) {
                            std::cout << "[watch] heartbeat"
                                      << (msg.state().empty() ? "" : " (" + msg.state() + ")") << "\n";
                            lastLog = now;
                        }
                    }
                    continue;
                }

                if (!wire_detail::crcMatches(msg)) {
                    std::cerr << "[watch] CRC mismatch: seq=" << msg.seq() << " -> drop\n";
                    ++rejected_;
                    continue;
                }

                // a restarted server begins again at 1
                if (msg.seq() <= lastSeq && msg.seq() != 1) {
                    std::cerr << "[watch] stale update: seq=" << msg.seq()
                              << " after " << lastSeq << " -> drop\n";
                    ++rejected_;
                    continue;
                }
                if (lastSeq && msg.seq() > lastSeq + 1) {
                    std::cout << "[watch] skipped " << (msg.seq() - lastSeq - 1) << " superseded update(s)\n";
                }
                lastSeq = msg.seq();
                noteState(msg.state());
                ++received_;
                cb_(wire_detail::fromWire(msg));
            }

            const grpc::Status st = reader->Finish();
            {
                std::lock_guard<std::mutex> lk(ctxMutex_);
                ctx_ = nullptr;
            }
            if (!running_) break;

            std::cerr << "[watch] stream closed (" << st.error_message() << ") -> reconnecting\n";
            std::this_thread::sleep_for(backoff);
            backoff = std::min(backoff * 2, milliseconds(opt_.reconnectMaxMs));
        }
    }

    std::string serverAddr_;
    Options     opt_;

    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<wire::PreviewStream::Stub> stub_;

    std::mutex ctxMutex_;
    grpc::ClientContext* ctx_{nullptr};

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> rejected_{0};
    mutable std::mutex stateMutex_;
    std::string state_;
    std::thread worker_;
    UpdateHandler cb_;
};

PreviewClient::PreviewClient(const std::string& serverAddr)
    : pimpl_{std::make_unique<Impl>(serverAddr, Options{})} {}

PreviewClient::PreviewClient(const std::string& serverAddr, Options opt)
    : pimpl_{std::make_unique<Impl>(serverAddr, std::move(opt))} {}

PreviewClient::~PreviewClient() = default;

void PreviewClient::start(UpdateHandler cb) { pimpl_->start(std::move(cb)); }
void PreviewClient::shutdown()              { pimpl_->shutdown(); }
std::uint64_t PreviewClient::received() const noexcept { return pimpl_->received(); }
std::uint64_t PreviewClient::rejected() const noexcept { return pimpl_->rejected(); }
std::string PreviewClient::lastState() const { return pimpl_->lastState(); }

} // namespace asesweep
