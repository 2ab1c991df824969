#include "asesweep/preview/PreviewServer.hpp"
#include "asesweep/core/Errors.hpp"
#include "asesweep/io/RunLog.hpp"
#include "asesweep.grpc.pb.h"
#include "wire.hpp"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace asesweep {

namespace {
constexpr std::string_view kTag = "preview-server";
}

//------------------------------------------------------------------------------
// gRPC streaming server
//  - keeps only the newest update (shared, immutable once published)
//  - every WatchSpectra call waits for a newer version or the heartbeat period
//------------------------------------------------------------------------------
class PreviewServer::Impl : public wire::PreviewStream::Service {
public:
    Impl(std::uint16_t port, RunLog& log, Options opt)
        : log_{log}, opt_{std::move(opt)}
    {
        const std::string addr = opt_.bindHost + ":" + std::to_string(port);
        grpc::ServerBuilder b;
        b.AddListeningPort(addr, grpc::InsecureServerCredentials(), &boundPort_);
        b.RegisterService(this);
        server_ = b.BuildAndStart();
        if (!server_ || boundPort_ == 0) {
            throw Error(ErrorKind::Internal, "preview server could not listen on " + addr);
        }
        running_ = true;
        log_.info(kTag, "listening at " + opt_.bindHost + ":" + std::to_string(boundPort_));
    }

    ~Impl() override {
        {
            std::lock_guard<std::mutex> lk(m_);
            running_ = false;
        }
        cv_.notify_all();
        if (server_) server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
    }

    ::grpc::Status WatchSpectra(::grpc::ServerContext* ctx,
                                const wire::WatchRequest* req,
                                ::grpc::ServerWriter<wire::SpectrumUpdate>* writer) override
    {
        ++watchers_;
        log_.info(kTag, "watcher connected: " + (req->client().empty() ? ctx->peer() : req->client()));

        std::uint64_t sent = 0;
        while (!ctx->IsCancelled()) {
            std::shared_ptr<const wire::SpectrumUpdate> msg;
            std::string state;
            {
                std::unique_lock<std::mutex> lk(m_);
                cv_.wait_for(lk, std::chrono::milliseconds(opt_.heartbeatMs),
                             [&]{ return !running_ || version_ != sent; });
                if (!running_) break;
                if (version_ != sent) {
                    msg = latest_;
                    sent = version_;
                }
                state = state_;
            }

            if (msg) {
                if (!writer->Write(*msg)) break;
            } else {
                // keep idle connections alive
                wire::SpectrumUpdate hb;
                hb.set_heartbeat(true);
                hb.set_state(state);
                if (!writer->Write(hb)) break;
            }
        }

        --watchers_;
        log_.info(kTag, "watcher left");
        return ::grpc::Status::OK;
    }

    void publish(const PreviewUpdate& u) {
        auto msg = std::make_shared<const wire::SpectrumUpdate>(wire_detail::toWire(u, seq_ + 1));
        {
            std::lock_guard<std::mutex> lk(m_);
            ++seq_;
            latest_ = std::move(msg);
            state_ = u.state;
            ++version_;
        }
        cv_.notify_all();
    }

    void publishState(const std::string& s) {
        std::lock_guard<std::mutex> lk(m_);
        state_ = s;
    }

    int port() const noexcept { return boundPort_; }
    std::uint64_t watchers() const noexcept { return watchers_; }

private:
    RunLog& log_;
    Options opt_;
    int boundPort_{0};
    std::unique_ptr<grpc::Server> server_;

    std::mutex m_;
    std::condition_variable cv_;
    bool running_{false};
    std::shared_ptr<const wire::SpectrumUpdate> latest_;
    std::string state_;
    std::uint64_t version_{0};
    std::uint64_t seq_{0};   // written by the publisher thread only

    std::atomic<std::uint64_t> watchers_{0};
};

PreviewServer::PreviewServer(std::uint16_t port, RunLog& log)
    : p_(std::make_unique<Impl>(port, log, Options{})) {}

PreviewServer::PreviewServer(std::uint16_t port, RunLog& log, Options opt)
    : p_(std::make_unique<Impl>(port, log, std::move(opt))) {}

PreviewServer::~PreviewServer() = default;

void PreviewServer::publish(const PreviewUpdate& u) { p_->publish(u); }
void PreviewServer::publishState(const std::string& state) { p_->publishState(state); }
int PreviewServer::port() const noexcept { return p_->port(); }
std::uint64_t PreviewServer::watchers() const noexcept { return p_->watchers(); }

} // namespace asesweep
