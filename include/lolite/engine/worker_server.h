#pragma once

#include <lolite/engine/engine.h>
#include <lolite/ipc/message_channel.h>
#include <lolite/ipc/message_pipe.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace lolite::engine {

// Worker side of the protocol: owns one Engine and applies the host's
// requests in arrival order. Run executes on its own thread so that stop,
// mutation and destroy requests keep being served meanwhile.
class WorkerServer {
public:
    explicit WorkerServer(ipc::MessagePipe pipe);
    ~WorkerServer();

    WorkerServer(const WorkerServer&) = delete;
    WorkerServer& operator=(const WorkerServer&) = delete;

    // Serves until Shutdown (returns 0) or until the host disappears
    // (returns 1).
    int serve();

private:
    void register_handlers();
    void handle(const ipc::Message& msg);

    void on_hello(const ipc::Message& msg);
    void on_run(const ipc::Message& msg);
    void on_destroy(const ipc::Message& msg);
    void on_shutdown(const ipc::Message& msg);

    // Replies InvalidHandle and returns false before Hello or after Destroy.
    bool require_engine(const ipc::Message& msg);
    void reply(std::uint32_t request_id, std::vector<std::uint8_t> payload);
    void reply_status(std::uint32_t request_id, const core::Status& status);
    void stop_engine();

    ipc::MessageChannel channel_;
    std::unique_ptr<Engine> engine_;
    std::thread run_thread_;
    std::atomic<bool> run_active_{false};
    bool shutdown_requested_ = false;
};

// Entry point of the lolite_worker executable.
int run_worker(int fd);

}  // namespace lolite::engine
