#pragma once

#include <lolite/core/config.h>
#include <lolite/engine/backend.h>
#include <lolite/engine/protocol.h>
#include <lolite/ipc/message_channel.h>
#include <lolite/platform/event_loop.h>

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

namespace lolite::engine {

// Host-side proxy for an engine living in a lolite_worker process.
//
// Calls block until the worker replies. A reader thread matches replies to
// requests and forwards worker diagnostics; frames are handed to the sink
// on a dispatcher thread, so a sink may call back into the registry. A
// sink exception aborts the worker's run loop.
class WorkerBackend : public EngineBackend {
public:
    // Starts the worker executable and performs the Hello handshake.
    // Returns null and fills `status` on failure.
    static std::unique_ptr<WorkerBackend> spawn(const core::EngineConfig& config,
                                                std::uint64_t handle,
                                                core::Status& status);

    // Talks to a worker already listening on the other end of `pipe`.
    static std::unique_ptr<WorkerBackend> connect(ipc::MessagePipe pipe,
                                                  const core::EngineConfig& config,
                                                  std::uint64_t handle,
                                                  core::Status& status);

    ~WorkerBackend() override;

    WorkerBackend(const WorkerBackend&) = delete;
    WorkerBackend& operator=(const WorkerBackend&) = delete;

    css::StylesheetResult add_stylesheet(std::string_view css) override;
    core::Status create_node(dom::NodeId id, std::optional<std::string> text) override;
    core::Status set_parent(dom::NodeId parent, dom::NodeId child) override;
    core::Status set_attribute(dom::NodeId node, const std::string& key,
                               const std::string& value) override;
    core::Status root_id() override;
    StyleResult resolve_style(dom::NodeId node) override;

    core::Status set_frame_sink(FrameSink sink) override;
    core::Status run() override;
    core::Status request_stop() override;
    core::Status destroy() override;

    core::RunState state() const override;
    std::vector<core::DiagnosticEvent> diagnostics() const override;

    pid_t worker_pid() const { return pid_; }

private:
    WorkerBackend(ipc::MessagePipe pipe, pid_t pid, const core::EngineConfig& config,
                  std::uint64_t handle);

    core::Status handshake(std::uint64_t handle);

    // Sends a request and blocks for its reply; nullopt once the link is down.
    std::optional<ipc::Message> call(MessageType type, std::vector<std::uint8_t> payload = {});
    core::Status call_status(MessageType type, std::vector<std::uint8_t> payload = {});

    // InvalidHandle once destroyed, CommunicationFailure if the link is down.
    core::Status check_usable(const char* stage) const;
    core::Status link_failure(MessageType type);
    core::Status protocol_failure(MessageType type, const std::string& detail);

    void reader_loop();
    void fail_pending();
    void deliver(const StyleFrame& frame);
    void drain_dispatcher();
    void stop_worker();
    void reap_worker();

    core::EngineConfig config_;
    ipc::MessageChannel channel_;
    pid_t pid_;

    mutable core::DiagnosticEmitter diagnostics_;

    std::atomic<std::uint32_t> next_request_id_{1};
    mutable std::mutex pending_mutex_;
    std::unordered_map<std::uint32_t, std::promise<std::optional<ipc::Message>>> pending_;
    bool link_down_ = false;  // guarded by pending_mutex_

    mutable std::mutex state_mutex_;
    core::RunState state_ = core::RunState::Idle;
    FrameSink sink_;
    bool aborted_ = false;
    bool worker_stopped_ = false;

    std::thread reader_;
    platform::EventLoop dispatch_loop_;
    std::thread dispatcher_;
};

}  // namespace lolite::engine
