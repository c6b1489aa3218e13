#include <lolite/engine/worker_backend.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace lolite::engine {

namespace {

constexpr const char* kWorkerModule = "worker";

}  // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

std::unique_ptr<WorkerBackend> WorkerBackend::spawn(const core::EngineConfig& config,
                                                    std::uint64_t handle,
                                                    core::Status& status) {
    std::string path = config.resolved_worker_path();
    if (::access(path.c_str(), X_OK) != 0) {
        status = communication_failure("worker executable not found: " + path);
        return nullptr;
    }

    std::pair<ipc::MessagePipe, ipc::MessagePipe> pipes{ipc::MessagePipe(-1), ipc::MessagePipe(-1)};
    try {
        pipes = ipc::MessagePipe::create_pair();
    } catch (const std::runtime_error& e) {
        status = communication_failure(e.what());
        return nullptr;
    }

    // Everything the child needs is prepared before fork().
    std::string fd_arg = std::string(core::config::kWorkerFdFlag) +
                         std::to_string(pipes.second.fd());
    std::vector<char*> argv{const_cast<char*>(path.c_str()),
                            const_cast<char*>(fd_arg.c_str()), nullptr};

    pid_t pid = ::fork();
    if (pid < 0) {
        status = communication_failure(std::string("fork failed: ") + std::strerror(errno));
        return nullptr;
    }
    if (pid == 0) {
        if (!ipc::set_inheritable(pipes.second.fd())) {
            ::_exit(127);
        }
        ::execv(path.c_str(), argv.data());
        ::_exit(127);
    }

    pipes.second.close();
    std::unique_ptr<WorkerBackend> backend(
        new WorkerBackend(std::move(pipes.first), pid, config, handle));
    status = backend->handshake(handle);
    if (!status.ok()) {
        return nullptr;
    }
    return backend;
}

std::unique_ptr<WorkerBackend> WorkerBackend::connect(ipc::MessagePipe pipe,
                                                      const core::EngineConfig& config,
                                                      std::uint64_t handle,
                                                      core::Status& status) {
    std::unique_ptr<WorkerBackend> backend(new WorkerBackend(std::move(pipe), -1, config, handle));
    status = backend->handshake(handle);
    if (!status.ok()) {
        return nullptr;
    }
    return backend;
}

WorkerBackend::WorkerBackend(ipc::MessagePipe pipe, pid_t pid,
                             const core::EngineConfig& config, std::uint64_t handle)
    : config_(config),
      channel_(std::move(pipe)),
      pid_(pid),
      diagnostics_(config.max_diagnostic_events) {
    diagnostics_.set_correlation_id(handle);
    if (config_.log_to_stderr) {
        diagnostics_.add_observer(core::stderr_observer(config_.min_severity));
    }
    dispatcher_ = std::thread([this]() { dispatch_loop_.run(); });
    reader_ = std::thread([this]() { reader_loop(); });
}

// Frames are only delivered while run() is active and run() drains the
// dispatcher before returning, so the last owner never releases us from
// the dispatcher thread.
WorkerBackend::~WorkerBackend() {
    stop_worker();
    dispatch_loop_.quit();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

core::Status WorkerBackend::handshake(std::uint64_t handle) {
    ipc::Serializer s;
    write_hello(s, HelloRequest::from_config(config_, handle));
    core::Status status = call_status(MessageType::Hello, s.take_data());
    if (status.ok()) {
        diagnostics_.emit(core::Severity::Info, kWorkerModule, "hello",
                          pid_ > 0 ? "worker pid " + std::to_string(pid_) + " connected"
                                   : std::string("worker connected"));
    }
    return status;
}

// ---------------------------------------------------------------------------
// Request plumbing
// ---------------------------------------------------------------------------

std::optional<ipc::Message> WorkerBackend::call(MessageType type,
                                                std::vector<std::uint8_t> payload) {
    std::uint32_t id = next_request_id_.fetch_add(1);
    std::future<std::optional<ipc::Message>> reply;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (link_down_) {
            return std::nullopt;
        }
        reply = pending_[id].get_future();
    }

    if (!channel_.send(make_message(type, id, std::move(payload)))) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(id);
        return std::nullopt;
    }
    return reply.get();
}

core::Status WorkerBackend::call_status(MessageType type, std::vector<std::uint8_t> payload) {
    auto reply = call(type, std::move(payload));
    if (!reply) {
        return link_failure(type);
    }
    try {
        ipc::Deserializer d(reply->payload);
        core::Status status = read_status(d);
        d.expect_end();
        return status;
    } catch (const std::exception& e) {
        return protocol_failure(type, e.what());
    }
}

core::Status WorkerBackend::check_usable(const char* stage) const {
    core::Status status;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == core::RunState::Destroyed) {
            status = core::Status::error(core::ErrorCode::InvalidHandle,
                                         "engine instance was destroyed");
        }
    }
    if (status.ok()) {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (link_down_) {
            status = communication_failure("worker link is down");
        }
    }
    if (!status.ok()) {
        diagnostics_.emit(core::Severity::Error, kWorkerModule, stage, core::describe(status));
    }
    return status;
}

core::Status WorkerBackend::link_failure(MessageType type) {
    core::Status status = communication_failure(
        std::string("worker unreachable during ") + message_type_name(type));
    diagnostics_.emit(core::Severity::Error, kWorkerModule, message_type_name(type),
                      core::describe(status));
    return status;
}

core::Status WorkerBackend::protocol_failure(MessageType type, const std::string& detail) {
    core::Status status = communication_failure(
        std::string("malformed reply to ") + message_type_name(type) + ": " + detail);
    diagnostics_.emit(core::Severity::Error, kWorkerModule, message_type_name(type),
                      core::describe(status));
    return status;
}

void WorkerBackend::reader_loop() {
    while (auto msg = channel_.receive()) {
        switch (static_cast<MessageType>(msg->type)) {
            case MessageType::Reply: {
                std::lock_guard<std::mutex> lock(pending_mutex_);
                auto it = pending_.find(msg->request_id);
                if (it == pending_.end()) {
                    diagnostics_.emit(core::Severity::Warning, kWorkerModule, "reply",
                                      "reply to unknown request " +
                                          std::to_string(msg->request_id));
                    break;
                }
                it->second.set_value(std::move(*msg));
                pending_.erase(it);
                break;
            }
            case MessageType::Frame: {
                try {
                    ipc::Deserializer d(msg->payload);
                    StyleFrame frame = read_frame(d);
                    d.expect_end();
                    dispatch_loop_.post_task([this, frame = std::move(frame)]() { deliver(frame); });
                } catch (const std::exception& e) {
                    diagnostics_.emit(core::Severity::Error, kWorkerModule, "frame",
                                      std::string("malformed frame: ") + e.what());
                }
                break;
            }
            case MessageType::Diagnostic: {
                try {
                    ipc::Deserializer d(msg->payload);
                    core::DiagnosticEvent event = read_diagnostic(d);
                    d.expect_end();
                    diagnostics_.forward(event);
                } catch (const std::exception& e) {
                    diagnostics_.emit(core::Severity::Error, kWorkerModule, "diagnostic",
                                      std::string("malformed diagnostic: ") + e.what());
                }
                break;
            }
            default:
                diagnostics_.emit(core::Severity::Warning, kWorkerModule, "receive",
                                  "unexpected message type " + std::to_string(msg->type));
                break;
        }
    }
    fail_pending();
}

void WorkerBackend::fail_pending() {
    std::unordered_map<std::uint32_t, std::promise<std::optional<ipc::Message>>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        link_down_ = true;
        pending.swap(pending_);
    }
    for (auto& entry : pending) {
        entry.second.set_value(std::nullopt);
    }
}

// ---------------------------------------------------------------------------
// Frames
// ---------------------------------------------------------------------------

void WorkerBackend::deliver(const StyleFrame& frame) {
    FrameSink sink;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (aborted_ || state_ == core::RunState::Destroyed) {
            return;
        }
        sink = sink_;
    }
    if (!sink) {
        return;
    }

    std::string failure;
    try {
        sink(frame);
        return;
    } catch (const std::exception& e) {
        failure = std::string("frame sink threw: ") + e.what();
    } catch (...) {
        failure = "frame sink threw a non-standard exception";
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        aborted_ = true;
    }
    diagnostics_.emit(core::Severity::Error, "run_loop", "frame", failure);

    ipc::Serializer s;
    s.write_string(failure);
    core::Status status = call_status(MessageType::Abort, s.take_data());
    if (!status.ok()) {
        diagnostics_.emit(core::Severity::Warning, kWorkerModule, "abort", core::describe(status));
    }
}

void WorkerBackend::drain_dispatcher() {
    if (std::this_thread::get_id() == dispatcher_.get_id()) {
        return;
    }
    std::promise<void> drained;
    auto done = drained.get_future();
    dispatch_loop_.post_task([&drained]() { drained.set_value(); });
    done.wait();
}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

css::StylesheetResult WorkerBackend::add_stylesheet(std::string_view css) {
    css::StylesheetResult result;
    result.status = check_usable("add_stylesheet");
    if (!result.ok()) return result;

    ipc::Serializer s;
    s.write_string(css);
    auto reply = call(MessageType::AddStylesheet, s.take_data());
    if (!reply) {
        result.status = link_failure(MessageType::AddStylesheet);
        return result;
    }
    try {
        ipc::Deserializer d(reply->payload);
        result = read_stylesheet_result(d);
        d.expect_end();
    } catch (const std::exception& e) {
        result = css::StylesheetResult{};
        result.status = protocol_failure(MessageType::AddStylesheet, e.what());
    }
    return result;
}

core::Status WorkerBackend::create_node(dom::NodeId id, std::optional<std::string> text) {
    core::Status status = check_usable("create_node");
    if (!status.ok()) return status;

    ipc::Serializer s;
    s.write_u64(id);
    s.write_optional_string(text);
    return call_status(MessageType::CreateNode, s.take_data());
}

core::Status WorkerBackend::set_parent(dom::NodeId parent, dom::NodeId child) {
    core::Status status = check_usable("set_parent");
    if (!status.ok()) return status;

    ipc::Serializer s;
    s.write_u64(parent);
    s.write_u64(child);
    return call_status(MessageType::SetParent, s.take_data());
}

core::Status WorkerBackend::set_attribute(dom::NodeId node, const std::string& key,
                                          const std::string& value) {
    core::Status status = check_usable("set_attribute");
    if (!status.ok()) return status;

    ipc::Serializer s;
    s.write_u64(node);
    s.write_string(key);
    s.write_string(value);
    return call_status(MessageType::SetAttribute, s.take_data());
}

core::Status WorkerBackend::root_id() {
    core::Status status = check_usable("root_id");
    if (!status.ok()) return status;
    return call_status(MessageType::RootId);
}

StyleResult WorkerBackend::resolve_style(dom::NodeId node) {
    StyleResult result;
    result.status = check_usable("resolve_style");
    if (!result.ok()) return result;

    ipc::Serializer s;
    s.write_u64(node);
    auto reply = call(MessageType::ResolveStyle, s.take_data());
    if (!reply) {
        result.status = link_failure(MessageType::ResolveStyle);
        return result;
    }
    try {
        ipc::Deserializer d(reply->payload);
        result.status = read_status(d);
        result.style = read_resolved_style(d);
        d.expect_end();
    } catch (const std::exception& e) {
        result = StyleResult{};
        result.status = protocol_failure(MessageType::ResolveStyle, e.what());
    }
    return result;
}

core::Status WorkerBackend::set_frame_sink(FrameSink sink) {
    core::Status status = check_usable("set_frame_sink");
    if (!status.ok()) return status;

    std::lock_guard<std::mutex> lock(state_mutex_);
    sink_ = std::move(sink);
    return status;
}

core::Status WorkerBackend::run() {
    core::Status status = check_usable("run");
    if (!status.ok()) return status;

    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != core::RunState::Running) {
            state_ = core::RunState::Running;
            aborted_ = false;
            owner = true;
        }
    }

    status = call_status(MessageType::Run);
    if (!owner) {
        return status;
    }

    // Every frame of this run reaches the sink before run() returns.
    drain_dispatcher();

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == core::RunState::Running) {
        state_ = status.ok() ? core::RunState::Stopped : core::RunState::Destroyed;
    }
    return status;
}

core::Status WorkerBackend::request_stop() {
    core::Status status = check_usable("request_stop");
    if (!status.ok()) return status;
    return call_status(MessageType::RequestStop);
}

core::Status WorkerBackend::destroy() {
    core::Status status = check_usable("destroy");
    if (status.code == core::ErrorCode::InvalidHandle) {
        return status;
    }
    if (status.ok()) {
        status = call_status(MessageType::Destroy);
    }
    if (!status.ok()) {
        diagnostics_.emit(core::Severity::Warning, kWorkerModule, "destroy",
                          "releasing worker after failed destroy: " + core::describe(status));
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = core::RunState::Destroyed;
        sink_ = nullptr;
    }
    stop_worker();
    return core::Status::success();
}

core::RunState WorkerBackend::state() const {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (link_down_) {
            return core::RunState::Destroyed;
        }
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::vector<core::DiagnosticEvent> WorkerBackend::diagnostics() const {
    return diagnostics_.events();
}

// ---------------------------------------------------------------------------
// Worker process
// ---------------------------------------------------------------------------

void WorkerBackend::stop_worker() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (worker_stopped_) {
            return;
        }
        worker_stopped_ = true;
    }

    bool link_up = false;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        link_up = !link_down_;
    }
    if (link_up) {
        core::Status status = call_status(MessageType::Shutdown);
        if (!status.ok()) {
            diagnostics_.emit(core::Severity::Warning, kWorkerModule, "shutdown",
                              core::describe(status));
        }
    }

    channel_.shutdown();
    if (reader_.joinable()) {
        reader_.join();
    }
    reap_worker();
}

void WorkerBackend::reap_worker() {
    if (pid_ <= 0) {
        return;
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(core::config::kWorkerShutdownTimeoutMs);
    int wstatus = 0;
    while (true) {
        pid_t result = ::waitpid(pid_, &wstatus, WNOHANG);
        if (result == pid_) {
            if (WIFEXITED(wstatus) && WEXITSTATUS(wstatus) != 0) {
                diagnostics_.emit(core::Severity::Warning, kWorkerModule, "exit",
                                  "worker exited with status " +
                                      std::to_string(WEXITSTATUS(wstatus)));
            } else if (WIFSIGNALED(wstatus)) {
                diagnostics_.emit(core::Severity::Warning, kWorkerModule, "exit",
                                  "worker killed by signal " + std::to_string(WTERMSIG(wstatus)));
            }
            break;
        }
        if (result < 0 && errno != EINTR) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            diagnostics_.emit(core::Severity::Warning, kWorkerModule, "exit",
                              "worker did not exit in time; killing it");
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, &wstatus, 0);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    pid_ = -1;
}

}  // namespace lolite::engine
