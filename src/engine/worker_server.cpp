#include <lolite/engine/worker_server.h>
#include <lolite/engine/protocol.h>

#include <stdexcept>
#include <utility>

namespace lolite::engine {

namespace {

constexpr const char* kWorkerModule = "worker";

std::uint32_t type_id(MessageType type) {
    return static_cast<std::uint32_t>(type);
}

}  // namespace

WorkerServer::WorkerServer(ipc::MessagePipe pipe)
    : channel_(std::move(pipe)) {
    register_handlers();
}

WorkerServer::~WorkerServer() {
    stop_engine();
}

void WorkerServer::reply(std::uint32_t request_id, std::vector<std::uint8_t> payload) {
    // A failed send means the host is gone; serve() notices on its next read.
    channel_.send(make_message(MessageType::Reply, request_id, std::move(payload)));
}

void WorkerServer::reply_status(std::uint32_t request_id, const core::Status& status) {
    ipc::Serializer s;
    write_status(s, status);
    reply(request_id, s.take_data());
}

bool WorkerServer::require_engine(const ipc::Message& msg) {
    if (engine_) {
        return true;
    }
    reply_status(msg.request_id,
                 core::Status::error(core::ErrorCode::InvalidHandle,
                                     "worker has no engine instance"));
    return false;
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

void WorkerServer::register_handlers() {
    channel_.on(type_id(MessageType::Hello), [this](const ipc::Message& msg) { on_hello(msg); });
    channel_.on(type_id(MessageType::Run), [this](const ipc::Message& msg) { on_run(msg); });
    channel_.on(type_id(MessageType::Destroy), [this](const ipc::Message& msg) { on_destroy(msg); });
    channel_.on(type_id(MessageType::Shutdown), [this](const ipc::Message& msg) { on_shutdown(msg); });

    channel_.on(type_id(MessageType::AddStylesheet), [this](const ipc::Message& msg) {
        if (!require_engine(msg)) return;
        ipc::Deserializer d(msg.payload);
        std::string css = d.read_string();
        d.expect_end();
        ipc::Serializer s;
        write_stylesheet_result(s, engine_->add_stylesheet(css));
        reply(msg.request_id, s.take_data());
    });

    channel_.on(type_id(MessageType::CreateNode), [this](const ipc::Message& msg) {
        if (!require_engine(msg)) return;
        ipc::Deserializer d(msg.payload);
        dom::NodeId id = d.read_u64();
        std::optional<std::string> text = d.read_optional_string();
        d.expect_end();
        reply_status(msg.request_id, engine_->create_node(id, std::move(text)));
    });

    channel_.on(type_id(MessageType::SetParent), [this](const ipc::Message& msg) {
        if (!require_engine(msg)) return;
        ipc::Deserializer d(msg.payload);
        dom::NodeId parent = d.read_u64();
        dom::NodeId child = d.read_u64();
        d.expect_end();
        reply_status(msg.request_id, engine_->set_parent(parent, child));
    });

    channel_.on(type_id(MessageType::SetAttribute), [this](const ipc::Message& msg) {
        if (!require_engine(msg)) return;
        ipc::Deserializer d(msg.payload);
        dom::NodeId node = d.read_u64();
        std::string key = d.read_string();
        std::string value = d.read_string();
        d.expect_end();
        reply_status(msg.request_id, engine_->set_attribute(node, key, value));
    });

    channel_.on(type_id(MessageType::RootId), [this](const ipc::Message& msg) {
        if (!require_engine(msg)) return;
        reply_status(msg.request_id, engine_->root_id());
    });

    channel_.on(type_id(MessageType::ResolveStyle), [this](const ipc::Message& msg) {
        if (!require_engine(msg)) return;
        ipc::Deserializer d(msg.payload);
        dom::NodeId node = d.read_u64();
        d.expect_end();
        StyleResult result = engine_->resolve_style(node);
        ipc::Serializer s;
        write_status(s, result.status);
        write_resolved_style(s, result.style);
        reply(msg.request_id, s.take_data());
    });

    channel_.on(type_id(MessageType::RequestStop), [this](const ipc::Message& msg) {
        if (!require_engine(msg)) return;
        reply_status(msg.request_id, engine_->request_stop());
    });

    channel_.on(type_id(MessageType::Abort), [this](const ipc::Message& msg) {
        if (!require_engine(msg)) return;
        ipc::Deserializer d(msg.payload);
        std::string reason = d.read_string();
        d.expect_end();
        reply_status(msg.request_id, engine_->abort(reason));
    });
}

void WorkerServer::on_hello(const ipc::Message& msg) {
    ipc::Deserializer d(msg.payload);
    HelloRequest hello = read_hello(d);
    d.expect_end();

    if (engine_) {
        reply_status(msg.request_id,
                     core::Status::error(core::ErrorCode::AlreadyRunning,
                                         "worker already serves an engine instance"));
        return;
    }

    engine_ = std::make_unique<Engine>(hello.to_config(), hello.handle);
    engine_->diagnostics().add_observer([this](const core::DiagnosticEvent& event) {
        ipc::Serializer s;
        write_diagnostic(s, event);
        channel_.send(make_message(MessageType::Diagnostic, 0, s.take_data()));
    });
    engine_->set_frame_sink([this](const StyleFrame& frame) {
        ipc::Serializer s;
        write_frame(s, frame);
        if (!channel_.send(make_message(MessageType::Frame, 0, s.take_data()))) {
            throw std::runtime_error("host link closed");
        }
    });
    engine_->diagnostics().emit(core::Severity::Info, kWorkerModule, "hello",
                                "worker engine ready");
    reply_status(msg.request_id, core::Status::success());
}

void WorkerServer::on_run(const ipc::Message& msg) {
    if (!require_engine(msg)) return;

    if (run_active_.exchange(true)) {
        core::Status status = core::Status::error(core::ErrorCode::AlreadyRunning,
                                                  "run loop is already active");
        engine_->diagnostics().emit(core::Severity::Error, "run_loop", "run",
                                    core::describe(status));
        reply_status(msg.request_id, status);
        return;
    }
    if (run_thread_.joinable()) {
        run_thread_.join();
    }

    std::uint32_t request_id = msg.request_id;
    run_thread_ = std::thread([this, request_id]() {
        core::Status status = engine_->run();
        reply_status(request_id, status);
        run_active_.store(false);
    });
}

void WorkerServer::on_destroy(const ipc::Message& msg) {
    if (!require_engine(msg)) return;

    core::Status status = engine_->shutdown();
    // The Run reply goes out before the Destroy reply.
    if (run_thread_.joinable()) {
        run_thread_.join();
    }
    reply_status(msg.request_id, status);
}

void WorkerServer::on_shutdown(const ipc::Message& msg) {
    stop_engine();
    shutdown_requested_ = true;
    reply_status(msg.request_id, core::Status::success());
}

// ---------------------------------------------------------------------------
// Serve loop
// ---------------------------------------------------------------------------

void WorkerServer::handle(const ipc::Message& msg) {
    try {
        if (!channel_.dispatch(msg)) {
            reply_status(msg.request_id,
                         communication_failure("unsupported message type " +
                                               std::to_string(msg.type)));
        }
    } catch (const std::exception& e) {
        reply_status(msg.request_id,
                     communication_failure(std::string("malformed ") +
                                           message_type_name(static_cast<MessageType>(msg.type)) +
                                           " request: " + e.what()));
    }
}

int WorkerServer::serve() {
    while (!shutdown_requested_) {
        auto msg = channel_.receive();
        if (!msg) {
            stop_engine();
            return 1;
        }
        handle(*msg);
    }
    return 0;
}

void WorkerServer::stop_engine() {
    if (engine_ && engine_->state() != core::RunState::Destroyed) {
        core::Status status = engine_->shutdown();
        if (!status.ok()) {
            engine_->diagnostics().emit(core::Severity::Warning, kWorkerModule, "shutdown",
                                        core::describe(status));
        }
    }
    if (run_thread_.joinable()) {
        run_thread_.join();
    }
}

int run_worker(int fd) {
    WorkerServer server{ipc::MessagePipe(fd)};
    return server.serve();
}

}  // namespace lolite::engine
