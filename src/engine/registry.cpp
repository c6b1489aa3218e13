#include <lolite/engine/registry.h>
#include <lolite/engine/direct_backend.h>
#include <lolite/engine/worker_backend.h>

#include <utility>

namespace lolite::engine {

namespace {

constexpr const char* kRegistryModule = "registry";

}  // namespace

Registry::Registry(core::EngineConfig config)
    : config_(std::move(config)),
      diagnostics_(config_.max_diagnostic_events) {
    if (config_.log_to_stderr) {
        diagnostics_.add_observer(core::stderr_observer(config_.min_severity));
    }
}

Registry::~Registry() {
    std::unordered_map<Handle, std::shared_ptr<EngineBackend>> instances;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances.swap(instances_);
    }
    for (auto& [handle, backend] : instances) {
        core::Status status = backend->destroy();
        if (!status.ok()) {
            diagnostics_.emit(core::Severity::Warning, kRegistryModule, "teardown",
                              "handle " + std::to_string(handle) + ": " + core::describe(status));
        }
    }
}

// ---------------------------------------------------------------------------
// Bookkeeping
// ---------------------------------------------------------------------------

std::shared_ptr<EngineBackend> Registry::lookup(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(handle);
    return it == instances_.end() ? nullptr : it->second;
}

core::Status Registry::record(Handle handle, core::Status status) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = status;
    if (handle != 0 && handle < next_handle_.load()) {
        last_errors_[handle] = status;
    }
    return status;
}

core::Status Registry::invalid_handle(Handle handle, const char* operation) {
    core::Status status = core::Status::error(
        core::ErrorCode::InvalidHandle, "unknown or destroyed handle " + std::to_string(handle));
    diagnostics_.emit(core::Severity::Error, kRegistryModule, operation, core::describe(status));
    return record(handle, std::move(status));
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

Handle Registry::init(bool use_same_process) {
    Handle handle = next_handle_.fetch_add(1);

    std::shared_ptr<EngineBackend> backend;
    core::Status status;
    if (use_same_process) {
        backend = std::make_shared<DirectBackend>(config_, handle);
    } else {
        backend = WorkerBackend::spawn(config_, handle, status);
    }

    if (!backend) {
        diagnostics_.emit(core::Severity::Error, kRegistryModule, "init",
                          "worker start failed: " + core::describe(status));
        record(handle, std::move(status));
        return 0;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances_.emplace(handle, std::move(backend));
    }
    diagnostics_.emit(core::Severity::Info, kRegistryModule, "init",
                      "handle " + std::to_string(handle) +
                          (use_same_process ? " in-process" : " in worker"));
    record(handle, core::Status::success());
    return handle;
}

int Registry::run(Handle handle) {
    auto backend = lookup(handle);
    if (!backend) {
        invalid_handle(handle, "run");
        return -1;
    }

    core::Status status = record(handle, backend->run());
    if (status.ok()) {
        return 0;
    }

    if (backend->state() == core::RunState::Destroyed) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(handle);
        if (it != instances_.end() && it->second == backend) {
            instances_.erase(it);
            diagnostics_.emit(core::Severity::Error, kRegistryModule, "run",
                              "handle " + std::to_string(handle) + " dropped: " +
                                  core::describe(status));
        }
    }
    return -1;
}

int Registry::destroy(Handle handle) {
    std::shared_ptr<EngineBackend> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instances_.find(handle);
        if (it != instances_.end()) {
            backend = std::move(it->second);
            instances_.erase(it);
        }
    }
    if (!backend) {
        invalid_handle(handle, "destroy");
        return -1;
    }

    core::Status status = record(handle, backend->destroy());
    if (status.ok()) {
        diagnostics_.emit(core::Severity::Info, kRegistryModule, "destroy",
                          "handle " + std::to_string(handle) + " released");
    }
    return status.ok() ? 0 : -1;
}

core::Status Registry::request_stop(Handle handle) {
    auto backend = lookup(handle);
    if (!backend) return invalid_handle(handle, "request_stop");
    return record(handle, backend->request_stop());
}

core::Status Registry::set_frame_sink(Handle handle, FrameSink sink) {
    auto backend = lookup(handle);
    if (!backend) return invalid_handle(handle, "set_frame_sink");
    return record(handle, backend->set_frame_sink(std::move(sink)));
}

// ---------------------------------------------------------------------------
// Document, stylesheet and cascade
// ---------------------------------------------------------------------------

css::StylesheetResult Registry::add_stylesheet(Handle handle, std::string_view css) {
    auto backend = lookup(handle);
    if (!backend) {
        css::StylesheetResult result;
        result.status = invalid_handle(handle, "add_stylesheet");
        return result;
    }
    css::StylesheetResult result = backend->add_stylesheet(css);
    record(handle, result.status);
    return result;
}

dom::NodeId Registry::create_node(Handle handle, dom::NodeId id,
                                  std::optional<std::string> text) {
    auto backend = lookup(handle);
    if (!backend) {
        invalid_handle(handle, "create_node");
        return 0;
    }
    core::Status status = record(handle, backend->create_node(id, std::move(text)));
    return status.ok() ? id : 0;
}

core::Status Registry::set_parent(Handle handle, dom::NodeId parent, dom::NodeId child) {
    auto backend = lookup(handle);
    if (!backend) return invalid_handle(handle, "set_parent");
    return record(handle, backend->set_parent(parent, child));
}

core::Status Registry::set_attribute(Handle handle, dom::NodeId node, const std::string& key,
                                     const std::string& value) {
    auto backend = lookup(handle);
    if (!backend) return invalid_handle(handle, "set_attribute");
    return record(handle, backend->set_attribute(node, key, value));
}

dom::NodeId Registry::root_id(Handle handle) {
    auto backend = lookup(handle);
    if (!backend) {
        invalid_handle(handle, "root_id");
        return 0;
    }
    record(handle, backend->root_id());
    return dom::kRootNodeId;
}

StyleResult Registry::resolve_style(Handle handle, dom::NodeId node) {
    auto backend = lookup(handle);
    if (!backend) {
        StyleResult result;
        result.status = invalid_handle(handle, "resolve_style");
        return result;
    }
    StyleResult result = backend->resolve_style(node);
    record(handle, result.status);
    return result;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

core::RunState Registry::state(Handle handle) const {
    auto backend = lookup(handle);
    return backend ? backend->state() : core::RunState::Destroyed;
}

core::Status Registry::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

core::Status Registry::last_error(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_errors_.find(handle);
    if (it == last_errors_.end()) {
        return core::Status::error(core::ErrorCode::InvalidHandle,
                                   "no call recorded for handle " + std::to_string(handle));
    }
    return it->second;
}

std::vector<core::DiagnosticEvent> Registry::diagnostics(Handle handle) const {
    auto backend = lookup(handle);
    return backend ? backend->diagnostics() : std::vector<core::DiagnosticEvent>{};
}

bool Registry::contains(Handle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.count(handle) > 0;
}

size_t Registry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

}  // namespace lolite::engine
