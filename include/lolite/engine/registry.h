#pragma once

#include <lolite/core/config.h>
#include <lolite/core/diagnostics.h>
#include <lolite/core/error.h>
#include <lolite/core/lifecycle.h>
#include <lolite/css/style/stylesheet_store.h>
#include <lolite/dom/node.h>
#include <lolite/engine/backend.h>
#include <lolite/engine/frame.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lolite::engine {

using Handle = std::uint64_t;

// Maps opaque handles to engine instances, in this process or in a worker.
//
// The narrow calls return sentinels (0 or -1) like the C binding they back;
// the outcome of the most recent call is kept in last_error(), globally
// and per handle. Handles are never reused. Calls on different handles,
// and calls on a handle whose run() is active, may come from any thread.
class Registry {
public:
    explicit Registry(core::EngineConfig config = core::EngineConfig::from_environment());
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // 0 on failure. `use_same_process == false` starts a worker process.
    Handle init(bool use_same_process);

    css::StylesheetResult add_stylesheet(Handle handle, std::string_view css);

    // Returns `id`, or 0 on failure.
    dom::NodeId create_node(Handle handle, dom::NodeId id,
                            std::optional<std::string> text = std::nullopt);
    core::Status set_parent(Handle handle, dom::NodeId parent, dom::NodeId child);
    core::Status set_attribute(Handle handle, dom::NodeId node, const std::string& key,
                               const std::string& value);

    // Always 0, also for an invalid handle; last_error() tells them apart.
    dom::NodeId root_id(Handle handle);

    StyleResult resolve_style(Handle handle, dom::NodeId node);

    core::Status set_frame_sink(Handle handle, FrameSink sink);
    core::Status request_stop(Handle handle);

    // 0 on an orderly stop, -1 otherwise. A fatal run drops the handle.
    int run(Handle handle);

    // 0, or -1 for an unknown handle.
    int destroy(Handle handle);

    core::RunState state(Handle handle) const;

    core::Status last_error() const;
    core::Status last_error(Handle handle) const;

    // Copy of the instance's diagnostic history; empty for unknown handles.
    std::vector<core::DiagnosticEvent> diagnostics(Handle handle) const;

    // Registry-level events such as calls on unknown handles.
    const core::DiagnosticEmitter& registry_diagnostics() const { return diagnostics_; }

    bool contains(Handle handle) const;
    size_t size() const;

    const core::EngineConfig& config() const { return config_; }

private:
    std::shared_ptr<EngineBackend> lookup(Handle handle) const;
    core::Status record(Handle handle, core::Status status);
    core::Status invalid_handle(Handle handle, const char* operation);

    core::EngineConfig config_;
    core::DiagnosticEmitter diagnostics_;
    std::atomic<Handle> next_handle_{1};

    mutable std::mutex mutex_;
    std::unordered_map<Handle, std::shared_ptr<EngineBackend>> instances_;
    std::unordered_map<Handle, core::Status> last_errors_;
    core::Status last_error_;
};

}  // namespace lolite::engine
