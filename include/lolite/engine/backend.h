#pragma once

#include <lolite/core/diagnostics.h>
#include <lolite/core/error.h>
#include <lolite/core/lifecycle.h>
#include <lolite/css/style/stylesheet_store.h>
#include <lolite/dom/node.h>
#include <lolite/engine/frame.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lolite::engine {

// The operation set behind a registry handle. DirectBackend serves it from
// an Engine in this process, WorkerBackend proxies it to a worker process.
// Both report the same error codes in the same order.
class EngineBackend {
public:
    virtual ~EngineBackend() = default;

    virtual css::StylesheetResult add_stylesheet(std::string_view css) = 0;
    virtual core::Status create_node(dom::NodeId id, std::optional<std::string> text) = 0;
    virtual core::Status set_parent(dom::NodeId parent, dom::NodeId child) = 0;
    virtual core::Status set_attribute(dom::NodeId node, const std::string& key,
                                       const std::string& value) = 0;
    virtual core::Status root_id() = 0;
    virtual StyleResult resolve_style(dom::NodeId node) = 0;

    virtual core::Status set_frame_sink(FrameSink sink) = 0;
    virtual core::Status run() = 0;
    virtual core::Status request_stop() = 0;
    virtual core::Status destroy() = 0;

    virtual core::RunState state() const = 0;
    virtual std::vector<core::DiagnosticEvent> diagnostics() const = 0;
};

}  // namespace lolite::engine
