#pragma once

#include <lolite/engine/backend.h>
#include <lolite/engine/engine.h>

namespace lolite::engine {

// In-process backend: operations run on the calling thread.
class DirectBackend : public EngineBackend {
public:
    DirectBackend(const core::EngineConfig& config, std::uint64_t handle);

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

private:
    Engine engine_;
};

}  // namespace lolite::engine
