#include <lolite/engine/direct_backend.h>

#include <utility>

namespace lolite::engine {

DirectBackend::DirectBackend(const core::EngineConfig& config, std::uint64_t handle)
    : engine_(config, handle) {}

css::StylesheetResult DirectBackend::add_stylesheet(std::string_view css) {
    return engine_.add_stylesheet(css);
}

core::Status DirectBackend::create_node(dom::NodeId id, std::optional<std::string> text) {
    return engine_.create_node(id, std::move(text));
}

core::Status DirectBackend::set_parent(dom::NodeId parent, dom::NodeId child) {
    return engine_.set_parent(parent, child);
}

core::Status DirectBackend::set_attribute(dom::NodeId node, const std::string& key,
                                          const std::string& value) {
    return engine_.set_attribute(node, key, value);
}

core::Status DirectBackend::root_id() {
    return engine_.root_id();
}

StyleResult DirectBackend::resolve_style(dom::NodeId node) {
    return engine_.resolve_style(node);
}

core::Status DirectBackend::set_frame_sink(FrameSink sink) {
    if (engine_.state() == core::RunState::Destroyed) {
        return core::Status::error(core::ErrorCode::InvalidHandle, "engine instance was destroyed");
    }
    engine_.set_frame_sink(std::move(sink));
    return core::Status::success();
}

core::Status DirectBackend::run() {
    return engine_.run();
}

core::Status DirectBackend::request_stop() {
    return engine_.request_stop();
}

core::Status DirectBackend::destroy() {
    return engine_.shutdown();
}

core::RunState DirectBackend::state() const {
    return engine_.state();
}

std::vector<core::DiagnosticEvent> DirectBackend::diagnostics() const {
    return engine_.diagnostics().events();
}

}  // namespace lolite::engine
