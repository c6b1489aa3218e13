#pragma once

#include <lolite/core/config.h>
#include <lolite/core/diagnostics.h>
#include <lolite/core/error.h>
#include <lolite/core/lifecycle.h>
#include <lolite/css/style/style_resolver.h>
#include <lolite/css/style/stylesheet_store.h>
#include <lolite/dom/document.h>
#include <lolite/engine/frame.h>
#include <lolite/engine/style_tree.h>
#include <lolite/platform/event_loop.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_set>

namespace lolite::engine {

// One styling engine: a document, its stylesheet store and a memoized
// cascade, driven by a debounced run loop.
//
// Every method may be called from any thread. Mutations made while run()
// is active are picked up by the next tick. Diagnostic observers must not
// call back into the engine.
class Engine {
public:
    explicit Engine(core::EngineConfig config = {}, std::uint64_t correlation_id = 0);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    css::StylesheetResult add_stylesheet(std::string_view css);

    core::Status create_node(dom::NodeId id, std::optional<std::string> text = std::nullopt);
    core::Status set_parent(dom::NodeId parent, dom::NodeId child);
    core::Status set_attribute(dom::NodeId node, const std::string& key, const std::string& value);
    // The root id is always dom::kRootNodeId; this reports whether the
    // engine can still serve it.
    core::Status root_id() const;

    StyleResult resolve_style(dom::NodeId node);

    void set_frame_sink(FrameSink sink);

    // Blocks until request_stop(), shutdown() or a fatal error. Returns
    // success on an orderly stop and Fatal when the loop failed; in that
    // case the engine is destroyed.
    core::Status run();

    // NotRunning unless run() is active.
    core::Status request_stop();

    // Makes the active loop fail as if its frame sink had thrown.
    core::Status abort(const std::string& reason);

    // Stops the loop and releases the document and store. From another
    // thread this waits for the loop to exit; from inside the loop the
    // release happens as run() returns.
    core::Status shutdown();

    core::RunState state() const;
    std::uint64_t frames_published() const;

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

private:
    // Everything released by shutdown().
    struct Content {
        dom::Document document;
        css::StylesheetStore store;
        css::StyleResolver resolver{store};
        StyleTree tree;
    };

    // All helpers below expect mutex_ to be held.
    core::Status check_alive(const char* module, const char* stage) const;
    core::Status report(core::Status status, const char* module, const char* stage) const;
    void transition_to(core::RunState next);
    void invalidate_subtree(dom::NodeId id);
    void invalidate_around(dom::NodeId id);
    StyleFrame collect_frame();
    void release_content();

    void tick();
    void fail(const std::string& reason);

    core::EngineConfig config_;
    mutable core::DiagnosticEmitter diagnostics_;
    platform::EventLoop loop_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    std::unique_ptr<Content> content_;
    core::RunState state_ = core::RunState::Idle;
    FrameSink sink_;

    std::set<dom::NodeId> pending_;  // nodes to republish
    std::unordered_set<dom::NodeId> invalidated_;  // subtree tops dropped since last resolve
    bool publish_all_ = true;
    std::uint64_t frame_sequence_ = 0;

    bool stop_requested_ = false;
    bool destroy_requested_ = false;
    std::optional<std::string> fatal_;
    std::thread::id run_thread_;
};

}  // namespace lolite::engine
