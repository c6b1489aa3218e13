#include <lolite/engine/engine.h>

#include <utility>
#include <vector>

namespace lolite::engine {

namespace {

constexpr const char* kDocumentModule = "document";
constexpr const char* kStylesheetModule = "stylesheet";
constexpr const char* kCascadeModule = "cascade";
constexpr const char* kRunLoopModule = "run_loop";

}  // namespace

Engine::Engine(core::EngineConfig config, std::uint64_t correlation_id)
    : config_(std::move(config)),
      diagnostics_(config_.max_diagnostic_events),
      content_(std::make_unique<Content>()) {
    diagnostics_.set_correlation_id(correlation_id);
    if (config_.log_to_stderr) {
        diagnostics_.add_observer(core::stderr_observer(config_.min_severity));
    }
}

Engine::~Engine() = default;

// ---------------------------------------------------------------------------
// Helpers (mutex_ held)
// ---------------------------------------------------------------------------

core::Status Engine::check_alive(const char* module, const char* stage) const {
    if (state_ == core::RunState::Destroyed || !content_) {
        return report(core::Status::error(core::ErrorCode::InvalidHandle,
                                          "engine instance was destroyed"),
                      module, stage);
    }
    return core::Status::success();
}

core::Status Engine::report(core::Status status, const char* module, const char* stage) const {
    if (!status.ok()) {
        diagnostics_.emit(core::Severity::Error, module, stage, core::describe(status));
    }
    return status;
}

void Engine::transition_to(core::RunState next) {
    if (state_ == next || !core::is_valid_transition(state_, next)) {
        return;
    }
    diagnostics_.emit(core::Severity::Info, kRunLoopModule, "state",
                      std::string(core::run_state_name(state_)) + " -> " +
                          core::run_state_name(next));
    state_ = next;
    state_cv_.notify_all();
}

// Subtrees already dropped since the last resolve or frame are not walked
// again; every node below an entry of invalidated_ is uncached and pending.
void Engine::invalidate_subtree(dom::NodeId id) {
    const dom::Node* top = content_->document.find(id);
    if (top == nullptr || invalidated_.count(id) > 0) {
        return;
    }

    std::vector<const dom::Node*> work{top};
    while (!work.empty()) {
        const dom::Node* node = work.back();
        work.pop_back();
        content_->resolver.invalidate(node->id());
        pending_.insert(node->id());
        node->for_each_child([&](const dom::Node& child) {
            if (invalidated_.count(child.id()) == 0) {
                work.push_back(&child);
            }
        });
    }
    invalidated_.insert(id);
}

// Sibling combinators and structural pseudo-classes make a node's match
// depend on its siblings, so a change is widened to the parent's subtree.
void Engine::invalidate_around(dom::NodeId id) {
    auto parent = content_->document.parent_of(id);
    invalidate_subtree(parent ? *parent : id);
}

void Engine::release_content() {
    content_.reset();
    pending_.clear();
    invalidated_.clear();
    sink_ = nullptr;
}

// ---------------------------------------------------------------------------
// Document and stylesheet operations
// ---------------------------------------------------------------------------

css::StylesheetResult Engine::add_stylesheet(std::string_view css) {
    std::lock_guard<std::mutex> lock(mutex_);
    css::StylesheetResult result;
    result.status = check_alive(kStylesheetModule, "add");
    if (!result.ok()) {
        return result;
    }

    result = content_->store.add(css);
    for (const auto& issue : result.issues) {
        diagnostics_.emit(core::Severity::Warning, kStylesheetModule, "parse",
                          std::to_string(issue.line) + ":" + std::to_string(issue.column) +
                              ": " + issue.message);
    }
    for (const auto& name : result.ignored_at_rules) {
        diagnostics_.emit(core::Severity::Info, kStylesheetModule, "parse",
                          "ignored @" + name + " rule");
    }
    if (!result.ok()) {
        report(result.status, kStylesheetModule, "add");
        return result;
    }

    content_->resolver.invalidate_all();
    publish_all_ = true;
    diagnostics_.emit(core::Severity::Info, kStylesheetModule, "add",
                      "appended " + std::to_string(result.rules_added) + " rule(s), " +
                          std::to_string(content_->store.rule_count()) + " total");
    return result;
}

core::Status Engine::create_node(dom::NodeId id, std::optional<std::string> text) {
    std::lock_guard<std::mutex> lock(mutex_);
    core::Status status = check_alive(kDocumentModule, "create_node");
    if (!status.ok()) return status;

    status = content_->document.create_node(id, std::move(text));
    if (status.ok()) {
        pending_.insert(id);
    }
    return report(std::move(status), kDocumentModule, "create_node");
}

core::Status Engine::set_parent(dom::NodeId parent, dom::NodeId child) {
    std::lock_guard<std::mutex> lock(mutex_);
    core::Status status = check_alive(kDocumentModule, "set_parent");
    if (!status.ok()) return status;

    auto old_parent = content_->document.parent_of(child);
    status = content_->document.set_parent(parent, child);
    if (!status.ok()) {
        return report(std::move(status), kDocumentModule, "set_parent");
    }

    // Gaining or losing a child flips a parent's :empty, which its own
    // siblings can observe through + and ~.
    invalidate_subtree(child);
    if (old_parent) {
        invalidate_around(*old_parent);
    }
    invalidate_around(parent);
    return status;
}

core::Status Engine::set_attribute(dom::NodeId node, const std::string& key,
                                   const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    core::Status status = check_alive(kDocumentModule, "set_attribute");
    if (!status.ok()) return status;

    status = content_->document.set_attribute(node, key, value);
    if (!status.ok()) {
        return report(std::move(status), kDocumentModule, "set_attribute");
    }
    invalidate_around(node);
    return status;
}

core::Status Engine::root_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_alive(kDocumentModule, "root_id");
}

StyleResult Engine::resolve_style(dom::NodeId node) {
    std::lock_guard<std::mutex> lock(mutex_);
    StyleResult result;
    result.status = check_alive(kCascadeModule, "resolve");
    if (!result.ok()) return result;

    if (!content_->document.contains(node)) {
        result.status = report(core::Status::error(core::ErrorCode::UnknownNode,
                                                   "unknown node " + std::to_string(node)),
                               kCascadeModule, "resolve");
        return result;
    }

    content_->tree.sync(content_->document);
    invalidated_.clear();
    const css::ElementView* view = content_->tree.find(node);
    if (view == nullptr) {
        result.status = report(core::Status::error(core::ErrorCode::Fatal,
                                                   "no style view for node " + std::to_string(node)),
                               kCascadeModule, "resolve");
        return result;
    }
    result.style = content_->resolver.resolve_cached(*view);
    return result;
}

void Engine::set_frame_sink(FrameSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

// ---------------------------------------------------------------------------
// Run loop
// ---------------------------------------------------------------------------

core::Status Engine::run() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        core::Status status = check_alive(kRunLoopModule, "run");
        if (!status.ok()) return status;
        if (state_ == core::RunState::Running) {
            return report(core::Status::error(core::ErrorCode::AlreadyRunning,
                                              "run loop is already active"),
                          kRunLoopModule, "run");
        }

        stop_requested_ = false;
        destroy_requested_ = false;
        fatal_.reset();
        publish_all_ = true;
        run_thread_ = std::this_thread::get_id();
        loop_.reset();
        transition_to(core::RunState::Running);
    }

    loop_.post_task([this]() { tick(); });
    loop_.run();

    std::lock_guard<std::mutex> lock(mutex_);
    run_thread_ = std::thread::id();
    core::Status result;
    if (fatal_) {
        result = core::Status::error(core::ErrorCode::Fatal, *fatal_);
        report(result, kRunLoopModule, "run");
        transition_to(core::RunState::Destroyed);
        release_content();
    } else if (destroy_requested_) {
        transition_to(core::RunState::Destroyed);
        release_content();
    } else {
        transition_to(core::RunState::Stopped);
    }
    loop_.reset();
    return result;
}

StyleFrame Engine::collect_frame() {
    StyleFrame frame;
    content_->tree.sync(content_->document);

    // Pre-order over the attached tree; detached nodes are never published.
    for (dom::NodeId id : content_->document.subtree_ids(content_->document.root_id())) {
        if (!publish_all_ && pending_.count(id) == 0) {
            continue;
        }
        const css::ElementView* view = content_->tree.find(id);
        if (view == nullptr) {
            continue;
        }
        frame.styles.emplace_back(id, content_->resolver.resolve_cached(*view));
    }

    pending_.clear();
    invalidated_.clear();
    publish_all_ = false;
    if (!frame.styles.empty()) {
        frame.sequence = ++frame_sequence_;
    }
    return frame;
}

void Engine::tick() {
    StyleFrame frame;
    FrameSink sink;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_ || fatal_ || !content_) {
            return;
        }
        frame = collect_frame();
        sink = sink_;
    } catch (const std::exception& e) {
        fail(std::string("style recomputation failed: ") + e.what());
        return;
    }

    if (!frame.styles.empty()) {
        diagnostics_.emit(core::Severity::Info, kRunLoopModule, "frame",
                          "frame " + std::to_string(frame.sequence) + " with " +
                              std::to_string(frame.styles.size()) + " node(s)");
        if (sink) {
            try {
                sink(frame);
            } catch (const std::exception& e) {
                fail(std::string("frame sink threw: ") + e.what());
                return;
            } catch (...) {
                fail("frame sink threw a non-standard exception");
                return;
            }
        }
    }

    loop_.post_delayed_task([this]() { tick(); }, config_.frame_debounce);
}

void Engine::fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fatal_) {
            fatal_ = reason;
        }
    }
    loop_.quit();
}

core::Status Engine::request_stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != core::RunState::Running) {
        return report(core::Status::error(core::ErrorCode::NotRunning,
                                          std::string("run loop is ") +
                                              core::run_state_name(state_)),
                      kRunLoopModule, "stop");
    }
    if (!stop_requested_) {
        stop_requested_ = true;
        diagnostics_.emit(core::Severity::Info, kRunLoopModule, "stop", "stop requested");
    }
    loop_.quit();
    return core::Status::success();
}

core::Status Engine::abort(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != core::RunState::Running) {
            return report(core::Status::error(core::ErrorCode::NotRunning,
                                              std::string("run loop is ") +
                                                  core::run_state_name(state_)),
                          kRunLoopModule, "abort");
        }
    }
    fail(reason);
    return core::Status::success();
}

core::Status Engine::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    core::Status status = check_alive(kRunLoopModule, "destroy");
    if (!status.ok()) return status;

    if (state_ == core::RunState::Running) {
        destroy_requested_ = true;
        stop_requested_ = true;
        loop_.quit();
        if (run_thread_ == std::this_thread::get_id()) {
            diagnostics_.emit(core::Severity::Info, kRunLoopModule, "destroy",
                              "destroy deferred until the run loop exits");
            return core::Status::success();
        }
        state_cv_.wait(lock, [this]() { return state_ != core::RunState::Running; });
        if (state_ == core::RunState::Destroyed) {
            return core::Status::success();
        }
    }

    transition_to(core::RunState::Destroyed);
    release_content();
    return core::Status::success();
}

core::RunState Engine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint64_t Engine::frames_published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frame_sequence_;
}

}  // namespace lolite::engine
