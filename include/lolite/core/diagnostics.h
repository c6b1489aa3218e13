#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace lolite::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Per-instance log channel. Safe to emit from several threads; observers run
// on the emitting thread, outside the emitter's lock.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t capacity = 1024);

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    // Re-emit an event produced elsewhere (e.g. forwarded from a worker),
    // keeping its severity, module and stage.
    void forward(const DiagnosticEvent& event);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear();
    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    void record(DiagnosticEvent event);
    std::vector<DiagnosticEvent> select(
        const std::function<bool(const DiagnosticEvent&)>& keep) const;

    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;  // oldest dropped first
    std::vector<DiagnosticObserver> observers_;
    std::size_t capacity_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

// Observer printing format_diagnostic() lines to stderr.
DiagnosticObserver stderr_observer(Severity min);

}  // namespace lolite::core
