#include <lolite/core/diagnostics.h>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <sstream>

namespace lolite::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream line;
    line << '[' << severity_name(event.severity) << ']';
    if (!event.module.empty()) line << ' ' << event.module;
    if (!event.stage.empty()) line << '/' << event.stage;
    if (event.correlation_id != 0) line << " (cid:" << event.correlation_id << ')';
    line << ": " << event.message;
    return line.str();
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    record(DiagnosticEvent{std::chrono::steady_clock::now(), severity, module, stage, message});
}

void DiagnosticEmitter::forward(const DiagnosticEvent& event) {
    DiagnosticEvent copy = event;
    copy.timestamp = std::chrono::steady_clock::now();
    record(std::move(copy));
}

void DiagnosticEmitter::record(DiagnosticEvent event) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (event.severity < min_severity_) {
        return;
    }
    event.correlation_id = correlation_id_;
    while (events_.size() >= capacity_) {
        events_.pop_front();
    }
    events_.push_back(event);
    std::vector<DiagnosticObserver> observers = observers_;
    lock.unlock();

    for (const auto& observer : observers) {
        observer(event);
    }
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return correlation_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::select(
    const std::function<bool(const DiagnosticEvent&)>& keep) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiagnosticEvent> selected;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(selected), keep);
    return selected;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    return select([](const DiagnosticEvent&) { return true; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select([&module](const DiagnosticEvent& e) { return e.module == module; });
}

void DiagnosticEmitter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

DiagnosticObserver stderr_observer(Severity min) {
    return [min](const DiagnosticEvent& event) {
        if (event.severity >= min) {
            std::cerr << "lolite " << format_diagnostic(event) << "\n";
        }
    };
}

}  // namespace lolite::core
