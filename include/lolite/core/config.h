#ifndef LOLITE_CORE_CONFIG_H
#define LOLITE_CORE_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include <lolite/core/diagnostics.h>

namespace lolite::core {

namespace config {

inline constexpr std::uint32_t kDefaultFrameDebounceMs = 100;
inline constexpr std::size_t kDefaultMaxDiagnosticEvents = 1024;
inline constexpr std::uint32_t kWorkerShutdownTimeoutMs = 2000;
inline constexpr const char kWorkerExecutableName[] = "lolite_worker";
inline constexpr const char kWorkerFdFlag[] = "--ipc-fd=";

}  // namespace config

struct EngineConfig {
    // Empty means "next to the running executable".
    std::string worker_path;
    std::chrono::milliseconds frame_debounce{config::kDefaultFrameDebounceMs};
    std::size_t max_diagnostic_events = config::kDefaultMaxDiagnosticEvents;
    Severity min_severity = Severity::Info;
    bool log_to_stderr = false;

    // Defaults overridden by LOLITE_WORKER_PATH, LOLITE_FRAME_DEBOUNCE_MS
    // and LOLITE_LOG.
    static EngineConfig from_environment();

    std::string resolved_worker_path() const;
};

// Accepts "info", "warning", "error". "off" disables stderr logging.
bool parse_log_level(const std::string& text, Severity& severity, bool& enabled);

}  // namespace lolite::core

#endif  // LOLITE_CORE_CONFIG_H
