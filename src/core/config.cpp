#include <lolite/core/config.h>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace lolite::core {

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return nullptr;
    }
    return value;
}

}  // namespace

bool parse_log_level(const std::string& text, Severity& severity, bool& enabled) {
    if (text == "info") {
        severity = Severity::Info;
        enabled = true;
    } else if (text == "warning" || text == "warn") {
        severity = Severity::Warning;
        enabled = true;
    } else if (text == "error") {
        severity = Severity::Error;
        enabled = true;
    } else if (text == "off" || text == "none") {
        enabled = false;
    } else {
        return false;
    }
    return true;
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig cfg;

    if (const char* path = env_value("LOLITE_WORKER_PATH")) {
        cfg.worker_path = path;
    }

    if (const char* debounce = env_value("LOLITE_FRAME_DEBOUNCE_MS")) {
        std::string_view text(debounce);
        std::uint32_t ms = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), ms);
        if (ec == std::errc() && ptr == text.data() + text.size()) {
            cfg.frame_debounce = std::chrono::milliseconds(ms);
        }
    }

    if (const char* level = env_value("LOLITE_LOG")) {
        Severity severity = cfg.min_severity;
        bool enabled = cfg.log_to_stderr;
        if (parse_log_level(level, severity, enabled)) {
            cfg.min_severity = severity;
            cfg.log_to_stderr = enabled;
        }
    }

    return cfg;
}

std::string EngineConfig::resolved_worker_path() const {
    if (!worker_path.empty()) {
        return worker_path;
    }

    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return config::kWorkerExecutableName;
    }
    return (self.parent_path() / config::kWorkerExecutableName).string();
}

}  // namespace lolite::core
