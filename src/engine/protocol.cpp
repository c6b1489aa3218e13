#include <lolite/engine/protocol.h>

#include <stdexcept>
#include <utility>

namespace lolite::engine {

namespace {

core::Severity severity_from_wire(std::uint8_t value) {
    switch (value) {
        case 0: return core::Severity::Info;
        case 1: return core::Severity::Warning;
        case 2: return core::Severity::Error;
        default: break;
    }
    throw std::runtime_error("invalid severity " + std::to_string(value));
}

css::PropertyOrigin::Kind origin_kind_from_wire(std::uint8_t value) {
    switch (value) {
        case 0: return css::PropertyOrigin::Kind::Declared;
        case 1: return css::PropertyOrigin::Kind::Inherited;
        case 2: return css::PropertyOrigin::Kind::Initial;
        default: break;
    }
    throw std::runtime_error("invalid origin kind " + std::to_string(value));
}

void write_issue(ipc::Serializer& s, const css::ParseIssue& issue) {
    s.write_u64(issue.position);
    s.write_u32(static_cast<std::uint32_t>(issue.line));
    s.write_u32(static_cast<std::uint32_t>(issue.column));
    s.write_string(issue.message);
}

css::ParseIssue read_issue(ipc::Deserializer& d) {
    css::ParseIssue issue;
    issue.position = static_cast<size_t>(d.read_u64());
    issue.line = d.read_u32();
    issue.column = d.read_u32();
    issue.message = d.read_string();
    return issue;
}

}  // namespace

const char* message_type_name(MessageType type) {
    switch (type) {
        case MessageType::Hello:         return "hello";
        case MessageType::AddStylesheet: return "add_stylesheet";
        case MessageType::CreateNode:    return "create_node";
        case MessageType::SetParent:     return "set_parent";
        case MessageType::SetAttribute:  return "set_attribute";
        case MessageType::RootId:        return "root_id";
        case MessageType::ResolveStyle:  return "resolve_style";
        case MessageType::Run:           return "run";
        case MessageType::RequestStop:   return "request_stop";
        case MessageType::Destroy:       return "destroy";
        case MessageType::Abort:         return "abort";
        case MessageType::Shutdown:      return "shutdown";
        case MessageType::Reply:         return "reply";
        case MessageType::Frame:         return "frame";
        case MessageType::Diagnostic:    return "diagnostic";
    }
    return "unknown";
}

HelloRequest HelloRequest::from_config(const core::EngineConfig& config, std::uint64_t handle) {
    HelloRequest hello;
    hello.handle = handle;
    hello.frame_debounce_ms = static_cast<std::uint32_t>(config.frame_debounce.count());
    hello.max_diagnostic_events = config.max_diagnostic_events;
    return hello;
}

core::EngineConfig HelloRequest::to_config() const {
    core::EngineConfig config;
    config.frame_debounce = std::chrono::milliseconds(frame_debounce_ms);
    config.max_diagnostic_events = static_cast<std::size_t>(max_diagnostic_events);
    config.log_to_stderr = false;
    return config;
}

ipc::Message make_message(MessageType type, std::uint32_t request_id,
                          std::vector<std::uint8_t> payload) {
    ipc::Message msg;
    msg.type = static_cast<std::uint32_t>(type);
    msg.request_id = request_id;
    msg.payload = std::move(payload);
    return msg;
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

void write_status(ipc::Serializer& s, const core::Status& status) {
    s.write_u32(static_cast<std::uint32_t>(status.code));
    s.write_string(status.message);
    s.write_u64(status.position);
}

core::Status read_status(ipc::Deserializer& d) {
    std::uint32_t code = d.read_u32();
    if (code > static_cast<std::uint32_t>(core::ErrorCode::Fatal)) {
        throw std::runtime_error("invalid error code " + std::to_string(code));
    }
    core::Status status;
    status.code = static_cast<core::ErrorCode>(code);
    status.message = d.read_string();
    status.position = static_cast<std::size_t>(d.read_u64());
    return status;
}

// ---------------------------------------------------------------------------
// Resolved styles
// ---------------------------------------------------------------------------

void write_resolved_style(ipc::Serializer& s, const css::ResolvedStyle& style) {
    s.write_u32(static_cast<std::uint32_t>(style.size()));
    for (const auto& [name, property] : style.properties()) {
        s.write_string(name);
        s.write_string(property.value);
        s.write_u8(static_cast<std::uint8_t>(property.origin.kind));
        s.write_bool(property.origin.rule_origin.has_value());
        s.write_u64(property.origin.rule_origin.value_or(0));
        s.write_string(property.origin.selector);
        s.write_u64(property.origin.source_node);
        s.write_bool(property.origin.important);
    }
}

css::ResolvedStyle read_resolved_style(ipc::Deserializer& d) {
    css::ResolvedStyle style;
    std::uint32_t count = d.read_u32();
    for (std::uint32_t i = 0; i < count; ++i) {
        std::string name = d.read_string();
        css::ResolvedProperty property;
        property.value = d.read_string();
        property.origin.kind = origin_kind_from_wire(d.read_u8());
        bool has_rule = d.read_bool();
        std::uint64_t rule_origin = d.read_u64();
        if (has_rule) {
            property.origin.rule_origin = static_cast<size_t>(rule_origin);
        }
        property.origin.selector = d.read_string();
        property.origin.source_node = d.read_u64();
        property.origin.important = d.read_bool();
        style.set(name, std::move(property));
    }
    return style;
}

// ---------------------------------------------------------------------------
// Stylesheet results
// ---------------------------------------------------------------------------

void write_stylesheet_result(ipc::Serializer& s, const css::StylesheetResult& result) {
    write_status(s, result.status);
    s.write_u64(result.rules_added);
    s.write_u32(static_cast<std::uint32_t>(result.issues.size()));
    for (const auto& issue : result.issues) {
        write_issue(s, issue);
    }
    s.write_u32(static_cast<std::uint32_t>(result.ignored_at_rules.size()));
    for (const auto& name : result.ignored_at_rules) {
        s.write_string(name);
    }
}

css::StylesheetResult read_stylesheet_result(ipc::Deserializer& d) {
    css::StylesheetResult result;
    result.status = read_status(d);
    result.rules_added = static_cast<size_t>(d.read_u64());
    std::uint32_t issue_count = d.read_u32();
    for (std::uint32_t i = 0; i < issue_count; ++i) {
        result.issues.push_back(read_issue(d));
    }
    std::uint32_t at_rule_count = d.read_u32();
    for (std::uint32_t i = 0; i < at_rule_count; ++i) {
        result.ignored_at_rules.push_back(d.read_string());
    }
    return result;
}

// ---------------------------------------------------------------------------
// Frames and diagnostics
// ---------------------------------------------------------------------------

void write_frame(ipc::Serializer& s, const StyleFrame& frame) {
    s.write_u64(frame.sequence);
    s.write_u32(static_cast<std::uint32_t>(frame.styles.size()));
    for (const auto& [id, style] : frame.styles) {
        s.write_u64(id);
        write_resolved_style(s, style);
    }
}

StyleFrame read_frame(ipc::Deserializer& d) {
    StyleFrame frame;
    frame.sequence = d.read_u64();
    std::uint32_t count = d.read_u32();
    for (std::uint32_t i = 0; i < count; ++i) {
        dom::NodeId id = d.read_u64();
        frame.styles.emplace_back(id, read_resolved_style(d));
    }
    return frame;
}

void write_diagnostic(ipc::Serializer& s, const core::DiagnosticEvent& event) {
    s.write_u8(static_cast<std::uint8_t>(event.severity));
    s.write_string(event.module);
    s.write_string(event.stage);
    s.write_string(event.message);
}

core::DiagnosticEvent read_diagnostic(ipc::Deserializer& d) {
    core::DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity_from_wire(d.read_u8());
    event.module = d.read_string();
    event.stage = d.read_string();
    event.message = d.read_string();
    return event;
}

void write_hello(ipc::Serializer& s, const HelloRequest& hello) {
    s.write_u64(hello.handle);
    s.write_u32(hello.frame_debounce_ms);
    s.write_u64(hello.max_diagnostic_events);
}

HelloRequest read_hello(ipc::Deserializer& d) {
    HelloRequest hello;
    hello.handle = d.read_u64();
    hello.frame_debounce_ms = d.read_u32();
    hello.max_diagnostic_events = d.read_u64();
    return hello;
}

core::Status communication_failure(const std::string& detail) {
    return core::Status::error(core::ErrorCode::CommunicationFailure, detail);
}

}  // namespace lolite::engine
