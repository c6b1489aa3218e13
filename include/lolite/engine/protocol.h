#pragma once

#include <lolite/core/config.h>
#include <lolite/core/diagnostics.h>
#include <lolite/core/error.h>
#include <lolite/css/style/resolved_style.h>
#include <lolite/css/style/stylesheet_store.h>
#include <lolite/engine/frame.h>
#include <lolite/ipc/message.h>
#include <lolite/ipc/serializer.h>

#include <cstdint>
#include <string>
#include <vector>

namespace lolite::engine {

// Host <-> worker message types. Requests carry a non-zero request id that
// the worker echoes in its Reply; Frame and Diagnostic are one-way.
enum class MessageType : std::uint32_t {
    // host -> worker
    Hello = 1,
    AddStylesheet,
    CreateNode,
    SetParent,
    SetAttribute,
    RootId,
    ResolveStyle,
    Run,
    RequestStop,
    Destroy,
    Abort,
    Shutdown,

    // worker -> host
    Reply = 100,
    Frame,
    Diagnostic,
};

const char* message_type_name(MessageType type);

// Configuration and identity sent with Hello. The worker never logs to
// stderr itself; the host prints the events it forwards.
struct HelloRequest {
    std::uint64_t handle = 0;
    std::uint32_t frame_debounce_ms = 0;
    std::uint64_t max_diagnostic_events = 0;

    static HelloRequest from_config(const core::EngineConfig& config, std::uint64_t handle);
    core::EngineConfig to_config() const;
};

ipc::Message make_message(MessageType type, std::uint32_t request_id,
                          std::vector<std::uint8_t> payload = {});

// Field encoders. Readers throw std::runtime_error on malformed input.
void write_status(ipc::Serializer& s, const core::Status& status);
core::Status read_status(ipc::Deserializer& d);

void write_resolved_style(ipc::Serializer& s, const css::ResolvedStyle& style);
css::ResolvedStyle read_resolved_style(ipc::Deserializer& d);

void write_stylesheet_result(ipc::Serializer& s, const css::StylesheetResult& result);
css::StylesheetResult read_stylesheet_result(ipc::Deserializer& d);

void write_frame(ipc::Serializer& s, const StyleFrame& frame);
StyleFrame read_frame(ipc::Deserializer& d);

void write_diagnostic(ipc::Serializer& s, const core::DiagnosticEvent& event);
core::DiagnosticEvent read_diagnostic(ipc::Deserializer& d);

void write_hello(ipc::Serializer& s, const HelloRequest& hello);
HelloRequest read_hello(ipc::Deserializer& d);

core::Status communication_failure(const std::string& detail);

}  // namespace lolite::engine
