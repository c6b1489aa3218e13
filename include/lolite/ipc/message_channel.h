#pragma once
#include <lolite/ipc/message.h>
#include <lolite/ipc/message_pipe.h>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace lolite::ipc {

// Typed messages over a MessagePipe. send() may be called from several
// threads; receive() from one reader at a time.
class MessageChannel {
public:
    using MessageHandler = std::function<void(const Message&)>;

    explicit MessageChannel(MessagePipe pipe);

    bool send(const Message& msg);

    // Blocking. nullopt once the peer is gone or a frame is malformed.
    std::optional<Message> receive();

    // Register a handler for a message type
    void on(uint32_t message_type, MessageHandler handler);

    // Returns false if no handler is registered for msg.type.
    bool dispatch(const Message& msg);

    bool is_open() const;

    // Unblocks a pending receive(); the channel stays usable for close().
    void shutdown();

    void close();

private:
    MessagePipe pipe_;
    std::mutex send_mutex_;
    std::unordered_map<uint32_t, MessageHandler> handlers_;
};

} // namespace lolite::ipc
