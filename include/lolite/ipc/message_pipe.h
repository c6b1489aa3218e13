#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace lolite::ipc {

// Length-prefixed byte frames over one end of a UNIX stream socket.
class MessagePipe {
public:
    // Frames larger than this are treated as a broken stream.
    static constexpr uint32_t kMaxFrameSize = 64u * 1024u * 1024u;

    // Create a pair of connected pipes. Both ends are close-on-exec; a
    // process handing one end to a child clears the flag on that end.
    static std::pair<MessagePipe, MessagePipe> create_pair();

    // Takes ownership of an existing socket descriptor
    explicit MessagePipe(int fd);

    ~MessagePipe();

    // Move-only
    MessagePipe(MessagePipe&& other) noexcept;
    MessagePipe& operator=(MessagePipe&& other) noexcept;
    MessagePipe(const MessagePipe&) = delete;
    MessagePipe& operator=(const MessagePipe&) = delete;

    // Send raw bytes (prefixed with length). Never raises SIGPIPE; a closed
    // peer makes this return false.
    bool send(const uint8_t* data, size_t len);
    bool send(const std::vector<uint8_t>& data);

    // Receive raw bytes (reads length prefix, then payload). nullopt on EOF,
    // error or an oversized frame.
    std::optional<std::vector<uint8_t>> receive();

    // Wakes up a thread blocked in receive() without releasing the fd.
    void shutdown();

    void close();

    // Gives up ownership of the descriptor without closing it.
    int release();

    bool is_open() const;

    int fd() const { return fd_; }

private:
    int fd_ = -1;
};

// Clears FD_CLOEXEC so `fd` survives exec into a worker process.
bool set_inheritable(int fd);

} // namespace lolite::ipc
