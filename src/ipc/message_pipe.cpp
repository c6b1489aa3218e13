#include <lolite/ipc/message_pipe.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace lolite::ipc {

namespace {

// Write exactly len bytes, handling partial writes and EINTR.
bool send_all(int fd, const uint8_t* data, size_t len) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::send(fd, data + written, len - written, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false;
        written += static_cast<size_t>(n);
    }
    return true;
}

// Read exactly len bytes, handling partial reads and EINTR.
// Returns false on EOF or error.
bool read_all(int fd, uint8_t* buf, size_t len) {
    size_t total_read = 0;
    while (total_read < len) {
        ssize_t n = ::read(fd, buf + total_read, len - total_read);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) return false; // EOF
        total_read += static_cast<size_t>(n);
    }
    return true;
}

} // anonymous namespace

bool set_inheritable(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC) == 0;
}

std::pair<MessagePipe, MessagePipe> MessagePipe::create_pair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        throw std::runtime_error(
            std::string("socketpair failed: ") + std::strerror(errno));
    }

    // Frames carrying a whole resolved document can be large; bigger
    // buffers keep a sender from stalling on a slow reader.
    constexpr int buf_size = 256 * 1024;
    for (int fd : fds) {
        ::setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &buf_size, sizeof(buf_size));
        ::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &buf_size, sizeof(buf_size));
    }

    return {MessagePipe(fds[0]), MessagePipe(fds[1])};
}

MessagePipe::MessagePipe(int fd) : fd_(fd) {}

MessagePipe::~MessagePipe() {
    close();
}

MessagePipe::MessagePipe(MessagePipe&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

MessagePipe& MessagePipe::operator=(MessagePipe&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

bool MessagePipe::send(const uint8_t* data, size_t len) {
    if (!is_open() || len > kMaxFrameSize) return false;

    // One buffer so the prefix and payload leave in a single write
    std::vector<uint8_t> frame(4 + len);
    uint32_t net_len = htonl(static_cast<uint32_t>(len));
    std::memcpy(frame.data(), &net_len, 4);
    if (len > 0 && data != nullptr) {
        std::memcpy(frame.data() + 4, data, len);
    }
    return send_all(fd_, frame.data(), frame.size());
}

bool MessagePipe::send(const std::vector<uint8_t>& data) {
    return send(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> MessagePipe::receive() {
    if (!is_open()) return std::nullopt;

    uint32_t net_len = 0;
    auto* prefix = reinterpret_cast<uint8_t*>(&net_len);
    if (!read_all(fd_, prefix, 4)) return std::nullopt;

    uint32_t len = ntohl(net_len);
    if (len > kMaxFrameSize) return std::nullopt;

    std::vector<uint8_t> payload(len);
    if (len > 0) {
        if (!read_all(fd_, payload.data(), len)) return std::nullopt;
    }
    return payload;
}

void MessagePipe::shutdown() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void MessagePipe::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

int MessagePipe::release() {
    return std::exchange(fd_, -1);
}

bool MessagePipe::is_open() const {
    return fd_ >= 0;
}

} // namespace lolite::ipc
