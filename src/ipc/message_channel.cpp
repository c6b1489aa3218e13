#include <lolite/ipc/message_channel.h>
#include <lolite/ipc/serializer.h>

#include <stdexcept>
#include <utility>

namespace lolite::ipc {

MessageChannel::MessageChannel(MessagePipe pipe)
    : pipe_(std::move(pipe)) {}

bool MessageChannel::send(const Message& msg) {
    // Wire format: type(4) + request_id(4) + payload_len(4) + payload(N)
    Serializer s;
    s.write_u32(msg.type);
    s.write_u32(msg.request_id);
    s.write_u32(static_cast<uint32_t>(msg.payload.size()));

    std::vector<uint8_t> frame = s.take_data();
    frame.insert(frame.end(), msg.payload.begin(), msg.payload.end());

    std::lock_guard<std::mutex> lock(send_mutex_);
    return pipe_.send(frame);
}

std::optional<Message> MessageChannel::receive() {
    auto raw = pipe_.receive();
    if (!raw) return std::nullopt;

    Deserializer d(*raw);
    if (d.remaining() < 12) return std::nullopt;

    Message msg;
    msg.type = d.read_u32();
    msg.request_id = d.read_u32();
    uint32_t payload_len = d.read_u32();

    if (d.remaining() != payload_len) return std::nullopt;

    size_t header = raw->size() - payload_len;
    msg.payload.assign(raw->begin() + static_cast<std::ptrdiff_t>(header), raw->end());
    return msg;
}

void MessageChannel::on(uint32_t message_type, MessageHandler handler) {
    handlers_[message_type] = std::move(handler);
}

bool MessageChannel::dispatch(const Message& msg) {
    auto it = handlers_.find(msg.type);
    if (it == handlers_.end()) {
        return false;
    }
    it->second(msg);
    return true;
}

bool MessageChannel::is_open() const {
    return pipe_.is_open();
}

void MessageChannel::shutdown() {
    pipe_.shutdown();
}

void MessageChannel::close() {
    pipe_.close();
}

} // namespace lolite::ipc
