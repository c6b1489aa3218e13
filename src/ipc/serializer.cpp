#include <lolite/ipc/serializer.h>
#include <cstring>
#include <stdexcept>

namespace lolite::ipc {

// ---------------------------------------------------------------------------
// Serializer
// ---------------------------------------------------------------------------

template <typename T>
void Serializer::write_be(T value) {
    for (int shift = static_cast<int>(sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void Serializer::write_u8(uint8_t value) {
    buffer_.push_back(value);
}

void Serializer::write_u32(uint32_t value) {
    write_be(value);
}

void Serializer::write_u64(uint64_t value) {
    write_be(value);
}

void Serializer::write_i32(int32_t value) {
    uint32_t uval;
    std::memcpy(&uval, &value, sizeof(uval));
    write_be(uval);
}

void Serializer::write_bool(bool value) {
    write_u8(value ? 1 : 0);
}

void Serializer::write_string(std::string_view str) {
    write_u32(static_cast<uint32_t>(str.size()));
    const auto* bytes = reinterpret_cast<const uint8_t*>(str.data());
    buffer_.insert(buffer_.end(), bytes, bytes + str.size());
}

void Serializer::write_optional_string(const std::optional<std::string>& str) {
    write_bool(str.has_value());
    if (str) {
        write_string(*str);
    }
}

// ---------------------------------------------------------------------------
// Deserializer
// ---------------------------------------------------------------------------

Deserializer::Deserializer(const uint8_t* data, size_t size)
    : data_(data), size_(size) {}

Deserializer::Deserializer(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()) {}

void Deserializer::check_remaining(size_t needed) const {
    if (needed > size_ - offset_) {
        throw std::runtime_error(
            "Deserializer underflow: need " + std::to_string(needed) +
            " bytes but only " + std::to_string(size_ - offset_) + " remaining");
    }
}

template <typename T>
T Deserializer::read_be() {
    check_remaining(sizeof(T));
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | data_[offset_ + i]);
    }
    offset_ += sizeof(T);
    return value;
}

uint8_t Deserializer::read_u8() {
    check_remaining(1);
    return data_[offset_++];
}

uint32_t Deserializer::read_u32() {
    return read_be<uint32_t>();
}

uint64_t Deserializer::read_u64() {
    return read_be<uint64_t>();
}

int32_t Deserializer::read_i32() {
    uint32_t uval = read_be<uint32_t>();
    int32_t result;
    std::memcpy(&result, &uval, sizeof(result));
    return result;
}

bool Deserializer::read_bool() {
    uint8_t value = read_u8();
    if (value > 1) {
        throw std::runtime_error("Deserializer: invalid bool byte " + std::to_string(value));
    }
    return value != 0;
}

std::string Deserializer::read_string() {
    uint32_t len = read_u32();
    check_remaining(len);
    std::string result(reinterpret_cast<const char*>(data_ + offset_), len);
    offset_ += len;
    return result;
}

std::optional<std::string> Deserializer::read_optional_string() {
    if (!read_bool()) {
        return std::nullopt;
    }
    return read_string();
}

void Deserializer::expect_end() const {
    if (has_remaining()) {
        throw std::runtime_error(
            "Deserializer: " + std::to_string(remaining()) + " trailing bytes");
    }
}

bool Deserializer::has_remaining() const {
    return offset_ < size_;
}

size_t Deserializer::remaining() const {
    return size_ - offset_;
}

} // namespace lolite::ipc
