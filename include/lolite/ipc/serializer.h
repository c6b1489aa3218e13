#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lolite::ipc {

// Big-endian encoder for message payloads.
class Serializer {
public:
    void write_u8(uint8_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_i32(int32_t value);
    void write_bool(bool value);
    void write_string(std::string_view str);
    void write_optional_string(const std::optional<std::string>& str);

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take_data() { return std::move(buffer_); }

private:
    template <typename T>
    void write_be(T value);

    std::vector<uint8_t> buffer_;
};

// Decoder matching Serializer. Every read throws std::runtime_error when
// the payload is too short.
class Deserializer {
public:
    explicit Deserializer(const uint8_t* data, size_t size);
    explicit Deserializer(const std::vector<uint8_t>& data);

    uint8_t read_u8();
    uint32_t read_u32();
    uint64_t read_u64();
    int32_t read_i32();
    bool read_bool();
    std::string read_string();
    std::optional<std::string> read_optional_string();

    // Throws if unread bytes are left over.
    void expect_end() const;

    bool has_remaining() const;
    size_t remaining() const;

private:
    template <typename T>
    T read_be();

    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;

    void check_remaining(size_t needed) const;
};

} // namespace lolite::ipc
