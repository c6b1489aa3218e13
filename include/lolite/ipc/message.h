#pragma once
#include <cstdint>
#include <vector>

namespace lolite::ipc {

// One frame on a MessageChannel. `request_id` pairs a reply with its
// request; one-way notifications use 0.
struct Message {
    uint32_t type = 0;
    uint32_t request_id = 0;
    std::vector<uint8_t> payload;
};

} // namespace lolite::ipc
