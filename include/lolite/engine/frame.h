#pragma once

#include <lolite/core/error.h>
#include <lolite/css/style/resolved_style.h>
#include <lolite/dom/node.h>

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace lolite::engine {

// Styles recomputed by one run-loop tick, in document pre-order.
struct StyleFrame {
    std::uint64_t sequence = 0;  // 1 for the first frame of an instance
    std::vector<std::pair<dom::NodeId, css::ResolvedStyle>> styles;

    const css::ResolvedStyle* find(dom::NodeId id) const {
        for (const auto& entry : styles) {
            if (entry.first == id) return &entry.second;
        }
        return nullptr;
    }
};

// Rendering collaborator. An exception thrown from the sink is fatal for
// the run loop that called it.
using FrameSink = std::function<void(const StyleFrame&)>;

struct StyleResult {
    core::Status status;
    css::ResolvedStyle style;

    bool ok() const { return status.ok(); }
};

}  // namespace lolite::engine
