#pragma once

#include <lolite/css/style/selector_matcher.h>
#include <lolite/dom/document.h>

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace lolite::engine {

// Selector-matching view of a Document: one ElementView per node, linked
// the same way the nodes are. Detached subtrees get views too, with their
// topmost node parentless.
class StyleTree {
public:
    // Rebuilds the views if the document changed since the last call.
    void sync(const dom::Document& document);

    const css::ElementView* find(dom::NodeId id) const;

    std::uint64_t generation() const { return generation_; }
    size_t size() const { return views_.size(); }

private:
    css::ElementView* make_view(const dom::Node& node, css::ElementView* parent,
                                bool is_document_root);
    void build(const dom::Node& top, bool is_document_root);

    std::vector<std::unique_ptr<css::ElementView>> views_;
    std::unordered_map<dom::NodeId, css::ElementView*> index_;
    std::uint64_t generation_ = 0;
    bool built_ = false;
};

}  // namespace lolite::engine
