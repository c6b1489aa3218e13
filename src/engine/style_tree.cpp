#include <lolite/engine/style_tree.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace lolite::engine {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

void StyleTree::sync(const dom::Document& document) {
    if (built_ && generation_ == document.generation()) {
        return;
    }

    views_.clear();
    index_.clear();

    build(document.root(), true);
    for (dom::NodeId id : document.detached_roots()) {
        if (const dom::Node* node = document.find(id)) {
            build(*node, false);
        }
    }

    generation_ = document.generation();
    built_ = true;
}

css::ElementView* StyleTree::make_view(const dom::Node& node, css::ElementView* parent,
                                       bool is_document_root) {
    auto view = std::make_unique<css::ElementView>();
    css::ElementView* raw = view.get();
    views_.push_back(std::move(view));
    index_[node.id()] = raw;

    raw->node_id = node.id();
    raw->parent = parent;
    raw->is_document_root = is_document_root;
    raw->has_text = node.text().has_value() && !node.text()->empty();

    for (const auto& [key, value] : node.attributes()) {
        raw->attributes.emplace_back(key, value);
        if (key == "tag") {
            raw->tag_name = to_lower(value);
        } else if (key == "id") {
            raw->id = value;
        } else if (key == "class") {
            raw->classes = css::split_class_list(value);
        }
    }
    return raw;
}

// Work-list walk so tree depth never turns into stack depth.
void StyleTree::build(const dom::Node& top, bool is_document_root) {
    std::vector<std::pair<const dom::Node*, css::ElementView*>> work;
    work.emplace_back(&top, make_view(top, nullptr, is_document_root));

    while (!work.empty()) {
        const dom::Node* node = work.back().first;
        css::ElementView* view = work.back().second;
        work.pop_back();

        css::ElementView* previous = nullptr;
        size_t index = 0;
        size_t count = node->child_count();
        view->children.reserve(count);
        node->for_each_child([&](const dom::Node& child) {
            css::ElementView* child_view = make_view(child, view, false);
            child_view->prev_sibling = previous;
            child_view->child_index = index++;
            child_view->sibling_count = count;
            view->children.push_back(child_view);
            previous = child_view;
            work.emplace_back(&child, child_view);
        });
    }
}

const css::ElementView* StyleTree::find(dom::NodeId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
}

}  // namespace lolite::engine
