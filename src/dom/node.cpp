#include <lolite/dom/node.h>
#include <algorithm>

namespace lolite::dom {

Node::Node(NodeId id, std::optional<std::string> text)
    : id_(id), text_(std::move(text)) {}

// Children are torn down through a work list so a deep chain does not
// recurse once per level.
Node::~Node() {
    std::vector<std::unique_ptr<Node>> doomed = std::move(children_);
    while (!doomed.empty()) {
        std::unique_ptr<Node> node = std::move(doomed.back());
        doomed.pop_back();
        for (auto& child : node->children_) {
            doomed.push_back(std::move(child));
        }
        node->children_.clear();
    }
}

Node& Node::append_child(std::unique_ptr<Node> child) {
    Node* new_child = child.get();

    if (!children_.empty()) {
        Node* old_last = children_.back().get();
        old_last->next_sibling_ = new_child;
        new_child->prev_sibling_ = old_last;
    } else {
        new_child->prev_sibling_ = nullptr;
    }
    new_child->next_sibling_ = nullptr;
    new_child->parent_ = this;

    children_.push_back(std::move(child));
    return *new_child;
}

std::unique_ptr<Node> Node::remove_child(Node& child) {
    auto it = std::find_if(children_.begin(), children_.end(),
        [&child](const std::unique_ptr<Node>& c) {
            return c.get() == &child;
        });
    if (it == children_.end()) {
        return nullptr;
    }

    Node* prev = child.prev_sibling_;
    Node* next = child.next_sibling_;

    if (prev) {
        prev->next_sibling_ = next;
    }
    if (next) {
        next->prev_sibling_ = prev;
    }

    child.parent_ = nullptr;
    child.prev_sibling_ = nullptr;
    child.next_sibling_ = nullptr;

    std::unique_ptr<Node> removed = std::move(*it);
    children_.erase(it);
    return removed;
}

void Node::set_attribute(const std::string& key, const std::string& value) {
    attributes_[key] = value;
}

const std::string* Node::attribute(const std::string& key) const {
    auto it = attributes_.find(key);
    return it == attributes_.end() ? nullptr : &it->second;
}

size_t Node::child_count() const {
    return children_.size();
}

} // namespace lolite::dom
