#include <lolite/dom/document.h>

namespace lolite::dom {

using core::ErrorCode;
using core::Status;

namespace {

void collect_preorder(const Node& top, std::vector<NodeId>& out) {
    std::vector<const Node*> stack{&top};
    std::vector<const Node*> children;
    while (!stack.empty()) {
        const Node* node = stack.back();
        stack.pop_back();
        out.push_back(node->id());

        children.clear();
        node->for_each_child([&children](const Node& child) {
            children.push_back(&child);
        });
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
}

std::string id_text(NodeId id) {
    return std::to_string(id);
}

} // namespace

Document::Document() : root_(std::make_unique<Node>(kRootNodeId)) {
    index_.emplace(kRootNodeId, root_.get());
}

Document::~Document() = default;

const Node* Document::find(NodeId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
}

Node* Document::find_mutable(NodeId id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : it->second;
}

Status Document::create_node(NodeId id, std::optional<std::string> text) {
    if (id == kRootNodeId) {
        return Status::error(ErrorCode::InvalidId, "node id 0 is reserved for the root");
    }
    if (index_.count(id) > 0) {
        return Status::error(ErrorCode::DuplicateId, "node " + id_text(id) + " already exists");
    }

    auto node = std::make_unique<Node>(id, std::move(text));
    index_.emplace(id, node.get());
    detached_.emplace(id, std::move(node));
    ++generation_;
    return Status::success();
}

Status Document::set_parent(NodeId parent_id, NodeId child_id) {
    Node* parent = find_mutable(parent_id);
    if (parent == nullptr) {
        return Status::error(ErrorCode::UnknownNode, "unknown parent node " + id_text(parent_id));
    }
    Node* child = find_mutable(child_id);
    if (child == nullptr) {
        return Status::error(ErrorCode::UnknownNode, "unknown child node " + id_text(child_id));
    }
    if (child_id == kRootNodeId) {
        return Status::error(ErrorCode::WouldCreateCycle, "the root cannot be reparented");
    }
    if (child_id == parent_id) {
        return Status::error(ErrorCode::WouldCreateCycle,
                             "node " + id_text(child_id) + " cannot be its own parent");
    }
    // Walk the proposed parent's ancestor chain before touching anything.
    // A childless node is nobody's ancestor.
    if (child->child_count() > 0) {
        for (const Node* a = parent->parent(); a != nullptr; a = a->parent()) {
            if (a == child) {
                return Status::error(ErrorCode::WouldCreateCycle,
                                     "node " + id_text(child_id) + " is an ancestor of " +
                                         id_text(parent_id));
            }
        }
    }

    if (child->parent() == parent) {
        return Status::success();
    }

    std::unique_ptr<Node> owned;
    if (Node* old_parent = child->parent()) {
        owned = old_parent->remove_child(*child);
    } else {
        auto it = detached_.find(child_id);
        if (it != detached_.end()) {
            owned = std::move(it->second);
            detached_.erase(it);
        }
    }
    if (!owned) {
        return Status::error(ErrorCode::Fatal,
                             "node " + id_text(child_id) + " has no owner");
    }

    parent->append_child(std::move(owned));
    ++generation_;
    return Status::success();
}

Status Document::set_attribute(NodeId id, const std::string& key, const std::string& value) {
    Node* node = find_mutable(id);
    if (node == nullptr) {
        return Status::error(ErrorCode::UnknownNode, "unknown node " + id_text(id));
    }
    node->set_attribute(key, value);
    ++generation_;
    return Status::success();
}

std::optional<NodeId> Document::parent_of(NodeId id) const {
    const Node* node = find(id);
    if (node == nullptr || node->parent() == nullptr) {
        return std::nullopt;
    }
    return node->parent()->id();
}

std::vector<NodeId> Document::children_of(NodeId id) const {
    std::vector<NodeId> ids;
    if (const Node* node = find(id)) {
        node->for_each_child([&ids](const Node& child) {
            ids.push_back(child.id());
        });
    }
    return ids;
}

std::optional<std::string> Document::get_attribute(NodeId id, const std::string& key) const {
    const Node* node = find(id);
    if (node == nullptr) {
        return std::nullopt;
    }
    const std::string* value = node->attribute(key);
    if (value == nullptr) {
        return std::nullopt;
    }
    return *value;
}

bool Document::is_ancestor(NodeId ancestor, NodeId node_id) const {
    const Node* node = find(node_id);
    if (node == nullptr) {
        return false;
    }
    for (const Node* a = node->parent(); a != nullptr; a = a->parent()) {
        if (a->id() == ancestor) {
            return true;
        }
    }
    return false;
}

bool Document::is_attached(NodeId id) const {
    return id == kRootNodeId || is_ancestor(kRootNodeId, id);
}

std::vector<NodeId> Document::subtree_ids(NodeId id) const {
    std::vector<NodeId> ids;
    if (const Node* node = find(id)) {
        collect_preorder(*node, ids);
    }
    return ids;
}

std::vector<NodeId> Document::detached_roots() const {
    std::vector<NodeId> ids;
    ids.reserve(detached_.size());
    for (const auto& [id, node] : detached_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace lolite::dom
