#pragma once
#include <lolite/core/error.h>
#include <lolite/dom/node.h>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lolite::dom {

// Arena of nodes keyed by caller-chosen ids, with the reserved root.
//
// Nodes start detached: they belong to the document but hang under no
// parent until set_parent() attaches them. A failed mutation leaves the
// document unchanged.
class Document {
public:
    Document();
    ~Document();

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    // InvalidId for 0, DuplicateId for an existing id.
    core::Status create_node(NodeId id, std::optional<std::string> text = std::nullopt);

    // Moves `child` (with its subtree) to the end of `parent`'s children.
    // UnknownNode for unknown ids; WouldCreateCycle when child == parent,
    // child is an ancestor of parent, or child is the root. Re-attaching a
    // node to its current parent is a no-op.
    core::Status set_parent(NodeId parent, NodeId child);

    core::Status set_attribute(NodeId node, const std::string& key, const std::string& value);

    NodeId root_id() const { return kRootNodeId; }
    const Node& root() const { return *root_; }

    const Node* find(NodeId id) const;
    bool contains(NodeId id) const { return find(id) != nullptr; }

    std::optional<NodeId> parent_of(NodeId id) const;
    std::vector<NodeId> children_of(NodeId id) const;
    std::optional<std::string> get_attribute(NodeId id, const std::string& key) const;

    // True if `ancestor` is a proper ancestor of `node`.
    bool is_ancestor(NodeId ancestor, NodeId node) const;
    // True if `id` is the root or hangs below it.
    bool is_attached(NodeId id) const;

    // Pre-order ids of `id` and everything below it; empty if unknown.
    std::vector<NodeId> subtree_ids(NodeId id) const;
    // Tops of detached subtrees, in id order.
    std::vector<NodeId> detached_roots() const;

    size_t node_count() const { return index_.size(); }

    // Bumped by every successful mutation.
    std::uint64_t generation() const { return generation_; }

private:
    Node* find_mutable(NodeId id);

    std::unique_ptr<Node> root_;
    std::map<NodeId, std::unique_ptr<Node>> detached_;
    std::unordered_map<NodeId, Node*> index_;
    std::uint64_t generation_ = 0;
};

} // namespace lolite::dom
