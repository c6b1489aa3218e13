#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lolite::dom {

using NodeId = std::uint64_t;

// Reserved id of the document root.
inline constexpr NodeId kRootNodeId = 0;

// A content node. Parents own their children; parent and sibling links are
// non-owning and kept in step by append_child/remove_child.
class Node {
public:
    explicit Node(NodeId id, std::optional<std::string> text = std::nullopt);
    ~Node();

    // Non-copyable
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    NodeId id() const { return id_; }
    const std::optional<std::string>& text() const { return text_; }

    Node* parent() const { return parent_; }
    Node* next_sibling() const { return next_sibling_; }
    Node* previous_sibling() const { return prev_sibling_; }

    // Tree manipulation
    Node& append_child(std::unique_ptr<Node> child);
    // Returns null if `child` is not a child of this node.
    std::unique_ptr<Node> remove_child(Node& child);

    // Attributes (case-sensitive keys)
    void set_attribute(const std::string& key, const std::string& value);
    const std::string* attribute(const std::string& key) const;
    const std::map<std::string, std::string>& attributes() const { return attributes_; }

    size_t child_count() const;

    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

private:
    NodeId id_;
    std::optional<std::string> text_;
    std::map<std::string, std::string> attributes_;
    Node* parent_ = nullptr;
    Node* next_sibling_ = nullptr;
    Node* prev_sibling_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
};

} // namespace lolite::dom
