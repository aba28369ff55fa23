#ifndef LEXITRIE_CORE_TRIE_NODE_HPP
#define LEXITRIE_CORE_TRIE_NODE_HPP

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace lexitrie::core {

/**
 * @brief A single vertex of a Trie
 *
 * Each node keeps an optional value, its children keyed by symbol and the
 * number of value-bearing nodes in its subtree (itself included). Children
 * are kept in the order their edges were first created, which is the order
 * every traversal visits them in.
 *
 * The parent pointer is non-owning and is only followed to propagate count
 * changes towards the root. A child never outlives its parent.
 *
 * Subtrees are released with an explicit work stack, so dropping a chain of
 * any depth uses constant stack space.
 *
 * @tparam Symbol Edge label type
 * @tparam Value Payload type
 */
template <typename Symbol, typename Value>
class TrieNode {
public:
    using Child = std::pair<Symbol, std::unique_ptr<TrieNode>>;

    explicit TrieNode(TrieNode* parent = nullptr) : parent_(parent) {}

    TrieNode(const TrieNode&) = delete;
    TrieNode& operator=(const TrieNode&) = delete;

    ~TrieNode() { release(std::exchange(children_, {})); }

    [[nodiscard]] auto hasValue() const noexcept -> bool {
        return value_.has_value();
    }

    [[nodiscard]] auto value() const noexcept -> const std::optional<Value>& {
        return value_;
    }

    [[nodiscard]] auto value() noexcept -> std::optional<Value>& {
        return value_;
    }

    /**
     * @brief Store a value on this node
     *
     * Overwriting an existing value leaves every count untouched.
     *
     * @return true if the node did not hold a value before
     */
    auto attachValue(Value value) -> bool {
        bool const added = !value_.has_value();
        value_ = std::move(value);
        if (added) {
            propagate(1);
        }
        return added;
    }

    /**
     * @brief Drop the value held by this node
     *
     * @return true if the node held a value before
     */
    auto clearValue() -> bool {
        if (!value_.has_value()) {
            return false;
        }
        value_.reset();
        propagate(-1);
        return true;
    }

    [[nodiscard]] auto childFor(const Symbol& symbol) const -> TrieNode* {
        auto it = findChild(symbol);
        return it == children_.end() ? nullptr : it->second.get();
    }

    auto childOrCreate(const Symbol& symbol) -> TrieNode& {
        auto it = findChild(symbol);
        if (it != children_.end()) {
            return *it->second;
        }
        children_.emplace_back(symbol, std::make_unique<TrieNode>(this));
        return *children_.back().second;
    }

    /**
     * @brief Detach and destroy the child reached through @p symbol
     *
     * The child's whole subtree is released and its value count is removed
     * from this node and its ancestors.
     */
    auto removeChild(const Symbol& symbol) -> bool {
        auto it = findChild(symbol);
        if (it == children_.end()) {
            return false;
        }
        auto const pos = children_.begin() + (it - children_.cbegin());
        auto const removed = pos->second->count_;
        std::vector<Child> detached;
        detached.push_back(std::move(*pos));
        children_.erase(pos);
        release(std::move(detached));
        if (removed > 0) {
            propagate(-static_cast<std::ptrdiff_t>(removed));
        }
        return true;
    }

    void clearChildren() {
        auto const removed = count_ - (value_.has_value() ? 1 : 0);
        release(std::exchange(children_, {}));
        if (removed > 0) {
            propagate(-static_cast<std::ptrdiff_t>(removed));
        }
    }

    // Drops the value and every child
    void reset() {
        clearChildren();
        clearValue();
    }

    [[nodiscard]] auto children() const noexcept -> const std::vector<Child>& {
        return children_;
    }

    [[nodiscard]] auto count() const noexcept -> std::size_t { return count_; }

    [[nodiscard]] auto parent() const noexcept -> TrieNode* { return parent_; }

    [[nodiscard]] auto isRoot() const noexcept -> bool {
        return parent_ == nullptr;
    }

    [[nodiscard]] auto isLeaf() const noexcept -> bool {
        return children_.empty();
    }

    // A non-root node in this state must be unlinked from its parent
    [[nodiscard]] auto isPrunable() const noexcept -> bool {
        return children_.empty() && !value_.has_value();
    }

private:
    // Destroys every node below @p children one at a time. Each node is
    // emptied before its destructor runs, so destruction never nests.
    static void release(std::vector<Child> children) {
        std::vector<std::unique_ptr<TrieNode>> pending;
        for (auto& [symbol, child] : children) {
            pending.push_back(std::move(child));
        }
        while (!pending.empty()) {
            auto node = std::move(pending.back());
            pending.pop_back();
            for (auto& [symbol, child] : node->children_) {
                pending.push_back(std::move(child));
            }
            node->children_.clear();
        }
    }

    auto findChild(const Symbol& symbol) const {
        return std::find_if(
            children_.begin(), children_.end(),
            [&symbol](const Child& child) { return child.first == symbol; });
    }

    void propagate(std::ptrdiff_t delta) noexcept {
        for (TrieNode* node = this; node != nullptr; node = node->parent_) {
            node->count_ = static_cast<std::size_t>(
                static_cast<std::ptrdiff_t>(node->count_) + delta);
        }
    }

    std::optional<Value> value_;
    std::vector<Child> children_;
    std::size_t count_ = 0;
    TrieNode* parent_;
};

}  // namespace lexitrie::core

#endif  // LEXITRIE_CORE_TRIE_NODE_HPP
