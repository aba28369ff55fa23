#ifndef LEXITRIE_CORE_TRIE_HPP
#define LEXITRIE_CORE_TRIE_HPP

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "key_traits.hpp"
#include "trie_node.hpp"

namespace lexitrie::core {

/**
 * @brief Pre-order walker over the value-bearing nodes of a subtree
 *
 * The cursor keeps an explicit stack of (node, next child) frames and owns
 * the symbol buffer spelling the path to the current node. A symbol is
 * pushed when descending into a child and popped when leaving it, so the
 * buffer always matches the stack. Two cursors never share a buffer.
 */
template <typename Node, typename Symbol>
class DepthFirstCursor {
public:
    DepthFirstCursor() = default;

    /**
     * @param start Subtree root, may be null for an exhausted cursor
     * @param prefix Symbols spelling the path from the trie root to @p start
     */
    DepthFirstCursor(const Node* start, std::vector<Symbol> prefix)
        : path_(std::move(prefix)) {
        if (start == nullptr) {
            return;
        }
        stack_.push_back({start, 0});
        if (start->hasValue()) {
            current_ = start;
        } else {
            advance();
        }
    }

    [[nodiscard]] auto done() const noexcept -> bool {
        return current_ == nullptr;
    }

    [[nodiscard]] auto node() const noexcept -> const Node* { return current_; }

    [[nodiscard]] auto path() const noexcept -> std::span<const Symbol> {
        return path_;
    }

    void advance() {
        current_ = nullptr;
        while (!stack_.empty()) {
            auto& frame = stack_.back();
            const auto& children = frame.node->children();
            if (frame.next < children.size()) {
                const auto& [symbol, child] = children[frame.next++];
                path_.push_back(symbol);
                stack_.push_back({child.get(), 0});
                if (child->hasValue()) {
                    current_ = child.get();
                    return;
                }
                continue;
            }
            stack_.pop_back();
            if (!stack_.empty()) {
                path_.pop_back();
            }
        }
    }

private:
    struct Frame {
        const Node* node;
        std::size_t next;
    };

    std::vector<Frame> stack_;
    std::vector<Symbol> path_;
    const Node* current_ = nullptr;
};

/**
 * @brief Map from symbol-sequence keys to values, organised as a prefix tree
 *
 * Besides the usual map operations the trie answers prefix queries: all keys
 * below a prefix (findPrefix) and all stored keys that are prefixes of a
 * query (iterPrefixes). Every node counts the values stored in its subtree,
 * so size() and countPrefix() do not walk the tree.
 *
 * Keys are converted to symbol sequences by the @p Traits policy. The default
 * policy treats std::string keys as sequences of char.
 *
 * The trie performs no locking. Concurrent mutation, or reading while another
 * thread mutates, must be serialized by the caller. Iterators own their own
 * traversal state but are invalidated by any mutation.
 *
 * @example
 * ```cpp
 * Trie<int> trie{{"cat", 0}, {"cats", 1}, {"catacomb", 2}, {"apple", 3}};
 * for (const auto& [key, value] : trie.iterPrefixes("catacombs")) {
 *     // ("cat", 0), ("catacomb", 2)
 * }
 * auto under = trie.findPrefix("app");  // {"apple"}
 * ```
 *
 * @tparam Value Payload type
 * @tparam Traits Key conversion policy
 */
template <typename Value, KeyTraits Traits = StringKeyTraits>
class Trie {
public:
    using Key = typename Traits::Key;
    using Symbol = typename Traits::Symbol;
    using Node = TrieNode<Symbol, Value>;
    using Cursor = DepthFirstCursor<Node, Symbol>;
    using Item = std::pair<Key, const Value&>;

private:
    struct KeyProjection {
        using value_type = Key;
        static auto apply(const Cursor& cursor) -> Key {
            return Traits::fromSymbols(cursor.path());
        }
    };

    struct ValueProjection {
        using value_type = Value;
        static auto apply(const Cursor& cursor) -> const Value& {
            return *cursor.node()->value();
        }
    };

    struct ItemProjection {
        using value_type = Item;
        static auto apply(const Cursor& cursor) -> Item {
            return {Traits::fromSymbols(cursor.path()),
                    *cursor.node()->value()};
        }
    };

public:
    /**
     * @brief Input iterator over a depth-first traversal
     *
     * @tparam Projection Selects what each visited node yields
     */
    template <typename Projection>
    class BasicIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = typename Projection::value_type;
        using difference_type = std::ptrdiff_t;
        using reference = decltype(Projection::apply(std::declval<Cursor>()));
        using pointer = void;

        BasicIterator() = default;
        explicit BasicIterator(Cursor cursor) : cursor_(std::move(cursor)) {}

        auto operator*() const -> reference {
            return Projection::apply(cursor_);
        }

        auto operator++() -> BasicIterator& {
            cursor_.advance();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend auto operator==(const BasicIterator& lhs,
                               const BasicIterator& rhs) noexcept -> bool {
            return lhs.cursor_.node() == rhs.cursor_.node();
        }

    private:
        Cursor cursor_;
    };

    using KeyIterator = BasicIterator<KeyProjection>;
    using ValueIterator = BasicIterator<ValueProjection>;
    using ItemIterator = BasicIterator<ItemProjection>;

    template <typename Iterator>
    class Range {
    public:
        Range(const Node* start, std::vector<Symbol> prefix)
            : start_(start), prefix_(std::move(prefix)) {}

        [[nodiscard]] auto begin() const -> Iterator {
            return Iterator(Cursor(start_, prefix_));
        }

        [[nodiscard]] auto end() const -> Iterator { return Iterator(); }

    private:
        const Node* start_;
        std::vector<Symbol> prefix_;
    };

    /**
     * @brief Iterator over the stored ancestors of a query key
     *
     * Walks the query one symbol at a time and stops at every node holding
     * a value. Reaching a symbol with no matching edge ends the sequence.
     * The iterator keeps its own copy of the query, so it stays usable after
     * the range that produced it is gone.
     */
    class PrefixIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Item;
        using difference_type = std::ptrdiff_t;
        using reference = Item;
        using pointer = void;

        PrefixIterator() = default;
        PrefixIterator(const Node* root, std::vector<Symbol> symbols)
            : node_(root), symbols_(std::move(symbols)) {
            advance();
        }

        auto operator*() const -> Item {
            return {Traits::fromSymbols(
                        std::span<const Symbol>(symbols_).first(depth_)),
                    *node_->value()};
        }

        auto operator++() -> PrefixIterator& {
            advance();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend auto operator==(const PrefixIterator& lhs,
                               const PrefixIterator& rhs) noexcept -> bool {
            return lhs.node_ == rhs.node_;
        }

    private:
        void advance() {
            while (node_ != nullptr) {
                if (depth_ == symbols_.size()) {
                    node_ = nullptr;
                    return;
                }
                node_ = node_->childFor(symbols_[depth_++]);
                if (node_ != nullptr && node_->hasValue()) {
                    return;
                }
            }
        }

        const Node* node_ = nullptr;
        std::vector<Symbol> symbols_;
        std::size_t depth_ = 0;
    };

    class PrefixRange {
    public:
        PrefixRange(const Node* root, std::vector<Symbol> symbols)
            : root_(root), symbols_(std::move(symbols)) {}

        [[nodiscard]] auto begin() const -> PrefixIterator {
            return PrefixIterator(root_, symbols_);
        }

        [[nodiscard]] auto end() const -> PrefixIterator {
            return PrefixIterator();
        }

    private:
        const Node* root_;
        std::vector<Symbol> symbols_;
    };

    Trie() : root_(std::make_unique<Node>()) {}

    Trie(std::initializer_list<std::pair<Key, Value>> items) : Trie() {
        update(items);
    }

    Trie(const Trie&) = delete;
    Trie& operator=(const Trie&) = delete;

    Trie(Trie&& other) : root_(std::exchange(other.root_, std::make_unique<Node>())) {}

    Trie& operator=(Trie&& other) {
        if (this != &other) {
            root_ = std::exchange(other.root_, std::make_unique<Node>());
        }
        return *this;
    }

    ~Trie() = default;

    /**
     * @brief Insert or overwrite the value stored under @p key
     *
     * Missing intermediate nodes are created. Overwriting an existing key
     * does not change size().
     */
    void set(const Key& key, Value value) {
        Node* node = root_.get();
        for (const auto& symbol : Traits::toSymbols(key)) {
            node = &node->childOrCreate(symbol);
        }
        if (node->attachValue(std::move(value))) {
            spdlog::trace("Trie: stored new key, size is now {}", size());
        } else {
            spdlog::trace("Trie: overwrote existing key");
        }
    }

    template <typename Pairs>
    void update(const Pairs& pairs) {
        for (const auto& [key, value] : pairs) {
            set(key, value);
        }
    }

    /**
     * @brief Value stored under @p key
     *
     * @throws KeyNotFoundException if the key is absent or only a prefix
     */
    [[nodiscard]] auto get(const Key& key) const -> const Value& {
        const Node* node = find(key);
        if (node == nullptr || !node->hasValue()) {
            THROW_KEY_NOT_FOUND("Key not found in trie");
        }
        return *node->value();
    }

    [[nodiscard]] auto get(const Key& key) -> Value& {
        Node* node = find(key);
        if (node == nullptr || !node->hasValue()) {
            THROW_KEY_NOT_FOUND("Key not found in trie");
        }
        return *node->value();
    }

    [[nodiscard]] auto tryGet(const Key& key) const -> std::optional<Value> {
        const Node* node = find(key);
        if (node == nullptr) {
            return std::nullopt;
        }
        return node->value();
    }

    [[nodiscard]] auto contains(const Key& key) const -> bool {
        const Node* node = find(key);
        return node != nullptr && node->hasValue();
    }

    /**
     * @brief Remove @p key and prune nodes left without purpose
     *
     * The terminal node's value is cleared. Then, walking towards the root,
     * every non-root node that holds no value and has no children is
     * unlinked from its parent. Nodes still leading to other keys are kept.
     *
     * @throws KeyNotFoundException if the key is absent or only a prefix
     */
    void erase(const Key& key) { static_cast<void>(take(key)); }

    /**
     * @brief Remove @p key and return the value it held
     *
     * @throws KeyNotFoundException if the key is absent or only a prefix
     */
    [[nodiscard]] auto pop(const Key& key) -> Value { return take(key); }

    /**
     * @brief Number of stored keys
     */
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return root_->count();
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

    /**
     * @brief Number of stored keys that start with @p prefix
     */
    [[nodiscard]] auto countPrefix(const Key& prefix) const -> std::size_t {
        const Node* node = find(prefix);
        return node == nullptr ? 0 : node->count();
    }

    /**
     * @brief Number of allocated nodes, root included
     */
    [[nodiscard]] auto nodeCount() const -> std::size_t {
        std::size_t total = 0;
        std::vector<const Node*> pending{root_.get()};
        while (!pending.empty()) {
            const Node* node = pending.back();
            pending.pop_back();
            ++total;
            for (const auto& [symbol, child] : node->children()) {
                pending.push_back(child.get());
            }
        }
        return total;
    }

    void clear() {
        spdlog::debug("Clearing trie with {} keys", size());
        root_->reset();
    }

    /**
     * @brief Stored keys that are prefixes of @p key, shortest first
     *
     * The query does not need to be stored itself; the walk stops at the
     * first symbol with no matching edge.
     */
    [[nodiscard]] auto iterPrefixes(const Key& key) const -> PrefixRange {
        return PrefixRange(root_.get(), Traits::toSymbols(key));
    }

    /**
     * @brief Every stored key that starts with @p prefix
     *
     * @return std::nullopt if no node exists for @p prefix, otherwise the
     * keys in depth-first order (possibly empty only if the trie is empty
     * and @p prefix is empty)
     */
    [[nodiscard]] auto findPrefix(const Key& prefix) const
        -> std::optional<std::vector<Key>> {
        auto symbols = Traits::toSymbols(prefix);
        const Node* node = descend(symbols);
        if (node == nullptr) {
            return std::nullopt;
        }
        std::vector<Key> keys;
        keys.reserve(node->count());
        for (Cursor cursor(node, std::move(symbols)); !cursor.done();
             cursor.advance()) {
            keys.push_back(Traits::fromSymbols(cursor.path()));
        }
        return keys;
    }

    [[nodiscard]] auto keys() const -> Range<KeyIterator> {
        return Range<KeyIterator>(root_.get(), {});
    }

    [[nodiscard]] auto values() const -> Range<ValueIterator> {
        return Range<ValueIterator>(root_.get(), {});
    }

    [[nodiscard]] auto items() const -> Range<ItemIterator> {
        return Range<ItemIterator>(root_.get(), {});
    }

    // Iterating a trie yields its keys
    [[nodiscard]] auto begin() const -> KeyIterator {
        return KeyIterator(Cursor(root_.get(), {}));
    }

    [[nodiscard]] auto end() const -> KeyIterator { return KeyIterator(); }

    [[nodiscard]] auto root() const noexcept -> const Node& { return *root_; }

    [[nodiscard]] auto root() noexcept -> Node& { return *root_; }

private:
    [[nodiscard]] auto descend(std::span<const Symbol> symbols) const
        -> Node* {
        Node* node = root_.get();
        for (const auto& symbol : symbols) {
            node = node->childFor(symbol);
            if (node == nullptr) {
                return nullptr;
            }
        }
        return node;
    }

    [[nodiscard]] auto find(const Key& key) const -> Node* {
        return descend(Traits::toSymbols(key));
    }

    auto take(const Key& key) -> Value {
        auto const symbols = Traits::toSymbols(key);
        Node* node = descend(symbols);
        if (node == nullptr || !node->hasValue()) {
            THROW_KEY_NOT_FOUND("Cannot remove key missing from trie");
        }

        Value value = std::move(*node->value());
        node->clearValue();

        auto depth = symbols.size();
        while (depth > 0 && node->isPrunable()) {
            Node* parent = node->parent();
            parent->removeChild(symbols[--depth]);
            node = parent;
        }

        spdlog::trace("Trie: removed key, size is now {}", size());
        return value;
    }

    std::unique_ptr<Node> root_;
};

}  // namespace lexitrie::core

#endif  // LEXITRIE_CORE_TRIE_HPP
