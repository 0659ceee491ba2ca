#pragma once

/**
 * Critbit (PATRICIA) index over slab nodes
 *
 * Binary trie keyed by 128-bit OrderKey. Every inner node stores the
 * position of its critical bit (prefix_len): the highest bit at which the
 * keys of its two subtrees differ. Left child = bit 0, right child = bit 1,
 * so an in-order walk visits keys in ascending order.
 *
 * Complexity Guarantees (depth bounded by key width, 128):
 * - insert / remove / find:   O(key bits)
 * - find_min / find_max:      O(key bits)
 * - in-order iteration:       O(1) amortized per leaf
 */

#include <array>
#include <cstdint>
#include <optional>

#include "common.hpp"
#include "error.hpp"
#include "slab.hpp"

namespace strata::critbit {

using slab::LeafNode;

enum class Direction : uint8_t { ASCENDING = 0, DESCENDING = 1 };

class CritbitIndex {
public:
    CritbitIndex() = default;
    explicit CritbitIndex(slab::Slab slab) noexcept : slab_(slab) {}

    /**
     * Insert a leaf; its key must be unique.
     * @return OK, DUPLICATE_KEY, or SLAB_FULL (no node leaked)
     */
    [[nodiscard]] ErrorCode insert(const LeafNode& leaf, NodeHandle* handle_out = nullptr) noexcept;

    /**
     * Remove the leaf with `key`, collapsing its parent inner node.
     * @return removed payload, std::nullopt when absent
     */
    [[nodiscard]] std::optional<LeafNode> remove(const OrderKey& key) noexcept;

    [[nodiscard]] const LeafNode* find(const OrderKey& key) const noexcept;
    [[nodiscard]] LeafNode* find_mut(const OrderKey& key) noexcept;

    [[nodiscard]] std::optional<NodeHandle> find_min() const noexcept;
    [[nodiscard]] std::optional<NodeHandle> find_max() const noexcept;

    [[nodiscard]] const LeafNode* leaf(NodeHandle handle) const noexcept;
    [[nodiscard]] LeafNode* leaf_mut(NodeHandle handle) noexcept;

    [[nodiscard]] uint64_t leaf_count() const noexcept { return slab_.header().leaf_count; }
    [[nodiscard]] bool empty() const noexcept { return slab_.root() == NIL_NODE; }

    [[nodiscard]] slab::Slab& slab() noexcept { return slab_; }
    [[nodiscard]] const slab::Slab& slab() const noexcept { return slab_; }

    /**
     * Full structural check: crit-bit ordering, shared prefixes,
     * reachable leaves == leaf_count, no free node reachable.
     */
    [[nodiscard]] ErrorCode check_invariants() const noexcept;

    // =========================================================================
    // IN-ORDER ITERATION
    // Explicit stack of pending subtrees; depth never exceeds 129.
    // The index must not be modified while an iterator is live.
    // =========================================================================

    class Iterator {
    public:
        Iterator() = default;
        Iterator(const CritbitIndex* index, Direction direction) noexcept;

        const LeafNode& operator*() const noexcept { return *current_; }
        const LeafNode* operator->() const noexcept { return current_; }
        Iterator& operator++() noexcept;
        bool operator!=(const Iterator& other) const noexcept { return current_ != other.current_; }
        bool operator==(const Iterator& other) const noexcept { return current_ == other.current_; }

    private:
        void descend(NodeHandle handle) noexcept;

        const CritbitIndex* index_{nullptr};
        Direction direction_{Direction::ASCENDING};
        const LeafNode* current_{nullptr};
        std::array<NodeHandle, 130> stack_{};
        size_t depth_{0};
    };

    class Range {
    public:
        Range(const CritbitIndex* index, Direction direction) noexcept
            : index_(index), direction_(direction) {}
        [[nodiscard]] Iterator begin() const noexcept { return Iterator(index_, direction_); }
        [[nodiscard]] Iterator end() const noexcept { return Iterator(); }

    private:
        const CritbitIndex* index_;
        Direction direction_;
    };

    [[nodiscard]] Range ascending() const noexcept { return Range(this, Direction::ASCENDING); }
    [[nodiscard]] Range descending() const noexcept { return Range(this, Direction::DESCENDING); }
    [[nodiscard]] Range iterate(Direction direction) const noexcept { return Range(this, direction); }

private:
    [[nodiscard]] std::optional<NodeHandle> find_extreme(unsigned child) const noexcept;
    [[nodiscard]] NodeHandle find_handle(const OrderKey& key) const noexcept;

    slab::Slab slab_;
};

} // namespace strata::critbit
