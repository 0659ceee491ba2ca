#include "strata/critbit.hpp"

#include "strata/logging.hpp"

namespace strata::critbit {

using slab::NodeTag;
using slab::SlabNode;

// =============================================================================
// INSERT
// =============================================================================

ErrorCode CritbitIndex::insert(const LeafNode& leaf, NodeHandle* handle_out) noexcept {
    slab::SlabHeader& header = slab_.header();
    const OrderKey& key = leaf.key;

    if (header.root_node == NIL_NODE) {
        const auto handle = slab_.allocate();
        if (!handle) {
            return ErrorCode::SLAB_FULL;
        }
        SlabNode* node = slab_.node(*handle);
        node->tag = NodeTag::LEAF;
        node->leaf = leaf;
        header.root_node = *handle;
        header.leaf_count = 1;
        if (handle_out) *handle_out = *handle;
        return ErrorCode::OK;
    }

    // `where` is the link (root or a child slot) that points at `current`
    NodeHandle* where = &header.root_node;
    while (true) {
        const NodeHandle current = *where;
        SlabNode* node = slab_.node(current);
        if (STRATA_UNLIKELY(node == nullptr)) {
            return ErrorCode::CORRUPT_STATE;
        }

        OrderKey node_key{};
        uint32_t node_prefix_len = 0;
        if (node->tag == NodeTag::LEAF) {
            node_key = node->leaf.key;
            node_prefix_len = 128;
        } else if (node->tag == NodeTag::INNER) {
            node_key = node->inner.key;
            node_prefix_len = node->inner.prefix_len;
        } else {
            return ErrorCode::CORRUPT_STATE;
        }

        const uint32_t shared = key.common_prefix_len(node_key);
        if (shared >= node_prefix_len) {
            if (node->tag == NodeTag::LEAF) {
                return ErrorCode::DUPLICATE_KEY;
            }
            where = &node->inner.children[key.bit_at(node_prefix_len)];
            continue;
        }

        // Paths diverge above `current`: split with a new inner node
        const auto leaf_handle = slab_.allocate();
        if (!leaf_handle) {
            return ErrorCode::SLAB_FULL;
        }
        const auto inner_handle = slab_.allocate();
        if (!inner_handle) {
            const ErrorCode rollback = slab_.free(*leaf_handle);
            return ok(rollback) ? ErrorCode::SLAB_FULL : rollback;
        }

        SlabNode* leaf_node = slab_.node(*leaf_handle);
        leaf_node->tag = NodeTag::LEAF;
        leaf_node->leaf = leaf;

        const unsigned new_bit = key.bit_at(shared);
        SlabNode* inner_node = slab_.node(*inner_handle);
        inner_node->tag = NodeTag::INNER;
        inner_node->inner.prefix_len = shared;
        inner_node->inner.key = key;
        inner_node->inner.children[new_bit] = *leaf_handle;
        inner_node->inner.children[1 - new_bit] = current;

        *where = *inner_handle;
        ++header.leaf_count;
        if (handle_out) *handle_out = *leaf_handle;
        return ErrorCode::OK;
    }
}

// =============================================================================
// REMOVE
// =============================================================================

std::optional<LeafNode> CritbitIndex::remove(const OrderKey& key) noexcept {
    slab::SlabHeader& header = slab_.header();
    if (header.root_node == NIL_NODE) {
        return std::nullopt;
    }

    NodeHandle* where = &header.root_node;
    NodeHandle* parent_where = nullptr;
    NodeHandle parent = NIL_NODE;
    unsigned branch = 0;

    while (true) {
        const NodeHandle current = *where;
        SlabNode* node = slab_.node(current);
        if (STRATA_UNLIKELY(node == nullptr)) {
            logger().error("critbit remove reached dangling index {}", current);
            return std::nullopt;
        }

        if (node->tag == NodeTag::INNER) {
            const uint32_t prefix_len = node->inner.prefix_len;
            if (key.common_prefix_len(node->inner.key) < prefix_len) {
                return std::nullopt;
            }
            parent_where = where;
            parent = current;
            branch = key.bit_at(prefix_len);
            where = &node->inner.children[branch];
            continue;
        }

        if (node->tag != NodeTag::LEAF || node->leaf.key != key) {
            return std::nullopt;
        }

        const LeafNode removed = node->leaf;

        if (parent == NIL_NODE) {
            header.root_node = NIL_NODE;
        } else {
            // Promote the sibling into the parent's slot
            *parent_where = slab_.node(parent)->inner.children[1 - branch];
            if (!ok(slab_.free(parent))) {
                return std::nullopt;
            }
        }
        if (!ok(slab_.free(current))) {
            return std::nullopt;
        }
        --header.leaf_count;
        return removed;
    }
}

// =============================================================================
// LOOKUP
// =============================================================================

NodeHandle CritbitIndex::find_handle(const OrderKey& key) const noexcept {
    NodeHandle current = slab_.root();
    while (current != NIL_NODE) {
        const SlabNode* node = slab_.node(current);
        if (node == nullptr) {
            return NIL_NODE;
        }
        if (node->tag == NodeTag::LEAF) {
            return node->leaf.key == key ? current : NIL_NODE;
        }
        if (node->tag != NodeTag::INNER) {
            return NIL_NODE;
        }
        if (key.common_prefix_len(node->inner.key) < node->inner.prefix_len) {
            return NIL_NODE;
        }
        current = node->inner.children[key.bit_at(node->inner.prefix_len)];
    }
    return NIL_NODE;
}

const LeafNode* CritbitIndex::find(const OrderKey& key) const noexcept {
    return leaf(find_handle(key));
}

LeafNode* CritbitIndex::find_mut(const OrderKey& key) noexcept {
    return leaf_mut(find_handle(key));
}

std::optional<NodeHandle> CritbitIndex::find_extreme(unsigned child) const noexcept {
    NodeHandle current = slab_.root();
    if (current == NIL_NODE) {
        return std::nullopt;
    }
    while (true) {
        const SlabNode* node = slab_.node(current);
        if (node == nullptr) {
            return std::nullopt;
        }
        if (node->tag == NodeTag::LEAF) {
            return current;
        }
        if (node->tag != NodeTag::INNER) {
            return std::nullopt;
        }
        current = node->inner.children[child];
    }
}

std::optional<NodeHandle> CritbitIndex::find_min() const noexcept {
    return find_extreme(0);
}

std::optional<NodeHandle> CritbitIndex::find_max() const noexcept {
    return find_extreme(1);
}

const LeafNode* CritbitIndex::leaf(NodeHandle handle) const noexcept {
    const SlabNode* node = slab_.node(handle);
    return (node && node->tag == NodeTag::LEAF) ? &node->leaf : nullptr;
}

LeafNode* CritbitIndex::leaf_mut(NodeHandle handle) noexcept {
    SlabNode* node = slab_.node(handle);
    return (node && node->tag == NodeTag::LEAF) ? &node->leaf : nullptr;
}

// =============================================================================
// INVARIANTS
// =============================================================================

ErrorCode CritbitIndex::check_invariants() const noexcept {
    const NodeHandle root = slab_.root();
    const uint64_t expected_leaves = slab_.header().leaf_count;
    if (root == NIL_NODE) {
        return expected_leaves == 0 ? ErrorCode::OK : ErrorCode::CORRUPT_STATE;
    }

    std::array<NodeHandle, 256> stack{};
    size_t depth = 0;
    uint64_t leaves = 0;
    uint64_t visited = 0;
    const uint64_t node_budget = slab_.header().bump_index;

    stack[depth++] = root;
    while (depth > 0) {
        const NodeHandle handle = stack[--depth];
        if (++visited > node_budget) {
            return ErrorCode::CORRUPT_STATE;   // cycle
        }
        const SlabNode* node = slab_.node(handle);
        if (node == nullptr) {
            return ErrorCode::CORRUPT_STATE;
        }
        if (node->tag == NodeTag::LEAF) {
            ++leaves;
            continue;
        }
        if (node->tag != NodeTag::INNER || node->inner.prefix_len >= 128) {
            return ErrorCode::CORRUPT_STATE;
        }

        const uint32_t prefix_len = node->inner.prefix_len;
        for (unsigned side = 0; side < 2; ++side) {
            const NodeHandle child_handle = node->inner.children[side];
            const SlabNode* child = slab_.node(child_handle);
            if (child == nullptr) {
                return ErrorCode::CORRUPT_STATE;
            }
            OrderKey child_key{};
            if (child->tag == NodeTag::LEAF) {
                child_key = child->leaf.key;
            } else if (child->tag == NodeTag::INNER) {
                if (child->inner.prefix_len <= prefix_len) {
                    return ErrorCode::CORRUPT_STATE;
                }
                child_key = child->inner.key;
            } else {
                return ErrorCode::CORRUPT_STATE;
            }
            if (child_key.common_prefix_len(node->inner.key) < prefix_len ||
                child_key.bit_at(prefix_len) != side) {
                return ErrorCode::CORRUPT_STATE;
            }
            if (depth >= stack.size()) {
                return ErrorCode::CORRUPT_STATE;
            }
            stack[depth++] = child_handle;
        }
    }

    return leaves == expected_leaves ? ErrorCode::OK : ErrorCode::CORRUPT_STATE;
}

// =============================================================================
// ITERATOR
// =============================================================================

CritbitIndex::Iterator::Iterator(const CritbitIndex* index, Direction direction) noexcept
    : index_(index)
    , direction_(direction)
{
    if (index_ != nullptr && index_->slab_.root() != NIL_NODE) {
        descend(index_->slab_.root());
    }
}

void CritbitIndex::Iterator::descend(NodeHandle handle) noexcept {
    const unsigned first = direction_ == Direction::ASCENDING ? 0u : 1u;
    const SlabNode* node = index_->slab_.node(handle);
    while (node != nullptr && node->tag == NodeTag::INNER) {
        if (depth_ < stack_.size()) {
            stack_[depth_++] = node->inner.children[1 - first];
        }
        node = index_->slab_.node(node->inner.children[first]);
    }
    current_ = (node != nullptr && node->tag == NodeTag::LEAF) ? &node->leaf : nullptr;
}

CritbitIndex::Iterator& CritbitIndex::Iterator::operator++() noexcept {
    if (depth_ == 0) {
        current_ = nullptr;
        return *this;
    }
    descend(stack_[--depth_]);
    return *this;
}

} // namespace strata::critbit
