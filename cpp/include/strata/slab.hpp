#pragma once

/**
 * Slab Allocator over a persisted region
 *
 * Key Design Decisions:
 * 1. Fixed-size nodes addressed by 32-bit index, never by pointer
 * 2. Intrusive free list threaded through freed nodes - O(1) alloc/free
 * 3. Bump index extends the arena only when the free list is empty
 * 4. Nodes never move, so a stored index stays valid until freed
 *
 * Region layout:
 *   [SlabHeader][SlabNode 0][SlabNode 1] ... [SlabNode capacity-1]
 */

#include <cstddef>
#include <cstdint>
#include <optional>

#include "common.hpp"
#include "error.hpp"

namespace strata::slab {

// =============================================================================
// NODE LAYOUT
// =============================================================================

enum class NodeTag : uint32_t {
    UNINITIALIZED = 0,
    INNER = 1,
    LEAF = 2,
    FREE = 3,
    LAST_FREE = 4
};

struct InnerNode {
    uint32_t prefix_len;        // Critical bit, counted from the MSB
    NodeHandle children[2];
    uint32_t reserved;
    OrderKey key;               // Any key below this node; first prefix_len bits are shared
};

struct LeafNode {
    uint8_t owner_slot;
    uint8_t fee_tier;
    uint8_t reserved[6];
    OrderKey key;
    OwnerId owner;
    Quantity quantity;
    uint64_t client_order_id;
};

struct FreeNode {
    NodeHandle next;
};

struct SlabNode {
    NodeTag tag;
    uint32_t reserved;
    union {
        InnerNode inner;
        LeafNode leaf;
        FreeNode free;
    };
};

static_assert(sizeof(InnerNode) == 32, "InnerNode layout changed");
static_assert(sizeof(LeafNode) == 48, "LeafNode layout changed");
static_assert(sizeof(SlabNode) == 56, "SlabNode must stay 56 bytes");

struct SlabHeader {
    uint64_t bump_index;
    uint64_t free_list_len;
    NodeHandle free_list_head;
    NodeHandle root_node;
    uint64_t leaf_count;
    uint64_t capacity;
};

static_assert(sizeof(SlabHeader) == 40, "SlabHeader must stay 40 bytes");

// =============================================================================
// SLAB VIEW
// Non-owning; the bytes belong to the persisted market region.
// =============================================================================

class Slab {
public:
    Slab() = default;

    /**
     * Bind to an already initialized region (no validation, see validate())
     */
    Slab(uint8_t* region, size_t length) noexcept;

    [[nodiscard]] static constexpr size_t region_size(uint32_t capacity) noexcept {
        return sizeof(SlabHeader) + static_cast<size_t>(capacity) * sizeof(SlabNode);
    }

    /**
     * Format `region` as an empty slab with room for `capacity` nodes
     */
    [[nodiscard]] static ErrorCode init(uint8_t* region, size_t length, uint32_t capacity) noexcept;

    [[nodiscard]] ErrorCode validate() const noexcept;

    /**
     * O(1) allocation: pop the free list, else bump.
     * @return node index, std::nullopt when the slab is exhausted
     */
    [[nodiscard]] std::optional<NodeHandle> allocate() noexcept;

    /**
     * O(1) deallocation: push the index onto the free list.
     * Rejects unknown indices and double frees with CORRUPT_STATE.
     */
    [[nodiscard]] ErrorCode free(NodeHandle handle) noexcept;

    [[nodiscard]] SlabNode* node(NodeHandle handle) noexcept;
    [[nodiscard]] const SlabNode* node(NodeHandle handle) const noexcept;

    [[nodiscard]] SlabHeader& header() noexcept { return *header_; }
    [[nodiscard]] const SlabHeader& header() const noexcept { return *header_; }

    [[nodiscard]] NodeHandle root() const noexcept { return header_->root_node; }
    void set_root(NodeHandle handle) noexcept { header_->root_node = handle; }

    [[nodiscard]] uint64_t capacity() const noexcept { return header_->capacity; }
    [[nodiscard]] uint64_t allocated() const noexcept {
        return header_->bump_index - header_->free_list_len;
    }
    [[nodiscard]] uint64_t available() const noexcept { return capacity() - allocated(); }
    [[nodiscard]] bool full() const noexcept { return available() == 0; }

private:
    SlabHeader* header_{nullptr};
    SlabNode* nodes_{nullptr};
    size_t length_{0};
};

} // namespace strata::slab
