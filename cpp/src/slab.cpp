#include "strata/slab.hpp"

#include <cstring>

#include "strata/logging.hpp"

namespace strata::slab {

Slab::Slab(uint8_t* region, size_t length) noexcept
    : header_(reinterpret_cast<SlabHeader*>(region))
    , nodes_(reinterpret_cast<SlabNode*>(region + sizeof(SlabHeader)))
    , length_(length)
{
}

ErrorCode Slab::init(uint8_t* region, size_t length, uint32_t capacity) noexcept {
    if (capacity == 0 || capacity == NIL_NODE) {
        return ErrorCode::INVALID_CAPACITY;
    }
    if (length < region_size(capacity)) {
        return ErrorCode::REGION_TOO_SMALL;
    }

    // Zeroed nodes read as UNINITIALIZED
    std::memset(region, 0, region_size(capacity));

    auto* header = reinterpret_cast<SlabHeader*>(region);
    header->bump_index = 0;
    header->free_list_len = 0;
    header->free_list_head = NIL_NODE;
    header->root_node = NIL_NODE;
    header->leaf_count = 0;
    header->capacity = capacity;
    return ErrorCode::OK;
}

ErrorCode Slab::validate() const noexcept {
    if (length_ < sizeof(SlabHeader)) {
        return ErrorCode::REGION_TOO_SMALL;
    }
    const SlabHeader& h = *header_;
    if (h.capacity == 0 || h.capacity >= NIL_NODE || length_ < region_size(static_cast<uint32_t>(h.capacity))) {
        return ErrorCode::CORRUPT_STATE;
    }
    if (h.bump_index > h.capacity || h.free_list_len > h.bump_index) {
        return ErrorCode::CORRUPT_STATE;
    }
    if ((h.free_list_len == 0) != (h.free_list_head == NIL_NODE)) {
        return ErrorCode::CORRUPT_STATE;
    }
    if ((h.leaf_count == 0) != (h.root_node == NIL_NODE)) {
        return ErrorCode::CORRUPT_STATE;
    }
    return ErrorCode::OK;
}

std::optional<NodeHandle> Slab::allocate() noexcept {
    SlabHeader& h = *header_;

    if (h.free_list_len > 0) {
        const NodeHandle handle = h.free_list_head;
        SlabNode& slot = nodes_[handle];
        h.free_list_head = slot.tag == NodeTag::LAST_FREE ? NIL_NODE : slot.free.next;
        --h.free_list_len;
        std::memset(&slot, 0, sizeof(SlabNode));
        return handle;
    }

    if (STRATA_UNLIKELY(h.bump_index >= h.capacity)) {
        return std::nullopt;
    }

    const auto handle = static_cast<NodeHandle>(h.bump_index++);
    std::memset(&nodes_[handle], 0, sizeof(SlabNode));
    return handle;
}

ErrorCode Slab::free(NodeHandle handle) noexcept {
    SlabHeader& h = *header_;

    if (STRATA_UNLIKELY(handle >= h.bump_index)) {
        logger().error("slab free of index {} beyond bump index {}", handle, h.bump_index);
        return ErrorCode::CORRUPT_STATE;
    }

    SlabNode& slot = nodes_[handle];
    if (STRATA_UNLIKELY(slot.tag == NodeTag::FREE || slot.tag == NodeTag::LAST_FREE)) {
        logger().error("slab double free of index {}", handle);
        return ErrorCode::CORRUPT_STATE;
    }

    slot.tag = h.free_list_len == 0 ? NodeTag::LAST_FREE : NodeTag::FREE;
    slot.free.next = h.free_list_head;
    h.free_list_head = handle;
    ++h.free_list_len;
    return ErrorCode::OK;
}

SlabNode* Slab::node(NodeHandle handle) noexcept {
    return handle < header_->bump_index ? &nodes_[handle] : nullptr;
}

const SlabNode* Slab::node(NodeHandle handle) const noexcept {
    return handle < header_->bump_index ? &nodes_[handle] : nullptr;
}

} // namespace strata::slab
