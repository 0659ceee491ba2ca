#pragma once

/**
 * Bounded FIFO ring over a persisted region
 *
 * Single-threaded counterpart of a classic SPSC ring: the host serializes
 * invocations, so head/count are plain integers in the persisted header.
 *
 * Guarantees:
 * - 0 <= count <= capacity at all times, capacity fixed at init
 * - Strict FIFO; producers write at (head + count) % capacity
 * - Every pushed entry gets the next monotonic sequence number
 * - Full queue: REJECT returns the configured error, OVERWRITE_OLDEST drops
 *   the oldest entry and counts it; consumers see the dropped sequence numbers
 *   as a gap
 *
 * Region layout:
 *   [QueueHeader][T 0][T 1] ... [T capacity-1]
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <type_traits>

#include "common.hpp"
#include "error.hpp"
#include "logging.hpp"

namespace strata::queue {

struct QueueHeader {
    uint64_t head;
    uint64_t count;
    uint64_t capacity;
    SeqNum next_seq_num;        // Assigned to the next pushed entry
    SeqNum consumed_seq_num;    // Expected sequence number of the next pop
    uint64_t overwritten;       // Entries dropped by OVERWRITE_OLDEST
};

static_assert(sizeof(QueueHeader) == 48, "QueueHeader must stay 48 bytes");

template<typename T>
class RingQueue {
    static_assert(std::is_trivially_copyable_v<T>, "Persisted entries must be trivially copyable");

public:
    RingQueue() = default;

    RingQueue(uint8_t* region, size_t length, QueueFullPolicy policy, ErrorCode full_error) noexcept
        : header_(reinterpret_cast<QueueHeader*>(region))
        , entries_(reinterpret_cast<T*>(region + sizeof(QueueHeader)))
        , length_(length)
        , policy_(policy)
        , full_error_(full_error) {}

    [[nodiscard]] static constexpr size_t region_size(uint32_t capacity) noexcept {
        return sizeof(QueueHeader) + static_cast<size_t>(capacity) * sizeof(T);
    }

    [[nodiscard]] static ErrorCode init(uint8_t* region, size_t length, uint32_t capacity) noexcept {
        if (capacity == 0) {
            return ErrorCode::INVALID_CAPACITY;
        }
        if (length < region_size(capacity)) {
            return ErrorCode::REGION_TOO_SMALL;
        }
        std::memset(region, 0, region_size(capacity));
        reinterpret_cast<QueueHeader*>(region)->capacity = capacity;
        return ErrorCode::OK;
    }

    [[nodiscard]] ErrorCode validate() const noexcept {
        if (length_ < sizeof(QueueHeader)) {
            return ErrorCode::REGION_TOO_SMALL;
        }
        const QueueHeader& h = *header_;
        if (h.capacity == 0 || h.capacity > UINT32_MAX ||
            length_ < region_size(static_cast<uint32_t>(h.capacity)) ||
            h.head >= h.capacity || h.count > h.capacity) {
            return ErrorCode::CORRUPT_STATE;
        }
        return ErrorCode::OK;
    }

    /**
     * Append at the tail, assigning the next sequence number
     */
    [[nodiscard]] ErrorCode push(T item) noexcept {
        QueueHeader& h = *header_;

        if (STRATA_UNLIKELY(h.count == h.capacity)) {
            if (policy_ == QueueFullPolicy::REJECT) {
                return full_error_;
            }
            logger().warn("queue full, overwriting unconsumed entry seq {}", entries_[h.head].seq_num);
            h.head = (h.head + 1) % h.capacity;
            --h.count;
            ++h.overwritten;
        }

        item.seq_num = h.next_seq_num++;
        entries_[(h.head + h.count) % h.capacity] = item;
        ++h.count;
        return ErrorCode::OK;
    }

    [[nodiscard]] const T* front() const noexcept {
        return header_->count == 0 ? nullptr : &entries_[header_->head];
    }

    /**
     * i-th entry from the head (0 = oldest)
     */
    [[nodiscard]] const T* at(size_t i) const noexcept {
        const QueueHeader& h = *header_;
        return i < h.count ? &entries_[(h.head + i) % h.capacity] : nullptr;
    }

    std::optional<T> pop() noexcept {
        QueueHeader& h = *header_;
        if (h.count == 0) {
            return std::nullopt;
        }
        T item = entries_[h.head];
        h.head = (h.head + 1) % h.capacity;
        --h.count;
        h.consumed_seq_num = item.seq_num + 1;
        return item;
    }

    /**
     * Number of sequence numbers skipped between the last pop and the
     * current front (entries lost to overwriting)
     */
    [[nodiscard]] uint64_t gap_before_front() const noexcept {
        const T* item = front();
        if (item == nullptr || item->seq_num <= header_->consumed_seq_num) {
            return 0;
        }
        return item->seq_num - header_->consumed_seq_num;
    }

    [[nodiscard]] size_t size() const noexcept { return header_->count; }
    [[nodiscard]] size_t capacity() const noexcept { return header_->capacity; }
    [[nodiscard]] bool empty() const noexcept { return header_->count == 0; }
    [[nodiscard]] bool full() const noexcept { return header_->count == header_->capacity; }
    [[nodiscard]] uint64_t overwritten() const noexcept { return header_->overwritten; }
    [[nodiscard]] SeqNum next_seq_num() const noexcept { return header_->next_seq_num; }
    [[nodiscard]] QueueFullPolicy policy() const noexcept { return policy_; }

private:
    QueueHeader* header_{nullptr};
    T* entries_{nullptr};
    size_t length_{0};
    QueueFullPolicy policy_{QueueFullPolicy::REJECT};
    ErrorCode full_error_{ErrorCode::REQUEST_QUEUE_FULL};
};

} // namespace strata::queue
