#pragma once

/**
 * Positional binary encoding for instructions
 *
 * - No self-describing schema: a tag byte, then fixed-width fields in order
 * - Little-endian (native) integers, copied with memcpy (no alignment needed)
 * - No heap allocation, bounds-checked on every access
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>

namespace strata::codec {

/**
 * Bounds-checked writer over a caller-owned buffer
 *
 * Usage:
 *   uint8_t buffer[MAX_INSTRUCTION_SIZE];
 *   ByteWriter writer(buffer, sizeof(buffer));
 *   writer.put_uint8(tag);
 *   writer.put_uint64(owner);
 *   size_t len = writer.encoded_length();
 */
class ByteWriter {
public:
    ByteWriter() = default;

    ByteWriter(uint8_t* buffer, size_t capacity) noexcept
        : buffer_(buffer), capacity_(capacity), position_(0) {}

    bool put_uint8(uint8_t value) noexcept {
        if (overflow_ || position_ + 1 > capacity_) return fail();
        buffer_[position_++] = value;
        return true;
    }

    bool put_uint16(uint16_t value) noexcept { return put_raw(&value, 2); }
    bool put_uint32(uint32_t value) noexcept { return put_raw(&value, 4); }
    bool put_uint64(uint64_t value) noexcept { return put_raw(&value, 8); }

    [[nodiscard]] size_t encoded_length() const noexcept { return position_; }
    [[nodiscard]] size_t remaining() const noexcept { return capacity_ - position_; }

    /**
     * False once any put ran out of room; later puts are ignored
     */
    [[nodiscard]] bool ok() const noexcept { return !overflow_; }

private:
    bool put_raw(const void* value, size_t size) noexcept {
        if (overflow_ || position_ + size > capacity_) return fail();
        std::memcpy(buffer_ + position_, value, size);
        position_ += size;
        return true;
    }

    bool fail() noexcept {
        overflow_ = true;
        return false;
    }

    uint8_t* buffer_{nullptr};
    size_t capacity_{0};
    size_t position_{0};
    bool overflow_{false};
};

/**
 * Zero-copy reader
 */
class ByteReader {
public:
    ByteReader() = default;

    ByteReader(const uint8_t* buffer, size_t length) noexcept
        : buffer_(buffer), length_(length), position_(0) {}

    std::optional<uint8_t> get_uint8() noexcept {
        if (position_ + 1 > length_) return std::nullopt;
        return buffer_[position_++];
    }

    std::optional<uint16_t> get_uint16() noexcept { return get_raw<uint16_t>(); }
    std::optional<uint32_t> get_uint32() noexcept { return get_raw<uint32_t>(); }
    std::optional<uint64_t> get_uint64() noexcept { return get_raw<uint64_t>(); }

    [[nodiscard]] size_t position() const noexcept { return position_; }
    [[nodiscard]] size_t remaining() const noexcept { return length_ - position_; }
    [[nodiscard]] bool at_end() const noexcept { return position_ == length_; }

private:
    template<typename T>
    std::optional<T> get_raw() noexcept {
        if (position_ + sizeof(T) > length_) return std::nullopt;
        T value;
        std::memcpy(&value, buffer_ + position_, sizeof(T));
        position_ += sizeof(T);
        return value;
    }

    const uint8_t* buffer_{nullptr};
    size_t length_{0};
    size_t position_{0};
};

} // namespace strata::codec
