#pragma once

#include "mefw/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mefw {

// Borrowed slice of the image buffer.
struct ByteView {
    const uint8_t* data = nullptr;
    size_t size = 0;
};

// ============================================================================
// Byte Cursor
// ============================================================================
//
// Bounds-checked, offset-addressable view over a region of the image. Offsets
// passed to the read functions are relative to the start of the view; base()
// is the absolute image offset of that start. A failed read (the OutOfBounds
// case) returns std::nullopt and never touches memory outside the view.

class ByteCursor {
public:
    ByteCursor() = default;
    ByteCursor(const uint8_t* data, size_t size, size_t base = 0)
        : data_(data), size_(size), base_(base) {}

    size_t size() const { return size_; }
    size_t base() const { return base_; }
    size_t absolute(size_t offset) const { return base_ + offset; }
    Range range() const { return Range{base_, size_}; }

    // True when [offset, offset + length) lies inside the view.
    bool contains(size_t offset, size_t length) const;

    std::optional<ByteView> read_bytes(size_t offset, size_t length) const;
    std::optional<uint8_t> read_u8(size_t offset) const;
    std::optional<uint16_t> read_u16_le(size_t offset) const;
    std::optional<uint32_t> read_u32_le(size_t offset) const;
    std::optional<uint64_t> read_u64_le(size_t offset) const;

    // Fixed-width ASCII field with trailing NUL padding removed.
    std::optional<std::string> read_ascii(size_t offset, size_t n) const;

    // True when the bytes at offset equal the given magic.
    bool matches(size_t offset, const char* magic, size_t n) const;

    // Narrow the view. The returned cursor keeps absolute addressing.
    std::optional<ByteCursor> sub(size_t offset, size_t length) const;

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t base_ = 0;
};

// Overflow-checked addition; false when a + b does not fit in size_t.
bool checked_add(size_t a, size_t b, size_t& out);

// ============================================================================
// Field Reader
// ============================================================================
//
// Sequential reader over a cursor for fixed-layout headers. The first failed
// read latches ok() to false; later reads return zero and do not advance.

class FieldReader {
public:
    explicit FieldReader(const ByteCursor& cursor, size_t position = 0)
        : cursor_(cursor), position_(position) {}

    uint8_t u8();
    uint16_t u16();
    uint32_t u32();
    std::string ascii(size_t n);
    void skip(size_t n);

    bool ok() const { return ok_; }
    size_t position() const { return position_; }
    // Relative offset of the first failed read, valid when !ok().
    size_t failed_at() const { return failed_at_; }

private:
    bool take(size_t n);

    ByteCursor cursor_;
    size_t position_ = 0;
    size_t failed_at_ = 0;
    bool ok_ = true;
};

} // namespace mefw
