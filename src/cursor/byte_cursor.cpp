#include "mefw/byte_cursor.hpp"

#include <cstring>
#include <limits>

namespace mefw {

bool checked_add(size_t a, size_t b, size_t& out) {
    if (b > std::numeric_limits<size_t>::max() - a) {
        return false;
    }
    out = a + b;
    return true;
}

// ============================================================================
// ByteCursor
// ============================================================================

bool ByteCursor::contains(size_t offset, size_t length) const {
    // Written without offset + length so attacker-controlled values cannot wrap
    return offset <= size_ && length <= size_ - offset;
}

std::optional<ByteView> ByteCursor::read_bytes(size_t offset, size_t length) const {
    if (!contains(offset, length)) {
        return std::nullopt;
    }
    return ByteView{data_ + offset, length};
}

std::optional<uint8_t> ByteCursor::read_u8(size_t offset) const {
    auto view = read_bytes(offset, 1);
    if (!view) return std::nullopt;
    return view->data[0];
}

std::optional<uint16_t> ByteCursor::read_u16_le(size_t offset) const {
    auto view = read_bytes(offset, 2);
    if (!view) return std::nullopt;
    const uint8_t* p = view->data;
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

std::optional<uint32_t> ByteCursor::read_u32_le(size_t offset) const {
    auto view = read_bytes(offset, 4);
    if (!view) return std::nullopt;
    const uint8_t* p = view->data;
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::optional<uint64_t> ByteCursor::read_u64_le(size_t offset) const {
    auto lo = read_u32_le(offset);
    if (!lo) return std::nullopt;
    size_t hi_offset = 0;
    if (!checked_add(offset, 4, hi_offset)) return std::nullopt;
    auto hi = read_u32_le(hi_offset);
    if (!hi) return std::nullopt;
    return static_cast<uint64_t>(*lo) | (static_cast<uint64_t>(*hi) << 32);
}

std::optional<std::string> ByteCursor::read_ascii(size_t offset, size_t n) const {
    auto view = read_bytes(offset, n);
    if (!view) return std::nullopt;

    // Some names are shorter than the field and padded with NUL
    size_t len = 0;
    while (len < n && view->data[len] != 0) {
        ++len;
    }
    return std::string(reinterpret_cast<const char*>(view->data), len);
}

bool ByteCursor::matches(size_t offset, const char* magic, size_t n) const {
    auto view = read_bytes(offset, n);
    return view && std::memcmp(view->data, magic, n) == 0;
}

std::optional<ByteCursor> ByteCursor::sub(size_t offset, size_t length) const {
    if (!contains(offset, length)) {
        return std::nullopt;
    }
    return ByteCursor(data_ + offset, length, base_ + offset);
}

// ============================================================================
// FieldReader
// ============================================================================

bool FieldReader::take(size_t n) {
    if (!ok_) return false;
    if (!cursor_.contains(position_, n)) {
        ok_ = false;
        failed_at_ = position_;
        return false;
    }
    return true;
}

uint8_t FieldReader::u8() {
    if (!take(1)) return 0;
    uint8_t v = *cursor_.read_u8(position_);
    position_ += 1;
    return v;
}

uint16_t FieldReader::u16() {
    if (!take(2)) return 0;
    uint16_t v = *cursor_.read_u16_le(position_);
    position_ += 2;
    return v;
}

uint32_t FieldReader::u32() {
    if (!take(4)) return 0;
    uint32_t v = *cursor_.read_u32_le(position_);
    position_ += 4;
    return v;
}

std::string FieldReader::ascii(size_t n) {
    if (!take(n)) return {};
    std::string v = *cursor_.read_ascii(position_, n);
    position_ += n;
    return v;
}

void FieldReader::skip(size_t n) {
    if (!take(n)) return;
    position_ += n;
}

} // namespace mefw
