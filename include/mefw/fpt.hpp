#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mefw {

// ============================================================================
// Flash Partition Table Layout
// ============================================================================

constexpr char FPT_MAGIC[] = "$FPT";
constexpr size_t FPT_HEADER_SIZE = 0x20;
constexpr size_t FPT_ENTRY_SIZE = 0x20;
// Header fields up to and including flags; the FITC version follows
constexpr size_t FPT_HEADER_MIN_SIZE = 0x18;

// Offset 0, then after the 16-byte ROM bypass vector
std::vector<size_t> default_fpt_offsets();

// Step of the signature search when no candidate offset matches
constexpr size_t FPT_SCAN_STEP = 0x10;
constexpr size_t FPT_ROM_BYPASS_SIZE = 0x10;

// Start of the ME region holding a $FPT signature at the given offset. A
// signature 16 bytes past a 4 KiB boundary follows the ROM bypass vector and
// the region starts at that boundary; otherwise it starts at the signature.
size_t fpt_region_base(size_t signature_offset);

struct FptHeader {
    size_t offset = 0;              // absolute offset of the $FPT signature
    size_t region_base = 0;         // absolute start of the ME region
    uint32_t entry_count = 0;
    uint8_t header_version = 0;
    uint8_t entry_version = 0;
    uint8_t header_length = 0;
    uint8_t checksum = 0;
    uint16_t ticks_to_add = 0;
    uint16_t tokens_to_add = 0;
    uint32_t uma_size = 0;
    uint32_t flags = 0;
    std::optional<VersionQuad> fitc_version;  // not present in ME 7
    bool checksum_valid = false;
};

struct FptEntry {
    size_t index = 0;
    size_t record_offset = 0;       // absolute offset of the 32-byte record
    std::string name;               // NUL-trimmed, lookup key
    std::string owner;
    uint32_t offset = 0;            // relative to region_base
    uint32_t length = 0;
    uint32_t start_tokens = 0;
    uint32_t max_tokens = 0;
    uint32_t scratch_sectors = 0;
    uint32_t flags = 0;
    size_t region_base = 0;
    bool range_valid = true;        // false when flagged invalid_entry_range

    // Absolute range in the image
    Range range() const { return Range{region_base + offset, length}; }
    // Offset or length of zero denotes an unused placeholder entry. Only
    // meaningful once range_valid holds.
    bool is_placeholder() const { return offset == 0 || length == 0; }
};

struct FptDecodeResult {
    bool ok = false;
    std::string error;
    FptHeader header;
    std::vector<FptEntry> entries;
};

// Locate and decode the FPT. The candidate offsets are tried first; with
// scan set the image is then searched in FPT_SCAN_STEP steps. Only a missing
// signature fails the decode; unreadable or out-of-range entries are reported
// through the sink.
FptDecodeResult decode_fpt(const ByteCursor& image, const std::vector<size_t>& candidate_offsets,
                           DiagnosticSink& sink, bool scan = false);

// 8-bit two's complement sum over the header bytes; zero when valid.
uint8_t fpt_header_sum(const ByteView& header);

// ============================================================================
// Known Partitions
// ============================================================================

enum class PartitionType {
    Code,
    Data,
    None,
};

inline const char* partition_type_to_string(PartitionType t) {
    switch (t) {
        case PartitionType::Code: return "code";
        case PartitionType::Data: return "data";
        case PartitionType::None: return "none";
        default: return "none";
    }
}

struct KnownPartition {
    PartitionType type = PartitionType::None;
    const char* description = "";
};

// Classification of well-known FPT partition names
KnownPartition describe_partition(const std::string& name);

} // namespace mefw
