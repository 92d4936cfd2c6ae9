#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/extensions.hpp"
#include "mefw/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mefw {

// ============================================================================
// Code Partition Directory Layout
// ============================================================================

constexpr char CPD_MAGIC[] = "$CPD";
constexpr size_t CPD_HEADER_SIZE = 0x10;
constexpr size_t CPD_HEADER_V2_SIZE = 0x14;     // adds crc32 after the name
constexpr size_t CPD_ENTRY_SIZE = 0x18;
constexpr uint32_t CPD_OFFSET_MASK = 0x01FFFFFF;
constexpr uint32_t CPD_COMPRESSED_FLAG = 1u << 25;  // Huffman compressed
constexpr char RESERVED_MANIFEST_NAME[] = "MANIFEST.MN2";
constexpr char MANIFEST_SUFFIX[] = ".man";
constexpr char METADATA_SUFFIX[] = ".met";

struct CpdHeader {
    size_t offset = 0;              // absolute offset of the $CPD signature
    uint32_t entry_count = 0;
    uint8_t header_version = 0;
    uint8_t entry_version = 0;
    uint8_t header_length = 0;
    uint8_t checksum = 0;
    std::string partition_name;
    std::optional<uint32_t> crc32;  // header version 2 only
    bool crc_valid = true;

    // Bytes the header occupies before the entry table
    size_t size() const { return crc32 ? CPD_HEADER_V2_SIZE : CPD_HEADER_SIZE; }
};

struct CpdEntry {
    size_t index = 0;
    size_t record_offset = 0;       // absolute offset of the 24-byte record
    std::string name;
    uint32_t offset = 0;            // relative to the partition start
    bool compressed = false;
    uint32_t length = 0;
    uint32_t reserved = 0;
    size_t absolute_offset = 0;
    bool range_valid = true;

    Range range() const { return Range{absolute_offset, length}; }
    bool is_metadata() const;
};

// Extension records stored in a `<module>.met` entry
struct MetadataEntry {
    size_t entry_index = 0;
    std::string module_name;
    std::optional<size_t> module_index;
    ExtensionRegion extensions;
};

struct CodePartitionDirectory {
    CpdHeader header;
    std::vector<CpdEntry> entries;
    std::optional<size_t> manifest_index;
    std::vector<MetadataEntry> metadata;

    const CpdEntry* find(const std::string& name) const;
    const CpdEntry* manifest_entry() const;
    const MetadataEntry* metadata_for(const std::string& module) const;
};

struct CpdDecodeResult {
    bool ok = false;
    std::string error;
    CodePartitionDirectory directory;
};

bool has_cpd_signature(const ByteCursor& partition);

// Exact, case-sensitive match against `<partition>.man` or MANIFEST.MN2
bool is_manifest_name(const std::string& entry_name, const std::string& partition_name);

// Decode the directory at the start of `partition`. ok is false when the
// signature is absent or the header is unreadable. A table that does not fit
// the partition is reported and leaves the directory without entries.
CpdDecodeResult decode_cpd(const ByteCursor& partition, DiagnosticSink& sink,
                           bool decode_metadata = true);

// CRC32 over header and table with the stored CRC field taken as zero
uint32_t cpd_crc32(const ByteView& header_and_table);

} // namespace mefw
