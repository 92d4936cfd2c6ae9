#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/manifest.hpp"
#include "mefw/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mefw {

// ============================================================================
// Gen 2 Directory Layout (ME 6 to ME 10)
// ============================================================================
//
// A Gen 2 code partition starts with its $MN2 manifest. The directory header
// follows the manifest header and is followed by num_modules $MME records.

constexpr char GEN2_MODULE_MAGIC[] = "$MME";
constexpr size_t GEN2_HEADER_SIZE = 12;         // name[4] + pad[8]
constexpr size_t GEN2_MODULE_SIZE = 0x60;
constexpr size_t GEN2_MODULE_HASH_SIZE = 32;

struct Gen2Module {
    size_t index = 0;
    size_t record_offset = 0;       // absolute offset of the $MME record
    std::string name;
    Range hash;
    uint32_t base = 0;
    uint32_t offset = 0;            // relative to the partition start
    uint32_t code_size = 0;
    uint32_t size = 0;              // stored size
    uint32_t memory_size = 0;
    uint32_t pre_uma_size = 0;
    uint32_t entry_point = 0;
    uint32_t flags = 0;
    size_t absolute_offset = 0;
    bool range_valid = true;

    Range range() const { return Range{absolute_offset, size}; }
    Compression compression() const { return compression_from_code((flags >> 4) & 0x7); }
    uint32_t rapi() const { return (flags >> 17) & 0x7; }
    uint32_t kapi() const { return (flags >> 20) & 0x3; }
    // Code starts after the RAPI and KAPI pages
    uint32_t code_start() const { return base + (rapi() + kapi()) * 0x1000; }
};

struct Gen2Directory {
    size_t offset = 0;              // absolute offset of the directory header
    std::string name;
    std::vector<Gen2Module> modules;

    const Gen2Module* find(const std::string& name) const;
};

struct Gen2DecodeResult {
    bool ok = false;
    std::string error;
    Manifest manifest;
    Gen2Directory directory;
};

// $MN2 at the manifest tag offset and no $CPD at the start
bool is_gen2_partition(const ByteCursor& partition);

// ok is false only when the leading manifest cannot be decoded. Module records
// that cannot be read end the table with a diagnostic.
Gen2DecodeResult decode_gen2(const ByteCursor& partition, DiagnosticSink& sink);

} // namespace mefw
