#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mefw {

// ============================================================================
// Firmware Interface Table
// ============================================================================
//
// Present only in full flash images. The BIOS region ends at 4 GiB in the
// host address space; the pointer 0x40 bytes before the end of the image is
// a host address that maps back into the image.

constexpr char FIT_MAGIC[] = "_FIT_   ";
constexpr size_t FIT_POINTER_FROM_END = 0x40;
constexpr size_t FIT_ENTRY_SIZE = 16;
constexpr uint8_t FIT_TYPE_MASK = 0x7F;
constexpr uint8_t FIT_CHECKSUM_VALID = 0x80;

struct FitEntry {
    size_t record_offset = 0;
    uint64_t address = 0;
    uint32_t size = 0;              // 24-bit, unit depends on the type
    uint16_t version = 0;
    uint8_t type = 0;
    bool checksum_valid = false;
    uint8_t checksum = 0;
};

struct Fit {
    uint32_t pointer = 0;           // host address read from the image
    size_t offset = 0;              // absolute offset of the header
    uint32_t entry_count = 0;       // declared, header excluded
    uint16_t version = 0;
    bool checksum_valid = false;
    uint8_t checksum = 0;
    std::vector<FitEntry> entries;
};

struct FitDecodeResult {
    bool ok = false;
    std::string error;
    Fit fit;
};

// Host address of the last image byte
constexpr uint64_t FIT_ADDRESS_SPACE_END = 0x100000000ULL;

// Locate and decode the FIT. A missing pointer or header fails without a
// diagnostic; only a located table reports problems through the sink.
FitDecodeResult decode_fit(const ByteCursor& image, DiagnosticSink& sink);

// Human readable name of an entry type
const char* fit_entry_type_name(uint8_t type);

} // namespace mefw
