#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mefw {

// ============================================================================
// ME Flash File System Layout
// ============================================================================
//
// The MFS partition is a sequence of fixed-size pages. Gen 3 (ME 11 and later)
// pages carry an 18-byte header, a slot array and 66-byte chunks (64 data
// bytes and a CRC-16). System pages hold the volume header and the file
// allocation table, data pages hold file contents. One page is kept blank for
// wear levelling. Gen 2 (ME 10 and earlier) uses larger pages with a
// different, page-numbered header.

constexpr uint32_t MFS_GEN3_PAGE_MAGIC = 0xAA557887;
constexpr size_t MFS_GEN3_PAGE_SIZE = 0x2000;
constexpr uint32_t MFS_GEN2_PAGE_MAGIC_MASK = 0xFFF07800;
constexpr size_t MFS_GEN2_PAGE_SIZE = 0x4000;
constexpr size_t MFS_GEN2_PAGE_HEADER_SIZE = 20;
constexpr char MFS_GEN2_VOLUME_MAGIC[] = "MFS\0";

constexpr size_t MFS_PAGE_HEADER_SIZE = 18;
constexpr size_t MFS_PAGE_CHECKSUM_SPAN = 16;     // header bytes covered by the CRC-8
constexpr size_t MFS_CHUNK_DATA_SIZE = 0x40;
constexpr size_t MFS_CHUNK_SIZE = MFS_CHUNK_DATA_SIZE + 2;

constexpr size_t MFS_SYS_PAGE_CHUNKS = 120;
constexpr size_t MFS_SYS_PAGE_SLOTS = MFS_SYS_PAGE_CHUNKS + 1;
constexpr size_t MFS_SYS_CHUNKS_OFFSET = MFS_PAGE_HEADER_SIZE + 2 * MFS_SYS_PAGE_SLOTS;
constexpr size_t MFS_DATA_PAGE_CHUNKS = 122;
constexpr size_t MFS_DATA_CHUNKS_OFFSET = MFS_PAGE_HEADER_SIZE + MFS_DATA_PAGE_CHUNKS;

constexpr uint16_t MFS_SLOT_UNUSED = 0xFFFF;
constexpr uint16_t MFS_SLOT_LAST = 0x7FFF;
constexpr uint8_t MFS_DATA_SLOT_FREE = 0xFF;

constexpr uint32_t MFS_VOLUME_MAGIC = 0x724F6201;
constexpr size_t MFS_VOLUME_HEADER_SIZE = 14;

// File allocation table markers
constexpr uint16_t MFS_FAT_NONE = 0x0000;
constexpr uint16_t MFS_FAT_EMPTY = 0xFFFF;

enum class MfsGeneration {
    Gen2,
    Gen3,
};

inline const char* mfs_generation_to_string(MfsGeneration g) {
    switch (g) {
        case MfsGeneration::Gen2: return "gen2";
        case MfsGeneration::Gen3: return "gen3";
        default: return "gen3";
    }
}

enum class MfsPageKind {
    System,
    Data,
    Blank,
};

inline const char* mfs_page_kind_to_string(MfsPageKind k) {
    switch (k) {
        case MfsPageKind::System: return "system";
        case MfsPageKind::Data: return "data";
        case MfsPageKind::Blank: return "blank";
        default: return "blank";
    }
}

struct MfsChunk {
    uint16_t index = 0;
    size_t offset = 0;              // absolute offset of the 64 data bytes
};

struct MfsPage {
    size_t offset = 0;              // absolute
    MfsPageKind kind = MfsPageKind::Blank;
    uint32_t usn = 0;               // update sequence number
    uint32_t erase_count = 0;
    uint16_t next_erase = 0;
    uint16_t first_chunk = 0;       // zero on system pages
    uint8_t checksum = 0;
    bool checksum_valid = false;
    size_t free_chunks = 0;
    std::vector<MfsChunk> chunks;
};

struct MfsGen2Page {
    size_t offset = 0;
    uint8_t number = 0;
    uint8_t flags = 0;

    // Page numbers 0x00 and 0xff mark unused pages
    bool active() const { return number != 0x00 && number != 0xFF; }
};

struct MfsVolumeHeader {
    uint32_t magic = 0;
    uint32_t version = 0;
    uint32_t chunk_bytes_total = 0;
    uint16_t files = 0;
};

enum class MfsFileState {
    None,       // slot never used
    Empty,      // allocated with no data
    Present,
    Broken,     // chain leaves the table or hits a missing chunk
};

inline const char* mfs_file_state_to_string(MfsFileState s) {
    switch (s) {
        case MfsFileState::None: return "none";
        case MfsFileState::Empty: return "empty";
        case MfsFileState::Present: return "present";
        case MfsFileState::Broken: return "broken";
        default: return "none";
    }
}

struct MfsFile {
    uint32_t index = 0;
    MfsFileState state = MfsFileState::None;
    std::vector<Range> extents;     // chunk data in file order
    std::string error;              // set when Broken

    size_t size() const;
};

struct MfsVolume {
    MfsGeneration generation = MfsGeneration::Gen3;
    Range range;
    size_t page_size = 0;

    // Gen 3
    std::vector<MfsPage> pages;     // image order
    std::optional<size_t> blank_page;
    uint16_t system_chunks = 0;     // index of the first data chunk
    size_t data_chunks = 0;         // capacity of the data pages
    std::map<uint16_t, size_t> chunks;  // chunk index -> absolute data offset
    std::optional<MfsVolumeHeader> header;
    std::vector<MfsFile> files;

    // Gen 2
    std::vector<MfsGen2Page> gen2_pages;
    bool gen2_volume_magic = false;

    size_t page_count(MfsPageKind kind) const;
    const MfsFile* file(uint32_t index) const;
};

struct MfsDecodeResult {
    bool ok = false;
    std::string error;
    MfsVolume volume;
};

// FPT names of partitions holding an MFS volume
bool is_mfs_partition(const std::string& name);

// ok is false only when no page of either generation is recognised; that case
// is reported as signature_not_found. Checksum, allocation and chain problems
// are reported through the sink and the volume is kept.
MfsDecodeResult decode_mfs(const ByteCursor& partition, DiagnosticSink& sink);

// CRC-8 (polynomial 0x07, initial value 1) over the first 16 page header bytes
uint8_t mfs_page_checksum(const ByteView& header);

// CRC-16/CCITT-FALSE over the chunk data followed by the little-endian index
uint16_t mfs_chunk_checksum(const ByteView& data, uint16_t chunk_index);

// System page slots hold the chunk index XORed with this value, derived from
// the index of the previous chunk on the page (zero before the first).
uint16_t mfs_next_chunk_index(uint16_t previous);

// Contents of a present file, nullopt otherwise
std::optional<std::vector<uint8_t>> read_mfs_file(const ByteCursor& image, const MfsFile& file);

} // namespace mefw
