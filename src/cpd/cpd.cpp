#include "mefw/cpd.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace mefw {

namespace {

constexpr size_t CPD_CRC_OFFSET = 0x10;

bool ends_with(const std::string& s, const char* suffix) {
    std::string tail(suffix);
    return s.size() > tail.size() && s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
}

bool decode_header(const ByteCursor& partition, CpdHeader& header, DiagnosticSink& sink) {
    FieldReader r(partition, 4);
    header.offset = partition.base();
    header.entry_count = r.u32();
    header.header_version = r.u8();
    header.entry_version = r.u8();
    header.header_length = r.u8();
    header.checksum = r.u8();
    header.partition_name = r.ascii(4);

    // Version 2 appends a CRC32 and grows the header to 0x14 bytes
    if (r.ok() && (header.header_version == 2 || header.header_length == CPD_HEADER_V2_SIZE)) {
        uint32_t crc = r.u32();
        if (r.ok()) header.crc32 = crc;
    }

    if (!r.ok()) {
        sink.emit(DiagnosticKind::out_of_bounds, Layer::Cpd, partition.absolute(r.failed_at()),
                  "CPD header truncated");
        return false;
    }
    return true;
}

} // namespace

bool CpdEntry::is_metadata() const {
    return ends_with(name, METADATA_SUFFIX);
}

const CpdEntry* CodePartitionDirectory::find(const std::string& name) const {
    for (const auto& e : entries) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

const CpdEntry* CodePartitionDirectory::manifest_entry() const {
    if (!manifest_index) return nullptr;
    return &entries[*manifest_index];
}

const MetadataEntry* CodePartitionDirectory::metadata_for(const std::string& module) const {
    for (const auto& m : metadata) {
        if (m.module_name == module) return &m;
    }
    return nullptr;
}

bool has_cpd_signature(const ByteCursor& partition) {
    return partition.matches(0, CPD_MAGIC, 4);
}

bool is_manifest_name(const std::string& entry_name, const std::string& partition_name) {
    if (entry_name == RESERVED_MANIFEST_NAME) return true;
    return !partition_name.empty() && entry_name == partition_name + MANIFEST_SUFFIX;
}

uint32_t cpd_crc32(const ByteView& header_and_table) {
    static const uint8_t zeros[4] = {0, 0, 0, 0};

    uLong crc = crc32(0L, Z_NULL, 0);
    if (header_and_table.size < CPD_CRC_OFFSET + 4) {
        return static_cast<uint32_t>(crc32(crc, header_and_table.data,
                                           static_cast<uInt>(header_and_table.size)));
    }
    crc = crc32(crc, header_and_table.data, static_cast<uInt>(CPD_CRC_OFFSET));
    crc = crc32(crc, zeros, 4);
    size_t rest = header_and_table.size - CPD_CRC_OFFSET - 4;
    crc = crc32(crc, header_and_table.data + CPD_CRC_OFFSET + 4, static_cast<uInt>(rest));
    return static_cast<uint32_t>(crc);
}

CpdDecodeResult decode_cpd(const ByteCursor& partition, DiagnosticSink& sink,
                           bool decode_metadata) {
    CpdDecodeResult result;
    CodePartitionDirectory& dir = result.directory;

    if (!has_cpd_signature(partition)) {
        result.error = "CPD signature not found";
        return result;
    }
    if (!decode_header(partition, dir.header, sink)) {
        result.error = "CPD header truncated";
        return result;
    }
    result.ok = true;

    const CpdHeader& header = dir.header;
    const size_t table_size = static_cast<size_t>(header.entry_count) * CPD_ENTRY_SIZE;
    size_t table_end = 0;
    if (!checked_add(header.size(), table_size, table_end) || table_end > partition.size()) {
        sink.emit(DiagnosticKind::malformed_header, Layer::Cpd, header.offset,
                  "CPD table of " + std::to_string(header.entry_count) + " entries needs " +
                      to_hex(table_size) + " bytes, partition has " +
                      to_hex(partition.size() - header.size()));
        return result;
    }

    if (header.crc32) {
        auto raw = partition.read_bytes(0, table_end);
        dir.header.crc_valid = raw && cpd_crc32(*raw) == *header.crc32;
        if (!dir.header.crc_valid) {
            sink.emit(DiagnosticKind::checksum_mismatch, Layer::Cpd, header.offset,
                      "CPD crc32 " + to_hex(*header.crc32) + " does not match header and table");
        }
    }

    spdlog::debug("CPD {} at {:#x}: {} entries", header.partition_name, header.offset,
                  header.entry_count);

    for (uint32_t i = 0; i < header.entry_count; ++i) {
        const size_t pos = header.size() + static_cast<size_t>(i) * CPD_ENTRY_SIZE;
        FieldReader r(partition, pos);

        CpdEntry entry;
        entry.index = i;
        entry.record_offset = partition.absolute(pos);
        entry.name = r.ascii(12);
        uint32_t raw_offset = r.u32();
        entry.length = r.u32();
        entry.reserved = r.u32();
        entry.offset = raw_offset & CPD_OFFSET_MASK;
        entry.compressed = (raw_offset & CPD_COMPRESSED_FLAG) != 0;
        entry.absolute_offset = partition.absolute(entry.offset);

        if (!partition.contains(entry.offset, entry.length)) {
            entry.range_valid = false;
            sink.emit(DiagnosticKind::invalid_entry_range, Layer::Cpd, entry.record_offset,
                      "CPD entry " + entry.name + " range " + to_hex(entry.offset) + "+" +
                          to_hex(entry.length) + " exceeds partition of " + to_hex(partition.size()));
        }

        if (is_manifest_name(entry.name, header.partition_name)) {
            if (dir.manifest_index) {
                sink.emit(DiagnosticKind::duplicate_manifest, Layer::Cpd, entry.record_offset,
                          "manifest entry " + entry.name + " duplicates entry " +
                              std::to_string(*dir.manifest_index));
            } else {
                dir.manifest_index = i;
            }
        }

        if (decode_metadata && entry.is_metadata() && entry.range_valid) {
            MetadataEntry meta;
            meta.entry_index = i;
            meta.module_name = entry.name.substr(0, entry.name.size() - 4);
            meta.extensions = decode_extensions(*partition.sub(entry.offset, entry.length), sink);
            dir.metadata.push_back(std::move(meta));
        }

        dir.entries.push_back(std::move(entry));
    }

    for (auto& meta : dir.metadata) {
        for (const auto& e : dir.entries) {
            if (e.name == meta.module_name) {
                meta.module_index = e.index;
                break;
            }
        }
    }

    return result;
}

} // namespace mefw
