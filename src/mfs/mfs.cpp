#include "mefw/mfs.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace mefw {

namespace {

// One system page in twelve; the rest minus the blank page hold data
constexpr size_t MFS_PAGES_PER_SYSTEM_PAGE = 12;

uint16_t crc16_update(uint16_t crc, uint8_t byte) {
    crc = static_cast<uint16_t>(crc ^ (static_cast<uint16_t>(byte) << 8));
    for (int i = 0; i < 8; ++i) {
        crc = static_cast<uint16_t>((crc & 0x8000) ? (crc << 1) ^ 0x1021 : crc << 1);
    }
    return crc;
}

uint16_t crc16_table(uint8_t byte) {
    return crc16_update(0, byte);
}

bool decode_page_header(const ByteCursor& page, MfsPage& out, DiagnosticSink& sink) {
    FieldReader r(page, 4);
    out.usn = r.u32();
    out.erase_count = r.u32();
    out.next_erase = r.u16();
    out.first_chunk = r.u16();
    out.checksum = r.u8();
    if (!r.ok()) {
        sink.emit(DiagnosticKind::out_of_bounds, Layer::Mfs, page.absolute(r.failed_at()),
                  "MFS page header truncated");
        return false;
    }

    auto span = page.read_bytes(0, MFS_PAGE_CHECKSUM_SPAN);
    out.checksum_valid = span && mfs_page_checksum(*span) == out.checksum;
    if (!out.checksum_valid) {
        sink.emit(DiagnosticKind::checksum_mismatch, Layer::Mfs, out.offset,
                  "MFS page checksum " + to_hex(out.checksum) + " does not match header");
    }
    return true;
}

void read_data_chunks(const ByteCursor& page, MfsPage& out) {
    for (size_t pos = 0; pos < MFS_DATA_PAGE_CHUNKS; ++pos) {
        auto slot = page.read_u8(MFS_PAGE_HEADER_SIZE + pos);
        const size_t at = MFS_DATA_CHUNKS_OFFSET + pos * MFS_CHUNK_SIZE;
        if (!slot || *slot == MFS_DATA_SLOT_FREE || !page.contains(at, MFS_CHUNK_SIZE)) {
            ++out.free_chunks;
            continue;
        }
        out.chunks.push_back({static_cast<uint16_t>(out.first_chunk + pos), page.absolute(at)});
    }
}

void read_system_chunks(const ByteCursor& page, MfsPage& out, DiagnosticSink& sink) {
    uint16_t index = 0;
    for (size_t pos = 0; pos < MFS_SYS_PAGE_CHUNKS; ++pos) {
        auto slot = page.read_u16_le(MFS_PAGE_HEADER_SIZE + 2 * pos);
        if (!slot || *slot == MFS_SLOT_UNUSED) {
            ++out.free_chunks;
            continue;
        }
        if (*slot == MFS_SLOT_LAST) {
            out.free_chunks += MFS_SYS_PAGE_CHUNKS - pos;
            break;
        }

        const size_t at = MFS_SYS_CHUNKS_OFFSET + pos * MFS_CHUNK_SIZE;
        auto data = page.read_bytes(at, MFS_CHUNK_DATA_SIZE);
        auto stored = page.read_u16_le(at + MFS_CHUNK_DATA_SIZE);
        if (!data || !stored) {
            sink.emit(DiagnosticKind::out_of_bounds, Layer::Mfs, page.absolute(at),
                      "MFS system chunk " + std::to_string(pos) + " beyond page");
            break;
        }

        index = static_cast<uint16_t>(mfs_next_chunk_index(index) ^ *slot);
        const uint16_t computed = mfs_chunk_checksum(*data, index);
        if (computed != *stored) {
            sink.emit(DiagnosticKind::checksum_mismatch, Layer::Mfs, page.absolute(at),
                      "MFS chunk " + std::to_string(index) + " checksum " + to_hex(computed) +
                          " does not match stored " + to_hex(*stored));
            continue;
        }
        out.chunks.push_back({index, page.absolute(at)});
    }
}

// Follow a file's chain through the allocation table. Values of at most one
// chunk's worth are the byte count of the final chunk.
void resolve_file(MfsVolume& volume, const std::vector<uint16_t>& fat, uint32_t index,
                  MfsFile& file) {
    const size_t n_files = volume.header->files;
    uint16_t node = fat[index];
    if (node == MFS_FAT_NONE) return;
    if (node == MFS_FAT_EMPTY) {
        file.state = MfsFileState::Empty;
        return;
    }

    file.state = MfsFileState::Broken;
    for (size_t steps = 0; steps < fat.size(); ++steps) {
        if (node < n_files || node >= fat.size()) {
            file.error = "node " + std::to_string(node) + " outside the chunk table";
            file.extents.clear();
            return;
        }
        const size_t chunk_index = node + volume.system_chunks - n_files;
        auto chunk = volume.chunks.find(static_cast<uint16_t>(chunk_index));
        if (chunk_index > UINT16_MAX || chunk == volume.chunks.end()) {
            file.error = "chunk " + std::to_string(chunk_index) + " missing";
            file.extents.clear();
            return;
        }

        node = fat[node];
        if (node > 0 && node <= MFS_CHUNK_DATA_SIZE) {
            file.extents.push_back(Range{chunk->second, node});
            file.state = MfsFileState::Present;
            file.error.clear();
            return;
        }
        file.extents.push_back(Range{chunk->second, MFS_CHUNK_DATA_SIZE});
    }
    file.error = "chain does not terminate";
    file.extents.clear();
}

void decode_files(const ByteCursor& partition, MfsVolume& volume, DiagnosticSink& sink) {
    // The system area is the concatenation of system chunks; unwritten ones
    // read as zero.
    std::vector<uint8_t> system_area(static_cast<size_t>(volume.system_chunks) *
                                     MFS_CHUNK_DATA_SIZE, 0);
    const size_t base = partition.base();
    for (const auto& [index, offset] : volume.chunks) {
        if (index >= volume.system_chunks) break;
        auto data = partition.read_bytes(offset - base, MFS_CHUNK_DATA_SIZE);
        if (!data) continue;
        std::memcpy(system_area.data() + static_cast<size_t>(index) * MFS_CHUNK_DATA_SIZE,
                    data->data, MFS_CHUNK_DATA_SIZE);
    }

    const size_t entries = volume.header->files + volume.data_chunks;
    if (MFS_VOLUME_HEADER_SIZE + entries * 2 > system_area.size()) {
        sink.emit(DiagnosticKind::malformed_header, Layer::Mfs, volume.range.offset,
                  "MFS allocation table of " + std::to_string(entries) +
                      " entries exceeds the system area of " + to_hex(system_area.size()));
        return;
    }

    std::vector<uint16_t> fat(entries);
    for (size_t i = 0; i < entries; ++i) {
        const size_t at = MFS_VOLUME_HEADER_SIZE + i * 2;
        fat[i] = static_cast<uint16_t>(system_area[at] | (system_area[at + 1] << 8));
    }

    volume.files.resize(volume.header->files);
    for (uint32_t i = 0; i < volume.header->files; ++i) {
        MfsFile& file = volume.files[i];
        file.index = i;
        resolve_file(volume, fat, i, file);
        if (file.state == MfsFileState::Broken) {
            sink.emit(DiagnosticKind::malformed_header, Layer::Mfs, volume.range.offset,
                      "MFS file " + std::to_string(i) + ": " + file.error);
        }
    }
}

void decode_gen3(const ByteCursor& partition, MfsVolume& volume, DiagnosticSink& sink) {
    volume.page_size = MFS_GEN3_PAGE_SIZE;
    const size_t n_pages = partition.size() / MFS_GEN3_PAGE_SIZE;

    for (size_t i = 0; i < n_pages; ++i) {
        auto page = partition.sub(i * MFS_GEN3_PAGE_SIZE, MFS_GEN3_PAGE_SIZE);
        if (!page) break;

        MfsPage out;
        out.offset = page->base();
        if (page->read_u32_le(0) != MFS_GEN3_PAGE_MAGIC) {
            if (volume.blank_page) {
                sink.emit(DiagnosticKind::malformed_header, Layer::Mfs, out.offset,
                          "second blank MFS page, first at " + to_hex(*volume.blank_page));
            } else {
                volume.blank_page = out.offset;
            }
            volume.pages.push_back(std::move(out));
            continue;
        }

        if (!decode_page_header(*page, out, sink)) continue;
        if (out.first_chunk > 0) {
            out.kind = MfsPageKind::Data;
            read_data_chunks(*page, out);
        } else {
            out.kind = MfsPageKind::System;
            read_system_chunks(*page, out, sink);
        }
        volume.pages.push_back(std::move(out));
    }

    std::vector<const MfsPage*> system;
    std::vector<const MfsPage*> data;
    for (const auto& p : volume.pages) {
        if (p.kind == MfsPageKind::System) system.push_back(&p);
        if (p.kind == MfsPageKind::Data) data.push_back(&p);
    }
    std::stable_sort(system.begin(), system.end(),
                     [](const MfsPage* a, const MfsPage* b) { return a->usn < b->usn; });
    std::stable_sort(data.begin(), data.end(), [](const MfsPage* a, const MfsPage* b) {
        return a->first_chunk < b->first_chunk;
    });

    const size_t n_system_pages = n_pages / MFS_PAGES_PER_SYSTEM_PAGE;
    const size_t n_data_pages = n_pages > n_system_pages ? n_pages - n_system_pages - 1 : 0;
    volume.data_chunks = n_data_pages * MFS_DATA_PAGE_CHUNKS;

    if (data.empty()) {
        sink.emit(DiagnosticKind::malformed_header, Layer::Mfs, volume.range.offset,
                  "MFS volume has no data pages");
        return;
    }
    volume.system_chunks = data.front()->first_chunk;

    // Later system pages supersede earlier ones
    for (const MfsPage* p : system) {
        for (const auto& c : p->chunks) {
            if (c.index >= volume.system_chunks) {
                sink.emit(DiagnosticKind::malformed_header, Layer::Mfs, c.offset,
                          "system chunk " + std::to_string(c.index) + " beyond system area of " +
                              std::to_string(volume.system_chunks) + " chunks");
                continue;
            }
            volume.chunks[c.index] = c.offset;
        }
    }
    for (size_t i = 0; i < data.size(); ++i) {
        const MfsPage* p = data[i];
        const size_t expected = volume.system_chunks + i * MFS_DATA_PAGE_CHUNKS;
        if (p->first_chunk != expected) {
            sink.emit(DiagnosticKind::malformed_header, Layer::Mfs, p->offset,
                      "data page starts at chunk " + std::to_string(p->first_chunk) +
                          ", expected " + std::to_string(expected));
        }
        for (const auto& c : p->chunks) {
            if (!volume.chunks.emplace(c.index, c.offset).second) {
                sink.emit(DiagnosticKind::malformed_header, Layer::Mfs, c.offset,
                          "duplicate chunk " + std::to_string(c.index));
            }
        }
    }

    // The volume header opens chunk 0
    auto first = volume.chunks.find(0);
    if (first == volume.chunks.end()) {
        sink.emit(DiagnosticKind::signature_not_found, Layer::Mfs, volume.range.offset,
                  "MFS volume header chunk missing");
        return;
    }
    auto header_view = partition.sub(first->second - partition.base(), MFS_VOLUME_HEADER_SIZE);
    if (!header_view) {
        sink.emit(DiagnosticKind::out_of_bounds, Layer::Mfs, first->second,
                  "MFS volume header truncated");
        return;
    }
    FieldReader r(*header_view);
    MfsVolumeHeader header;
    header.magic = r.u32();
    header.version = r.u32();
    header.chunk_bytes_total = r.u32();
    header.files = r.u16();
    if (header.magic != MFS_VOLUME_MAGIC) {
        sink.emit(DiagnosticKind::signature_not_found, Layer::Mfs, first->second,
                  "MFS volume magic " + to_hex(header.magic) + " does not match " +
                      to_hex(MFS_VOLUME_MAGIC));
        return;
    }
    volume.header = header;

    decode_files(partition, volume, sink);
}

void decode_gen2_pages(const ByteCursor& partition, MfsVolume& volume, DiagnosticSink& sink) {
    volume.page_size = MFS_GEN2_PAGE_SIZE;
    const size_t n_pages = partition.size() / MFS_GEN2_PAGE_SIZE;

    for (size_t i = 0; i < n_pages; ++i) {
        const size_t at = i * MFS_GEN2_PAGE_SIZE;
        MfsGen2Page page;
        page.offset = partition.absolute(at);
        page.number = partition.read_u8(at).value_or(0xFF);
        page.flags = partition.read_u8(at + 2).value_or(0xFF);
        volume.gen2_pages.push_back(page);
    }

    const MfsGen2Page* first = nullptr;
    for (const auto& p : volume.gen2_pages) {
        if (p.active() && (!first || p.number < first->number)) first = &p;
    }
    if (!first) {
        sink.emit(DiagnosticKind::malformed_header, Layer::Mfs, volume.range.offset,
                  "Gen 2 MFS has no active pages");
        return;
    }

    // The lowest-numbered page carries the volume magic after the page header
    volume.gen2_volume_magic =
        partition.matches(first->offset - partition.base() + 8, MFS_GEN2_VOLUME_MAGIC, 4);
    if (!volume.gen2_volume_magic) {
        sink.emit(DiagnosticKind::signature_not_found, Layer::Mfs, first->offset + 8,
                  "Gen 2 MFS page " + std::to_string(first->number) + " lacks the MFS tag");
    }
}

bool has_gen3_page(const ByteCursor& partition) {
    for (size_t at = 0; at + MFS_GEN3_PAGE_SIZE <= partition.size(); at += MFS_GEN3_PAGE_SIZE) {
        if (partition.read_u32_le(at) == MFS_GEN3_PAGE_MAGIC) return true;
    }
    return false;
}

bool has_gen2_page(const ByteCursor& partition) {
    for (size_t at = 0; at + MFS_GEN2_PAGE_SIZE <= partition.size(); at += MFS_GEN2_PAGE_SIZE) {
        auto v = partition.read_u32_le(at);
        if (v && *v != 0xFFFFFFFF &&
            (*v & MFS_GEN2_PAGE_MAGIC_MASK) == MFS_GEN2_PAGE_MAGIC_MASK) {
            return true;
        }
    }
    return false;
}

} // namespace

size_t MfsFile::size() const {
    size_t total = 0;
    for (const auto& e : extents) total += e.length;
    return total;
}

size_t MfsVolume::page_count(MfsPageKind kind) const {
    return static_cast<size_t>(std::count_if(pages.begin(), pages.end(),
                                             [kind](const MfsPage& p) { return p.kind == kind; }));
}

const MfsFile* MfsVolume::file(uint32_t index) const {
    return index < files.size() ? &files[index] : nullptr;
}

bool is_mfs_partition(const std::string& name) {
    return name == "MFS";
}

uint8_t mfs_page_checksum(const ByteView& header) {
    uint8_t crc = 1;
    for (size_t i = 0; i < header.size; ++i) {
        crc ^= header.data[i];
        for (int bit = 0; bit < 8; ++bit) {
            crc = static_cast<uint8_t>((crc & 0x80) ? (crc << 1) ^ 0x07 : crc << 1);
        }
    }
    return crc;
}

uint16_t mfs_chunk_checksum(const ByteView& data, uint16_t chunk_index) {
    uint16_t crc = 0xFFFF;
    for (size_t i = 0; i < data.size; ++i) crc = crc16_update(crc, data.data[i]);
    crc = crc16_update(crc, static_cast<uint8_t>(chunk_index & 0xFF));
    crc = crc16_update(crc, static_cast<uint8_t>(chunk_index >> 8));
    return crc;
}

uint16_t mfs_next_chunk_index(uint16_t previous) {
    const uint8_t bytes[] = {static_cast<uint8_t>(previous & 0xFF),
                             static_cast<uint8_t>(previous >> 8)};
    uint16_t crc = 0x3FFF;
    for (uint8_t b : bytes) {
        const uint8_t i = static_cast<uint8_t>(b ^ (crc >> 8));
        crc = static_cast<uint16_t>((crc16_table(i) ^ (crc << 8)) & 0x3FFF);
    }
    return crc;
}

MfsDecodeResult decode_mfs(const ByteCursor& partition, DiagnosticSink& sink) {
    MfsDecodeResult result;
    MfsVolume& volume = result.volume;
    volume.range = partition.range();

    if (has_gen3_page(partition)) {
        volume.generation = MfsGeneration::Gen3;
        decode_gen3(partition, volume, sink);
    } else if (has_gen2_page(partition)) {
        volume.generation = MfsGeneration::Gen2;
        decode_gen2_pages(partition, volume, sink);
    } else {
        result.error = "no MFS page found";
        sink.emit(DiagnosticKind::signature_not_found, Layer::Mfs, partition.base(),
                  "no MFS page magic in " + to_hex(partition.size()) + " bytes");
        return result;
    }

    const size_t tail = partition.size() % volume.page_size;
    if (tail != 0) {
        sink.emit(DiagnosticKind::trailing_bytes, Layer::Mfs,
                  partition.absolute(partition.size() - tail),
                  std::to_string(tail) + " bytes after the last MFS page");
    }

    spdlog::debug("MFS {} at {:#x}: {} pages, {} chunks, {} files",
                  mfs_generation_to_string(volume.generation), volume.range.offset,
                  volume.pages.size() + volume.gen2_pages.size(), volume.chunks.size(),
                  volume.files.size());
    result.ok = true;
    return result;
}

std::optional<std::vector<uint8_t>> read_mfs_file(const ByteCursor& image, const MfsFile& file) {
    if (file.state != MfsFileState::Present) return std::nullopt;
    std::vector<uint8_t> out;
    out.reserve(file.size());
    for (const auto& e : file.extents) {
        auto bytes = image.read_bytes(e.offset - image.base(), e.length);
        if (!bytes) return std::nullopt;
        out.insert(out.end(), bytes->data, bytes->data + bytes->size);
    }
    return out;
}

} // namespace mefw
