#include <doctest/doctest.h>
#include <mefw/mfs.hpp>

#include "image_builder.hpp"

#include <cstring>

using namespace mefw;
using namespace mefw::test;

namespace {

constexpr size_t BASE = 0x40000;

MfsDecodeResult decode(const Bytes& partition, DiagnosticSink& sink) {
    return decode_mfs(ByteCursor(partition.data(), partition.size(), BASE), sink);
}

Bytes pattern(size_t n, uint8_t seed) {
    Bytes b(n);
    for (size_t i = 0; i < n; ++i) b[i] = static_cast<uint8_t>(seed + i);
    return b;
}

MfsSpec sample_spec() {
    MfsSpec spec;
    spec.contents.push_back({2, pattern(10, 0x10)});
    spec.contents.push_back({3, pattern(84, 0x80)});
    spec.contents.push_back({5, {}});
    return spec;
}

// Overwrite a u16 inside system chunk i and fix up its checksum
void patch_system_chunk(Bytes& b, size_t i, size_t at, uint16_t value) {
    const size_t chunk = mfs_system_chunk_at(i);
    put_u16(b, chunk + at, value);
    put_u16(b, chunk + MFS_CHUNK_DATA_SIZE,
            mfs_chunk_checksum(ByteView{b.data() + chunk, MFS_CHUNK_DATA_SIZE},
                               static_cast<uint16_t>(i)));
}

} // namespace

TEST_CASE("MFS checksums") {
    const uint8_t header[] = {0x87, 0x78, 0x55, 0xaa, 0xb1, 0x28, 0x00, 0x00,
                              0xcd, 0x00, 0x00, 0x00, 0x1a, 0x00, 0x00, 0x00};
    CHECK(mfs_page_checksum(ByteView{header, sizeof(header)}) == 0xea);

    // CRC-16/CCITT-FALSE check value, with the index supplying "89"
    const char* digits = "1234567";
    CHECK(mfs_chunk_checksum(ByteView{reinterpret_cast<const uint8_t*>(digits), 7}, 0x3938) ==
          0x29B1);

    CHECK(mfs_next_chunk_index(0) == 0x0B5B);
    CHECK(mfs_next_chunk_index(1) == 0x386A);
}

TEST_CASE("MFS partition names") {
    CHECK(is_mfs_partition("MFS"));
    CHECK_FALSE(is_mfs_partition("FTPR"));
    CHECK_FALSE(is_mfs_partition("mfs"));
}

TEST_CASE("Gen 3 volume decodes pages, header and files") {
    Bytes part = mfs_volume(sample_spec());

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(sink.diagnostics().empty());

    const auto& v = result.volume;
    CHECK(v.generation == MfsGeneration::Gen3);
    CHECK(v.page_size == MFS_GEN3_PAGE_SIZE);
    CHECK(v.range == Range{BASE, part.size()});
    REQUIRE(v.pages.size() == 3);
    CHECK(v.pages[0].kind == MfsPageKind::System);
    CHECK(v.pages[0].checksum_valid);
    CHECK(v.pages[1].kind == MfsPageKind::Data);
    CHECK(v.pages[1].first_chunk == 16);
    CHECK(v.pages[1].chunks.size() == 3);
    CHECK(v.pages[1].free_chunks == MFS_DATA_PAGE_CHUNKS - 3);
    CHECK(v.pages[2].kind == MfsPageKind::Blank);
    REQUIRE(v.blank_page.has_value());
    CHECK(*v.blank_page == BASE + 2 * MFS_GEN3_PAGE_SIZE);
    CHECK(v.page_count(MfsPageKind::System) == 1);
    CHECK(v.page_count(MfsPageKind::Data) == 1);

    CHECK(v.system_chunks == 16);
    CHECK(v.data_chunks == 2 * MFS_DATA_PAGE_CHUNKS);

    REQUIRE(v.header.has_value());
    CHECK(v.header->magic == MFS_VOLUME_MAGIC);
    CHECK(v.header->version == 1);
    CHECK(v.header->files == 100);

    REQUIRE(v.files.size() == 100);
    CHECK(v.file(0)->state == MfsFileState::None);
    CHECK(v.file(5)->state == MfsFileState::Empty);
    CHECK(v.file(100) == nullptr);

    const MfsFile* small = v.file(2);
    REQUIRE(small != nullptr);
    CHECK(small->state == MfsFileState::Present);
    CHECK(small->size() == 10);
    REQUIRE(small->extents.size() == 1);
    CHECK(small->extents[0].offset == BASE + MFS_GEN3_PAGE_SIZE + MFS_DATA_CHUNKS_OFFSET);

    const MfsFile* two = v.file(3);
    REQUIRE(two != nullptr);
    CHECK(two->state == MfsFileState::Present);
    CHECK(two->extents.size() == 2);
    CHECK(two->size() == 84);

    ByteCursor image(part.data(), part.size(), BASE);
    auto content = read_mfs_file(image, *two);
    REQUIRE(content.has_value());
    CHECK(*content == pattern(84, 0x80));
    CHECK_FALSE(read_mfs_file(image, *v.file(5)).has_value());
}

TEST_CASE("page header checksum mismatch is reported and the page kept") {
    Bytes part = mfs_volume(sample_spec());
    part[MFS_GEN3_PAGE_SIZE + 8] ^= 0x01;

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(sink.count(DiagnosticKind::checksum_mismatch) == 1);
    auto diags = sink.diagnostics();
    REQUIRE(diags.size() == 1);
    CHECK(diags[0].layer == Layer::Mfs);
    CHECK(diags[0].offset == BASE + MFS_GEN3_PAGE_SIZE);

    CHECK_FALSE(result.volume.pages[1].checksum_valid);
    CHECK(result.volume.file(3)->state == MfsFileState::Present);
}

TEST_CASE("corrupt system chunk is dropped") {
    Bytes part = mfs_volume(sample_spec());
    part[mfs_system_chunk_at(0) + 1] ^= 0xFF;

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(sink.count(DiagnosticKind::checksum_mismatch) == 1);
    // Chunk 0 held the volume header
    CHECK(sink.count(DiagnosticKind::signature_not_found) == 1);
    CHECK(result.volume.chunks.count(0) == 0);
    CHECK_FALSE(result.volume.header.has_value());
    CHECK(result.volume.files.empty());
}

TEST_CASE("wrong volume magic") {
    Bytes part = mfs_volume(sample_spec());
    patch_system_chunk(part, 0, 0, 0x1234);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(sink.count(DiagnosticKind::signature_not_found) == 1);
    CHECK(sink.count(DiagnosticKind::checksum_mismatch) == 0);
    CHECK_FALSE(result.volume.header.has_value());
    CHECK(result.volume.pages.size() == 3);
}

TEST_CASE("file chain leaving the table is broken") {
    Bytes part = mfs_volume(sample_spec());
    // Table entry of file 2 sits at byte 14 + 2 * 2 of the system area
    patch_system_chunk(part, 0, MFS_VOLUME_HEADER_SIZE + 4, 0x0050);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    const MfsFile* f = result.volume.file(2);
    REQUIRE(f != nullptr);
    CHECK(f->state == MfsFileState::Broken);
    CHECK(f->extents.empty());
    CHECK_FALSE(f->error.empty());
    CHECK(sink.count(DiagnosticKind::malformed_header) == 1);

    // Other files are unaffected
    CHECK(result.volume.file(3)->state == MfsFileState::Present);
}

TEST_CASE("second blank page is reported") {
    MfsSpec spec = sample_spec();
    spec.pages = 4;
    Bytes part = mfs_volume(spec);
    std::memset(part.data() + 2 * MFS_GEN3_PAGE_SIZE, 0xFF, MFS_GEN3_PAGE_SIZE);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(result.volume.page_count(MfsPageKind::Blank) == 2);
    CHECK(*result.volume.blank_page == BASE + 2 * MFS_GEN3_PAGE_SIZE);
    CHECK(sink.count(DiagnosticKind::malformed_header) == 1);
}

TEST_CASE("bytes after the last page are trailing") {
    Bytes part = mfs_volume(sample_spec());
    part.resize(part.size() + 0x100, 0xFF);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(result.volume.pages.size() == 3);
    auto diags = sink.diagnostics();
    REQUIRE(diags.size() == 1);
    CHECK(diags[0].kind == DiagnosticKind::trailing_bytes);
    CHECK(diags[0].offset == BASE + 3 * MFS_GEN3_PAGE_SIZE);
}

TEST_CASE("erased partition has no MFS signature") {
    Bytes part(2 * MFS_GEN3_PAGE_SIZE, 0xFF);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    CHECK_FALSE(result.ok);
    CHECK(sink.count(DiagnosticKind::signature_not_found) == 1);

    Bytes small(0x200, 0x00);
    CHECK_FALSE(decode(small, sink).ok);
}

TEST_CASE("Gen 2 pages and volume tag") {
    Bytes part(2 * MFS_GEN2_PAGE_SIZE, 0xFF);
    put_u8(part, 0, 1);
    put_u8(part, 2, 0xF0);
    put_u32(part, 4, 0);
    put_ascii(part, 8, "MFS", 4);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(sink.diagnostics().empty());

    const auto& v = result.volume;
    CHECK(v.generation == MfsGeneration::Gen2);
    CHECK(v.page_size == MFS_GEN2_PAGE_SIZE);
    REQUIRE(v.gen2_pages.size() == 2);
    CHECK(v.gen2_pages[0].active());
    CHECK(v.gen2_pages[0].number == 1);
    CHECK(v.gen2_pages[0].flags == 0xF0);
    CHECK_FALSE(v.gen2_pages[1].active());
    CHECK(v.gen2_volume_magic);
    CHECK(v.pages.empty());

    put_ascii(part, 8, "XXXX", 4);
    DiagnosticSink untagged;
    auto missing = decode(part, untagged);
    REQUIRE(missing.ok);
    CHECK_FALSE(missing.volume.gen2_volume_magic);
    CHECK(untagged.count(DiagnosticKind::signature_not_found) == 1);
}
