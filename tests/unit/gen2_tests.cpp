#include <doctest/doctest.h>
#include <mefw/gen2.hpp>

#include "image_builder.hpp"

using namespace mefw;
using namespace mefw::test;

namespace {

constexpr size_t BASE = 0x5000;
constexpr size_t HEADER_AT = 0x284;
constexpr size_t TABLE_AT = HEADER_AT + GEN2_HEADER_SIZE;

Gen2DecodeResult decode(const Bytes& partition, DiagnosticSink& sink) {
    return decode_gen2(ByteCursor(partition.data(), partition.size(), BASE), sink);
}

} // namespace

TEST_CASE("Gen 2 partition detection") {
    Bytes gen2 = gen2_partition("FTPR", {{"BUP", Bytes(0x10, 1)}});
    CHECK(is_gen2_partition(ByteCursor(gen2.data(), gen2.size())));

    Bytes dir = cpd("FTPR", {{"FTPR.man", manifest({})}});
    CHECK_FALSE(is_gen2_partition(ByteCursor(dir.data(), dir.size())));

    Bytes blank(0x100, 0xFF);
    CHECK_FALSE(is_gen2_partition(ByteCursor(blank.data(), blank.size())));
}

TEST_CASE("Gen 2 module records decode") {
    Bytes part = gen2_partition("FTPR", {{"BUP", Bytes(0x30, 0x22)}, {"KERNEL", Bytes(0x20, 0x33), 2}});

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(result.manifest.num_modules == 2);
    CHECK(result.manifest.offset == BASE);
    // The extension region is the directory, not decoded as records
    CHECK(result.manifest.extensions.records.empty());

    const auto& dir = result.directory;
    CHECK(dir.name == "FTPR");
    CHECK(dir.offset == BASE + HEADER_AT);
    REQUIRE(dir.modules.size() == 2);

    const auto& bup = dir.modules[0];
    CHECK(bup.name == "BUP");
    CHECK(bup.record_offset == BASE + TABLE_AT);
    CHECK(bup.hash == Range{BASE + TABLE_AT + 20, GEN2_MODULE_HASH_SIZE});
    CHECK(bup.base == 0x20000000);
    CHECK(bup.size == 0x30);
    CHECK(bup.offset == TABLE_AT + 2 * GEN2_MODULE_SIZE);
    CHECK(bup.absolute_offset == BASE + bup.offset);
    CHECK(bup.range() == Range{BASE + bup.offset, 0x30});
    CHECK(bup.compression() == Compression::None);
    CHECK(bup.rapi() == 1);
    CHECK(bup.kapi() == 0);
    CHECK(bup.code_start() == 0x20001000);
    CHECK(bup.range_valid);

    const auto& kernel = dir.modules[1];
    CHECK(kernel.compression() == Compression::Lzma);
    CHECK(kernel.offset == bup.offset + 0x30);

    CHECK(dir.find("KERNEL") == &dir.modules[1]);
    CHECK(dir.find("kernel") == nullptr);
    CHECK(sink.diagnostics().empty());
}

TEST_CASE("missing $MME tag ends the module table") {
    Bytes part = gen2_partition("FTPR", {{"BUP", Bytes(0x10, 0)}, {"KERNEL", Bytes(0x10, 0)}});
    put_ascii(part, TABLE_AT + GEN2_MODULE_SIZE, "XXXX", 4);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(result.directory.modules.size() == 1);
    CHECK(sink.count(DiagnosticKind::signature_not_found) == 1);
    auto diags = sink.diagnostics();
    REQUIRE(diags.size() == 1);
    CHECK(diags[0].layer == Layer::Gen2);
}

TEST_CASE("module count beyond the partition is reported once") {
    Bytes part = gen2_partition("FTPR", {{"BUP", Bytes(0x10, 0)}});
    put_u32(part, 0x20, 50);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(result.directory.modules.size() == 1);
    CHECK(sink.count(DiagnosticKind::out_of_bounds) == 1);
}

TEST_CASE("module range outside the partition is retained and flagged") {
    Bytes part = gen2_partition("FTPR", {{"BUP", Bytes(0x10, 0)}});
    put_u32(part, TABLE_AT + 0x40, 0x100000);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    REQUIRE(result.directory.modules.size() == 1);
    CHECK_FALSE(result.directory.modules[0].range_valid);
    CHECK(sink.count(DiagnosticKind::invalid_entry_range) == 1);
}

TEST_CASE("directory header past the partition end") {
    Bytes part = manifest({});

    DiagnosticSink sink;
    auto result = decode(part, sink);
    REQUIRE(result.ok);
    CHECK(result.directory.modules.empty());
    CHECK(sink.count(DiagnosticKind::out_of_bounds) == 1);
}

TEST_CASE("unreadable manifest fails the Gen 2 decode") {
    Bytes part = gen2_partition("FTPR", {});
    part.resize(0x40);

    DiagnosticSink sink;
    auto result = decode(part, sink);
    CHECK_FALSE(result.ok);
    CHECK(sink.count(DiagnosticKind::malformed_manifest) == 1);
}
