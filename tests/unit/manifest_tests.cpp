#include <doctest/doctest.h>
#include <mefw/manifest.hpp>

#include "image_builder.hpp"

using namespace mefw;
using namespace mefw::test;

namespace {

constexpr size_t BASE = 0x1040;

ManifestDecodeResult decode(const Bytes& entry, DiagnosticSink& sink) {
    return decode_manifest(ByteCursor(entry.data(), entry.size(), BASE), sink);
}

} // namespace

TEST_CASE("manifest fixed fields decode") {
    Bytes bytes = manifest({});

    DiagnosticSink sink;
    auto result = decode(bytes, sink);
    REQUIRE(result.ok);
    const Manifest& m = result.manifest;
    CHECK(m.offset == BASE);
    CHECK(m.header_type == 4);
    CHECK(m.header_length == 0xA1);
    CHECK(m.header_bytes() == 0x284);
    CHECK(m.vendor == VENDOR_INTEL);
    CHECK(m.vendor_name() == "Intel");
    CHECK(m.date_string() == "2019-04-15");
    CHECK(m.version.to_string() == "11.8.50.3425");
    CHECK(m.svn == 3);
    CHECK(m.modulus_size == 0x40);
    CHECK(m.exponent_size == 1);
    CHECK(sink.diagnostics().empty());
}

TEST_CASE("RSA material ranges follow the fixed header") {
    DiagnosticSink sink;
    Bytes bytes = manifest({});
    auto result = decode(bytes, sink);
    REQUIRE(result.ok);
    const Manifest& m = result.manifest;
    CHECK(m.rsa_modulus == Range{BASE + 0x80, 0x100});
    CHECK(m.rsa_exponent == Range{BASE + 0x180, 4});
    CHECK(m.rsa_signature == Range{BASE + 0x184, 0x100});
}

TEST_CASE("extension region spans header_length to size") {
    Bytes ext = concat({extension(0x7777, {}), extension(EXT_MODULE_ATTRIBUTES,
                                                         module_attributes_payload(0, 16, 16))});
    ManifestSpec spec;
    spec.extensions = ext;
    Bytes bytes = manifest(spec);

    DiagnosticSink sink;
    auto result = decode(bytes, sink);
    REQUIRE(result.ok);
    const auto& region = result.manifest.extensions;
    CHECK(region.range == Range{BASE + 0x284, ext.size()});
    CHECK(region.records.size() == 2);
    CHECK(region.trailing.empty());
    CHECK(sink.diagnostics().empty());
}

TEST_CASE("missing tag fails the manifest") {
    Bytes bytes = manifest({});
    bytes[0x1C] = 'X';

    DiagnosticSink sink;
    auto result = decode(bytes, sink);
    CHECK_FALSE(result.ok);
    CHECK(sink.count(DiagnosticKind::signature_not_found) == 1);
    CHECK(sink.count(DiagnosticKind::malformed_manifest) == 0);
}

TEST_CASE("truncated fixed fields fail the manifest") {
    Bytes bytes = manifest({});
    bytes.resize(0x70);

    DiagnosticSink sink;
    auto result = decode(bytes, sink);
    CHECK_FALSE(result.ok);
    auto diags = sink.diagnostics();
    REQUIRE(diags.size() == 1);
    CHECK(diags[0].kind == DiagnosticKind::malformed_manifest);
    CHECK(diags[0].layer == Layer::Manifest);
}

TEST_CASE("header length beyond the entry skips extensions") {
    ManifestSpec spec;
    spec.header_length = 0x1000;
    Bytes bytes = manifest(spec);

    DiagnosticSink sink;
    auto result = decode(bytes, sink);
    REQUIRE(result.ok);
    CHECK(result.manifest.extensions.records.empty());
    CHECK(result.manifest.extensions.range.empty());
    CHECK(sink.count(DiagnosticKind::malformed_manifest) == 1);
}

TEST_CASE("size smaller than header leaves the region empty") {
    ManifestSpec spec;
    spec.size = 0x10;
    Bytes bytes = manifest(spec);

    DiagnosticSink sink;
    auto result = decode(bytes, sink);
    REQUIRE(result.ok);
    CHECK(result.manifest.extensions.range.empty());
    CHECK(sink.count(DiagnosticKind::malformed_manifest) == 1);
}

TEST_CASE("size beyond the entry clamps the region") {
    ManifestSpec spec;
    spec.extensions = extension(0x7777, Bytes(8, 0));
    spec.size = 0xA1 + 0x100;
    Bytes bytes = manifest(spec);

    DiagnosticSink sink;
    auto result = decode(bytes, sink);
    REQUIRE(result.ok);
    CHECK(result.manifest.extensions.range.length == 16);
    CHECK(result.manifest.extensions.records.size() == 1);
    CHECK(sink.count(DiagnosticKind::malformed_manifest) == 1);
}

TEST_CASE("header length inconsistent with key material is reported") {
    ManifestSpec spec;
    spec.header_length = 0xA0;
    Bytes bytes = manifest(spec);

    DiagnosticSink sink;
    auto result = decode(bytes, sink);
    REQUIRE(result.ok);
    CHECK(sink.count(DiagnosticKind::malformed_manifest) == 1);
    CHECK(result.manifest.rsa_modulus.empty());
}

TEST_CASE("non-Intel vendor") {
    Bytes bytes = manifest({});
    put_u32(bytes, 16, 0x1234);

    DiagnosticSink sink;
    auto result = decode(bytes, sink);
    REQUIRE(result.ok);
    CHECK(result.manifest.vendor_name() == "unknown");
}
