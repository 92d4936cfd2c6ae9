#include <doctest/doctest.h>
#include <mefw/diagnostics.hpp>
#include <mefw/types.hpp>

#include <thread>
#include <vector>

using namespace mefw;

TEST_CASE("diagnostic_kind_to_string returns canonical keys") {
    CHECK(std::string(diagnostic_kind_to_string(DiagnosticKind::out_of_bounds)) == "out_of_bounds");
    CHECK(std::string(diagnostic_kind_to_string(DiagnosticKind::malformed_manifest)) ==
          "malformed_manifest");
    CHECK(std::string(diagnostic_kind_to_string(DiagnosticKind::unknown_extension_type)) ==
          "unknown_extension_type");
}

TEST_CASE("parse_diagnostic_kind is case-insensitive") {
    CHECK(parse_diagnostic_kind("trailing_bytes") == DiagnosticKind::trailing_bytes);
    CHECK(parse_diagnostic_kind("Checksum_Mismatch") == DiagnosticKind::checksum_mismatch);
    CHECK_FALSE(parse_diagnostic_kind("not_a_kind").has_value());
    CHECK_FALSE(parse_diagnostic_kind("").has_value());
}

TEST_CASE("parse_diagnostic_action") {
    CHECK(parse_diagnostic_action("warn") == DiagnosticAction::Warn);
    CHECK(parse_diagnostic_action("IGNORE") == DiagnosticAction::Ignore);
    CHECK(parse_diagnostic_action("error") == DiagnosticAction::Error);
    CHECK_FALSE(parse_diagnostic_action("fatal").has_value());
}

TEST_CASE("default policy warns and ignores unknown extension types") {
    DiagnosticSink sink;
    sink.emit(DiagnosticKind::trailing_bytes, Layer::Extension, 0x100, "3 bytes");
    sink.emit(DiagnosticKind::unknown_extension_type, Layer::Extension, 0x200, "type 99");

    auto diags = sink.diagnostics();
    REQUIRE(diags.size() == 1);
    CHECK(diags[0].kind == DiagnosticKind::trailing_bytes);
    CHECK(diags[0].action == DiagnosticAction::Warn);
    CHECK(diags[0].offset == 0x100);
    CHECK(diags[0].layer == Layer::Extension);

    CHECK(sink.all().size() == 2);
    CHECK(sink.count(DiagnosticKind::unknown_extension_type) == 0);
    CHECK_FALSE(sink.has_errors());
}

TEST_CASE("error policy sets has_errors") {
    DiagnosticPolicy policy = default_diagnostic_policy();
    policy["checksum_mismatch"] = DiagnosticAction::Error;

    DiagnosticSink sink(policy);
    sink.emit(DiagnosticKind::trailing_bytes, Layer::Extension, 0, "x");
    CHECK_FALSE(sink.has_errors());

    sink.emit(DiagnosticKind::checksum_mismatch, Layer::Fpt, 0x10, "bad sum");
    CHECK(sink.has_errors());
}

TEST_CASE("ignore policy hides a kind") {
    DiagnosticPolicy policy;
    policy["trailing_bytes"] = DiagnosticAction::Ignore;

    DiagnosticSink sink(policy);
    sink.emit(DiagnosticKind::trailing_bytes, Layer::Extension, 0, "x");
    CHECK(sink.diagnostics().empty());
    CHECK_FALSE(sink.has_effective_diagnostics());
}

TEST_CASE("overrides take precedence over the policy") {
    DiagnosticSink sink;
    sink.apply_override(DiagnosticKind::unknown_extension_type, DiagnosticAction::Error);
    sink.emit(DiagnosticKind::unknown_extension_type, Layer::Extension, 0, "type 99");
    CHECK(sink.has_errors());
}

TEST_CASE("scoped sinks tag the partition and merge in order") {
    DiagnosticSink root;
    root.apply_override(DiagnosticKind::trailing_bytes, DiagnosticAction::Error);

    auto a = root.scoped("FTPR");
    auto b = root.scoped("NFTP");
    b->emit(DiagnosticKind::trailing_bytes, Layer::Extension, 0x20, "b");
    a->emit(DiagnosticKind::malformed_header, Layer::Cpd, 0x10, "a");
    CHECK(root.all().empty());

    root.append(*a);
    root.append(*b);
    auto diags = root.diagnostics();
    REQUIRE(diags.size() == 2);
    CHECK(diags[0].partition == "FTPR");
    CHECK(diags[1].partition == "NFTP");
    CHECK(diags[1].action == DiagnosticAction::Error);
    CHECK(root.has_errors());
}

TEST_CASE("emit_for names the partition explicitly") {
    DiagnosticSink sink;
    sink.emit_for("FTPR", DiagnosticKind::unsupported_compression, Layer::Content, 0x40, "huffman");
    auto diags = sink.diagnostics();
    REQUIRE(diags.size() == 1);
    CHECK(diags[0].partition == "FTPR");
}

TEST_CASE("sink accepts concurrent emits") {
    DiagnosticSink sink;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&sink, t]() {
            for (int i = 0; i < 100; ++i) {
                sink.emit(DiagnosticKind::out_of_bounds, Layer::Cpd,
                          static_cast<size_t>(t * 1000 + i), "read");
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(sink.count(DiagnosticKind::out_of_bounds) == 400);

    sink.clear();
    CHECK(sink.all().empty());
}

TEST_CASE("to_hex renders lowercase with a prefix") {
    CHECK(to_hex(0) == "0x0");
    CHECK(to_hex(0x1000) == "0x1000");
    CHECK(to_hex(0xAA557887) == "0xaa557887");
}

TEST_CASE("layer names") {
    CHECK(std::string(layer_to_string(Layer::Fpt)) == "fpt");
    CHECK(std::string(layer_to_string(Layer::Mfs)) == "mfs");
    CHECK(std::string(layer_to_string(Layer::Content)) == "content");
}
