#include <doctest/doctest.h>
#include <mefw/parse_options.hpp>

#include <algorithm>

using namespace mefw;

namespace {

bool has_warning(const ParseOptionsResult& r, const std::string& w) {
    return std::find(r.warnings.begin(), r.warnings.end(), w) != r.warnings.end();
}

} // namespace

TEST_CASE("default parse options") {
    auto options = default_parse_options();
    CHECK(options.fpt_offsets == std::vector<size_t>{0, 0x10});
    CHECK_FALSE(options.parallel);
    CHECK(options.max_workers == 4);
    CHECK(options.decode_metadata);
    CHECK_FALSE(options.decode_fit);
    CHECK(options.decode_mfs);
    CHECK(options.scan_fpt);
    CHECK(options.diagnostics["unknown_extension_type"] == DiagnosticAction::Ignore);
}

TEST_CASE("a default-constructed ParseOptions carries the default policy") {
    ParseOptions options;
    CHECK(options.diagnostics == default_diagnostic_policy());
    REQUIRE(options.diagnostics.count("unknown_extension_type") == 1);
    CHECK(options.diagnostics.at("unknown_extension_type") == DiagnosticAction::Ignore);
    CHECK(options.fpt_offsets.empty());
}

TEST_CASE("parse options from JSON") {
    const char* json = R"({
        "$schema": "mefw.parse.options.v1",
        "fpt_offsets": [16],
        "parallel": true,
        "max_workers": 8,
        "decode_metadata": false,
        "decode_fit": true,
        "decode_mfs": false,
        "scan_fpt": false,
        "diagnostics": {
            "checksum_mismatch": "error",
            "Trailing_Bytes": "ignore"
        }
    })";

    auto result = parse_options_json(json, "opts.json");
    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    const auto& o = result.options;
    CHECK(o.source_path == "opts.json");
    CHECK(o.fpt_offsets == std::vector<size_t>{16});
    CHECK(o.parallel);
    CHECK(o.max_workers == 8);
    CHECK_FALSE(o.decode_metadata);
    CHECK(o.decode_fit);
    CHECK_FALSE(o.decode_mfs);
    CHECK_FALSE(o.scan_fpt);
    CHECK(o.diagnostics.at("checksum_mismatch") == DiagnosticAction::Error);
    CHECK(o.diagnostics.at("trailing_bytes") == DiagnosticAction::Ignore);
    CHECK(o.diagnostics.at("unknown_extension_type") == DiagnosticAction::Ignore);
}

TEST_CASE("schema is required") {
    auto missing = parse_options_json(R"({"parallel": true})");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error == "$schema missing");

    auto wrong = parse_options_json(R"({"$schema": "mefw.parse.options.v2"})");
    CHECK_FALSE(wrong.ok);
}

TEST_CASE("malformed JSON is an error, not an exception") {
    auto result = parse_options_json("{ not json");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("parse error") == 0);

    auto array = parse_options_json("[1, 2]");
    CHECK_FALSE(array.ok);
    CHECK(array.error == "JSON must be an object");
}

TEST_CASE("invalid values keep defaults and warn") {
    const char* json = R"({
        "$schema": "mefw.parse.options.v1",
        "fpt_offsets": [],
        "parallel": "yes",
        "max_workers": 0,
        "diagnostics": {
            "no_such_kind": "warn",
            "trailing_bytes": "explode"
        },
        "unrelated": 1
    })";

    auto result = parse_options_json(json);
    REQUIRE(result.ok);
    CHECK(result.options.fpt_offsets == std::vector<size_t>{0, 0x10});
    CHECK_FALSE(result.options.parallel);
    CHECK(result.options.max_workers == 4);
    CHECK(result.options.diagnostics.count("trailing_bytes") == 0);

    CHECK(has_warning(result, "invalid_configuration:invalid_fpt_offsets"));
    CHECK(has_warning(result, "invalid_configuration:invalid_parallel"));
    CHECK(has_warning(result, "invalid_configuration:invalid_max_workers"));
    CHECK(has_warning(result, "invalid_configuration:unknown_diagnostic:no_such_kind"));
    CHECK(has_warning(result, "invalid_configuration:invalid_diagnostic_action:trailing_bytes"));
    CHECK(result.warnings.size() == 5);
}
