#pragma once

#include "mefw/diagnostics.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace mefw {

constexpr char PARSE_OPTIONS_SCHEMA[] = "mefw.parse.options.v1";

// ============================================================================
// Parse Options
// ============================================================================

struct ParseOptions {
    std::string schema = PARSE_OPTIONS_SCHEMA;
    std::string source_path;

    // Candidate offsets tried for the $FPT signature, in order
    std::vector<size_t> fpt_offsets;

    // Search the whole image in 16-byte steps when no candidate matches
    bool scan_fpt = true;

    bool parallel = false;
    size_t max_workers = 4;

    // Decode `.met` entries as extension regions
    bool decode_metadata = true;

    // Look for a Firmware Interface Table (full flash images only)
    bool decode_fit = false;

    // Decode the MFS partition's pages, volume header and file table
    bool decode_mfs = true;

    // Diagnostic kind -> action
    DiagnosticPolicy diagnostics = default_diagnostic_policy();
};

// Defaults used when no configuration file is given
ParseOptions default_parse_options();

struct ParseOptionsResult {
    bool ok = false;
    std::string error;
    ParseOptions options;
    std::vector<std::string> warnings;
};

// Parse options from JSON. Invalid values keep their default and add an
// invalid_configuration warning; a malformed document or schema fails.
ParseOptionsResult parse_options_json(const std::string& json_str,
                                      const std::string& source_path = "");

} // namespace mefw
