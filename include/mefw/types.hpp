#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mefw {

// ============================================================================
// Byte Ranges
// ============================================================================

// Absolute view into the image buffer. Entities never copy image bytes.
struct Range {
    size_t offset = 0;
    size_t length = 0;

    size_t end() const { return offset + length; }
    bool empty() const { return length == 0; }

    bool operator==(const Range& other) const {
        return offset == other.offset && length == other.length;
    }
    bool operator!=(const Range& other) const { return !(*this == other); }
};

// ============================================================================
// Diagnostic Kinds
// ============================================================================

enum class DiagnosticKind {
    out_of_bounds,
    signature_not_found,
    malformed_header,
    malformed_manifest,
    malformed_extension,
    invalid_entry_range,
    trailing_bytes,
    unknown_extension_type,
    duplicate_manifest,
    checksum_mismatch,
    unsupported_compression,
};

// Convert diagnostic kind to canonical lowercase snake_case string
inline const char* diagnostic_kind_to_string(DiagnosticKind k) {
    switch (k) {
        case DiagnosticKind::out_of_bounds: return "out_of_bounds";
        case DiagnosticKind::signature_not_found: return "signature_not_found";
        case DiagnosticKind::malformed_header: return "malformed_header";
        case DiagnosticKind::malformed_manifest: return "malformed_manifest";
        case DiagnosticKind::malformed_extension: return "malformed_extension";
        case DiagnosticKind::invalid_entry_range: return "invalid_entry_range";
        case DiagnosticKind::trailing_bytes: return "trailing_bytes";
        case DiagnosticKind::unknown_extension_type: return "unknown_extension_type";
        case DiagnosticKind::duplicate_manifest: return "duplicate_manifest";
        case DiagnosticKind::checksum_mismatch: return "checksum_mismatch";
        case DiagnosticKind::unsupported_compression: return "unsupported_compression";
        default: return "unknown";
    }
}

// Parse diagnostic key string to enum (case-insensitive)
std::optional<DiagnosticKind> parse_diagnostic_kind(const std::string& key);

// ============================================================================
// Decoder Layers
// ============================================================================

enum class Layer {
    Fpt,
    Cpd,
    Gen2,
    Manifest,
    Extension,
    Fit,
    Mfs,
    Content,
};

inline const char* layer_to_string(Layer l) {
    switch (l) {
        case Layer::Fpt: return "fpt";
        case Layer::Cpd: return "cpd";
        case Layer::Gen2: return "gen2";
        case Layer::Manifest: return "manifest";
        case Layer::Extension: return "extension";
        case Layer::Fit: return "fit";
        case Layer::Mfs: return "mfs";
        case Layer::Content: return "content";
        default: return "unknown";
    }
}

// ============================================================================
// Diagnostic Action (policy applied by DiagnosticSink)
// ============================================================================

enum class DiagnosticAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(DiagnosticAction a) {
    switch (a) {
        case DiagnosticAction::Warn: return "warn";
        case DiagnosticAction::Ignore: return "ignore";
        case DiagnosticAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<DiagnosticAction> parse_diagnostic_action(const std::string& s);

// ============================================================================
// Diagnostic Object
// ============================================================================

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::malformed_header;
    Layer layer = Layer::Fpt;
    size_t offset = 0;              // absolute offset in the image
    std::string partition;          // owning partition name, empty for image-level
    std::string message;
    DiagnosticAction action = DiagnosticAction::Warn;

    bool operator==(const Diagnostic& other) const {
        return kind == other.kind && layer == other.layer && offset == other.offset &&
               partition == other.partition && message == other.message &&
               action == other.action;
    }
};

// "0x"-prefixed lowercase hex, used in diagnostic messages
std::string to_hex(uint64_t value);

// ============================================================================
// Version Quad
// ============================================================================

struct VersionQuad {
    uint16_t major = 0;
    uint16_t minor = 0;
    uint16_t hotfix = 0;
    uint16_t build = 0;

    std::string to_string() const;

    bool operator==(const VersionQuad& other) const {
        return major == other.major && minor == other.minor &&
               hotfix == other.hotfix && build == other.build;
    }
};

// ============================================================================
// Module Compression
// ============================================================================

// Same numbering in Gen 2 module flags and the Module Attributes extension
enum class Compression {
    None,
    Huffman,
    Lzma,
    Unknown,
};

inline Compression compression_from_code(uint32_t code) {
    switch (code) {
        case 0: return Compression::None;
        case 1: return Compression::Huffman;
        case 2: return Compression::Lzma;
        default: return Compression::Unknown;
    }
}

inline const char* compression_to_string(Compression c) {
    switch (c) {
        case Compression::None: return "none";
        case Compression::Huffman: return "huffman";
        case Compression::Lzma: return "lzma";
        case Compression::Unknown: return "unknown";
        default: return "unknown";
    }
}

} // namespace mefw
