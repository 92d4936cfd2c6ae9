#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/extensions.hpp"
#include "mefw/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mefw {

// ============================================================================
// $MN2 Manifest Layout
// ============================================================================

constexpr char MANIFEST_MAGIC[] = "$MN2";
constexpr size_t MANIFEST_MAGIC_OFFSET = 0x1C;
// Fixed fields up to and including the exponent size; key material follows
constexpr size_t MANIFEST_FIXED_HEADER_SIZE = 0x80;
constexpr uint32_t VENDOR_INTEL = 0x8086;

struct Manifest {
    size_t offset = 0;              // absolute offset of the manifest
    uint16_t header_type = 0;
    uint16_t header_subtype = 0;
    uint32_t header_length = 0;     // in dwords
    uint32_t header_version = 0;
    uint32_t flags = 0;
    uint32_t vendor = 0;
    uint32_t date = 0;              // BCD 0xYYYYMMDD
    uint32_t size = 0;              // in dwords, header and extensions
    uint32_t num_modules = 0;       // Gen 2 only
    VersionQuad version;
    uint32_t svn = 0;
    uint32_t modulus_size = 0;      // key size, in dwords
    uint32_t exponent_size = 0;     // scratch size, in dwords

    // RSA material, surfaced verbatim and never verified
    Range rsa_modulus;
    Range rsa_exponent;
    Range rsa_signature;

    ExtensionRegion extensions;

    size_t header_bytes() const { return static_cast<size_t>(header_length) * 4; }
    size_t total_bytes() const { return static_cast<size_t>(size) * 4; }
    std::string date_string() const;
    std::string vendor_name() const;
};

struct ManifestDecodeResult {
    bool ok = false;
    std::string error;
    Manifest manifest;
};

// True when the $MN2 tag sits at its fixed offset inside the view
bool has_manifest_signature(const ByteCursor& data);

// Decode the manifest at the start of `entry` (the manifest entry's bytes).
// ok is false only when the fixed fields cannot be read or the tag is missing;
// inconsistent lengths are reported and leave the extension region empty.
ManifestDecodeResult decode_manifest(const ByteCursor& entry, DiagnosticSink& sink,
                                     bool with_extensions = true);

} // namespace mefw
