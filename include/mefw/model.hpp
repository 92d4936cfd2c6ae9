#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/cpd.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/fit.hpp"
#include "mefw/fpt.hpp"
#include "mefw/gen2.hpp"
#include "mefw/manifest.hpp"
#include "mefw/mfs.hpp"
#include "mefw/parse_options.hpp"
#include "mefw/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mefw {

// ============================================================================
// Image
// ============================================================================
//
// Sole owner of the firmware bytes. Models share it so it outlives them.

class Image {
public:
    explicit Image(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }

    ByteCursor cursor() const { return ByteCursor(bytes_.data(), bytes_.size(), 0); }

    // Bytes of an absolute range, nullopt when it is not inside the image
    std::optional<ByteView> view(const Range& range) const;

private:
    std::vector<uint8_t> bytes_;
};

// ============================================================================
// Partitions
// ============================================================================

enum class PartitionKind {
    Empty,      // placeholder entry with zero offset or length
    Invalid,    // range outside the image
    Opaque,     // no directory recognised
    Cpd,
    Gen2,
    Mfs,
};

inline const char* partition_kind_to_string(PartitionKind k) {
    switch (k) {
        case PartitionKind::Empty: return "empty";
        case PartitionKind::Invalid: return "invalid";
        case PartitionKind::Opaque: return "opaque";
        case PartitionKind::Cpd: return "cpd";
        case PartitionKind::Gen2: return "gen2";
        case PartitionKind::Mfs: return "mfs";
        default: return "opaque";
    }
}

struct Partition {
    size_t index = 0;               // position in the FPT
    std::string name;
    FptEntry entry;
    Range range;
    PartitionKind kind = PartitionKind::Empty;

    std::optional<CodePartitionDirectory> directory;
    std::optional<Gen2Directory> gen2;
    std::optional<Manifest> manifest;
    std::optional<MfsVolume> mfs;
};

// ============================================================================
// Structural Model
// ============================================================================

struct StructuralModel {
    std::shared_ptr<const Image> image;
    FptHeader fpt;
    std::vector<Partition> partitions;
    std::optional<Fit> fit;

    // Effective diagnostics in decode order; ignored kinds are not listed
    std::vector<Diagnostic> diagnostics;
    bool has_errors = false;

    // First partition with the given FPT name
    const Partition* find_partition(const std::string& name) const;

    // Directory entry by partition and entry name
    const CpdEntry* find_entry(const std::string& partition, const std::string& entry) const;

    // Directory entries with the given name across all partitions
    std::vector<const CpdEntry*> find_entries(const std::string& entry) const;
};

struct ParseResult {
    bool ok = false;
    std::string error;
    StructuralModel model;
};

// Decode the image. ok is false only when no FPT signature is found; every
// other problem is recorded in model.diagnostics.
ParseResult parse_image(std::shared_ptr<const Image> image,
                        const ParseOptions& options = default_parse_options());

// Decode one partition. Used by parse_image for every FPT entry.
Partition decode_partition(const ByteCursor& image, const FptEntry& entry,
                           const ParseOptions& options, DiagnosticSink& sink);

} // namespace mefw
