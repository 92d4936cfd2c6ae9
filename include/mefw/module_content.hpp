#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/model.hpp"
#include "mefw/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mefw {

// ============================================================================
// Modules
// ============================================================================

enum class ModuleSource {
    Cpd,
    Gen2,
};

// A directory entry or $MME record whose bytes hold module content
struct ModuleRef {
    std::string partition;
    std::string name;
    ModuleSource source = ModuleSource::Cpd;
    Range range;                    // stored bytes
    Compression compression = Compression::None;
    uint32_t uncompressed_size = 0; // 0 when not declared
    bool range_valid = true;
};

// Modules of every CPD and Gen 2 partition, in FPT and directory order.
// Manifest and metadata entries are not modules.
std::vector<ModuleRef> list_modules(const StructuralModel& model);

// ============================================================================
// Decompression
// ============================================================================

struct DecompressResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

class Decompressor {
public:
    virtual ~Decompressor() = default;
    virtual Compression kind() const = 0;
    // expected_size is a hint; 0 means unknown
    virtual DecompressResult decompress(const ByteView& input, size_t expected_size) const = 0;
};

// LZMA "alone" streams as stored by CSME, via liblzma
class LzmaDecompressor : public Decompressor {
public:
    Compression kind() const override { return Compression::Lzma; }
    DecompressResult decompress(const ByteView& input, size_t expected_size) const override;
};

class DecompressorRegistry {
public:
    DecompressorRegistry() = default;
    DecompressorRegistry(DecompressorRegistry&&) = default;
    DecompressorRegistry& operator=(DecompressorRegistry&&) = default;

    // Registry with every built-in decompressor (LZMA)
    static DecompressorRegistry with_defaults();

    // Later registrations for the same kind take precedence
    void add(std::unique_ptr<Decompressor> decompressor);

    const Decompressor* find(Compression kind) const;

private:
    std::vector<std::unique_ptr<Decompressor>> decompressors_;
};

// ============================================================================
// Content
// ============================================================================

struct ModuleContentResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

// Resolve a module's bytes, decompressing on request. A compression without
// a registered decompressor is reported as unsupported_compression.
ModuleContentResult read_module_content(const StructuralModel& model, const ModuleRef& module,
                                        const DecompressorRegistry& registry,
                                        DiagnosticSink& sink);

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;
};

HashResult compute_sha256(const std::vector<uint8_t>& data);

} // namespace mefw
