#include "mefw/module_content.hpp"

#include <spdlog/spdlog.h>

#include <lzma.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cstring>

namespace mefw {

namespace {

// Upper bound for a single decompressed module
constexpr size_t MAX_MODULE_SIZE = 64 * 1024 * 1024;

// CSME inserts three zero bytes after the LZMA "alone" header
constexpr uint8_t ME_LZMA_PREFIX[] = {0x36, 0x00, 0x40, 0x00, 0x00};
constexpr size_t ME_LZMA_PAD_OFFSET = 0x0E;
constexpr size_t ME_LZMA_PAD_SIZE = 3;

bool range_inside(const Range& inner, const Range& outer) {
    size_t end = 0;
    return inner.offset >= outer.offset && checked_add(inner.offset, inner.length, end) &&
           end <= outer.end();
}

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

// RAII wrapper for lzma_stream
class LzmaStream {
public:
    LzmaStream() = default;
    ~LzmaStream() { lzma_end(&strm_); }

    LzmaStream(const LzmaStream&) = delete;
    LzmaStream& operator=(const LzmaStream&) = delete;

    lzma_stream* get() { return &strm_; }

private:
    lzma_stream strm_ = LZMA_STREAM_INIT;
};

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

void add_cpd_modules(const Partition& partition, std::vector<ModuleRef>& out) {
    const CodePartitionDirectory& dir = *partition.directory;
    for (const auto& entry : dir.entries) {
        if (entry.is_metadata() || is_manifest_name(entry.name, dir.header.partition_name)) {
            continue;
        }

        ModuleRef module;
        module.partition = partition.name;
        module.name = entry.name;
        module.source = ModuleSource::Cpd;
        module.range = entry.range();
        module.range_valid = entry.range_valid;
        module.compression = entry.compressed ? Compression::Huffman : Compression::None;

        const MetadataEntry* meta = dir.metadata_for(entry.name);
        if (const ModuleAttributes* attrs = meta ? find_module_attributes(meta->extensions) : nullptr) {
            module.compression = compression_from_code(attrs->compression_type);
            module.uncompressed_size = attrs->uncompressed_size;
            // Huffman entries declare their uncompressed length in the directory
            if (module.compression == Compression::Huffman && attrs->compressed_size != 0) {
                module.range.length = attrs->compressed_size;
                module.range_valid = module.range_valid && range_inside(module.range, partition.range);
            }
        }
        out.push_back(std::move(module));
    }
}

void add_gen2_modules(const Partition& partition, std::vector<ModuleRef>& out) {
    for (const auto& m : partition.gen2->modules) {
        ModuleRef module;
        module.partition = partition.name;
        module.name = m.name;
        module.source = ModuleSource::Gen2;
        module.range = m.range();
        module.range_valid = m.range_valid;
        module.compression = m.compression();
        out.push_back(std::move(module));
    }
}

} // namespace

std::vector<ModuleRef> list_modules(const StructuralModel& model) {
    std::vector<ModuleRef> modules;
    for (const auto& partition : model.partitions) {
        if (partition.directory) {
            add_cpd_modules(partition, modules);
        } else if (partition.gen2) {
            add_gen2_modules(partition, modules);
        }
    }
    return modules;
}

// ============================================================================
// LZMA
// ============================================================================

DecompressResult LzmaDecompressor::decompress(const ByteView& input, size_t expected_size) const {
    DecompressResult result;

    std::vector<uint8_t> fixed;
    const uint8_t* data = input.data;
    size_t size = input.size;
    if (size >= ME_LZMA_PAD_OFFSET + ME_LZMA_PAD_SIZE &&
        std::memcmp(data, ME_LZMA_PREFIX, sizeof(ME_LZMA_PREFIX)) == 0 &&
        std::all_of(data + ME_LZMA_PAD_OFFSET, data + ME_LZMA_PAD_OFFSET + ME_LZMA_PAD_SIZE,
                    [](uint8_t b) { return b == 0; })) {
        fixed.assign(data, data + ME_LZMA_PAD_OFFSET);
        fixed.insert(fixed.end(), data + ME_LZMA_PAD_OFFSET + ME_LZMA_PAD_SIZE, data + size);
        data = fixed.data();
        size = fixed.size();
    }

    LzmaStream stream;
    lzma_ret code = lzma_alone_decoder(stream.get(), UINT64_MAX);
    if (code != LZMA_OK) {
        result.error = "lzma_alone_decoder failed: " + std::to_string(code);
        return result;
    }

    lzma_stream* strm = stream.get();
    strm->next_in = data;
    strm->avail_in = size;

    result.data.reserve(std::min(expected_size, MAX_MODULE_SIZE));
    uint8_t buf[64 * 1024];
    for (;;) {
        strm->next_out = buf;
        strm->avail_out = sizeof(buf);
        code = lzma_code(strm, LZMA_FINISH);
        result.data.insert(result.data.end(), buf, buf + (sizeof(buf) - strm->avail_out));

        if (code == LZMA_STREAM_END) break;
        if (code != LZMA_OK) {
            result.error = "lzma_code failed: " + std::to_string(code);
            result.data.clear();
            return result;
        }
        if (result.data.size() > MAX_MODULE_SIZE) {
            result.error = "decompressed module exceeds size limit";
            result.data.clear();
            return result;
        }
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Registry
// ============================================================================

DecompressorRegistry DecompressorRegistry::with_defaults() {
    DecompressorRegistry registry;
    registry.add(std::make_unique<LzmaDecompressor>());
    return registry;
}

void DecompressorRegistry::add(std::unique_ptr<Decompressor> decompressor) {
    if (decompressor) decompressors_.push_back(std::move(decompressor));
}

const Decompressor* DecompressorRegistry::find(Compression kind) const {
    for (auto it = decompressors_.rbegin(); it != decompressors_.rend(); ++it) {
        if ((*it)->kind() == kind) return it->get();
    }
    return nullptr;
}

// ============================================================================
// Content
// ============================================================================

ModuleContentResult read_module_content(const StructuralModel& model, const ModuleRef& module,
                                        const DecompressorRegistry& registry,
                                        DiagnosticSink& sink) {
    ModuleContentResult result;

    if (!module.range_valid) {
        result.error = "module " + module.name + " range lies outside its partition";
        return result;
    }
    auto view = model.image ? model.image->view(module.range) : std::nullopt;
    if (!view) {
        result.error = "module " + module.name + " range lies outside the image";
        return result;
    }

    if (module.compression == Compression::None) {
        result.data.assign(view->data, view->data + view->size);
        result.ok = true;
        return result;
    }

    const Decompressor* decompressor = registry.find(module.compression);
    if (!decompressor) {
        sink.emit_for(module.partition, DiagnosticKind::unsupported_compression, Layer::Content,
                      module.range.offset,
                      std::string("no decompressor for ") + compression_to_string(module.compression) +
                          " module " + module.name);
        result.error = std::string("unsupported compression: ") +
                       compression_to_string(module.compression);
        return result;
    }

    auto decompressed = decompressor->decompress(*view, module.uncompressed_size);
    if (!decompressed.ok) {
        result.error = "module " + module.name + ": " + decompressed.error;
        return result;
    }
    spdlog::debug("module {} decompressed {} -> {} bytes", module.name, view->size,
                  decompressed.data.size());
    result.data = std::move(decompressed.data);
    result.ok = true;
    return result;
}

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }

    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

} // namespace mefw
