#include "mefw/model.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>

namespace mefw {

std::optional<ByteView> Image::view(const Range& range) const {
    return cursor().read_bytes(range.offset, range.length);
}

// ============================================================================
// Lookups
// ============================================================================

const Partition* StructuralModel::find_partition(const std::string& name) const {
    for (const auto& p : partitions) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

const CpdEntry* StructuralModel::find_entry(const std::string& partition,
                                            const std::string& entry) const {
    for (const auto& p : partitions) {
        if (p.name != partition || !p.directory) continue;
        if (const CpdEntry* e = p.directory->find(entry)) return e;
    }
    return nullptr;
}

std::vector<const CpdEntry*> StructuralModel::find_entries(const std::string& entry) const {
    std::vector<const CpdEntry*> found;
    for (const auto& p : partitions) {
        if (!p.directory) continue;
        for (const auto& e : p.directory->entries) {
            if (e.name == entry) found.push_back(&e);
        }
    }
    return found;
}

// ============================================================================
// Partition Decode
// ============================================================================

Partition decode_partition(const ByteCursor& image, const FptEntry& entry,
                           const ParseOptions& options, DiagnosticSink& sink) {
    Partition partition;
    partition.index = entry.index;
    partition.name = entry.name;
    partition.entry = entry;
    partition.range = entry.range();

    if (!entry.range_valid) {
        partition.kind = PartitionKind::Invalid;
        return partition;
    }
    if (entry.is_placeholder()) {
        partition.kind = PartitionKind::Empty;
        return partition;
    }
    auto bytes = image.sub(partition.range.offset - image.base(), partition.range.length);
    if (!bytes) {
        partition.kind = PartitionKind::Invalid;
        return partition;
    }

    partition.kind = PartitionKind::Opaque;

    if (has_cpd_signature(*bytes)) {
        auto cpd = decode_cpd(*bytes, sink, options.decode_metadata);
        if (!cpd.ok) return partition;

        partition.kind = PartitionKind::Cpd;
        partition.directory = std::move(cpd.directory);

        const CpdEntry* man = partition.directory->manifest_entry();
        if (man && man->range_valid) {
            auto manifest = decode_manifest(*bytes->sub(man->offset, man->length), sink);
            if (manifest.ok) partition.manifest = std::move(manifest.manifest);
        }
        return partition;
    }

    if (is_gen2_partition(*bytes)) {
        auto gen2 = decode_gen2(*bytes, sink);
        if (!gen2.ok) return partition;

        partition.kind = PartitionKind::Gen2;
        partition.manifest = std::move(gen2.manifest);
        partition.gen2 = std::move(gen2.directory);
        return partition;
    }

    if (options.decode_mfs && is_mfs_partition(entry.name)) {
        auto mfs = decode_mfs(*bytes, sink);
        if (!mfs.ok) return partition;

        partition.kind = PartitionKind::Mfs;
        partition.mfs = std::move(mfs.volume);
    }
    return partition;
}

// ============================================================================
// Image Decode
// ============================================================================

ParseResult parse_image(std::shared_ptr<const Image> image, const ParseOptions& options) {
    ParseResult result;
    if (!image) {
        result.error = "no image";
        return result;
    }

    StructuralModel& model = result.model;
    model.image = image;
    const ByteCursor cursor = image->cursor();

    DiagnosticSink sink(options.diagnostics);

    const std::vector<size_t> offsets =
        options.fpt_offsets.empty() ? default_fpt_offsets() : options.fpt_offsets;
    auto fpt = decode_fpt(cursor, offsets, sink, options.scan_fpt);
    if (!fpt.ok) {
        result.error = fpt.error;
        return result;
    }
    model.fpt = fpt.header;

    // Each partition reports into its own sink; merged in FPT order below
    std::vector<std::unique_ptr<DiagnosticSink>> scoped;
    scoped.reserve(fpt.entries.size());
    for (const auto& entry : fpt.entries) {
        scoped.push_back(sink.scoped(entry.name));
    }

    model.partitions.reserve(fpt.entries.size());
    if (options.parallel && fpt.entries.size() > 1) {
        const size_t workers = std::max<size_t>(1, options.max_workers);
        spdlog::debug("decoding {} partitions with {} workers", fpt.entries.size(), workers);

        for (size_t start = 0; start < fpt.entries.size(); start += workers) {
            const size_t end = std::min(fpt.entries.size(), start + workers);
            std::vector<std::future<Partition>> batch;
            for (size_t i = start; i < end; ++i) {
                batch.push_back(std::async(std::launch::async, decode_partition, std::cref(cursor),
                                           std::cref(fpt.entries[i]), std::cref(options),
                                           std::ref(*scoped[i])));
            }
            for (auto& f : batch) {
                model.partitions.push_back(f.get());
            }
        }
    } else {
        for (size_t i = 0; i < fpt.entries.size(); ++i) {
            model.partitions.push_back(decode_partition(cursor, fpt.entries[i], options, *scoped[i]));
        }
    }

    for (const auto& s : scoped) {
        sink.append(*s);
    }

    if (options.decode_fit) {
        auto fit = decode_fit(cursor, sink);
        if (fit.ok) {
            model.fit = std::move(fit.fit);
        } else {
            spdlog::debug("no FIT: {}", fit.error);
        }
    }

    model.diagnostics = sink.diagnostics();
    model.has_errors = sink.has_errors();
    result.ok = true;
    return result;
}

} // namespace mefw
