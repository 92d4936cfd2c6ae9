#include "mefw/gen2.hpp"
#include "mefw/cpd.hpp"

#include <spdlog/spdlog.h>

namespace mefw {

const Gen2Module* Gen2Directory::find(const std::string& module_name) const {
    for (const auto& m : modules) {
        if (m.name == module_name) return &m;
    }
    return nullptr;
}

bool is_gen2_partition(const ByteCursor& partition) {
    return !has_cpd_signature(partition) && has_manifest_signature(partition);
}

Gen2DecodeResult decode_gen2(const ByteCursor& partition, DiagnosticSink& sink) {
    Gen2DecodeResult result;

    // The extension region of a Gen 2 manifest is the directory itself
    auto manifest = decode_manifest(partition, sink, false);
    if (!manifest.ok) {
        result.error = manifest.error;
        return result;
    }
    result.ok = true;
    result.manifest = std::move(manifest.manifest);

    const size_t header_at = result.manifest.header_bytes();
    Gen2Directory& dir = result.directory;
    dir.offset = partition.absolute(header_at);

    auto name = partition.read_ascii(header_at, 4);
    if (!name || !partition.contains(header_at, GEN2_HEADER_SIZE)) {
        sink.emit(DiagnosticKind::out_of_bounds, Layer::Gen2, dir.offset,
                  "Gen 2 directory header beyond partition of " + to_hex(partition.size()));
        return result;
    }
    dir.name = *name;

    const size_t count = result.manifest.num_modules;
    const size_t table = header_at + GEN2_HEADER_SIZE;
    for (size_t i = 0; i < count; ++i) {
        const size_t pos = table + i * GEN2_MODULE_SIZE;
        auto record = partition.sub(pos, GEN2_MODULE_SIZE);
        if (!record) {
            sink.emit(DiagnosticKind::out_of_bounds, Layer::Gen2, partition.absolute(pos),
                      std::to_string(count - i) + " of " + std::to_string(count) +
                          " module records beyond partition");
            break;
        }
        if (!record->matches(0, GEN2_MODULE_MAGIC, 4)) {
            sink.emit(DiagnosticKind::signature_not_found, Layer::Gen2, record->base(),
                      "module record " + std::to_string(i) + " lacks $MME tag");
            break;
        }

        FieldReader r(*record, 4);
        Gen2Module module;
        module.index = i;
        module.record_offset = record->base();
        module.name = r.ascii(16);
        module.hash = Range{record->absolute(r.position()), GEN2_MODULE_HASH_SIZE};
        r.skip(GEN2_MODULE_HASH_SIZE);
        module.base = r.u32();
        module.offset = r.u32();
        module.code_size = r.u32();
        module.size = r.u32();
        module.memory_size = r.u32();
        module.pre_uma_size = r.u32();
        module.entry_point = r.u32();
        module.flags = r.u32();
        module.absolute_offset = partition.absolute(module.offset);

        if (!partition.contains(module.offset, module.size)) {
            module.range_valid = false;
            sink.emit(DiagnosticKind::invalid_entry_range, Layer::Gen2, module.record_offset,
                      "module " + module.name + " range " + to_hex(module.offset) + "+" +
                          to_hex(module.size) + " exceeds partition of " + to_hex(partition.size()));
        }
        dir.modules.push_back(std::move(module));
    }

    spdlog::debug("Gen 2 directory {} at {:#x}: {} modules", dir.name, dir.offset,
                  dir.modules.size());
    return result;
}

} // namespace mefw
