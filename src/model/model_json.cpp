#include "mefw/model_json.hpp"

#include <type_traits>

namespace mefw {

namespace {

nlohmann::json range_to_json(const Range& r) {
    return nlohmann::json{{"offset", r.offset}, {"length", r.length}};
}

// Hashes are stored byte-reversed in the image
std::string hash_hex(const Image* image, const Range& r, bool reversed) {
    static const char digits[] = "0123456789abcdef";
    if (!image) return {};
    auto view = image->view(r);
    if (!view) return {};

    std::string out;
    out.reserve(view->size * 2);
    for (size_t i = 0; i < view->size; ++i) {
        uint8_t b = reversed ? view->data[view->size - 1 - i] : view->data[i];
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

nlohmann::json extension_body_to_json(const ExtensionBody& body, const Image* image) {
    return std::visit(
        [image](const auto& b) -> nlohmann::json {
            using T = std::decay_t<decltype(b)>;
            nlohmann::json j = nlohmann::json::object();
            if constexpr (std::is_same_v<T, ModuleAttributes>) {
                j["compression"] = compression_to_string(compression_from_code(b.compression_type));
                j["uncompressed_size"] = b.uncompressed_size;
                j["compressed_size"] = b.compressed_size;
                j["global_module_id"] = b.global_module_id;
                j["image_hash"] = hash_hex(image, b.image_hash, true);
            } else if constexpr (std::is_same_v<T, SignedPackageInfo>) {
                j["package_name"] = b.package_name;
                j["vcn"] = b.vcn;
                j["svn"] = b.svn;
                j["modules"] = nlohmann::json::array();
                for (const auto& m : b.modules) {
                    j["modules"].push_back({{"name", m.name},
                                            {"type", m.type},
                                            {"hash_algorithm", m.hash_algorithm},
                                            {"metadata_size", m.metadata_size},
                                            {"metadata_hash", hash_hex(image, m.metadata_hash, true)}});
                }
            } else if constexpr (std::is_same_v<T, PartitionInfoExtension>) {
                j["partition_name"] = b.partition_name;
                j["partition_length"] = b.partition_length;
                j["partition_hash"] = hash_hex(image, b.partition_hash, true);
                j["vcn"] = b.vcn;
                j["partition_version"] = b.partition_version;
                j["data_format_version"] = b.data_format_version;
                j["instance_id"] = b.instance_id;
                j["flags"] = b.flags;
            } else if constexpr (std::is_same_v<T, IfwiPartitionManifest>) {
                j["partition_name"] = b.partition_name;
                j["complete_partition_length"] = b.complete_partition_length;
                j["version"] = std::to_string(b.version_major) + "." + std::to_string(b.version_minor);
                j["data_format_version"] = b.data_format_version;
                j["instance_id"] = b.instance_id;
                j["flags"] = b.flags;
                j["hash_algorithm"] = b.hash_algorithm;
                j["partition_hash"] = hash_hex(image, b.partition_hash, true);
            }
            return j;
        },
        body);
}

nlohmann::json extension_region_to_json(const ExtensionRegion& region, const Image* image) {
    nlohmann::json j;
    j["range"] = range_to_json(region.range);
    j["trailing"] = range_to_json(region.trailing);
    j["records"] = nlohmann::json::array();
    for (const auto& rec : region.records) {
        nlohmann::json r;
        r["offset"] = rec.offset;
        r["type"] = rec.type;
        r["name"] = rec.type_name();
        r["length"] = rec.length;
        r["payload"] = range_to_json(rec.payload);
        if (!rec.is_unknown() && !std::holds_alternative<OpaqueExtension>(rec.body)) {
            r["body"] = extension_body_to_json(rec.body, image);
        }
        j["records"].push_back(r);
    }
    return j;
}

nlohmann::json directory_to_json(const CodePartitionDirectory& dir, const Image* image) {
    nlohmann::json j;
    j["offset"] = dir.header.offset;
    j["name"] = dir.header.partition_name;
    j["header_version"] = dir.header.header_version;
    j["entry_version"] = dir.header.entry_version;
    if (dir.header.crc32) {
        j["crc32"] = *dir.header.crc32;
        j["crc_valid"] = dir.header.crc_valid;
    }
    j["entries"] = nlohmann::json::array();
    for (const auto& e : dir.entries) {
        j["entries"].push_back({{"name", e.name},
                                {"offset", e.absolute_offset},
                                {"length", e.length},
                                {"compressed", e.compressed},
                                {"range_valid", e.range_valid}});
    }
    j["metadata"] = nlohmann::json::array();
    for (const auto& m : dir.metadata) {
        nlohmann::json meta;
        meta["module"] = m.module_name;
        meta["extensions"] = extension_region_to_json(m.extensions, image);
        j["metadata"].push_back(meta);
    }
    return j;
}

nlohmann::json gen2_to_json(const Gen2Directory& dir) {
    nlohmann::json j;
    j["offset"] = dir.offset;
    j["name"] = dir.name;
    j["modules"] = nlohmann::json::array();
    for (const auto& m : dir.modules) {
        j["modules"].push_back({{"name", m.name},
                                {"offset", m.absolute_offset},
                                {"size", m.size},
                                {"base", m.base},
                                {"entry_point", m.entry_point},
                                {"memory_size", m.memory_size},
                                {"compression", compression_to_string(m.compression())},
                                {"range_valid", m.range_valid}});
    }
    return j;
}

nlohmann::json mfs_to_json(const MfsVolume& volume) {
    nlohmann::json j;
    j["generation"] = mfs_generation_to_string(volume.generation);
    j["page_size"] = volume.page_size;

    if (volume.generation == MfsGeneration::Gen2) {
        j["volume_magic"] = volume.gen2_volume_magic;
        j["pages"] = nlohmann::json::array();
        for (const auto& p : volume.gen2_pages) {
            j["pages"].push_back({{"offset", p.offset},
                                  {"number", p.number},
                                  {"flags", p.flags},
                                  {"active", p.active()}});
        }
        return j;
    }

    j["pages"] = nlohmann::json::array();
    for (const auto& p : volume.pages) {
        nlohmann::json pj;
        pj["offset"] = p.offset;
        pj["kind"] = mfs_page_kind_to_string(p.kind);
        if (p.kind != MfsPageKind::Blank) {
            pj["usn"] = p.usn;
            pj["erase_count"] = p.erase_count;
            pj["first_chunk"] = p.first_chunk;
            pj["checksum_valid"] = p.checksum_valid;
            pj["chunks"] = p.chunks.size();
            pj["free_chunks"] = p.free_chunks;
        }
        j["pages"].push_back(pj);
    }
    if (volume.blank_page) j["blank_page"] = *volume.blank_page;
    j["system_chunks"] = volume.system_chunks;
    j["data_chunks"] = volume.data_chunks;
    j["chunks"] = volume.chunks.size();

    if (volume.header) {
        j["volume"] = {{"version", volume.header->version},
                       {"chunk_bytes_total", volume.header->chunk_bytes_total},
                       {"files", volume.header->files}};
    }
    j["files"] = nlohmann::json::array();
    for (const auto& f : volume.files) {
        if (f.state == MfsFileState::None) continue;
        nlohmann::json fj;
        fj["index"] = f.index;
        fj["state"] = mfs_file_state_to_string(f.state);
        if (f.state == MfsFileState::Present) fj["size"] = f.size();
        if (!f.error.empty()) fj["error"] = f.error;
        j["files"].push_back(fj);
    }
    return j;
}

} // namespace

nlohmann::json diagnostic_to_json(const Diagnostic& d) {
    nlohmann::json j;
    j["kind"] = diagnostic_kind_to_string(d.kind);
    j["layer"] = layer_to_string(d.layer);
    j["offset"] = d.offset;
    if (!d.partition.empty()) j["partition"] = d.partition;
    j["message"] = d.message;
    j["action"] = action_to_string(d.action);
    return j;
}

nlohmann::json manifest_to_json(const Manifest& m, const Image* image) {
    nlohmann::json j;
    j["offset"] = m.offset;
    j["header_type"] = m.header_type;
    j["header_subtype"] = m.header_subtype;
    j["header_length"] = m.header_length;
    j["header_version"] = m.header_version;
    j["flags"] = m.flags;
    j["vendor"] = m.vendor_name();
    j["date"] = m.date_string();
    j["size"] = m.size;
    j["version"] = m.version.to_string();
    j["svn"] = m.svn;
    j["num_modules"] = m.num_modules;
    j["rsa_modulus"] = range_to_json(m.rsa_modulus);
    j["rsa_exponent"] = range_to_json(m.rsa_exponent);
    j["rsa_signature"] = range_to_json(m.rsa_signature);
    j["extensions"] = extension_region_to_json(m.extensions, image);
    return j;
}

nlohmann::json model_to_json(const StructuralModel& model) {
    const Image* image = model.image.get();

    nlohmann::json j;
    j["image_size"] = image ? image->size() : 0;

    nlohmann::json fpt;
    fpt["offset"] = model.fpt.offset;
    fpt["region_base"] = model.fpt.region_base;
    fpt["entry_count"] = model.fpt.entry_count;
    fpt["header_version"] = model.fpt.header_version;
    fpt["entry_version"] = model.fpt.entry_version;
    fpt["checksum_valid"] = model.fpt.checksum_valid;
    if (model.fpt.fitc_version) fpt["fitc_version"] = model.fpt.fitc_version->to_string();
    j["fpt"] = fpt;

    j["partitions"] = nlohmann::json::array();
    for (const auto& p : model.partitions) {
        nlohmann::json pj;
        pj["index"] = p.index;
        pj["name"] = p.name;
        pj["owner"] = p.entry.owner;
        pj["kind"] = partition_kind_to_string(p.kind);
        pj["range"] = range_to_json(p.range);
        pj["flags"] = p.entry.flags;
        KnownPartition known = describe_partition(p.name);
        pj["description"] = known.description;
        if (p.directory) pj["directory"] = directory_to_json(*p.directory, image);
        if (p.gen2) pj["gen2"] = gen2_to_json(*p.gen2);
        if (p.manifest) pj["manifest"] = manifest_to_json(*p.manifest, image);
        if (p.mfs) pj["mfs"] = mfs_to_json(*p.mfs);
        j["partitions"].push_back(pj);
    }

    if (model.fit) {
        nlohmann::json fit;
        fit["offset"] = model.fit->offset;
        fit["version"] = model.fit->version;
        fit["entries"] = nlohmann::json::array();
        for (const auto& e : model.fit->entries) {
            fit["entries"].push_back({{"type", e.type},
                                      {"name", fit_entry_type_name(e.type)},
                                      {"address", e.address},
                                      {"size", e.size},
                                      {"version", e.version}});
        }
        j["fit"] = fit;
    }

    j["diagnostics"] = nlohmann::json::array();
    for (const auto& d : model.diagnostics) {
        j["diagnostics"].push_back(diagnostic_to_json(d));
    }
    j["has_errors"] = model.has_errors;
    return j;
}

std::string dump_json(const nlohmann::json& j, int indent) {
    // Names and tags come straight from image bytes and need not be UTF-8
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mefw
