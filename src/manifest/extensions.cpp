#include "mefw/extensions.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mefw {

namespace {

constexpr size_t MODULE_ATTRIBUTES_HASH_OFFSET = 24;
constexpr size_t SIGNED_PACKAGE_INFO_SIZE = 52;
constexpr size_t SIGNED_PACKAGE_MODULE_SIZE = 20;
constexpr size_t PARTITION_INFO_SIZE = 68;
constexpr size_t PARTITION_INFO_HASH_SIZE = 32;
constexpr size_t IFWI_MANIFEST_HASH_OFFSET = 36;
constexpr size_t IFWI_MANIFEST_MAX_HASH = 48;

std::optional<ExtensionBody> decode_module_attributes(const ByteCursor& record, DiagnosticSink&) {
    FieldReader r(record, EXTENSION_HEADER_SIZE);
    ModuleAttributes attrs;
    attrs.compression_type = r.u8();
    r.skip(3);
    attrs.uncompressed_size = r.u32();
    attrs.compressed_size = r.u32();
    attrs.global_module_id = r.u32();
    if (!r.ok()) return std::nullopt;

    attrs.image_hash = Range{record.absolute(MODULE_ATTRIBUTES_HASH_OFFSET),
                             record.size() - MODULE_ATTRIBUTES_HASH_OFFSET};
    return ExtensionBody{attrs};
}

std::optional<ExtensionBody> decode_signed_package_info(const ByteCursor& record,
                                                        DiagnosticSink& sink) {
    FieldReader r(record, EXTENSION_HEADER_SIZE);
    SignedPackageInfo info;
    info.package_name = r.ascii(4);
    info.vcn = r.u32();
    info.usage_bitmap = Range{record.absolute(r.position()), 16};
    r.skip(16);
    info.svn = r.u32();
    r.skip(16);
    if (!r.ok()) return std::nullopt;

    size_t pos = SIGNED_PACKAGE_INFO_SIZE;
    while (record.size() - pos >= SIGNED_PACKAGE_MODULE_SIZE) {
        FieldReader m(record, pos);
        SignedPackageModule module;
        module.name = m.ascii(12);
        module.type = m.u8();
        module.hash_algorithm = m.u8();
        module.hash_size = m.u16();
        module.metadata_size = m.u32();

        size_t hash_at = pos + SIGNED_PACKAGE_MODULE_SIZE;
        if (!record.contains(hash_at, module.hash_size)) {
            sink.emit(DiagnosticKind::malformed_extension, Layer::Extension, record.absolute(pos),
                      "signed package module " + module.name + " hash of " +
                          std::to_string(module.hash_size) + " bytes overruns record");
            break;
        }
        module.metadata_hash = Range{record.absolute(hash_at), module.hash_size};
        pos = hash_at + module.hash_size;
        info.modules.push_back(std::move(module));
    }

    return ExtensionBody{info};
}

std::optional<ExtensionBody> decode_partition_info(const ByteCursor& record, DiagnosticSink&) {
    if (record.size() < PARTITION_INFO_SIZE) return std::nullopt;

    FieldReader r(record, EXTENSION_HEADER_SIZE);
    PartitionInfoExtension info;
    info.partition_name = r.ascii(4);
    info.partition_length = r.u32();
    info.partition_hash = Range{record.absolute(r.position()), PARTITION_INFO_HASH_SIZE};
    r.skip(PARTITION_INFO_HASH_SIZE);
    info.vcn = r.u32();
    info.partition_version = r.u32();
    info.data_format_version = r.u32();
    info.instance_id = r.u32();
    info.flags = r.u32();
    if (!r.ok()) return std::nullopt;
    return ExtensionBody{info};
}

std::optional<ExtensionBody> decode_ifwi_partition_manifest(const ByteCursor& record,
                                                            DiagnosticSink& sink) {
    FieldReader r(record, EXTENSION_HEADER_SIZE);
    IfwiPartitionManifest manifest;
    manifest.partition_name = r.ascii(4);
    manifest.complete_partition_length = r.u32();
    manifest.version_minor = r.u16();
    manifest.version_major = r.u16();
    manifest.data_format_version = r.u32();
    manifest.instance_id = r.u32();
    manifest.flags = r.u32();
    manifest.hash_algorithm = r.u8();
    uint32_t lo = r.u16();
    uint32_t hi = r.u8();
    if (!r.ok()) return std::nullopt;
    manifest.hash_size = lo | (hi << 16);

    size_t available = record.size() - IFWI_MANIFEST_HASH_OFFSET;
    size_t hash_size = std::min<size_t>({manifest.hash_size, IFWI_MANIFEST_MAX_HASH, available});
    if (hash_size < manifest.hash_size) {
        sink.emit(DiagnosticKind::malformed_extension, Layer::Extension, record.base(),
                  "IFWI partition manifest hash size " + std::to_string(manifest.hash_size) +
                      " truncated to " + std::to_string(hash_size));
    }
    manifest.partition_hash = Range{record.absolute(IFWI_MANIFEST_HASH_OFFSET), hash_size};
    return ExtensionBody{manifest};
}

} // namespace

const char* extension_type_name(uint32_t type) {
    switch (type) {
        case EXT_SYSTEM_INFO: return "System Info";
        case EXT_INIT_SCRIPT: return "Init Script";
        case EXT_FEATURE_PERMISSIONS: return "Feature Permissions";
        case EXT_PARTITION_INFO: return "Partition Info";
        case EXT_SHARED_LIB_ATTRIBUTES: return "Shared Lib Attributes";
        case EXT_PROCESS_ATTRIBUTES: return "Process Attributes";
        case EXT_THREAD_ATTRIBUTES: return "Thread Attributes";
        case EXT_DEVICE_TYPE: return "Device Type";
        case EXT_MMIO_RANGE: return "MMIO Range";
        case EXT_SPEC_FILE_PRODUCER: return "Spec File Producer";
        case EXT_MODULE_ATTRIBUTES: return "Module Attributes";
        case EXT_LOCKED_RANGES: return "Locked Ranges";
        case EXT_CLIENT_SYSTEM_INFO: return "Client System Info";
        case EXT_USER_INFO: return "User Info";
        case EXT_KEY_MANIFEST: return "Key Manifest";
        case EXT_SIGNED_PACKAGE_INFO: return "Signed Package Info";
        case EXT_ANTI_CLONING_SKU_ID: return "Anti-Cloning SKU ID";
        case EXT_CAVS: return "cAVS";
        case EXT_IMR_INFO: return "IMR Info";
        case EXT_RCIP_INFO: return "RCIP Info";
        case EXT_BOOT_POLICY: return "Boot Policy";
        case EXT_SECURE_TOKEN: return "Secure Token";
        case EXT_IFWI_PARTITION_MANIFEST: return "IFWI Partition Manifest";
        case EXT_FD_HASH: return "FD Hash";
        case EXT_IOM_METADATA: return "IOM Metadata";
        case EXT_MGP_METADATA: return "MGP Metadata";
        case EXT_TBT_METADATA: return "TBT Metadata";
        case EXT_GMF_CERTIFICATE: return "GMF Certificate";
        case EXT_GMF_BODY: return "GMF Body";
        case EXT_KEY_MANIFEST_EXT: return "Key Manifest Ext";
        case EXT_SIGNED_PACKAGE_INFO_EXT: return "Signed Package Info Ext";
        case EXT_SPS_PLATFORM_ID: return "SPS Platform ID";
        default: return nullptr;
    }
}

std::string ExtensionRecord::type_name() const {
    const char* name = extension_type_name(type);
    return name ? name : "Unknown";
}

size_t ExtensionRegion::consumed() const {
    size_t total = 0;
    for (const auto& r : records) {
        total += r.length;
    }
    return total;
}

const std::unordered_map<uint32_t, ExtensionDecoder>& extension_decoders() {
    static const std::unordered_map<uint32_t, ExtensionDecoder> decoders = {
        {EXT_PARTITION_INFO, &decode_partition_info},
        {EXT_MODULE_ATTRIBUTES, &decode_module_attributes},
        {EXT_SIGNED_PACKAGE_INFO, &decode_signed_package_info},
        {EXT_IFWI_PARTITION_MANIFEST, &decode_ifwi_partition_manifest},
    };
    return decoders;
}

ExtensionRegion decode_extensions(const ByteCursor& region, DiagnosticSink& sink) {
    ExtensionRegion out;
    out.range = region.range();

    const auto& decoders = extension_decoders();
    const size_t size = region.size();
    size_t pos = 0;
    bool abandoned = false;

    while (size - pos >= EXTENSION_HEADER_SIZE) {
        uint32_t type = *region.read_u32_le(pos);
        uint32_t length = *region.read_u32_le(pos + 4);

        if (length < EXTENSION_HEADER_SIZE) {
            sink.emit(DiagnosticKind::malformed_header, Layer::Extension, region.absolute(pos),
                      "extension " + std::to_string(type) + " declares length " +
                          std::to_string(length) + " below record header size");
            abandoned = true;
            break;
        }
        if (length > size - pos) {
            sink.emit(DiagnosticKind::malformed_header, Layer::Extension, region.absolute(pos),
                      "extension " + std::to_string(type) + " length " + std::to_string(length) +
                          " overruns region by " + std::to_string(length - (size - pos)) +
                          " bytes");
            abandoned = true;
            break;
        }

        ByteCursor record = *region.sub(pos, length);

        ExtensionRecord rec;
        rec.offset = record.base();
        rec.type = type;
        rec.length = length;
        rec.payload = Range{record.absolute(EXTENSION_HEADER_SIZE), length - EXTENSION_HEADER_SIZE};

        auto decoder = decoders.find(type);
        if (decoder != decoders.end()) {
            auto body = decoder->second(record, sink);
            if (body) {
                rec.body = std::move(*body);
            } else {
                rec.body = OpaqueExtension{};
                sink.emit(DiagnosticKind::malformed_extension, Layer::Extension, rec.offset,
                          rec.type_name() + " record too short for its fixed fields");
            }
        } else if (extension_type_name(type)) {
            rec.body = OpaqueExtension{};
        } else {
            rec.body = UnknownExtension{};
            sink.emit(DiagnosticKind::unknown_extension_type, Layer::Extension, rec.offset,
                      "extension type " + std::to_string(type) + " is not known");
        }

        out.records.push_back(std::move(rec));
        // Advance by the declared length, whatever the decoder interpreted
        pos += length;
    }

    out.trailing = Range{region.absolute(pos), size - pos};
    if (!abandoned && !out.trailing.empty()) {
        sink.emit(DiagnosticKind::trailing_bytes, Layer::Extension, out.trailing.offset,
                  std::to_string(out.trailing.length) + " bytes after last extension record");
    }

    spdlog::debug("extension region {:#x}+{:#x}: {} records, {} trailing bytes",
                  out.range.offset, out.range.length, out.records.size(), out.trailing.length);
    return out;
}

const ModuleAttributes* find_module_attributes(const ExtensionRegion& region) {
    for (const auto& rec : region.records) {
        if (const auto* attrs = std::get_if<ModuleAttributes>(&rec.body)) {
            return attrs;
        }
    }
    return nullptr;
}

} // namespace mefw
