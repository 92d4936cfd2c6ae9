#pragma once

#include "mefw/byte_cursor.hpp"
#include "mefw/diagnostics.hpp"
#include "mefw/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mefw {

// ============================================================================
// Extension Record Framing
// ============================================================================

// type:u32 + length:u32, length counts the header itself
constexpr size_t EXTENSION_HEADER_SIZE = 8;

enum ExtensionType : uint32_t {
    EXT_SYSTEM_INFO = 0,
    EXT_INIT_SCRIPT = 1,
    EXT_FEATURE_PERMISSIONS = 2,
    EXT_PARTITION_INFO = 3,
    EXT_SHARED_LIB_ATTRIBUTES = 4,
    EXT_PROCESS_ATTRIBUTES = 5,
    EXT_THREAD_ATTRIBUTES = 6,
    EXT_DEVICE_TYPE = 7,
    EXT_MMIO_RANGE = 8,
    EXT_SPEC_FILE_PRODUCER = 9,
    EXT_MODULE_ATTRIBUTES = 10,
    EXT_LOCKED_RANGES = 11,
    EXT_CLIENT_SYSTEM_INFO = 12,
    EXT_USER_INFO = 13,
    EXT_KEY_MANIFEST = 14,
    EXT_SIGNED_PACKAGE_INFO = 15,
    EXT_ANTI_CLONING_SKU_ID = 16,
    EXT_CAVS = 17,
    EXT_IMR_INFO = 18,
    EXT_RCIP_INFO = 19,
    EXT_BOOT_POLICY = 20,
    EXT_SECURE_TOKEN = 21,
    EXT_IFWI_PARTITION_MANIFEST = 22,
    EXT_FD_HASH = 23,
    EXT_IOM_METADATA = 24,
    EXT_MGP_METADATA = 25,
    EXT_TBT_METADATA = 26,
    EXT_GMF_CERTIFICATE = 30,
    EXT_GMF_BODY = 31,
    EXT_KEY_MANIFEST_EXT = 34,
    EXT_SIGNED_PACKAGE_INFO_EXT = 35,
    EXT_SPS_PLATFORM_ID = 50,
};

// Name of a documented extension type, nullptr when the tag is not known
const char* extension_type_name(uint32_t type);

// ============================================================================
// Decoded Extension Bodies
// ============================================================================

// Module Attributes (0x0A)
struct ModuleAttributes {
    uint8_t compression_type = 0;   // 0 none, 1 Huffman, 2 LZMA
    uint32_t uncompressed_size = 0;
    uint32_t compressed_size = 0;
    uint32_t global_module_id = 0;
    Range image_hash;               // stored byte-reversed
};

struct SignedPackageModule {
    std::string name;
    uint8_t type = 0;
    uint8_t hash_algorithm = 0;
    uint16_t hash_size = 0;
    uint32_t metadata_size = 0;
    Range metadata_hash;            // stored byte-reversed
};

// Signed Package Info (0x0F)
struct SignedPackageInfo {
    std::string package_name;
    uint32_t vcn = 0;
    Range usage_bitmap;
    uint32_t svn = 0;
    std::vector<SignedPackageModule> modules;
};

// Partition Info (0x03)
struct PartitionInfoExtension {
    std::string partition_name;
    uint32_t partition_length = 0;
    Range partition_hash;
    uint32_t vcn = 0;
    uint32_t partition_version = 0;
    uint32_t data_format_version = 0;
    uint32_t instance_id = 0;
    uint32_t flags = 0;
};

// IFWI Partition Manifest (0x16)
struct IfwiPartitionManifest {
    std::string partition_name;
    uint32_t complete_partition_length = 0;
    uint16_t version_minor = 0;
    uint16_t version_major = 0;
    uint32_t data_format_version = 0;
    uint32_t instance_id = 0;
    uint32_t flags = 0;
    uint8_t hash_algorithm = 0;
    uint32_t hash_size = 0;
    Range partition_hash;           // stored byte-reversed, clamped to the field
};

// Documented type without a dedicated decoder
struct OpaqueExtension {};

// Tag not in the known table; the payload range is preserved verbatim
struct UnknownExtension {};

using ExtensionBody = std::variant<UnknownExtension, OpaqueExtension, ModuleAttributes,
                                   SignedPackageInfo, PartitionInfoExtension,
                                   IfwiPartitionManifest>;

struct ExtensionRecord {
    size_t offset = 0;              // absolute offset of the record header
    uint32_t type = 0;
    uint32_t length = 0;            // declared, header included
    Range payload;                  // length - EXTENSION_HEADER_SIZE bytes
    ExtensionBody body;

    bool is_unknown() const { return std::holds_alternative<UnknownExtension>(body); }
    std::string type_name() const;
};

struct ExtensionRegion {
    Range range;
    std::vector<ExtensionRecord> records;
    // Bytes not consumed by any record: the sub-header remainder or a region
    // abandoned after a malformed record. Never dropped.
    Range trailing;

    size_t consumed() const;
};

// ============================================================================
// Decode
// ============================================================================

// A decoder sees the whole record (header included) and never affects framing
using ExtensionDecoder = std::optional<ExtensionBody> (*)(const ByteCursor& record,
                                                          DiagnosticSink& sink);

// Dispatch table of known decoders
const std::unordered_map<uint32_t, ExtensionDecoder>& extension_decoders();

ExtensionRegion decode_extensions(const ByteCursor& region, DiagnosticSink& sink);

// First Module Attributes record of a region, nullptr when absent
const ModuleAttributes* find_module_attributes(const ExtensionRegion& region);

} // namespace mefw
