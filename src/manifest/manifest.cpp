#include "mefw/manifest.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>

namespace mefw {

namespace {

constexpr size_t MANIFEST_MODULUS_SIZE_OFFSET = 0x78;

} // namespace

std::string Manifest::date_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04x-%02x-%02x", (date >> 16) & 0xffff, (date >> 8) & 0xff,
                  date & 0xff);
    return buf;
}

std::string Manifest::vendor_name() const {
    return vendor == VENDOR_INTEL ? "Intel" : "unknown";
}

bool has_manifest_signature(const ByteCursor& data) {
    return data.matches(MANIFEST_MAGIC_OFFSET, MANIFEST_MAGIC, 4);
}

ManifestDecodeResult decode_manifest(const ByteCursor& entry, DiagnosticSink& sink,
                                     bool with_extensions) {
    ManifestDecodeResult result;
    Manifest& m = result.manifest;
    m.offset = entry.base();

    FieldReader r(entry);
    m.header_type = r.u16();
    m.header_subtype = r.u16();
    m.header_length = r.u32();
    m.header_version = r.u32();
    m.flags = r.u32();
    m.vendor = r.u32();
    m.date = r.u32();
    m.size = r.u32();
    std::string tag = r.ascii(4);
    m.num_modules = r.u32();
    m.version.major = r.u16();
    m.version.minor = r.u16();
    m.version.hotfix = r.u16();
    m.version.build = r.u16();
    m.svn = r.u32();
    r.skip(MANIFEST_MODULUS_SIZE_OFFSET - r.position());
    m.modulus_size = r.u32();
    m.exponent_size = r.u32();

    if (!r.ok()) {
        result.error = "manifest header truncated";
        sink.emit(DiagnosticKind::malformed_manifest, Layer::Manifest,
                  entry.absolute(r.failed_at()),
                  "manifest field at " + to_hex(r.failed_at()) + " beyond entry of " +
                      to_hex(entry.size()) + " bytes");
        return result;
    }

    if (!has_manifest_signature(entry)) {
        result.error = "manifest tag not found";
        sink.emit(DiagnosticKind::signature_not_found, Layer::Manifest,
                  entry.absolute(MANIFEST_MAGIC_OFFSET), "$MN2 tag not found, got '" + tag + "'");
        return result;
    }

    result.ok = true;

    const size_t header_bytes = m.header_bytes();
    const size_t empty_at = entry.absolute(std::min(header_bytes, entry.size()));
    m.extensions.range = Range{empty_at, 0};
    m.extensions.trailing = Range{empty_at, 0};

    if (header_bytes < MANIFEST_FIXED_HEADER_SIZE) {
        sink.emit(DiagnosticKind::malformed_manifest, Layer::Manifest, m.offset,
                  "header length " + to_hex(header_bytes) + " shorter than fixed layout");
        return result;
    }
    if (header_bytes > entry.size()) {
        sink.emit(DiagnosticKind::malformed_manifest, Layer::Manifest, m.offset,
                  "header length " + to_hex(header_bytes) + " exceeds the " + to_hex(entry.size()) +
                      " bytes available");
        return result;
    }

    // modulus, exponent, signature
    const size_t modulus = static_cast<size_t>(m.modulus_size) * 4;
    const size_t exponent = static_cast<size_t>(m.exponent_size) * 4;
    const size_t key_end = MANIFEST_FIXED_HEADER_SIZE + modulus + exponent + modulus;
    if (key_end <= header_bytes) {
        m.rsa_modulus = Range{entry.absolute(MANIFEST_FIXED_HEADER_SIZE), modulus};
        m.rsa_exponent = Range{m.rsa_modulus.end(), exponent};
        m.rsa_signature = Range{m.rsa_exponent.end(), modulus};
    }
    if (key_end != header_bytes) {
        sink.emit(DiagnosticKind::malformed_manifest, Layer::Manifest, m.offset,
                  "header length " + to_hex(header_bytes) + " inconsistent with key material ending at " +
                      to_hex(key_end));
    }

    const size_t total = m.total_bytes();
    if (total < header_bytes) {
        sink.emit(DiagnosticKind::malformed_manifest, Layer::Manifest, m.offset,
                  "manifest size " + to_hex(total) + " smaller than header length " + to_hex(header_bytes));
        return result;
    }

    size_t end = total;
    if (end > entry.size()) {
        sink.emit(DiagnosticKind::malformed_manifest, Layer::Manifest, m.offset,
                  "manifest size " + to_hex(total) + " exceeds entry, extension region clamped to " +
                      to_hex(entry.size() - header_bytes));
        end = entry.size();
    }

    ByteCursor region = *entry.sub(header_bytes, end - header_bytes);
    if (with_extensions) {
        m.extensions = decode_extensions(region, sink);
    } else {
        m.extensions.range = region.range();
        m.extensions.trailing = Range{region.base(), 0};
    }

    spdlog::debug("manifest at {:#x}: version {}, header {:#x}, extensions {:#x}", m.offset,
                  m.version.to_string(), header_bytes, region.size());
    return result;
}

} // namespace mefw
