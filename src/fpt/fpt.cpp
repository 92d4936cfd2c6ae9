#include "mefw/fpt.hpp"

#include <spdlog/spdlog.h>

namespace mefw {

namespace {

// Past this many unreadable records the rest are summarised in one diagnostic
constexpr size_t MAX_ENTRY_DIAGNOSTICS = 64;

bool decode_header(const ByteCursor& image, size_t offset, FptHeader& header, DiagnosticSink& sink) {
    auto view = image.sub(offset, image.size() - offset);
    if (!view) return false;

    FieldReader r(*view, 4);
    header.offset = image.absolute(offset);
    header.entry_count = r.u32();
    header.header_version = r.u8();
    header.entry_version = r.u8();
    header.header_length = r.u8();
    header.checksum = r.u8();
    header.ticks_to_add = r.u16();
    header.tokens_to_add = r.u16();
    header.uma_size = r.u32();
    header.flags = r.u32();
    if (!r.ok()) {
        sink.emit(DiagnosticKind::out_of_bounds, Layer::Fpt, view->absolute(r.failed_at()),
                  "FPT header truncated");
        return false;
    }

    if (header.header_length >= FPT_HEADER_SIZE) {
        VersionQuad fitc;
        fitc.major = r.u16();
        fitc.minor = r.u16();
        fitc.hotfix = r.u16();
        fitc.build = r.u16();
        if (r.ok()) {
            header.fitc_version = fitc;
        } else {
            sink.emit(DiagnosticKind::out_of_bounds, Layer::Fpt, view->absolute(r.failed_at()),
                      "FPT FITC version truncated");
        }
    }

    if (header.header_length < FPT_HEADER_MIN_SIZE) {
        sink.emit(DiagnosticKind::malformed_header, Layer::Fpt, header.offset,
                  "FPT header length " + to_hex(header.header_length) + " shorter than fixed fields");
        return true;
    }

    auto raw = view->read_bytes(0, header.header_length);
    if (!raw) {
        sink.emit(DiagnosticKind::out_of_bounds, Layer::Fpt, header.offset,
                  "FPT header length " + to_hex(header.header_length) + " exceeds image");
        return true;
    }
    header.checksum_valid = fpt_header_sum(*raw) == 0;
    if (!header.checksum_valid) {
        sink.emit(DiagnosticKind::checksum_mismatch, Layer::Fpt, header.offset,
                  "FPT header checksum does not sum to zero");
    }
    return true;
}

} // namespace

std::vector<size_t> default_fpt_offsets() {
    return {0, 0x10};
}

size_t fpt_region_base(size_t signature_offset) {
    if (signature_offset >= FPT_ROM_BYPASS_SIZE &&
        (signature_offset - FPT_ROM_BYPASS_SIZE) % 0x1000 == 0) {
        return signature_offset - FPT_ROM_BYPASS_SIZE;
    }
    return signature_offset;
}

uint8_t fpt_header_sum(const ByteView& header) {
    uint8_t sum = 0;
    for (size_t i = 0; i < header.size; ++i) {
        sum = static_cast<uint8_t>(sum + header.data[i]);
    }
    return sum;
}

FptDecodeResult decode_fpt(const ByteCursor& image, const std::vector<size_t>& candidate_offsets,
                           DiagnosticSink& sink, bool scan) {
    FptDecodeResult result;

    std::optional<size_t> found;
    for (size_t candidate : candidate_offsets) {
        if (image.matches(candidate, FPT_MAGIC, 4)) {
            found = candidate;
            break;
        }
    }
    if (!found && scan) {
        for (size_t at = 0; at + FPT_HEADER_SIZE <= image.size(); at += FPT_SCAN_STEP) {
            if (image.matches(at, FPT_MAGIC, 4)) {
                found = at;
                break;
            }
        }
    }

    if (!found) {
        result.error = "FPT signature not found";
        return result;
    }

    result.header.region_base = fpt_region_base(image.absolute(*found));
    spdlog::debug("FPT signature at {:#x}, region base {:#x}", *found, result.header.region_base);

    if (!decode_header(image, *found, result.header, sink)) {
        // Signature present but the header cannot be read: nothing to walk,
        // the parse still succeeds with an empty table.
        result.ok = true;
        return result;
    }

    // The table follows the header; header_length describes the header only
    size_t table = 0;
    if (!checked_add(*found, FPT_HEADER_SIZE, table)) {
        table = image.size();
    }

    const size_t image_size = image.size();
    // Entry ranges are absolute, so compare against the absolute end
    const size_t image_end = image.absolute(image_size);
    size_t unreadable = 0;
    for (uint32_t i = 0; i < result.header.entry_count; ++i) {
        size_t record = 0;
        bool addressable = checked_add(table, static_cast<size_t>(i) * FPT_ENTRY_SIZE, record);

        auto view = addressable ? image.sub(record, FPT_ENTRY_SIZE) : std::nullopt;
        if (!view) {
            size_t at = addressable ? image.absolute(record) : image.absolute(image_size);
            if (++unreadable > MAX_ENTRY_DIAGNOSTICS) {
                sink.emit(DiagnosticKind::out_of_bounds, Layer::Fpt, at,
                          std::to_string(result.header.entry_count - i) +
                              " further FPT entries beyond end of image");
                break;
            }
            sink.emit(DiagnosticKind::out_of_bounds, Layer::Fpt, at,
                      "FPT entry " + std::to_string(i) + " beyond end of image");
            continue;
        }

        FieldReader r(*view);
        FptEntry entry;
        entry.index = i;
        entry.record_offset = view->base();
        entry.name = r.ascii(4);
        entry.owner = r.ascii(4);
        entry.offset = r.u32();
        entry.length = r.u32();
        entry.start_tokens = r.u32();
        entry.max_tokens = r.u32();
        entry.scratch_sectors = r.u32();
        entry.flags = r.u32();
        entry.region_base = result.header.region_base;

        // Placeholders are checked too: a zero offset with a length past the
        // end is still out of range.
        size_t start = 0;
        size_t end = 0;
        if (!checked_add(entry.region_base, entry.offset, start) ||
            !checked_add(start, entry.length, end) || end > image_end) {
            entry.range_valid = false;
            sink.emit(DiagnosticKind::invalid_entry_range, Layer::Fpt, entry.record_offset,
                      "FPT entry " + entry.name + " range " + to_hex(start) + "+" +
                          to_hex(entry.length) + " exceeds image size " + to_hex(image_end));
        }

        result.entries.push_back(std::move(entry));
    }

    spdlog::debug("FPT declares {} entries, decoded {}", result.header.entry_count,
                  result.entries.size());

    result.ok = true;
    return result;
}

} // namespace mefw
