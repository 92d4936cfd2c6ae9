#include "mefw/fit.hpp"

#include <spdlog/spdlog.h>

namespace mefw {

namespace {

uint32_t read_u24(FieldReader& r) {
    uint32_t lo = r.u16();
    uint32_t hi = r.u8();
    return lo | (hi << 16);
}

} // namespace

const char* fit_entry_type_name(uint8_t type) {
    switch (type & FIT_TYPE_MASK) {
        case 0x00: return "FIT Header";
        case 0x01: return "Microcode Update";
        case 0x02: return "Startup AC Module";
        case 0x03: return "Diagnostic AC Module";
        case 0x07: return "BIOS Startup Module";
        case 0x08: return "TPM Policy Record";
        case 0x09: return "BIOS Policy Record";
        case 0x0A: return "TXT Policy Record";
        case 0x0B: return "Key Manifest Record";
        case 0x0C: return "Boot Policy Manifest";
        case 0x10: return "CSE Secure Boot";
        case 0x2D: return "Feature Policy Delivery Record";
        case 0x2F: return "JMP $ Debug Policy";
        case 0x7F: return "Unused Entry";
        default: break;
    }
    if (type >= 0x30 && type <= 0x70) return "Platform Manufacturer";
    return "Intel Reserved";
}

FitDecodeResult decode_fit(const ByteCursor& image, DiagnosticSink& sink) {
    FitDecodeResult result;
    Fit& fit = result.fit;

    if (image.size() < FIT_POINTER_FROM_END || image.size() > FIT_ADDRESS_SPACE_END) {
        result.error = "image size cannot hold a FIT pointer";
        return result;
    }
    const size_t pointer_at = image.size() - FIT_POINTER_FROM_END;
    fit.pointer = *image.read_u32_le(pointer_at);

    const uint64_t mapped_base = FIT_ADDRESS_SPACE_END - image.size();
    if (fit.pointer == 0xFFFFFFFF || fit.pointer < mapped_base) {
        result.error = "FIT pointer " + to_hex(fit.pointer) + " outside the mapped image";
        return result;
    }
    const size_t offset = static_cast<size_t>(fit.pointer - mapped_base);
    if (!image.matches(offset, FIT_MAGIC, 8)) {
        result.error = "no FIT header at " + to_hex(offset);
        return result;
    }

    fit.offset = image.absolute(offset);
    FieldReader r(image, offset + 8);
    uint32_t declared = read_u24(r);
    r.skip(1);
    fit.version = r.u16();
    uint8_t type = r.u8();
    fit.checksum = r.u8();
    if (!r.ok()) {
        sink.emit(DiagnosticKind::out_of_bounds, Layer::Fit, fit.offset, "FIT header truncated");
        result.error = "FIT header truncated";
        return result;
    }
    fit.checksum_valid = (type & FIT_CHECKSUM_VALID) != 0;
    // The header counts as the first entry
    fit.entry_count = declared > 0 ? declared - 1 : 0;
    result.ok = true;

    if (fit.checksum_valid) {
        auto table = image.read_bytes(offset, static_cast<size_t>(declared) * FIT_ENTRY_SIZE);
        uint8_t sum = 0;
        if (table) {
            for (size_t i = 0; i < table->size; ++i) {
                sum = static_cast<uint8_t>(sum + table->data[i]);
            }
        }
        if (!table || sum != 0) {
            sink.emit(DiagnosticKind::checksum_mismatch, Layer::Fit, fit.offset,
                      "FIT table checksum does not sum to zero");
        }
    }

    for (uint32_t i = 0; i < fit.entry_count; ++i) {
        const size_t pos = offset + FIT_ENTRY_SIZE + static_cast<size_t>(i) * FIT_ENTRY_SIZE;
        auto record = image.sub(pos, FIT_ENTRY_SIZE);
        if (!record) {
            sink.emit(DiagnosticKind::out_of_bounds, Layer::Fit, image.absolute(pos),
                      std::to_string(fit.entry_count - i) + " FIT entries beyond end of image");
            break;
        }

        FieldReader e(*record);
        FitEntry entry;
        entry.record_offset = record->base();
        uint64_t lo = e.u32();
        uint64_t hi = e.u32();
        entry.address = lo | (hi << 32);
        entry.size = read_u24(e);
        e.skip(1);
        entry.version = e.u16();
        uint8_t entry_type = e.u8();
        entry.checksum = e.u8();
        entry.type = entry_type & FIT_TYPE_MASK;
        entry.checksum_valid = (entry_type & FIT_CHECKSUM_VALID) != 0;
        fit.entries.push_back(entry);
    }

    spdlog::debug("FIT at {:#x}: {} entries", fit.offset, fit.entries.size());
    return result;
}

} // namespace mefw
