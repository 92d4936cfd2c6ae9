/**
 * mefw CLI - human-readable model report
 */

#include "report.hpp"
#include "common.hpp"

#include <iomanip>

namespace mefw::cli {

namespace {

void print_extensions(const ExtensionRegion& region, const std::string& indent, std::ostream& out) {
    for (const auto& rec : region.records) {
        out << indent << hex(rec.offset, 8) << "  " << std::left << std::setw(28)
            << rec.type_name() << std::right << " type " << std::setw(2) << rec.type << ", "
            << rec.length << " bytes";
        if (const auto* attrs = std::get_if<ModuleAttributes>(&rec.body)) {
            out << ", " << compression_to_string(compression_from_code(attrs->compression_type))
                << " " << attrs->compressed_size << " -> " << attrs->uncompressed_size;
        } else if (const auto* info = std::get_if<SignedPackageInfo>(&rec.body)) {
            out << ", package " << info->package_name << ", " << info->modules.size()
                << " modules";
        } else if (const auto* part = std::get_if<PartitionInfoExtension>(&rec.body)) {
            out << ", partition " << part->partition_name << " " << hex(part->partition_length);
        } else if (const auto* ifwi = std::get_if<IfwiPartitionManifest>(&rec.body)) {
            out << ", partition " << ifwi->partition_name << " v" << ifwi->version_major << "."
                << ifwi->version_minor;
        }
        out << "\n";
    }
    if (!region.trailing.empty()) {
        out << indent << hex(region.trailing.offset, 8) << "  " << region.trailing.length
            << " unconsumed bytes\n";
    }
}

void print_manifest(const Manifest& m, std::ostream& out) {
    out << "    manifest @ " << hex(m.offset, 8) << ": version " << m.version.to_string()
        << ", " << m.date_string() << ", vendor " << m.vendor_name() << ", svn " << m.svn
        << "\n";
    print_extensions(m.extensions, "      ", out);
}

void print_mfs(const MfsVolume& v, std::ostream& out) {
    out << "    MFS " << mfs_generation_to_string(v.generation) << ", page size "
        << hex(v.page_size);
    if (v.generation == MfsGeneration::Gen2) {
        size_t active = 0;
        for (const auto& p : v.gen2_pages) {
            if (p.active()) ++active;
        }
        out << ", " << v.gen2_pages.size() << " pages, " << active << " active, volume tag "
            << (v.gen2_volume_magic ? "ok" : "missing") << "\n";
        return;
    }

    out << ", " << v.page_count(MfsPageKind::System) << " system + "
        << v.page_count(MfsPageKind::Data) << " data pages";
    if (v.blank_page) out << ", blank @ " << hex(*v.blank_page, 8);
    out << "\n";
    out << "      " << v.chunks.size() << " chunks, " << v.system_chunks << " system";
    if (v.header) {
        size_t present = 0;
        for (const auto& f : v.files) {
            if (f.state == MfsFileState::Present) ++present;
        }
        out << ", volume v" << v.header->version << ", " << v.header->files << " file slots, "
            << present << " files";
    }
    out << "\n";
}

void print_partition(const Partition& p, std::ostream& out) {
    KnownPartition known = describe_partition(p.name);
    out << std::left << std::setw(4) << p.name << std::right << " " << hex(p.range.offset, 8)
        << " +" << hex(p.range.length, 8) << "  " << std::left << std::setw(7)
        << partition_kind_to_string(p.kind) << std::right << " " << known.description << "\n";

    if (p.directory) {
        const auto& dir = *p.directory;
        out << "    $CPD " << dir.header.partition_name << ", " << dir.entries.size()
            << " entries";
        if (dir.header.crc32) out << ", crc32 " << (dir.header.crc_valid ? "ok" : "BAD");
        out << "\n";
        for (const auto& e : dir.entries) {
            out << "      " << std::left << std::setw(12) << e.name << std::right << " "
                << hex(e.absolute_offset, 8) << " +" << hex(e.length, 8);
            if (e.compressed) out << " huffman";
            if (!e.range_valid) out << " INVALID RANGE";
            out << "\n";
        }
        for (const auto& meta : dir.metadata) {
            out << "    metadata " << meta.module_name << "\n";
            print_extensions(meta.extensions, "      ", out);
        }
    }

    if (p.gen2) {
        out << "    Gen 2 directory " << p.gen2->name << ", " << p.gen2->modules.size()
            << " modules\n";
        for (const auto& m : p.gen2->modules) {
            out << "      " << std::left << std::setw(16) << m.name << std::right << " "
                << hex(m.absolute_offset, 8) << " +" << hex(m.size, 8) << " "
                << compression_to_string(m.compression()) << ", entry point "
                << hex(m.entry_point, 8) << "\n";
        }
    }

    if (p.manifest) print_manifest(*p.manifest, out);
    if (p.mfs) print_mfs(*p.mfs, out);
}

} // namespace

void print_diagnostics(const std::vector<Diagnostic>& diagnostics, std::ostream& out) {
    for (const auto& d : diagnostics) {
        out << action_to_string(d.action) << ": " << hex(d.offset, 8) << " ["
            << layer_to_string(d.layer);
        if (!d.partition.empty()) out << " " << d.partition;
        out << "] " << diagnostic_kind_to_string(d.kind) << ": " << d.message << "\n";
    }
}

void print_report(const StructuralModel& model, std::ostream& out) {
    const auto& fpt = model.fpt;
    out << "$FPT @ " << hex(fpt.offset, 8) << " (region " << hex(fpt.region_base, 8) << "), "
        << fpt.entry_count << " entries, header v"
        << static_cast<int>(fpt.header_version) << ", checksum "
        << (fpt.checksum_valid ? "ok" : "BAD");
    if (fpt.fitc_version) out << ", FITC " << fpt.fitc_version->to_string();
    out << "\n\n";

    for (const auto& p : model.partitions) {
        print_partition(p, out);
    }

    if (model.fit) {
        out << "\nFIT @ " << hex(model.fit->offset, 8) << ", " << model.fit->entries.size()
            << " entries\n";
        for (const auto& e : model.fit->entries) {
            out << "  " << std::left << std::setw(32) << fit_entry_type_name(e.type) << std::right
                << " " << hex(e.address, 8) << " size " << hex(e.size) << "\n";
        }
    }

    if (!model.diagnostics.empty()) {
        out << "\n" << model.diagnostics.size() << " diagnostics\n";
        print_diagnostics(model.diagnostics, out);
    }
}

} // namespace mefw::cli
