#include "mefw/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

namespace mefw {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::string to_hex(uint64_t value) {
    std::ostringstream os;
    os << "0x" << std::hex << value;
    return os.str();
}

std::optional<DiagnosticKind> parse_diagnostic_kind(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "out_of_bounds") return DiagnosticKind::out_of_bounds;
    if (lower == "signature_not_found") return DiagnosticKind::signature_not_found;
    if (lower == "malformed_header") return DiagnosticKind::malformed_header;
    if (lower == "malformed_manifest") return DiagnosticKind::malformed_manifest;
    if (lower == "malformed_extension") return DiagnosticKind::malformed_extension;
    if (lower == "invalid_entry_range") return DiagnosticKind::invalid_entry_range;
    if (lower == "trailing_bytes") return DiagnosticKind::trailing_bytes;
    if (lower == "unknown_extension_type") return DiagnosticKind::unknown_extension_type;
    if (lower == "duplicate_manifest") return DiagnosticKind::duplicate_manifest;
    if (lower == "checksum_mismatch") return DiagnosticKind::checksum_mismatch;
    if (lower == "unsupported_compression") return DiagnosticKind::unsupported_compression;

    return std::nullopt;
}

std::optional<DiagnosticAction> parse_diagnostic_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return DiagnosticAction::Warn;
    if (lower == "ignore") return DiagnosticAction::Ignore;
    if (lower == "error") return DiagnosticAction::Error;
    return std::nullopt;
}

std::string VersionQuad::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." +
           std::to_string(hotfix) + "." + std::to_string(build);
}

} // namespace mefw
