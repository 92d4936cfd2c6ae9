/**
 * mefw CLI - human-readable model report
 */

#pragma once

#include <mefw/mefw.hpp>

#include <ostream>

namespace mefw::cli {

// Partition tree with directories, manifests and extension records
void print_report(const StructuralModel& model, std::ostream& out);

// One line per diagnostic
void print_diagnostics(const std::vector<Diagnostic>& diagnostics, std::ostream& out);

} // namespace mefw::cli
