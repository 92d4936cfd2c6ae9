#include "mefw/diagnostics.hpp"

namespace mefw {

DiagnosticPolicy default_diagnostic_policy() {
    DiagnosticPolicy policy;
    policy[diagnostic_kind_to_string(DiagnosticKind::unknown_extension_type)] =
        DiagnosticAction::Ignore;
    return policy;
}

// ============================================================================
// DiagnosticSink Implementation
// ============================================================================

void DiagnosticSink::emit(DiagnosticKind kind, Layer layer, size_t offset, std::string message) {
    emit_for(scope_, kind, layer, offset, std::move(message));
}

void DiagnosticSink::emit_for(const std::string& partition, DiagnosticKind kind, Layer layer,
                              size_t offset, std::string message) {
    Diagnostic d;
    d.kind = kind;
    d.layer = layer;
    d.offset = offset;
    d.partition = partition;
    d.message = std::move(message);

    std::lock_guard<std::mutex> lock(mutex_);
    // Ignored diagnostics are still collected but marked
    d.action = get_effective_action(kind);
    diagnostics_.push_back(std::move(d));
}

void DiagnosticSink::apply_override(DiagnosticKind kind, DiagnosticAction action) {
    std::lock_guard<std::mutex> lock(mutex_);
    overrides_[diagnostic_kind_to_string(kind)] = action;
}

void DiagnosticSink::append(const DiagnosticSink& other) {
    if (&other == this) return;
    std::vector<Diagnostic> incoming = other.all();
    std::lock_guard<std::mutex> lock(mutex_);
    diagnostics_.insert(diagnostics_.end(), incoming.begin(), incoming.end());
}

std::unique_ptr<DiagnosticSink> DiagnosticSink::scoped(const std::string& scope) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sink = std::make_unique<DiagnosticSink>(policy_, scope);
    sink->overrides_ = overrides_;
    return sink;
}

std::vector<Diagnostic> DiagnosticSink::diagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Diagnostic> result;
    for (const auto& d : diagnostics_) {
        if (d.action == DiagnosticAction::Ignore) {
            continue;
        }
        result.push_back(d);
    }
    return result;
}

std::vector<Diagnostic> DiagnosticSink::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diagnostics_;
}

bool DiagnosticSink::has_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& d : diagnostics_) {
        if (d.action == DiagnosticAction::Error) {
            return true;
        }
    }
    return false;
}

bool DiagnosticSink::has_effective_diagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& d : diagnostics_) {
        if (d.action != DiagnosticAction::Ignore) {
            return true;
        }
    }
    return false;
}

size_t DiagnosticSink::count(DiagnosticKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& d : diagnostics_) {
        if (d.kind == kind && d.action != DiagnosticAction::Ignore) {
            ++n;
        }
    }
    return n;
}

void DiagnosticSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    diagnostics_.clear();
}

DiagnosticAction DiagnosticSink::get_effective_action(DiagnosticKind kind) const {
    const std::string key = diagnostic_kind_to_string(kind);

    // Check overrides first (highest precedence)
    auto override_it = overrides_.find(key);
    if (override_it != overrides_.end()) {
        return override_it->second;
    }

    auto policy_it = policy_.find(key);
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    // Default: warn
    return DiagnosticAction::Warn;
}

} // namespace mefw
