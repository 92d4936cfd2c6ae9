#pragma once

#include "mefw/types.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mefw {

using DiagnosticPolicy = std::unordered_map<std::string, DiagnosticAction>;

// Built-in policy: everything warns except unknown extension types, which are
// an expected outcome for an evolving format.
DiagnosticPolicy default_diagnostic_policy();

// ============================================================================
// Diagnostic Sink
// ============================================================================
//
// Append-only collector for non-fatal decode findings. Every emit is tagged
// with the source layer and the absolute byte offset. The sink is safe to
// share between worker threads; per-partition sinks created with scoped()
// are merged back with append() in partition order.

class DiagnosticSink {
public:
    DiagnosticSink() : policy_(default_diagnostic_policy()) {}

    explicit DiagnosticSink(const DiagnosticPolicy& policy, std::string scope = {})
        : policy_(policy), scope_(std::move(scope)) {}

    DiagnosticSink(const DiagnosticSink&) = delete;
    DiagnosticSink& operator=(const DiagnosticSink&) = delete;

    // Emit a diagnostic under the sink's scope (partition name)
    void emit(DiagnosticKind kind, Layer layer, size_t offset, std::string message);

    // Emit a diagnostic with an explicit partition name
    void emit_for(const std::string& partition, DiagnosticKind kind, Layer layer,
                  size_t offset, std::string message);

    // Override the action for one kind (highest precedence)
    void apply_override(DiagnosticKind kind, DiagnosticAction action);

    // Append everything collected by another sink, preserving its order
    void append(const DiagnosticSink& other);

    // A new empty sink with the same policy and overrides
    std::unique_ptr<DiagnosticSink> scoped(const std::string& scope) const;

    // Diagnostics after policy application; ignored ones are excluded
    std::vector<Diagnostic> diagnostics() const;

    // Every emitted diagnostic, ignored ones included
    std::vector<Diagnostic> all() const;

    // Check if any diagnostic was upgraded to error
    bool has_errors() const;

    // Check if any effective diagnostics remain (excluding ignored)
    bool has_effective_diagnostics() const;

    size_t count(DiagnosticKind kind) const;

    const std::string& scope() const { return scope_; }

    void clear();

private:
    DiagnosticAction get_effective_action(DiagnosticKind kind) const;

    DiagnosticPolicy policy_;
    std::unordered_map<std::string, DiagnosticAction> overrides_;
    std::string scope_;
    std::vector<Diagnostic> diagnostics_;
    mutable std::mutex mutex_;
};

} // namespace mefw
