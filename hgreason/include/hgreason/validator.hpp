#ifndef HGREASON_VALIDATOR_HPP
#define HGREASON_VALIDATOR_HPP

#include <hgreason/atom.hpp>
#include <hgreason/hyperedge.hpp>
#include <hgreason/layer_registry.hpp>
#include <hgreason/pattern.hpp>
#include <hgreason/rule_index.hpp>
#include <hgreason/store.hpp>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace hgreason {

// =============================================================================
// Decisions
// =============================================================================

enum class Decision {
    ALLOW,
    DENY,
    UNKNOWN
};

const char* to_string(Decision decision);

// Batch aggregation order: DENY > UNKNOWN > ALLOW
Decision worst_of(Decision a, Decision b);

// =============================================================================
// Validator Configuration
// =============================================================================

struct ValidatorConfig {
    // A rule is blocking when its connector label contains one of these,
    // compared case-insensitively. Everything else is supporting.
    std::vector<std::string> blocking_markers = {"contraind", "forbidden"};

    // Layers whose facts enrich a proposal's concepts (e.g. user conditions)
    LayerSet context_layers = {"user"};

    // Cap on nearest-rule suggestions attached to UNKNOWN verdicts
    std::size_t max_suggestions = 3;

    // Nesting limit for rule-selection patterns given as text
    std::size_t max_pattern_depth = DEFAULT_MAX_PATTERN_DEPTH;

    std::string deny_reason = "contraindicated or forbidden by rules";
    std::string unknown_reason = "insufficient information";
};

// =============================================================================
// Verdicts
// =============================================================================

/**
 * Evidence for a verdict: one rule that fired, with the concepts that tied
 * it to the proposal. direct_match holds concepts present in the proposed
 * edge itself, context_match those supplied only by context facts.
 */
struct WhyTraceEntry {
    Hyperedge rule;
    Hyperedge connector;
    std::string layer;
    std::optional<std::string> source;
    bool mandatory = false;
    double confidence = 1.0;
    std::set<Atom> matched_concepts;
    std::set<Atom> direct_match;
    std::set<Atom> context_match;
};

using WhyTrace = std::vector<WhyTraceEntry>;

// Nearest rule that did not quite apply
struct Suggestion {
    Hyperedge rule;
    std::size_t overlap = 0;
    std::vector<Atom> missing_concepts;
};

struct Allowed {};

struct Denied {
    std::string reason;
};

struct Undetermined {
    std::string reason;
    std::vector<Suggestion> suggestions;
};

using Outcome = std::variant<Allowed, Denied, Undetermined>;

struct EdgeVerdict {
    Hyperedge edge;
    Outcome outcome;
    WhyTrace why_trace;

    Decision decision() const;
    std::string edge_str() const { return edge.to_str(); }
};

struct ValidationReport {
    Decision decision = Decision::ALLOW;
    std::vector<EdgeVerdict> kept;
    std::vector<EdgeVerdict> rejected;
    std::vector<EdgeVerdict> unknown;

    // Active rules considered, summed over proposed edges
    std::size_t rules_checked = 0;

    std::size_t num_edges() const { return kept.size() + rejected.size() + unknown.size(); }
};

// =============================================================================
// Validator
// =============================================================================

/**
 * Tri-state rule validator.
 *
 * For each proposed edge the active rules are collected afresh and split
 * into blocking and supporting rules. A rule is relevant when its concepts
 * are a non-empty subset of the proposal's evaluation context (the edge's
 * own concepts plus those of connected context facts) and at least one of
 * them appears in the edge itself.
 *
 *   any relevant mandatory blocking rule        -> DENY
 *   relevant supporting rules, no blocking rule -> ALLOW
 *   otherwise                                   -> UNKNOWN
 *
 * The validator only reads the store and the registry.
 */
class Validator {
private:
    const HypergraphStore& store_;
    const LayerRegistry& layers_;
    ValidatorConfig config_;

public:
    Validator(const HypergraphStore& store, const LayerRegistry& layers,
              ValidatorConfig config = {});

    /**
     * Classify every proposed edge.
     * layers, when given, replaces the registry's active set for this call
     * only. Throws InvalidArgument for an empty batch or confidence_min
     * outside [0,1]; store failures propagate as StoreError.
     */
    ValidationReport validate(const std::vector<Hyperedge>& proposed,
                              const std::optional<Hyperedge>& pattern = std::nullopt,
                              const std::optional<LayerSet>& layers = std::nullopt,
                              double confidence_min = 0.0) const;

    // Text form. All strings are parsed before the store is touched, so a
    // ParseError never leaves a partial report.
    ValidationReport validate(const std::vector<std::string>& proposed,
                              const std::optional<std::string>& pattern = std::nullopt,
                              const std::optional<LayerSet>& layers = std::nullopt,
                              double confidence_min = 0.0) const;

    // Single-edge decision against an already selected rule list
    EdgeVerdict evaluate(const Hyperedge& proposed, const RuleList& rules) const;

    bool is_blocking(const Rule& rule) const;

    const ValidatorConfig& config() const { return config_; }
};

} // namespace hgreason

#endif // HGREASON_VALIDATOR_HPP
