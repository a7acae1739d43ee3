// validator.cpp - Tri-state validation with why-trace

#include "hgreason/validator.hpp"
#include "hgreason/debug_log.hpp"
#include "hgreason/errors.hpp"

#include <algorithm>
#include <cctype>

namespace hgreason {

// =============================================================================
// Decisions
// =============================================================================

const char* to_string(Decision decision) {
    switch (decision) {
        case Decision::ALLOW: return "ALLOW";
        case Decision::DENY: return "DENY";
        case Decision::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

namespace {

int severity(Decision decision) {
    switch (decision) {
        case Decision::DENY: return 2;
        case Decision::UNKNOWN: return 1;
        case Decision::ALLOW:
        default: return 0;
    }
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Evaluation context of one proposed edge
struct EdgeContext {
    std::set<Atom> direct;                    // concepts of the proposed edge
    std::set<Atom> supplied;                  // concepts added by context facts
    std::set<const Rule*> facts;              // connected context facts

    // A concept counts for `rule` if the edge has it, or if context supplies
    // it and `rule` is not itself a context fact. Facts only ever match directly.
    bool covers(const Atom& term, const Rule& rule) const {
        if (direct.count(term)) return true;
        return facts.count(&rule) == 0 && supplied.count(term) > 0;
    }
};

WhyTraceEntry make_trace_entry(const Rule& rule, const EdgeContext& ctx) {
    WhyTraceEntry entry{rule.edge, rule.connector(), rule.layer};
    entry.source = rule.source;
    entry.mandatory = rule.mandatory;
    entry.confidence = rule.confidence;
    for (const Atom& term : rule.concepts) {
        entry.matched_concepts.insert(term);
        if (ctx.direct.count(term)) {
            entry.direct_match.insert(term);
        } else {
            entry.context_match.insert(term);
        }
    }
    return entry;
}

} // namespace

Decision worst_of(Decision a, Decision b) {
    return severity(a) >= severity(b) ? a : b;
}

Decision EdgeVerdict::decision() const {
    if (std::holds_alternative<Denied>(outcome)) return Decision::DENY;
    if (std::holds_alternative<Undetermined>(outcome)) return Decision::UNKNOWN;
    return Decision::ALLOW;
}

// =============================================================================
// Validator
// =============================================================================

Validator::Validator(const HypergraphStore& store, const LayerRegistry& layers,
                     ValidatorConfig config)
    : store_(store), layers_(layers), config_(std::move(config)) {
    for (auto& marker : config_.blocking_markers) {
        marker = lowercase(marker);
    }
}

bool Validator::is_blocking(const Rule& rule) const {
    const Hyperedge& connector = rule.connector();
    std::string text = lowercase(connector.is_atom() ? connector.atom().label()
                                                     : connector.to_str());
    for (const auto& marker : config_.blocking_markers) {
        if (!marker.empty() && text.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

EdgeVerdict Validator::evaluate(const Hyperedge& proposed, const RuleList& rules) const {
    EdgeContext ctx;
    for (const Atom& term : proposed.concepts()) {
        ctx.direct.insert(term);
    }

    // Context facts: non-blocking rules from a context layer that talk about
    // at least one concept of the proposal (e.g. "patient has diabetes").
    for (const auto& rule : rules) {
        if (config_.context_layers.count(rule.layer) == 0 || is_blocking(rule)) {
            continue;
        }
        bool connected = std::any_of(rule.concepts.begin(), rule.concepts.end(),
            [&ctx](const Atom& c) { return ctx.direct.count(c) > 0; });
        if (!connected) continue;

        ctx.facts.insert(&rule);
        for (const Atom& term : rule.concepts) {
            if (!ctx.direct.count(term)) {
                ctx.supplied.insert(term);
            }
        }
    }

    WhyTrace mandatory_blocks;
    WhyTrace soft_blocks;
    WhyTrace supports;

    struct Candidate {
        const Rule* rule;
        std::size_t overlap;
    };
    std::vector<Candidate> near_misses;

    for (const auto& rule : rules) {
        if (rule.concepts.empty()) continue;

        std::size_t overlap = 0;
        bool anchored = false;
        for (const Atom& term : rule.concepts) {
            if (ctx.covers(term, rule)) ++overlap;
            if (ctx.direct.count(term)) anchored = true;
        }

        bool relevant = anchored && overlap == rule.concepts.size();
        if (!relevant) {
            // Context facts describe the situation, they are not rules to suggest
            if (overlap > 0 && ctx.facts.count(&rule) == 0) {
                near_misses.push_back(Candidate{&rule, overlap});
            }
            continue;
        }

        if (is_blocking(rule)) {
            (rule.mandatory ? mandatory_blocks : soft_blocks).push_back(make_trace_entry(rule, ctx));
        } else {
            supports.push_back(make_trace_entry(rule, ctx));
        }
    }

    if (!mandatory_blocks.empty()) {
        return EdgeVerdict{proposed, Denied{config_.deny_reason}, std::move(mandatory_blocks)};
    }

    if (!supports.empty() && soft_blocks.empty()) {
        return EdgeVerdict{proposed, Allowed{}, std::move(supports)};
    }

    std::sort(near_misses.begin(), near_misses.end(),
        [](const Candidate& a, const Candidate& b) {
            if (a.overlap != b.overlap) return a.overlap > b.overlap;
            return a.rule->edge < b.rule->edge;
        });

    Undetermined undetermined{config_.unknown_reason, {}};
    for (const auto& candidate : near_misses) {
        if (undetermined.suggestions.size() >= config_.max_suggestions) break;
        Suggestion suggestion{candidate.rule->edge, candidate.overlap, {}};
        for (const Atom& term : candidate.rule->concepts) {
            if (!ctx.covers(term, *candidate.rule)) {
                suggestion.missing_concepts.push_back(term);
            }
        }
        undetermined.suggestions.push_back(std::move(suggestion));
    }

    // Non-mandatory blocking evidence first, then any support it outweighed
    WhyTrace trace = std::move(soft_blocks);
    trace.insert(trace.end(), supports.begin(), supports.end());
    return EdgeVerdict{proposed, std::move(undetermined), std::move(trace)};
}

ValidationReport Validator::validate(const std::vector<Hyperedge>& proposed,
                                     const std::optional<Hyperedge>& pattern,
                                     const std::optional<LayerSet>& layers,
                                     double confidence_min) const {
    if (proposed.empty()) {
        throw InvalidArgument("validate requires at least one proposed edge");
    }
    if (!(confidence_min >= 0.0 && confidence_min <= 1.0)) {
        throw InvalidArgument("confidence_min must lie in [0,1], got " +
                              std::to_string(confidence_min));
    }

    const LayerSet active = layers ? *layers : layers_.active();
    RuleIndex index(store_);

    ValidationReport report;
    for (const auto& edge : proposed) {
        RuleList rules = index.active_rules(active, confidence_min, pattern);
        report.rules_checked += rules.size();

        EdgeVerdict verdict = evaluate(edge, rules);
        Decision decision = verdict.decision();
        report.decision = worst_of(report.decision, decision);

        HGREASON_LOG(VALIDATE, "%s -> %s (%zu rules, %zu trace entries)",
                     edge.to_str().c_str(), to_string(decision),
                     rules.size(), verdict.why_trace.size());

        switch (decision) {
            case Decision::ALLOW:
                report.kept.push_back(std::move(verdict));
                break;
            case Decision::DENY:
                report.rejected.push_back(std::move(verdict));
                break;
            case Decision::UNKNOWN:
                report.unknown.push_back(std::move(verdict));
                break;
        }
    }
    return report;
}

ValidationReport Validator::validate(const std::vector<std::string>& proposed,
                                     const std::optional<std::string>& pattern,
                                     const std::optional<LayerSet>& layers,
                                     double confidence_min) const {
    std::vector<Hyperedge> edges;
    edges.reserve(proposed.size());
    for (const auto& text : proposed) {
        edges.push_back(Hyperedge::parse(text));
    }

    std::optional<Hyperedge> selector;
    if (pattern) {
        selector = parse_pattern(*pattern, config_.max_pattern_depth);
    }
    return validate(edges, selector, layers, confidence_min);
}

} // namespace hgreason
