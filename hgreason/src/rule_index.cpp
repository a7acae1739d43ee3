// rule_index.cpp - Active rule selection over a HypergraphStore

#include "hgreason/rule_index.hpp"
#include "hgreason/debug_log.hpp"
#include "hgreason/errors.hpp"

namespace hgreason {

std::optional<Rule> Rule::from_stored(const StoredEdge& stored) {
    auto layer = stored.attrs.layer();
    if (!layer) {
        return std::nullopt;
    }

    Rule rule{stored.edge, stored.attrs, *layer};
    rule.mandatory = stored.attrs.mandatory();
    rule.confidence = stored.attrs.confidence();
    rule.source = stored.attrs.source();
    rule.concepts = stored.edge.concepts();
    return rule;
}

const Hyperedge& RuleIndex::default_pattern() {
    static const Hyperedge pattern = Hyperedge::parse("(*/P ...)");
    return pattern;
}

RuleList RuleIndex::active_rules(const LayerSet& layers,
                                 double confidence_min,
                                 const std::optional<Hyperedge>& pattern) const {
    if (!(confidence_min >= 0.0 && confidence_min <= 1.0)) {
        throw InvalidArgument("confidence_min must lie in [0,1], got " +
                              std::to_string(confidence_min));
    }

    RuleList rules;
    if (layers.empty()) {
        HGREASON_LOG(RULES, "no active layers, no rules selected");
        return rules;
    }

    const Hyperedge& selector = pattern ? *pattern : default_pattern();
    StoredEdges matched = store_.query(selector);

    for (const auto& stored : matched) {
        auto rule = Rule::from_stored(stored);
        if (!rule) continue;
        if (layers.count(rule->layer) == 0) continue;
        if (rule->confidence < confidence_min) continue;
        rules.push_back(std::move(*rule));
    }

    HGREASON_LOG(RULES, "pattern %s: %zu matched, %zu active",
                 selector.to_str().c_str(), matched.size(), rules.size());
    return rules;
}

} // namespace hgreason
