#ifndef HGREASON_RULE_INDEX_HPP
#define HGREASON_RULE_INDEX_HPP

#include <hgreason/atom.hpp>
#include <hgreason/attributes.hpp>
#include <hgreason/hyperedge.hpp>
#include <hgreason/layer_registry.hpp>
#include <hgreason/store.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hgreason {

/**
 * Stored edge viewed as a rule: an edge whose attributes carry a layer.
 * Reserved attributes are read once at projection time.
 */
struct Rule {
    Hyperedge edge;
    Attributes attrs;
    std::string layer;
    bool mandatory = false;
    double confidence = 1.0;
    std::optional<std::string> source;
    std::vector<Atom> concepts;

    // nullopt when the edge has no layer attribute.
    // Throws AttributeError on malformed mandatory/confidence values.
    static std::optional<Rule> from_stored(const StoredEdge& stored);

    const Hyperedge& connector() const { return edge.connector(); }
};

using RuleList = std::vector<Rule>;

/**
 * View over a store restricted to active rules.
 *
 * Nothing is cached: every call re-queries the store and re-filters by the
 * layer set and confidence threshold it is given. The cost is a linear
 * scan of the matched edges per call, which is fine while rule sets stay
 * small next to fact stores.
 */
class RuleIndex {
private:
    const HypergraphStore& store_;

public:
    explicit RuleIndex(const HypergraphStore& store) : store_(store) {}

    // (*/P ...) - every edge whose connector is a predicate
    static const Hyperedge& default_pattern();

    // Edges matching pattern (default_pattern() if absent) whose layer is
    // in layers and whose confidence >= confidence_min, in store order.
    // Throws InvalidArgument if confidence_min is outside [0,1].
    RuleList active_rules(const LayerSet& layers,
                          double confidence_min = 0.0,
                          const std::optional<Hyperedge>& pattern = std::nullopt) const;
};

} // namespace hgreason

#endif // HGREASON_RULE_INDEX_HPP
