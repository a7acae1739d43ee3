#ifndef HGREASON_REASONER_HPP
#define HGREASON_REASONER_HPP

#include <hgreason/attributes.hpp>
#include <hgreason/hyperedge.hpp>
#include <hgreason/pattern.hpp>
#include <hgreason/store.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace hgreason {

struct ReasonerConfig {
    int default_hops = 2;
    int default_limit = 100;

    // Nesting limit for start patterns given as text
    std::size_t max_pattern_depth = DEFAULT_MAX_PATTERN_DEPTH;
};

/**
 * Edge discovered by multi-hop reasoning.
 * path lists the canonical strings of the chain that led here, starting at
 * the origin (or the matched start edge) and ending at the predecessor, so
 * path.size() == distance.
 */
struct ReasoningResult {
    Hyperedge edge;
    int distance = 0;
    std::vector<std::string> path;
    Attributes attrs;

    std::string edge_str() const { return edge.to_str(); }
};

struct NeighborResult {
    Hyperedge edge;
    int distance = 0;
    Attributes attrs;
};

/**
 * Bounded breadth-first traversal over edges sharing atoms.
 *
 * Two stored edges are adjacent iff they share at least one atom. A start
 * edge containing wildcards is a pattern: its matches form the distance-0
 * frontier and are reported with an empty path. A concrete start edge (or
 * atom) is only the origin and is not reported.
 *
 * Each edge is reported once, at the smallest hop count it was reached
 * (the visited set is keyed by canonical string). When several
 * predecessors reach an edge at the same depth the first one in store
 * iteration order wins; stores need not make that order deterministic.
 *
 * Traversal stops after `hops` layers or as soon as `limit` results exist,
 * even in the middle of a layer. Results are ordered by distance.
 */
class Reasoner {
private:
    const HypergraphStore& store_;
    ReasonerConfig config_;

    std::vector<ReasoningResult> traverse(const Hyperedge& start, int hops, int limit,
                                          bool track_paths) const;

public:
    explicit Reasoner(const HypergraphStore& store, ReasonerConfig config = {});

    // Throws InvalidArgument if hops <= 0 or limit <= 0
    std::vector<ReasoningResult> reason(const Hyperedge& start, int hops, int limit) const;
    std::vector<ReasoningResult> reason(const Hyperedge& start) const;

    // Start given as text, sanitized as a pattern before parsing
    std::vector<ReasoningResult> reason(const std::string& start, int hops, int limit) const;

    // Same traversal without path bookkeeping
    std::vector<NeighborResult> neighbors(const Hyperedge& node, int max_degree, int limit) const;
    std::vector<NeighborResult> neighbors(const Hyperedge& node) const;

    const ReasonerConfig& config() const { return config_; }
};

} // namespace hgreason

#endif // HGREASON_REASONER_HPP
