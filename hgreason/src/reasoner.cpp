// reasoner.cpp - Bounded multi-hop BFS over shared-atom adjacency

#include "hgreason/reasoner.hpp"
#include "hgreason/debug_log.hpp"
#include "hgreason/errors.hpp"

#include <unordered_set>

namespace hgreason {

namespace {

struct FrontierNode {
    Hyperedge edge;
    std::vector<std::string> path;
};

void check_bounds(int hops, int limit) {
    if (hops <= 0) {
        throw InvalidArgument("hops must be positive, got " + std::to_string(hops));
    }
    if (limit <= 0) {
        throw InvalidArgument("limit must be positive, got " + std::to_string(limit));
    }
}

} // namespace

Reasoner::Reasoner(const HypergraphStore& store, ReasonerConfig config)
    : store_(store), config_(config) {}

std::vector<ReasoningResult> Reasoner::traverse(const Hyperedge& start, int hops, int limit,
                                                bool track_paths) const {
    check_bounds(hops, limit);

    const std::size_t max_results = static_cast<std::size_t>(limit);
    std::vector<ReasoningResult> results;
    std::unordered_set<std::string> visited;
    std::vector<FrontierNode> frontier;

    if (start.is_pattern()) {
        for (auto& match : store_.query(start)) {
            std::string key = match.edge.to_str();
            if (!visited.insert(key).second) continue;

            results.push_back(ReasoningResult{match.edge, 0, {}, std::move(match.attrs)});
            if (results.size() >= max_results) {
                HGREASON_LOG(REASON, "limit %d reached at distance 0", limit);
                return results;
            }
            frontier.push_back(FrontierNode{std::move(match.edge), {}});
        }
    } else {
        visited.insert(start.to_str());
        frontier.push_back(FrontierNode{start, {}});
    }

    HGREASON_LOG(REASON, "start %s: %zu frontier edges", start.to_str().c_str(), frontier.size());

    for (int depth = 1; depth <= hops && !frontier.empty(); ++depth) {
        std::vector<FrontierNode> next_frontier;

        for (const auto& node : frontier) {
            std::vector<std::string> child_path;
            if (track_paths) {
                child_path = node.path;
                child_path.push_back(node.edge.to_str());
            }

            for (auto& neighbor : store_.neighbors_sharing_atom(node.edge)) {
                if (!visited.insert(neighbor.edge.to_str()).second) continue;

                results.push_back(ReasoningResult{neighbor.edge, depth, child_path,
                                                  std::move(neighbor.attrs)});
                if (results.size() >= max_results) {
                    HGREASON_LOG(REASON, "limit %d reached at distance %d", limit, depth);
                    return results;
                }
                next_frontier.push_back(FrontierNode{std::move(neighbor.edge), child_path});
            }
        }

        HGREASON_LOG(REASON, "distance %d: %zu new edges", depth, next_frontier.size());
        frontier = std::move(next_frontier);
    }

    return results;
}

std::vector<ReasoningResult> Reasoner::reason(const Hyperedge& start, int hops, int limit) const {
    return traverse(start, hops, limit, true);
}

std::vector<ReasoningResult> Reasoner::reason(const Hyperedge& start) const {
    return reason(start, config_.default_hops, config_.default_limit);
}

std::vector<ReasoningResult> Reasoner::reason(const std::string& start, int hops, int limit) const {
    check_bounds(hops, limit);
    return reason(parse_pattern(start, config_.max_pattern_depth), hops, limit);
}

std::vector<NeighborResult> Reasoner::neighbors(const Hyperedge& node, int max_degree, int limit) const {
    std::vector<NeighborResult> result;
    for (auto& found : traverse(node, max_degree, limit, false)) {
        result.push_back(NeighborResult{std::move(found.edge), found.distance, std::move(found.attrs)});
    }
    return result;
}

std::vector<NeighborResult> Reasoner::neighbors(const Hyperedge& node) const {
    return neighbors(node, config_.default_hops, config_.default_limit);
}

} // namespace hgreason
