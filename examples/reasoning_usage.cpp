/**
 * Multi-Hop Reasoning Example
 *
 * Demonstrates bounded traversal over edges sharing atoms:
 * - Reasoning from a concrete edge and from a pattern
 * - Reading distances and the chains that led to each edge
 * - Connector and atom lookups
 */

#include <hgreason/hgreason.hpp>
#include <iostream>

using namespace hgreason;

namespace {

void print_results(const std::vector<ReasoningResult>& results) {
    for (const auto& result : results) {
        std::cout << "  [" << result.distance << "] " << result.edge_str() << "\n";
        for (const auto& step : result.path) {
            std::cout << "        via " << step << "\n";
        }
    }
    std::cout << "\n";
}

} // namespace

int main() {
    std::cout << "=== Multi-Hop Reasoning Example ===\n\n";

    MemoryStore store;
    store.add("(capital_of/P paris/C france/C)");
    store.add("(located_in/P france/C europe/C)");
    store.add("(member_of/P france/C eu/C)");
    store.add("(uses/P eu/C euro/C)");
    store.add("(located_in/P louvre/C paris/C)");
    store.add("(says/P guide/C (is/P louvre/C museum/C))");
    std::cout << "Store holds " << store.size() << " edges\n\n";

    Reasoner reasoner(store);

    std::cout << "From (visits/P tourist/C paris/C), 2 hops:\n";
    print_results(reasoner.reason(Hyperedge::parse("(visits/P tourist/C paris/C)"), 2, 100));

    std::cout << "From every capital_of edge, 1 hop:\n";
    print_results(reasoner.reason(std::string("(capital_of/P * *)"), 1, 100));

    std::cout << "From france/C, capped at 2 results:\n";
    print_results(reasoner.reason(Hyperedge::parse("france/C"), 3, 2));

    std::cout << "Edges with connector located_in:\n";
    for (const auto& e : edges_by_connector(store, "located_in")) {
        std::cout << "  " << e << "\n";
    }

    std::cout << "\nAtoms starting with 'eu':\n";
    for (const auto& atom : atoms_by_prefix(store, "eu*")) {
        std::cout << "  " << atom << "\n";
    }

    try {
        reasoner.reason(Hyperedge::parse("(capital_of/P paris/C france/C)"), 0, 10);
    } catch (const InvalidArgument& e) {
        std::cout << "\nRejected: " << e.what() << "\n";
    }

    return 0;
}
