// graph_ops.cpp - Convenience lookups built on HypergraphStore::query

#include "hgreason/graph_ops.hpp"
#include "hgreason/errors.hpp"

#include <set>

namespace hgreason {

std::vector<Hyperedge> edges_by_connector(const HypergraphStore& store,
                                          const std::string& connector,
                                          std::size_t limit) {
    Hyperedge pattern(EdgeList{
        Hyperedge(Atom::parse(typed_predicate(connector))),
        Hyperedge(Atom("..."))
    });

    std::vector<Hyperedge> result;
    for (auto& stored : store.query(pattern)) {
        if (limit != 0 && result.size() >= limit) break;
        result.push_back(std::move(stored.edge));
    }
    return result;
}

std::vector<std::string> atoms_by_prefix(const HypergraphStore& store,
                                         const std::string& prefix,
                                         std::size_t limit) {
    if (limit == 0) {
        throw InvalidArgument("limit must be positive");
    }

    const bool is_prefix = !prefix.empty() && prefix.back() == '*';
    const std::string stem = is_prefix ? prefix.substr(0, prefix.size() - 1) : prefix;

    static const Hyperedge any_edge = Hyperedge::parse("(* ...)");

    std::set<std::string> found;
    for (const auto& stored : store.query(any_edge)) {
        for (const Atom& atom : stored.edge.atoms()) {
            std::string text = atom.to_str();
            bool hit = is_prefix ? text.compare(0, stem.size(), stem) == 0 : text == stem;
            if (hit) {
                found.insert(std::move(text));
            }
        }
    }

    std::vector<std::string> result;
    for (const auto& text : found) {
        if (result.size() >= limit) break;
        result.push_back(text);
    }
    return result;
}

} // namespace hgreason
