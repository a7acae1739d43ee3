#ifndef HGREASON_GRAPH_OPS_HPP
#define HGREASON_GRAPH_OPS_HPP

#include <hgreason/hyperedge.hpp>
#include <hgreason/store.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace hgreason {

// Stored edges whose connector is exactly `connector`. An untyped label is
// treated as a predicate ("treats" -> "treats/P"). limit 0 = unlimited.
std::vector<Hyperedge> edges_by_connector(const HypergraphStore& store,
                                          const std::string& connector,
                                          std::size_t limit = 0);

// Distinct atoms (canonical text) appearing in stored edges that equal
// `prefix`, or start with it when prefix ends in '*'. Sorted; at most
// `limit` entries. Throws InvalidArgument if limit == 0.
std::vector<std::string> atoms_by_prefix(const HypergraphStore& store,
                                         const std::string& prefix,
                                         std::size_t limit = 100);

} // namespace hgreason

#endif // HGREASON_GRAPH_OPS_HPP
