#ifndef HGREASON_STORE_HPP
#define HGREASON_STORE_HPP

#include <hgreason/attributes.hpp>
#include <hgreason/hyperedge.hpp>
#include <vector>

namespace hgreason {

// Edge returned by a store query together with its attribute mapping
struct StoredEdge {
    Hyperedge edge;
    Attributes attrs;
};

using StoredEdges = std::vector<StoredEdge>;

/**
 * Read interface of the hypergraph store the validator and reasoner run
 * against. Implementations own durability, indexing and pattern matching;
 * the core only issues these three calls and never mutates the store.
 *
 * Any failure must surface as StoreError (or a subclass). Calls are
 * treated as opaque blocking operations.
 */
class HypergraphStore {
public:
    virtual ~HypergraphStore() = default;

    // Every stored edge matching pattern (see pattern.hpp), unspecified order
    virtual StoredEdges query(const Hyperedge& pattern) const = 0;

    // Attributes of a stored edge; empty if the edge is unknown
    virtual Attributes get_attrs(const Hyperedge& edge) const = 0;

    // Stored edges sharing at least one atom with edge, excluding edge itself
    virtual StoredEdges neighbors_sharing_atom(const Hyperedge& edge) const = 0;
};

} // namespace hgreason

#endif // HGREASON_STORE_HPP
