#ifndef HGREASON_MEMORY_STORE_HPP
#define HGREASON_MEMORY_STORE_HPP

#include <hgreason/atom.hpp>
#include <hgreason/attributes.hpp>
#include <hgreason/hyperedge.hpp>
#include <hgreason/store.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hgreason {

using EdgeSlot = std::size_t;

/**
 * In-process hypergraph store.
 * Keeps edges in insertion order and indexes them by every atom they
 * contain (at any nesting level), so neighbor lookup is a union of
 * per-atom edge lists rather than a full scan.
 *
 * Not synchronized: callers sharing a store across threads must serialize
 * mutation themselves.
 */
class MemoryStore : public HypergraphStore {
private:
    struct Entry {
        Hyperedge edge;
        Attributes attrs;
        bool live;
    };

    // Removal tombstones the slot. Once tombstones outnumber live edges the
    // table is compacted, so slot numbers are only stable between removals.
    std::vector<Entry> entries_;

    // Index: canonical string -> slot
    std::unordered_map<std::string, EdgeSlot> by_key_;

    // Index: atom -> slots of edges containing that atom
    std::unordered_map<Atom, std::vector<EdgeSlot>> atom_to_edges_;

    std::size_t live_count_ = 0;

    void update_indices_add_edge(EdgeSlot slot);
    void update_indices_remove_edge(EdgeSlot slot);
    std::optional<EdgeSlot> find_slot(const Hyperedge& edge) const;
    void compact();

public:
    MemoryStore() = default;

    // Insert or replace. Re-adding an existing edge replaces its attributes.
    // Throws InvalidArgument for atomic edges or edges containing wildcards.
    void add(const Hyperedge& edge, const Attributes& attrs = {});
    void add(const std::string& edge_text, const Attributes& attrs = {});

    // Merge attrs into an existing edge's attributes; false if absent
    bool set_attrs(const Hyperedge& edge, const Attributes& attrs);

    bool remove(const Hyperedge& edge);
    bool exists(const Hyperedge& edge) const;

    std::vector<Hyperedge> all_edges() const;

    // Stored edges containing atom, insertion order
    std::vector<Hyperedge> edges_containing(const Atom& atom) const;

    std::size_t size() const { return live_count_; }
    // Live plus tombstoned slots; never more than 2 * size()
    std::size_t slot_count() const { return entries_.size(); }
    bool empty() const { return live_count_ == 0; }
    void clear();

    // HypergraphStore
    StoredEdges query(const Hyperedge& pattern) const override;
    Attributes get_attrs(const Hyperedge& edge) const override;
    StoredEdges neighbors_sharing_atom(const Hyperedge& edge) const override;
};

} // namespace hgreason

#endif // HGREASON_MEMORY_STORE_HPP
