// memory_store.cpp - In-process HypergraphStore with an atom index

#include "hgreason/memory_store.hpp"
#include "hgreason/debug_log.hpp"
#include "hgreason/errors.hpp"
#include "hgreason/pattern.hpp"

#include <algorithm>

namespace hgreason {

// =============================================================================
// Index maintenance
// =============================================================================

void MemoryStore::update_indices_add_edge(EdgeSlot slot) {
    const Entry& entry = entries_[slot];
    by_key_[entry.edge.to_str()] = slot;
    for (const Atom& atom : entry.edge.atoms()) {
        atom_to_edges_[atom].push_back(slot);
    }
}

void MemoryStore::update_indices_remove_edge(EdgeSlot slot) {
    const Entry& entry = entries_[slot];
    by_key_.erase(entry.edge.to_str());
    for (const Atom& atom : entry.edge.atoms()) {
        auto it = atom_to_edges_.find(atom);
        if (it == atom_to_edges_.end()) continue;

        auto& slots = it->second;
        slots.erase(std::remove(slots.begin(), slots.end(), slot), slots.end());

        // Drop the atom once no edge references it
        if (slots.empty()) {
            atom_to_edges_.erase(it);
        }
    }
}

void MemoryStore::compact() {
    std::vector<Entry> live;
    live.reserve(live_count_);
    for (auto& entry : entries_) {
        if (entry.live) {
            live.push_back(std::move(entry));
        }
    }
    entries_ = std::move(live);

    by_key_.clear();
    atom_to_edges_.clear();
    for (EdgeSlot slot = 0; slot < entries_.size(); ++slot) {
        update_indices_add_edge(slot);
    }

    HGREASON_LOG(STORE, "compacted to %zu slots", entries_.size());
}

std::optional<EdgeSlot> MemoryStore::find_slot(const Hyperedge& edge) const {
    auto it = by_key_.find(edge.to_str());
    if (it == by_key_.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Mutation
// =============================================================================

void MemoryStore::add(const Hyperedge& edge, const Attributes& attrs) {
    if (edge.is_atom()) {
        throw InvalidArgument("cannot store atomic edge " + edge.to_str());
    }
    if (edge.is_pattern()) {
        throw InvalidArgument("cannot store pattern " + edge.to_str());
    }

    if (auto slot = find_slot(edge)) {
        entries_[*slot].attrs = attrs;
        HGREASON_LOG(STORE, "updated %s", edge.to_str().c_str());
        return;
    }

    entries_.push_back(Entry{edge, attrs, true});
    update_indices_add_edge(entries_.size() - 1);
    ++live_count_;
    HGREASON_LOG(STORE, "added %s", edge.to_str().c_str());
}

void MemoryStore::add(const std::string& edge_text, const Attributes& attrs) {
    add(Hyperedge::parse(edge_text), attrs);
}

bool MemoryStore::set_attrs(const Hyperedge& edge, const Attributes& attrs) {
    auto slot = find_slot(edge);
    if (!slot) return false;
    entries_[*slot].attrs.merge(attrs);
    return true;
}

bool MemoryStore::remove(const Hyperedge& edge) {
    auto slot = find_slot(edge);
    if (!slot) return false;

    update_indices_remove_edge(*slot);
    entries_[*slot].live = false;
    --live_count_;
    HGREASON_LOG(STORE, "removed %s", edge.to_str().c_str());

    if (entries_.size() - live_count_ > live_count_) {
        compact();
    }
    return true;
}

void MemoryStore::clear() {
    entries_.clear();
    by_key_.clear();
    atom_to_edges_.clear();
    live_count_ = 0;
}

// =============================================================================
// Lookup
// =============================================================================

bool MemoryStore::exists(const Hyperedge& edge) const {
    return find_slot(edge).has_value();
}

std::vector<Hyperedge> MemoryStore::all_edges() const {
    std::vector<Hyperedge> result;
    result.reserve(live_count_);
    for (const auto& entry : entries_) {
        if (entry.live) {
            result.push_back(entry.edge);
        }
    }
    return result;
}

std::vector<Hyperedge> MemoryStore::edges_containing(const Atom& atom) const {
    std::vector<Hyperedge> result;
    auto it = atom_to_edges_.find(atom);
    if (it == atom_to_edges_.end()) return result;
    for (EdgeSlot slot : it->second) {
        result.push_back(entries_[slot].edge);
    }
    return result;
}

StoredEdges MemoryStore::query(const Hyperedge& pattern) const {
    // Every concrete atom of the pattern must appear in a match, so the
    // shortest posting list among them bounds the candidate set.
    const std::vector<EdgeSlot>* candidates = nullptr;
    for (const Atom& atom : pattern.atoms()) {
        if (atom.is_pattern_token()) continue;
        auto it = atom_to_edges_.find(atom);
        if (it == atom_to_edges_.end()) {
            return {};
        }
        if (!candidates || it->second.size() < candidates->size()) {
            candidates = &it->second;
        }
    }

    StoredEdges result;
    auto consider = [&](EdgeSlot slot) {
        const Entry& entry = entries_[slot];
        if (entry.live && matches(entry.edge, pattern)) {
            result.push_back(StoredEdge{entry.edge, entry.attrs});
        }
    };

    if (candidates) {
        for (EdgeSlot slot : *candidates) consider(slot);
    } else {
        for (EdgeSlot slot = 0; slot < entries_.size(); ++slot) consider(slot);
    }
    return result;
}

Attributes MemoryStore::get_attrs(const Hyperedge& edge) const {
    auto slot = find_slot(edge);
    return slot ? entries_[*slot].attrs : Attributes{};
}

StoredEdges MemoryStore::neighbors_sharing_atom(const Hyperedge& edge) const {
    std::vector<EdgeSlot> slots;
    for (const Atom& atom : edge.atoms()) {
        auto it = atom_to_edges_.find(atom);
        if (it != atom_to_edges_.end()) {
            slots.insert(slots.end(), it->second.begin(), it->second.end());
        }
    }

    std::sort(slots.begin(), slots.end());
    slots.erase(std::unique(slots.begin(), slots.end()), slots.end());

    auto self = find_slot(edge);

    StoredEdges result;
    for (EdgeSlot slot : slots) {
        if (self && slot == *self) continue;
        result.push_back(StoredEdge{entries_[slot].edge, entries_[slot].attrs});
    }
    return result;
}

} // namespace hgreason
