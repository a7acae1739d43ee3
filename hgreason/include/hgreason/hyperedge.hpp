#ifndef HGREASON_HYPEREDGE_HPP
#define HGREASON_HYPEREDGE_HPP

#include <hgreason/atom.hpp>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace hgreason {

class Hyperedge;

using EdgeList = std::vector<Hyperedge>;

// Deepest nesting Hyperedge::parse accepts by default
constexpr std::size_t MAX_EDGE_DEPTH = 256;

/**
 * Ordered, typed, recursively structured hyperedge.
 *
 * A hyperedge is either a single atom or a non-empty list of hyperedges,
 * where position 0 is the connector:
 *   (takes/P patient/C ibuprofen/C)
 *   (says/P mary/C (is/P sky/C blue/C))
 * Children are owned by value, so the structure is a tree and never cycles.
 * Immutable once constructed.
 */
class Hyperedge {
private:
    std::optional<Atom> atom_;
    EdgeList elements_;

public:
    // Atomic hyperedge
    Hyperedge(Atom atom);

    // Non-atomic hyperedge, elements must be non-empty
    explicit Hyperedge(EdgeList elements);

    // Parse canonical text. Throws ParseError on unbalanced parentheses,
    // empty lists, trailing input, malformed atoms or nesting beyond max_depth.
    static Hyperedge parse(const std::string& text, std::size_t max_depth = MAX_EDGE_DEPTH);

    // Accessors
    bool is_atom() const { return atom_.has_value(); }
    const Atom& atom() const;
    const EdgeList& elements() const { return elements_; }

    // Number of elements (1 for an atom)
    std::size_t arity() const { return is_atom() ? 1 : elements_.size(); }

    // Element access for non-atomic edges
    const Hyperedge& operator[](std::size_t index) const { return elements_[index]; }
    const Hyperedge& element(std::size_t index) const;

    // Position 0; the atom itself for atomic edges
    const Hyperedge& connector() const;

    // Iterators over elements
    auto begin() const { return elements_.begin(); }
    auto end() const { return elements_.end(); }

    // Distinct atoms, depth-first order of first appearance
    std::vector<Atom> atoms() const;

    // Every atom occurrence, depth-first
    std::vector<Atom> all_atoms() const;

    // Distinct concept atoms (main type 'C')
    std::vector<Atom> concepts() const;

    bool contains_atom(const Atom& atom) const;

    // True if any atom is a wildcard or "..."
    bool is_pattern() const;

    std::size_t depth() const;

    // Pattern comparison, see pattern.hpp for the rules
    bool matches(const Hyperedge& pattern) const;

    // Canonical text; parse(to_str()) == *this
    std::string to_str() const;

    bool operator==(const Hyperedge& other) const;

    bool operator!=(const Hyperedge& other) const {
        return !(*this == other);
    }

    // Ordering by canonical string
    bool operator<(const Hyperedge& other) const {
        return to_str() < other.to_str();
    }
};

// Copy with namespaces dropped and types reduced to their main type,
// e.g. (is/Pd.so/en graphbrain/Cp.s/en) -> (is/P graphbrain/C)
Hyperedge normalized(const Hyperedge& edge);

// Bare label helpers: trim, spaces to underscores, append /C or /P
// unless the label already carries a type
std::string typed_concept(const std::string& label);
std::string typed_predicate(const std::string& label);

std::ostream& operator<<(std::ostream& os, const Hyperedge& edge);

} // namespace hgreason

namespace std {
template<>
struct hash<hgreason::Hyperedge> {
    std::size_t operator()(const hgreason::Hyperedge& edge) const {
        if (edge.is_atom()) {
            return std::hash<hgreason::Atom>{}(edge.atom());
        }
        std::size_t hash_value = edge.arity();
        for (const auto& element : edge) {
            hash_value ^= (*this)(element) + 0x9e3779b9 + (hash_value << 6) + (hash_value >> 2);
        }
        return hash_value;
    }
};
}

#endif // HGREASON_HYPEREDGE_HPP
