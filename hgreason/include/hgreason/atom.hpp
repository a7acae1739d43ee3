#ifndef HGREASON_ATOM_HPP
#define HGREASON_ATOM_HPP

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <utility>

namespace hgreason {

// Typed token inside a hyperedge: label[/type[/namespace]],
// e.g. "ibuprofen/C", "is/Pd.so/en", "*", "*/P".
//
// Equality is exact over all three parts. Wildcard semantics only
// apply during pattern comparison (see pattern.hpp).
class Atom {
private:
    std::string label_;
    std::string type_;
    std::string namespace_;

public:
    Atom() = default;

    explicit Atom(std::string label, std::string type = "", std::string ns = "")
        : label_(std::move(label)), type_(std::move(type)), namespace_(std::move(ns)) {}

    // Parse "label/type/ns". Throws ParseError on an empty label or a
    // malformed type code. offset is added to reported positions.
    static Atom parse(const std::string& text, std::size_t offset = 0);

    // Accessors
    const std::string& label() const { return label_; }
    const std::string& type() const { return type_; }
    const std::string& ns() const { return namespace_; }

    bool is_typed() const { return !type_.empty(); }

    // First character of the type code, '\0' if untyped
    char main_type() const { return type_.empty() ? '\0' : type_[0]; }

    bool is_concept() const { return main_type() == 'C'; }
    bool is_predicate() const { return main_type() == 'P'; }

    // "*" or "*/T"
    bool is_wildcard() const { return label_ == "*"; }

    // "..." open-ended tail marker
    bool is_ellipsis() const { return label_ == "..." && type_.empty(); }

    bool is_pattern_token() const { return is_wildcard() || is_ellipsis(); }

    std::string to_str() const;

    // Same label, type reduced to its main type, namespace dropped
    Atom simplified() const;

    bool operator==(const Atom& other) const {
        return label_ == other.label_ && type_ == other.type_ && namespace_ == other.namespace_;
    }

    bool operator!=(const Atom& other) const {
        return !(*this == other);
    }

    bool operator<(const Atom& other) const {
        return to_str() < other.to_str();
    }
};

std::ostream& operator<<(std::ostream& os, const Atom& atom);

} // namespace hgreason

namespace std {
template<>
struct hash<hgreason::Atom> {
    std::size_t operator()(const hgreason::Atom& atom) const {
        std::size_t h = std::hash<std::string>{}(atom.label());
        h ^= std::hash<std::string>{}(atom.type()) + 0x9e3779b9 + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(atom.ns()) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};
}

#endif // HGREASON_ATOM_HPP
