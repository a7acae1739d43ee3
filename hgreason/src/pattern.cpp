// pattern.cpp - Wildcard pattern matching and pattern sanitization

#include "hgreason/pattern.hpp"
#include "hgreason/errors.hpp"

namespace hgreason {

bool atom_matches(const Atom& atom, const Atom& pattern_atom) {
    if (!pattern_atom.is_wildcard()) {
        return atom == pattern_atom;
    }
    if (!pattern_atom.is_typed()) {
        return true;
    }
    // Typed wildcard: */P matches P, Pd, Pd.so...
    return atom.type().compare(0, pattern_atom.type().size(), pattern_atom.type()) == 0;
}

bool matches(const Hyperedge& edge, const Hyperedge& pattern) {
    if (pattern.is_atom()) {
        const Atom& p = pattern.atom();
        if (p.is_wildcard() && !p.is_typed()) {
            return true;
        }
        return edge.is_atom() && atom_matches(edge.atom(), p);
    }

    if (edge.is_atom()) {
        return false;
    }

    const std::size_t n = pattern.arity();
    const bool open_ended = pattern[n - 1].is_atom() && pattern[n - 1].atom().is_ellipsis();
    const std::size_t fixed = open_ended ? n - 1 : n;

    if (open_ended ? edge.arity() < fixed : edge.arity() != fixed) {
        return false;
    }

    for (std::size_t i = 0; i < fixed; ++i) {
        if (!matches(edge[i], pattern[i])) {
            return false;
        }
    }
    return true;
}

const std::string& sanitize_pattern(const std::string& text, std::size_t max_depth) {
    std::size_t depth = 0;
    std::size_t max_observed = 0;
    std::size_t deepest_pos = 0;

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '(') {
            ++depth;
            if (depth > max_observed) {
                max_observed = depth;
                deepest_pos = i;
            }
        } else if (text[i] == ')') {
            if (depth == 0) {
                throw ParseError("unbalanced parentheses in pattern", i);
            }
            --depth;
        }
    }

    if (depth != 0) {
        throw ParseError("unbalanced parentheses in pattern", text.size());
    }
    if (max_observed > max_depth) {
        throw PatternError("pattern depth " + std::to_string(max_observed) +
                           " exceeds maximum " + std::to_string(max_depth), deepest_pos);
    }
    return text;
}

Hyperedge parse_pattern(const std::string& text, std::size_t max_depth) {
    return Hyperedge::parse(sanitize_pattern(text, max_depth));
}

} // namespace hgreason
