#ifndef HGREASON_PATTERN_HPP
#define HGREASON_PATTERN_HPP

#include <hgreason/atom.hpp>
#include <hgreason/hyperedge.hpp>
#include <cstddef>
#include <string>

namespace hgreason {

// Pattern comparison between a stored edge and a pattern edge.
//
// Pattern elements:
//   *        matches any element, atom or nested edge, of any type
//   */T      matches any atom whose type starts with T (atoms only)
//   ...      last element only; matches zero or more remaining elements
//   (...)    nested pattern, matched recursively
//   other    matches only an identical atom, type included
//
// An exactly typed pattern atom never matches a differently typed atom with
// the same label: capital_of/P does not match capital_of/C.
bool matches(const Hyperedge& edge, const Hyperedge& pattern);

// Atom-level rule used by matches()
bool atom_matches(const Atom& atom, const Atom& pattern_atom);

// Maximum nesting depth accepted by sanitize_pattern() by default
constexpr std::size_t DEFAULT_MAX_PATTERN_DEPTH = 10;

/**
 * Validate raw pattern text before parsing.
 * Throws ParseError on unbalanced parentheses and PatternError when
 * nesting exceeds max_depth. Returns the text unchanged.
 */
const std::string& sanitize_pattern(const std::string& text,
                                    std::size_t max_depth = DEFAULT_MAX_PATTERN_DEPTH);

// sanitize_pattern() followed by Hyperedge::parse()
Hyperedge parse_pattern(const std::string& text,
                        std::size_t max_depth = DEFAULT_MAX_PATTERN_DEPTH);

} // namespace hgreason

#endif // HGREASON_PATTERN_HPP
