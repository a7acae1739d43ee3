// hyperedge.cpp - Hyperedge construction, parsing and traversal

#include "hgreason/hyperedge.hpp"
#include "hgreason/errors.hpp"
#include "hgreason/pattern.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <stdexcept>
#include <unordered_set>

namespace hgreason {

// =============================================================================
// Parsing
// =============================================================================

namespace {

class EdgeParser {
    const std::string& text_;
    std::size_t max_depth_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;

    static bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    void skip_whitespace() {
        while (pos_ < text_.size() && is_space(text_[pos_])) {
            ++pos_;
        }
    }

    Hyperedge parse_atom() {
        std::size_t start = pos_;
        while (pos_ < text_.size() && !is_space(text_[pos_]) &&
               text_[pos_] != '(' && text_[pos_] != ')') {
            ++pos_;
        }
        return Hyperedge(Atom::parse(text_.substr(start, pos_ - start), start));
    }

    Hyperedge parse_list() {
        std::size_t open = pos_;
        if (++depth_ > max_depth_) {
            throw ParseError("hyperedge nested deeper than " +
                             std::to_string(max_depth_) + " levels", open);
        }
        ++pos_;  // consume '('

        EdgeList elements;
        while (true) {
            skip_whitespace();
            if (pos_ >= text_.size()) {
                throw ParseError("unbalanced parentheses: '(' at " +
                                 std::to_string(open) + " is never closed", pos_);
            }
            if (text_[pos_] == ')') {
                if (elements.empty()) {
                    throw ParseError("empty hyperedge '()'", open);
                }
                ++pos_;
                --depth_;
                return Hyperedge(std::move(elements));
            }
            elements.push_back(parse_element());
        }
    }

public:
    EdgeParser(const std::string& text, std::size_t max_depth)
        : text_(text), max_depth_(max_depth) {}

    Hyperedge parse_element() {
        skip_whitespace();
        if (pos_ >= text_.size()) {
            throw ParseError("unexpected end of input", pos_);
        }
        if (text_[pos_] == ')') {
            throw ParseError("unbalanced parentheses: unexpected ')'", pos_);
        }
        if (text_[pos_] == '(') {
            return parse_list();
        }
        return parse_atom();
    }

    Hyperedge parse_all() {
        skip_whitespace();
        if (pos_ >= text_.size()) {
            throw ParseError("empty input", 0);
        }
        Hyperedge edge = parse_element();
        skip_whitespace();
        if (pos_ < text_.size()) {
            if (text_[pos_] == ')') {
                throw ParseError("unbalanced parentheses: unexpected ')'", pos_);
            }
            throw ParseError("unexpected trailing input", pos_);
        }
        return edge;
    }
};

void collect_atoms(const Hyperedge& edge, std::vector<Atom>& out) {
    if (edge.is_atom()) {
        out.push_back(edge.atom());
        return;
    }
    for (const auto& element : edge) {
        collect_atoms(element, out);
    }
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

Hyperedge::Hyperedge(Atom atom)
    : atom_(std::move(atom)) {}

Hyperedge::Hyperedge(EdgeList elements)
    : elements_(std::move(elements)) {
    if (elements_.empty()) {
        throw InvalidArgument("Hyperedge must have at least one element");
    }
}

Hyperedge Hyperedge::parse(const std::string& text, std::size_t max_depth) {
    return EdgeParser(text, max_depth).parse_all();
}

// =============================================================================
// Accessors
// =============================================================================

const Atom& Hyperedge::atom() const {
    if (!atom_) {
        throw std::logic_error("Hyperedge " + to_str() + " is not an atom");
    }
    return *atom_;
}

const Hyperedge& Hyperedge::element(std::size_t index) const {
    if (index >= arity() || is_atom()) {
        throw std::out_of_range("Element index out of range");
    }
    return elements_[index];
}

const Hyperedge& Hyperedge::connector() const {
    return is_atom() ? *this : elements_.front();
}

std::vector<Atom> Hyperedge::all_atoms() const {
    std::vector<Atom> result;
    collect_atoms(*this, result);
    return result;
}

std::vector<Atom> Hyperedge::atoms() const {
    std::vector<Atom> result;
    std::unordered_set<Atom> seen;
    for (auto& atom : all_atoms()) {
        if (seen.insert(atom).second) {
            result.push_back(std::move(atom));
        }
    }
    return result;
}

std::vector<Atom> Hyperedge::concepts() const {
    std::vector<Atom> result;
    for (auto& atom : atoms()) {
        if (atom.is_concept() && !atom.is_wildcard()) {
            result.push_back(std::move(atom));
        }
    }
    return result;
}

bool Hyperedge::contains_atom(const Atom& atom) const {
    if (is_atom()) {
        return *atom_ == atom;
    }
    return std::any_of(elements_.begin(), elements_.end(),
        [&atom](const Hyperedge& e) { return e.contains_atom(atom); });
}

bool Hyperedge::is_pattern() const {
    if (is_atom()) {
        return atom_->is_pattern_token();
    }
    return std::any_of(elements_.begin(), elements_.end(),
        [](const Hyperedge& e) { return e.is_pattern(); });
}

std::size_t Hyperedge::depth() const {
    std::size_t max_child = 0;
    for (const auto& element : elements_) {
        max_child = std::max(max_child, element.depth());
    }
    return is_atom() ? 0 : max_child + 1;
}

bool Hyperedge::matches(const Hyperedge& pattern) const {
    return hgreason::matches(*this, pattern);
}

std::string Hyperedge::to_str() const {
    if (is_atom()) {
        return atom_->to_str();
    }
    std::string result = "(";
    for (std::size_t i = 0; i < elements_.size(); ++i) {
        if (i > 0) result += ' ';
        result += elements_[i].to_str();
    }
    result += ')';
    return result;
}

bool Hyperedge::operator==(const Hyperedge& other) const {
    return atom_ == other.atom_ && elements_ == other.elements_;
}

// =============================================================================
// Free helpers
// =============================================================================

Hyperedge normalized(const Hyperedge& edge) {
    if (edge.is_atom()) {
        return Hyperedge(edge.atom().simplified());
    }
    EdgeList elements;
    elements.reserve(edge.arity());
    for (const auto& element : edge) {
        elements.push_back(normalized(element));
    }
    return Hyperedge(std::move(elements));
}

namespace {

std::string canonical_label(const std::string& label) {
    std::size_t first = label.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        throw InvalidArgument("empty label");
    }
    std::size_t last = label.find_last_not_of(" \t\n\r");
    std::string result = label.substr(first, last - first + 1);
    std::replace(result.begin(), result.end(), ' ', '_');
    return result;
}

} // namespace

std::string typed_concept(const std::string& label) {
    std::string canon = canonical_label(label);
    return canon.find('/') != std::string::npos ? canon : canon + "/C";
}

std::string typed_predicate(const std::string& label) {
    std::string canon = canonical_label(label);
    return canon.find('/') != std::string::npos ? canon : canon + "/P";
}

std::ostream& operator<<(std::ostream& os, const Hyperedge& edge) {
    return os << edge.to_str();
}

} // namespace hgreason
