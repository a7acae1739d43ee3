// atom.cpp - Atom text parsing and rendering

#include "hgreason/atom.hpp"
#include "hgreason/errors.hpp"

#include <cctype>
#include <ostream>
#include <vector>

namespace hgreason {

namespace {

bool valid_type_code(const std::string& type) {
    if (type.empty() || !std::isupper(static_cast<unsigned char>(type[0]))) {
        return false;
    }
    for (char c : type) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '.' && c != '|' && c != '+' && c != '-') {
            return false;
        }
    }
    return true;
}

bool valid_namespace(const std::string& ns) {
    if (ns.empty()) return false;
    for (char c : ns) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::islower(uc) && !std::isdigit(uc)) {
            return false;
        }
    }
    return true;
}

} // namespace

Atom Atom::parse(const std::string& text, std::size_t offset) {
    if (text.empty()) {
        throw ParseError("empty atom", offset);
    }

    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t slash = text.find('/', start);
        if (slash == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, slash - start));
        start = slash + 1;
    }

    if (parts.size() > 3) {
        throw ParseError("too many '/' separators in atom '" + text + "'", offset);
    }
    if (parts[0].empty()) {
        throw ParseError("atom '" + text + "' has an empty label", offset);
    }

    Atom atom(parts[0]);
    if (parts.size() >= 2) {
        if (!valid_type_code(parts[1])) {
            throw ParseError("malformed type code in atom '" + text + "'",
                             offset + parts[0].size() + 1);
        }
        atom.type_ = parts[1];
    }
    if (parts.size() == 3) {
        if (!valid_namespace(parts[2])) {
            throw ParseError("malformed namespace in atom '" + text + "'",
                             offset + parts[0].size() + parts[1].size() + 2);
        }
        atom.namespace_ = parts[2];
    }
    return atom;
}

std::string Atom::to_str() const {
    std::string result = label_;
    if (!type_.empty()) {
        result += '/';
        result += type_;
        if (!namespace_.empty()) {
            result += '/';
            result += namespace_;
        }
    }
    return result;
}

Atom Atom::simplified() const {
    if (type_.empty()) {
        return Atom(label_);
    }
    return Atom(label_, type_.substr(0, 1));
}

std::ostream& operator<<(std::ostream& os, const Atom& atom) {
    return os << atom.to_str();
}

} // namespace hgreason
