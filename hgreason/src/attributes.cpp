// attributes.cpp - Typed readers for reserved edge attributes

#include "hgreason/attributes.hpp"
#include "hgreason/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace hgreason {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trimmed(const std::string& s) {
    std::size_t first = s.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    std::size_t last = s.find_last_not_of(" \t\n\r");
    return s.substr(first, last - first + 1);
}

} // namespace

std::string attr_to_string(const AttrValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream oss;
        oss << *d;
        return oss.str();
    }
    return std::get<std::string>(value);
}

const AttrValue* Attributes::find(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? &it->second : nullptr;
}

std::optional<std::string> Attributes::get_string(const std::string& key) const {
    const AttrValue* value = find(key);
    if (!value) return std::nullopt;
    return attr_to_string(*value);
}

void Attributes::merge(const Attributes& other) {
    for (const auto& [key, value] : other.values_) {
        values_[key] = value;
    }
}

bool Attributes::mandatory() const {
    const AttrValue* value = find(MANDATORY);
    if (!value) return false;

    if (const auto* b = std::get_if<bool>(value)) {
        return *b;
    }
    if (const auto* s = std::get_if<std::string>(value)) {
        std::string v = lowercase(trimmed(*s));
        if (v == "true") return true;
        if (v == "false") return false;
        throw AttributeError(MANDATORY, "expected true/false, got '" + *s + "'");
    }
    throw AttributeError(MANDATORY, "expected a boolean, got " + attr_to_string(*value));
}

double Attributes::confidence() const {
    const AttrValue* value = find(CONFIDENCE);
    if (!value) return 1.0;

    double result = 0.0;
    if (const auto* d = std::get_if<double>(value)) {
        result = *d;
    } else if (const auto* i = std::get_if<int64_t>(value)) {
        result = static_cast<double>(*i);
    } else if (const auto* s = std::get_if<std::string>(value)) {
        std::string text = trimmed(*s);
        char* end = nullptr;
        result = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size()) {
            throw AttributeError(CONFIDENCE, "expected a number, got '" + *s + "'");
        }
    } else {
        throw AttributeError(CONFIDENCE, "expected a number, got a boolean");
    }

    if (!(result >= 0.0 && result <= 1.0)) {
        throw AttributeError(CONFIDENCE, "value " + attr_to_string(*value) + " outside [0,1]");
    }
    return result;
}

} // namespace hgreason
