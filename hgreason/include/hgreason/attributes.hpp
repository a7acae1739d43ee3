#ifndef HGREASON_ATTRIBUTES_HPP
#define HGREASON_ATTRIBUTES_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace hgreason {

// Attribute value stored alongside an edge. Stores that keep everything as
// text (the common case) use the string alternative; typed readers below
// accept both forms.
using AttrValue = std::variant<bool, int64_t, double, std::string>;

std::string attr_to_string(const AttrValue& value);

/**
 * Metadata mapping attached to a stored edge. Not part of edge identity.
 *
 * Reserved keys are read through typed accessors; every other key is passed
 * through untouched. Keys are kept ordered.
 */
class Attributes {
public:
    static constexpr const char* LAYER = "layer";
    static constexpr const char* MANDATORY = "mandatory";
    static constexpr const char* CONFIDENCE = "confidence";
    static constexpr const char* SOURCE = "source";

    using Map = std::map<std::string, AttrValue>;

    Attributes() = default;

    // Textual attributes, the form most stores hand back
    Attributes(std::initializer_list<std::pair<std::string, std::string>> values) {
        for (const auto& [key, value] : values) {
            values_[key] = value;
        }
    }

    // Generic access. One overload per alternative so literals never
    // convert to bool.
    void set(const std::string& key, AttrValue value) { values_[key] = std::move(value); }
    void set(const std::string& key, bool value) { values_[key] = value; }
    void set(const std::string& key, int value) { values_[key] = static_cast<int64_t>(value); }
    void set(const std::string& key, int64_t value) { values_[key] = value; }
    void set(const std::string& key, double value) { values_[key] = value; }
    void set(const std::string& key, const char* value) { values_[key] = std::string(value); }
    void set(const std::string& key, std::string value) { values_[key] = std::move(value); }
    bool erase(const std::string& key) { return values_.erase(key) > 0; }
    bool has(const std::string& key) const { return values_.count(key) > 0; }
    const AttrValue* find(const std::string& key) const;
    std::optional<std::string> get_string(const std::string& key) const;

    // Overwrite keys present in other, keep the rest
    void merge(const Attributes& other);

    // Reserved readers. mandatory() and confidence() throw AttributeError
    // when the stored value cannot be read as the expected type or range.
    std::optional<std::string> layer() const { return get_string(LAYER); }
    std::optional<std::string> source() const { return get_string(SOURCE); }
    bool mandatory() const;        // default false
    double confidence() const;     // default 1.0, must lie in [0,1]

    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }
    const Map& values() const { return values_; }

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }

    bool operator==(const Attributes& other) const { return values_ == other.values_; }
    bool operator!=(const Attributes& other) const { return values_ != other.values_; }

private:
    Map values_;
};

} // namespace hgreason

#endif // HGREASON_ATTRIBUTES_HPP
