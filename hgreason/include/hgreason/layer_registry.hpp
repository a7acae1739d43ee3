#ifndef HGREASON_LAYER_REGISTRY_HPP
#define HGREASON_LAYER_REGISTRY_HPP

#include <cstddef>
#include <mutex>
#include <set>
#include <string>

namespace hgreason {

using LayerSet = std::set<std::string>;

/**
 * Set of enabled knowledge layers ("foundation", "user", "plan", ...).
 *
 * Starts empty; changes only through enable()/disable(). Both are
 * idempotent and never fail. Every validator or reasoner call sharing the
 * instance sees the change. active() returns a copy, so an in-flight call
 * works on whichever set was current when it read the registry; there is
 * no snapshot isolation beyond that. Callers that need isolation use one
 * registry per session.
 */
class LayerRegistry {
private:
    mutable std::mutex mutex_;
    LayerSet enabled_;

public:
    LayerRegistry() = default;

    explicit LayerRegistry(const LayerSet& initial) : enabled_(initial) {}

    LayerRegistry(const LayerRegistry&) = delete;
    LayerRegistry& operator=(const LayerRegistry&) = delete;

    void enable(const std::string& layer);
    void disable(const std::string& layer);

    // enable() or disable() depending on flag
    void toggle(const std::string& layer, bool enabled);

    void clear();

    LayerSet active() const;
    bool is_active(const std::string& layer) const;
    std::size_t size() const;
};

} // namespace hgreason

#endif // HGREASON_LAYER_REGISTRY_HPP
