#include "hgreason/layer_registry.hpp"
#include "hgreason/debug_log.hpp"

namespace hgreason {

void LayerRegistry::enable(const std::string& layer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enabled_.insert(layer).second) {
        HGREASON_LOG(LAYERS, "'%s' enabled", layer.c_str());
    }
}

void LayerRegistry::disable(const std::string& layer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (enabled_.erase(layer) > 0) {
        HGREASON_LOG(LAYERS, "'%s' disabled", layer.c_str());
    }
}

void LayerRegistry::toggle(const std::string& layer, bool enabled) {
    if (enabled) {
        enable(layer);
    } else {
        disable(layer);
    }
}

void LayerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    enabled_.clear();
}

LayerSet LayerRegistry::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

bool LayerRegistry::is_active(const std::string& layer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_.count(layer) > 0;
}

std::size_t LayerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_.size();
}

} // namespace hgreason
