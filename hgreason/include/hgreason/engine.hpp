#ifndef HGREASON_ENGINE_HPP
#define HGREASON_ENGINE_HPP

#include <hgreason/layer_registry.hpp>
#include <hgreason/reasoner.hpp>
#include <hgreason/store.hpp>
#include <hgreason/validator.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hgreason {

/**
 * Validation and reasoning bound to one store and one layer registry.
 * The registry is owned per engine: two engines over the same store keep
 * independent layer state.
 */
class Engine {
private:
    const HypergraphStore& store_;
    LayerRegistry layers_;
    Validator validator_;
    Reasoner reasoner_;

public:
    explicit Engine(const HypergraphStore& store,
                    ValidatorConfig validator_config = {},
                    ReasonerConfig reasoner_config = {});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    LayerRegistry& layers() { return layers_; }
    const LayerRegistry& layers() const { return layers_; }

    const HypergraphStore& store() const { return store_; }

    ValidationReport validate(const std::vector<Hyperedge>& proposed,
                              const std::optional<Hyperedge>& pattern = std::nullopt,
                              const std::optional<LayerSet>& layers = std::nullopt,
                              double confidence_min = 0.0) const {
        return validator_.validate(proposed, pattern, layers, confidence_min);
    }

    ValidationReport validate(const std::vector<std::string>& proposed,
                              const std::optional<std::string>& pattern = std::nullopt,
                              const std::optional<LayerSet>& layers = std::nullopt,
                              double confidence_min = 0.0) const {
        return validator_.validate(proposed, pattern, layers, confidence_min);
    }

    std::vector<ReasoningResult> reason(const Hyperedge& start) const {
        return reasoner_.reason(start);
    }

    std::vector<ReasoningResult> reason(const Hyperedge& start, int hops, int limit) const {
        return reasoner_.reason(start, hops, limit);
    }

    std::vector<ReasoningResult> reason(const std::string& start, int hops, int limit) const {
        return reasoner_.reason(start, hops, limit);
    }

    std::vector<NeighborResult> neighbors(const Hyperedge& node, int max_degree, int limit) const {
        return reasoner_.neighbors(node, max_degree, limit);
    }

    const Validator& validator() const { return validator_; }
    const Reasoner& reasoner() const { return reasoner_; }
};

} // namespace hgreason

#endif // HGREASON_ENGINE_HPP
