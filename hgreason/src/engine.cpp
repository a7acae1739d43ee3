#include "hgreason/engine.hpp"

namespace hgreason {

Engine::Engine(const HypergraphStore& store,
               ValidatorConfig validator_config,
               ReasonerConfig reasoner_config)
    : store_(store)
    , layers_()
    , validator_(store, layers_, std::move(validator_config))
    , reasoner_(store, reasoner_config) {}

} // namespace hgreason
