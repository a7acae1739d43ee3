#ifndef HGREASON_HGREASON_HPP
#define HGREASON_HGREASON_HPP

// Convenience header pulling in the public API

#include <hgreason/errors.hpp>
#include <hgreason/atom.hpp>
#include <hgreason/hyperedge.hpp>
#include <hgreason/pattern.hpp>
#include <hgreason/attributes.hpp>
#include <hgreason/store.hpp>
#include <hgreason/memory_store.hpp>
#include <hgreason/layer_registry.hpp>
#include <hgreason/rule_index.hpp>
#include <hgreason/validator.hpp>
#include <hgreason/reasoner.hpp>
#include <hgreason/graph_ops.hpp>
#include <hgreason/engine.hpp>

#endif // HGREASON_HGREASON_HPP
