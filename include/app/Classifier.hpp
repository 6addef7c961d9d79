#pragma once
#include "model/Topology.hpp"
#include <vector>

namespace lasso::app {

// Split cores into preferred / non-preferred groups.
//
//  1. Cache asymmetry: every core has a known last-level cache group and the
//     groups come in exactly two distinct sizes -> larger-cache groups are
//     preferred (AMD X3D parts: V-Cache CCD vs plain CCD).
//  2. Hybrid: known efficiency flags include both true and false -> cores not
//     flagged as efficiency cores are preferred (unknown counts as preferred).
//  3. Otherwise Uniform with both sets empty.
//
// Two groups of equal size are Uniform: a symmetric group is never guessed
// to be the better one. Pure and total.
[[nodiscard]] model::Topology classify(const std::vector<model::CoreFact>& facts);

} // namespace lasso::app
