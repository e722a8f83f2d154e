// scenario.h
#pragma once

#include "map_topology.h"

struct SimulationContext;

// Land kinds used to derive per-county productivity for synthetic worlds.
enum class LandKind {
    Farmland = 0,
    Forest = 1,
    Hills = 2,
    Coast = 3
};

// Baseline per-capita daily yields for a land kind, before jitter.
GoodArray landKindProductivity(LandKind kind);

// Deterministic realm/province/county hierarchy sized by config.world and
// seeded from the context's world seed.
MapTopology buildSyntheticTopology(const SimulationContext& ctx);
