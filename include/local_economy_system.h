// local_economy_system.h
#pragma once

#include <vector>

#include "simulation_context.h"
#include "tick_system.h"

// Daily county production, household consumption, county upkeep and the
// basic-needs satisfaction average.
class LocalEconomySystem : public ITickSystem {
public:
    explicit LocalEconomySystem(const SimulationConfig::Production& config);

    const char* name() const override { return "LocalEconomy"; }
    int tickInterval() const override { return TickInterval::Daily; }
    void initialize(EconomyState& state, const MapTopology& topology) override;
    void tick(EconomyState& state, const MapTopology& topology) override;

    // Consumption-weighted share of basic demand that was met today; 1 with no basic demand.
    static double dailyBasicFulfillment(const GoodArray& need, const GoodArray& consumed);

private:
    SimulationConfig::Production m_config;
    std::vector<char> m_distressed;
};
