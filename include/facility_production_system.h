// facility_production_system.h
#pragma once

#include <vector>

#include "simulation_context.h"
#include "tick_system.h"

// Staffs each facility for its quota, moves recipe input out of the host
// county, runs the recipe and returns the output to county stock.
class FacilityProductionSystem : public ITickSystem {
public:
    explicit FacilityProductionSystem(const SimulationConfig::Production& config);

    const char* name() const override { return "FacilityProduction"; }
    int tickInterval() const override { return TickInterval::Daily; }
    void initialize(EconomyState& state, const MapTopology& topology) override;
    void tick(EconomyState& state, const MapTopology& topology) override;

private:
    SimulationConfig::Production m_config;
    std::vector<int> m_countyWorkers;
    std::vector<GoodArray> m_quotaLeft;
};

// Splits each realm's need for facility outputs among the counties hosting
// those facilities. The quota drives the next day's FacilityProductionSystem.
class FacilityQuotaSystem : public ITickSystem {
public:
    const char* name() const override { return "FacilityQuota"; }
    int tickInterval() const override { return TickInterval::Daily; }
    void initialize(EconomyState& state, const MapTopology& topology) override;
    void tick(EconomyState& state, const MapTopology& topology) override;

    static void planQuotas(EconomyState& state, const MapTopology& topology);
};

// Recipe input a county's facilities need to meet their current quotas.
GoodArray facilityInputNeed(const EconomyState& state, int countyIndex);
