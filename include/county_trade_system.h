// county_trade_system.h
#pragma once

#include <vector>

#include "goods.h"
#include "market_orders.h"
#include "simulation_context.h"
#include "tick_system.h"

enum class TradeScope {
    IntraProvince,
    CrossProvince,
    CrossRealm
};

// County-to-county trade at published prices. Local trade runs first so that
// cheaper nearby surplus is consumed before wider, tolled passes.
class CountyTradeSystem : public ITickSystem {
public:
    explicit CountyTradeSystem(const SimulationConfig::Trade& config);

    const char* name() const override { return "CountyTrade"; }
    int tickInterval() const override { return TickInterval::Daily; }
    void initialize(EconomyState& state, const MapTopology& topology) override;
    void tick(EconomyState& state, const MapTopology& topology) override;

    // One clearing pass over a set of counties. Returns units traded across all goods.
    double executePass(EconomyState& state,
                       const MapTopology& topology,
                       const std::vector<int>& countyIndices,
                       TradeScope scope);

    // Orders and lots posted by the most recent pass, across all goods.
    const std::vector<BuyOrder>& lastOrders() const { return m_orders; }
    const std::vector<ConsignmentLot>& lastLots() const { return m_lots; }

private:
    SimulationConfig::Trade m_config;
    std::vector<GoodArray> m_inputNeed;
    std::vector<int> m_allCounties;

    // Working set of the current pass; index-aligned with the county lists.
    std::vector<BuyOrder> m_orders;
    std::vector<int> m_orderCounty;
    std::vector<ConsignmentLot> m_lots;
    std::vector<int> m_lotCounty;
};
