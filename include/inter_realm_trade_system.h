// inter_realm_trade_system.h
#pragma once

#include <vector>

#include "goods.h"
#include "tick_system.h"

class EconomyLog;
struct RealmEconomy;

// Global market between realm treasuries and stockpiles. Each good in buy
// priority is cleared at a single supply/demand price.
class InterRealmTradeSystem : public ITickSystem {
public:
    struct GoodClearing {
        double totalSupply = 0.0;
        double totalDemand = 0.0;
        double effectiveDemand = 0.0;
        double price = 0.0;
        double sold = 0.0;
        double bought = 0.0;
        bool traded = false;
    };

    const char* name() const override { return "InterRealmTrade"; }
    int tickInterval() const override { return TickInterval::Daily; }
    void initialize(EconomyState& state, const MapTopology& topology) override;
    void tick(EconomyState& state, const MapTopology& topology) override;

    // Recomputes each realm's deficit as the unmet county need for tradeable
    // goods. The value stands until the next scan, so the quota planner sees it.
    static void scanDeficits(EconomyState& state, const MapTopology& topology);

    // Clears every good in buy priority; prices holds the published price per good.
    void clearMarket(std::vector<RealmEconomy>& realms, GoodArray& prices, EconomyLog* log, int day);
    GoodClearing clearGood(std::vector<RealmEconomy>& realms, GoodType good, GoodArray& prices);

    const GoodClearing& lastClearing(GoodType good) const {
        return m_lastClearing[static_cast<size_t>(goodIndex(good))];
    }

private:
    std::vector<double> m_netPosition;
    std::vector<double> m_effectiveDemand;
    std::array<GoodClearing, kGoodCount> m_lastClearing{};
    std::array<bool, kGoodCount> m_atCeiling{};
};
