// inter_realm_trade_system.cpp
#include "inter_realm_trade_system.h"

#include <algorithm>
#include <sstream>

#include "economy_log.h"
#include "economy_state.h"
#include "market_orders.h"

void InterRealmTradeSystem::initialize(EconomyState& state, const MapTopology& /*topology*/) {
    m_netPosition.assign(state.realms.size(), 0.0);
    m_effectiveDemand.assign(state.realms.size(), 0.0);
    m_lastClearing.fill(GoodClearing{});
    m_atCeiling.fill(false);
}

void InterRealmTradeSystem::tick(EconomyState& state, const MapTopology& topology) {
    scanDeficits(state, topology);
    clearMarket(state.realms, state.marketPrices, &state.log, state.day);
}

void InterRealmTradeSystem::scanDeficits(EconomyState& state, const MapTopology& topology) {
    for (int r = 0; r < topology.realmCount(); ++r) {
        if (static_cast<size_t>(r) >= state.realms.size()) continue;
        RealmEconomy& re = state.realms[static_cast<size_t>(r)];
        re.deficit.fill(0.0);
        for (int c : topology.countiesOfRealm(r)) {
            const CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
            for (int g = 0; g < kGoodCount; ++g) {
                if (!goodDef(g).tradeable) continue;
                const size_t gi = static_cast<size_t>(g);
                re.deficit[gi] += std::max(0.0, ce.needOf(g) - ce.stock[gi]);
            }
        }
    }
}

void InterRealmTradeSystem::clearMarket(std::vector<RealmEconomy>& realms, GoodArray& prices, EconomyLog* log, int day) {
    for (GoodType good : kBuyPriority) {
        const GoodClearing result = clearGood(realms, good, prices);
        const size_t gi = static_cast<size_t>(goodIndex(good));
        const bool atCeiling = result.traded && result.price >= goodDef(good).maxPrice;
        if (atCeiling && !m_atCeiling[gi] && log) {
            std::ostringstream oss;
            oss << goodName(good) << " scarce: price at ceiling " << result.price
                << " (supply " << result.totalSupply << ", demand " << result.totalDemand << ")";
            log->addEvent(day, oss.str());
        }
        if (result.traded) {
            m_atCeiling[gi] = atCeiling;
        }
    }
}

InterRealmTradeSystem::GoodClearing InterRealmTradeSystem::clearGood(std::vector<RealmEconomy>& realms,
                                                                     GoodType good,
                                                                     GoodArray& prices) {
    const size_t gi = static_cast<size_t>(goodIndex(good));
    GoodClearing result;
    m_netPosition.assign(realms.size(), 0.0);
    m_effectiveDemand.assign(realms.size(), 0.0);

    // A realm covers its own deficit before it can sell, so it is never both
    // buyer and seller of the same unit.
    for (size_t r = 0; r < realms.size(); ++r) {
        double stock = realms[r].stockpile[gi];
        double deficit = realms[r].deficit[gi];
        const double selfSatisfy = std::min(stock, deficit);
        stock -= selfSatisfy;
        deficit -= selfSatisfy;

        const double net = stock - deficit;
        m_netPosition[r] = net;
        if (net > 0.0) {
            result.totalSupply += net;
        } else if (net < 0.0) {
            result.totalDemand += -net;
        }
    }

    result.price = prices[gi];
    if (result.totalSupply <= 0.0 || result.totalDemand <= 0.0) {
        m_lastClearing[gi] = result;
        return result;
    }

    const double price = clearingPrice(good, result.totalSupply, result.totalDemand);
    prices[gi] = price;
    result.price = price;
    if (price <= 0.0) {
        m_lastClearing[gi] = result;
        return result;
    }

    for (size_t r = 0; r < realms.size(); ++r) {
        if (m_netPosition[r] >= 0.0) continue;
        const double want = -m_netPosition[r];
        const double canAfford = std::max(0.0, realms[r].treasury) / price;
        m_effectiveDemand[r] = std::min(want, canAfford);
        result.effectiveDemand += m_effectiveDemand[r];
    }

    ClearingRatios ratios;
    if (!computeClearingRatios(result.totalSupply, result.effectiveDemand, ratios)) {
        m_lastClearing[gi] = result;
        return result;
    }

    for (size_t r = 0; r < realms.size(); ++r) {
        RealmEconomy& re = realms[r];
        if (m_netPosition[r] > 0.0) {
            const double sold = m_netPosition[r] * ratios.sellRatio;
            const double revenue = sold * price;
            re.stockpile[gi] = clampNonNegative(re.stockpile[gi] - sold);
            re.treasury += revenue;
            re.tradeExports[gi] += sold;
            re.tradeRevenue += revenue;
            result.sold += sold;
        } else if (m_effectiveDemand[r] > 0.0) {
            const double bought = m_effectiveDemand[r] * ratios.fillRatio;
            const double cost = bought * price;
            re.stockpile[gi] += bought;
            re.treasury = clampNonNegative(re.treasury - cost);
            re.tradeImports[gi] += bought;
            re.tradeSpending += cost;
            result.bought += bought;
        }
    }
    result.traded = true;
    m_lastClearing[gi] = result;
    return result;
}
