// county_trade_system.cpp
#include "county_trade_system.h"

#include <algorithm>

#include "economy_state.h"
#include "facility_production_system.h"

CountyTradeSystem::CountyTradeSystem(const SimulationConfig::Trade& config)
    : m_config(config) {}

void CountyTradeSystem::initialize(EconomyState& state, const MapTopology& /*topology*/) {
    m_allCounties.clear();
    m_allCounties.reserve(state.counties.size());
    for (size_t c = 0; c < state.counties.size(); ++c) {
        m_allCounties.push_back(static_cast<int>(c));
    }
}

void CountyTradeSystem::tick(EconomyState& state, const MapTopology& topology) {
    if (m_allCounties.size() != state.counties.size()) {
        initialize(state, topology);
    }
    m_inputNeed.resize(state.counties.size());
    for (size_t c = 0; c < state.counties.size(); ++c) {
        m_inputNeed[c] = facilityInputNeed(state, static_cast<int>(c));
    }

    for (int p = 0; p < topology.provinceCount(); ++p) {
        const std::vector<int>& members = topology.countiesOfProvince(p);
        if (members.size() <= 1) continue;
        executePass(state, topology, members, TradeScope::IntraProvince);
    }

    for (int r = 0; r < topology.realmCount(); ++r) {
        if (topology.provincesOfRealm(r).size() <= 1) continue;
        executePass(state, topology, topology.countiesOfRealm(r), TradeScope::CrossProvince);
    }

    if (m_config.countyCrossRealmTrade && topology.realmCount() > 1) {
        executePass(state, topology, m_allCounties, TradeScope::CrossRealm);
    }
}

double CountyTradeSystem::executePass(EconomyState& state,
                                      const MapTopology& topology,
                                      const std::vector<int>& countyIndices,
                                      TradeScope scope) {
    if (m_inputNeed.size() != state.counties.size()) {
        m_inputNeed.assign(state.counties.size(), zeroGoods());
    }

    const double tollRate = scope == TradeScope::IntraProvince ? 0.0 : m_config.crossProvinceTollRate;
    const double tariffRate = scope == TradeScope::CrossRealm ? m_config.crossRealmTariffRate : 0.0;
    const double feeRate = m_config.marketFeeRate;
    const int marketCounty = state.marketCountyIndex;
    double traded = 0.0;

    m_orders.clear();
    m_orderCounty.clear();
    m_lots.clear();
    m_lotCounty.clear();

    for (GoodType good : kBuyPriority) {
        const int g = goodIndex(good);
        const size_t gi = static_cast<size_t>(g);
        const double price = state.marketPrices[gi];
        if (price <= 0.0 || !goodDef(g).tradeable) continue;
        const double costPerUnit = price * (1.0 + tollRate + tariffRate + feeRate);
        const size_t firstOrder = m_orders.size();
        const size_t firstLot = m_lots.size();

        double totalSupply = 0.0;
        double totalDemand = 0.0;
        for (int c : countyIndices) {
            const CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
            const double retain = m_config.countyRetainDays * ce.needOf(g) + m_inputNeed[static_cast<size_t>(c)][gi];
            const double surplus = ce.stock[gi] - retain;
            if (surplus > 0.0) {
                ConsignmentLot lot;
                lot.seller = PopulationBuyer{ce.countyId};
                lot.good = good;
                lot.quantity = surplus;
                lot.dayListed = state.day;
                m_lots.push_back(lot);
                m_lotCounty.push_back(c);
                totalSupply += surplus;
            } else if (surplus < 0.0) {
                const double demand = std::min(-surplus, ce.treasury / costPerUnit);
                if (demand <= 0.0) continue;
                BuyOrder order;
                order.buyer = PopulationBuyer{ce.countyId};
                order.good = good;
                order.quantity = demand;
                order.maxSpend = demand * costPerUnit;
                order.transportCost = price * (tollRate + tariffRate + feeRate);
                order.dayPosted = state.day;
                m_orders.push_back(order);
                m_orderCounty.push_back(c);
                totalDemand += demand;
            }
        }

        ClearingRatios ratios;
        if (!computeClearingRatios(totalSupply, totalDemand, ratios)) continue;

        for (size_t i = firstLot; i < m_lots.size(); ++i) {
            const int c = m_lotCounty[i];
            CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
            const double sold = std::min(ce.stock[gi], m_lots[i].quantity * ratios.sellRatio);
            const double earned = sold * price;
            ce.stock[gi] = clampNonNegative(ce.stock[gi] - sold);
            ce.treasury += earned;
            ce.tradeSold[gi] += sold;
            ce.tradeRevenue += earned;
            if (scope == TradeScope::CrossRealm) {
                const int r = topology.realmOfCounty(c);
                if (r >= 0) {
                    RealmEconomy& re = state.realms[static_cast<size_t>(r)];
                    re.tradeExports[gi] += sold;
                    re.tradeRevenue += earned;
                }
            }
            traded += sold;
        }

        for (size_t i = firstOrder; i < m_orders.size(); ++i) {
            const int c = m_orderCounty[i];
            CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
            const double bought = m_orders[i].quantity * ratios.fillRatio;
            const double goodsCost = bought * price;
            const double toll = goodsCost * tollRate;
            const double tariff = goodsCost * tariffRate;
            const double fee = goodsCost * feeRate;
            ce.stock[gi] += bought;
            ce.treasury = clampNonNegative(ce.treasury - (goodsCost + toll + tariff + fee));
            ce.tradeBought[gi] += bought;
            ce.tradeSpending += goodsCost;
            ce.tollsPaid += toll;
            ce.tariffsPaid += tariff;

            if (toll > 0.0) {
                const int p = topology.provinceOfCounty(c);
                if (p >= 0) {
                    ProvinceEconomy& pe = state.provinces[static_cast<size_t>(p)];
                    pe.treasury += toll;
                    pe.tradeTollsCollected += toll;
                }
            }
            if (scope == TradeScope::CrossRealm) {
                const int r = topology.realmOfCounty(c);
                if (r >= 0) {
                    RealmEconomy& re = state.realms[static_cast<size_t>(r)];
                    re.treasury += tariff;
                    re.tradeTariffsCollected += tariff;
                    re.tradeImports[gi] += bought;
                    re.tradeSpending += goodsCost;
                }
            }
            if (fee > 0.0 && marketCounty >= 0 && static_cast<size_t>(marketCounty) < state.counties.size()) {
                CountyEconomy& market = state.counties[static_cast<size_t>(marketCounty)];
                market.treasury += fee;
                market.marketFeesReceived += fee;
            }
        }
    }
    return traded;
}
