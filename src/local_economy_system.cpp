// local_economy_system.cpp
#include "local_economy_system.h"

#include <algorithm>
#include <sstream>

#include "economy_state.h"

LocalEconomySystem::LocalEconomySystem(const SimulationConfig::Production& config)
    : m_config(config) {}

void LocalEconomySystem::initialize(EconomyState& state, const MapTopology& /*topology*/) {
    m_distressed.assign(state.counties.size(), 0);
    for (size_t i = 0; i < state.counties.size(); ++i) {
        m_distressed[i] = state.counties[i].basicSatisfaction < m_config.distressThreshold ? 1 : 0;
    }
}

double LocalEconomySystem::dailyBasicFulfillment(const GoodArray& need, const GoodArray& consumed) {
    double weightSum = 0.0;
    for (int g = 0; g < kGoodCount; ++g) {
        if (isBasicNeed(g)) weightSum += goodDef(g).consumptionPerPop;
    }
    if (weightSum <= 0.0) return 1.0;

    double today = 0.0;
    double servedWeight = 0.0;
    for (int g = 0; g < kGoodCount; ++g) {
        if (!isBasicNeed(g)) continue;
        const size_t gi = static_cast<size_t>(g);
        const double w = goodDef(g).consumptionPerPop / weightSum;
        if (need[gi] <= 0.0) continue;
        today += w * std::min(1.0, consumed[gi] / need[gi]);
        servedWeight += w;
    }
    if (servedWeight <= 0.0) return 1.0;
    return std::clamp(today, 0.0, 1.0);
}

void LocalEconomySystem::tick(EconomyState& state, const MapTopology& /*topology*/) {
    if (m_distressed.size() != state.counties.size()) {
        m_distressed.assign(state.counties.size(), 0);
    }
    const double window = std::max(1.0, m_config.satisfactionWindowDays);

    for (size_t i = 0; i < state.counties.size(); ++i) {
        CountyEconomy& ce = state.counties[i];
        const double pop = std::max(0.0, ce.population);

        ce.production.fill(0.0);
        ce.consumption.fill(0.0);
        ce.unmetNeed.fill(0.0);

        const double wf = pop > 0.0
            ? std::clamp((pop - static_cast<double>(ce.facilityWorkers)) / pop, 0.0, 1.0)
            : 1.0;

        GoodArray need = zeroGoods();
        GoodArray household = zeroGoods();
        for (int g = 0; g < kGoodCount; ++g) {
            const size_t gi = static_cast<size_t>(g);
            const GoodDef& def = goodDef(g);

            const double produced = pop * ce.productivity[gi] * wf;
            ce.stock[gi] += produced;
            ce.production[gi] = produced;

            need[gi] = pop * def.consumptionPerPop;
            const double consumed = std::min(ce.stock[gi], need[gi]);
            ce.stock[gi] = clampNonNegative(ce.stock[gi] - consumed);
            household[gi] = consumed;
            ce.consumption[gi] = consumed;
            ce.unmetNeed[gi] = need[gi] - consumed;

            const double upkeep = pop * def.countyAdminPerPop;
            if (upkeep > 0.0) {
                const double used = std::min(ce.stock[gi], upkeep);
                ce.stock[gi] = clampNonNegative(ce.stock[gi] - used);
                ce.consumption[gi] += used;
                ce.unmetNeed[gi] += upkeep - used;
            }
        }

        const double today = dailyBasicFulfillment(need, household);
        ce.basicSatisfaction += (today - ce.basicSatisfaction) / window;
        ce.basicSatisfaction = std::clamp(ce.basicSatisfaction, 0.0, 1.0);

        const bool distressed = ce.basicSatisfaction < m_config.distressThreshold;
        if (distressed && !m_distressed[i]) {
            std::ostringstream oss;
            oss << "county " << ce.countyId << " fell into distress (satisfaction "
                << ce.basicSatisfaction << ")";
            state.log.addEvent(state.day, oss.str());
        }
        m_distressed[i] = distressed ? 1 : 0;
    }
}
