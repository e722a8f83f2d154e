// facility_production_system.cpp
#include "facility_production_system.h"

#include <algorithm>
#include <cmath>

#include "economy_state.h"

FacilityProductionSystem::FacilityProductionSystem(const SimulationConfig::Production& config)
    : m_config(config) {}

void FacilityProductionSystem::initialize(EconomyState& state, const MapTopology& /*topology*/) {
    m_countyWorkers.assign(state.counties.size(), 0);
}

void FacilityProductionSystem::tick(EconomyState& state, const MapTopology& /*topology*/) {
    m_countyWorkers.assign(state.counties.size(), 0);
    m_quotaLeft.resize(state.counties.size());
    for (size_t c = 0; c < state.counties.size(); ++c) {
        m_quotaLeft[c] = state.counties[c].facilityQuota;
    }
    const double alpha = m_config.facilityEfficiencyAlpha;

    for (Facility& f : state.facilities) {
        f.assignedWorkers = 0;
        f.throughput = 0.0;
        if (f.countyIndex < 0 || static_cast<size_t>(f.countyIndex) >= state.counties.size()) continue;
        if (f.defIndex < 0 || static_cast<size_t>(f.defIndex) >= state.facilityDefs.size()) continue;

        const FacilityDef& def = state.facilityDefs[static_cast<size_t>(f.defIndex)];
        CountyEconomy& ce = state.counties[static_cast<size_t>(f.countyIndex)];
        const size_t in = static_cast<size_t>(goodIndex(def.inputGood));
        const size_t out = static_cast<size_t>(goodIndex(def.outputGood));

        double& quotaLeft = m_quotaLeft[static_cast<size_t>(f.countyIndex)][out];
        const double quotaUnits = quotaLeft / def.outputAmount;
        if (!f.isActive || quotaUnits <= 0.0) continue;

        int& countyWorkers = m_countyWorkers[static_cast<size_t>(f.countyIndex)];
        const int remainingPop = std::max(0, static_cast<int>(std::floor(ce.population)) - countyWorkers);
        const int needed = static_cast<int>(std::ceil(quotaUnits * def.laborPerUnit));
        f.assignedWorkers = std::max(0, std::min({needed, f.laborRequired, remainingPop}));
        countyWorkers += f.assignedWorkers;

        const double plannedUnits = std::min(quotaUnits, f.getThroughput(def, alpha));
        const double inputWanted = std::max(0.0, plannedUnits * def.inputAmount - f.inputBuffer[in]);
        const double pulled = std::min(ce.stock[in], inputWanted);
        ce.stock[in] = clampNonNegative(ce.stock[in] - pulled);
        f.inputBuffer[in] += pulled;

        f.runDay(def, quotaUnits, alpha);

        const double made = f.outputBuffer[out];
        f.outputBuffer[out] = 0.0;
        ce.stock[out] += made;
        ce.production[out] += made;
        quotaLeft = clampNonNegative(quotaLeft - made);
    }

    for (size_t c = 0; c < state.counties.size(); ++c) {
        state.counties[c].facilityWorkers = m_countyWorkers[c];
    }
}

void FacilityQuotaSystem::initialize(EconomyState& state, const MapTopology& topology) {
    planQuotas(state, topology);
}

void FacilityQuotaSystem::tick(EconomyState& state, const MapTopology& topology) {
    planQuotas(state, topology);
}

void FacilityQuotaSystem::planQuotas(EconomyState& state, const MapTopology& topology) {
    for (CountyEconomy& ce : state.counties) {
        ce.facilityQuota.fill(0.0);
    }

    std::vector<char> isOutput(kGoodCount, 0);
    for (const FacilityDef& def : state.facilityDefs) {
        isOutput[static_cast<size_t>(goodIndex(def.outputGood))] = 1;
    }

    for (int r = 0; r < topology.realmCount(); ++r) {
        const RealmEconomy* re = static_cast<size_t>(r) < state.realms.size() ? &state.realms[static_cast<size_t>(r)] : nullptr;
        const double realmPop = static_cast<size_t>(r) < state.realmPopulation.size()
            ? state.realmPopulation[static_cast<size_t>(r)]
            : 0.0;

        for (int g = 0; g < kGoodCount; ++g) {
            if (!isOutput[static_cast<size_t>(g)]) continue;
            const size_t gi = static_cast<size_t>(g);

            // Host counties and the baseline each must keep running.
            std::vector<int> hosts;
            std::vector<double> baselines;
            double hostPop = 0.0;
            for (int c : topology.countiesOfRealm(r)) {
                double baseline = 0.0;
                bool hostsGood = false;
                for (int fi : state.countyFacilityIndices[static_cast<size_t>(c)]) {
                    const Facility& f = state.facilities[static_cast<size_t>(fi)];
                    const FacilityDef& def = state.facilityDefs[static_cast<size_t>(f.defIndex)];
                    if (!f.isActive || goodIndex(def.outputGood) != g) continue;
                    hostsGood = true;
                    baseline += def.baselineOutput;
                }
                if (!hostsGood) continue;
                hosts.push_back(c);
                baselines.push_back(baseline);
                hostPop += state.counties[static_cast<size_t>(c)].population;
            }
            if (hosts.empty()) continue;

            const double realmNeed = realmPop * goodDef(g).consumptionPerPop + (re ? re->deficit[gi] : 0.0);
            for (size_t h = 0; h < hosts.size(); ++h) {
                CountyEconomy& ce = state.counties[static_cast<size_t>(hosts[h])];
                const double share = hostPop > 0.0
                    ? ce.population / hostPop
                    : 1.0 / static_cast<double>(hosts.size());
                ce.facilityQuota[gi] = std::max(realmNeed * share, baselines[h]);
            }
        }
    }
}

GoodArray facilityInputNeed(const EconomyState& state, int countyIndex) {
    GoodArray need = zeroGoods();
    if (countyIndex < 0 || static_cast<size_t>(countyIndex) >= state.counties.size()) return need;
    const CountyEconomy& ce = state.counties[static_cast<size_t>(countyIndex)];
    for (int fi : state.countyFacilityIndices[static_cast<size_t>(countyIndex)]) {
        const Facility& f = state.facilities[static_cast<size_t>(fi)];
        if (!f.isActive) continue;
        const FacilityDef& def = state.facilityDefs[static_cast<size_t>(f.defIndex)];
        const double units = ce.facilityQuota[static_cast<size_t>(goodIndex(def.outputGood))] / def.outputAmount;
        const double capped = std::min(units, f.baseThroughput(def));
        need[static_cast<size_t>(goodIndex(def.inputGood))] += std::max(0.0, capped) * def.inputAmount;
    }
    return need;
}
