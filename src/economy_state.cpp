// economy_state.cpp
#include "economy_state.h"

#include <algorithm>
#include <iostream>

#include "simulation_context.h"

namespace {

double medianOf(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return 0.5 * (values[mid - 1] + values[mid]);
    }
    return values[mid];
}

// Lowest index wins ties. -1 when there are no counties.
int mostPopulousCounty(const std::vector<CountyEconomy>& counties) {
    int best = -1;
    for (size_t c = 0; c < counties.size(); ++c) {
        if (best < 0 || counties[c].population > counties[static_cast<size_t>(best)].population) {
            best = static_cast<int>(c);
        }
    }
    return best;
}

} // namespace

void EconomyState::refreshPopulationCaches(const MapTopology& topology) {
    provincePopulation.assign(provinces.size(), 0.0);
    realmPopulation.assign(realms.size(), 0.0);
    for (size_t c = 0; c < counties.size(); ++c) {
        const int p = topology.provinceOfCounty(static_cast<int>(c));
        const int r = topology.realmOfCounty(static_cast<int>(c));
        if (p >= 0 && static_cast<size_t>(p) < provincePopulation.size()) {
            provincePopulation[static_cast<size_t>(p)] += counties[c].population;
        }
        if (r >= 0 && static_cast<size_t>(r) < realmPopulation.size()) {
            realmPopulation[static_cast<size_t>(r)] += counties[c].population;
        }
    }
}

void EconomyState::appendSnapshot(const EconomySnapshot& snapshot) {
    if (snapshotCapacity == 0) return;
    while (snapshots.size() >= snapshotCapacity) {
        snapshots.pop_front();
    }
    snapshots.push_back(snapshot);
}

const EconomySnapshot* EconomyState::latestSnapshot() const {
    if (snapshots.empty()) return nullptr;
    return &snapshots.back();
}

EconomyState initializeEconomy(const MapTopology& topology, const SimulationConfig& config) {
    EconomyState state;
    state.snapshotCapacity = static_cast<size_t>(std::max(1, config.simulation.snapshotCapacity));
    state.marketPrices = basePrices();
    state.facilityDefs = config.facilities;
    state.log.setEchoToStdout(config.simulation.echoEvents);

    const std::vector<CountyInfo>& countyInfos = topology.getCounties();
    state.counties.resize(countyInfos.size());
    for (size_t c = 0; c < countyInfos.size(); ++c) {
        CountyEconomy& ce = state.counties[c];
        ce.countyId = countyInfos[c].id;
        ce.population = countyInfos[c].population;
        ce.productivity = countyInfos[c].productivity;
        ce.treasury = ce.population * config.fiscal.initialCountyTreasuryPerPop;
    }

    const int configuredMarket = config.trade.marketCounty;
    if (configuredMarket >= 0 && static_cast<size_t>(configuredMarket) < state.counties.size()) {
        state.marketCountyIndex = configuredMarket;
    } else {
        if (configuredMarket >= 0) {
            std::cerr << "[Economy] marketCounty " << configuredMarket << " is out of range for "
                      << state.counties.size() << " counties. Using the most populous county.\n";
        }
        state.marketCountyIndex = mostPopulousCounty(state.counties);
    }

    state.provinces.resize(topology.getProvinces().size());
    for (size_t p = 0; p < state.provinces.size(); ++p) {
        state.provinces[p].provinceId = topology.getProvinces()[p].id;
    }

    state.realms.resize(topology.getRealms().size());
    for (size_t r = 0; r < state.realms.size(); ++r) {
        state.realms[r].realmId = topology.getRealms()[r].id;
        state.realms[r].treasury = config.fiscal.initialRealmTreasury;
    }

    for (int g = 0; g < kGoodCount; ++g) {
        std::vector<double> productivities;
        productivities.reserve(state.counties.size());
        for (const CountyEconomy& ce : state.counties) {
            const double p = ce.productivity[static_cast<size_t>(g)];
            if (p > 0.0) productivities.push_back(p);
        }
        state.medianProductivity[static_cast<size_t>(g)] = medianOf(std::move(productivities));
    }

    state.countyFacilityIndices.assign(state.counties.size(), {});
    int nextFacilityId = 1;
    for (size_t d = 0; d < state.facilityDefs.size(); ++d) {
        const FacilityDef& def = state.facilityDefs[d];
        const size_t input = static_cast<size_t>(goodIndex(def.inputGood));
        for (size_t c = 0; c < state.counties.size(); ++c) {
            const CountyEconomy& ce = state.counties[c];
            if (ce.population <= 0.0) continue;
            if (ce.productivity[input] < def.placementMinProductivity) continue;

            Facility f{};
            f.id = nextFacilityId++;
            f.defIndex = static_cast<int>(d);
            f.cellId = countyInfos[c].seatCellId;
            f.countyIndex = static_cast<int>(c);
            f.laborRequired = computeLaborRequired(def, ce.population);
            state.countyFacilityIndices[c].push_back(static_cast<int>(state.facilities.size()));
            state.facilities.push_back(f);
        }
    }

    state.refreshPopulationCaches(topology);

    std::cout << "[Economy] Initialized " << state.counties.size() << " counties, "
              << state.provinces.size() << " provinces, " << state.realms.size() << " realms, "
              << state.facilities.size() << " facilities\n";
    return state;
}
