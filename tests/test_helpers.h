// tests/test_helpers.h
#pragma once

#include <string>
#include <vector>

#include "economy_state.h"
#include "goods.h"
#include "map_topology.h"
#include "simulation_context.h"

namespace test_helpers {

// Restores the built-in goods catalog when a test that overrides prices ends.
struct CatalogGuard {
    CatalogGuard() { resetGoodCatalog(); }
    ~CatalogGuard() { resetGoodCatalog(); }
};

inline size_t gi(GoodType g) {
    return static_cast<size_t>(goodIndex(g));
}

// Uniform hierarchy: every county gets the same population and productivity.
inline MapTopology makeTopology(int realms,
                                int provincesPerRealm,
                                int countiesPerProvince,
                                double population,
                                const GoodArray& productivity = zeroGoods()) {
    std::vector<RealmInfo> realmInfos;
    std::vector<ProvinceInfo> provinceInfos;
    std::vector<CountyInfo> countyInfos;
    for (int r = 0; r < realms; ++r) {
        realmInfos.push_back(RealmInfo{r, "R" + std::to_string(r)});
        for (int p = 0; p < provincesPerRealm; ++p) {
            const int provinceIndex = static_cast<int>(provinceInfos.size());
            provinceInfos.push_back(ProvinceInfo{provinceIndex, r, "P" + std::to_string(provinceIndex)});
            for (int c = 0; c < countiesPerProvince; ++c) {
                CountyInfo county;
                county.id = static_cast<int>(countyInfos.size());
                county.provinceIndex = provinceIndex;
                county.seatCellId = county.id;
                county.population = population;
                county.productivity = productivity;
                countyInfos.push_back(county);
            }
        }
    }
    return MapTopology(std::move(countyInfos), std::move(provinceInfos), std::move(realmInfos));
}

// Explicit membership: county c sits in province countyProvince[c], province p in realm provinceRealm[p].
inline MapTopology makeCustomTopology(const std::vector<double>& countyPopulations,
                                      const std::vector<int>& countyProvince,
                                      const std::vector<int>& provinceRealm,
                                      int realms) {
    std::vector<RealmInfo> realmInfos;
    for (int r = 0; r < realms; ++r) {
        realmInfos.push_back(RealmInfo{r, "R" + std::to_string(r)});
    }
    std::vector<ProvinceInfo> provinceInfos;
    for (size_t p = 0; p < provinceRealm.size(); ++p) {
        provinceInfos.push_back(ProvinceInfo{static_cast<int>(p), provinceRealm[p], "P" + std::to_string(p)});
    }
    std::vector<CountyInfo> countyInfos;
    for (size_t c = 0; c < countyPopulations.size(); ++c) {
        CountyInfo county;
        county.id = static_cast<int>(c);
        county.provinceIndex = countyProvince[c];
        county.seatCellId = static_cast<int>(c);
        county.population = countyPopulations[c];
        countyInfos.push_back(county);
    }
    return MapTopology(std::move(countyInfos), std::move(provinceInfos), std::move(realmInfos));
}

inline double totalGood(const EconomyState& state, GoodType good) {
    const size_t g = gi(good);
    double total = 0.0;
    for (const CountyEconomy& ce : state.counties) total += ce.stock[g];
    for (const ProvinceEconomy& pe : state.provinces) total += pe.stockpile[g];
    for (const RealmEconomy& re : state.realms) total += re.stockpile[g];
    for (const Facility& f : state.facilities) total += f.inputBuffer[g] + f.outputBuffer[g];
    return total;
}

} // namespace test_helpers
