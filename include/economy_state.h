// economy_state.h
#pragma once

#include <deque>
#include <vector>

#include "economy_log.h"
#include "economy_snapshot.h"
#include "facility.h"
#include "goods.h"
#include "map_topology.h"

struct SimulationConfig;

struct CountyEconomy {
    int countyId = 0;
    double population = 0.0;

    GoodArray stock = zeroGoods();
    GoodArray productivity = zeroGoods();
    GoodArray production = zeroGoods();
    GoodArray consumption = zeroGoods();
    GoodArray unmetNeed = zeroGoods();
    GoodArray taxPaid = zeroGoods();
    GoodArray relief = zeroGoods();
    GoodArray facilityQuota = zeroGoods(); // output units requested for the next tick
    GoodArray tradeBought = zeroGoods();
    GoodArray tradeSold = zeroGoods();
    GoodArray granaryRequisitioned = zeroGoods();

    double basicSatisfaction = 1.0; // EMA in [0, 1]
    double birthsThisMonth = 0.0;
    double deathsThisMonth = 0.0;
    double netMigrationThisMonth = 0.0;
    int facilityWorkers = 0;

    double treasury = 0.0;
    double monetaryTaxPaid = 0.0;
    double tradeSpending = 0.0;
    double tradeRevenue = 0.0;
    double tollsPaid = 0.0;
    double tariffsPaid = 0.0;
    double marketFeesReceived = 0.0;

    double needOf(int g) const { return population * goodDef(g).consumptionPerPop; }
};

struct ProvinceEconomy {
    int provinceId = 0;

    GoodArray stockpile = zeroGoods();
    GoodArray taxCollected = zeroGoods();
    GoodArray reliefGiven = zeroGoods();
    GoodArray granaryRequisitioned = zeroGoods();

    double treasury = 0.0;
    double monetaryTaxCollected = 0.0;
    double monetaryTaxPaidToRealm = 0.0;
    double adminCrownsCost = 0.0;
    double granaryCrownsSpent = 0.0;
    double tradeTollsCollected = 0.0;
};

struct RealmEconomy {
    int realmId = 0;

    GoodArray stockpile = zeroGoods();
    GoodArray taxCollected = zeroGoods();
    GoodArray reliefGiven = zeroGoods();
    GoodArray deficit = zeroGoods();
    GoodArray tradeImports = zeroGoods();
    GoodArray tradeExports = zeroGoods();

    double treasury = 0.0;
    double goldMinted = 0.0;
    double silverMinted = 0.0;
    double crownsMinted = 0.0;
    double monetaryTaxCollected = 0.0;
    double adminCrownsCost = 0.0;
    double tradeSpending = 0.0;
    double tradeRevenue = 0.0;
    double tradeTariffsCollected = 0.0;
};

struct EconomyState {
    static constexpr size_t kDefaultSnapshotCapacity = 3650;

    int day = 0;

    std::vector<CountyEconomy> counties;
    std::vector<ProvinceEconomy> provinces;
    std::vector<RealmEconomy> realms;

    std::vector<FacilityDef> facilityDefs;
    std::vector<Facility> facilities;
    std::vector<std::vector<int>> countyFacilityIndices;

    GoodArray marketPrices = zeroGoods();
    int marketCountyIndex = -1; // receives county trade fees
    GoodArray medianProductivity = zeroGoods();
    std::vector<double> provincePopulation;
    std::vector<double> realmPopulation;

    std::deque<EconomySnapshot> snapshots;
    size_t snapshotCapacity = kDefaultSnapshotCapacity;

    EconomyLog log;

    void refreshPopulationCaches(const MapTopology& topology);
    // Drops the oldest entry once the series is at capacity.
    void appendSnapshot(const EconomySnapshot& snapshot);
    const EconomySnapshot* latestSnapshot() const;
};

// Builds the tier arenas from the topology and places facilities. Facility
// definitions are taken from config; each one is placed in every county whose
// productivity of the recipe input reaches its placement threshold.
EconomyState initializeEconomy(const MapTopology& topology, const SimulationConfig& config);

// Clamps tiny negative residue from floating-point subtraction back to zero.
inline double clampNonNegative(double v) {
    return v < 0.0 ? 0.0 : v;
}
