// economy_snapshot.cpp
#include "economy_snapshot.h"

#include <algorithm>
#include <limits>

#include "economy_state.h"

namespace {

void addInto(GoodArray& total, const GoodArray& v) {
    for (size_t g = 0; g < total.size(); ++g) {
        total[g] += v[g];
    }
}

double sum(const GoodArray& v) {
    double s = 0.0;
    for (double x : v) s += x;
    return s;
}

} // namespace

EconomySnapshot buildSnapshot(const EconomyState& state, int day, double distressThreshold) {
    EconomySnapshot snap;
    snap.day = day;
    snap.marketPrices = state.marketPrices;
    snap.medianFoodProductivity = state.medianProductivity[static_cast<size_t>(goodIndex(GoodType::Food))];

    const size_t food = static_cast<size_t>(goodIndex(GoodType::Food));
    double minFood = std::numeric_limits<double>::max();
    double maxFood = std::numeric_limits<double>::lowest();
    double minSat = std::numeric_limits<double>::max();
    double maxSat = std::numeric_limits<double>::lowest();
    double weightedSat = 0.0;

    for (const CountyEconomy& ce : state.counties) {
        addInto(snap.totalStock, ce.stock);
        addInto(snap.totalProduction, ce.production);
        addInto(snap.totalConsumption, ce.consumption);
        addInto(snap.totalUnmetNeed, ce.unmetNeed);
        addInto(snap.totalRelief, ce.relief);
        snap.totalGranaryRequisitioned += ce.granaryRequisitioned[food];

        const double foodStock = ce.stock[food];
        const double foodNeed = ce.needOf(static_cast<int>(food));
        if (ce.production[food] > ce.consumption[food]) {
            ++snap.countiesInSurplus;
        } else if (ce.unmetNeed[food] > 0.0) {
            ++snap.countiesInDeficit;
        }
        if (foodNeed > 0.0 && ce.consumption[food] <= 0.0) {
            ++snap.countiesStarving;
        }
        minFood = std::min(minFood, foodStock);
        maxFood = std::max(maxFood, foodStock);

        snap.totalCountyTreasury += ce.treasury;
        snap.totalMonetaryTaxToProvince += ce.monetaryTaxPaid;
        snap.totalCountyTradeSpending += ce.tradeSpending;
        snap.totalCountyTradeRevenue += ce.tradeRevenue;
        snap.totalMarketFees += ce.marketFeesReceived;

        snap.totalPopulation += ce.population;
        snap.totalBirths += ce.birthsThisMonth;
        snap.totalDeaths += ce.deathsThisMonth;
        weightedSat += ce.population * ce.basicSatisfaction;
        minSat = std::min(minSat, ce.basicSatisfaction);
        maxSat = std::max(maxSat, ce.basicSatisfaction);
        if (ce.basicSatisfaction < distressThreshold) {
            ++snap.countiesInDistress;
        }
    }

    for (const ProvinceEconomy& pe : state.provinces) {
        addInto(snap.provincialStockpile, pe.stockpile);
        snap.totalDucalTax += sum(pe.taxCollected);
        snap.totalDucalRelief += sum(pe.reliefGiven);
        snap.totalProvinceTreasury += pe.treasury;
        snap.totalMonetaryTaxToRealm += pe.monetaryTaxPaidToRealm;
        snap.totalProvinceAdminCost += pe.adminCrownsCost;
        snap.totalGranaryCrownsSpent += pe.granaryCrownsSpent;
        snap.totalTradeTolls += pe.tradeTollsCollected;
    }

    for (const RealmEconomy& re : state.realms) {
        addInto(snap.royalStockpile, re.stockpile);
        addInto(snap.realmDeficit, re.deficit);
        addInto(snap.tradeImports, re.tradeImports);
        addInto(snap.tradeExports, re.tradeExports);
        snap.totalRoyalTax += sum(re.taxCollected);
        snap.totalRoyalRelief += sum(re.reliefGiven);
        snap.totalRealmTreasury += re.treasury;
        snap.totalRealmAdminCost += re.adminCrownsCost;
        snap.totalGoldMinted += re.goldMinted;
        snap.totalSilverMinted += re.silverMinted;
        snap.totalCrownsMinted += re.crownsMinted;
        snap.totalTradeSpending += re.tradeSpending;
        snap.totalTradeRevenue += re.tradeRevenue;
        snap.totalTradeTariffs += re.tradeTariffsCollected;
    }

    snap.totalFoodStock = snap.totalStock[food];
    snap.totalFoodProduction = snap.totalProduction[food];
    snap.totalFoodConsumption = snap.totalConsumption[food];
    snap.totalFoodUnmet = snap.totalUnmetNeed[food];
    snap.totalDomesticTreasury = snap.totalCountyTreasury + snap.totalProvinceTreasury + snap.totalRealmTreasury;

    if (state.counties.empty()) {
        snap.minCountyFoodStock = 0.0;
        snap.maxCountyFoodStock = 0.0;
        snap.minBasicSatisfaction = 0.0;
        snap.maxBasicSatisfaction = 0.0;
    } else {
        snap.minCountyFoodStock = minFood;
        snap.maxCountyFoodStock = maxFood;
        snap.minBasicSatisfaction = minSat;
        snap.maxBasicSatisfaction = maxSat;
    }
    snap.avgBasicSatisfaction = snap.totalPopulation > 0.0 ? weightedSat / snap.totalPopulation : 0.0;
    return snap;
}
