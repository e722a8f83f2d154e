// economy_snapshot.h
#pragma once

#include "goods.h"

struct EconomyState;

// One day of aggregate economy telemetry. Everything here is derived from
// EconomyState; nothing is read back by the tick systems.
struct EconomySnapshot {
    int day = 0;

    GoodArray totalStock = zeroGoods();
    GoodArray totalProduction = zeroGoods();
    GoodArray totalConsumption = zeroGoods();
    GoodArray totalUnmetNeed = zeroGoods();
    GoodArray totalRelief = zeroGoods();
    GoodArray provincialStockpile = zeroGoods();
    GoodArray royalStockpile = zeroGoods();
    GoodArray realmDeficit = zeroGoods();
    GoodArray tradeImports = zeroGoods();
    GoodArray tradeExports = zeroGoods();
    GoodArray marketPrices = zeroGoods();

    // Food
    double totalFoodStock = 0.0;
    double totalFoodProduction = 0.0;
    double totalFoodConsumption = 0.0;
    double totalFoodUnmet = 0.0;
    int countiesInSurplus = 0;
    int countiesInDeficit = 0;
    int countiesStarving = 0;
    double minCountyFoodStock = 0.0;
    double maxCountyFoodStock = 0.0;
    double medianFoodProductivity = 0.0;

    // Treasuries
    double totalCountyTreasury = 0.0;
    double totalProvinceTreasury = 0.0;
    double totalRealmTreasury = 0.0;
    double totalDomesticTreasury = 0.0;

    // Fiscal
    double totalDucalTax = 0.0;
    double totalRoyalTax = 0.0;
    double totalDucalRelief = 0.0;
    double totalRoyalRelief = 0.0;
    double totalMonetaryTaxToProvince = 0.0;
    double totalMonetaryTaxToRealm = 0.0;
    double totalProvinceAdminCost = 0.0;
    double totalRealmAdminCost = 0.0;
    double totalGranaryRequisitioned = 0.0;
    double totalGranaryCrownsSpent = 0.0;
    double totalGoldMinted = 0.0;
    double totalSilverMinted = 0.0;
    double totalCrownsMinted = 0.0;

    // Trade
    double totalTradeSpending = 0.0;
    double totalTradeRevenue = 0.0;
    double totalCountyTradeSpending = 0.0;
    double totalCountyTradeRevenue = 0.0;
    double totalTradeTolls = 0.0;
    double totalTradeTariffs = 0.0;
    double totalMarketFees = 0.0;

    // Population
    double totalPopulation = 0.0;
    double totalBirths = 0.0;
    double totalDeaths = 0.0;
    double avgBasicSatisfaction = 0.0;
    double minBasicSatisfaction = 0.0;
    double maxBasicSatisfaction = 0.0;
    int countiesInDistress = 0;
};

// Pure reduction of the state at the end of a tick.
EconomySnapshot buildSnapshot(const EconomyState& state, int day, double distressThreshold = 0.5);
