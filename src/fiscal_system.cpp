// fiscal_system.cpp
#include "fiscal_system.h"

#include <algorithm>
#include <sstream>

#include "economy_state.h"

namespace {

constexpr GoodType kGranaryStaples[] = {GoodType::Food};

double adminCostPerPop(double GoodDef::*perPop) {
    double cost = 0.0;
    for (int g = 0; g < kGoodCount; ++g) {
        cost += goodDef(g).*perPop * goodDef(g).basePrice;
    }
    return cost;
}

bool validIndex(int i, size_t size) {
    return i >= 0 && static_cast<size_t>(i) < size;
}

} // namespace

std::vector<double> allocateProRata(double available, const std::vector<double>& deficits) {
    std::vector<double> out(deficits.size(), 0.0);
    if (!(available > 0.0)) return out;

    double total = 0.0;
    for (double d : deficits) {
        if (d > 0.0) total += d;
    }
    if (total <= 0.0) return out;

    double given = 0.0;
    for (size_t i = 0; i < deficits.size(); ++i) {
        if (deficits[i] <= 0.0) continue;
        const double share = deficits[i] / total;
        double amount = std::min(share * available, deficits[i]);
        amount = std::min(amount, available - given);
        if (amount <= 0.0) break;
        out[i] = amount;
        given += amount;
    }
    return out;
}

double countyShortfall(const CountyEconomy& county, int good) {
    return std::max(0.0, county.needOf(good) - county.stock[static_cast<size_t>(good)]);
}

FiscalSystem::FiscalSystem(const SimulationConfig::Fiscal& config)
    : m_config(config) {}

void FiscalSystem::initialize(EconomyState& /*state*/, const MapTopology& /*topology*/) {}

void FiscalSystem::tick(EconomyState& state, const MapTopology& topology) {
    resetAccumulators(state);
    confiscatePreciousMetals(state, topology);
    collectDucalGoodsTax(state, topology);
    collectRoyalGoodsTax(state, topology);
    collectMonetaryTax(state, topology);
    mintPreciousMetals(state);
    payAdminWages(state, topology);
    requisitionGranary(state, topology);
    distributeRoyalRelief(state, topology);
    distributeDucalRelief(state, topology);
}

void FiscalSystem::resetAccumulators(EconomyState& state) const {
    for (CountyEconomy& ce : state.counties) {
        ce.taxPaid.fill(0.0);
        ce.relief.fill(0.0);
        ce.tradeBought.fill(0.0);
        ce.tradeSold.fill(0.0);
        ce.granaryRequisitioned.fill(0.0);
        ce.monetaryTaxPaid = 0.0;
        ce.tradeSpending = 0.0;
        ce.tradeRevenue = 0.0;
        ce.tollsPaid = 0.0;
        ce.tariffsPaid = 0.0;
        ce.marketFeesReceived = 0.0;
    }
    for (ProvinceEconomy& pe : state.provinces) {
        pe.taxCollected.fill(0.0);
        pe.reliefGiven.fill(0.0);
        pe.granaryRequisitioned.fill(0.0);
        pe.monetaryTaxCollected = 0.0;
        pe.monetaryTaxPaidToRealm = 0.0;
        pe.adminCrownsCost = 0.0;
        pe.granaryCrownsSpent = 0.0;
        pe.tradeTollsCollected = 0.0;
    }
    for (RealmEconomy& re : state.realms) {
        re.taxCollected.fill(0.0);
        re.reliefGiven.fill(0.0);
        re.tradeImports.fill(0.0);
        re.tradeExports.fill(0.0);
        re.goldMinted = 0.0;
        re.silverMinted = 0.0;
        re.crownsMinted = 0.0;
        re.monetaryTaxCollected = 0.0;
        re.adminCrownsCost = 0.0;
        re.tradeSpending = 0.0;
        re.tradeRevenue = 0.0;
        re.tradeTariffsCollected = 0.0;
    }
}

void FiscalSystem::confiscatePreciousMetals(EconomyState& state, const MapTopology& topology) const {
    for (int r = 0; r < topology.realmCount(); ++r) {
        if (!validIndex(r, state.realms.size())) continue;
        RealmEconomy& re = state.realms[static_cast<size_t>(r)];
        for (int c : topology.countiesOfRealm(r)) {
            CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
            for (int g = 0; g < kGoodCount; ++g) {
                if (!isPreciousMetal(g)) continue;
                const size_t gi = static_cast<size_t>(g);
                const double amount = ce.stock[gi];
                if (amount <= 0.0) continue;
                ce.stock[gi] = 0.0;
                ce.taxPaid[gi] += amount;
                re.stockpile[gi] += amount;
                re.taxCollected[gi] += amount;
            }
        }
    }
}

void FiscalSystem::collectDucalGoodsTax(EconomyState& state, const MapTopology& topology) const {
    for (int p = 0; p < topology.provinceCount(); ++p) {
        if (!validIndex(p, state.provinces.size())) continue;
        ProvinceEconomy& pe = state.provinces[static_cast<size_t>(p)];
        for (int c : topology.countiesOfProvince(p)) {
            CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
            for (int g = 0; g < kGoodCount; ++g) {
                if (isPreciousMetal(g)) continue;
                const size_t gi = static_cast<size_t>(g);
                const double surplus = ce.stock[gi] - m_config.surplusThresholdDays * ce.needOf(g);
                if (surplus <= 0.0) continue;
                const double tax = surplus * m_config.ducalTaxRate;
                ce.stock[gi] = clampNonNegative(ce.stock[gi] - tax);
                ce.taxPaid[gi] += tax;
                pe.stockpile[gi] += tax;
                pe.taxCollected[gi] += tax;
            }
        }
    }
}

void FiscalSystem::collectRoyalGoodsTax(EconomyState& state, const MapTopology& topology) const {
    for (int p = 0; p < topology.provinceCount(); ++p) {
        const int r = topology.realmOfProvince(p);
        if (!validIndex(p, state.provinces.size()) || !validIndex(r, state.realms.size())) continue;
        ProvinceEconomy& pe = state.provinces[static_cast<size_t>(p)];
        RealmEconomy& re = state.realms[static_cast<size_t>(r)];
        for (int g = 0; g < kGoodCount; ++g) {
            if (isPreciousMetal(g)) continue;
            const size_t gi = static_cast<size_t>(g);
            const double tax = pe.stockpile[gi] * m_config.royalTaxRate;
            if (tax <= 0.0) continue;
            pe.stockpile[gi] = clampNonNegative(pe.stockpile[gi] - tax);
            re.stockpile[gi] += tax;
            re.taxCollected[gi] += tax;
        }
    }
}

void FiscalSystem::collectMonetaryTax(EconomyState& state, const MapTopology& topology) const {
    for (int p = 0; p < topology.provinceCount(); ++p) {
        if (!validIndex(p, state.provinces.size())) continue;
        ProvinceEconomy& pe = state.provinces[static_cast<size_t>(p)];
        for (int c : topology.countiesOfProvince(p)) {
            CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
            double productionValue = 0.0;
            for (int g = 0; g < kGoodCount; ++g) {
                productionValue += ce.production[static_cast<size_t>(g)] * state.marketPrices[static_cast<size_t>(g)];
            }
            const double tax = std::min(productionValue * m_config.monetaryTaxRate, ce.treasury);
            if (tax <= 0.0) continue;
            ce.treasury = clampNonNegative(ce.treasury - tax);
            ce.monetaryTaxPaid += tax;
            pe.treasury += tax;
            pe.monetaryTaxCollected += tax;
        }
    }

    for (int p = 0; p < topology.provinceCount(); ++p) {
        const int r = topology.realmOfProvince(p);
        if (!validIndex(p, state.provinces.size()) || !validIndex(r, state.realms.size())) continue;
        ProvinceEconomy& pe = state.provinces[static_cast<size_t>(p)];
        RealmEconomy& re = state.realms[static_cast<size_t>(r)];
        const double share = std::min(pe.monetaryTaxCollected * m_config.royalRevenueShare, pe.treasury);
        if (share <= 0.0) continue;
        pe.treasury = clampNonNegative(pe.treasury - share);
        pe.monetaryTaxPaidToRealm += share;
        re.treasury += share;
        re.monetaryTaxCollected += share;
    }
}

double FiscalSystem::mintValue(double goldOre, double silverOre) {
    return goldOre * kGoldSmeltingYield * kCrownsPerKgGold
         + silverOre * kSilverSmeltingYield * kCrownsPerKgSilver;
}

void FiscalSystem::mintPreciousMetals(EconomyState& state) const {
    const size_t gold = static_cast<size_t>(goodIndex(GoodType::GoldOre));
    const size_t silver = static_cast<size_t>(goodIndex(GoodType::SilverOre));
    for (RealmEconomy& re : state.realms) {
        const double goldOre = re.stockpile[gold];
        const double silverOre = re.stockpile[silver];
        re.stockpile[gold] = 0.0;
        re.stockpile[silver] = 0.0;

        const double crowns = mintValue(goldOre, silverOre);
        re.treasury += crowns;
        re.goldMinted = goldOre;
        re.silverMinted = silverOre;
        re.crownsMinted = crowns;

        if (crowns > 0.0 && state.day % TickInterval::Monthly == 0) {
            std::ostringstream oss;
            oss << "realm " << re.realmId << " minted " << crowns << " crowns";
            state.log.addEvent(state.day, oss.str());
        }
    }
}

void FiscalSystem::payAdminWages(EconomyState& state, const MapTopology& topology) const {
    const double provinceCostPerPop = adminCostPerPop(&GoodDef::provinceAdminPerPop);
    const double realmCostPerPop = adminCostPerPop(&GoodDef::realmAdminPerPop);

    for (int p = 0; p < topology.provinceCount(); ++p) {
        if (!validIndex(p, state.provinces.size())) continue;
        ProvinceEconomy& pe = state.provinces[static_cast<size_t>(p)];
        const double provPop = state.provincePopulation[static_cast<size_t>(p)];
        const double cost = std::min(provPop * provinceCostPerPop, pe.treasury);
        if (cost <= 0.0 || provPop <= 0.0) continue;
        pe.treasury = clampNonNegative(pe.treasury - cost);
        pe.adminCrownsCost += cost;
        for (int c : topology.countiesOfProvince(p)) {
            CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
            ce.treasury += cost * (ce.population / provPop);
        }
    }

    for (int r = 0; r < topology.realmCount(); ++r) {
        if (!validIndex(r, state.realms.size())) continue;
        RealmEconomy& re = state.realms[static_cast<size_t>(r)];
        const double realmPop = state.realmPopulation[static_cast<size_t>(r)];
        const double cost = std::min(realmPop * realmCostPerPop, re.treasury);
        if (cost <= 0.0 || realmPop <= 0.0) continue;
        re.treasury = clampNonNegative(re.treasury - cost);
        re.adminCrownsCost += cost;
        for (int c : topology.countiesOfRealm(r)) {
            CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
            ce.treasury += cost * (ce.population / realmPop);
        }
    }
}

void FiscalSystem::requisitionGranary(EconomyState& state, const MapTopology& topology) const {
    for (int p = 0; p < topology.provinceCount(); ++p) {
        if (!validIndex(p, state.provinces.size())) continue;
        ProvinceEconomy& pe = state.provinces[static_cast<size_t>(p)];
        const double provPop = state.provincePopulation[static_cast<size_t>(p)];
        const std::vector<int>& members = topology.countiesOfProvince(p);

        for (GoodType staple : kGranaryStaples) {
            const int g = goodIndex(staple);
            const size_t gi = static_cast<size_t>(g);
            const double perPop = goodDef(g).consumptionPerPop;
            const double target = m_config.granaryDaysBuffer * provPop * perPop;
            const double gap = target - pe.stockpile[gi];
            if (gap <= 0.0) continue;

            const double unitCost = state.marketPrices[gi] * m_config.granaryRequisitionDiscount;
            double fill = gap * m_config.granaryFillRate;
            if (unitCost > 0.0) fill = std::min(fill, pe.treasury / unitCost);
            if (fill <= 0.0) continue;

            double totalSurplus = 0.0;
            for (int c : members) {
                const CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
                const double surplus = ce.stock[gi] - ce.population * perPop;
                if (surplus > 0.0) totalSurplus += surplus;
            }
            if (totalSurplus <= 0.0) continue;
            const double collectRatio = std::min(1.0, fill / totalSurplus);

            double collected = 0.0;
            for (int c : members) {
                CountyEconomy& ce = state.counties[static_cast<size_t>(c)];
                const double surplus = ce.stock[gi] - ce.population * perPop;
                if (surplus <= 0.0) continue;
                const double take = surplus * collectRatio;
                ce.stock[gi] = clampNonNegative(ce.stock[gi] - take);
                ce.granaryRequisitioned[gi] += take;
                ce.treasury += take * unitCost;
                collected += take;
            }

            const double paid = std::min(collected * unitCost, pe.treasury);
            pe.treasury = clampNonNegative(pe.treasury - paid);
            pe.granaryCrownsSpent += paid;
            pe.stockpile[gi] += collected;
            pe.granaryRequisitioned[gi] += collected;
        }
    }
}

void FiscalSystem::distributeRoyalRelief(EconomyState& state, const MapTopology& topology) const {
    for (int r = 0; r < topology.realmCount(); ++r) {
        if (!validIndex(r, state.realms.size())) continue;
        RealmEconomy& re = state.realms[static_cast<size_t>(r)];
        const std::vector<int>& provinces = topology.provincesOfRealm(r);
        if (provinces.empty()) continue;

        for (int g = 0; g < kGoodCount; ++g) {
            const size_t gi = static_cast<size_t>(g);
            if (isPreciousMetal(g) || re.stockpile[gi] <= 0.0) continue;

            std::vector<double> deficits(provinces.size(), 0.0);
            for (size_t i = 0; i < provinces.size(); ++i) {
                const int p = provinces[i];
                double shortfall = 0.0;
                for (int c : topology.countiesOfProvince(p)) {
                    shortfall += countyShortfall(state.counties[static_cast<size_t>(c)], g);
                }
                deficits[i] = std::max(0.0, shortfall - state.provinces[static_cast<size_t>(p)].stockpile[gi]);
            }

            const std::vector<double> grants = allocateProRata(re.stockpile[gi], deficits);
            for (size_t i = 0; i < provinces.size(); ++i) {
                if (grants[i] <= 0.0) continue;
                ProvinceEconomy& pe = state.provinces[static_cast<size_t>(provinces[i])];
                re.stockpile[gi] = clampNonNegative(re.stockpile[gi] - grants[i]);
                re.reliefGiven[gi] += grants[i];
                pe.stockpile[gi] += grants[i];
            }
        }
    }
}

void FiscalSystem::distributeDucalRelief(EconomyState& state, const MapTopology& topology) const {
    for (int p = 0; p < topology.provinceCount(); ++p) {
        if (!validIndex(p, state.provinces.size())) continue;
        ProvinceEconomy& pe = state.provinces[static_cast<size_t>(p)];
        const std::vector<int>& members = topology.countiesOfProvince(p);
        if (members.empty()) continue;

        for (int g = 0; g < kGoodCount; ++g) {
            const size_t gi = static_cast<size_t>(g);
            if (isPreciousMetal(g) || pe.stockpile[gi] <= 0.0) continue;

            std::vector<double> deficits(members.size(), 0.0);
            for (size_t i = 0; i < members.size(); ++i) {
                deficits[i] = countyShortfall(state.counties[static_cast<size_t>(members[i])], g);
            }

            const std::vector<double> grants = allocateProRata(pe.stockpile[gi], deficits);
            for (size_t i = 0; i < members.size(); ++i) {
                if (grants[i] <= 0.0) continue;
                CountyEconomy& ce = state.counties[static_cast<size_t>(members[i])];
                pe.stockpile[gi] = clampNonNegative(pe.stockpile[gi] - grants[i]);
                pe.reliefGiven[gi] += grants[i];
                ce.stock[gi] += grants[i];
                ce.relief[gi] += grants[i];
            }
        }
    }
}
