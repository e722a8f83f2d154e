// spoilage_system.cpp
#include "spoilage_system.h"

#include <cmath>

#include "economy_state.h"

namespace {

void applyRetention(GoodArray& goods, const GoodArray& retention) {
    for (size_t g = 0; g < goods.size(); ++g) {
        if (retention[g] < 1.0) {
            goods[g] = clampNonNegative(goods[g] * retention[g]);
        }
    }
}

} // namespace

void SpoilageSystem::initialize(EconomyState& /*state*/, const MapTopology& /*topology*/) {
    for (int g = 0; g < kGoodCount; ++g) {
        const double rate = goodDef(g).spoilageRate;
        m_retention[static_cast<size_t>(g)] = rate > 0.0
            ? std::pow(1.0 - rate, static_cast<double>(tickInterval()))
            : 1.0;
    }
}

void SpoilageSystem::tick(EconomyState& state, const MapTopology& /*topology*/) {
    for (CountyEconomy& ce : state.counties) {
        applyRetention(ce.stock, m_retention);
    }
    for (ProvinceEconomy& pe : state.provinces) {
        applyRetention(pe.stockpile, m_retention);
    }
    for (RealmEconomy& re : state.realms) {
        applyRetention(re.stockpile, m_retention);
    }
    for (Facility& f : state.facilities) {
        applyRetention(f.inputBuffer, m_retention);
        applyRetention(f.outputBuffer, m_retention);
    }
}
