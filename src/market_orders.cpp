// market_orders.cpp
#include "market_orders.h"

#include <algorithm>
#include <cstdlib>
#include <type_traits>

bool computeClearingRatios(double totalSupply, double totalDemand, ClearingRatios& out) {
    out = ClearingRatios{};
    if (!(totalSupply > 0.0) || !(totalDemand > 0.0)) {
        return false;
    }
    out.fillRatio = std::min(1.0, totalSupply / totalDemand);
    out.sellRatio = std::min(1.0, totalDemand / totalSupply);
    return true;
}

double clearingPrice(GoodType good, double totalSupply, double totalDemand) {
    const GoodDef& def = goodDef(good);
    if (!(totalSupply > 0.0)) return def.maxPrice;
    const double raw = def.basePrice * totalDemand / totalSupply;
    return std::max(def.minPrice, std::min(raw, def.maxPrice));
}

bool isSyntheticSeller(const MarketParticipant& p) {
    return std::holds_alternative<SeedSeller>(p) || std::holds_alternative<OffMapSeller>(p);
}

std::string describeParticipant(const MarketParticipant& p) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, FacilityParticipant>) {
            return "facility#" + std::to_string(v.facilityId);
        } else if constexpr (std::is_same_v<T, PopulationBuyer>) {
            return "county#" + std::to_string(v.countyId);
        } else if constexpr (std::is_same_v<T, SeedSeller>) {
            return "seed@market" + std::to_string(v.marketId);
        } else {
            return "offmap@market" + std::to_string(v.marketId);
        }
    }, p);
}

namespace legacy_ids {

int toLegacyId(const MarketParticipant& p) {
    return std::visit([](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, FacilityParticipant>) {
            return std::abs(v.facilityId);
        } else if constexpr (std::is_same_v<T, PopulationBuyer>) {
            return -(std::abs(v.countyId) + 1);
        } else if constexpr (std::is_same_v<T, SeedSeller>) {
            return kSeedSellerBase - std::abs(v.marketId);
        } else {
            return kOffMapSellerBase - std::abs(v.marketId);
        }
    }, p);
}

bool fromLegacyId(int id, MarketParticipant& out) {
    if (id > 0) {
        out = FacilityParticipant{id};
        return true;
    }
    if (id == 0) {
        return false;
    }
    if (id <= kOffMapSellerBase) {
        out = OffMapSeller{kOffMapSellerBase - id};
        return true;
    }
    if (id <= kSeedSellerBase) {
        out = SeedSeller{kSeedSellerBase - id};
        return true;
    }
    out = PopulationBuyer{-id - 1};
    return true;
}

} // namespace legacy_ids
