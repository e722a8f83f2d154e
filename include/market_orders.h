// market_orders.h
#pragma once

#include <string>
#include <variant>

#include "goods.h"

struct FacilityParticipant {
    int facilityId = 0;
};

// A county's population. Posts buy orders for shortfalls and consigns surplus.
struct PopulationBuyer {
    int countyId = 0;
};

// Synthetic sellers with no real owner, used to bootstrap liquidity.
struct SeedSeller {
    int marketId = 0;
};

struct OffMapSeller {
    int marketId = 0;
};

using MarketParticipant = std::variant<FacilityParticipant, PopulationBuyer, SeedSeller, OffMapSeller>;

struct BuyOrder {
    MarketParticipant buyer;
    GoodType good = GoodType::Food;
    double quantity = 0.0;
    double maxSpend = 0.0;
    double transportCost = 0.0; // opaque per-order scalar
    int dayPosted = 0;
};

struct ConsignmentLot {
    MarketParticipant seller;
    GoodType good = GoodType::Food;
    double quantity = 0.0;
    int dayListed = 0;
};

// Pro-rata clearing of one good. Buyers receive fillRatio of their demand and
// sellers part with sellRatio of their supply; neither exceeds 1.
struct ClearingRatios {
    double fillRatio = 0.0;
    double sellRatio = 0.0;
};

// Returns false when either side is empty and nothing can trade.
bool computeClearingRatios(double totalSupply, double totalDemand, ClearingRatios& out);

// Supply/demand price around the base price, clamped to the good's bounds.
double clearingPrice(GoodType good, double totalSupply, double totalDemand);

bool isSyntheticSeller(const MarketParticipant& p);
std::string describeParticipant(const MarketParticipant& p);

// Signed id codec used by older saves: positive facility, negative county
// (county n is -(n + 1)), reserved ranges below the base constants for
// synthetic sellers.
namespace legacy_ids {
constexpr int kSeedSellerBase = -100000;
constexpr int kOffMapSellerBase = -200000;

int toLegacyId(const MarketParticipant& p);
// Returns false for 0, which no participant encodes to.
bool fromLegacyId(int id, MarketParticipant& out);
} // namespace legacy_ids
