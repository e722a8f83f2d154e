// goods.h
#pragma once

#include <array>
#include <string>

enum class GoodType {
    Food = 0,
    Timber = 1,
    IronOre = 2,
    GoldOre = 3,
    SilverOre = 4,
    Salt = 5,
    Wool = 6,
    Stone = 7,
    Ale = 8,
    Clay = 9,
    Pottery = 10
};

static constexpr int kGoodCount = 11;

// Every per-good container in every tier uses this indexing. Never resized.
using GoodArray = std::array<double, kGoodCount>;

constexpr int goodIndex(GoodType g) { return static_cast<int>(g); }

static constexpr std::array<GoodType, kGoodCount> kAllGoods = {
    GoodType::Food,
    GoodType::Timber,
    GoodType::IronOre,
    GoodType::GoldOre,
    GoodType::SilverOre,
    GoodType::Salt,
    GoodType::Wool,
    GoodType::Stone,
    GoodType::Ale,
    GoodType::Clay,
    GoodType::Pottery
};

// Market iteration order: staples first, stone and clay last.
// Treasury spent on an earlier good is gone for later goods in the same tick.
static constexpr std::array<GoodType, 9> kBuyPriority = {
    GoodType::Food,
    GoodType::Ale,
    GoodType::IronOre,
    GoodType::Salt,
    GoodType::Wool,
    GoodType::Pottery,
    GoodType::Timber,
    GoodType::Stone,
    GoodType::Clay
};

enum class GoodCategory {
    Raw,
    Refined
};

enum class NeedCategory {
    Basic,
    Comfort,
    None
};

struct GoodDef {
    GoodType type = GoodType::Food;
    std::string name;
    GoodCategory category = GoodCategory::Raw;
    NeedCategory need = NeedCategory::None;
    double consumptionPerPop = 0.0;   // per capita per day
    double countyAdminPerPop = 0.0;   // building upkeep
    double provinceAdminPerPop = 0.0; // infrastructure
    double realmAdminPerPop = 0.0;    // military upkeep
    double basePrice = 0.0;           // crowns per unit
    double minPrice = 0.0;
    double maxPrice = 0.0;
    bool tradeable = false;
    bool preciousMetal = false;
    double spoilageRate = 0.0;        // fraction lost per day
};

// Minting process parameters.
static constexpr double kGoldSmeltingYield = 0.01;
static constexpr double kSilverSmeltingYield = 0.05;
static constexpr double kCrownsPerKgGold = 1000.0;
static constexpr double kCrownsPerKgSilver = 100.0;

// The catalog is process-wide: every EconomyState in the process reads the
// same price bounds. Configure it once at startup, before building any state.
const GoodDef& goodDef(GoodType g);
const GoodDef& goodDef(int g);
// Built-in definition, unaffected by price overrides.
const GoodDef& builtinGoodDef(GoodType g);
const std::string& goodName(GoodType g);
bool isPreciousMetal(int g);
bool isBasicNeed(int g);

// Returns false when no good has that name.
bool findGoodByName(const std::string& name, GoodType& out);

// Price overrides applied from configuration before the simulation starts.
void setGoodPrices(GoodType g, double basePrice, double minPrice, double maxPrice);
void resetGoodCatalog();

// Checks price bounds and non-negative rates across the catalog.
bool validateGoodCatalog(std::string* errorMessage = nullptr);

inline GoodArray zeroGoods() {
    GoodArray a{};
    a.fill(0.0);
    return a;
}

inline GoodArray basePrices() {
    GoodArray a{};
    for (int g = 0; g < kGoodCount; ++g) {
        a[static_cast<size_t>(g)] = goodDef(g).basePrice;
    }
    return a;
}
