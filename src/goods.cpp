// goods.cpp
#include "goods.h"

#include <sstream>

namespace {

std::array<GoodDef, kGoodCount> makeDefaultCatalog() {
    //         type                 name         category               need                   cons    cAdmin  pAdmin  rAdmin  base   min    max    trade  prec   spoil
    return {{
        {GoodType::Food,      "food",      GoodCategory::Raw,     NeedCategory::Basic,   1.0,    0.0,    0.0,    0.02,   1.0,   0.1,   10.0,  true,  false, 0.03},
        {GoodType::Timber,    "timber",    GoodCategory::Raw,     NeedCategory::Comfort, 0.2,    0.02,   0.01,   0.01,   0.5,   0.05,  5.0,   true,  false, 0.001},
        {GoodType::IronOre,   "ironOre",   GoodCategory::Raw,     NeedCategory::Comfort, 0.005,  0.0,    0.001,  0.003,  5.0,   0.5,   50.0,  true,  false, 0.0},
        {GoodType::GoldOre,   "goldOre",   GoodCategory::Raw,     NeedCategory::None,    0.0,    0.0,    0.0,    0.0,    0.0,   0.0,   0.0,   false, true,  0.0},
        {GoodType::SilverOre, "silverOre", GoodCategory::Raw,     NeedCategory::None,    0.0,    0.0,    0.0,    0.0,    0.0,   0.0,   0.0,   false, true,  0.0},
        {GoodType::Salt,      "salt",      GoodCategory::Raw,     NeedCategory::Basic,   0.05,   0.0,    0.0,    0.0,    3.0,   0.3,   30.0,  true,  false, 0.0},
        {GoodType::Wool,      "wool",      GoodCategory::Raw,     NeedCategory::Comfort, 0.1,    0.0,    0.0,    0.005,  2.0,   0.2,   20.0,  true,  false, 0.001},
        {GoodType::Stone,     "stone",     GoodCategory::Raw,     NeedCategory::None,    0.0,    0.005,  0.008,  0.012,  0.3,   0.03,  3.0,   true,  false, 0.0},
        {GoodType::Ale,       "ale",       GoodCategory::Raw,     NeedCategory::Basic,   0.5,    0.0,    0.0,    0.0,    0.8,   0.08,  8.0,   true,  false, 0.05},
        {GoodType::Clay,      "clay",      GoodCategory::Raw,     NeedCategory::None,    0.0,    0.0,    0.0,    0.0,    0.2,   0.02,  2.0,   true,  false, 0.0},
        {GoodType::Pottery,   "pottery",   GoodCategory::Refined, NeedCategory::Comfort, 0.01,   0.002,  0.001,  0.001,  2.0,   0.2,   20.0,  true,  false, 0.0},
    }};
}

const std::array<GoodDef, kGoodCount>& builtinCatalog() {
    static const std::array<GoodDef, kGoodCount> defs = makeDefaultCatalog();
    return defs;
}

std::array<GoodDef, kGoodCount>& catalog() {
    static std::array<GoodDef, kGoodCount> defs = builtinCatalog();
    return defs;
}

} // namespace

const GoodDef& goodDef(GoodType g) {
    return catalog()[static_cast<size_t>(g)];
}

const GoodDef& goodDef(int g) {
    return catalog()[static_cast<size_t>(g)];
}

const GoodDef& builtinGoodDef(GoodType g) {
    return builtinCatalog()[static_cast<size_t>(g)];
}

const std::string& goodName(GoodType g) {
    return goodDef(g).name;
}

bool isPreciousMetal(int g) {
    return goodDef(g).preciousMetal;
}

bool isBasicNeed(int g) {
    return goodDef(g).need == NeedCategory::Basic;
}

bool findGoodByName(const std::string& name, GoodType& out) {
    for (const GoodDef& def : catalog()) {
        if (def.name == name) {
            out = def.type;
            return true;
        }
    }
    return false;
}

void setGoodPrices(GoodType g, double basePrice, double minPrice, double maxPrice) {
    GoodDef& def = catalog()[static_cast<size_t>(g)];
    def.basePrice = basePrice;
    def.minPrice = minPrice;
    def.maxPrice = maxPrice;
}

void resetGoodCatalog() {
    catalog() = builtinCatalog();
}

bool validateGoodCatalog(std::string* errorMessage) {
    for (int g = 0; g < kGoodCount; ++g) {
        const GoodDef& d = goodDef(g);
        std::ostringstream oss;
        if (static_cast<int>(d.type) != g) {
            oss << "good '" << d.name << "' is registered at index " << g
                << " but declares index " << static_cast<int>(d.type);
        } else if (d.basePrice < 0.0 || d.minPrice < 0.0 || d.maxPrice < 0.0) {
            oss << "good '" << d.name << "' has a negative price";
        } else if (d.minPrice > d.basePrice || d.basePrice > d.maxPrice) {
            oss << "good '" << d.name << "' violates min <= base <= max ("
                << d.minPrice << ", " << d.basePrice << ", " << d.maxPrice << ")";
        } else if (d.tradeable && d.basePrice <= 0.0) {
            oss << "tradeable good '" << d.name << "' needs a positive base price";
        } else if (d.consumptionPerPop < 0.0 || d.countyAdminPerPop < 0.0 ||
                   d.provinceAdminPerPop < 0.0 || d.realmAdminPerPop < 0.0) {
            oss << "good '" << d.name << "' has a negative consumption rate";
        } else if (d.spoilageRate < 0.0 || d.spoilageRate >= 1.0) {
            oss << "good '" << d.name << "' has spoilage outside [0,1)";
        }
        const std::string msg = oss.str();
        if (!msg.empty()) {
            if (errorMessage) *errorMessage = msg;
            return false;
        }
    }
    return true;
}
