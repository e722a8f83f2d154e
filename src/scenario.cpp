// scenario.cpp
#include "scenario.h"

#include <cmath>
#include <cstdint>
#include <string>

#include "simulation_context.h"

namespace {

constexpr std::uint64_t kPopSalt = 0xA11CE5EEDull;
constexpr std::uint64_t kLandSalt = 0x1A4DC0DEull;
constexpr std::uint64_t kJitterSalt = 0x517E5A17ull;

double countyRoll(const SimulationContext& ctx, std::uint64_t salt, int county, int good = 0) {
    const std::uint64_t key = ctx.worldSeed
        ^ (static_cast<std::uint64_t>(county + 1) * 0x9E3779B97F4A7C15ull)
        ^ (static_cast<std::uint64_t>(good + 1) * 0xD1B54A32D192ED03ull)
        ^ salt;
    return SimulationContext::u01FromU64(SimulationContext::mix64(key));
}

void setYield(GoodArray& a, GoodType g, double v) {
    a[static_cast<size_t>(goodIndex(g))] = v;
}

} // namespace

GoodArray landKindProductivity(LandKind kind) {
    GoodArray p = zeroGoods();
    switch (kind) {
        case LandKind::Farmland:
            setYield(p, GoodType::Food, 1.30);
            setYield(p, GoodType::Wool, 0.12);
            setYield(p, GoodType::Ale, 0.60);
            setYield(p, GoodType::Timber, 0.10);
            setYield(p, GoodType::Clay, 0.08);
            break;
        case LandKind::Forest:
            setYield(p, GoodType::Food, 0.95);
            setYield(p, GoodType::Timber, 0.40);
            setYield(p, GoodType::Ale, 0.35);
            setYield(p, GoodType::Wool, 0.05);
            setYield(p, GoodType::Clay, 0.02);
            break;
        case LandKind::Hills:
            setYield(p, GoodType::Food, 0.85);
            setYield(p, GoodType::Stone, 0.05);
            setYield(p, GoodType::IronOre, 0.02);
            setYield(p, GoodType::Salt, 0.03);
            setYield(p, GoodType::GoldOre, 0.002);
            setYield(p, GoodType::SilverOre, 0.005);
            setYield(p, GoodType::Wool, 0.15);
            setYield(p, GoodType::Clay, 0.06);
            break;
        case LandKind::Coast:
            setYield(p, GoodType::Food, 1.10);
            setYield(p, GoodType::Salt, 0.15);
            setYield(p, GoodType::Ale, 0.50);
            setYield(p, GoodType::Timber, 0.08);
            setYield(p, GoodType::Wool, 0.05);
            break;
    }
    return p;
}

MapTopology buildSyntheticTopology(const SimulationContext& ctx) {
    const SimulationConfig::World& world = ctx.config.world;

    std::vector<RealmInfo> realms;
    std::vector<ProvinceInfo> provinces;
    std::vector<CountyInfo> counties;

    for (int r = 0; r < world.realms; ++r) {
        RealmInfo realm;
        realm.id = r;
        realm.name = "Realm " + std::to_string(r + 1);
        realms.push_back(realm);

        for (int p = 0; p < world.provincesPerRealm; ++p) {
            ProvinceInfo province;
            province.id = static_cast<int>(provinces.size());
            province.realmIndex = r;
            province.name = realm.name + " / Duchy " + std::to_string(p + 1);
            const int provinceIndex = province.id;
            provinces.push_back(province);

            for (int c = 0; c < world.countiesPerProvince; ++c) {
                CountyInfo county;
                county.id = static_cast<int>(counties.size());
                county.provinceIndex = provinceIndex;
                county.seatCellId = county.id * 16;

                const double popRoll = countyRoll(ctx, kPopSalt, county.id);
                county.population = std::floor(world.countyPopMin + popRoll * (world.countyPopMax - world.countyPopMin));

                const int kind = static_cast<int>(countyRoll(ctx, kLandSalt, county.id) * 4.0) % 4;
                county.productivity = landKindProductivity(static_cast<LandKind>(kind));
                for (int g = 0; g < kGoodCount; ++g) {
                    const double jitter = 0.8 + 0.4 * countyRoll(ctx, kJitterSalt, county.id, g);
                    county.productivity[static_cast<size_t>(g)] *= jitter;
                }
                counties.push_back(county);
            }
        }
    }

    return MapTopology(std::move(counties), std::move(provinces), std::move(realms));
}
