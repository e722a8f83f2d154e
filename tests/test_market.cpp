#include <catch2/catch.hpp>

#include <string>
#include <variant>
#include <vector>

#include "economy_state.h"
#include "inter_realm_trade_system.h"
#include "market_orders.h"
#include "simulation_context.h"
#include "test_helpers.h"

using test_helpers::CatalogGuard;
using test_helpers::gi;

namespace {

std::vector<RealmEconomy> makeRealms(size_t n) {
    std::vector<RealmEconomy> realms(n);
    for (size_t r = 0; r < n; ++r) {
        realms[r].realmId = static_cast<int>(r);
    }
    return realms;
}

} // namespace

TEST_CASE("Clearing ratios never exceed one", "[market]") {
    ClearingRatios ratios;

    REQUIRE(computeClearingRatios(100.0, 50.0, ratios));
    CHECK(ratios.fillRatio == Approx(1.0));
    CHECK(ratios.sellRatio == Approx(0.5));

    REQUIRE(computeClearingRatios(10.0, 40.0, ratios));
    CHECK(ratios.fillRatio == Approx(0.25));
    CHECK(ratios.sellRatio == Approx(1.0));

    CHECK_FALSE(computeClearingRatios(0.0, 40.0, ratios));
    CHECK_FALSE(computeClearingRatios(10.0, 0.0, ratios));
    CHECK(ratios.fillRatio == 0.0);
    CHECK(ratios.sellRatio == 0.0);
}

TEST_CASE("Clearing price stays within the good's bounds", "[market]") {
    CatalogGuard guard;
    const double quantities[] = {0.001, 0.5, 1.0, 7.0, 100.0, 1.0e6};

    for (GoodType good : kBuyPriority) {
        const GoodDef& def = goodDef(good);
        for (double supply : quantities) {
            for (double demand : quantities) {
                const double price = clearingPrice(good, supply, demand);
                INFO(def.name << " supply=" << supply << " demand=" << demand);
                CHECK(price >= def.minPrice);
                CHECK(price <= def.maxPrice);
            }
        }
        CHECK(clearingPrice(good, 0.0, 10.0) == Approx(def.maxPrice));
        CHECK(clearingPrice(good, 10.0, 10.0) == Approx(def.basePrice));
    }
}

TEST_CASE("Inter-realm market: two realms trade at the clearing price", "[market]") {
    CatalogGuard guard;
    setGoodPrices(GoodType::Food, 10.0, 5.0, 20.0);
    const size_t food = gi(GoodType::Food);

    std::vector<RealmEconomy> realms = makeRealms(2);
    realms[0].stockpile[food] = 100.0;
    realms[0].treasury = 1000.0;
    realms[1].deficit[food] = 50.0;
    realms[1].treasury = 1000.0;

    GoodArray prices = basePrices();
    InterRealmTradeSystem market;
    const InterRealmTradeSystem::GoodClearing result = market.clearGood(realms, GoodType::Food, prices);

    REQUIRE(result.traded);
    CHECK(result.totalSupply == Approx(100.0));
    CHECK(result.totalDemand == Approx(50.0));
    // 10 * 50 / 100 = 5, exactly at the floor.
    CHECK(result.price == Approx(5.0));
    CHECK(prices[food] == Approx(5.0));

    CHECK(realms[0].stockpile[food] == Approx(50.0));
    CHECK(realms[0].treasury == Approx(1250.0));
    CHECK(realms[0].tradeExports[food] == Approx(50.0));
    CHECK(realms[1].stockpile[food] == Approx(50.0));
    CHECK(realms[1].treasury == Approx(750.0));
    CHECK(realms[1].tradeImports[food] == Approx(50.0));

    CHECK(market.lastClearing(GoodType::Food).sold == Approx(50.0));
}

TEST_CASE("Inter-realm market: scarce supply is rationed pro rata", "[market]") {
    CatalogGuard guard;
    const size_t food = gi(GoodType::Food);

    std::vector<RealmEconomy> realms = makeRealms(3);
    realms[0].stockpile[food] = 10.0;
    realms[1].deficit[food] = 100.0;
    realms[1].treasury = 1000.0;
    realms[2].deficit[food] = 100.0;
    realms[2].treasury = 1000.0;

    GoodArray prices = basePrices();
    InterRealmTradeSystem market;
    const InterRealmTradeSystem::GoodClearing result = market.clearGood(realms, GoodType::Food, prices);

    REQUIRE(result.traded);
    CHECK(result.price == Approx(goodDef(GoodType::Food).maxPrice));
    CHECK(result.sold == Approx(result.bought));
    CHECK(result.sold == Approx(10.0));
    CHECK(realms[1].tradeImports[food] == Approx(5.0));
    CHECK(realms[2].tradeImports[food] == Approx(5.0));
    CHECK(realms[0].stockpile[food] == Approx(0.0).margin(1e-9));
    CHECK(realms[0].treasury == Approx(10.0 * result.price));
}

TEST_CASE("Inter-realm market: demand is capped by treasury", "[market]") {
    CatalogGuard guard;
    const size_t food = gi(GoodType::Food);

    std::vector<RealmEconomy> realms = makeRealms(2);
    realms[0].stockpile[food] = 100.0;
    realms[1].deficit[food] = 100.0;
    realms[1].treasury = 20.0;

    GoodArray prices = basePrices();
    InterRealmTradeSystem market;
    const InterRealmTradeSystem::GoodClearing result = market.clearGood(realms, GoodType::Food, prices);

    REQUIRE(result.traded);
    CHECK(result.price == Approx(1.0));
    CHECK(result.effectiveDemand == Approx(20.0));
    CHECK(realms[1].stockpile[food] == Approx(20.0));
    CHECK(realms[1].treasury == Approx(0.0).margin(1e-9));
    CHECK(result.sold == Approx(result.bought));
}

TEST_CASE("Inter-realm market: realms cover their own deficit first", "[market]") {
    CatalogGuard guard;
    const size_t salt = gi(GoodType::Salt);

    std::vector<RealmEconomy> realms = makeRealms(3);
    realms[0].stockpile[salt] = 30.0;
    realms[0].deficit[salt] = 20.0;
    realms[0].treasury = 500.0;
    realms[1].stockpile[salt] = 20.0;
    realms[1].deficit[salt] = 20.0;
    realms[1].treasury = 500.0;
    realms[2].deficit[salt] = 5.0;
    realms[2].treasury = 500.0;

    GoodArray prices = basePrices();
    InterRealmTradeSystem market;
    const InterRealmTradeSystem::GoodClearing result = market.clearGood(realms, GoodType::Salt, prices);

    REQUIRE(result.traded);
    CHECK(result.totalSupply == Approx(10.0));
    CHECK(result.totalDemand == Approx(5.0));
    CHECK(realms[0].tradeImports[salt] == 0.0);
    CHECK(realms[0].tradeExports[salt] == Approx(5.0));
    CHECK(realms[1].tradeImports[salt] == 0.0);
    CHECK(realms[1].tradeExports[salt] == 0.0);
    CHECK(realms[1].treasury == Approx(500.0));
    CHECK(realms[2].tradeImports[salt] == Approx(5.0));
}

TEST_CASE("Inter-realm market: one-sided market leaves state untouched", "[market]") {
    CatalogGuard guard;
    const size_t wool = gi(GoodType::Wool);

    std::vector<RealmEconomy> realms = makeRealms(2);
    realms[0].deficit[wool] = 10.0;
    realms[0].treasury = 100.0;
    realms[1].deficit[wool] = 10.0;
    realms[1].treasury = 100.0;

    GoodArray prices = basePrices();
    InterRealmTradeSystem market;
    const InterRealmTradeSystem::GoodClearing result = market.clearGood(realms, GoodType::Wool, prices);

    CHECK_FALSE(result.traded);
    CHECK(prices[wool] == Approx(goodDef(GoodType::Wool).basePrice));
    CHECK(realms[0].treasury == Approx(100.0));
    CHECK(realms[1].stockpile[wool] == 0.0);
}

TEST_CASE("Inter-realm market: price at the ceiling raises one scarcity event", "[market]") {
    CatalogGuard guard;
    const size_t food = gi(GoodType::Food);

    std::vector<RealmEconomy> realms = makeRealms(2);
    GoodArray prices = basePrices();
    EconomyLog log;
    InterRealmTradeSystem market;

    for (int day = 1; day <= 3; ++day) {
        realms[0].stockpile[food] = 1.0;
        realms[1].deficit[food] = 100.0;
        realms[1].treasury = 10000.0;
        market.clearMarket(realms, prices, &log, day);
    }

    CHECK(prices[food] == Approx(goodDef(GoodType::Food).maxPrice));
    REQUIRE(log.getEvents().size() == 1);
    CHECK(log.getEvents().front().find("food scarce") != std::string::npos);
}

TEST_CASE("Inter-realm market: deficits come from county shortfalls", "[market]") {
    const MapTopology topology = test_helpers::makeTopology(2, 1, 1, 100.0);
    SimulationConfig config;
    EconomyState state = initializeEconomy(topology, config);
    const size_t food = gi(GoodType::Food);

    state.counties[0].stock[food] = 40.0;
    state.counties[1].stock[food] = 200.0;

    InterRealmTradeSystem::scanDeficits(state, topology);

    CHECK(state.realms[0].deficit[food] == Approx(60.0));
    CHECK(state.realms[1].deficit[food] == Approx(0.0));
    CHECK(state.realms[0].deficit[gi(GoodType::Salt)] == Approx(5.0));
    CHECK(state.realms[0].deficit[gi(GoodType::GoldOre)] == 0.0);

    // A second scan replaces the figures rather than adding to them.
    InterRealmTradeSystem::scanDeficits(state, topology);
    CHECK(state.realms[0].deficit[food] == Approx(60.0));
}

TEST_CASE("Legacy participant ids", "[market]") {
    using namespace legacy_ids;

    CHECK(toLegacyId(FacilityParticipant{7}) == 7);
    CHECK(toLegacyId(PopulationBuyer{12}) == -13);
    CHECK(toLegacyId(PopulationBuyer{0}) == -1);
    CHECK(toLegacyId(SeedSeller{3}) == kSeedSellerBase - 3);
    CHECK(toLegacyId(OffMapSeller{4}) == kOffMapSellerBase - 4);

    MarketParticipant p;
    REQUIRE(fromLegacyId(-13, p));
    REQUIRE(std::holds_alternative<PopulationBuyer>(p));
    CHECK(std::get<PopulationBuyer>(p).countyId == 12);

    // The first county of a world survives the round trip.
    REQUIRE(fromLegacyId(toLegacyId(PopulationBuyer{0}), p));
    REQUIRE(std::holds_alternative<PopulationBuyer>(p));
    CHECK(std::get<PopulationBuyer>(p).countyId == 0);
    CHECK(describeParticipant(p) == "county#0");

    REQUIRE(fromLegacyId(kSeedSellerBase - 3, p));
    REQUIRE(std::holds_alternative<SeedSeller>(p));
    CHECK(std::get<SeedSeller>(p).marketId == 3);
    CHECK(isSyntheticSeller(p));

    REQUIRE(fromLegacyId(kOffMapSellerBase - 4, p));
    REQUIRE(std::holds_alternative<OffMapSeller>(p));
    CHECK(std::get<OffMapSeller>(p).marketId == 4);

    REQUIRE(fromLegacyId(7, p));
    REQUIRE(std::holds_alternative<FacilityParticipant>(p));
    CHECK_FALSE(isSyntheticSeller(p));
    CHECK(describeParticipant(p) == "facility#7");

    CHECK_FALSE(fromLegacyId(0, p));
}
