#include <catch2/catch.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "economy_snapshot.h"
#include "economy_state.h"
#include "scenario.h"
#include "simulation_context.h"
#include "simulation_runner.h"
#include "test_helpers.h"

using test_helpers::CatalogGuard;
using test_helpers::gi;

namespace {

class CountingSystem : public ITickSystem {
public:
    CountingSystem(int interval, int* ticks) : m_interval(interval), m_ticks(ticks) {}

    const char* name() const override { return "Counting"; }
    int tickInterval() const override { return m_interval; }
    void initialize(EconomyState& /*state*/, const MapTopology& /*topology*/) override {}
    void tick(EconomyState& /*state*/, const MapTopology& /*topology*/) override { ++*m_ticks; }

private:
    int m_interval;
    int* m_ticks;
};

std::uint64_t runAndHash(std::uint64_t seed, int days, bool reversed) {
    SimulationContext ctx(seed);
    ctx.applyGoodCatalog();
    const MapTopology topology = buildSyntheticTopology(ctx);
    EconomyState state = initializeEconomy(topology, ctx.config);

    SimulationRunner runner(state, topology);
    std::vector<std::unique_ptr<ITickSystem>> systems = makeDefaultPipeline(ctx.config);
    if (reversed) {
        std::reverse(systems.begin(), systems.end());
    }
    for (auto& system : systems) {
        runner.addSystem(std::move(system));
    }
    runner.runDays(days);
    return computeStateHash(state);
}

} // namespace

TEST_CASE("Synthetic topology is valid and seed-stable", "[scenario]") {
    SimulationContext ctx(1234);
    const MapTopology topology = buildSyntheticTopology(ctx);

    std::string err;
    REQUIRE(topology.validate(&err));
    CHECK(topology.realmCount() == 3);
    CHECK(topology.provinceCount() == 9);
    CHECK(topology.countyCount() == 36);

    for (const CountyInfo& county : topology.getCounties()) {
        CHECK(county.population >= ctx.config.world.countyPopMin);
        CHECK(county.population <= ctx.config.world.countyPopMax);
        CHECK(county.productivity[gi(GoodType::Food)] > 0.0);
    }

    const MapTopology again = buildSyntheticTopology(SimulationContext(1234));
    const MapTopology other = buildSyntheticTopology(SimulationContext(4321));
    bool sameAsAgain = true;
    bool sameAsOther = true;
    for (int c = 0; c < topology.countyCount(); ++c) {
        const double pop = topology.getCounties()[static_cast<size_t>(c)].population;
        sameAsAgain = sameAsAgain && pop == again.getCounties()[static_cast<size_t>(c)].population;
        sameAsOther = sameAsOther && pop == other.getCounties()[static_cast<size_t>(c)].population;
    }
    CHECK(sameAsAgain);
    CHECK_FALSE(sameAsOther);
}

TEST_CASE("Topology lookups and validation", "[scenario]") {
    const MapTopology topology = test_helpers::makeTopology(2, 2, 3, 10.0);
    REQUIRE(topology.validate());
    CHECK(topology.countiesOfProvince(3) == std::vector<int>({9, 10, 11}));
    CHECK(topology.provincesOfRealm(1) == std::vector<int>({2, 3}));
    CHECK(topology.countiesOfRealm(0).size() == 6);
    CHECK(topology.provinceOfCounty(7) == 2);
    CHECK(topology.realmOfCounty(7) == 1);
    CHECK(topology.realmOfProvince(1) == 0);
    CHECK(topology.countiesOfProvince(99).empty());

    const MapTopology broken = test_helpers::makeCustomTopology({10.0}, {5}, {0}, 1);
    std::string err;
    CHECK_FALSE(broken.validate(&err));
    CHECK(err.find("missing province") != std::string::npos);
}

TEST_CASE("Runner honours tick intervals", "[runner]") {
    const MapTopology topology = test_helpers::makeTopology(1, 1, 1, 0.0);
    SimulationConfig config;
    EconomyState state = initializeEconomy(topology, config);

    int daily = 0;
    int weekly = 0;
    int monthly = 0;
    SimulationRunner runner(state, topology);
    runner.addSystem(std::make_unique<CountingSystem>(TickInterval::Daily, &daily));
    runner.addSystem(std::make_unique<CountingSystem>(TickInterval::Weekly, &weekly));
    runner.addSystem(std::make_unique<CountingSystem>(TickInterval::Monthly, &monthly));
    runner.setCaptureSnapshots(false);

    runner.runDays(61);

    CHECK(state.day == 61);
    CHECK(daily == 61);
    CHECK(weekly == 8);
    CHECK(monthly == 2);
    CHECK(state.snapshots.empty());
}

TEST_CASE("Default pipeline order", "[runner]") {
    SimulationConfig config;
    const std::vector<std::unique_ptr<ITickSystem>> systems = makeDefaultPipeline(config);
    std::vector<std::string> names;
    for (const auto& system : systems) {
        names.emplace_back(system->name());
    }
    CHECK(names == std::vector<std::string>({"LocalEconomy", "FacilityProduction", "Fiscal", "CountyTrade",
                                             "FacilityQuota", "InterRealmTrade", "Spoilage"}));
}

TEST_CASE("Same seed and config give the same state hash", "[runner][determinism]") {
    CatalogGuard guard;
    const std::uint64_t first = runAndHash(77, 45, false);
    const std::uint64_t second = runAndHash(77, 45, false);
    CHECK(first == second);
}

TEST_CASE("Stage order changes the outcome", "[runner][determinism]") {
    CatalogGuard guard;
    CHECK(runAndHash(77, 10, false) != runAndHash(77, 10, true));
}

TEST_CASE("Holdings stay non-negative over a long run", "[runner]") {
    CatalogGuard guard;
    SimulationContext ctx(2024);
    ctx.applyGoodCatalog();
    const MapTopology topology = buildSyntheticTopology(ctx);
    EconomyState state = initializeEconomy(topology, ctx.config);
    SimulationRunner runner(state, topology);
    for (auto& system : makeDefaultPipeline(ctx.config)) {
        runner.addSystem(std::move(system));
    }

    runner.runDays(120);

    bool ok = true;
    for (const CountyEconomy& ce : state.counties) {
        ok = ok && ce.treasury >= 0.0 && ce.basicSatisfaction >= 0.0 && ce.basicSatisfaction <= 1.0;
        for (double v : ce.stock) ok = ok && v >= 0.0;
    }
    for (const ProvinceEconomy& pe : state.provinces) {
        ok = ok && pe.treasury >= 0.0;
        for (double v : pe.stockpile) ok = ok && v >= 0.0;
    }
    for (const RealmEconomy& re : state.realms) {
        ok = ok && re.treasury >= 0.0;
        for (double v : re.stockpile) ok = ok && v >= 0.0;
    }
    for (const Facility& f : state.facilities) {
        for (double v : f.inputBuffer) ok = ok && v >= 0.0;
    }
    CHECK(ok);

    for (GoodType good : kBuyPriority) {
        const double price = state.marketPrices[gi(good)];
        INFO(goodName(good));
        CHECK(price >= goodDef(good).minPrice);
        CHECK(price <= goodDef(good).maxPrice);
    }

    const EconomySnapshot* last = state.latestSnapshot();
    REQUIRE(last != nullptr);
    CHECK(last->day == 120);
    CHECK(last->totalPopulation > 0.0);
}

TEST_CASE("A good nobody makes, eats or buys is conserved", "[runner]") {
    CatalogGuard guard;
    SimulationConfig config;
    // Empty counties: no production, no consumption, no buyers.
    const MapTopology topology = test_helpers::makeTopology(2, 2, 2, 0.0);
    EconomyState state = initializeEconomy(topology, config);
    for (CountyEconomy& ce : state.counties) {
        ce.stock[gi(GoodType::Stone)] = 100.0;
    }
    const double initial = test_helpers::totalGood(state, GoodType::Stone);
    REQUIRE(initial == Approx(800.0));

    SimulationRunner runner(state, topology);
    for (auto& system : makeDefaultPipeline(config)) {
        runner.addSystem(std::move(system));
    }

    for (int day = 1; day <= 35; ++day) {
        runner.runDay();
        INFO("day " << day);
        CHECK(test_helpers::totalGood(state, GoodType::Stone) == Approx(initial));
    }
    // Taxes moved some of it up the hierarchy.
    CHECK(state.realms[0].stockpile[gi(GoodType::Stone)] > 0.0);
}

TEST_CASE("Snapshot series is bounded", "[snapshot]") {
    const MapTopology topology = test_helpers::makeTopology(1, 1, 1, 0.0);
    SimulationConfig config;
    EconomyState state = initializeEconomy(topology, config);
    state.snapshotCapacity = 5;

    SimulationRunner runner(state, topology);
    runner.runDays(8);

    REQUIRE(state.snapshots.size() == 5);
    CHECK(state.snapshots.front().day == 4);
    CHECK(state.snapshots.back().day == 8);
    REQUIRE(state.latestSnapshot() != nullptr);
    CHECK(state.latestSnapshot()->day == 8);
}

TEST_CASE("Snapshot aggregates county, province and realm records", "[snapshot]") {
    CatalogGuard guard;
    const MapTopology topology = test_helpers::makeTopology(1, 1, 2, 100.0);
    SimulationConfig config;
    EconomyState state = initializeEconomy(topology, config);
    const size_t food = gi(GoodType::Food);

    state.counties[0].stock[food] = 10.0;
    state.counties[1].stock[food] = 30.0;
    state.counties[0].basicSatisfaction = 0.4;
    state.counties[1].basicSatisfaction = 1.0;
    state.counties[0].unmetNeed[food] = 5.0;
    state.provinces[0].taxCollected[food] = 2.0;
    state.provinces[0].treasury = 50.0;
    state.realms[0].treasury = 25.0;
    state.realms[0].crownsMinted = 7.0;

    const EconomySnapshot snap = buildSnapshot(state, 3, 0.5);

    CHECK(snap.day == 3);
    CHECK(snap.totalFoodStock == Approx(40.0));
    CHECK(snap.minCountyFoodStock == Approx(10.0));
    CHECK(snap.maxCountyFoodStock == Approx(30.0));
    CHECK(snap.countiesInDeficit == 1);
    CHECK(snap.countiesInDistress == 1);
    CHECK(snap.avgBasicSatisfaction == Approx(0.7));
    CHECK(snap.minBasicSatisfaction == Approx(0.4));
    CHECK(snap.totalPopulation == Approx(200.0));
    CHECK(snap.totalDucalTax == Approx(2.0));
    CHECK(snap.totalCountyTreasury == Approx(200.0));
    CHECK(snap.totalDomesticTreasury == Approx(275.0));
    CHECK(snap.totalCrownsMinted == Approx(7.0));
}

TEST_CASE("Event log keeps the most recent entries", "[snapshot]") {
    EconomyLog log;
    for (int day = 1; day <= 70; ++day) {
        log.addEvent(day, "event " + std::to_string(day));
    }
    CHECK(log.getEvents().size() == EconomyLog::kCapacity);
    CHECK(log.totalRaised() == 70);
    CHECK(log.getEvents().front() == "day 7: event 7");
    CHECK(log.getEvents().back() == "day 70: event 70");

    log.clearEvents();
    CHECK(log.getEvents().empty());
    CHECK(log.totalRaised() == 70);

    for (int day = 1; day <= 200; ++day) {
        log.addEvent(day, "event " + std::to_string(day));
    }
    CHECK(log.getEvents().size() == EconomyLog::kCapacity);
    CHECK(log.getEvents().front() == "day 137: event 137");
    CHECK(log.getEvents()[1] == "day 138: event 138");
    CHECK(log.totalRaised() == 270);
}
