#include <catch2/catch.hpp>

#include <cmath>
#include <string>

#include "facility.h"
#include "goods.h"
#include "test_helpers.h"

using test_helpers::CatalogGuard;
using test_helpers::gi;

TEST_CASE("Goods catalog: indices and flags", "[goods]") {
    CatalogGuard guard;

    for (int g = 0; g < kGoodCount; ++g) {
        CHECK(static_cast<int>(goodDef(g).type) == g);
    }
    CHECK(goodName(GoodType::Food) == "food");
    CHECK(goodName(GoodType::Pottery) == "pottery");

    CHECK(isPreciousMetal(goodIndex(GoodType::GoldOre)));
    CHECK(isPreciousMetal(goodIndex(GoodType::SilverOre)));
    CHECK_FALSE(isPreciousMetal(goodIndex(GoodType::IronOre)));
    CHECK_FALSE(goodDef(GoodType::GoldOre).tradeable);

    CHECK(isBasicNeed(goodIndex(GoodType::Food)));
    CHECK(isBasicNeed(goodIndex(GoodType::Salt)));
    CHECK(isBasicNeed(goodIndex(GoodType::Ale)));
    CHECK_FALSE(isBasicNeed(goodIndex(GoodType::Wool)));

    CHECK(validateGoodCatalog());
}

TEST_CASE("Goods catalog: buy priority covers every tradeable good once", "[goods]") {
    int seen[kGoodCount] = {};
    for (GoodType g : kBuyPriority) {
        ++seen[goodIndex(g)];
    }
    for (int g = 0; g < kGoodCount; ++g) {
        INFO("good " << goodDef(g).name);
        CHECK(seen[g] == (goodDef(g).tradeable ? 1 : 0));
    }
    CHECK(kBuyPriority.front() == GoodType::Food);
}

TEST_CASE("Goods catalog: lookup by name", "[goods]") {
    GoodType g = GoodType::Food;
    REQUIRE(findGoodByName("ironOre", g));
    CHECK(g == GoodType::IronOre);
    CHECK_FALSE(findGoodByName("unobtainium", g));
    CHECK(g == GoodType::IronOre);
}

TEST_CASE("Goods catalog: price overrides are validated and reset", "[goods]") {
    CatalogGuard guard;

    setGoodPrices(GoodType::Food, 10.0, 5.0, 20.0);
    CHECK(goodDef(GoodType::Food).basePrice == Approx(10.0));
    CHECK(validateGoodCatalog());
    CHECK(basePrices()[gi(GoodType::Food)] == Approx(10.0));

    setGoodPrices(GoodType::Salt, 1.0, 2.0, 3.0);
    std::string err;
    CHECK_FALSE(validateGoodCatalog(&err));
    CHECK(err.find("salt") != std::string::npos);

    resetGoodCatalog();
    CHECK(goodDef(GoodType::Food).basePrice == Approx(1.0));
    CHECK(validateGoodCatalog());
}

TEST_CASE("Facility: efficiency curve", "[facility]") {
    Facility f;
    f.laborRequired = 10;

    f.assignedWorkers = 0;
    CHECK(f.getEfficiency(0.7) == Approx(0.0));

    f.assignedWorkers = 5;
    CHECK(f.getEfficiency(0.7) == Approx(std::pow(0.5, 0.7)));
    CHECK(f.getEfficiency(1.0) == Approx(0.5));

    f.assignedWorkers = 10;
    CHECK(f.getEfficiency(0.7) == Approx(1.0));

    f.assignedWorkers = 25;
    CHECK(f.getEfficiency(0.7) == Approx(1.0));

    f.laborRequired = 0;
    f.assignedWorkers = 0;
    CHECK(f.getEfficiency(0.7) == Approx(1.0));
}

TEST_CASE("Facility: labor required scales with host population", "[facility]") {
    const FacilityDef kiln = defaultFacilityDefs().front();
    REQUIRE(kiln.laborPerUnit == 3);

    // 1000 * 0.05 = 50 workers -> 16 whole recipe units.
    CHECK(computeLaborRequired(kiln, 1000.0) == 48);
    // Tiny counties still staff one unit.
    CHECK(computeLaborRequired(kiln, 10.0) == 3);
    CHECK(computeLaborRequired(kiln, 0.0) == 3);
}

TEST_CASE("Facility: runDay is limited by staffing, quota and input", "[facility]") {
    const FacilityDef kiln = defaultFacilityDefs().front();
    Facility f;
    f.laborRequired = 48;
    f.assignedWorkers = 48;

    SECTION("input bound") {
        f.inputBuffer[gi(GoodType::Clay)] = 10.0;
        const double units = f.runDay(kiln, 100.0, 0.7);
        CHECK(units == Approx(5.0));
        CHECK(f.inputBuffer[gi(GoodType::Clay)] == Approx(0.0));
        CHECK(f.outputBuffer[gi(GoodType::Pottery)] == Approx(5.0));
        CHECK(f.throughput == Approx(5.0));
    }

    SECTION("quota bound") {
        f.inputBuffer[gi(GoodType::Clay)] = 100.0;
        const double units = f.runDay(kiln, 2.0, 0.7);
        CHECK(units == Approx(2.0));
        CHECK(f.inputBuffer[gi(GoodType::Clay)] == Approx(96.0));
    }

    SECTION("staffing bound") {
        f.inputBuffer[gi(GoodType::Clay)] = 100.0;
        const double units = f.runDay(kiln, 100.0, 0.7);
        CHECK(units == Approx(16.0));
        CHECK(f.outputBuffer[gi(GoodType::Pottery)] == Approx(16.0));
    }

    SECTION("inactive facility does nothing") {
        f.isActive = false;
        f.inputBuffer[gi(GoodType::Clay)] = 100.0;
        CHECK(f.runDay(kiln, 100.0, 0.7) == Approx(0.0));
        CHECK(f.inputBuffer[gi(GoodType::Clay)] == Approx(100.0));
    }
}

TEST_CASE("Facility: invalid definitions are rejected", "[facility][config]") {
    FacilityDef def = defaultFacilityDefs().front();
    CHECK_NOTHROW(validateFacilityDef(def));

    SECTION("zero input amount") {
        def.inputAmount = 0.0;
        CHECK_THROWS_AS(validateFacilityDef(def), ConfigError);
    }
    SECTION("self-consuming recipe") {
        def.outputGood = def.inputGood;
        CHECK_THROWS_AS(validateFacilityDef(def), ConfigError);
    }
    SECTION("labor fraction above one") {
        def.maxLaborFraction = 1.5;
        CHECK_THROWS_AS(validateFacilityDef(def), ConfigError);
    }
    SECTION("minting is not a recipe") {
        def.outputGood = GoodType::GoldOre;
        CHECK_THROWS_AS(validateFacilityDef(def), ConfigError);
    }
}
