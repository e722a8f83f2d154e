#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "facility.h"

struct SimulationConfig {
    struct GoodPriceOverride {
        std::string good;
        double basePrice = 0.0;
        double minPrice = 0.0;
        double maxPrice = 0.0;
    };

    struct Simulation {
        int days = 365;
        int snapshotCapacity = 3650;
        bool captureSnapshots = true;
        int checkpointEveryDays = 30;
        bool echoEvents = false;
    } simulation{};

    struct Production {
        double facilityEfficiencyAlpha = 0.7;
        double satisfactionWindowDays = 30.0;
        double distressThreshold = 0.5;
    } production{};

    struct Fiscal {
        double ducalTaxRate = 0.20;
        double royalTaxRate = 0.20;
        double surplusThresholdDays = 1.0;
        double monetaryTaxRate = 0.013;
        double royalRevenueShare = 0.40;
        double granaryDaysBuffer = 7.0;
        double granaryFillRate = 0.05;
        double granaryRequisitionDiscount = 0.60;
        double initialCountyTreasuryPerPop = 1.0;
        double initialRealmTreasury = 0.0;
    } fiscal{};

    struct Trade {
        double countyRetainDays = 1.0;
        double crossProvinceTollRate = 0.05;
        double crossRealmTariffRate = 0.10;
        bool countyCrossRealmTrade = true;
        double marketFeeRate = 0.02; // paid by buyers to the market county
        int marketCounty = -1;       // county index; -1 picks the most populous
    } trade{};

    // Synthetic topology used by the headless CLI.
    struct World {
        int realms = 3;
        int provincesPerRealm = 3;
        int countiesPerProvince = 4;
        double countyPopMin = 500.0;
        double countyPopMax = 5000.0;
    } world{};

    std::vector<GoodPriceOverride> goodPrices;
    std::vector<FacilityDef> facilities = defaultFacilityDefs();
};

struct SimulationContext {
    std::uint64_t worldSeed = 0;
    SimulationConfig config;
    std::string configPath;
    std::string configHash;

    // Throws ConfigError when a non-empty config path cannot be loaded.
    explicit SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath = "");

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);

    // Resets the process-wide goods catalog, applies this config's price
    // overrides and validates it. The last context applied wins. Throws ConfigError.
    void applyGoodCatalog() const;

    static std::uint64_t mix64(std::uint64_t x);
    static double u01FromU64(std::uint64_t x);
};
