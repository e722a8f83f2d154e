#include "simulation_context.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readNodeValue(const toml::node_view<const toml::node>& view, T& target) {
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    readNodeValue(root[section][key], target);
}

GoodType requireGood(const std::string& name, const std::string& where) {
    GoodType g = GoodType::Food;
    if (!findGoodByName(name, g)) {
        throw ConfigError(where + ": unknown good '" + name + "'");
    }
    return g;
}

SimulationConfig::GoodPriceOverride parseGoodOverride(const toml::table& t) {
    SimulationConfig::GoodPriceOverride o{};
    readNodeValue(t["name"], o.good);
    if (o.good.empty()) {
        throw ConfigError("[[goods]] entry without a name");
    }
    const GoodDef& def = builtinGoodDef(requireGood(o.good, "[[goods]]"));
    o.basePrice = def.basePrice;
    o.minPrice = def.minPrice;
    o.maxPrice = def.maxPrice;
    readNodeValue(t["basePrice"], o.basePrice);
    readNodeValue(t["minPrice"], o.minPrice);
    readNodeValue(t["maxPrice"], o.maxPrice);
    return o;
}

FacilityDef parseFacility(const toml::table& t) {
    FacilityDef def{};
    readNodeValue(t["name"], def.name);
    if (def.name.empty()) {
        throw ConfigError("[[facility]] entry without a name");
    }
    const std::string where = "[[facility]] '" + def.name + "'";
    std::string input;
    std::string output;
    readNodeValue(t["input"], input);
    readNodeValue(t["output"], output);
    def.inputGood = requireGood(input, where);
    def.outputGood = requireGood(output, where);
    readNodeValue(t["inputAmount"], def.inputAmount);
    readNodeValue(t["outputAmount"], def.outputAmount);
    readNodeValue(t["laborPerUnit"], def.laborPerUnit);
    readNodeValue(t["placementMinProductivity"], def.placementMinProductivity);
    readNodeValue(t["maxLaborFraction"], def.maxLaborFraction);
    readNodeValue(t["baselineOutput"], def.baselineOutput);
    validateFacilityDef(def);
    return def;
}

} // namespace

SimulationContext::SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath)
    : worldSeed(seed), config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            throw ConfigError(err);
        }
    }
}

bool SimulationContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = SimulationConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "simulation", "days", config.simulation.days);
        readTomlValue(root, "simulation", "snapshotCapacity", config.simulation.snapshotCapacity);
        readTomlValue(root, "simulation", "captureSnapshots", config.simulation.captureSnapshots);
        readTomlValue(root, "simulation", "checkpointEveryDays", config.simulation.checkpointEveryDays);
        readTomlValue(root, "simulation", "echoEvents", config.simulation.echoEvents);

        readTomlValue(root, "production", "facilityEfficiencyAlpha", config.production.facilityEfficiencyAlpha);
        readTomlValue(root, "production", "satisfactionWindowDays", config.production.satisfactionWindowDays);
        readTomlValue(root, "production", "distressThreshold", config.production.distressThreshold);

        readTomlValue(root, "fiscal", "ducalTaxRate", config.fiscal.ducalTaxRate);
        readTomlValue(root, "fiscal", "royalTaxRate", config.fiscal.royalTaxRate);
        readTomlValue(root, "fiscal", "surplusThresholdDays", config.fiscal.surplusThresholdDays);
        readTomlValue(root, "fiscal", "monetaryTaxRate", config.fiscal.monetaryTaxRate);
        readTomlValue(root, "fiscal", "royalRevenueShare", config.fiscal.royalRevenueShare);
        readTomlValue(root, "fiscal", "granaryDaysBuffer", config.fiscal.granaryDaysBuffer);
        readTomlValue(root, "fiscal", "granaryFillRate", config.fiscal.granaryFillRate);
        readTomlValue(root, "fiscal", "granaryRequisitionDiscount", config.fiscal.granaryRequisitionDiscount);
        readTomlValue(root, "fiscal", "initialCountyTreasuryPerPop", config.fiscal.initialCountyTreasuryPerPop);
        readTomlValue(root, "fiscal", "initialRealmTreasury", config.fiscal.initialRealmTreasury);

        readTomlValue(root, "trade", "countyRetainDays", config.trade.countyRetainDays);
        readTomlValue(root, "trade", "crossProvinceTollRate", config.trade.crossProvinceTollRate);
        readTomlValue(root, "trade", "crossRealmTariffRate", config.trade.crossRealmTariffRate);
        readTomlValue(root, "trade", "countyCrossRealmTrade", config.trade.countyCrossRealmTrade);
        readTomlValue(root, "trade", "marketFeeRate", config.trade.marketFeeRate);
        readTomlValue(root, "trade", "marketCounty", config.trade.marketCounty);

        readTomlValue(root, "world", "realms", config.world.realms);
        readTomlValue(root, "world", "provincesPerRealm", config.world.provincesPerRealm);
        readTomlValue(root, "world", "countiesPerProvince", config.world.countiesPerProvince);
        readTomlValue(root, "world", "countyPopMin", config.world.countyPopMin);
        readTomlValue(root, "world", "countyPopMax", config.world.countyPopMax);

        if (const toml::array* goods = root["goods"].as_array()) {
            config.goodPrices.reserve(goods->size());
            for (const auto& node : *goods) {
                const toml::table* t = node.as_table();
                if (!t) {
                    throw ConfigError("[[goods]] must be an array of tables");
                }
                config.goodPrices.push_back(parseGoodOverride(*t));
            }
        }

        if (const toml::array* facilities = root["facility"].as_array()) {
            config.facilities.clear();
            config.facilities.reserve(facilities->size());
            for (const auto& node : *facilities) {
                const toml::table* t = node.as_table();
                if (!t) {
                    throw ConfigError("[[facility]] must be an array of tables");
                }
                config.facilities.push_back(parseFacility(*t));
            }
        }

        config.simulation.days = std::max(0, config.simulation.days);
        config.simulation.snapshotCapacity = std::max(1, config.simulation.snapshotCapacity);
        config.simulation.checkpointEveryDays = std::max(1, config.simulation.checkpointEveryDays);
        config.production.facilityEfficiencyAlpha = std::clamp(config.production.facilityEfficiencyAlpha, 0.0, 1.0);
        config.production.satisfactionWindowDays = std::max(1.0, config.production.satisfactionWindowDays);
        config.fiscal.ducalTaxRate = std::clamp(config.fiscal.ducalTaxRate, 0.0, 1.0);
        config.fiscal.royalTaxRate = std::clamp(config.fiscal.royalTaxRate, 0.0, 1.0);
        config.fiscal.monetaryTaxRate = std::clamp(config.fiscal.monetaryTaxRate, 0.0, 1.0);
        config.fiscal.royalRevenueShare = std::clamp(config.fiscal.royalRevenueShare, 0.0, 1.0);
        config.fiscal.granaryFillRate = std::clamp(config.fiscal.granaryFillRate, 0.0, 1.0);
        config.trade.marketFeeRate = std::clamp(config.trade.marketFeeRate, 0.0, 1.0);
        config.world.realms = std::max(1, config.world.realms);
        config.world.provincesPerRealm = std::max(1, config.world.provincesPerRealm);
        config.world.countiesPerProvince = std::max(1, config.world.countiesPerProvince);
        if (config.world.countyPopMax < config.world.countyPopMin) {
            std::swap(config.world.countyPopMax, config.world.countyPopMin);
        }
        config.world.countyPopMin = std::max(0.0, config.world.countyPopMin);

        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    return false;
}

void SimulationContext::applyGoodCatalog() const {
    resetGoodCatalog();
    for (const SimulationConfig::GoodPriceOverride& o : config.goodPrices) {
        GoodType g = GoodType::Food;
        if (!findGoodByName(o.good, g)) {
            throw ConfigError("unknown good '" + o.good + "'");
        }
        setGoodPrices(g, o.basePrice, o.minPrice, o.maxPrice);
    }
    std::string err;
    if (!validateGoodCatalog(&err)) {
        throw ConfigError(err);
    }
}

std::string SimulationContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

std::uint64_t SimulationContext::mix64(std::uint64_t x) {
    // SplitMix64 finalizer.
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

double SimulationContext::u01FromU64(std::uint64_t x) {
    // 53 random bits to [0,1).
    const std::uint64_t mantissa = (x >> 11);
    return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0);
}
