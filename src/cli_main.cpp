#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "economy_state.h"
#include "scenario.h"
#include "simulation_context.h"
#include "simulation_runner.h"

namespace {

struct RunOptions {
    std::uint64_t seed = 1;
    std::string configPath = "data/econ_config.toml";
    int days = -1;                // -1 means "use config value"
    int checkpointEveryDays = -1; // -1 means "use config value"
    std::string outDir;
    bool echoEvents = false;
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "feudal_econ_cli")
              << " [--seed N] [--config path] [--days N]\n"
              << "       [--checkpointEveryDays N] [--outDir path] [--echoEvents]\n"
              << "Env: FEUDAL_ECON_TRACE_DAY=N prints the state hash after each stage of day N.\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return false;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--days") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.days)) return false;
        } else if (arg.rfind("--days=", 0) == 0) {
            if (!parseInt(arg.substr(7), opt.days)) return false;
        } else if (arg == "--checkpointEveryDays") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.checkpointEveryDays)) return false;
        } else if (arg.rfind("--checkpointEveryDays=", 0) == 0) {
            if (!parseInt(arg.substr(22), opt.checkpointEveryDays)) return false;
        } else if (arg == "--outDir") {
            if (!requireValue(opt.outDir)) return false;
        } else if (arg.rfind("--outDir=", 0) == 0) {
            opt.outDir = arg.substr(9);
        } else if (arg == "--echoEvents") {
            opt.echoEvents = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::string csvEscape(const std::string& input) {
    bool needsQuotes = false;
    for (char c : input) {
        if (c == '"' || c == ',' || c == '\n' || c == '\r') {
            needsQuotes = true;
            break;
        }
    }
    if (!needsQuotes) {
        return input;
    }
    std::string out;
    out.reserve(input.size() + 2);
    out.push_back('"');
    for (char c : input) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string jsonEscape(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

// Stocks, stockpiles and treasuries must never go negative.
bool checkInvariants(const EconomyState& state, std::string* error) {
    std::ostringstream oss;
    for (const CountyEconomy& ce : state.counties) {
        if (ce.treasury < 0.0) oss << "county " << ce.countyId << " treasury " << ce.treasury << "; ";
        for (int g = 0; g < kGoodCount; ++g) {
            if (ce.stock[static_cast<size_t>(g)] < 0.0) {
                oss << "county " << ce.countyId << " stock of " << goodDef(g).name << " negative; ";
            }
        }
    }
    for (const ProvinceEconomy& pe : state.provinces) {
        if (pe.treasury < 0.0) oss << "province " << pe.provinceId << " treasury " << pe.treasury << "; ";
        for (double v : pe.stockpile) {
            if (v < 0.0) oss << "province " << pe.provinceId << " stockpile negative; ";
        }
    }
    for (const RealmEconomy& re : state.realms) {
        if (re.treasury < 0.0) oss << "realm " << re.realmId << " treasury " << re.treasury << "; ";
        for (double v : re.stockpile) {
            if (v < 0.0) oss << "realm " << re.realmId << " stockpile negative; ";
        }
    }
    const std::string msg = oss.str();
    if (!msg.empty()) {
        if (error) *error = msg;
        return false;
    }
    return true;
}

void writeSnapshotHeader(std::ostream& out) {
    out << "day,population,food_stock,food_production,food_consumption,food_unmet,"
           "counties_surplus,counties_deficit,counties_starving,min_county_food,max_county_food,"
           "median_food_productivity,county_treasury,province_treasury,realm_treasury,domestic_treasury,"
           "ducal_tax,royal_tax,ducal_relief,royal_relief,monetary_tax_province,monetary_tax_realm,"
           "province_admin,realm_admin,granary_requisitioned,granary_crowns,"
           "gold_minted,silver_minted,crowns_minted,"
           "trade_spending,trade_revenue,county_trade_spending,county_trade_revenue,tolls,tariffs,market_fees,"
           "avg_satisfaction,min_satisfaction,max_satisfaction,counties_distress";
    for (GoodType g : kAllGoods) {
        out << ",price_" << goodName(g);
    }
    for (GoodType g : kAllGoods) {
        out << ",stock_" << goodName(g);
    }
    out << "\n";
}

void writeSnapshotRow(std::ostream& out, const EconomySnapshot& s) {
    out << s.day << "," << s.totalPopulation << ","
        << s.totalFoodStock << "," << s.totalFoodProduction << "," << s.totalFoodConsumption << ","
        << s.totalFoodUnmet << ","
        << s.countiesInSurplus << "," << s.countiesInDeficit << "," << s.countiesStarving << ","
        << s.minCountyFoodStock << "," << s.maxCountyFoodStock << "," << s.medianFoodProductivity << ","
        << s.totalCountyTreasury << "," << s.totalProvinceTreasury << "," << s.totalRealmTreasury << ","
        << s.totalDomesticTreasury << ","
        << s.totalDucalTax << "," << s.totalRoyalTax << "," << s.totalDucalRelief << "," << s.totalRoyalRelief << ","
        << s.totalMonetaryTaxToProvince << "," << s.totalMonetaryTaxToRealm << ","
        << s.totalProvinceAdminCost << "," << s.totalRealmAdminCost << ","
        << s.totalGranaryRequisitioned << "," << s.totalGranaryCrownsSpent << ","
        << s.totalGoldMinted << "," << s.totalSilverMinted << "," << s.totalCrownsMinted << ","
        << s.totalTradeSpending << "," << s.totalTradeRevenue << ","
        << s.totalCountyTradeSpending << "," << s.totalCountyTradeRevenue << ","
        << s.totalTradeTolls << "," << s.totalTradeTariffs << "," << s.totalMarketFees << ","
        << s.avgBasicSatisfaction << "," << s.minBasicSatisfaction << "," << s.maxBasicSatisfaction << ","
        << s.countiesInDistress;
    for (GoodType g : kAllGoods) {
        out << "," << s.marketPrices[static_cast<size_t>(goodIndex(g))];
    }
    for (GoodType g : kAllGoods) {
        out << "," << s.totalStock[static_cast<size_t>(goodIndex(g))];
    }
    out << "\n";
}

void writeRealmRows(std::ostream& out, const EconomyState& state, const MapTopology& topology) {
    for (size_t r = 0; r < state.realms.size(); ++r) {
        const RealmEconomy& re = state.realms[r];
        const std::string& name = topology.getRealms()[r].name;
        double imports = 0.0;
        double exports = 0.0;
        for (int g = 0; g < kGoodCount; ++g) {
            imports += re.tradeImports[static_cast<size_t>(g)];
            exports += re.tradeExports[static_cast<size_t>(g)];
        }
        out << state.day << "," << re.realmId << "," << csvEscape(name) << ","
            << state.realmPopulation[r] << "," << re.treasury << ","
            << re.stockpile[static_cast<size_t>(goodIndex(GoodType::Food))] << ","
            << re.deficit[static_cast<size_t>(goodIndex(GoodType::Food))] << ","
            << imports << "," << exports << ","
            << re.tradeSpending << "," << re.tradeRevenue << "," << re.tradeTariffsCollected << ","
            << re.monetaryTaxCollected << "," << re.adminCrownsCost << "," << re.crownsMinted << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }

    SimulationContext ctx(opt.seed);
    std::string configError;
    if (!ctx.loadConfig(opt.configPath, &configError)) {
        std::cerr << "[Config] " << configError << "\n";
        return 1;
    }
    try {
        ctx.applyGoodCatalog();
    } catch (const ConfigError& err) {
        std::cerr << "[Config] " << err.what() << "\n";
        return 1;
    }

    const int days = (opt.days >= 0) ? opt.days : ctx.config.simulation.days;
    int checkpointEvery = (opt.checkpointEveryDays > 0) ? opt.checkpointEveryDays : ctx.config.simulation.checkpointEveryDays;
    if (checkpointEvery <= 0) {
        checkpointEvery = 30;
    }
    if (opt.echoEvents) {
        ctx.config.simulation.echoEvents = true;
    }

    const MapTopology topology = buildSyntheticTopology(ctx);
    std::string topologyError;
    if (!topology.validate(&topologyError)) {
        std::cerr << "Error: invalid topology: " << topologyError << "\n";
        return 1;
    }

    EconomyState state = initializeEconomy(topology, ctx.config);
    SimulationRunner runner(state, topology);
    for (auto& system : makeDefaultPipeline(ctx.config)) {
        runner.addSystem(std::move(system));
    }
    runner.setCaptureSnapshots(ctx.config.simulation.captureSnapshots, ctx.config.production.distressThreshold);
    runner.initialize();

    if (opt.outDir.empty()) {
        std::ostringstream oss;
        oss << "out/econ_runs/seed_" << opt.seed;
        opt.outDir = oss.str();
    }
    std::error_code dirError;
    std::filesystem::create_directories(opt.outDir, dirError);
    if (dirError) {
        std::cerr << "Could not create " << opt.outDir << ": " << dirError.message() << "\n";
        return 2;
    }

    const std::filesystem::path snapshotPath = std::filesystem::path(opt.outDir) / "snapshots.csv";
    const std::filesystem::path realmPath = std::filesystem::path(opt.outDir) / "realms.csv";
    const std::filesystem::path eventPath = std::filesystem::path(opt.outDir) / "events.log";
    const std::filesystem::path metaPath = std::filesystem::path(opt.outDir) / "run_meta.json";

    std::ofstream snapshotCsv(snapshotPath);
    std::ofstream realmCsv(realmPath);
    if (!snapshotCsv || !realmCsv) {
        std::cerr << "Could not open outputs in " << opt.outDir << "\n";
        return 2;
    }
    snapshotCsv << std::setprecision(10);
    realmCsv << std::setprecision(10);
    writeSnapshotHeader(snapshotCsv);
    realmCsv << "day,realm_id,realm_name,population,treasury,food_stockpile,food_deficit,"
                "imports,exports,trade_spending,trade_revenue,tariffs,monetary_tax,admin_cost,crowns_minted\n";

    bool invariantsOk = true;
    std::string invariantError;
    for (int d = 1; d <= days; ++d) {
        runner.runDay();
        if (invariantsOk && !checkInvariants(state, &invariantError)) {
            invariantsOk = false;
            std::cerr << "[econ] invariant broken on day " << state.day << ": " << invariantError << "\n";
        }
        if (state.day % checkpointEvery == 0 || d == days) {
            const EconomySnapshot* latest = state.latestSnapshot();
            const EconomySnapshot snap = (latest && latest->day == state.day)
                ? *latest
                : buildSnapshot(state, state.day, ctx.config.production.distressThreshold);
            writeSnapshotRow(snapshotCsv, snap);
            writeRealmRows(realmCsv, state, topology);
            std::cout << "[econ] day " << state.day
                      << " pop=" << std::fixed << std::setprecision(0) << snap.totalPopulation
                      << " food=" << snap.totalFoodStock
                      << " treasury=" << snap.totalDomesticTreasury
                      << std::setprecision(3) << " satisfaction=" << snap.avgBasicSatisfaction
                      << " distress=" << snap.countiesInDistress
                      << std::defaultfloat << "\n";
        }
    }

    {
        std::ofstream events(eventPath);
        for (const std::string& e : state.log.getEvents()) {
            events << e << "\n";
        }
    }

    const std::uint64_t finalHash = computeStateHash(state);
    {
        std::ofstream meta(metaPath);
        meta << "{\n";
        meta << "  \"seed\": " << opt.seed << ",\n";
        meta << "  \"config_path\": \"" << jsonEscape(ctx.configPath) << "\",\n";
        meta << "  \"config_hash\": \"" << jsonEscape(ctx.configHash) << "\",\n";
        meta << "  \"days\": " << days << ",\n";
        meta << "  \"counties\": " << state.counties.size() << ",\n";
        meta << "  \"provinces\": " << state.provinces.size() << ",\n";
        meta << "  \"realms\": " << state.realms.size() << ",\n";
        meta << "  \"facilities\": " << state.facilities.size() << ",\n";
        meta << "  \"events_raised\": " << state.log.totalRaised() << ",\n";
        meta << "  \"final_state_hash\": \"" << finalHash << "\"\n";
        meta << "}\n";
    }

    std::cout << "Wrote " << snapshotPath.string() << ", " << realmPath.string()
              << ", " << eventPath.string() << ", " << metaPath.string() << "\n";
    std::cout << "Final state hash: " << finalHash << "\n";
    if (!invariantsOk) {
        std::cerr << "Invariant failure: " << invariantError << "\n";
        return 3;
    }
    return 0;
}
