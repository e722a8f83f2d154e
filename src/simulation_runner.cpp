#include "simulation_runner.h"

#include "county_trade_system.h"
#include "economy_state.h"
#include "facility_production_system.h"
#include "fiscal_system.h"
#include "inter_realm_trade_system.h"
#include "local_economy_system.h"
#include "simulation_context.h"
#include "spoilage_system.h"

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace {

std::uint64_t mixHash(std::uint64_t h, std::uint64_t v) {
    h ^= v + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
    return h;
}

std::uint64_t hashDouble(double v, double scale = 1.0e6) {
    if (!std::isfinite(v)) {
        return 0xFFFFFFFFFFFFFFFFull;
    }
    const double q = std::round(v * scale) / scale;
    return static_cast<std::uint64_t>(static_cast<std::int64_t>(q * scale));
}

std::uint64_t hashGoods(std::uint64_t h, const GoodArray& goods, double scale = 1.0e3) {
    for (double v : goods) {
        h = mixHash(h, hashDouble(v, scale));
    }
    return h;
}

int determinismTraceDay() {
    static int day = []() {
        const char* v = std::getenv("FEUDAL_ECON_TRACE_DAY");
        if (!v || !*v) return std::numeric_limits<int>::max();
        return std::atoi(v);
    }();
    return day;
}

void maybeTraceDeterminismStage(const char* stage, const EconomyState& state) {
    if (state.day != determinismTraceDay()) {
        return;
    }
    const std::uint64_t h = computeStateHash(state);
    std::cout << "[det-trace] day=" << state.day << " stage=" << stage << " hash=" << h << std::endl;
}

} // namespace

std::uint64_t computeStateHash(const EconomyState& state) {
    std::uint64_t h = 0xC0DEC0DE12345678ull;
    h = mixHash(h, static_cast<std::uint64_t>(state.day));
    h = mixHash(h, static_cast<std::uint64_t>(state.counties.size()));
    for (const CountyEconomy& ce : state.counties) {
        h = hashGoods(h, ce.stock);
        h = hashGoods(h, ce.production);
        h = hashGoods(h, ce.consumption);
        h = hashGoods(h, ce.unmetNeed);
        h = hashGoods(h, ce.facilityQuota);
        h = mixHash(h, hashDouble(ce.basicSatisfaction, 1.0e6));
        h = mixHash(h, hashDouble(ce.treasury, 1.0e3));
        h = mixHash(h, static_cast<std::uint64_t>(ce.facilityWorkers));
    }
    for (const ProvinceEconomy& pe : state.provinces) {
        h = hashGoods(h, pe.stockpile);
        h = mixHash(h, hashDouble(pe.treasury, 1.0e3));
    }
    for (const RealmEconomy& re : state.realms) {
        h = hashGoods(h, re.stockpile);
        h = hashGoods(h, re.deficit);
        h = mixHash(h, hashDouble(re.treasury, 1.0e3));
    }
    for (const Facility& f : state.facilities) {
        h = mixHash(h, static_cast<std::uint64_t>(f.assignedWorkers));
        h = mixHash(h, hashDouble(f.throughput, 1.0e6));
        h = hashGoods(h, f.inputBuffer);
    }
    h = hashGoods(h, state.marketPrices, 1.0e6);
    return h;
}

SimulationRunner::SimulationRunner(EconomyState& state, const MapTopology& topology)
    : m_state(state),
      m_topology(topology),
      m_initialized(false),
      m_captureSnapshots(true),
      m_distressThreshold(0.5) {}

void SimulationRunner::addSystem(std::unique_ptr<ITickSystem> system) {
    if (system) {
        m_systems.push_back(std::move(system));
        m_initialized = false;
    }
}

void SimulationRunner::initialize() {
    for (const auto& system : m_systems) {
        system->initialize(m_state, m_topology);
    }
    m_initialized = true;
}

void SimulationRunner::setCaptureSnapshots(bool capture, double distressThreshold) {
    m_captureSnapshots = capture;
    m_distressThreshold = distressThreshold;
}

void SimulationRunner::runDay() {
    if (!m_initialized) {
        initialize();
    }
    ++m_state.day;
    maybeTraceDeterminismStage("start", m_state);
    for (const auto& system : m_systems) {
        const int interval = system->tickInterval();
        if (interval <= 0 || m_state.day % interval != 0) continue;
        system->tick(m_state, m_topology);
        maybeTraceDeterminismStage(system->name(), m_state);
    }
    if (m_captureSnapshots) {
        m_state.appendSnapshot(buildSnapshot(m_state, m_state.day, m_distressThreshold));
    }
}

void SimulationRunner::runDays(int days) {
    for (int i = 0; i < days; ++i) {
        runDay();
    }
}

std::vector<std::unique_ptr<ITickSystem>> makeDefaultPipeline(const SimulationConfig& config) {
    std::vector<std::unique_ptr<ITickSystem>> systems;
    systems.push_back(std::make_unique<LocalEconomySystem>(config.production));
    systems.push_back(std::make_unique<FacilityProductionSystem>(config.production));
    systems.push_back(std::make_unique<FiscalSystem>(config.fiscal));
    systems.push_back(std::make_unique<CountyTradeSystem>(config.trade));
    systems.push_back(std::make_unique<FacilityQuotaSystem>());
    systems.push_back(std::make_unique<InterRealmTradeSystem>());
    systems.push_back(std::make_unique<SpoilageSystem>());
    return systems;
}
