#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "tick_system.h"

class MapTopology;
struct EconomyState;
struct SimulationConfig;

// Authoritative daily step shared by the CLI and the tests. Systems run in the
// order they were added; stages communicate only through EconomyState.
class SimulationRunner {
public:
    SimulationRunner(EconomyState& state, const MapTopology& topology);

    void addSystem(std::unique_ptr<ITickSystem> system);

    // Calls initialize on every system once. runDay initializes lazily.
    void initialize();
    void runDay();
    void runDays(int days);

    void setCaptureSnapshots(bool capture, double distressThreshold = 0.5);

private:
    EconomyState& m_state;
    const MapTopology& m_topology;
    std::vector<std::unique_ptr<ITickSystem>> m_systems;
    bool m_initialized;
    bool m_captureSnapshots;
    double m_distressThreshold;
};

// LocalEconomy, FacilityProduction, Fiscal, CountyTrade, FacilityQuota,
// InterRealmTrade, Spoilage.
std::vector<std::unique_ptr<ITickSystem>> makeDefaultPipeline(const SimulationConfig& config);

// Order-sensitive hash of all tier records and facilities with quantized doubles.
std::uint64_t computeStateHash(const EconomyState& state);
