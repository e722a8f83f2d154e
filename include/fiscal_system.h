// fiscal_system.h
#pragma once

#include <vector>

#include "simulation_context.h"
#include "tick_system.h"

struct CountyEconomy;
struct ProvinceEconomy;
struct RealmEconomy;

// Feudal taxation and redistribution. Goods flow up as tax, crowns flow up
// as monetary tax and back down as admin wages, and tier stockpiles flow back
// down as relief.
class FiscalSystem : public ITickSystem {
public:
    explicit FiscalSystem(const SimulationConfig::Fiscal& config);

    const char* name() const override { return "Fiscal"; }
    int tickInterval() const override { return TickInterval::Daily; }
    void initialize(EconomyState& state, const MapTopology& topology) override;
    void tick(EconomyState& state, const MapTopology& topology) override;

    void resetAccumulators(EconomyState& state) const;
    void confiscatePreciousMetals(EconomyState& state, const MapTopology& topology) const;
    void collectDucalGoodsTax(EconomyState& state, const MapTopology& topology) const;
    void collectRoyalGoodsTax(EconomyState& state, const MapTopology& topology) const;
    void collectMonetaryTax(EconomyState& state, const MapTopology& topology) const;
    void mintPreciousMetals(EconomyState& state) const;
    void payAdminWages(EconomyState& state, const MapTopology& topology) const;
    void requisitionGranary(EconomyState& state, const MapTopology& topology) const;
    void distributeRoyalRelief(EconomyState& state, const MapTopology& topology) const;
    void distributeDucalRelief(EconomyState& state, const MapTopology& topology) const;

    // Crowns minted from ore at the fixed smelting yields.
    static double mintValue(double goldOre, double silverOre);

private:
    SimulationConfig::Fiscal m_config;
};

// Splits `available` across claimants in proportion to their deficits. No
// claimant receives more than its own deficit and the total never exceeds
// `available`.
std::vector<double> allocateProRata(double available, const std::vector<double>& deficits);

// max(0, need - stock) for one good.
double countyShortfall(const CountyEconomy& county, int good);
