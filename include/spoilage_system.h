// spoilage_system.h
#pragma once

#include "goods.h"
#include "tick_system.h"

// Monthly decay of perishable goods held anywhere in the hierarchy.
class SpoilageSystem : public ITickSystem {
public:
    const char* name() const override { return "Spoilage"; }
    int tickInterval() const override { return TickInterval::Monthly; }
    void initialize(EconomyState& state, const MapTopology& topology) override;
    void tick(EconomyState& state, const MapTopology& topology) override;

    // Fraction of each good that survives one interval.
    const GoodArray& retention() const { return m_retention; }

private:
    GoodArray m_retention = zeroGoods();
};
