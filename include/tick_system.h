// tick_system.h
#pragma once

class MapTopology;
struct EconomyState;

namespace TickInterval {
constexpr int Daily = 1;
constexpr int Weekly = 7;
constexpr int Monthly = 30;
constexpr int Yearly = 365;
} // namespace TickInterval

// One stage of the economy pipeline. Stages communicate only through EconomyState.
class ITickSystem {
public:
    virtual ~ITickSystem() = default;

    virtual const char* name() const = 0;
    virtual int tickInterval() const = 0;
    virtual void initialize(EconomyState& state, const MapTopology& topology) = 0;
    virtual void tick(EconomyState& state, const MapTopology& topology) = 0;
};
