// facility.h
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "goods.h"

// Thrown by strict loaders when a definition cannot be used. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Recipe: inputAmount of inputGood -> outputAmount of outputGood per recipe unit.
// One recipe unit per day takes laborPerUnit workers.
struct FacilityDef {
    std::string name;
    GoodType inputGood = GoodType::Clay;
    double inputAmount = 0.0;
    GoodType outputGood = GoodType::Pottery;
    double outputAmount = 0.0;
    int laborPerUnit = 1;
    double placementMinProductivity = 0.0; // of inputGood in the host county
    double maxLaborFraction = 0.0;         // share of host population it may employ
    double baselineOutput = 0.0;           // output floor the quota planner keeps
};

std::vector<FacilityDef> defaultFacilityDefs();

// Throws ConfigError when the recipe cannot run.
void validateFacilityDef(const FacilityDef& def);

struct Facility {
    int id = 0;
    int defIndex = 0;
    int cellId = 0;
    int countyIndex = 0;
    int laborRequired = 0;
    int assignedWorkers = 0;
    GoodArray inputBuffer = zeroGoods();
    GoodArray outputBuffer = zeroGoods();
    bool isActive = true;
    double throughput = 0.0; // recipe units processed last tick

    // (w/L)^alpha below full staffing, 1 at or above it.
    double getEfficiency(double alpha = 0.7) const;
    // Recipe units per day at current staffing, before input limits.
    double getThroughput(const FacilityDef& def, double alpha = 0.7) const;
    double baseThroughput(const FacilityDef& def) const;

    // Runs one day of the recipe against the buffers. Returns units processed.
    double runDay(const FacilityDef& def, double maxUnits, double alpha = 0.7);
};

// Workforce a facility needs for full capacity in a county of this size.
int computeLaborRequired(const FacilityDef& def, double hostPopulation);
