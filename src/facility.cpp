// facility.cpp
#include "facility.h"

#include <algorithm>
#include <cmath>
#include <sstream>

std::vector<FacilityDef> defaultFacilityDefs() {
    FacilityDef kiln;
    kiln.name = "kiln";
    kiln.inputGood = GoodType::Clay;
    kiln.inputAmount = 2.0;
    kiln.outputGood = GoodType::Pottery;
    kiln.outputAmount = 1.0;
    kiln.laborPerUnit = 3;
    kiln.placementMinProductivity = 0.05;
    kiln.maxLaborFraction = 0.05;
    kiln.baselineOutput = 1.0;
    return {kiln};
}

void validateFacilityDef(const FacilityDef& def) {
    std::ostringstream oss;
    if (def.name.empty()) {
        oss << "facility definition without a name";
    } else if (!(def.inputAmount > 0.0) || !(def.outputAmount > 0.0)) {
        oss << "facility '" << def.name << "' needs positive input and output amounts";
    } else if (def.inputGood == def.outputGood) {
        oss << "facility '" << def.name << "' consumes its own output good";
    } else if (def.laborPerUnit < 0) {
        oss << "facility '" << def.name << "' has negative laborPerUnit";
    } else if (def.maxLaborFraction < 0.0 || def.maxLaborFraction > 1.0) {
        oss << "facility '" << def.name << "' has maxLaborFraction outside [0,1]";
    } else if (def.placementMinProductivity < 0.0 || def.baselineOutput < 0.0) {
        oss << "facility '" << def.name << "' has a negative threshold";
    } else if (isPreciousMetal(goodIndex(def.outputGood))) {
        oss << "facility '" << def.name << "' cannot produce a precious metal";
    }
    const std::string msg = oss.str();
    if (!msg.empty()) {
        throw ConfigError(msg);
    }
}

double Facility::getEfficiency(double alpha) const {
    if (laborRequired <= 0) return 1.0;
    if (assignedWorkers <= 0) return 0.0;

    const double ratio = static_cast<double>(assignedWorkers) / static_cast<double>(laborRequired);
    if (ratio >= 1.0) return 1.0;
    return std::pow(ratio, alpha);
}

double Facility::baseThroughput(const FacilityDef& def) const {
    if (def.laborPerUnit <= 0) {
        return def.baselineOutput / def.outputAmount;
    }
    return static_cast<double>(laborRequired) / static_cast<double>(def.laborPerUnit);
}

double Facility::getThroughput(const FacilityDef& def, double alpha) const {
    if (!isActive) return 0.0;
    return baseThroughput(def) * getEfficiency(alpha);
}

double Facility::runDay(const FacilityDef& def, double maxUnits, double alpha) {
    const int in = goodIndex(def.inputGood);
    const int out = goodIndex(def.outputGood);

    double units = getThroughput(def, alpha);
    units = std::min(units, std::max(0.0, maxUnits));
    units = std::min(units, inputBuffer[static_cast<size_t>(in)] / def.inputAmount);
    if (units < 0.0) units = 0.0;

    const double used = std::min(inputBuffer[static_cast<size_t>(in)], units * def.inputAmount);
    inputBuffer[static_cast<size_t>(in)] -= used;
    outputBuffer[static_cast<size_t>(out)] += units * def.outputAmount;
    throughput = units;
    return units;
}

int computeLaborRequired(const FacilityDef& def, double hostPopulation) {
    if (def.laborPerUnit <= 0) return 0;
    const double maxWorkers = std::max(0.0, hostPopulation) * def.maxLaborFraction;
    const int units = static_cast<int>(std::floor(maxWorkers / def.laborPerUnit));
    return std::max(1, units) * def.laborPerUnit;
}
