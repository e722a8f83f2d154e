// map_topology.cpp
#include "map_topology.h"

#include <sstream>
#include <utility>

namespace {

const std::vector<int> kEmpty;

bool inRange(int index, size_t size) {
    return index >= 0 && static_cast<size_t>(index) < size;
}

} // namespace

MapTopology::MapTopology(std::vector<CountyInfo> counties,
                         std::vector<ProvinceInfo> provinces,
                         std::vector<RealmInfo> realms)
    : m_counties(std::move(counties)),
      m_provinces(std::move(provinces)),
      m_realms(std::move(realms)) {
    rebuildLookups();
}

void MapTopology::rebuildLookups() {
    m_provinceCounties.assign(m_provinces.size(), {});
    m_realmProvinces.assign(m_realms.size(), {});
    m_realmCounties.assign(m_realms.size(), {});
    m_countyToRealm.assign(m_counties.size(), -1);

    for (size_t p = 0; p < m_provinces.size(); ++p) {
        const int r = m_provinces[p].realmIndex;
        if (inRange(r, m_realms.size())) {
            m_realmProvinces[static_cast<size_t>(r)].push_back(static_cast<int>(p));
        }
    }
    for (size_t c = 0; c < m_counties.size(); ++c) {
        const int p = m_counties[c].provinceIndex;
        if (!inRange(p, m_provinces.size())) continue;
        m_provinceCounties[static_cast<size_t>(p)].push_back(static_cast<int>(c));
        const int r = m_provinces[static_cast<size_t>(p)].realmIndex;
        if (inRange(r, m_realms.size())) {
            m_realmCounties[static_cast<size_t>(r)].push_back(static_cast<int>(c));
            m_countyToRealm[c] = r;
        }
    }
}

bool MapTopology::validate(std::string* errorMessage) const {
    std::ostringstream oss;
    for (size_t c = 0; c < m_counties.size() && oss.tellp() == 0; ++c) {
        const CountyInfo& county = m_counties[c];
        if (!inRange(county.provinceIndex, m_provinces.size())) {
            oss << "county " << county.id << " references missing province index " << county.provinceIndex;
        } else if (county.population < 0.0) {
            oss << "county " << county.id << " has negative population";
        } else {
            for (int g = 0; g < kGoodCount; ++g) {
                if (county.productivity[static_cast<size_t>(g)] < 0.0) {
                    oss << "county " << county.id << " has negative productivity for "
                        << goodDef(g).name;
                    break;
                }
            }
        }
    }
    for (size_t p = 0; p < m_provinces.size() && oss.tellp() == 0; ++p) {
        if (!inRange(m_provinces[p].realmIndex, m_realms.size())) {
            oss << "province " << m_provinces[p].id << " references missing realm index "
                << m_provinces[p].realmIndex;
        }
    }
    const std::string msg = oss.str();
    if (!msg.empty()) {
        if (errorMessage) *errorMessage = msg;
        return false;
    }
    return true;
}

const std::vector<int>& MapTopology::countiesOfProvince(int provinceIndex) const {
    if (!inRange(provinceIndex, m_provinceCounties.size())) return kEmpty;
    return m_provinceCounties[static_cast<size_t>(provinceIndex)];
}

const std::vector<int>& MapTopology::provincesOfRealm(int realmIndex) const {
    if (!inRange(realmIndex, m_realmProvinces.size())) return kEmpty;
    return m_realmProvinces[static_cast<size_t>(realmIndex)];
}

const std::vector<int>& MapTopology::countiesOfRealm(int realmIndex) const {
    if (!inRange(realmIndex, m_realmCounties.size())) return kEmpty;
    return m_realmCounties[static_cast<size_t>(realmIndex)];
}

int MapTopology::provinceOfCounty(int countyIndex) const {
    if (!inRange(countyIndex, m_counties.size())) return -1;
    return m_counties[static_cast<size_t>(countyIndex)].provinceIndex;
}

int MapTopology::realmOfCounty(int countyIndex) const {
    if (!inRange(countyIndex, m_countyToRealm.size())) return -1;
    return m_countyToRealm[static_cast<size_t>(countyIndex)];
}

int MapTopology::realmOfProvince(int provinceIndex) const {
    if (!inRange(provinceIndex, m_provinces.size())) return -1;
    return m_provinces[static_cast<size_t>(provinceIndex)].realmIndex;
}
