// map_topology.h
#pragma once

#include <string>
#include <vector>

#include "goods.h"

struct CountyInfo {
    int id = 0;
    int provinceIndex = 0;
    int seatCellId = 0;
    double population = 0.0;
    GoodArray productivity = zeroGoods(); // per capita per day, from local biome
};

struct ProvinceInfo {
    int id = 0;
    int realmIndex = 0;
    std::string name;
};

struct RealmInfo {
    int id = 0;
    std::string name;
};

// Read-only county -> province -> realm membership. Indices into the vectors are
// the arena indices used by EconomyState.
class MapTopology {
public:
    MapTopology() = default;
    MapTopology(std::vector<CountyInfo> counties,
                std::vector<ProvinceInfo> provinces,
                std::vector<RealmInfo> realms);

    bool validate(std::string* errorMessage = nullptr) const;

    const std::vector<CountyInfo>& getCounties() const { return m_counties; }
    const std::vector<ProvinceInfo>& getProvinces() const { return m_provinces; }
    const std::vector<RealmInfo>& getRealms() const { return m_realms; }

    int countyCount() const { return static_cast<int>(m_counties.size()); }
    int provinceCount() const { return static_cast<int>(m_provinces.size()); }
    int realmCount() const { return static_cast<int>(m_realms.size()); }

    const std::vector<int>& countiesOfProvince(int provinceIndex) const;
    const std::vector<int>& provincesOfRealm(int realmIndex) const;
    const std::vector<int>& countiesOfRealm(int realmIndex) const;
    int provinceOfCounty(int countyIndex) const;
    int realmOfCounty(int countyIndex) const;
    int realmOfProvince(int provinceIndex) const;

private:
    std::vector<CountyInfo> m_counties;
    std::vector<ProvinceInfo> m_provinces;
    std::vector<RealmInfo> m_realms;

    std::vector<std::vector<int>> m_provinceCounties;
    std::vector<std::vector<int>> m_realmProvinces;
    std::vector<std::vector<int>> m_realmCounties;
    std::vector<int> m_countyToRealm;

    void rebuildLookups();
};
