#pragma once

#include "prima/country.h"
#include "prima/sector.h"

#include "infra/span.h"

#include <string>
#include <vector>

namespace prima {

// One value per hour of the year
using HourlySeries = std::vector<double>;

// Hourly total load of every country
class CountryLoadTable
{
public:
    struct Entry
    {
        Entry() = default;
        Entry(Country c, HourlySeries s)
        : country(std::move(c))
        , series(std::move(s))
        {
        }

        Country country;
        HourlySeries series;
    };

    CountryLoadTable() = default;
    CountryLoadTable(size_t hourCount, std::vector<Entry> entries);

    size_t hour_count() const noexcept;
    std::span<const Entry> entries() const noexcept;

    const HourlySeries* find(const Country& country) const noexcept;
    const HourlySeries& series(const Country& country) const;

private:
    size_t _hourCount = 0;
    std::vector<Entry> _entries;
};

// Hourly series keyed on country and a second key
// The key is a sector name for the sectoral load and a land use category or RES for the load per land use unit
class HourlyLoadTable
{
public:
    struct Entry
    {
        Entry() = default;
        Entry(Country c, std::string_view k, HourlySeries s)
        : country(std::move(c))
        , key(k)
        , series(std::move(s))
        {
        }

        Country country;
        std::string key;
        HourlySeries series;
    };

    HourlyLoadTable() = default;
    // The entries are sorted on country, the key order of the entries of a country is preserved
    HourlyLoadTable(size_t hourCount, std::vector<Entry> entries);

    size_t hour_count() const noexcept;
    std::span<const Entry> entries() const noexcept;
    std::vector<Country> countries() const;
    bool contains(const Country& country) const noexcept;

    const HourlySeries* find(const Country& country, std::string_view key) const noexcept;
    const HourlySeries& series(const Country& country, std::string_view key) const;

    // Sum of the series over all the hours
    double total(const Country& country, std::string_view key) const;

private:
    size_t _hourCount = 0;
    std::vector<Entry> _entries;
};

struct YearlySectorLoad
{
    YearlySectorLoad() = default;
    YearlySectorLoad(Country c, Sector s, double l)
    : country(std::move(c))
    , sector(std::move(s))
    , load(l)
    {
    }

    Country country;
    Sector sector;
    double load = 0.0; // MWh
};

}
