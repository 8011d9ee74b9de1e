#include "prima/loadtables.h"

#include "infra/exception.h"

#include <algorithm>
#include <numeric>

namespace prima {

using namespace inf;

CountryLoadTable::CountryLoadTable(size_t hourCount, std::vector<Entry> entries)
: _hourCount(hourCount)
, _entries(std::move(entries))
{
    std::sort(_entries.begin(), _entries.end(), [](const Entry& lhs, const Entry& rhs) {
        return lhs.country < rhs.country;
    });

    for (size_t i = 0; i < _entries.size(); ++i) {
        if (_entries[i].series.size() != _hourCount) {
            throw RuntimeError("Load series of {} contains {} values, expected {}", _entries[i].country, _entries[i].series.size(), _hourCount);
        }

        if (i > 0 && _entries[i - 1].country == _entries[i].country) {
            throw RuntimeError("Duplicate load series for country {}", _entries[i].country);
        }
    }
}

size_t CountryLoadTable::hour_count() const noexcept
{
    return _hourCount;
}

std::span<const CountryLoadTable::Entry> CountryLoadTable::entries() const noexcept
{
    return _entries;
}

const HourlySeries* CountryLoadTable::find(const Country& country) const noexcept
{
    auto iter = std::lower_bound(_entries.begin(), _entries.end(), country, [](const Entry& entry, const Country& c) {
        return entry.country < c;
    });

    if (iter != _entries.end() && iter->country == country) {
        return &iter->series;
    }

    return nullptr;
}

const HourlySeries& CountryLoadTable::series(const Country& country) const
{
    if (const auto* series = find(country); series != nullptr) {
        return *series;
    }

    throw RuntimeError("No load series available for country {}", country);
}

HourlyLoadTable::HourlyLoadTable(size_t hourCount, std::vector<Entry> entries)
: _hourCount(hourCount)
, _entries(std::move(entries))
{
    std::stable_sort(_entries.begin(), _entries.end(), [](const Entry& lhs, const Entry& rhs) {
        return lhs.country < rhs.country;
    });

    for (auto iter = _entries.begin(); iter != _entries.end(); ++iter) {
        if (iter->series.size() != _hourCount) {
            throw RuntimeError("Load series of {} {} contains {} values, expected {}", iter->country, iter->key, iter->series.size(), _hourCount);
        }

        auto duplicate = std::find_if(_entries.begin(), iter, [&](const Entry& entry) {
            return entry.country == iter->country && entry.key == iter->key;
        });

        if (duplicate != iter) {
            throw RuntimeError("Duplicate load series for {} {}", iter->country, iter->key);
        }
    }
}

size_t HourlyLoadTable::hour_count() const noexcept
{
    return _hourCount;
}

std::span<const HourlyLoadTable::Entry> HourlyLoadTable::entries() const noexcept
{
    return _entries;
}

std::vector<Country> HourlyLoadTable::countries() const
{
    std::vector<Country> result;
    for (auto& entry : _entries) {
        if (result.empty() || result.back() != entry.country) {
            result.push_back(entry.country);
        }
    }

    return result;
}

bool HourlyLoadTable::contains(const Country& country) const noexcept
{
    auto iter = std::lower_bound(_entries.begin(), _entries.end(), country, [](const Entry& entry, const Country& c) {
        return entry.country < c;
    });

    return iter != _entries.end() && iter->country == country;
}

const HourlySeries* HourlyLoadTable::find(const Country& country, std::string_view key) const noexcept
{
    auto iter = std::lower_bound(_entries.begin(), _entries.end(), country, [](const Entry& entry, const Country& c) {
        return entry.country < c;
    });

    for (; iter != _entries.end() && iter->country == country; ++iter) {
        if (iter->key == key) {
            return &iter->series;
        }
    }

    return nullptr;
}

const HourlySeries& HourlyLoadTable::series(const Country& country, std::string_view key) const
{
    if (const auto* series = find(country, key); series != nullptr) {
        return *series;
    }

    throw RuntimeError("No load series available for {} {}", country, key);
}

double HourlyLoadTable::total(const Country& country, std::string_view key) const
{
    const auto& values = series(country, key);
    return std::accumulate(values.begin(), values.end(), 0.0);
}

}
