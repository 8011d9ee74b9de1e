#pragma once

#include "prima/constants.h"

#include <fmt/core.h>
#include <string>
#include <string_view>

namespace prima {

// Electricity demand sector (e.g. IND, COM, AGR, RES)
class Sector
{
public:
    Sector() noexcept
    {
    }

    explicit Sector(std::string_view name)
    : _name(name)
    {
    }

    static Sector residential()
    {
        return Sector(constants::sector::Residential);
    }

    std::string_view name() const noexcept
    {
        return _name;
    }

    // The residential sector is spread using the population instead of the land use
    bool is_residential() const noexcept
    {
        return _name == constants::sector::Residential;
    }

    bool operator==(const Sector& other) const noexcept
    {
        return _name == other._name;
    }

    bool operator!=(const Sector& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const Sector& other) const noexcept
    {
        return _name < other._name;
    }

private:
    std::string _name;
};

}

namespace std {
template <>
struct hash<prima::Sector>
{
    size_t operator()(const prima::Sector& sector) const
    {
        return hash<std::string_view>()(sector.name());
    }
};
}

namespace fmt {
template <>
struct formatter<prima::Sector>
{
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin())
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const prima::Sector& val, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return format_to(ctx.out(), "{}", val.name());
    }
};
}
