#pragma once

#include <fmt/core.h>
#include <string>
#include <string_view>

namespace prima {

class Country
{
public:
    Country() noexcept
    {
    }

    explicit Country(std::string_view isoCode)
    : _isoCode(isoCode)
    {
    }

    std::string_view iso_code() const noexcept
    {
        return _isoCode;
    }

    bool operator==(const Country& other) const noexcept
    {
        return _isoCode == other._isoCode;
    }

    bool operator!=(const Country& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const Country& other) const noexcept
    {
        return _isoCode < other._isoCode;
    }

    std::string_view to_string() const noexcept;

private:
    std::string _isoCode;
};

}

namespace std {
template <>
struct hash<prima::Country>
{
    size_t operator()(const prima::Country& country) const
    {
        return hash<std::string_view>()(country.iso_code());
    }
};
}

namespace fmt {
template <>
struct formatter<prima::Country>
{
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin())
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const prima::Country& val, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return format_to(ctx.out(), "{}", val.to_string());
    }
};
}
