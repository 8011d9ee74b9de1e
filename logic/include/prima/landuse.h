#pragma once

#include <cstdint>
#include <fmt/core.h>
#include <string>
#include <type_safe/strong_typedef.hpp>

namespace prima {

// Category value of a pixel in the land use raster
struct LandUseType : type_safe::strong_typedef<LandUseType, int32_t>,
                     type_safe::strong_typedef_op::equality_comparison<LandUseType>,
                     type_safe::strong_typedef_op::relational_comparison<LandUseType>
{
    using strong_typedef::strong_typedef;

    std::string to_string() const
    {
        return std::to_string(static_cast<int32_t>(*this));
    }
};

}

namespace std {
template <>
struct hash<prima::LandUseType> : type_safe::hashable<prima::LandUseType>
{
};
}

namespace fmt {
template <>
struct formatter<prima::LandUseType>
{
    constexpr auto parse(format_parse_context& ctx) -> decltype(ctx.begin())
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const prima::LandUseType& val, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return format_to(ctx.out(), "{}", static_cast<int32_t>(val));
    }
};
}
