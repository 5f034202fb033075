#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/fmt/fmt.h>
#include <zpp_bits.h>

namespace EcoSim {

/**
 * Integer grid coordinate. x grows to the right, y grows downward
 * (so "Up" is a negative y delta).
 */
struct Vector2i {
    int x = 0;
    int y = 0;

    constexpr Vector2i operator+(const Vector2i& other) const
    {
        return Vector2i{ x + other.x, y + other.y };
    }
    constexpr Vector2i operator-(const Vector2i& other) const
    {
        return Vector2i{ x - other.x, y - other.y };
    }

    constexpr bool operator==(const Vector2i& other) const
    {
        return x == other.x && y == other.y;
    }
    constexpr bool operator!=(const Vector2i& other) const { return !(*this == other); }

    // Lexicographic (x, then y) ordering so ordered containers iterate deterministically.
    constexpr bool operator<(const Vector2i& other) const
    {
        return x < other.x || (x == other.x && y < other.y);
    }

    // Squared Euclidean length. Exact for grid coordinates, so radius checks compare
    // against radius * radius instead of taking a square root.
    constexpr int lengthSquared() const { return x * x + y * y; }

    using serialize = zpp::bits::members<2>;
};

inline void to_json(nlohmann::json& j, const Vector2i& v)
{
    j = nlohmann::json::array({ v.x, v.y });
}

inline void from_json(const nlohmann::json& j, Vector2i& v)
{
    v.x = j.at(0).get<int>();
    v.y = j.at(1).get<int>();
}

inline std::ostream& operator<<(std::ostream& os, const Vector2i& v)
{
    return os << "(" << v.x << ", " << v.y << ")";
}

} // namespace EcoSim

template <>
struct fmt::formatter<EcoSim::Vector2i> : fmt::formatter<std::string_view> {
    auto format(const EcoSim::Vector2i& v, fmt::format_context& ctx) const
    {
        return fmt::format_to(ctx.out(), "({}, {})", v.x, v.y);
    }
};
