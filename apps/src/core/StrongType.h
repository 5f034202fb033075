#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/fmt/fmt.h>
#include <zpp_bits.h>

namespace EcoSim {

// Integer identifier wrapper that keeps unrelated id spaces from mixing.
//
// Usage:
//   using AllianceId = StrongType<struct AllianceIdTag>;
//
//   AllianceId alliance{ 3 };
//   // alliance == 3;          // Compile error - no implicit conversion.
//   int raw = alliance.get();  // Explicit access to underlying value.
template <typename Tag>
class StrongType {
public:
    constexpr StrongType() : m_value{ 0 } {}
    constexpr explicit StrongType(int value) : m_value{ value } {}

    [[nodiscard]] constexpr int get() const { return m_value; }

    constexpr bool operator==(const StrongType& other) const { return m_value == other.m_value; }
    constexpr bool operator!=(const StrongType& other) const { return m_value != other.m_value; }
    constexpr bool operator<(const StrongType& other) const { return m_value < other.m_value; }

    // Post-increment hands out the current id and advances the counter.
    StrongType operator++(int)
    {
        StrongType temp = *this;
        ++m_value;
        return temp;
    }

    // Binary serialization support for zpp_bits requires public member access.
    using serialize = zpp::bits::members<1>;
    int m_value;
};

template <typename Tag>
void to_json(nlohmann::json& j, const StrongType<Tag>& st)
{
    j = st.get();
}

template <typename Tag>
void from_json(const nlohmann::json& j, StrongType<Tag>& st)
{
    st = StrongType<Tag>{ j.get<int>() };
}

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const StrongType<Tag>& st)
{
    return os << st.get();
}

} // namespace EcoSim

template <typename Tag>
struct std::hash<EcoSim::StrongType<Tag>> {
    std::size_t operator()(const EcoSim::StrongType<Tag>& st) const noexcept
    {
        return std::hash<int>{}(st.get());
    }
};

// fmt formatting support for spdlog.
template <typename Tag>
struct fmt::formatter<EcoSim::StrongType<Tag>> : fmt::formatter<int> {
    auto format(const EcoSim::StrongType<Tag>& st, fmt::format_context& ctx) const
    {
        return fmt::formatter<int>::format(st.get(), ctx);
    }
};
