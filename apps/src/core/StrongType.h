#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <spdlog/fmt/fmt.h>

// Distinct integer id types that cannot be mixed by accident.
//
// Usage:
//   using LightId = StrongType<struct LightIdTag>;
//   LightId id{ 3 };
//   uint32_t raw = id.get();
template <typename Tag>
class StrongType {
public:
    constexpr StrongType() = default;
    constexpr explicit StrongType(uint32_t value) : value_{ value } {}

    [[nodiscard]] constexpr uint32_t get() const { return value_; }

    constexpr bool operator==(const StrongType& other) const { return value_ == other.value_; }
    constexpr bool operator!=(const StrongType& other) const { return value_ != other.value_; }
    constexpr bool operator<(const StrongType& other) const { return value_ < other.value_; }

    // Post-increment for id generation.
    StrongType operator++(int)
    {
        StrongType previous = *this;
        ++value_;
        return previous;
    }

private:
    uint32_t value_ = 0;
};

template <typename Tag>
struct std::hash<StrongType<Tag>> {
    std::size_t operator()(const StrongType<Tag>& st) const noexcept
    {
        return std::hash<uint32_t>{}(st.get());
    }
};

template <typename Tag>
struct fmt::formatter<StrongType<Tag>> : fmt::formatter<uint32_t> {
    auto format(const StrongType<Tag>& st, fmt::format_context& ctx) const
    {
        return fmt::formatter<uint32_t>::format(st.get(), ctx);
    }
};

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const StrongType<Tag>& st)
{
    return os << st.get();
}
