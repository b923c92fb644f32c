#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace waypoint::core{

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Milliseconds since the Unix epoch.
    using Timestamp = i64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(Hash256, Hash256) noexcept = default;
        friend constexpr auto operator<=>(Hash256, Hash256) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    // 64 lowercase hex characters + NUL
    inline constexpr std::size_t kHashHexChars = 64;

    template <typename Tag, typename Repr>
    struct Id {
        Repr v{};

        static constexpr Id invalid() noexcept { return Id{Repr(~Repr{0})}; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return v != invalid().v; }

        friend constexpr bool operator==(Id, Id) noexcept = default;
        friend constexpr auto operator<=>(Id, Id) noexcept = default;
    };

    // 1-based position of a step inside a workflow; 0 means "none yet".
    struct StepIndexTag {};
    using StepIndex = Id<StepIndexTag, u32>;

    [[nodiscard]] Timestamp now_ms() noexcept;

    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_standard_layout_v<Hash256>);
    static_assert(std::is_trivially_copyable_v<StepIndex>);

} // namespace waypoint::core
