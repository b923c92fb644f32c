#pragma once

#include <string_view>
#include <type_traits>
#include <vector>

#include "waypoint/core/types.hpp"

namespace waypoint::storage {
    using u8 = waypoint::core::u8;
    using u64 = waypoint::core::u64;

    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] inline BufferView as_view(const std::vector<u8>& bytes) noexcept {
        return BufferView{bytes.data(), static_cast<u64>(bytes.size())};
    }

    [[nodiscard]] inline BufferView as_view(std::string_view text) noexcept {
        return BufferView{reinterpret_cast<const u8*>(text.data()), static_cast<u64>(text.size())};
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
} // namespace waypoint::storage
