#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "waypoint/core/errors.hpp"
#include "waypoint/core/types.hpp"
#include "waypoint/storage/buffer.hpp"

namespace waypoint::storage {
    [[nodiscard]] constexpr bool hash_is_zero(const waypoint::core::Hash256& h) noexcept {
        for (u8 b : h.b) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    // BLAKE3, 32-byte output.
    [[nodiscard]] waypoint::core::Status hash_compute(BufferView data, waypoint::core::Hash256* out) noexcept;

    [[nodiscard]] std::string hash_to_hex(const waypoint::core::Hash256& h);

    // Accepts exactly 64 hex characters (either case).
    [[nodiscard]] bool hash_from_hex(std::string_view hex, waypoint::core::Hash256* out) noexcept;

    // Incremental hashing for inputs assembled piecewise.
    class Hasher {
    public:
        Hasher() noexcept;
        ~Hasher() noexcept;

        Hasher(const Hasher&) = delete;
        Hasher& operator=(const Hasher&) = delete;

        void update(BufferView data) noexcept;
        void update(std::string_view text) noexcept;
        [[nodiscard]] waypoint::core::Status finalize(waypoint::core::Hash256* out) noexcept;

    private:
        struct State;
        std::unique_ptr<State> state_;
    };

} // namespace waypoint::storage
