#include "waypoint/storage/hashing.hpp"

#include <cstddef>
#include <new>

#include <blake3.h>

namespace waypoint::storage {
    waypoint::core::Status hash_compute(BufferView data, waypoint::core::Hash256* out) noexcept {
        if (out == nullptr){
            return waypoint::core::make_status(waypoint::core::StatusDomain::Storage, waypoint::core::StatusCode::Invalid);
        }
        if (data.len > 0 && data.data == nullptr){
            return waypoint::core::make_status(waypoint::core::StatusDomain::Storage, waypoint::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0){
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return waypoint::core::ok_status();
    }

    std::string hash_to_hex(const waypoint::core::Hash256& h) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.resize(waypoint::core::kHashHexChars);
        for (size_t i = 0; i < h.b.size(); ++i) {
            out[i * 2] = hex[(h.b[i] >> 4) & 0xF];
            out[i * 2 + 1] = hex[h.b[i] & 0xF];
        }
        return out;
    }

    namespace {
        [[nodiscard]] int hex_value(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }
    } // namespace

    bool hash_from_hex(std::string_view hex, waypoint::core::Hash256* out) noexcept {
        if (out == nullptr || hex.size() != waypoint::core::kHashHexChars) {
            return false;
        }
        waypoint::core::Hash256 h{};
        for (size_t i = 0; i < h.b.size(); ++i) {
            const int hi = hex_value(hex[i * 2]);
            const int lo = hex_value(hex[i * 2 + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            h.b[i] = static_cast<u8>((hi << 4) | lo);
        }
        *out = h;
        return true;
    }

    struct Hasher::State {
        blake3_hasher hasher;
    };

    Hasher::Hasher() noexcept
        : state_(new (std::nothrow) State) {
        if (state_) {
            blake3_hasher_init(&state_->hasher);
        }
    }

    Hasher::~Hasher() noexcept = default;

    void Hasher::update(BufferView data) noexcept {
        if (!state_ || data.len == 0 || data.data == nullptr) {
            return;
        }
        blake3_hasher_update(&state_->hasher, data.data, static_cast<size_t>(data.len));
    }

    void Hasher::update(std::string_view text) noexcept {
        update(as_view(text));
    }

    waypoint::core::Status Hasher::finalize(waypoint::core::Hash256* out) noexcept {
        if (out == nullptr) {
            return waypoint::core::make_status(waypoint::core::StatusDomain::Storage, waypoint::core::StatusCode::Invalid);
        }
        if (!state_) {
            return waypoint::core::make_status(waypoint::core::StatusDomain::Storage, waypoint::core::StatusCode::Unavailable);
        }
        blake3_hasher_finalize(&state_->hasher, out->b.data(), out->b.size());
        return waypoint::core::ok_status();
    }
} // namespace waypoint::storage
