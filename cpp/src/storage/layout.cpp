#include "waypoint/storage/layout.hpp"
#include "waypoint/storage/hashing.hpp"

#include <cerrno>
#include <cstdio>
#include <ctime>
#include <random>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace waypoint::storage {
    namespace fs = std::filesystem;
    using waypoint::core::Status;
    using waypoint::core::StatusCode;
    using waypoint::core::StatusDomain;
    using waypoint::core::make_status;
    using waypoint::core::ok_status;

    fs::path blob_path(const fs::path& data_root, const waypoint::core::Hash256& hash) {
        const std::string hex = hash_to_hex(hash);
        return data_root / hex.substr(0, 2) / hex.substr(2, 2) / (hex + ".dat");
    }

    fs::path session_dir(const fs::path& sessions_root, std::string_view session_id) {
        return sessions_root / std::string(session_id);
    }

    fs::path session_state_dir(const fs::path& session_root) {
        return session_root / "state";
    }

    fs::path session_audit_path(const fs::path& session_root) {
        return session_root / "audit.jsonl";
    }

    fs::path session_manifest_path(const fs::path& session_root) {
        return session_root / "manifest.json";
    }

    bool session_id_valid(std::string_view session_id) noexcept {
        if (session_id.empty() || session_id.size() > 200) {
            return false;
        }
        if (session_id == "." || session_id == "..") {
            return false;
        }
        for (char c : session_id) {
            const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                            c == '_' || c == '-' || c == '.';
            if (!ok) {
                return false;
            }
        }
        return true;
    }

    std::string make_session_id(waypoint::core::Timestamp at_ms) {
        const std::time_t secs = static_cast<std::time_t>(at_ms / 1000);
        std::tm tm_utc{};
        gmtime_r(&secs, &tm_utc);

        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_utc);

        std::random_device rd;
        std::uniform_int_distribution<u32> dist;
        char suffix[9];
        std::snprintf(suffix, sizeof(suffix), "%08x", dist(rd));

        return std::string("session_") + stamp + "_" + suffix;
    }

    Status ensure_parent_dirs(const fs::path& path) noexcept {
        const fs::path parent = path.parent_path();
        if (parent.empty()) {
            return ok_status();
        }
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return make_status(StatusDomain::Storage, StatusCode::Io, static_cast<u32>(ec.value()));
        }
        return ok_status();
    }

    Status write_file_atomic(const fs::path& path, std::string_view bytes, StatusDomain domain) noexcept {
        Status s = ensure_parent_dirs(path);
        if (!waypoint::core::is_ok(s)) {
            return make_status(domain, s.code, s.aux);
        }

        std::string tmp_path = path.string();
        tmp_path += ".tmp.";
        tmp_path += std::to_string(static_cast<long>(getpid()));
        tmp_path += ".";
        tmp_path += std::to_string(std::random_device{}());

        int fd = open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
        if (fd < 0) {
            return make_status(domain, StatusCode::Io, static_cast<u32>(errno));
        }

        size_t written = 0;
        while (written < bytes.size()) {
            ssize_t n = write(fd, bytes.data() + written, bytes.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                close(fd);
                unlink(tmp_path.c_str());  // Cleanup partial write
                return make_status(domain, StatusCode::Io, static_cast<u32>(err));
            }
            written += static_cast<size_t>(n);
        }

        if (fsync(fd) != 0) {
            const int err = errno;
            close(fd);
            unlink(tmp_path.c_str());
            return make_status(domain, StatusCode::Io, static_cast<u32>(err));
        }
        close(fd);

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            const int err = errno;
            unlink(tmp_path.c_str());
            return make_status(domain, StatusCode::Io, static_cast<u32>(err));
        }
        return ok_status();
    }
} // namespace waypoint::storage
