#include "waypoint/audit/audit_log.hpp"
#include "waypoint/storage/layout.hpp"

#include <cerrno>
#include <fstream>
#include <new>

#include <fcntl.h>
#include <unistd.h>

namespace waypoint::audit {

using namespace waypoint::core;
using json = nlohmann::json;

AuditLog::~AuditLog() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Status AuditLog::open(const std::filesystem::path& path) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ >= 0) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    Status s = waypoint::storage::ensure_parent_dirs(path);
    if (!is_ok(s)) {
        return make_status(StatusDomain::Audit, s.code, s.aux);
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        return make_status(StatusDomain::Audit, StatusCode::Io, static_cast<u32>(errno));
    }

    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        ::close(fd);
        return make_status(StatusDomain::Audit, StatusCode::Unavailable);
    }
    fd_ = fd;
    appended_ = 0;
    return ok_status();
}

Status AuditLog::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ < 0) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    const int rc = ::fsync(fd_);
    const int err = errno;
    ::close(fd_);
    fd_ = -1;
    if (rc != 0) {
        return make_status(StatusDomain::Audit, StatusCode::Io, static_cast<u32>(err));
    }
    return ok_status();
}

bool AuditLog::is_open() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_ >= 0;
}

u64 AuditLog::appended() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return appended_;
}

Status AuditLog::append(std::string_view component, std::string_view event_type, const json& payload) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fd_ < 0) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }
    if (component.empty() || event_type.empty()) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    // Timestamps never go backwards within one log.
    Timestamp ts = now_ms();
    if (ts < last_ts_) {
        ts = last_ts_;
    }

    std::string line;
    try {
        json record = {
            {"ts", ts},
            {"component", std::string(component)},
            {"event", std::string(event_type)},
            {"payload", payload.is_null() ? json::object() : payload},
        };
        line = record.dump(-1, ' ', false, json::error_handler_t::replace);
        line.push_back('\n');
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Audit, StatusCode::Unavailable);
    } catch (const json::exception&) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    size_t written = 0;
    while (written < line.size()) {
        ssize_t n = ::write(fd_, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return make_status(StatusDomain::Audit, StatusCode::Io, static_cast<u32>(errno));
        }
        written += static_cast<size_t>(n);
    }

    last_ts_ = ts;
    ++appended_;
    return ok_status();
}

Status read_audit_events(const std::filesystem::path& path, std::vector<AuditEvent>* out, u64* malformed) noexcept {
    if (!out || !malformed) {
        return make_status(StatusDomain::Audit, StatusCode::Invalid);
    }

    out->clear();
    *malformed = 0;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ec ? make_status(StatusDomain::Audit, StatusCode::Io, static_cast<u32>(ec.value()))
                  : make_status(StatusDomain::Audit, StatusCode::NotFound);
    }

    try {
        std::ifstream in(path);
        if (!in.is_open()) {
            return make_status(StatusDomain::Audit, StatusCode::Io, static_cast<u32>(errno));
        }

        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;

            json j = json::parse(line, nullptr, false);
            if (j.is_discarded() || !j.is_object() || !j.contains("event") || !j["event"].is_string()) {
                ++(*malformed);
                continue;
            }

            AuditEvent evt;
            evt.timestamp = j.value("ts", Timestamp{0});
            evt.component = j.value("component", std::string());
            evt.event_type = j["event"].get<std::string>();
            evt.payload = j.value("payload", json::object());
            out->push_back(std::move(evt));
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Audit, StatusCode::Unavailable);
    } catch (const json::exception&) {
        return make_status(StatusDomain::Audit, StatusCode::Corrupt);
    }

    return ok_status();
}

} // namespace waypoint::audit
