#include "waypoint/audit/manifest.hpp"
#include "waypoint/storage/layout.hpp"

#include <map>
#include <new>
#include <system_error>

namespace waypoint::audit {

using namespace waypoint::core;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
    [[nodiscard]] Status audit_error(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Audit, code, aux);
    }

    // Tolerates events written by older builds with missing fields.
    [[nodiscard]] ManifestStep step_from_event(const json& payload) {
        ManifestStep step;
        step.step = payload.value("step", 0u);
        step.agent = payload.value("agent", std::string{});
        step.duration_ms = payload.value("duration_ms", u64{0});
        step.cache_hit = payload.value("cache_hit", false);
        auto outputs = payload.find("outputs");
        if (outputs != payload.end() && outputs->is_array()) {
            for (const auto& h : *outputs) {
                if (h.is_string()) {
                    step.outputs.push_back(h.get<std::string>());
                }
            }
        }
        return step;
    }
}

Status build_manifest(const fs::path& session_root,
                      std::string session_id,
                      waypoint::storage::ArtifactStore& store,
                      Manifest* out) noexcept {
    if (!out) {
        return audit_error(StatusCode::Invalid);
    }

    try {
        Manifest m;
        m.session_id = std::move(session_id);

        std::vector<AuditEvent> events;
        Status s = read_audit_events(waypoint::storage::session_audit_path(session_root), &events, &m.audit_malformed);
        if (!is_ok(s) && s.code != StatusCode::NotFound) {
            return s;
        }

        std::map<u32, ManifestStep> steps;
        for (const auto& ev : events) {
            if (ev.event_type == "cache_hit") {
                ++m.cache_hits;
            } else if (ev.event_type == "cache_miss") {
                ++m.cache_misses;
            } else if (ev.event_type == "cache_corruption") {
                ++m.cache_corruptions;
            } else if (ev.event_type == "step_completed" && ev.payload.is_object()) {
                ManifestStep step = step_from_event(ev.payload);
                if (step.step != 0) {
                    // A resumed session may complete a step twice.
                    steps[step.step] = std::move(step);
                }
            }
        }
        m.audit_event_count = events.size();

        const u64 lookups = m.cache_hits + m.cache_misses + m.cache_corruptions;
        m.hit_rate = lookups ? static_cast<double>(m.cache_hits) / static_cast<double>(lookups) : 0.0;

        for (auto& [n, step] : steps) {
            m.steps.push_back(std::move(step));
        }

        s = store.count(&m.artifacts_total);
        if (!is_ok(s)) {
            return s;
        }
        std::vector<Hash256> tagged;
        s = store.find_by_tag("session", m.session_id, &tagged);
        if (!is_ok(s)) {
            return s;
        }
        m.artifacts_session = tagged.size();

        m.finalized_at = now_ms();
        *out = std::move(m);
    } catch (const std::bad_alloc&) {
        return audit_error(StatusCode::Unavailable);
    } catch (const json::exception&) {
        return audit_error(StatusCode::Corrupt);
    }
    return ok_status();
}

json manifest_to_json(const Manifest& m) {
    json steps = json::array();
    for (const auto& step : m.steps) {
        steps.push_back({{"step", step.step},
                         {"agent", step.agent},
                         {"duration_ms", step.duration_ms},
                         {"cache_hit", step.cache_hit},
                         {"outputs", step.outputs}});
    }

    return {{"session_id", m.session_id},
            {"finalized_at", m.finalized_at},
            {"cache", {{"hits", m.cache_hits},
                       {"misses", m.cache_misses},
                       {"corruptions", m.cache_corruptions},
                       {"hit_rate", m.hit_rate}}},
            {"steps", std::move(steps)},
            {"artifacts", {{"total", m.artifacts_total}, {"session", m.artifacts_session}}},
            {"audit_event_count", m.audit_event_count}};
}

Status finalize_manifest(const fs::path& session_root,
                         const std::string& session_id,
                         waypoint::storage::ArtifactStore& store,
                         AuditLog* log,
                         Manifest* out) noexcept {
    try {
        const fs::path path = waypoint::storage::session_manifest_path(session_root);
        std::error_code ec;
        if (fs::exists(path, ec)) {
            return audit_error(StatusCode::Conflict);
        }

        Manifest m;
        Status s = build_manifest(session_root, session_id, store, &m);
        if (!is_ok(s)) {
            return s;
        }

        const std::string body = manifest_to_json(m).dump(2) + "\n";
        s = waypoint::storage::write_file_atomic(path, body, StatusDomain::Audit);
        if (!is_ok(s)) {
            return s;
        }

        ArtifactMeta meta;
        meta.artifact_type = ArtifactType::Manifest;
        meta.producer = kComponentManifest;
        meta.created_at = m.finalized_at;
        meta.tags["type"] = artifact_type_name(ArtifactType::Manifest);
        meta.tags["session"] = session_id;
        waypoint::storage::PutResult put{};
        s = store.put(waypoint::storage::as_view(body), meta, &put);
        if (!is_ok(s)) {
            return s;
        }

        if (log && log->is_open()) {
            s = log->append(kComponentManifest, "manifest_finalized",
                            {{"session_id", session_id}, {"path", path.string()}});
            if (!is_ok(s)) {
                return s;
            }
        }

        if (out) {
            *out = std::move(m);
        }
    } catch (const std::bad_alloc&) {
        return audit_error(StatusCode::Unavailable);
    } catch (const json::exception&) {
        return audit_error(StatusCode::Corrupt);
    }
    return ok_status();
}

} // namespace waypoint::audit
