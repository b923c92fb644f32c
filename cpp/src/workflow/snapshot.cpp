#include "waypoint/workflow/snapshot.hpp"
#include "waypoint/storage/hashing.hpp"
#include "waypoint/storage/layout.hpp"
#include "waypoint/workflow/workflow_json.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <limits>
#include <new>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace waypoint::workflow {

using namespace waypoint::core;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
    constexpr std::string_view kPartialPrefix = "state_step_";
    constexpr std::string_view kPartialSuffix = "_partial";
    constexpr std::string_view kCompletedPrefix = "state_after_step_";

    // Parses the run of digits at `pos`; false if there is none or it overflows.
    bool parse_digits(std::string_view text, size_t pos, u32* value, size_t* end) noexcept {
        u64 v = 0;
        size_t i = pos;
        while (i < text.size() && text[i] >= '0' && text[i] <= '9') {
            v = v * 10 + static_cast<u64>(text[i] - '0');
            if (v > std::numeric_limits<u32>::max()) {
                return false;
            }
            ++i;
        }
        if (i == pos) {
            return false;
        }
        *value = static_cast<u32>(v);
        *end = i;
        return true;
    }

    // First `prefix<digits><suffix>` anywhere in `name`.
    bool search_pattern(std::string_view name, std::string_view prefix, std::string_view suffix, u32* step) noexcept {
        size_t from = 0;
        while (true) {
            const size_t at = name.find(prefix, from);
            if (at == std::string_view::npos) {
                return false;
            }
            u32 value = 0;
            size_t end = 0;
            if (parse_digits(name, at + prefix.size(), &value, &end) && name.substr(end, suffix.size()) == suffix) {
                *step = value;
                return true;
            }
            from = at + 1;
        }
    }

    [[nodiscard]] Status corrupt() noexcept {
        return make_status(StatusDomain::Workflow, StatusCode::Corrupt);
    }

    // Unsigned JSON number that fits in u32; larger values are not truncated.
    bool read_u32(const json& v, u32* out) {
        if (!v.is_number_unsigned()) {
            return false;
        }
        const u64 wide = v.get<u64>();
        if (wide > std::numeric_limits<u32>::max()) {
            return false;
        }
        *out = static_cast<u32>(wide);
        return true;
    }

    bool parse_status(const std::string& text, SnapshotStatus* out) noexcept {
        if (text == "in_progress") {
            *out = SnapshotStatus::InProgress;
            return true;
        }
        if (text == "completed") {
            *out = SnapshotStatus::Completed;
            return true;
        }
        return false;
    }

    struct Candidate {
        fs::path path;
        fs::file_time_type mtime{};
        u32 resume_step{0};
    };

    bool newer(const Candidate& a, const Candidate& b) noexcept {
        if (a.mtime != b.mtime) {
            return a.mtime > b.mtime;
        }
        return a.resume_step > b.resume_step;
    }

    // Collects *.json regular files of one state directory into `best`.
    Status scan_state_dir(const fs::path& state_dir, Candidate* best, bool* found) {
        std::error_code ec;
        if (!fs::is_directory(state_dir, ec)) {
            return ok_status();
        }

        fs::directory_iterator it(state_dir, ec);
        if (ec) {
            return make_status(StatusDomain::Workflow, StatusCode::Io, static_cast<u32>(ec.value()));
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                return make_status(StatusDomain::Workflow, StatusCode::Io, static_cast<u32>(ec.value()));
            }
            const fs::directory_entry& entry = *it;
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec) || entry.path().extension() != kSnapshotExtension) {
                continue;
            }

            Candidate c;
            c.path = entry.path();
            c.mtime = entry.last_write_time(entry_ec);
            if (entry_ec) {
                // Vanished between listing and stat.
                continue;
            }
            c.resume_step = determine_resume_step(c.path.filename().string());

            if (!*found || newer(c, *best)) {
                *best = std::move(c);
                *found = true;
            }
        }
        return ok_status();
    }
}

const char* snapshot_status_name(SnapshotStatus s) noexcept {
    switch (s) {
        case SnapshotStatus::InProgress: return "in_progress";
        case SnapshotStatus::Completed: return "completed";
    }
    return "unknown";
}

// ============================================================================
// File naming
// ============================================================================

std::string sanitize_agent_name(std::string_view agent) {
    std::string out;
    out.reserve(agent.size());
    for (char c : agent) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '_' || c == '-';
        out.push_back(ok ? c : '_');
    }
    if (out.empty()) {
        out = "step";
    }
    return out;
}

std::string partial_snapshot_filename(u32 step) {
    std::string name(kPartialPrefix);
    name += std::to_string(step);
    name += kPartialSuffix;
    name += kSnapshotExtension;
    return name;
}

std::string completed_snapshot_filename(u32 step, std::string_view agent) {
    std::string name(kCompletedPrefix);
    name += std::to_string(step);
    name += "_";
    name += sanitize_agent_name(agent);
    name += kSnapshotExtension;
    return name;
}

SnapshotName parse_snapshot_filename(std::string_view filename) noexcept {
    SnapshotName out;
    u32 step = 0;
    if (search_pattern(filename, kPartialPrefix, kPartialSuffix, &step)) {
        out.kind = SnapshotNameKind::Partial;
        out.step = step;
        return out;
    }
    if (search_pattern(filename, kCompletedPrefix, "_", &step)) {
        out.kind = SnapshotNameKind::Completed;
        out.step = step;
        return out;
    }
    return out;
}

u32 determine_resume_step(std::string_view filename) noexcept {
    const SnapshotName name = parse_snapshot_filename(filename);
    switch (name.kind) {
        case SnapshotNameKind::Partial:
            return name.step >= 1 ? name.step : 1;
        case SnapshotNameKind::Completed:
            if (name.step == std::numeric_limits<u32>::max()) {
                return 1;
            }
            return name.step + 1;
        case SnapshotNameKind::Unrecognized:
            break;
    }
    return 1;
}

// ============================================================================
// Serialization
// ============================================================================

Status snapshot_to_json(const StateSnapshot& snap, std::string* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }

    try {
        json outputs = json::object();
        for (const auto& [step, hashes] : snap.step_outputs) {
            json arr = json::array();
            for (const auto& h : hashes) {
                arr.push_back(waypoint::storage::hash_to_hex(h));
            }
            outputs[std::to_string(step)] = std::move(arr);
        }

        json doc = {
            {"schema_version", kSnapshotSchemaVersion},
            {"session_id", snap.session_id},
            {"status", snapshot_status_name(snap.status)},
            {"completed_step_index", snap.completed_step_index},
            {"current_step", snap.current_step},
            {"workflow", workflow_to_json(snap.workflow)},
            {"step_outputs", std::move(outputs)},
            {"resources", resources_to_json(snap.resources)},
            {"project_root", snap.project_root},
            {"created_at", snap.created_at},
        };
        *out = doc.dump(2);
        out->push_back('\n');
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    } catch (const json::exception&) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }
    return ok_status();
}

Status snapshot_from_json(std::string_view text, StateSnapshot* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }

    try {
        const json doc = json::parse(text.begin(), text.end(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return corrupt();
        }

        auto version = doc.find("schema_version");
        u32 schema = 0;
        if (version == doc.end() || !read_u32(*version, &schema)) {
            return corrupt();
        }
        if (schema > kSnapshotSchemaVersion) {
            return make_status(StatusDomain::Workflow, StatusCode::Unsupported, schema);
        }

        StateSnapshot snap;

        auto session = doc.find("session_id");
        if (session == doc.end() || !session->is_string()) {
            return corrupt();
        }
        snap.session_id = session->get<std::string>();

        auto status = doc.find("status");
        if (status == doc.end() || !status->is_string() || !parse_status(status->get<std::string>(), &snap.status)) {
            return corrupt();
        }

        auto completed = doc.find("completed_step_index");
        auto current = doc.find("current_step");
        if (completed == doc.end() || !read_u32(*completed, &snap.completed_step_index) ||
            current == doc.end() || !read_u32(*current, &snap.current_step)) {
            return corrupt();
        }

        // An empty workflow parses; the resumption analyzer reports it.
        auto workflow = doc.find("workflow");
        if (workflow == doc.end() || !is_ok(workflow_from_json(*workflow, StatusDomain::Workflow, &snap.workflow))) {
            return corrupt();
        }

        auto outputs = doc.find("step_outputs");
        if (outputs != doc.end()) {
            if (!outputs->is_object()) {
                return corrupt();
            }
            for (auto it = outputs->begin(); it != outputs->end(); ++it) {
                u32 step = 0;
                size_t end = 0;
                if (!parse_digits(it.key(), 0, &step, &end) || end != it.key().size() || !it.value().is_array()) {
                    return corrupt();
                }
                std::vector<Hash256> hashes;
                for (const auto& h : it.value()) {
                    Hash256 hash{};
                    if (!h.is_string() || !waypoint::storage::hash_from_hex(h.get<std::string>(), &hash)) {
                        return corrupt();
                    }
                    hashes.push_back(hash);
                }
                snap.step_outputs[step] = std::move(hashes);
            }
        }

        auto resources = doc.find("resources");
        if (resources != doc.end() && !is_ok(resources_from_json(*resources, StatusDomain::Workflow, &snap.resources))) {
            return corrupt();
        }

        snap.project_root = doc.value("project_root", std::string());
        snap.created_at = doc.value("created_at", Timestamp{0});

        *out = std::move(snap);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    } catch (const json::exception&) {
        return corrupt();
    }
    return ok_status();
}

Status write_snapshot(const fs::path& state_dir, const StateSnapshot& snap, fs::path* written, std::string* body_out) noexcept {
    if (snap.current_step == 0) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }

    std::string body;
    Status s = snapshot_to_json(snap, &body);
    if (!is_ok(s)) {
        return s;
    }

    fs::path path;
    try {
        if (snap.status == SnapshotStatus::Completed) {
            if (snap.current_step > snap.workflow.size()) {
                return make_status(StatusDomain::Workflow, StatusCode::Invalid);
            }
            path = state_dir / completed_snapshot_filename(snap.current_step, snap.workflow[snap.current_step - 1].agent);
        } else {
            path = state_dir / partial_snapshot_filename(snap.current_step);
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    }

    s = waypoint::storage::write_file_atomic(path, body, StatusDomain::Workflow);
    if (!is_ok(s)) {
        return s;
    }

    try {
        if (written) {
            *written = path;
        }
        if (body_out) {
            *body_out = std::move(body);
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    }
    return ok_status();
}

Status load_snapshot(const fs::path& path, StateSnapshot* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }

    std::string text;
    try {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return make_status(StatusDomain::Workflow, StatusCode::NotFound);
        }
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return make_status(StatusDomain::Workflow, StatusCode::Io, static_cast<u32>(errno));
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad()) {
            return make_status(StatusDomain::Workflow, StatusCode::Io);
        }
        text = buffer.str();
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    }

    return snapshot_from_json(text, out);
}

// ============================================================================
// Discovery
// ============================================================================

Status find_latest_snapshot_in(const fs::path& state_dir, fs::path* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }

    try {
        Candidate best;
        bool found = false;
        Status s = scan_state_dir(state_dir, &best, &found);
        if (!is_ok(s)) {
            return s;
        }
        if (!found) {
            return make_status(StatusDomain::Workflow, StatusCode::NotFound);
        }
        *out = std::move(best.path);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    } catch (const fs::filesystem_error& e) {
        return make_status(StatusDomain::Workflow, StatusCode::Io, static_cast<u32>(e.code().value()));
    }
    return ok_status();
}

Status find_latest_snapshot(const fs::path& sessions_root, fs::path* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Workflow, StatusCode::Invalid);
    }

    try {
        std::error_code ec;
        if (!fs::is_directory(sessions_root, ec)) {
            return make_status(StatusDomain::Workflow, StatusCode::NotFound);
        }

        Candidate best;
        bool found = false;
        fs::directory_iterator it(sessions_root, ec);
        if (ec) {
            return make_status(StatusDomain::Workflow, StatusCode::Io, static_cast<u32>(ec.value()));
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                return make_status(StatusDomain::Workflow, StatusCode::Io, static_cast<u32>(ec.value()));
            }
            std::error_code entry_ec;
            if (!it->is_directory(entry_ec)) {
                continue;
            }
            Status s = scan_state_dir(waypoint::storage::session_state_dir(it->path()), &best, &found);
            if (!is_ok(s)) {
                return s;
            }
        }

        if (!found) {
            return make_status(StatusDomain::Workflow, StatusCode::NotFound);
        }
        *out = std::move(best.path);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Workflow, StatusCode::Unavailable);
    } catch (const fs::filesystem_error& e) {
        return make_status(StatusDomain::Workflow, StatusCode::Io, static_cast<u32>(e.code().value()));
    }
    return ok_status();
}

} // namespace waypoint::workflow
