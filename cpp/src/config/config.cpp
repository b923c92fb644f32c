#include "waypoint/config/config.hpp"
#include "waypoint/workflow/workflow_json.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <new>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace waypoint::config {

using namespace waypoint::core;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {
    [[nodiscard]] const char* env_value(const char* name) noexcept {
        const char* v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    }

    [[nodiscard]] Status config_error(StatusCode code, u32 aux = 0) noexcept {
        return make_status(StatusDomain::Config, code, aux);
    }
}

bool parse_bool(std::string_view text, bool* out) noexcept {
    if (!out) {
        return false;
    }
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        *out = true;
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        *out = false;
        return true;
    }
    return false;
}

bool parse_u64(std::string_view text, u64* out) noexcept {
    if (!out || text.empty()) {
        return false;
    }
    u64 v{};
    auto r = std::from_chars(text.data(), text.data() + text.size(), v, 10);
    if (r.ec != std::errc() || r.ptr != text.data() + text.size()) {
        return false;
    }
    *out = v;
    return true;
}

void set_home(RunnerConfig* cfg, const fs::path& home) {
    cfg->home = home;
    cfg->data_root = home / "objects";
    cfg->db_path = home / "registry.db";
    cfg->sessions_root = home / "sessions";
}

Status load_runner_config(RunnerConfig* out) noexcept {
    if (!out) {
        return config_error(StatusCode::Invalid);
    }

    try {
        RunnerConfig cfg;

        // Default storage locations.
        if (const char* home = env_value("WAYPOINT_HOME")) {
            set_home(&cfg, fs::path(home));
        } else if (const char* user_home = env_value("HOME")) {
            set_home(&cfg, fs::path(user_home) / "waypoint");
        } else {
            set_home(&cfg, fs::path("/tmp/waypoint"));
        }

        if (const char* v = env_value("WAYPOINT_MAX_CONCURRENCY")) {
            u64 n = 0;
            if (!parse_u64(v, &n) || n == 0 || n > 1024) {
                return config_error(StatusCode::Invalid);
            }
            cfg.max_concurrency = static_cast<u32>(n);
        }

        if (const char* v = env_value("WAYPOINT_VERIFY_ON_READ")) {
            if (!parse_bool(v, &cfg.verify_on_read)) {
                return config_error(StatusCode::Invalid);
            }
        }

        if (const char* v = env_value("WAYPOINT_MAX_ARTIFACT_BYTES")) {
            if (!parse_u64(v, &cfg.max_artifact_bytes)) {
                return config_error(StatusCode::Invalid);
            }
        }

        if (const char* v = env_value("WAYPOINT_DB_JOURNAL_MODE")) {
            cfg.journal_mode = v;
        }

        *out = std::move(cfg);
    } catch (const std::bad_alloc&) {
        return config_error(StatusCode::Unavailable);
    }
    return ok_status();
}

waypoint::storage::ArtifactStoreConfig store_config(const RunnerConfig& cfg) {
    waypoint::storage::ArtifactStoreConfig out;
    out.data_root = cfg.data_root;
    out.db_path = cfg.db_path;
    out.max_artifact_bytes = cfg.max_artifact_bytes;
    out.verify_on_read = cfg.verify_on_read;
    // Points into cfg; the store copies its config on open.
    out.journal_mode = cfg.journal_mode.empty() ? nullptr : cfg.journal_mode.c_str();
    return out;
}

Status parse_experiment(std::string_view text, ExperimentConfig* out) noexcept {
    if (!out) {
        return config_error(StatusCode::Invalid);
    }

    try {
        const json doc = json::parse(text.begin(), text.end(), nullptr, false);
        if (doc.is_discarded()) {
            return config_error(StatusCode::Corrupt);
        }
        if (!doc.is_object()) {
            return config_error(StatusCode::Invalid);
        }

        ExperimentConfig cfg;

        auto version = doc.find("schema_version");
        if (version != doc.end()) {
            if (!version->is_number_unsigned()) {
                return config_error(StatusCode::Invalid);
            }
            cfg.schema_version = version->get<u32>();
            if (cfg.schema_version > kExperimentSchemaVersion) {
                return config_error(StatusCode::Unsupported, cfg.schema_version);
            }
        }

        auto name = doc.find("name");
        if (name != doc.end() && name->is_string()) {
            cfg.name = name->get<std::string>();
        }

        auto workflow = doc.find("workflow");
        if (workflow == doc.end() || !workflow->is_array() || workflow->empty()) {
            return config_error(StatusCode::Invalid);
        }
        Status s = waypoint::workflow::workflow_from_json(*workflow, StatusDomain::Config, &cfg.workflow);
        if (!is_ok(s)) {
            return s;
        }

        auto resources = doc.find("resources");
        if (resources != doc.end() && !resources->is_null()) {
            s = waypoint::workflow::resources_from_json(*resources, StatusDomain::Config, &cfg.resources);
            if (!is_ok(s)) {
                return s;
            }
        }

        *out = std::move(cfg);
    } catch (const std::bad_alloc&) {
        return config_error(StatusCode::Unavailable);
    } catch (const json::exception&) {
        return config_error(StatusCode::Invalid);
    }
    return ok_status();
}

Status load_experiment(const fs::path& path, ExperimentConfig* out) noexcept {
    if (!out) {
        return config_error(StatusCode::Invalid);
    }

    std::string text;
    try {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return config_error(StatusCode::NotFound);
        }
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            return config_error(StatusCode::Io, static_cast<u32>(errno));
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        text = buffer.str();
    } catch (const std::bad_alloc&) {
        return config_error(StatusCode::Unavailable);
    }

    Status s = parse_experiment(text, out);
    if (!is_ok(s)) {
        return s;
    }

    try {
        std::error_code ec;
        fs::path absolute = fs::absolute(path, ec);
        out->source = ec ? path : absolute;
        out->project_root = out->source.parent_path();
    } catch (const std::bad_alloc&) {
        return config_error(StatusCode::Unavailable);
    }
    return ok_status();
}

} // namespace waypoint::config
