#include <cerrno>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "waypoint/audit/audit_log.hpp"
#include "waypoint/audit/manifest.hpp"
#include "waypoint/cache/cache_manager.hpp"
#include "waypoint/cli/commands.hpp"
#include "waypoint/cli/options.hpp"
#include "waypoint/config/config.hpp"
#include "waypoint/core/errors.hpp"
#include "waypoint/storage/artifact_store.hpp"
#include "waypoint/storage/hashing.hpp"
#include "waypoint/storage/layout.hpp"
#include "waypoint/workflow/command_handler.hpp"
#include "waypoint/workflow/orchestrator.hpp"
#include "waypoint/workflow/resumption.hpp"

namespace fs = std::filesystem;
namespace cli = waypoint::cli;
namespace core = waypoint::core;
namespace wf = waypoint::workflow;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNotResumable = 2;

constexpr cli::u32 kMaxOptions = 64;

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_warn(const std::string& msg) {
    fprintf(stderr, "warn: %s\n", msg.c_str());
}

void print_status_error_detailed(const char* context, core::Status s) {
    fprintf(stderr,
            "error: %s failed (code=%s/%u, domain=%s/%u, aux=%u)\n",
            context,
            core::status_code_name(s.code),
            static_cast<unsigned>(s.code),
            core::status_domain_name(s.domain),
            static_cast<unsigned>(s.domain),
            s.aux);
    if (s.code == core::StatusCode::Io && s.aux != 0) {
        fprintf(stderr, "error: %s: %s\n", context, std::strerror(static_cast<int>(s.aux)));
    }
}

// ========================================================================
// Option Tables
// ========================================================================

const cli::OptionSpec kOptions[] = {
    {cli::OptionId::Home, cli::OptionType::String, "home", 'H'},
    {cli::OptionId::Concurrency, cli::OptionType::I64, "concurrency", 'j'},
    {cli::OptionId::Verify, cli::OptionType::Flag, "verify", '\0'},
    {cli::OptionId::Session, cli::OptionType::String, "session", 's'},
    {cli::OptionId::StateFile, cli::OptionType::String, "state-file", 'f'},
    {cli::OptionId::FromStep, cli::OptionType::I64, "from-step", 'n'},
    {cli::OptionId::Experiment, cli::OptionType::String, "experiment", 'e'},
    {cli::OptionId::Output, cli::OptionType::String, "output", 'o'},
    {cli::OptionId::Type, cli::OptionType::String, "type", 't'},
    {cli::OptionId::Tag, cli::OptionType::String, "tag", 'T'},
    {cli::OptionId::Limit, cli::OptionType::I64, "limit", 'l'},
    {cli::OptionId::NoCache, cli::OptionType::Flag, "no-cache", '\0'},
    {cli::OptionId::Producer, cli::OptionType::String, "producer", 'p'},
};
constexpr cli::u32 kOptionCount = sizeof(kOptions) / sizeof(kOptions[0]);

const cli::CommandSpec kCommands[] = {
    {cli::CommandId::Help, "help", nullptr},
    {cli::CommandId::Run, "run", nullptr},
    {cli::CommandId::Resume, "resume", nullptr},
    {cli::CommandId::Analyze, "analyze", nullptr},
    {cli::CommandId::Put, "put", nullptr},
    {cli::CommandId::Get, "get", "cat"},
    {cli::CommandId::Verify, "verify", nullptr},
    {cli::CommandId::List, "ls", "list"},
    {cli::CommandId::Manifest, "manifest", nullptr},
};
constexpr cli::u32 kCommandCount = sizeof(kCommands) / sizeof(kCommands[0]);

// Parsed options plus their backing storage.
struct OptionSet {
    cli::ParsedOption storage[kMaxOptions]{};
    cli::ParsedOptions parsed{storage, 0, kMaxOptions};
};

// Parses options at the front of `args`; `rest` receives what follows.
[[nodiscard]] bool parse_leading_options(const char* context, const cli::CliArgs& args,
                                         OptionSet* set, cli::CliArgs* rest) {
    cli::u32 consumed = 0;
    const core::Status s = cli::parse_options(args, kOptions, kOptionCount, &set->parsed, &consumed);
    if (!core::is_ok(s)) {
        if (s.code == core::StatusCode::Invalid && s.aux < args.argc) {
            fprintf(stderr, "error: %s: bad option '%s'\n", context, args.argv[s.aux]);
        } else {
            print_status_error_detailed(context, s);
        }
        return false;
    }
    *rest = cli::CliArgs{args.argv + consumed, args.argc - consumed};
    return true;
}

// ========================================================================
// Runtime
// ========================================================================

// Applies CLI overrides on top of the environment.
[[nodiscard]] bool apply_overrides(const cli::ParsedOptions& opts, waypoint::config::RunnerConfig* cfg) {
    if (const char* home = cli::option_str(opts, cli::OptionId::Home)) {
        waypoint::config::set_home(cfg, fs::path(home));
    }
    const cli::i64 jobs = cli::option_i64(opts, cli::OptionId::Concurrency, 0);
    if (jobs < 0 || jobs > 1024) {
        print_error("--concurrency must be between 1 and 1024");
        return false;
    }
    if (jobs > 0) {
        cfg->max_concurrency = static_cast<cli::u32>(jobs);
    }
    if (cli::option_flag(opts, cli::OptionId::Verify)) {
        cfg->verify_on_read = true;
    }
    return true;
}

[[nodiscard]] bool open_store(const waypoint::config::RunnerConfig& cfg, waypoint::storage::ArtifactStore* store) {
    const core::Status s = store->open(waypoint::config::store_config(cfg));
    if (!core::is_ok(s)) {
        print_status_error_detailed("artifact store initialization", s);
        return false;
    }
    return true;
}

[[nodiscard]] bool parse_hash_arg(const char* context, const char* text, core::Hash256* out) {
    if (text == nullptr || !waypoint::storage::hash_from_hex(text, out)) {
        fprintf(stderr, "error: %s: expected a 64 character hex hash\n", context);
        return false;
    }
    return true;
}

// "key=value" -> (key, value).
[[nodiscard]] bool split_tag(const char* text, std::string* key, std::string* value) {
    const char* eq = std::strchr(text, '=');
    if (eq == nullptr || eq == text) {
        return false;
    }
    key->assign(text, static_cast<size_t>(eq - text));
    value->assign(eq + 1);
    return true;
}

[[nodiscard]] core::Status read_input(const char* path, std::vector<core::u8>* out) {
    const bool use_stdin = std::strcmp(path, "-") == 0;
    FILE* f = use_stdin ? stdin : fopen(path, "rb");
    if (!f) {
        return core::make_status(core::StatusDomain::Cli,
                                 errno == ENOENT ? core::StatusCode::NotFound : core::StatusCode::Io,
                                 static_cast<core::u32>(errno));
    }

    out->clear();
    core::u8 chunk[64 * 1024];
    size_t n = 0;
    while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0) {
        out->insert(out->end(), chunk, chunk + n);
    }
    const bool failed = ferror(f) != 0;
    if (!use_stdin) {
        fclose(f);
    }
    if (failed) {
        return core::make_status(core::StatusDomain::Cli, core::StatusCode::Io);
    }
    return core::ok_status();
}

[[nodiscard]] core::Status write_output(const char* path, const std::vector<core::u8>& bytes) {
    FILE* f = path ? fopen(path, "wb") : stdout;
    if (!f) {
        return core::make_status(core::StatusDomain::Cli, core::StatusCode::Io, static_cast<core::u32>(errno));
    }
    const size_t written = bytes.empty() ? 0 : fwrite(bytes.data(), 1, bytes.size(), f);
    const bool flushed = fflush(f) == 0;
    const bool closed = path ? fclose(f) == 0 : true;
    if (written != bytes.size() || !flushed || !closed) {
        return core::make_status(core::StatusDomain::Cli, core::StatusCode::Io);
    }
    return core::ok_status();
}

// ========================================================================
// Reports
// ========================================================================

void print_run_report(const wf::RunReport& report) {
    for (const auto& step : report.steps) {
        printf("step %u %s: %zu output(s), %" PRId64 " ms%s%s\n",
               step.step,
               step.agent.c_str(),
               step.outputs.size(),
               step.duration_ms,
               step.cache_hit ? ", cached" : "",
               step.failed_runs ? ", partial" : "");
        for (const auto& h : step.outputs) {
            printf("  %s\n", waypoint::storage::hash_to_hex(h).c_str());
        }
    }
    if (report.audit_errors != 0) {
        fprintf(stderr, "warn: %" PRIu64 " audit event(s) could not be written\n", report.audit_errors);
    }
}

void print_lines(const char* title, const std::vector<std::string>& lines) {
    if (lines.empty()) {
        return;
    }
    printf("%s:\n", title);
    for (const auto& line : lines) {
        printf("  - %s\n", line.c_str());
    }
}

void print_analysis(const wf::ResumeAnalysis& a) {
    printf("strategy: %s\n", wf::resume_strategy_name(a.strategy));
    printf("can_resume: %s\n", a.can_resume ? "yes" : "no");
    if (!a.state_file.empty()) {
        printf("state_file: %s\n", a.state_file.c_str());
        printf("state_integrity: %s\n", a.state_integrity ? "ok" : "corrupt");
    }
    if (a.resume_step != 0) {
        printf("resume_step: %u of %u\n", a.resume_step, a.total_steps);
    }
    print_lines("completed", a.completed_steps);
    print_lines("remaining", a.remaining_steps);
    print_lines("workflow changes", a.workflow_changes);
    print_lines("upcoming changes", a.upcoming_changes);
    print_lines("resource warnings", a.resource_warnings);
    printf("\n%s\n", a.user_guidance.c_str());
}

void finalize_session_manifest(const fs::path& session_root, const std::string& session_id,
                               waypoint::storage::ArtifactStore& store, waypoint::audit::AuditLog& log) {
    waypoint::audit::Manifest manifest;
    const core::Status s = waypoint::audit::finalize_manifest(session_root, session_id, store, &log, &manifest);
    if (s.code == core::StatusCode::Conflict) {
        print_warn("manifest already finalized for session " + session_id);
        return;
    }
    if (!core::is_ok(s)) {
        print_status_error_detailed("manifest", s);
        return;
    }
    printf("manifest: %s (cache hit rate %.2f)\n",
           waypoint::storage::session_manifest_path(session_root).c_str(), manifest.hit_rate);
}

// ========================================================================
// Workflow Execution
// ========================================================================

// Stores, cache, audit log and handlers shared by run and resume.
struct SessionRuntime {
    waypoint::storage::ArtifactStore store;
    waypoint::audit::AuditLog audit;
    std::unique_ptr<waypoint::cache::CacheManager> cache;
    wf::HandlerRegistry handlers;
};

[[nodiscard]] bool open_runtime(const waypoint::config::RunnerConfig& cfg, const fs::path& session_root,
                                SessionRuntime* rt) {
    if (!open_store(cfg, &rt->store)) {
        return false;
    }
    const core::Status s = rt->audit.open(waypoint::storage::session_audit_path(session_root));
    if (!core::is_ok(s)) {
        print_status_error_detailed("audit log open", s);
        return false;
    }
    rt->cache = std::make_unique<waypoint::cache::CacheManager>(rt->store, &rt->audit);
    rt->handlers.set_fallback(std::make_shared<wf::CommandStepHandler>(session_root / "work"));
    return true;
}

[[nodiscard]] int report_outcome(const char* context, core::Status s, const wf::RunReport& report,
                                 const fs::path& session_root, SessionRuntime* rt) {
    print_run_report(report);
    if (s.code == core::StatusCode::StepFailed) {
        fprintf(stderr, "error: step %u failed: %s\n", report.failed_step, report.failure_detail.c_str());
        fprintf(stderr, "info: resume with: waypoint resume --session %s\n", report.session_id.c_str());
        return kExitError;
    }
    if (!core::is_ok(s)) {
        print_status_error_detailed(context, s);
        return kExitError;
    }
    finalize_session_manifest(session_root, report.session_id, rt->store, rt->audit);
    printf("session %s completed through step %u\n", report.session_id.c_str(), report.completed_through);
    return kExitOk;
}

int handle_run(const waypoint::config::RunnerConfig& cfg, const cli::ParsedOptions& opts) {
    const char* experiment_path = cli::option_str(opts, cli::OptionId::Experiment);
    if (experiment_path == nullptr) {
        print_error("run: --experiment <file> is required");
        return kExitError;
    }

    waypoint::config::ExperimentConfig experiment;
    core::Status s = waypoint::config::load_experiment(experiment_path, &experiment);
    if (!core::is_ok(s)) {
        print_status_error_detailed("run: experiment load", s);
        return kExitError;
    }

    std::string session_id;
    if (const char* requested = cli::option_str(opts, cli::OptionId::Session)) {
        session_id = requested;
    } else {
        session_id = waypoint::storage::make_session_id(core::now_ms());
    }
    if (!waypoint::storage::session_id_valid(session_id)) {
        print_error("run: invalid session id");
        return kExitError;
    }

    const fs::path session_root = waypoint::storage::session_dir(cfg.sessions_root, session_id);
    std::error_code ec;
    if (fs::exists(session_root, ec)) {
        fprintf(stderr, "error: run: session %s already exists (use resume)\n", session_id.c_str());
        return kExitError;
    }

    SessionRuntime rt;
    if (!open_runtime(cfg, session_root, &rt)) {
        return kExitError;
    }

    wf::OrchestratorOptions options;
    options.max_concurrency = cfg.max_concurrency;
    options.use_cache = !cli::option_flag(opts, cli::OptionId::NoCache);
    wf::Orchestrator orchestrator(rt.store, *rt.cache, rt.audit, rt.handlers, options);

    wf::SessionContext session{session_id, session_root, experiment.resources, experiment.project_root.string()};
    printf("session %s: %zu step(s)\n", session_id.c_str(), experiment.workflow.size());

    wf::RunReport report;
    s = orchestrator.run(session, experiment.workflow, &report);
    return report_outcome("run", s, report, session_root, &rt);
}

// Shared by analyze and resume. Returns false only on a usage or I/O error.
[[nodiscard]] bool analyze_session(const waypoint::config::RunnerConfig& cfg, const cli::ParsedOptions& opts,
                                   const char* context, wf::ResumeAnalysis* analysis,
                                   std::optional<waypoint::config::ExperimentConfig>* experiment) {
    wf::ResumeRequest request;
    request.sessions_root = cfg.sessions_root;

    if (const char* state_file = cli::option_str(opts, cli::OptionId::StateFile)) {
        request.state_file = fs::path(state_file);
    } else if (const char* session_id = cli::option_str(opts, cli::OptionId::Session)) {
        if (!waypoint::storage::session_id_valid(session_id)) {
            fprintf(stderr, "error: %s: invalid session id\n", context);
            return false;
        }
        request.session_dir = waypoint::storage::session_dir(cfg.sessions_root, session_id);
    }

    const cli::i64 from_step = cli::option_i64(opts, cli::OptionId::FromStep, 0);
    if (from_step < 0 || from_step > UINT32_MAX) {
        fprintf(stderr, "error: %s: --from-step out of range\n", context);
        return false;
    }
    if (from_step > 0) {
        request.from_step = static_cast<cli::u32>(from_step);
    }

    if (const char* experiment_path = cli::option_str(opts, cli::OptionId::Experiment)) {
        waypoint::config::ExperimentConfig loaded;
        const core::Status s = waypoint::config::load_experiment(experiment_path, &loaded);
        if (core::is_ok(s)) {
            request.current_workflow = loaded.workflow;
            *experiment = std::move(loaded);
        } else {
            print_status_error_detailed("experiment load", s);
            print_warn("continuing without the current experiment configuration");
        }
    }

    const core::Status s = wf::ResumptionAnalyzer{}.analyze(request, analysis);
    if (!core::is_ok(s)) {
        print_status_error_detailed(context, s);
        return false;
    }
    return true;
}

int handle_analyze(const waypoint::config::RunnerConfig& cfg, const cli::ParsedOptions& opts) {
    wf::ResumeAnalysis analysis;
    std::optional<waypoint::config::ExperimentConfig> experiment;
    if (!analyze_session(cfg, opts, "analyze", &analysis, &experiment)) {
        return kExitError;
    }
    print_analysis(analysis);
    return analysis.can_resume ? kExitOk : kExitNotResumable;
}

int handle_resume(const waypoint::config::RunnerConfig& cfg, const cli::ParsedOptions& opts) {
    wf::ResumeAnalysis analysis;
    std::optional<waypoint::config::ExperimentConfig> experiment;
    if (!analyze_session(cfg, opts, "resume", &analysis, &experiment)) {
        return kExitError;
    }
    print_analysis(analysis);

    if (!analysis.can_resume || !analysis.snapshot) {
        fprintf(stderr, "error: resume: %s\n", wf::resume_strategy_name(analysis.strategy));
        return kExitNotResumable;
    }
    if (analysis.strategy == wf::ResumeStrategy::NoRemainingSteps) {
        return kExitOk;
    }

    const wf::StateSnapshot& snap = *analysis.snapshot;
    if (!waypoint::storage::session_id_valid(snap.session_id)) {
        print_error("resume: snapshot names an invalid session id");
        return kExitError;
    }
    // <session_root>/state/<file>
    const fs::path session_root = analysis.state_file.parent_path().parent_path();

    SessionRuntime rt;
    if (!open_runtime(cfg, session_root, &rt)) {
        return kExitError;
    }

    wf::OrchestratorOptions options;
    options.max_concurrency = cfg.max_concurrency;
    options.use_cache = !cli::option_flag(opts, cli::OptionId::NoCache);
    wf::Orchestrator orchestrator(rt.store, *rt.cache, rt.audit, rt.handlers, options);

    wf::SessionContext session;
    session.session_id = snap.session_id;
    session.session_root = session_root;
    const waypoint::core::Workflow& workflow = experiment ? experiment->workflow : snap.workflow;
    session.resources = experiment ? experiment->resources : snap.resources;
    session.project_root = experiment ? experiment->project_root.string() : snap.project_root;

    printf("resuming session %s at step %u\n", snap.session_id.c_str(), analysis.resume_step);

    wf::RunReport report;
    const core::Status s = orchestrator.resume(session, workflow, analysis.resume_step, snap.step_outputs, &report);
    return report_outcome("resume", s, report, session_root, &rt);
}

// ========================================================================
// Store Commands
// ========================================================================

int handle_put(const waypoint::config::RunnerConfig& cfg, const cli::ParsedOptions& opts, const cli::CliArgs& rest) {
    if (rest.argc < 1) {
        print_error("put: missing file (use - for stdin)");
        return kExitError;
    }

    core::ArtifactMeta meta;
    meta.producer = cli::option_str(opts, cli::OptionId::Producer, "cli");
    meta.created_at = core::now_ms();
    if (const char* type = cli::option_str(opts, cli::OptionId::Type)) {
        if (!core::parse_artifact_type(type, &meta.artifact_type)) {
            fprintf(stderr, "error: put: unknown artifact type '%s'\n", type);
            return kExitError;
        }
    }
    for (cli::u32 i = 0; i < opts.len; ++i) {
        if (opts.data[i].id != cli::OptionId::Tag) {
            continue;
        }
        std::string key;
        std::string value;
        if (!split_tag(opts.data[i].value.str, &key, &value)) {
            fprintf(stderr, "error: put: tag '%s' is not key=value\n", opts.data[i].value.str);
            return kExitError;
        }
        meta.tags[key] = value;
    }

    waypoint::storage::ArtifactStore store;
    if (!open_store(cfg, &store)) {
        return kExitError;
    }

    int rc = kExitOk;
    for (cli::u32 i = 0; i < rest.argc; ++i) {
        std::vector<core::u8> bytes;
        core::Status s = read_input(rest.argv[i], &bytes);
        if (!core::is_ok(s)) {
            fprintf(stderr, "error: put: cannot read '%s'\n", rest.argv[i]);
            rc = kExitError;
            continue;
        }
        waypoint::storage::PutResult result{};
        s = store.put(waypoint::storage::as_view(bytes), meta, &result);
        if (!core::is_ok(s)) {
            print_status_error_detailed("put", s);
            rc = kExitError;
            continue;
        }
        printf("%s  %s%s\n",
               waypoint::storage::hash_to_hex(result.hash).c_str(),
               rest.argv[i],
               result.deduplicated ? " (deduplicated)" : "");
    }
    return rc;
}

int handle_get(const waypoint::config::RunnerConfig& cfg, const cli::ParsedOptions& opts, const cli::CliArgs& rest) {
    core::Hash256 hash{};
    if (rest.argc < 1 || !parse_hash_arg("get", rest.argv[0], &hash)) {
        return kExitError;
    }

    waypoint::storage::ArtifactStore store;
    if (!open_store(cfg, &store)) {
        return kExitError;
    }

    std::vector<core::u8> bytes;
    core::Status s = store.get(hash, &bytes);
    if (s.code == core::StatusCode::NotFound) {
        print_error("get: artifact not found");
        return kExitError;
    }
    if (!core::is_ok(s)) {
        print_status_error_detailed("get", s);
        return kExitError;
    }

    s = write_output(cli::option_str(opts, cli::OptionId::Output), bytes);
    if (!core::is_ok(s)) {
        print_status_error_detailed("get: write", s);
        return kExitError;
    }
    return kExitOk;
}

int handle_verify(const waypoint::config::RunnerConfig& cfg, const cli::CliArgs& rest) {
    core::Hash256 hash{};
    if (rest.argc < 1 || !parse_hash_arg("verify", rest.argv[0], &hash)) {
        return kExitError;
    }

    waypoint::storage::ArtifactStore store;
    if (!open_store(cfg, &store)) {
        return kExitError;
    }

    bool valid = false;
    const core::Status s = store.verify(hash, &valid);
    if (!core::is_ok(s)) {
        print_status_error_detailed("verify", s);
        return kExitError;
    }
    printf("%s\n", valid ? "Artifact is valid" : "Artifact is CORRUPT");
    return valid ? kExitOk : kExitError;
}

void print_record(const core::ArtifactRecord& rec) {
    printf("%s  %-12s %10" PRIu64 "  %-16s refs=%u\n",
           waypoint::storage::hash_to_hex(rec.hash).c_str(),
           core::artifact_type_name(rec.meta.artifact_type),
           rec.size_bytes,
           rec.meta.producer.c_str(),
           rec.reference_count);
}

int handle_list(const waypoint::config::RunnerConfig& cfg, const cli::ParsedOptions& opts) {
    const cli::i64 limit = cli::option_i64(opts, cli::OptionId::Limit, 0);
    if (limit < 0) {
        print_error("ls: --limit must not be negative");
        return kExitError;
    }

    waypoint::storage::ArtifactStore store;
    if (!open_store(cfg, &store)) {
        return kExitError;
    }

    std::vector<core::ArtifactRecord> records;
    if (const char* tag = cli::option_str(opts, cli::OptionId::Tag)) {
        std::string key;
        std::string value;
        if (!split_tag(tag, &key, &value)) {
            print_error("ls: --tag expects key=value");
            return kExitError;
        }
        std::vector<core::Hash256> hashes;
        core::Status s = store.find_by_tag(key, value, &hashes);
        if (!core::is_ok(s)) {
            print_status_error_detailed("ls", s);
            return kExitError;
        }
        for (const auto& h : hashes) {
            if (limit > 0 && records.size() >= static_cast<size_t>(limit)) {
                break;
            }
            core::ArtifactRecord rec;
            s = store.metadata(h, &rec);
            if (!core::is_ok(s)) {
                print_status_error_detailed("ls", s);
                return kExitError;
            }
            records.push_back(std::move(rec));
        }
    } else {
        const core::Status s = store.scan(static_cast<core::u64>(limit), &records);
        if (!core::is_ok(s)) {
            print_status_error_detailed("ls", s);
            return kExitError;
        }
    }

    for (const auto& rec : records) {
        print_record(rec);
    }
    return kExitOk;
}

int handle_manifest(const waypoint::config::RunnerConfig& cfg, const cli::ParsedOptions& opts) {
    const char* session_id = cli::option_str(opts, cli::OptionId::Session);
    if (session_id == nullptr || !waypoint::storage::session_id_valid(session_id)) {
        print_error("manifest: --session <id> is required");
        return kExitError;
    }
    const fs::path session_root = waypoint::storage::session_dir(cfg.sessions_root, session_id);
    const fs::path path = waypoint::storage::session_manifest_path(session_root);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (!fs::is_directory(session_root, ec)) {
            fprintf(stderr, "error: manifest: no session %s\n", session_id);
            return kExitError;
        }
        waypoint::storage::ArtifactStore store;
        if (!open_store(cfg, &store)) {
            return kExitError;
        }
        waypoint::audit::AuditLog log;
        core::Status s = log.open(waypoint::storage::session_audit_path(session_root));
        if (!core::is_ok(s)) {
            print_status_error_detailed("audit log open", s);
            return kExitError;
        }
        s = waypoint::audit::finalize_manifest(session_root, session_id, store, &log, nullptr);
        if (!core::is_ok(s) && s.code != core::StatusCode::Conflict) {
            print_status_error_detailed("manifest", s);
            return kExitError;
        }
    }

    std::vector<core::u8> bytes;
    core::Status s = read_input(path.c_str(), &bytes);
    if (core::is_ok(s)) {
        s = write_output(nullptr, bytes);
    }
    if (!core::is_ok(s)) {
        print_status_error_detailed("manifest: read", s);
        return kExitError;
    }
    return kExitOk;
}

void handle_help() {
    printf("usage: waypoint [global options] <command> [options] [args]\n");
    printf("\n");
    printf("Global options:\n");
    printf("  -H, --home <dir>          Storage root (default $WAYPOINT_HOME or ~/waypoint)\n");
    printf("  -j, --concurrency <n>     Parallel runs per step (default 4)\n");
    printf("      --verify              Re-hash payloads on every read\n");
    printf("\n");
    printf("Commands:\n");
    printf("  run -e <experiment.json> [-s <id>] [--no-cache]\n");
    printf("                            Start a new session\n");
    printf("  resume [-s <id> | -f <state.json>] [-e <experiment.json>] [-n <step>] [--no-cache]\n");
    printf("                            Continue from the latest snapshot\n");
    printf("  analyze [-s <id> | -f <state.json>] [-e <experiment.json>] [-n <step>]\n");
    printf("                            Report resumability (exit 2 if not resumable)\n");
    printf("  put [-t <type>] [-p <producer>] [-T k=v]... <file|->...\n");
    printf("                            Store artifacts\n");
    printf("  get <hash> [-o <path>]    Retrieve an artifact\n");
    printf("  verify <hash>             Re-hash an artifact payload\n");
    printf("  ls [-T k=v] [-l <n>]      List registry entries\n");
    printf("  manifest -s <id>          Show (finalizing if needed) a session manifest\n");
    printf("  help                      Show this help\n");
}

} // namespace

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    const cli::CliArgs all{argv + 1, argc > 0 ? static_cast<cli::u32>(argc - 1) : 0u};

    OptionSet global;
    cli::CliArgs after_global{};
    if (!parse_leading_options("waypoint", all, &global, &after_global)) {
        return kExitError;
    }
    if (after_global.argc == 0) {
        handle_help();
        return kExitError;
    }

    cli::CommandInvocation inv{};
    cli::u32 consumed = 0;
    core::Status s = cli::parse_command(after_global, kCommands, kCommandCount, &inv, &consumed);
    if (!core::is_ok(s)) {
        fprintf(stderr, "error: unknown command '%s' (try help)\n", after_global.argv[0]);
        return kExitError;
    }
    if (inv.id == cli::CommandId::Help) {
        handle_help();
        return kExitOk;
    }

    OptionSet local;
    cli::CliArgs rest{};
    if (!parse_leading_options(after_global.argv[0], inv.args, &local, &rest)) {
        return kExitError;
    }

    waypoint::config::RunnerConfig cfg;
    s = waypoint::config::load_runner_config(&cfg);
    if (!core::is_ok(s)) {
        print_status_error_detailed("configuration", s);
        return kExitError;
    }
    if (!apply_overrides(global.parsed, &cfg) || !apply_overrides(local.parsed, &cfg)) {
        return kExitError;
    }

    switch (inv.id) {
        case cli::CommandId::Run:
            return handle_run(cfg, local.parsed);
        case cli::CommandId::Resume:
            return handle_resume(cfg, local.parsed);
        case cli::CommandId::Analyze:
            return handle_analyze(cfg, local.parsed);
        case cli::CommandId::Put:
            return handle_put(cfg, local.parsed, rest);
        case cli::CommandId::Get:
            return handle_get(cfg, local.parsed, rest);
        case cli::CommandId::Verify:
            return handle_verify(cfg, rest);
        case cli::CommandId::List:
            return handle_list(cfg, local.parsed);
        case cli::CommandId::Manifest:
            return handle_manifest(cfg, local.parsed);
        case cli::CommandId::Help:
        case cli::CommandId::None:
            break;
    }
    handle_help();
    return kExitError;
}
