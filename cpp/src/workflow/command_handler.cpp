#include "waypoint/workflow/command_handler.hpp"
#include "waypoint/storage/layout.hpp"

#include <cerrno>
#include <cstring>
#include <new>
#include <system_error>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace waypoint::workflow {

using namespace waypoint::core;
namespace fs = std::filesystem;

namespace {
    // Removes the input directory on every exit path.
    struct TempDir {
        fs::path path;
        ~TempDir() {
            if (!path.empty()) {
                std::error_code ec;
                fs::remove_all(path, ec);
            }
        }
    };

    [[nodiscard]] Status make_temp_dir(const fs::path& root, TempDir* out) {
        std::error_code ec;
        fs::path base = root.empty() ? fs::temp_directory_path(ec) : root;
        if (ec) {
            return make_status(StatusDomain::External, StatusCode::Io, static_cast<u32>(ec.value()));
        }
        fs::create_directories(base, ec);
        if (ec) {
            return make_status(StatusDomain::External, StatusCode::Io, static_cast<u32>(ec.value()));
        }

        std::string pattern = (base / "waypoint-step-XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            return make_status(StatusDomain::External, StatusCode::Io, static_cast<u32>(errno));
        }
        out->path = pattern;
        return ok_status();
    }

    void describe_exit(int wstatus, std::string* detail) {
        if (WIFEXITED(wstatus)) {
            *detail = "command exited with status " + std::to_string(WEXITSTATUS(wstatus));
        } else if (WIFSIGNALED(wstatus)) {
            *detail = "command killed by signal " + std::to_string(WTERMSIG(wstatus));
        } else {
            *detail = "command ended abnormally";
        }
    }
}

std::string param_env_name(std::string_view param) {
    std::string name = "WAYPOINT_PARAM_";
    for (char c : param) {
        if (c >= 'a' && c <= 'z') {
            name.push_back(static_cast<char>(c - 'a' + 'A'));
        } else if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
            name.push_back(c);
        } else {
            name.push_back('_');
        }
    }
    return name;
}

CommandStepHandler::CommandStepHandler(fs::path work_root) : work_root_(std::move(work_root)) {}

Status CommandStepHandler::invoke(const WorkflowStep& step,
                                  const StepContext& ctx,
                                  const std::vector<std::vector<u8>>& inputs,
                                  StepOutcome* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::External, StatusCode::Invalid);
    }
    *out = StepOutcome{};

    if (step.command.empty()) {
        out->error_detail = "step " + std::to_string(ctx.step_index) + " (" + step.agent + ") has no command";
        return ok_status();
    }

    try {
        TempDir dir;
        Status s = make_temp_dir(work_root_, &dir);
        if (!is_ok(s)) {
            return s;
        }

        std::string input_list;
        for (size_t i = 0; i < inputs.size(); ++i) {
            const fs::path p = dir.path / ("input_" + std::to_string(i) + ".bin");
            const std::string_view bytes(reinterpret_cast<const char*>(inputs[i].data()), inputs[i].size());
            s = waypoint::storage::write_file_atomic(p, bytes, StatusDomain::External);
            if (!is_ok(s)) {
                return s;
            }
            if (!input_list.empty()) {
                input_list.push_back('\n');
            }
            input_list += p.string();
        }

        // Environment is assembled before fork; the child only calls
        // async-signal-safe functions.
        std::vector<std::string> env_storage;
        for (char** e = environ; e && *e; ++e) {
            if (std::strncmp(*e, "WAYPOINT_", 9) != 0) {
                env_storage.emplace_back(*e);
            }
        }
        env_storage.push_back("WAYPOINT_INPUTS=" + input_list);
        env_storage.push_back("WAYPOINT_AGENT=" + step.agent);
        env_storage.push_back("WAYPOINT_MODEL=" + step.model);
        env_storage.push_back("WAYPOINT_SESSION=" + std::string(ctx.session_id));
        env_storage.push_back("WAYPOINT_STEP=" + std::to_string(ctx.step_index));
        env_storage.push_back("WAYPOINT_RUN=" + std::to_string(ctx.run_index));
        for (const auto& [key, value] : step.params) {
            env_storage.push_back(param_env_name(key) + "=" + value);
        }
        std::vector<char*> envp;
        envp.reserve(env_storage.size() + 1);
        for (auto& entry : env_storage) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);

        std::string shell = "/bin/sh";
        std::string dash_c = "-c";
        std::string command = step.command;
        char* argv[] = {shell.data(), dash_c.data(), command.data(), nullptr};

        int pipefd[2];
        if (::pipe2(pipefd, O_CLOEXEC) != 0) {
            return make_status(StatusDomain::External, StatusCode::Io, static_cast<u32>(errno));
        }

        const pid_t pid = ::fork();
        if (pid < 0) {
            const int err = errno;
            ::close(pipefd[0]);
            ::close(pipefd[1]);
            return make_status(StatusDomain::External, StatusCode::Unavailable, static_cast<u32>(err));
        }
        if (pid == 0) {
            if (::dup2(pipefd[1], STDOUT_FILENO) < 0 || ::chdir(dir.path.c_str()) != 0) {
                ::_exit(126);
            }
            ::execve(argv[0], argv, envp.data());
            ::_exit(127);
        }

        ::close(pipefd[1]);

        u8 buffer[8192];
        while (true) {
            ssize_t n = ::read(pipefd[0], buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) continue;
                const int err = errno;
                ::close(pipefd[0]);
                int reaped = 0;
                while (::waitpid(pid, &reaped, 0) < 0 && errno == EINTR) {
                }
                return make_status(StatusDomain::External, StatusCode::Io, static_cast<u32>(err));
            }
            if (n == 0) break;  // EOF
            out->output.insert(out->output.end(), buffer, buffer + n);
        }
        ::close(pipefd[0]);

        int wstatus = 0;
        while (::waitpid(pid, &wstatus, 0) < 0) {
            if (errno != EINTR) {
                return make_status(StatusDomain::External, StatusCode::Io, static_cast<u32>(errno));
            }
        }

        if (WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 0) {
            out->success = true;
            return ok_status();
        }

        out->output.clear();
        describe_exit(wstatus, &out->error_detail);
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::External, StatusCode::Unavailable);
    }
    return ok_status();
}

} // namespace waypoint::workflow
