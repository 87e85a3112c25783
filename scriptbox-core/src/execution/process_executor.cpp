#include "scriptbox/process_executor.h"
#include "scriptbox/temp_script_file.h"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace scriptbox {

namespace {

// Output still arriving after the interpreter exited comes from descendants
constexpr std::chrono::milliseconds kDrainAfterExit{500};

enum class ChildStage : int {
    WorkingDirectory = 1,
    Exec = 2
};

// Written by the child to the close-on-exec status pipe when it cannot exec
struct ChildFailure {
    int stage;
    int error;
};

struct ChildLimits {
    size_t max_memory_mb = 0;
    size_t max_output_bytes = 0;
    bool clean_environment = false;
};

struct ChildRun {
    bool spawned = false;
    std::string spawn_error;
    std::string io_error;
    pid_t pid = -1;
    bool timed_out = false;
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::string stdout_text;
    std::string stderr_text;
    bool truncated = false;
};

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void ClosePipe(int (&fds)[2]) {
    CloseFd(fds[0]);
    CloseFd(fds[1]);
}

std::vector<std::string> BuildEnvironment(bool clean) {
    std::vector<std::string> env;
    if (!clean) {
        for (char** entry = environ; entry && *entry; ++entry) {
            env.emplace_back(*entry);
        }
        return env;
    }

    const char* path = std::getenv("PATH");
    const char* home = std::getenv("HOME");
    env.push_back(std::string("PATH=") + (path ? path : "/usr/local/bin:/usr/bin:/bin"));
    if (home) {
        env.push_back(std::string("HOME=") + home);
    }
    env.push_back("LANG=C.UTF-8");
    env.push_back("PYTHONIOENCODING=utf-8");
    env.push_back("PYTHONDONTWRITEBYTECODE=1");
    return env;
}

std::vector<char*> MakeCArray(std::vector<std::string>& items) {
    std::vector<char*> out;
    out.reserve(items.size() + 1);
    for (auto& item : items) {
        out.push_back(item.data());
    }
    out.push_back(nullptr);
    return out;
}

void AppendCapped(std::string& buffer, const char* data, size_t size, size_t cap, bool& truncated) {
    if (cap == 0) {
        buffer.append(data, size);
        return;
    }
    if (buffer.size() >= cap) {
        truncated = true;
        return;
    }
    size_t take = std::min(size, cap - buffer.size());
    buffer.append(data, take);
    if (take < size) {
        truncated = true;
    }
}

void KillGroup(pid_t pid) {
    if (::killpg(pid, SIGKILL) != 0 && errno == ESRCH) {
        ::kill(pid, SIGKILL);
    }
}

bool WaitForExit(pid_t pid, int& status) {
    while (true) {
        pid_t reaped = ::waitpid(pid, &status, 0);
        if (reaped == pid) {
            return true;
        }
        if (reaped < 0 && errno == EINTR) {
            continue;
        }
        return false;
    }
}

void ReportChildFailure(int fd, ChildStage stage) {
    ChildFailure failure{static_cast<int>(stage), errno};
    ssize_t written = ::write(fd, &failure, sizeof(failure));
    (void)written;
    _exit(127);
}

ChildRun RunChild(std::vector<std::string> argv,
                  const std::optional<std::string>& working_dir,
                  std::chrono::milliseconds timeout,
                  const ChildLimits& limits) {
    ChildRun run;

    // Everything the child touches is prepared before fork()
    std::vector<std::string> env = BuildEnvironment(limits.clean_environment);
    std::vector<char*> c_argv = MakeCArray(argv);
    std::vector<char*> c_env = MakeCArray(env);
    const char* cwd = (working_dir && !working_dir->empty()) ? working_dir->c_str() : nullptr;
    rlim_t memory_bytes = static_cast<rlim_t>(limits.max_memory_mb) * 1024 * 1024;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        run.spawn_error = fmt::format("Failed to create pipes: {}", std::strerror(errno));
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        ClosePipe(status_pipe);
        return run;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        run.spawn_error = fmt::format("Failed to fork process: {}", std::strerror(errno));
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        ClosePipe(status_pipe);
        return run;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);

        struct rlimit core_limit{0, 0};
        ::setrlimit(RLIMIT_CORE, &core_limit);
        if (memory_bytes > 0) {
            struct rlimit as_limit{memory_bytes, memory_bytes};
            ::setrlimit(RLIMIT_AS, &as_limit);
        }

        if (cwd && ::chdir(cwd) != 0) {
            ReportChildFailure(status_pipe[1], ChildStage::WorkingDirectory);
        }

        ::execvpe(c_argv[0], c_argv.data(), c_env.data());
        ReportChildFailure(status_pipe[1], ChildStage::Exec);
    }

    // Parent
    run.pid = pid;
    ::setpgid(pid, pid);  // also done by the child; fails harmlessly once it has exec'd
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(status_pipe[1]);

    // EOF on the status pipe means exec succeeded
    ChildFailure failure{};
    ssize_t got;
    do {
        got = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (got < 0 && errno == EINTR);
    CloseFd(status_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        if (!WaitForExit(pid, status)) {
            spdlog::warn("ProcessExecutor: failed to reap pid {}: {}", pid, std::strerror(errno));
        }
        CloseFd(out_pipe[0]);
        CloseFd(err_pipe[0]);
        if (failure.stage == static_cast<int>(ChildStage::WorkingDirectory)) {
            run.spawn_error = fmt::format("Failed to enter working directory '{}': {}",
                                          cwd ? cwd : "", std::strerror(failure.error));
        } else {
            run.spawn_error = fmt::format("Failed to start interpreter '{}': {}",
                                          argv.front(), std::strerror(failure.error));
        }
        return run;
    }

    run.spawned = true;
    spdlog::debug("ProcessExecutor: started pid {} ({})", pid, argv.front());

    auto deadline = std::chrono::steady_clock::now() + timeout;
    int fds[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&run.stdout_text, &run.stderr_text};
    for (int fd : fds) {
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    int status = 0;
    bool reaped = false;
    bool drain_cut = false;
    char buffer[8192];
    while (fds[0] >= 0 || fds[1] >= 0) {
        if (!reaped) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                // Descendants may still hold the pipes; give them a short tail
                reaped = true;
                std::chrono::steady_clock::time_point tail = std::chrono::steady_clock::now() + kDrainAfterExit;
                if (tail < deadline) {
                    deadline = tail;
                }
            }
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            if (reaped) {
                drain_cut = true;
            } else {
                run.timed_out = true;
            }
            break;
        }

        struct pollfd pfds[2];
        int owner[2];
        nfds_t count = 0;
        for (int i = 0; i < 2; ++i) {
            if (fds[i] >= 0) {
                pfds[count].fd = fds[i];
                pfds[count].events = POLLIN;
                pfds[count].revents = 0;
                owner[count] = i;
                ++count;
            }
        }

        int wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 100));
        int ready = ::poll(pfds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            run.io_error = fmt::format("Failed to poll child output: {}", std::strerror(errno));
            break;
        }

        for (nfds_t k = 0; k < count; ++k) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            int i = owner[k];
            ssize_t n = ::read(fds[i], buffer, sizeof(buffer));
            if (n > 0) {
                AppendCapped(*sinks[i], buffer, static_cast<size_t>(n),
                             limits.max_output_bytes, run.truncated);
            } else if (n == 0) {
                CloseFd(fds[i]);
            } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                CloseFd(fds[i]);
            }
        }
    }

    if (drain_cut) {
        spdlog::warn("ProcessExecutor: pid {} exited but its output pipes stayed open, "
                     "killing leftover process group", pid);
        if (::killpg(pid, SIGKILL) != 0 && errno != ESRCH) {
            spdlog::warn("ProcessExecutor: failed to kill group {}: {}", pid, std::strerror(errno));
        }
    }

    // Both streams closed; the child may still be running
    while (!reaped && !run.timed_out && run.io_error.empty()) {
        pid_t result = ::waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            reaped = true;
            break;
        }
        if (result < 0 && errno != EINTR) {
            run.io_error = fmt::format("Failed to wait for child {}: {}", pid, std::strerror(errno));
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            run.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!reaped) {
        KillGroup(pid);
        if (!WaitForExit(pid, status)) {
            spdlog::warn("ProcessExecutor: failed to reap pid {}: {}", pid, std::strerror(errno));
        }
        if (run.timed_out) {
            spdlog::warn("ProcessExecutor: pid {} exceeded {} ms, process group killed",
                         pid, timeout.count());
        }
    }

    CloseFd(fds[0]);
    CloseFd(fds[1]);

    if (reaped) {
        if (WIFEXITED(status)) {
            run.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            run.term_signal = WTERMSIG(status);
        }
    }
    return run;
}

std::string TrimText(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

ProcessExecutor::ProcessExecutor()
    : ProcessExecutor(ProcessOptions{}, SymbolPolicy::Default())
{
}

ProcessExecutor::ProcessExecutor(ProcessOptions options, SymbolPolicy policy)
    : options_(std::move(options))
    , policy_(std::move(policy))
    , template_(policy_)
{
}

bool ProcessExecutor::IsAppImage(const std::string& interpreter) {
    static const std::string suffix = ".appimage";
    if (interpreter.size() < suffix.size()) {
        return false;
    }
    std::string tail = interpreter.substr(interpreter.size() - suffix.size());
    std::transform(tail.begin(), tail.end(), tail.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return tail == suffix;
}

std::vector<std::string> ProcessExecutor::BuildCommand(const std::string& script_path) const {
    std::vector<std::string> command;
    command.push_back(options_.interpreter);
    command.insert(command.end(), options_.interpreter_args.begin(), options_.interpreter_args.end());
    if (IsAppImage(options_.interpreter)) {
        command.push_back("--console");
    }
    command.push_back(script_path);
    return command;
}

std::optional<std::string> ProcessExecutor::ProbeVersion(std::chrono::milliseconds timeout) const {
    ChildLimits limits;
    limits.max_output_bytes = 64 * 1024;
    limits.clean_environment = options_.clean_environment;

    ChildRun run = RunChild({options_.interpreter, "--version"}, std::nullopt, timeout, limits);
    if (!run.spawned || run.timed_out) {
        spdlog::warn("ProcessExecutor: version probe of {} failed: {}", options_.interpreter,
                     run.spawn_error.empty() ? "timed out" : run.spawn_error);
        return std::nullopt;
    }

    static const std::regex version_pattern(R"((FreeCAD|Python)\s+(\d+(?:\.\d+)+))");
    std::string text = run.stdout_text + "\n" + run.stderr_text;
    std::smatch match;
    if (std::regex_search(text, match, version_pattern)) {
        return match[1].str() + " " + match[2].str();
    }
    spdlog::warn("ProcessExecutor: unrecognized version output from {}", options_.interpreter);
    return std::nullopt;
}

ExecutionResult ProcessExecutor::Execute(const ExecutionRequest& request) {
    auto start = std::chrono::steady_clock::now();

    ExecutionResult result = ExecutionResult::Make(ExecutionStatus::UnknownError);
    result.metadata["execution_mode"] = GetModeName();
    result.metadata["isolation"] = "process";
    result.metadata["interpreter"] = options_.interpreter;
    if (!request.script.GetRequestId().empty()) {
        result.metadata["request_id"] = request.script.GetRequestId();
    }

    try {
        if (options_.probe_version) {
            std::call_once(probe_once_, [this] { host_version_ = ProbeVersion(); });
            if (host_version_) {
                result.metadata["host_version"] = *host_version_;
            }
        }

        ScriptTemplate::Options render_options;
        render_options.host = options_.host;
        render_options.document_name = options_.document_name;
        std::string wrapper = template_.Render(request.script, render_options);

        TempScriptFile script_file(options_.temp_directory);
        if (!script_file.IsValid() || !script_file.Write(wrapper)) {
            result.error = script_file.GetError();
            result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            return result;
        }

        ChildLimits limits;
        limits.max_memory_mb = options_.max_memory_mb;
        limits.max_output_bytes = options_.max_output_bytes;
        limits.clean_environment = options_.clean_environment;

        ChildRun run = RunChild(BuildCommand(script_file.GetPath()), request.working_dir,
                                request.timeout, limits);

        if (!run.spawned) {
            result.error = run.spawn_error;
            spdlog::error("ProcessExecutor: {}", run.spawn_error);
        } else {
            result.output = run.stdout_text;
            result.metadata["pid"] = run.pid;
            result.metadata["stderr"] = run.stderr_text;
            if (run.truncated) {
                result.metadata["output_truncated"] = true;
                spdlog::warn("ProcessExecutor: output of pid {} truncated at {} bytes",
                             run.pid, options_.max_output_bytes);
            }

            if (!run.io_error.empty()) {
                result.error = run.io_error;
                spdlog::error("ProcessExecutor: {}", run.io_error);
            } else if (run.timed_out) {
                result.SetStatus(ExecutionStatus::Timeout);
                result.error = fmt::format("Script execution timed out after {:g} seconds",
                                           request.timeout.count() / 1000.0);
            } else if (run.exit_code) {
                result.exit_code = run.exit_code;
                if (*run.exit_code == 0) {
                    result.SetStatus(ExecutionStatus::Success);
                } else {
                    result.SetStatus(ExecutionStatus::ExecutionFailed);
                    std::string stderr_text = TrimText(run.stderr_text);
                    result.error = stderr_text.empty()
                        ? fmt::format("Process exited with code {}", *run.exit_code)
                        : stderr_text;
                }
            } else if (run.term_signal) {
                result.SetStatus(ExecutionStatus::ExecutionFailed);
                result.metadata["signal"] = *run.term_signal;
                result.error = fmt::format("Process terminated by signal {} ({})",
                                           *run.term_signal, strsignal(*run.term_signal));
            } else {
                result.error = "Process ended without an exit status";
            }

            spdlog::debug("ProcessExecutor: pid {} finished with status {}",
                          run.pid, GetStatusName(result.status));
        }
    } catch (const std::exception& e) {
        result.SetStatus(ExecutionStatus::UnknownError);
        result.error = fmt::format("Execution error: {}", e.what());
        spdlog::error("ProcessExecutor: {}", result.error);
    }

    result.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

} // namespace scriptbox
