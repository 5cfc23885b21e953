#include "sandbox/sandbox_executor.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "nlohmann/json.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codeteam::sandbox {
namespace bp = boost::process;
namespace {

constexpr char kProgramFile[] = "program.py";
constexpr char kGuardFile[] = "__codeteam_guard__.py";
constexpr char kResultFile[] = "__codeteam_result__.json";
constexpr char kStdoutFile[] = "__codeteam_stdout__.log";
constexpr char kStderrFile[] = "__codeteam_stderr__.log";
constexpr auto kPollInterval = std::chrono::milliseconds(5);
constexpr auto kSyntaxCheckTimeout = std::chrono::milliseconds(10000);

// Runs inside the child only. Compiles the program before disabling anything so that
// parse errors are reported as ordinary errors, then records the classification.
constexpr char kGuardScript[] = R"PY(import builtins
import faulthandler
import io
import json
import os
import shutil
import subprocess
import sys

_open = open
_result_path = os.path.abspath("__codeteam_result__.json")


def _report(status, detail=""):
    with _open(_result_path, "w", encoding="utf-8") as handle:
        json.dump({"status": status, "detail": detail}, handle)


class _NoInput(io.TextIOBase):
    def read(self, *args, **kwargs):
        raise IOError("stdin is not available")

    def readline(self, *args, **kwargs):
        raise IOError("stdin is not available")

    def readlines(self, *args, **kwargs):
        raise IOError("stdin is not available")

    def readable(self, *args, **kwargs):
        return False


def _disable_destructive():
    faulthandler.disable()
    builtins.exit = None
    builtins.quit = None
    builtins.help = None
    os.environ["OMP_NUM_THREADS"] = "1"
    for name in ("kill", "killpg", "system", "putenv", "remove", "removedirs", "rmdir",
                 "fchdir", "chdir", "setuid", "fork", "forkpty", "rename", "renames",
                 "truncate", "replace", "unlink", "fchmod", "fchown", "chmod", "chown",
                 "chroot", "lchown", "lchmod", "lchflags", "_exit", "abort", "popen",
                 "execv", "execve", "execvp", "execvpe", "execl", "execle", "execlp",
                 "spawnl", "spawnle", "spawnv", "spawnve", "spawnvp", "spawnvpe",
                 "posix_spawn", "posix_spawnp"):
        if hasattr(os, name):
            setattr(os, name, None)
    shutil.rmtree = None
    shutil.move = None
    shutil.chown = None
    subprocess.Popen = None
    for module in ("ipdb", "joblib", "resource", "psutil", "tkinter"):
        sys.modules[module] = None
    sys.stdin = _NoInput()


def _main():
    with _open("program.py", encoding="utf-8") as handle:
        source = handle.read()
    try:
        code = compile(source, "program.py", "exec")
    except BaseException as exc:
        _report("error", "%s: %s" % (type(exc).__name__, exc))
        return
    if "--parse-only" in sys.argv[1:]:
        _report("passed")
        return
    _disable_destructive()
    try:
        exec(code, {"__name__": "__main__", "__builtins__": builtins})
    except AssertionError as exc:
        _report("assertion", str(exc))
    except BaseException as exc:
        _report("error", "%s: %s" % (type(exc).__name__, exc))
    else:
        _report("passed")


_main()
)PY";

ExecutionResult MakeResult(ExecutionStatus status, std::string detail = {}) {
    ExecutionResult result{};
    result.status = status;
    result.detail = std::move(detail);
    return result;
}

class ScopedTempDir {
public:
    ScopedTempDir() {
        static std::atomic<unsigned> counter{0};
        const auto base = std::filesystem::temp_directory_path();
        for (int attempt = 0; attempt < 16; ++attempt) {
            const auto stamp = std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count());
            auto candidate = base / ("codeteam_sandbox_" + std::to_string(::getpid()) + "_" +
                stamp + "_" + std::to_string(counter.fetch_add(1)));
            if (std::filesystem::create_directory(candidate)) {
                path_ = std::move(candidate);
                return;
            }
        }
        throw std::runtime_error("could not create a unique working directory");
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            codeteam::utils::LogWarn("sandbox", "failed to remove " + path_.string() + ": " + ec.message());
        }
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Applied in the forked child before exec.
struct ChildLimits : bp::extend::handler {
    rlim_t memory_bytes = 0;
    rlim_t output_bytes = 0;
    rlim_t cpu_seconds = 0;
    bool block_subprocesses = false;

    static void SetLimit(int resource, rlim_t value) {
        struct rlimit limit {};
        limit.rlim_cur = value;
        limit.rlim_max = value;
        ::setrlimit(resource, &limit);
    }

    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setpgid(0, 0);
        SetLimit(RLIMIT_CORE, 0);
        if (memory_bytes > 0) {
            SetLimit(RLIMIT_AS, memory_bytes);
        }
        if (output_bytes > 0) {
            SetLimit(RLIMIT_FSIZE, output_bytes);
        }
        if (cpu_seconds > 0) {
            SetLimit(RLIMIT_CPU, cpu_seconds);
        }
        if (block_subprocesses) {
            SetLimit(RLIMIT_NPROC, 0);
        }
    }
};

bool WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << content;
    return static_cast<bool>(output);
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return "";
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::string LastNonEmptyLine(const std::string& text) {
    const auto lines = codeteam::utils::SplitLines(text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const auto trimmed = codeteam::utils::Trim(*it);
        if (!trimmed.empty()) {
            return trimmed;
        }
    }
    return "";
}

std::string ResolveInterpreter(const std::string& interpreter) {
    if (interpreter.find('/') != std::string::npos) {
        return interpreter;
    }
    return bp::search_path(interpreter).string();
}

bp::environment BuildChildEnvironment(const std::filesystem::path& working_dir) {
    bp::environment env;
    env["PATH"] = "/usr/local/bin:/usr/bin:/bin";
    env["HOME"] = working_dir.string();
    env["TMPDIR"] = working_dir.string();
    env["LANG"] = "C.UTF-8";
    env["PYTHONIOENCODING"] = "utf-8";
    env["PYTHONDONTWRITEBYTECODE"] = "1";
    env["OMP_NUM_THREADS"] = "1";
    env["OPENBLAS_NUM_THREADS"] = "1";
    env["MKL_NUM_THREADS"] = "1";
    return env;
}

ExecutionResult ClassifyExit(const std::filesystem::path& working_dir, int status) {
    const auto result_text = ReadFile(working_dir / kResultFile);
    if (!result_text.empty()) {
        const auto json = nlohmann::json::parse(result_text, nullptr, false);
        if (json.is_object() && json.contains("status") && json["status"].is_string()) {
            const auto kind = json["status"].get<std::string>();
            const auto detail = json.value("detail", std::string());
            if (kind == "passed") {
                return MakeResult(ExecutionStatus::kPassed);
            }
            if (kind == "assertion") {
                return MakeResult(ExecutionStatus::kAssertionFailure, detail);
            }
            return MakeResult(ExecutionStatus::kOtherError, detail);
        }
    }

    if (WIFSIGNALED(status)) {
        const int signal_number = WTERMSIG(status);
        std::string detail = "terminated by signal " + std::to_string(signal_number);
        if (signal_number == SIGXFSZ) {
            detail += " (output limit exceeded)";
        } else if (signal_number == SIGXCPU) {
            detail += " (cpu limit exceeded)";
        }
        return MakeResult(ExecutionStatus::kOtherError, detail);
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        auto detail = LastNonEmptyLine(ReadFile(working_dir / kStderrFile));
        if (detail.empty()) {
            detail = "exited with status " + std::to_string(WEXITSTATUS(status));
        }
        return MakeResult(ExecutionStatus::kOtherError, detail);
    }
    return MakeResult(ExecutionStatus::kOtherError, "program exited without reporting a result");
}

}  // namespace

const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kPassed: return "passed";
        case ExecutionStatus::kAssertionFailure: return "assertion_failure";
        case ExecutionStatus::kTimeout: return "timeout";
        case ExecutionStatus::kOtherError: return "error";
    }
    return "unknown";
}

std::string Describe(const ExecutionResult& result) {
    switch (result.status) {
        case ExecutionStatus::kPassed:
            return "Code Test Passed.";
        case ExecutionStatus::kAssertionFailure:
            return "failed with AssertionError. " + result.detail;
        case ExecutionStatus::kTimeout:
            return "timed out";
        case ExecutionStatus::kOtherError:
            return result.detail;
    }
    return result.detail;
}

SandboxOptions MakeSandboxOptions(const codeteam::config::SandboxConfig& config) {
    SandboxOptions options{};
    options.interpreter = config.interpreter;
    options.memory_bytes = config.memory_mb > 0
        ? static_cast<std::size_t>(config.memory_mb) * 1024 * 1024
        : 0;
    options.max_output_bytes = config.max_output_mb > 0
        ? static_cast<std::size_t>(config.max_output_mb) * 1024 * 1024
        : 0;
    options.block_subprocesses = config.block_subprocesses;
    return options;
}

SandboxExecutor::SandboxExecutor(SandboxOptions options)
    : options_(std::move(options)) {}

ExecutionResult SandboxExecutor::Run(const std::string& program, std::chrono::milliseconds timeout) {
    return Execute(program, timeout, false);
}

ExecutionResult SandboxExecutor::CheckSyntax(const std::string& program) {
    return Execute(program, kSyntaxCheckTimeout, true);
}

ExecutionResult SandboxExecutor::Execute(const std::string& program,
                                         std::chrono::milliseconds timeout,
                                         bool parse_only) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (timeout.count() <= 0) {
        return MakeResult(ExecutionStatus::kOtherError, "timeout must be positive");
    }

    try {
        ScopedTempDir working_dir;
        const auto& dir = working_dir.Path();
        if (!WriteFile(dir / kProgramFile, program) || !WriteFile(dir / kGuardFile, kGuardScript)) {
            return MakeResult(ExecutionStatus::kOtherError, "failed to write program to " + dir.string());
        }

        const auto interpreter = ResolveInterpreter(options_.interpreter);
        if (interpreter.empty()) {
            return MakeResult(ExecutionStatus::kOtherError,
                              "interpreter not found: " + options_.interpreter);
        }

        ChildLimits limits{};
        limits.memory_bytes = static_cast<rlim_t>(options_.memory_bytes);
        limits.output_bytes = static_cast<rlim_t>(options_.max_output_bytes);
        limits.cpu_seconds = static_cast<rlim_t>((timeout.count() + 999) / 1000 + 1);
        limits.block_subprocesses = options_.block_subprocesses;

        const auto started = std::chrono::steady_clock::now();
        std::vector<std::string> args{"-I", "-B", kGuardFile};
        if (parse_only) {
            args.emplace_back("--parse-only");
        }
        bp::child child_process(
            bp::exe = interpreter,
            bp::args = args,
            BuildChildEnvironment(dir),
            bp::start_dir = dir.string(),
            bp::std_in < bp::null,
            bp::std_out > (dir / kStdoutFile).string(),
            bp::std_err > (dir / kStderrFile).string(),
            limits);

        const pid_t pid = child_process.id();
        child_process.detach();

        const auto deadline = started + timeout;
        int status = 0;
        bool finished = false;
        bool lost = false;
        int wait_errno = 0;
        // Exit is observed without reaping so the pid, and with it the process group id,
        // stays reserved until the group has been killed.
        while (true) {
            siginfo_t info{};
            const int waited = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
            if (waited == 0 && info.si_pid == pid) {
                finished = true;
                break;
            }
            if (waited < 0 && errno != EINTR) {
                wait_errno = errno;
                lost = true;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(kPollInterval);
        }

        // The unreaped leader keeps the group id valid, so this also takes down anything the
        // program left running. A lost child may already have been reaped elsewhere.
        if (!lost) {
            ::kill(-pid, SIGKILL);
            if (!finished) {
                ::kill(pid, SIGKILL);
            }
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        ExecutionResult result{};
        if (lost) {
            result = MakeResult(ExecutionStatus::kOtherError,
                                std::string("lost track of child process: ") + std::strerror(wait_errno));
        } else if (!finished) {
            result = MakeResult(ExecutionStatus::kTimeout);
        } else {
            result = ClassifyExit(dir, status);
        }
        codeteam::utils::LogDebug("sandbox", std::string("run finished status=") + ToString(result.status) +
            " elapsed_ms=" + std::to_string(elapsed.count()));
        return result;
    } catch (const std::exception& ex) {
        codeteam::utils::LogError("sandbox", std::string("execution failed: ") + ex.what());
        return MakeResult(ExecutionStatus::kOtherError, std::string("sandbox failure: ") + ex.what());
    }
}

}  // namespace codeteam::sandbox
