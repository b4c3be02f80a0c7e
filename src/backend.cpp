#include "backend.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <thread>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace teamfs {

// ── ProcessBackend ──────────────────────────────────────────────────

namespace {

long parse_pid(const std::string& handle) {
    char* end = nullptr;
    long pid = std::strtol(handle.c_str(), &end, 10);
    if (handle.empty() || *end != '\0' || pid <= 0) {
        throw StoreError(ErrorCode::InvalidArgument, "invalid process handle '" + handle + "'");
    }
    return pid;
}

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::vector<std::string> ProcessBackend::expand_command(const std::vector<std::string>& tmpl,
                                                        const SpawnRequest& req) {
    std::vector<std::string> argv;
    for (auto arg : tmpl) {
        replace_all(arg, "{name}", req.name);
        replace_all(arg, "{team}", req.team_name);
        replace_all(arg, "{model}", req.model);
        replace_all(arg, "{agent_id}", req.agent_id);
        replace_all(arg, "{cwd}", req.cwd);
        replace_all(arg, "{color}", req.color);
        // Last, so prompt text containing braces is left alone.
        replace_all(arg, "{prompt}", req.prompt);
        argv.push_back(arg);
    }
    return argv;
}

std::string ProcessBackend::binary_name() const {
    return cfg_.command.empty() ? "" : cfg_.command.front();
}

namespace {

// Full path of `bin`, searched on PATH unless it already names a path.
// Empty if nothing executable is found.
std::string find_executable(const std::string& bin) {
    if (bin.empty()) return "";
    std::error_code ec;
    if (bin.find('/') != std::string::npos || bin.find('\\') != std::string::npos)
        return fs::exists(bin, ec) ? bin : "";

    const char* path = std::getenv("PATH");
    if (!path) return "";
#ifdef _WIN32
    const char sep = ';';
#else
    const char sep = ':';
#endif
    std::string dirs = path;
    size_t start = 0;
    while (start <= dirs.size()) {
        size_t end = dirs.find(sep, start);
        if (end == std::string::npos) end = dirs.size();
        std::string dir = dirs.substr(start, end - start);
        if (!dir.empty()) {
            fs::path candidate = fs::path(dir) / bin;
            if (fs::exists(candidate, ec)) return candidate.string();
#ifdef _WIN32
            candidate = fs::path(dir) / (bin + ".exe");
            if (fs::exists(candidate, ec)) return candidate.string();
#endif
        }
        start = end + 1;
    }
    return "";
}

} // namespace

bool ProcessBackend::is_available() const {
    return !find_executable(binary_name()).empty();
}

std::vector<std::string> ProcessBackend::supported_models() const {
    std::vector<std::string> models;
    if (!cfg_.default_model.empty()) models.push_back(cfg_.default_model);
    for (auto& [tier, model] : cfg_.models) {
        if (std::find(models.begin(), models.end(), model) == models.end())
            models.push_back(model);
    }
    return models;
}

std::string ProcessBackend::resolve_model(const std::string& generic) const {
    if (generic.empty()) return cfg_.default_model;
    auto it = cfg_.models.find(generic);
    if (it != cfg_.models.end()) return it->second;
    return generic;
}

#ifdef _WIN32

namespace {

std::string quote_arg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) return arg;
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"') out += '\\';
        out += c;
    }
    return out + "\"";
}

} // namespace

SpawnResult ProcessBackend::spawn(const SpawnRequest& req) {
    auto argv = expand_command(cfg_.command, req);
    if (argv.empty()) throw StoreError(ErrorCode::InvalidArgument, "backend '" + name_ + "' has no command");

    std::string cmd;
    for (auto& a : argv) cmd += (cmd.empty() ? "" : " ") + quote_arg(a);
    for (auto& [k, v] : cfg_.env) SetEnvironmentVariableA(k.c_str(), v.c_str());

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};
    if (!CreateProcessA(nullptr, const_cast<char*>(cmd.c_str()), nullptr, nullptr, FALSE,
                        CREATE_NEW_PROCESS_GROUP, nullptr,
                        req.cwd.empty() ? nullptr : req.cwd.c_str(), &si, &pi)) {
        throw StoreError(ErrorCode::IOError, "failed to spawn '" + req.name + "': error " +
                                             std::to_string(GetLastError()));
    }
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
    std::cerr << "[backend] Spawned '" << req.name << "' (PID " << pi.dwProcessId << ")\n";
    return {std::to_string(pi.dwProcessId), name_};
}

HealthStatus ProcessBackend::health_check(const std::string& handle) {
    DWORD pid = static_cast<DWORD>(parse_pid(handle));
    HANDLE h = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (!h) return {false, "no such process"};
    DWORD code = 0;
    BOOL ok = GetExitCodeProcess(h, &code);
    CloseHandle(h);
    if (ok && code == STILL_ACTIVE) return {true, "running"};
    return {false, "exited with status " + std::to_string(code)};
}

void ProcessBackend::kill(const std::string& handle) {
    DWORD pid = static_cast<DWORD>(parse_pid(handle));
    HANDLE h = OpenProcess(PROCESS_TERMINATE, FALSE, pid);
    if (!h) return;
    TerminateProcess(h, 1);
    CloseHandle(h);
}

bool ProcessBackend::graceful_shutdown(const std::string& handle, std::chrono::milliseconds timeout) {
    DWORD pid = static_cast<DWORD>(parse_pid(handle));
    GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, pid);
    HANDLE h = OpenProcess(SYNCHRONIZE, FALSE, pid);
    if (!h) return true;
    DWORD rc = WaitForSingleObject(h, static_cast<DWORD>(timeout.count()));
    CloseHandle(h);
    return rc == WAIT_OBJECT_0;
}

#else

SpawnResult ProcessBackend::spawn(const SpawnRequest& req) {
    auto argv_strs = expand_command(cfg_.command, req);
    if (argv_strs.empty()) throw StoreError(ErrorCode::InvalidArgument, "backend '" + name_ + "' has no command");
    std::string exe = find_executable(argv_strs.front());
    if (exe.empty()) {
        throw StoreError(ErrorCode::IOError,
                         "backend '" + name_ + "': '" + argv_strs.front() + "' not found on PATH");
    }

    // Everything the child needs is prepared here; after fork it only
    // makes async-signal-safe calls.
    std::vector<char*> argv;
    for (auto& s : argv_strs) argv.push_back(const_cast<char*>(s.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> env_strs;
    for (char** e = environ; *e; ++e) {
        std::string entry = *e;
        if (!cfg_.env.count(entry.substr(0, entry.find('=')))) env_strs.push_back(std::move(entry));
    }
    for (auto& [k, v] : cfg_.env) env_strs.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& s : env_strs) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    int devnull = open("/dev/null", O_RDWR | O_CLOEXEC);
    pid_t pid = fork();
    if (pid == 0) {
        setsid();
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
        }
        if (!req.cwd.empty() && chdir(req.cwd.c_str()) != 0) _exit(126);
        execve(exe.c_str(), argv.data(), envp.data());
        _exit(127);
    }
    int fork_errno = errno;
    if (devnull >= 0) close(devnull);
    if (pid < 0) throw io_error_errno("fork for '" + req.name + "'", fork_errno);

    std::cerr << "[backend] Spawned '" << req.name << "' (PID " << pid << ")\n";
    return {std::to_string(pid), name_};
}

HealthStatus ProcessBackend::health_check(const std::string& handle) {
    pid_t pid = static_cast<pid_t>(parse_pid(handle));
    int status = 0;
    pid_t rc = waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
        if (WIFEXITED(status)) return {false, "exited with status " + std::to_string(WEXITSTATUS(status))};
        if (WIFSIGNALED(status)) return {false, "killed by signal " + std::to_string(WTERMSIG(status))};
        return {false, "exited"};
    }
    if (rc == 0) return {true, "running"};
    // Not our child: probe it.
    if (::kill(pid, 0) == 0 || errno == EPERM) return {true, "running"};
    return {false, "no such process"};
}

void ProcessBackend::kill(const std::string& handle) {
    pid_t pid = static_cast<pid_t>(parse_pid(handle));
    if (::kill(pid, SIGKILL) != 0) {
        if (errno == ESRCH) return;
        throw io_error_errno("kill " + handle, errno);
    }
    // Reap if it is ours; ECHILD otherwise.
    while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
}

bool ProcessBackend::graceful_shutdown(const std::string& handle, std::chrono::milliseconds timeout) {
    pid_t pid = static_cast<pid_t>(parse_pid(handle));
    if (::kill(pid, SIGTERM) != 0) {
        if (errno == ESRCH) return true;
        throw io_error_errno("kill " + handle, errno);
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (!health_check(handle).alive) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

#endif

// ── BackendRegistry ─────────────────────────────────────────────────

void BackendRegistry::register_backend(const std::string& name, std::unique_ptr<Backend> backend) {
    backends_[name] = std::move(backend);
    if (default_.empty()) default_ = name;
    std::cerr << "[backend] Registered '" << name << "'\n";
}

Backend& BackendRegistry::get(const std::string& name) const {
    auto it = backends_.find(name);
    if (it == backends_.end()) {
        std::string known;
        for (auto& n : names()) known += (known.empty() ? "" : ", ") + n;
        throw StoreError(ErrorCode::NotFound,
                         "unknown backend '" + name + "' (available: " +
                         (known.empty() ? "none" : known) + ")");
    }
    return *it->second;
}

std::vector<std::string> BackendRegistry::names() const {
    std::vector<std::string> out;
    for (auto& [name, _] : backends_) out.push_back(name);
    return out;
}

std::vector<std::string> BackendRegistry::list_available() const {
    std::vector<std::string> out;
    for (auto& [name, b] : backends_) {
        if (b->is_available()) out.push_back(name);
    }
    return out;
}

std::string BackendRegistry::default_backend() const {
    return default_;
}

MemberStatus BackendRegistry::health_of(const TeamMember& member) const {
    // Nothing to probe from this process: trust what was last recorded.
    if (member.process_handle.empty() || !has(member.backend_type)) return member.status;
    return get(member.backend_type).health_check(member.process_handle).alive
        ? MemberStatus::alive : MemberStatus::dead;
}

HealthCheck BackendRegistry::health_check() const {
    return [this](const TeamMember& m) { return health_of(m); };
}

BackendRegistry BackendRegistry::from_config(const Config& cfg) {
    BackendRegistry reg;
    for (auto& [name, bc] : cfg.backends) {
        reg.register_backend(name, std::make_unique<ProcessBackend>(name, bc));
    }
    if (!cfg.default_backend.empty()) {
        if (reg.has(cfg.default_backend)) reg.default_ = cfg.default_backend;
        else std::cerr << "[config] Warning: default backend '" << cfg.default_backend
                       << "' is not configured\n";
    }
    return reg;
}

} // namespace teamfs
