/*
 * Copyright 2025 Lamina Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Lamina Worker Supervisor - Implementation

#include "worker_supervisor.hpp"

#include <fcntl.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstdlib>

#include "../core/logging.hpp"
#include "../core/socket.hpp"

namespace lamina::runtime {

namespace {

constexpr size_t kReadChunkSize = 8192;

// Child descriptors are first moved above this number so dup2 onto 0..3 never
// collides with a source descriptor
constexpr int kChildScratchFd = 10;

int open_pidfd(pid_t pid) noexcept {
    return static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
}

void close_pair(int fds[2]) noexcept {
    core::close_fd(fds[0]);
    core::close_fd(fds[1]);
    fds[0] = fds[1] = -1;
}

// Blocking reap (the process has exited or was just sent SIGKILL)
int reap(pid_t pid) noexcept {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return status;
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) {
        return fmt::format("exit code {}", WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return fmt::format("signal {}", WTERMSIG(status));
    }
    return fmt::format("status {}", status);
}

// Child side of spawn: only async-signal-safe calls
[[noreturn]] void exec_child(const char* exe, char* const argv[], char* const envp[],
                             const int sources[4], int status_fd) noexcept {
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    signal(SIGPIPE, SIG_DFL);

    int moved[4];
    for (int i = 0; i < 4; ++i) {
        moved[i] = fcntl(sources[i], F_DUPFD_CLOEXEC, kChildScratchFd);
        if (moved[i] < 0) {
            int err = errno;
            [[maybe_unused]] ssize_t n = write(status_fd, &err, sizeof(err));
            _exit(127);
        }
    }

    // dup2 clears FD_CLOEXEC on the target: stdin, stdout, stderr, IPC channel
    for (int i = 0; i < 4; ++i) {
        if (dup2(moved[i], i) < 0) {
            int err = errno;
            [[maybe_unused]] ssize_t n = write(status_fd, &err, sizeof(err));
            _exit(127);
        }
    }

    execve(exe, argv, envp);

    int err = errno;
    [[maybe_unused]] ssize_t n = write(status_fd, &err, sizeof(err));
    _exit(127);
}

}  // anonymous namespace

std::string resolve_executable(std::string_view bin,
                               const std::map<std::string, std::string>& env) {
    if (bin.empty()) {
        return {};
    }
    if (bin.find('/') != std::string_view::npos) {
        return std::string(bin);
    }

    auto search = [bin](std::string_view path_list) -> std::string {
        while (true) {
            size_t colon = path_list.find(':');
            std::string_view dir = path_list.substr(0, colon);
            std::string candidate =
                dir.empty() ? std::string(bin) : fmt::format("{}/{}", dir, bin);
            if (::access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
            if (colon == std::string_view::npos) {
                return {};
            }
            path_list.remove_prefix(colon + 1);
        }
    };

    if (auto it = env.find("PATH"); it != env.end()) {
        if (auto found = search(it->second); !found.empty()) {
            return found;
        }
    }
    if (const char* own_path = std::getenv("PATH")) {
        return search(own_path);
    }
    return {};
}

WorkerSupervisor::WorkerSupervisor(core::EventLoop& loop, control::FunctionConfig function,
                                   const RuntimeSettings& settings,
                                   std::shared_ptr<LogSink> stdout_sink,
                                   std::shared_ptr<LogSink> stderr_sink)
    : loop_(loop),
      function_(std::move(function)),
      settings_(settings),
      stdout_sink_(std::move(stdout_sink)),
      stderr_sink_(std::move(stderr_sink)),
      logger_(logging::get_current_logger()) {
    if (!stdout_sink_) {
        stdout_sink_ = default_stdout_sink();
    }
    if (!stderr_sink_) {
        stderr_sink_ = default_stderr_sink();
    }
}

WorkerSupervisor::~WorkerSupervisor() {
    close_all();
}

std::vector<pid_t> WorkerSupervisor::active_pids() const {
    std::vector<pid_t> pids;
    pids.reserve(processes_.size());
    for (const auto& [serial, proc] : processes_) {
        pids.push_back(proc->pid);
    }
    return pids;
}

std::error_code WorkerSupervisor::spawn(WorkerProcess& proc) {
    std::string exe = resolve_executable(settings_.bin, settings_.env);
    if (exe.empty()) {
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    // argv/envp are built before fork: the child may not allocate
    std::vector<std::string> args = {settings_.bin, settings_.bootstrap_path, function_.entry,
                                     function_.handler};
    std::vector<std::string> env_list;
    env_list.reserve(settings_.env.size() + 2);
    for (const auto& [name, value] : settings_.env) {
        if (name == "NODE_CHANNEL_FD" || name == "NODE_CHANNEL_SERIALIZATION_MODE") {
            continue;
        }
        env_list.push_back(fmt::format("{}={}", name, value));
    }
    env_list.push_back(fmt::format("NODE_CHANNEL_FD={}", kIpcChannelFd));
    env_list.push_back("NODE_CHANNEL_SERIALIZATION_MODE=json");

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    envp.reserve(env_list.size() + 1);
    for (auto& entry : env_list) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int ipc_pair[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto cleanup = [&]() {
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(ipc_pair);
        close_pair(status_pipe);
    };

    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, ipc_pair) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        std::error_code ec(errno, std::system_category());
        cleanup();
        return ec;
    }

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        std::error_code ec(errno, std::system_category());
        cleanup();
        return ec;
    }

    const int sources[4] = {devnull, out_pipe[1], err_pipe[1], ipc_pair[1]};

    pid_t pid = ::fork();
    if (pid < 0) {
        std::error_code ec(errno, std::system_category());
        core::close_fd(devnull);
        cleanup();
        return ec;
    }

    if (pid == 0) {
        exec_child(exe.c_str(), argv.data(), envp.data(), sources, status_pipe[1]);
    }

    // Parent: drop the child's ends
    core::close_fd(devnull);
    core::close_fd(out_pipe[1]);
    core::close_fd(err_pipe[1]);
    core::close_fd(ipc_pair[1]);
    core::close_fd(status_pipe[1]);
    out_pipe[1] = err_pipe[1] = ipc_pair[1] = status_pipe[1] = -1;

    // The status pipe closes on successful exec, or carries the child's errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    core::close_fd(status_pipe[0]);
    status_pipe[0] = -1;

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        reap(pid);
        cleanup();
        return std::error_code(child_errno, std::system_category());
    }

    int pidfd = open_pidfd(pid);
    if (pidfd < 0) {
        std::error_code ec(errno, std::system_category());
        ::kill(pid, SIGKILL);
        reap(pid);
        cleanup();
        return ec;
    }

    for (int fd : {out_pipe[0], err_pipe[0], ipc_pair[0]}) {
        if (auto ec = core::set_nonblocking(fd); ec) {
            ::kill(pid, SIGKILL);
            reap(pid);
            core::close_fd(pidfd);
            cleanup();
            return ec;
        }
    }

    proc.pid = pid;
    proc.pidfd = pidfd;
    proc.stdout_fd = out_pipe[0];
    proc.stderr_fd = err_pipe[0];
    proc.ipc_fd = ipc_pair[0];
    return {};
}

void WorkerSupervisor::invoke(const std::string& id, const nlohmann::json& event,
                              InvocationCallback done) {
    auto owned = std::make_unique<WorkerProcess>();
    owned->serial = next_serial_++;
    owned->id = id;
    owned->done = std::move(done);
    owned->start = std::chrono::steady_clock::now();
    owned->start_wall = std::chrono::system_clock::now();

    stdout_sink_->write(fmt::format("START\tRequestId:{}\tVersion:$LATEST\n", id));

    if (auto ec = spawn(*owned); ec) {
        LOG_ERROR(logger_, "Failed to spawn worker: function={}, bin={}, correlation_id={}, error={}",
                  function_.path, settings_.bin, id, ec.message());
        InvocationCallback callback = std::move(owned->done);
        callback(InvocationOutcome::failure(
            InvocationErrorKind::WorkerSpawnError, "Internal Server Error",
            {fmt::format("failed to spawn {}: {}", settings_.bin, ec.message())}));
        return;
    }

    uint64_t serial = owned->serial;
    WorkerProcess& proc = *owned;
    processes_.emplace(serial, std::move(owned));

    LOG_WORKER(logger_, "spawned", function_.path, proc.pid, id);

    std::error_code ec = loop_.add(proc.stdout_fd, EPOLLIN,
                                   [this, serial](uint32_t) { on_stdout(serial); });
    if (!ec) {
        ec = loop_.add(proc.stderr_fd, EPOLLIN, [this, serial](uint32_t) { on_stderr(serial); });
    }
    if (!ec) {
        ec = loop_.add(proc.ipc_fd, EPOLLIN,
                       [this, serial](uint32_t events) { on_ipc(serial, events); });
    }
    if (!ec) {
        ec = loop_.add(proc.pidfd, EPOLLIN, [this, serial](uint32_t) { on_exit(serial); });
    }

    if (ec) {
        LOG_ERROR(logger_, "Failed to watch worker: function={}, pid={}, correlation_id={}, error={}",
                  function_.path, proc.pid, id, ec.message());
        proc.settled = true;
        InvocationCallback callback = std::move(proc.done);
        release(serial);
        callback(InvocationOutcome::failure(InvocationErrorKind::WorkerSpawnError,
                                            "Internal Server Error", {ec.message()}));
        return;
    }

    proc.ipc_out = encode_event_message(id, event);
    flush_ipc_output(proc);
}

void WorkerSupervisor::close_all() {
    std::vector<uint64_t> serials;
    serials.reserve(processes_.size());
    for (const auto& [serial, proc] : processes_) {
        serials.push_back(serial);
    }

    for (uint64_t serial : serials) {
        if (WorkerProcess* proc = find(serial)) {
            proc->settled = true;
            proc->done = nullptr;
            LOG_WORKER(logger_, "killed", function_.path, proc->pid, proc->id);
        }
        release(serial);
    }
}

WorkerProcess* WorkerSupervisor::find(uint64_t serial) noexcept {
    auto it = processes_.find(serial);
    return it == processes_.end() ? nullptr : it->second.get();
}

bool WorkerSupervisor::drain(int fd, std::string& out) {
    char buffer[kReadChunkSize];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;  // EOF
        }
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: nothing more for now; anything else ends the stream
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void WorkerSupervisor::emit_lines(WorkerProcess& proc, LineBuffer& lines, LogSink& sink,
                                  std::string_view tag, bool flush_partial) {
    while (auto line = lines.next_line()) {
        sink.write(fmt::format("{} {} {} {}\n", format_iso8601(std::chrono::system_clock::now()),
                               proc.id, tag, *line));
    }
    if (flush_partial) {
        if (auto rest = lines.take_rest()) {
            sink.write(fmt::format("{} {} {} {}\n",
                                   format_iso8601(std::chrono::system_clock::now()), proc.id, tag,
                                   *rest));
        }
    }
}

void WorkerSupervisor::on_stdout(uint64_t serial) {
    WorkerProcess* proc = find(serial);
    if (!proc || proc->stdout_fd < 0) {
        return;
    }

    std::string data;
    bool open = drain(proc->stdout_fd, data);
    proc->stdout_lines.append(data);
    emit_lines(*proc, proc->stdout_lines, *stdout_sink_, "INFO", !open);

    if (!open) {
        loop_.remove(proc->stdout_fd);
        core::close_fd(proc->stdout_fd);
        proc->stdout_fd = -1;
    }
}

void WorkerSupervisor::on_stderr(uint64_t serial) {
    WorkerProcess* proc = find(serial);
    if (!proc || proc->stderr_fd < 0) {
        return;
    }

    std::string data;
    bool open = true;
    char buffer[kReadChunkSize];
    while (true) {
        ssize_t n = ::read(proc->stderr_fd, buffer, sizeof(buffer));
        if (n > 0) {
            // Only the first chunk is kept as crash diagnostic
            if (!proc->stderr_captured) {
                proc->first_stderr_chunk.assign(buffer, static_cast<size_t>(n));
                proc->stderr_captured = true;
            }
            data.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        open = (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK));
        break;
    }

    proc->stderr_lines.append(data);
    emit_lines(*proc, proc->stderr_lines, *stderr_sink_, "ERR", !open);

    if (!open) {
        loop_.remove(proc->stderr_fd);
        core::close_fd(proc->stderr_fd);
        proc->stderr_fd = -1;
    }
}

void WorkerSupervisor::on_ipc(uint64_t serial, uint32_t events) {
    WorkerProcess* proc = find(serial);
    if (!proc || proc->ipc_fd < 0) {
        return;
    }

    if (events & EPOLLOUT) {
        flush_ipc_output(*proc);
        proc = find(serial);
        if (!proc || proc->ipc_fd < 0) {
            return;
        }
    }

    if (events & (EPOLLIN | EPOLLHUP | EPOLLERR)) {
        handle_ipc_input(*proc);
    }
}

void WorkerSupervisor::handle_ipc_input(WorkerProcess& proc) {
    uint64_t serial = proc.serial;

    std::string data;
    bool open = drain(proc.ipc_fd, data);
    proc.ipc_lines.append(data);

    while (true) {
        WorkerProcess* current = find(serial);
        if (!current) {
            return;  // Dropped by a callback (close_all)
        }
        auto line = current->ipc_lines.next_line();
        if (!line) {
            break;
        }
        handle_message(*current, *line);
    }

    WorkerProcess* current = find(serial);
    if (current && !open && current->ipc_fd >= 0) {
        // Channel closed by the worker; the exit handler reports the outcome
        loop_.remove(current->ipc_fd);
        core::close_fd(current->ipc_fd);
        current->ipc_fd = -1;
    }
}

void WorkerSupervisor::flush_ipc_output(WorkerProcess& proc) {
    bool was_waiting = false;

    while (!proc.ipc_out.empty()) {
        ssize_t n = ::send(proc.ipc_fd, proc.ipc_out.data(), proc.ipc_out.size(), MSG_NOSIGNAL);
        if (n > 0) {
            proc.ipc_out.erase(0, static_cast<size_t>(n));
            was_waiting = true;
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (auto ec = loop_.modify(proc.ipc_fd, EPOLLIN | EPOLLOUT); ec) {
                LOG_ERROR(logger_, "Failed to watch IPC channel: pid={}, error={}", proc.pid,
                          ec.message());
            }
            return;
        }

        // Channel error: the worker cannot receive its event
        std::error_code ec(errno, std::system_category());
        LOG_ERROR_CTX(logger_, "IPC channel error", proc.id, "WorkerSpawnError", ec.message());
        proc.ipc_out.clear();
        kill_process(proc);
        settle(proc, InvocationOutcome::failure(InvocationErrorKind::WorkerSpawnError,
                                                "Internal Server Error",
                                                {fmt::format("IPC channel error: {}",
                                                             ec.message())}));
        return;
    }

    if (was_waiting) {
        if (auto ec = loop_.modify(proc.ipc_fd, EPOLLIN); ec) {
            LOG_ERROR(logger_, "Failed to watch IPC channel: pid={}, error={}", proc.pid,
                      ec.message());
        }
    }
}

void WorkerSupervisor::handle_message(WorkerProcess& proc, std::string_view line) {
    if (line.empty()) {
        return;
    }

    if (proc.settled) {
        LOG_WARNING(logger_, "Ignoring message after outcome: function={}, pid={}, correlation_id={}",
                    function_.path, proc.pid, proc.id);
        return;
    }

    std::string error;
    auto message = decode_result_message(line, proc.id, error);
    if (!message) {
        LOG_ERROR_CTX(logger_, "Protocol violation from worker", proc.id, "ProtocolViolation",
                      error);
        kill_process(proc);
        settle(proc, InvocationOutcome::failure(InvocationErrorKind::ProtocolViolation,
                                                "Internal Server Error", {error}));
        return;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - proc.start)
                        .count();
    std::string memory = message->memory_used_bytes
                             ? fmt::format("{}", std::llround(*message->memory_used_bytes /
                                                             (1024.0 * 1024.0)))
                             : std::string("NaN");

    stdout_sink_->write(fmt::format(
        "END\tRequestId: {}\n"
        "REPORT\tRequestId: {}\tInitDuration: 0 ms\tDuration: {} ms\tBilledDuration: {} ms\t"
        "Memory Size: NaN MB MaxMemoryUsed {} MB\n",
        message->id, message->id, duration, duration, memory));

    // The worker is done once it has answered
    kill_process(proc);
    settle(proc, InvocationOutcome::success(std::move(message->result)));
}

void WorkerSupervisor::on_exit(uint64_t serial) {
    WorkerProcess* proc = find(serial);
    if (!proc) {
        return;
    }

    // Everything the worker wrote before exiting is processed first
    if (proc->stdout_fd >= 0) {
        on_stdout(serial);
    }
    if (proc->stderr_fd >= 0) {
        on_stderr(serial);
    }
    proc = find(serial);
    if (proc && proc->ipc_fd >= 0) {
        handle_ipc_input(*proc);
    }
    proc = find(serial);
    if (!proc) {
        return;
    }

    int status = reap(proc->pid);
    proc->pid = -1;

    emit_lines(*proc, proc->stdout_lines, *stdout_sink_, "INFO", true);
    emit_lines(*proc, proc->stderr_lines, *stderr_sink_, "ERR", true);

    if (proc->settled) {
        release(serial);
        return;
    }

    // Exit before any result is a crash, whatever the status
    std::vector<std::string> stack = split_lines(proc->first_stderr_chunk);
    nlohmann::json lambda_error = {
        {"errorType", "Error"}, {"errorMessage", "Error"}, {"stack", stack}};
    stdout_sink_->write(fmt::format(
        "{}\t{}\tERROR\t{}\n", format_iso8601(proc->start_wall), proc->id,
        lambda_error.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));

    LOG_ERROR_CTX(logger_, "Worker exited before sending a result", proc->id, "WorkerCrash",
                  describe_status(status));

    proc->settled = true;
    InvocationCallback callback = std::move(proc->done);
    release(serial);

    if (callback) {
        callback(InvocationOutcome::failure(InvocationErrorKind::WorkerCrash,
                                            "Internal Server Error", std::move(stack)));
    }
}

void WorkerSupervisor::settle(WorkerProcess& proc, InvocationOutcome outcome) {
    if (proc.settled) {
        return;
    }
    proc.settled = true;

    // The process stays tracked until its exit is observed and it is reaped
    InvocationCallback callback = std::move(proc.done);
    proc.done = nullptr;
    if (callback) {
        callback(std::move(outcome));
    }
}

void WorkerSupervisor::kill_process(WorkerProcess& proc) noexcept {
    if (proc.pid > 0 && !proc.killed) {
        ::kill(proc.pid, SIGKILL);
        proc.killed = true;
    }
}

void WorkerSupervisor::release(uint64_t serial) {
    auto it = processes_.find(serial);
    if (it == processes_.end()) {
        return;
    }

    std::unique_ptr<WorkerProcess> proc = std::move(it->second);
    processes_.erase(it);

    for (int* fd : {&proc->stdout_fd, &proc->stderr_fd, &proc->ipc_fd, &proc->pidfd}) {
        if (*fd >= 0) {
            loop_.remove(*fd);
            core::close_fd(*fd);
            *fd = -1;
        }
    }

    if (proc->pid > 0) {
        ::kill(proc->pid, SIGKILL);
        reap(proc->pid);
        proc->pid = -1;
    }
}

}  // namespace lamina::runtime
