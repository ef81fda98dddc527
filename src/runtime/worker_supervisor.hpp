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

// Lamina Worker Supervisor - Header
// Spawns one isolated process per invocation and exchanges one event/result pair

#pragma once

#include <quill/Logger.h>
#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "../control/config.hpp"
#include "../core/containers.hpp"
#include "../core/event_loop.hpp"
#include "ipc.hpp"
#include "log_sink.hpp"

namespace lamina::runtime {

/// Gateway-wide settings shared by every supervisor
struct RuntimeSettings {
    std::string bin = "node";                // Worker executable (PATH lookup if no '/')
    std::string bootstrap_path;              // Materialized bootstrap artifact
    std::map<std::string, std::string> env;  // Complete worker environment
};

/// Called exactly once per invocation with its terminal outcome
using InvocationCallback = std::function<void(InvocationOutcome)>;

/// One spawned worker (never reused)
struct WorkerProcess {
    uint64_t serial = 0;
    std::string id;  // Correlation id of the invocation it serves
    pid_t pid = -1;
    int pidfd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;
    int ipc_fd = -1;

    std::chrono::steady_clock::time_point start;
    std::chrono::system_clock::time_point start_wall;

    LineBuffer stdout_lines;
    LineBuffer stderr_lines;
    LineBuffer ipc_lines;

    std::string first_stderr_chunk;  // Crash diagnostic (first read only)
    bool stderr_captured = false;

    std::string ipc_out;  // Unsent part of the event message
    bool settled = false;
    bool killed = false;
    InvocationCallback done;
};

/// Lifecycle of one function's worker processes
class WorkerSupervisor {
public:
    WorkerSupervisor(core::EventLoop& loop, control::FunctionConfig function,
                     const RuntimeSettings& settings, std::shared_ptr<LogSink> stdout_sink,
                     std::shared_ptr<LogSink> stderr_sink);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    /// Spawn a worker for this invocation and send it the event.
    /// done runs on the loop thread (synchronously if the spawn fails).
    void invoke(const std::string& id, const nlohmann::json& event, InvocationCallback done);

    /// SIGKILL and reap every tracked process; their callbacks are dropped
    void close_all();

    /// Set logger for gateway diagnostics
    void set_logger(quill::Logger* logger) noexcept { logger_ = logger; }

    [[nodiscard]] const control::FunctionConfig& function() const noexcept { return function_; }

    /// Number of tracked (not yet reaped) processes
    [[nodiscard]] size_t active_count() const noexcept { return processes_.size(); }

    /// Pids of tracked processes
    [[nodiscard]] std::vector<pid_t> active_pids() const;

private:
    /// fork/exec the worker with its descriptors wired up
    [[nodiscard]] std::error_code spawn(WorkerProcess& proc);

    void on_stdout(uint64_t serial);
    void on_stderr(uint64_t serial);
    void on_ipc(uint64_t serial, uint32_t events);
    void on_exit(uint64_t serial);

    /// Read everything currently available on fd (returns false on EOF)
    bool drain(int fd, std::string& out);

    void emit_lines(WorkerProcess& proc, LineBuffer& lines, LogSink& sink, std::string_view tag,
                    bool flush_partial);
    void handle_ipc_input(WorkerProcess& proc);
    void flush_ipc_output(WorkerProcess& proc);
    void handle_message(WorkerProcess& proc, std::string_view line);

    /// Deliver outcome once; the process stays tracked until it is reaped
    void settle(WorkerProcess& proc, InvocationOutcome outcome);

    void kill_process(WorkerProcess& proc) noexcept;

    /// Deregister and close descriptors, forget the process
    void release(uint64_t serial);

    [[nodiscard]] WorkerProcess* find(uint64_t serial) noexcept;

    core::EventLoop& loop_;
    control::FunctionConfig function_;
    RuntimeSettings settings_;
    std::shared_ptr<LogSink> stdout_sink_;
    std::shared_ptr<LogSink> stderr_sink_;
    quill::Logger* logger_ = nullptr;

    uint64_t next_serial_ = 1;
    core::fast_map<uint64_t, std::unique_ptr<WorkerProcess>> processes_;
};

/// Resolve an executable name the way execvp would, searching the PATH of
/// env first and then the gateway's own PATH. Empty if nothing is found.
[[nodiscard]] std::string resolve_executable(std::string_view bin,
                                             const std::map<std::string, std::string>& env);

}  // namespace lamina::runtime
