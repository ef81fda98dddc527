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

// Lamina Dispatcher - Header
// Correlates requests with invocation outcomes

#pragma once

#include <quill/Logger.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../control/config.hpp"
#include "../core/containers.hpp"
#include "../core/event_loop.hpp"
#include "../http/http.hpp"
#include "../runtime/ipc.hpp"
#include "../runtime/worker_supervisor.hpp"
#include "event.hpp"
#include "router.hpp"

namespace lamina::gateway {

/// Receives the terminal outcome of one dispatched request
using ResponseSink = std::function<void(runtime::InvocationOutcome)>;

/// Request waiting for its outcome
struct PendingRequest {
    ResponseSink sink;
    std::chrono::steady_clock::time_point start_time;
    std::string method;
    std::string path;
    std::string function;  // Matched route pattern, empty on a routing miss
};

/// Routes events to worker supervisors and delivers each outcome exactly once
///
/// All calls happen on the event loop thread. An outcome for an id that is
/// not pending, or tracking an id twice, throws std::logic_error.
class Dispatcher {
public:
    Dispatcher(core::EventLoop& loop, std::vector<control::FunctionConfig> functions,
               const runtime::RuntimeSettings& settings, bool silent);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Assign a correlation id, route the event and start the invocation.
    /// A routing miss resolves synchronously with 403 {"message":"Forbidden"}.
    /// @return Correlation id of the invocation
    std::string dispatch(const Event& event, ResponseSink sink);

    /// Record a pending request under id
    void track(const std::string& id, PendingRequest entry);

    /// Remove the pending entry for id and hand it the outcome
    void resolve(const std::string& id, runtime::InvocationOutcome outcome);

    [[nodiscard]] bool has_pending(const std::string& id) const noexcept {
        return pending_.contains(id);
    }

    [[nodiscard]] size_t pending_count() const noexcept { return pending_.size(); }

    /// Kill every worker; pending requests are dropped without delivery
    void close_all();

    /// Tracked worker processes across all functions
    [[nodiscard]] size_t active_workers() const noexcept;

    [[nodiscard]] const Router& router() const noexcept { return *router_; }

    [[nodiscard]] const std::vector<control::FunctionConfig>& functions() const noexcept {
        return functions_;
    }

    void set_logger(quill::Logger* logger) noexcept;

private:
    core::EventLoop& loop_;
    std::vector<control::FunctionConfig> functions_;
    std::unique_ptr<Router> router_;
    std::vector<std::unique_ptr<runtime::WorkerSupervisor>> supervisors_;  // Index == route index
    core::fast_map<std::string, PendingRequest> pending_;
    quill::Logger* logger_ = nullptr;
};

/// Path portion of a request target: query and fragment removed, the
/// authority of an absolute-form target ("http://host/x") dropped
[[nodiscard]] std::string_view request_pathname(std::string_view target) noexcept;

/// Result object answering a routing miss
[[nodiscard]] runtime::InvocationResult forbidden_result();

/// Write an outcome into a response: headers, status and body
void apply_outcome(const runtime::InvocationOutcome& outcome, http::Response& response);

/// Status code apply_outcome would produce
[[nodiscard]] uint16_t outcome_status(const runtime::InvocationOutcome& outcome) noexcept;

}  // namespace lamina::gateway
