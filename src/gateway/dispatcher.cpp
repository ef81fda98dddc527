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

// Lamina Dispatcher - Implementation

#include "dispatcher.hpp"

#include <fmt/format.h>

#include <stdexcept>

#include "../core/logging.hpp"
#include "../runtime/log_sink.hpp"
#include "factory.hpp"

namespace lamina::gateway {

namespace {

constexpr std::string_view kForbiddenBody = R"({"message":"Forbidden"})";

}  // namespace

Dispatcher::Dispatcher(core::EventLoop& loop, std::vector<control::FunctionConfig> functions,
                       const runtime::RuntimeSettings& settings, bool silent)
    : loop_(loop),
      functions_(std::move(functions)),
      router_(build_router(functions_)),
      logger_(logging::get_current_logger()) {
    supervisors_.reserve(functions_.size());
    for (const auto& function : functions_) {
        auto stdout_sink = function.stdout_sink;
        auto stderr_sink = function.stderr_sink;
        if (!stdout_sink) {
            stdout_sink = silent ? runtime::null_sink() : runtime::default_stdout_sink();
        }
        if (!stderr_sink) {
            stderr_sink = silent ? runtime::null_sink() : runtime::default_stderr_sink();
        }
        supervisors_.push_back(std::make_unique<runtime::WorkerSupervisor>(
            loop_, function, settings, std::move(stdout_sink), std::move(stderr_sink)));
    }
}

Dispatcher::~Dispatcher() {
    close_all();
}

void Dispatcher::set_logger(quill::Logger* logger) noexcept {
    logger_ = logger;
    for (auto& supervisor : supervisors_) {
        supervisor->set_logger(logger);
    }
}

std::string Dispatcher::dispatch(const Event& event, ResponseSink sink) {
    std::string id = logging::generate_correlation_id();
    std::string_view pathname = request_pathname(event.path);
    auto match = router_->match(pathname);

    PendingRequest entry;
    entry.sink = std::move(sink);
    entry.start_time = std::chrono::steady_clock::now();
    entry.method = event.http_method;
    entry.path = event.path;
    if (match.matched()) {
        entry.function = match.route->pattern;
    }
    track(id, std::move(entry));

    if (!match.matched()) {
        LOG_DEBUG(logger_, "No function for path: path={}, correlation_id={}", pathname, id);
        resolve(id, runtime::InvocationOutcome::success(forbidden_result()));
        return id;
    }

    auto& supervisor = *supervisors_[match.route->function_index];
    supervisor.invoke(id, event.to_json(), [this, id](runtime::InvocationOutcome outcome) {
        resolve(id, std::move(outcome));
    });
    return id;
}

void Dispatcher::track(const std::string& id, PendingRequest entry) {
    auto [it, inserted] = pending_.try_emplace(id, std::move(entry));
    if (!inserted) {
        throw std::logic_error(fmt::format("correlation id {} is already pending", id));
    }
}

void Dispatcher::resolve(const std::string& id, runtime::InvocationOutcome outcome) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        throw std::logic_error(fmt::format("no pending request for correlation id {}", id));
    }

    PendingRequest entry = std::move(it->second);
    pending_.erase(it);

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::steady_clock::now() - entry.start_time)
                           .count();
    LOG_INVOCATION(logger_, entry.method, entry.path, entry.function, outcome_status(outcome),
                   duration_ms, id);

    if (entry.sink) {
        entry.sink(std::move(outcome));
    }
}

void Dispatcher::close_all() {
    for (auto& supervisor : supervisors_) {
        supervisor->close_all();
    }
    if (!pending_.empty()) {
        LOG_INFO(logger_, "Dropping {} pending requests on close", pending_.size());
    }
    pending_.clear();
}

size_t Dispatcher::active_workers() const noexcept {
    size_t total = 0;
    for (const auto& supervisor : supervisors_) {
        total += supervisor->active_count();
    }
    return total;
}

std::string_view request_pathname(std::string_view target) noexcept {
    // Absolute-form: skip "scheme://authority"
    if (auto scheme_end = target.find("://"); scheme_end != std::string_view::npos &&
                                              target.find('/') > scheme_end) {
        std::string_view rest = target.substr(scheme_end + 3);
        size_t path_start = rest.find_first_of("/?#");
        target = path_start == std::string_view::npos ? std::string_view("/")
                                                      : rest.substr(path_start);
    }

    size_t end = target.find_first_of("?#");
    std::string_view pathname = target.substr(0, end);
    return pathname.empty() ? std::string_view("/") : pathname;
}

runtime::InvocationResult forbidden_result() {
    runtime::InvocationResult result;
    result.status_code = 403;
    result.body = std::string(kForbiddenBody);
    result.multi_value_headers.emplace();
    return result;
}

uint16_t outcome_status(const runtime::InvocationOutcome& outcome) noexcept {
    if (!outcome.ok()) {
        return static_cast<uint16_t>(http::StatusCode::InternalServerError);
    }
    if (outcome.result->is_base64_encoded) {
        return static_cast<uint16_t>(http::StatusCode::BadRequest);
    }
    return static_cast<uint16_t>(outcome.result->status_code);
}

void apply_outcome(const runtime::InvocationOutcome& outcome, http::Response& response) {
    if (!outcome.ok()) {
        const auto& error = *outcome.error;
        response.status = outcome_status(outcome);
        response.body =
            nlohmann::json{{"message", error.message}, {"stack", error.stack_lines}}.dump(
                2, ' ', false, nlohmann::json::error_handler_t::replace);
        return;
    }

    const auto& result = *outcome.result;

    // Single-valued first; a multi-valued entry replaces a same-named header
    for (const auto& [name, value] : result.headers) {
        response.set_header(name, value);
    }
    if (result.multi_value_headers) {
        for (const auto& [name, values] : *result.multi_value_headers) {
            response.set_header(name, values);
        }
    }

    response.status = outcome_status(outcome);
    if (result.is_base64_encoded) {
        response.body = std::string(kForbiddenBody);
    } else {
        response.body = result.body;
    }
}

}  // namespace lamina::gateway
