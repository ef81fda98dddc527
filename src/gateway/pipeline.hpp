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

// Lamina Pipeline - Header
// Middleware chain run on every request before dispatch

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../http/http.hpp"

namespace lamina::gateway {

/// Request context (passed through middleware chain); both pointers are always set
struct RequestContext {
    http::Request* request = nullptr;
    http::Response* response = nullptr;
};

/// Middleware result
enum class MiddlewareResult {
    Continue,  // Continue to next middleware
    Stop,      // Response is complete, do not dispatch
};

/// Middleware base class
class Middleware {
public:
    virtual ~Middleware() = default;

    /// Process request phase (before dispatch to a function)
    [[nodiscard]] virtual MiddlewareResult process_request(RequestContext& ctx) = 0;

    /// Get middleware name (for debugging)
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// CORS middleware: permissive headers on every response, preflight answered here
class CorsMiddleware : public Middleware {
public:
    static constexpr std::string_view kAllowMethods = "POST, GET, PUT, DELETE, OPTIONS, XMODIFY";
    static constexpr std::string_view kAllowHeaders =
        "X-Requested-With, X-HTTP-Method-Override, Content-Type, Accept, Authorization";
    static constexpr std::string_view kMaxAge = "86400";

    MiddlewareResult process_request(RequestContext& ctx) override;
    std::string_view name() const override { return "CorsMiddleware"; }
};

/// Rejects requests whose Referer points anywhere but localhost
/// (installed only when CORS is disabled)
class LocalRefererMiddleware : public Middleware {
public:
    MiddlewareResult process_request(RequestContext& ctx) override;
    std::string_view name() const override { return "LocalRefererMiddleware"; }
};

/// Rejects requests whose Host header names anything but localhost
class LocalHostMiddleware : public Middleware {
public:
    MiddlewareResult process_request(RequestContext& ctx) override;
    std::string_view name() const override { return "LocalHostMiddleware"; }
};

/// 403 with a pretty-printed {"message": ...} body
void set_forbidden(http::Response& response, std::string_view message);

/// Middleware pipeline
class Pipeline {
public:
    Pipeline() = default;
    ~Pipeline() = default;

    // Non-copyable, movable
    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) noexcept = default;
    Pipeline& operator=(Pipeline&&) noexcept = default;

    /// Add middleware to pipeline
    void use(std::unique_ptr<Middleware> middleware);

    /// Run middleware in order until one stops
    [[nodiscard]] MiddlewareResult execute_request(RequestContext& ctx);

    /// Get middleware count
    [[nodiscard]] size_t size() const noexcept { return middleware_.size(); }

    /// Names in execution order
    [[nodiscard]] std::vector<std::string_view> names() const;

private:
    std::vector<std::unique_ptr<Middleware>> middleware_;
};

}  // namespace lamina::gateway
