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

// Lamina Pipeline - Implementation

#include "pipeline.hpp"

#include <nlohmann/json.hpp>

#include "../core/logging.hpp"
#include "event.hpp"

namespace lamina::gateway {

void set_forbidden(http::Response& response, std::string_view message) {
    response.set_status(http::StatusCode::Forbidden);
    response.body = nlohmann::json{{"message", message}}.dump(2);
}

// CorsMiddleware implementation

MiddlewareResult CorsMiddleware::process_request(RequestContext& ctx) {
    std::string_view origin = ctx.request->get_header("Origin", "*");
    ctx.response->set_header("Access-Control-Allow-Origin", origin);
    ctx.response->set_header("Access-Control-Allow-Methods", kAllowMethods);
    ctx.response->set_header("Access-Control-Allow-Credentials", "true");
    ctx.response->set_header("Access-Control-Max-Age", kMaxAge);
    ctx.response->set_header("Access-Control-Allow-Headers", kAllowHeaders);

    // Handle OPTIONS preflight
    if (ctx.request->method_name == "OPTIONS") {
        ctx.response->set_status(http::StatusCode::OK);
        ctx.response->body.clear();
        return MiddlewareResult::Stop;
    }

    return MiddlewareResult::Continue;
}

// LocalRefererMiddleware implementation

MiddlewareResult LocalRefererMiddleware::process_request(RequestContext& ctx) {
    const http::Header* referer = ctx.request->find_header("Referer");
    if (!referer) {
        return MiddlewareResult::Continue;
    }

    auto hostname = url_hostname(referer->value);
    if (!hostname || *hostname != "localhost") {
        auto* logger = logging::get_current_logger();
        LOG_WARNING(logger, "Request rejected: referer={}, path={}", referer->value,
                    ctx.request->uri);
        set_forbidden(*ctx.response, "expected request from localhost");
        return MiddlewareResult::Stop;
    }

    return MiddlewareResult::Continue;
}

// LocalHostMiddleware implementation

MiddlewareResult LocalHostMiddleware::process_request(RequestContext& ctx) {
    const http::Header* host = ctx.request->find_header("Host");
    if (!host) {
        return MiddlewareResult::Continue;
    }

    if (host_component(host->value) != "localhost") {
        auto* logger = logging::get_current_logger();
        LOG_WARNING(logger, "Request rejected: host={}, path={}", host->value, ctx.request->uri);
        set_forbidden(*ctx.response, "unexpected host header");
        return MiddlewareResult::Stop;
    }

    return MiddlewareResult::Continue;
}

// Pipeline implementation

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) {
    for (auto& middleware : middleware_) {
        if (middleware->process_request(ctx) == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }
    }

    return MiddlewareResult::Continue;
}

std::vector<std::string_view> Pipeline::names() const {
    std::vector<std::string_view> out;
    out.reserve(middleware_.size());
    for (const auto& middleware : middleware_) {
        out.push_back(middleware->name());
    }
    return out;
}

}  // namespace lamina::gateway
