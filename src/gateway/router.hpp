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

// Lamina Router - Header
// Ordered path matching over function registrations (exact and proxy patterns)

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lamina::gateway {

/// Route definition (one per registered function)
struct Route {
    std::string pattern;         // As registered ("/hello", "/api/{proxy+}")
    std::string prefix;          // Literal prefix for proxy patterns, pattern otherwise
    bool is_proxy = false;       // Pattern ends in "+}"
    size_t function_index = 0;   // Index of the function this route belongs to
};

/// Match result from router
struct RouteMatch {
    const Route* route = nullptr;
    std::string_view proxy;  // Path remainder after the proxy prefix (empty for exact)

    [[nodiscard]] bool matched() const noexcept { return route != nullptr; }
};

/// True if pattern is a proxy pattern ("/prefix/{name+}")
[[nodiscard]] bool is_proxy_pattern(std::string_view pattern) noexcept;

/// Literal prefix of a proxy pattern: everything before the last '{'
[[nodiscard]] std::string_view proxy_prefix(std::string_view pattern) noexcept;

/// Router with first-match-wins semantics in registration order
class Router {
public:
    Router() = default;

    /// Register a pattern for function_index (appended after existing routes)
    void add_route(std::string_view pattern, size_t function_index);

    /// Find the first route matching pathname (query string already removed)
    /// Exact: pathname == pattern. Proxy: pathname starts with the prefix and
    /// is strictly longer than it.
    [[nodiscard]] RouteMatch match(std::string_view pathname) const noexcept;

    /// Get all registered routes
    [[nodiscard]] const std::vector<Route>& routes() const noexcept { return routes_; }

    [[nodiscard]] bool empty() const noexcept { return routes_.empty(); }

private:
    std::vector<Route> routes_;
};

/// Convenience for registration lists: index of the first entry whose
/// `path` member matches, or nullopt
template <typename Functions>
[[nodiscard]] std::optional<size_t> match_function(const Functions& functions,
                                                   std::string_view pathname) {
    Router router;
    size_t index = 0;
    for (const auto& function : functions) {
        router.add_route(function.path, index++);
    }
    auto result = router.match(pathname);
    if (!result.matched()) {
        return std::nullopt;
    }
    return result.route->function_index;
}

}  // namespace lamina::gateway
