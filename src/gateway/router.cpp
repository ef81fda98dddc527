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

// Lamina Router - Implementation

#include "router.hpp"

namespace lamina::gateway {

bool is_proxy_pattern(std::string_view pattern) noexcept {
    return pattern.ends_with("+}");
}

std::string_view proxy_prefix(std::string_view pattern) noexcept {
    size_t brace = pattern.rfind('{');
    if (brace == std::string_view::npos) {
        return pattern;
    }
    return pattern.substr(0, brace);
}

void Router::add_route(std::string_view pattern, size_t function_index) {
    Route route;
    route.pattern = std::string(pattern);
    route.is_proxy = is_proxy_pattern(pattern);
    route.prefix = route.is_proxy ? std::string(proxy_prefix(pattern)) : route.pattern;
    route.function_index = function_index;
    routes_.push_back(std::move(route));
}

RouteMatch Router::match(std::string_view pathname) const noexcept {
    for (const auto& route : routes_) {
        if (route.is_proxy) {
            // The bare prefix itself is not a match
            if (pathname.size() > route.prefix.size() && pathname.starts_with(route.prefix)) {
                return RouteMatch{&route, pathname.substr(route.prefix.size())};
            }
        } else if (pathname == route.pattern) {
            return RouteMatch{&route, {}};
        }
    }
    return RouteMatch{};
}

}  // namespace lamina::gateway
