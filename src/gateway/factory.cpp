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

// Gateway Component Factory - Implementation

#include "factory.hpp"

#include "../core/logging.hpp"

namespace lamina::gateway {

std::unique_ptr<Router> build_router(const std::vector<control::FunctionConfig>& functions) {
    auto router = std::make_unique<Router>();

    for (size_t i = 0; i < functions.size(); ++i) {
        router->add_route(functions[i].path, i);
    }

    if (auto* logger = logging::get_current_logger()) {
        LOG_DEBUG(logger, "Router built with {} routes", router->routes().size());
    }

    return router;
}

std::unique_ptr<Pipeline> build_pipeline(const control::Config& config) {
    auto pipeline = std::make_unique<Pipeline>();

    // Order matters: middleware runs in order added
    if (config.enable_cors) {
        pipeline->use(std::make_unique<CorsMiddleware>());
    } else {
        pipeline->use(std::make_unique<LocalRefererMiddleware>());
    }
    pipeline->use(std::make_unique<LocalHostMiddleware>());

    return pipeline;
}

}  // namespace lamina::gateway
