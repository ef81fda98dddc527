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

// Gateway Component Factory - Header
// Factory functions for building gateway components (Router, Pipeline)

#pragma once

#include <memory>
#include <vector>

#include "../control/config.hpp"
#include "pipeline.hpp"
#include "router.hpp"

namespace lamina::gateway {

/// Build router over function registrations (route index == function index)
[[nodiscard]] std::unique_ptr<Router> build_router(
    const std::vector<control::FunctionConfig>& functions);

/// Build the security pipeline: CORS or Referer check, then Host check
[[nodiscard]] std::unique_ptr<Pipeline> build_pipeline(const control::Config& config);

}  // namespace lamina::gateway
