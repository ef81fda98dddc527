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

// Lamina Worker Bootstrap - Implementation

#include "bootstrap.hpp"

#include <fmt/format.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>

#include "../core/containers.hpp"

namespace lamina::runtime {

namespace {

constexpr std::string_view kNodeBootstrap = R"JS('use strict'
const path = require('path')

const entry = process.argv[2]
const handlerName = process.argv[3] || 'handler'

function sendResult (id, result) {
  process.send({
    type: 'result',
    id,
    result,
    memoryUsedBytes: process.memoryUsage().rss
  })
}

function fail (err) {
  console.error(err && err.stack ? err.stack : String(err))
  process.exit(1)
}

process.once('message', (msg) => {
  if (!msg || msg.type !== 'event') {
    fail(new Error('unexpected message from gateway'))
    return
  }

  let fn
  try {
    const mod = require(path.resolve(entry))
    fn = mod[handlerName]
  } catch (err) {
    fail(err)
    return
  }
  if (typeof fn !== 'function') {
    fail(new Error(`handler '${handlerName}' is not exported by ${entry}`))
    return
  }

  const context = {
    awsRequestId: msg.id,
    functionName: path.basename(entry),
    getRemainingTimeInMillis: () => Infinity
  }

  let settled = false
  const callback = (err, result) => {
    if (settled) return
    settled = true
    if (err) {
      fail(err)
      return
    }
    sendResult(msg.id, result)
  }

  try {
    const ret = fn(msg.eventObject, context, callback)
    if (ret && typeof ret.then === 'function') {
      ret.then((result) => callback(null, result), callback)
    }
  } catch (err) {
    callback(err)
  }
})
)JS";

// Artifacts written by this process: path -> content hash
std::mutex g_written_mutex;
core::fast_map<std::string, size_t> g_written;

}  // anonymous namespace

std::string_view default_bootstrap_source() noexcept {
    return kNodeBootstrap;
}

std::string materialize_bootstrap(std::string_view dir, std::string_view source,
                                  std::error_code& ec) {
    namespace fs = std::filesystem;

    fs::path directory = fs::absolute(fs::path(dir), ec);
    if (ec) {
        return {};
    }
    fs::path target = directory / kBootstrapFileName;
    std::string target_str = target.string();
    size_t content_hash = std::hash<std::string_view>{}(source);

    std::lock_guard lock(g_written_mutex);

    auto it = g_written.find(target_str);
    if (it != g_written.end() && it->second == content_hash && fs::exists(target, ec)) {
        return target_str;
    }

    fs::create_directories(directory, ec);
    if (ec) {
        return {};
    }

    fs::path temp = directory / fmt::format("{}.{}.tmp", kBootstrapFileName, getpid());
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            ec = std::make_error_code(std::errc::permission_denied);
            return {};
        }
        out.write(source.data(), static_cast<std::streamsize>(source.size()));
        if (!out.good()) {
            ec = std::make_error_code(std::errc::io_error);
            return {};
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return {};
    }

    g_written[target_str] = content_hash;
    return target_str;
}

}  // namespace lamina::runtime
