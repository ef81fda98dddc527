#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace lamina::control {
struct LogConfig;
}

namespace lamina::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Initialize the gateway logger with config-driven settings
// Writes to <output>/gateway.log, or <output>/gateway.json in json format
quill::Logger* init_gateway_logger(const lamina::control::LogConfig& config);

// Current gateway logger, or a freshly initialized one (backend started on demand)
quill::Logger* ensure_gateway_logger(const lamina::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// Correlation id for one request: UUID v4 base (generated once per process)
// followed by '#' and a monotonically increasing counter
std::string generate_correlation_id();

// Validate correlation id format ({8-4-4-4-12}#{digits})
bool is_valid_correlation_id(std::string_view id);

// Get the gateway logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Logging macros for structured logging

// Invocation completion logging
#define LOG_INVOCATION(logger, method, path, function, status, duration_ms, correlation_id) \
    LOG_INFO(logger,                                                                        \
             "Invocation completed: method={}, path={}, function={}, status={}, "          \
             "duration_ms={}, correlation_id={}",                                           \
             method, path, function, status, duration_ms, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_kind, error_detail)      \
    LOG_ERROR(logger, "{}: correlation_id={}, error_kind={}, error_detail={}", message, \
              correlation_id, error_kind, error_detail)

// Worker process event logging
#define LOG_WORKER(logger, event, function, pid, correlation_id)                            \
    LOG_INFO(logger, "Worker {}: function={}, pid={}, correlation_id={}", event, function, \
             pid, correlation_id)

}  // namespace lamina::logging
