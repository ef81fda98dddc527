// Lamina Socket Utilities - Header

#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace lamina::core {

/// Create non-blocking, close-on-exec listening socket
/// Returns -1 on failure with errno describing the failing step
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog = 128);

/// Port a bound socket actually listens on (resolves port 0), 0 on failure
[[nodiscard]] uint16_t bound_port(int fd) noexcept;

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_cloexec(int fd);
[[nodiscard]] std::error_code set_reuseaddr(int fd);

void close_fd(int fd);

} // namespace lamina::core
