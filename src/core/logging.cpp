#include "logging.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <filesystem>
#include <random>
#include <span>

#include "../control/config.hpp"

namespace lamina::logging {

static quill::Logger* g_current_logger = nullptr;

void init_logging_system() {
  quill::Backend::start();
}

quill::Logger* init_gateway_logger(const control::LogConfig& log_config) {
  std::filesystem::create_directories(log_config.output);

  quill::RotatingFileSinkConfig config;
  config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000);
  config.set_max_backup_files(log_config.rotation.max_files);
  config.set_open_mode('a');

  quill::Logger* logger = nullptr;

  if (log_config.format == "json") {
    std::string log_path = fmt::format("{}/gateway.json", log_config.output);
    auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
        log_path, config);
    logger = quill::Frontend::create_or_get_logger("gateway", std::move(json_sink));
  } else {
    std::string log_path = fmt::format("{}/gateway.log", log_config.output);
    auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
        log_path, config);
    logger = quill::Frontend::create_or_get_logger("gateway", std::move(file_sink));
  }

  std::string level_lower = log_config.level;
  std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(), ::tolower);

  if (level_lower == "debug") {
    logger->set_log_level(quill::LogLevel::Debug);
  } else if (level_lower == "info") {
    logger->set_log_level(quill::LogLevel::Info);
  } else if (level_lower == "warning" || level_lower == "warn") {
    logger->set_log_level(quill::LogLevel::Warning);
  } else if (level_lower == "error") {
    logger->set_log_level(quill::LogLevel::Error);
  } else {
    logger->set_log_level(quill::LogLevel::Info);
  }

  g_current_logger = logger;
  return logger;
}

quill::Logger* ensure_gateway_logger(const control::LogConfig& log_config) {
  if (g_current_logger) {
    return g_current_logger;
  }
  init_logging_system();
  return init_gateway_logger(log_config);
}

void shutdown_logging() {
  if (g_current_logger) {
    g_current_logger->flush_log();
  }
  quill::Backend::stop();
}

quill::Logger* get_current_logger() {
  return g_current_logger;
}

// Base UUID v4 shared by every correlation id of this process
static std::string generate_base_uuid() {
  std::array<uint8_t, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    // RAND_bytes failed: fall back to the OS entropy source
    std::random_device device;
    for (auto& byte : bytes) {
      byte = static_cast<uint8_t>(device());
    }
  }

  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

  std::span<const uint8_t> b(bytes);
  return fmt::format("{:02x}-{:02x}-{:02x}-{:02x}-{:02x}", fmt::join(b.subspan(0, 4), ""),
                     fmt::join(b.subspan(4, 2), ""), fmt::join(b.subspan(6, 2), ""),
                     fmt::join(b.subspan(8, 2), ""), fmt::join(b.subspan(10, 6), ""));
}

std::string generate_correlation_id() {
  // Format: {base_uuid}#{counter}
  // The counter never repeats within one process
  static const std::string base_uuid = generate_base_uuid();
  static std::atomic<uint64_t> counter{0};

  return fmt::format("{}#{}", base_uuid, counter.fetch_add(1));
}

bool is_valid_correlation_id(std::string_view id) {
  // Example: 550e8400-e29b-41d4-a716-446655440000#42
  size_t hash_pos = id.rfind('#');
  if (hash_pos == std::string_view::npos) {
    return false;  // No separator found
  }

  std::string_view uuid_part = id.substr(0, hash_pos);
  std::string_view counter_part = id.substr(hash_pos + 1);

  // Validate UUID part (36 characters: 8-4-4-4-12 with hyphens)
  if (uuid_part.length() != 36) {
    return false;
  }

  if (uuid_part[8] != '-' || uuid_part[13] != '-' || uuid_part[18] != '-' ||
      uuid_part[23] != '-') {
    return false;
  }

  // Check version (character 14 must be '4')
  if (uuid_part[14] != '4') {
    return false;
  }

  // Check variant (character 19 must be '8', '9', 'a', or 'b')
  char variant = uuid_part[19];
  if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' &&
      variant != 'A' && variant != 'B') {
    return false;
  }

  auto is_hex = [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
  };

  for (size_t i = 0; i < 36; ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23)
      continue;  // Skip hyphens
    if (!is_hex(uuid_part[i])) return false;
  }

  if (counter_part.empty()) {
    return false;
  }

  return std::all_of(counter_part.begin(), counter_part.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace lamina::logging
