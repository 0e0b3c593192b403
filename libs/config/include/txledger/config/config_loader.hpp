#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace txledger {
namespace config {

enum class ProcessingMode : std::uint8_t {
  kSequential,
  kPartitioned,
};

struct InputConfig {
  bool require_header{false};
  std::size_t max_recorded_errors{32};
};

struct ProcessingConfig {
  ProcessingMode mode{ProcessingMode::kSequential};
  std::size_t workers{4};
  std::size_t queue_depth{1 << 12};
  std::size_t arena_bytes{1 << 20};
};

struct OutputConfig {
  bool digest{false};
};

struct TelemetryConfig {
  bool enabled{false};
};

struct LoggingConfig {
  bool verbose{false};
};

struct LedgerConfig {
  InputConfig input;
  ProcessingConfig processing;
  OutputConfig output;
  TelemetryConfig telemetry;
  LoggingConfig logging;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  LedgerConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const LedgerConfig& config);
  static std::string generate_default();
};

std::string_view to_string(ProcessingMode mode) noexcept;

}  // namespace config
}  // namespace txledger
