#include "txledger/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>

namespace txledger {
namespace config {

namespace {

constexpr std::size_t kMaxWorkers = 256;
constexpr std::size_t kMinArenaBytes = 1 << 16;
constexpr std::size_t kMaxArenaBytes = std::size_t{1} << 30;

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

// Sizes must be non-negative; a negative value is reported and the default kept.
std::size_t get_size_or(const toml::table& tbl, std::string_view key, std::size_t default_val,
                        std::string_view section, std::vector<ValidationError>& errors) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    if (*val < 0) {
      errors.push_back({std::string(section) + "." + std::string(key), "must not be negative"});
      return default_val;
    }
    return static_cast<std::size_t>(*val);
  }
  return default_val;
}

InputConfig parse_input(const toml::table& root, std::vector<ValidationError>& errors) {
  InputConfig cfg;
  if (auto* input = root["input"].as_table()) {
    cfg.require_header = get_bool_or(*input, "require_header", cfg.require_header);
    cfg.max_recorded_errors = get_size_or(*input, "max_recorded_errors", cfg.max_recorded_errors, "input", errors);
  }
  return cfg;
}

ProcessingConfig parse_processing(const toml::table& root, std::vector<ValidationError>& errors) {
  ProcessingConfig cfg;
  if (auto* processing = root["processing"].as_table()) {
    const auto mode = get_str_or(*processing, "mode", to_string(cfg.mode));
    if (mode == "sequential") {
      cfg.mode = ProcessingMode::kSequential;
    } else if (mode == "partitioned") {
      cfg.mode = ProcessingMode::kPartitioned;
    } else {
      errors.push_back({"processing.mode", "must be \"sequential\" or \"partitioned\", got \"" + mode + "\""});
    }
    cfg.workers = get_size_or(*processing, "workers", cfg.workers, "processing", errors);
    cfg.queue_depth = get_size_or(*processing, "queue_depth", cfg.queue_depth, "processing", errors);
    cfg.arena_bytes = get_size_or(*processing, "arena_bytes", cfg.arena_bytes, "processing", errors);
  }
  return cfg;
}

OutputConfig parse_output(const toml::table& root) {
  OutputConfig cfg;
  if (auto* output = root["output"].as_table()) {
    cfg.digest = get_bool_or(*output, "digest", cfg.digest);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

LoggingConfig parse_logging(const toml::table& root) {
  LoggingConfig cfg;
  if (auto* logging = root["logging"].as_table()) {
    cfg.verbose = get_bool_or(*logging, "verbose", cfg.verbose);
  }
  return cfg;
}

LedgerConfig parse_config(const toml::table& root, std::vector<ValidationError>& errors) {
  LedgerConfig cfg;
  cfg.input = parse_input(root, errors);
  cfg.processing = parse_processing(root, errors);
  cfg.output = parse_output(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.logging = parse_logging(root);
  return cfg;
}

LoadResult finish(const toml::table& root) {
  LoadResult result;
  result.config = parse_config(root, result.errors);
  auto validation = ConfigLoader::validate(result.config);
  result.errors.insert(result.errors.end(), validation.begin(), validation.end());
  result.success = result.errors.empty();
  return result;
}

}  // namespace

std::string_view to_string(ProcessingMode mode) noexcept {
  switch (mode) {
    case ProcessingMode::kSequential:
      return "sequential";
    case ProcessingMode::kPartitioned:
      return "partitioned";
  }
  return "unknown";
}

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    LoadResult result;
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    LoadResult result;
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  return finish(parse_result.table());
}

std::vector<ValidationError> ConfigLoader::validate(const LedgerConfig& config) {
  std::vector<ValidationError> errors;

  if (config.processing.workers == 0 || config.processing.workers > kMaxWorkers) {
    errors.push_back({"processing.workers", "must be between 1 and " + std::to_string(kMaxWorkers)});
  }

  const auto depth = config.processing.queue_depth;
  if (depth < 2 || (depth & (depth - 1)) != 0) {
    errors.push_back({"processing.queue_depth", "must be a power of two >= 2"});
  }

  if (config.processing.arena_bytes < kMinArenaBytes || config.processing.arena_bytes > kMaxArenaBytes) {
    errors.push_back({"processing.arena_bytes", "must be between 64KB and 1GB"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# txledger configuration
# Generated default configuration

[input]
require_header = false
max_recorded_errors = 32

[processing]
mode = "sequential"   # or "partitioned"
workers = 4           # partitioned mode only
queue_depth = 4096    # per worker, power of two
arena_bytes = 1048576 # 1MB initial ledger arena

[output]
digest = false

[telemetry]
enabled = false

[logging]
verbose = false
)";
}

}  // namespace config
}  // namespace txledger
