#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string_view>
#include <vector>

#include "txledger/common/transaction.hpp"
#include "txledger/config/config_loader.hpp"
#include "txledger/ingest/csv_reader.hpp"
#include "txledger/ledger/ledger_state.hpp"
#include "txledger/replay/replay_driver.hpp"
#include "txledger/report/account_report.hpp"
#include "txledger/telemetry/telemetry_sink.hpp"

namespace {

struct CliOptions {
  std::filesystem::path input;
  std::filesystem::path config;
  bool digest{false};
  bool stats{false};
  bool print_config{false};
};

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [options] <transactions.csv>\n"
            << "  --config FILE    Path to TOML configuration file\n"
            << "                   If not specified, uses ./txledger.toml or built-in defaults\n"
            << "  --digest         Print a BLAKE2b digest of the final account state to stderr\n"
            << "  --stats          Print record outcome counters and apply latency to stderr\n"
            << "  --print-config   Print the default configuration and exit\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
  CliOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "--config needs a file argument\n";
        return std::nullopt;
      }
      options.config = argv[++i];
    } else if (arg == "--digest") {
      options.digest = true;
    } else if (arg == "--stats") {
      options.stats = true;
    } else if (arg == "--print-config") {
      options.print_config = true;
    } else if (arg.starts_with("--")) {
      std::cerr << "Unknown option: " << arg << "\n";
      return std::nullopt;
    } else if (options.input.empty()) {
      options.input = arg;
    } else {
      std::cerr << "Unexpected argument: " << arg << "\n";
      return std::nullopt;
    }
  }

  if (options.input.empty() && !options.print_config) {
    return std::nullopt;
  }
  return options;
}

std::filesystem::path find_config_path(const CliOptions& options) {
  if (!options.config.empty()) {
    return options.config;
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./txledger.toml",
      home ? std::filesystem::path{home} / ".config/txledger/txledger.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

std::optional<txledger::config::LedgerConfig> load_config(const CliOptions& options) {
  using namespace txledger;

  const auto config_path = find_config_path(options);
  const auto result = config_path.empty()
                          ? config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default())
                          : config::ConfigLoader::load(config_path);

  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Config error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return std::nullopt;
  }

  return result.config;
}

void print_telemetry(txledger::telemetry::TelemetrySink& sink) {
  using namespace txledger;

  std::cerr << "Record outcomes:\n";
  for (const auto& counter : sink.counters()) {
    std::cerr << "  " << telemetry::to_string(counter.metric) << ": " << counter.value << "\n";
  }
  for (const auto& summary : sink.drain_latency()) {
    std::cerr << "  " << telemetry::to_string(summary.metric) << ": count=" << summary.count
              << " mean_ns=" << summary.mean_ns << " p50_ns=" << summary.p50_ns
              << " p99_ns=" << summary.p99_ns << " max_ns=" << summary.max_ns << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace txledger;

  const auto options = parse_args(argc, argv);
  if (!options) {
    print_usage(argv[0]);
    return 2;
  }

  if (options->print_config) {
    std::cout << config::ConfigLoader::generate_default();
    return 0;
  }

  auto cfg = load_config(*options);
  if (!cfg) {
    return 1;
  }
  if (options->digest) {
    cfg->output.digest = true;
  }
  if (options->stats) {
    cfg->telemetry.enabled = true;
  }

  try {
    ingest::CsvReader reader(options->input, ingest::CsvReader::Options{
                                                 .require_header = cfg->input.require_header,
                                                 .max_recorded_errors = cfg->input.max_recorded_errors,
                                             });
    const replay::RecordSource source = [&reader](common::TransactionRecord& record) {
      return reader.next(record);
    };

    telemetry::TelemetrySink telemetry_sink;
    telemetry::TelemetrySink* sink = cfg->telemetry.enabled ? &telemetry_sink : nullptr;

    replay::Driver::OutcomeHandler log_ignored;
    if (cfg->logging.verbose) {
      log_ignored = [](const common::TransactionRecord& record, ledger::Outcome outcome) {
        std::cerr << "Ignored " << common::to_string(record.kind) << " client=" << record.client
                  << " tx=" << record.tx << ": " << ledger::to_string(outcome) << "\n";
      };
    }

    std::vector<ledger::Account> accounts;
    if (cfg->processing.mode == config::ProcessingMode::kSequential) {
      ledger::LedgerState state{cfg->processing.arena_bytes};
      replay::Driver driver;
      driver.set_telemetry(sink);
      driver.set_outcome_handler(log_ignored);
      driver.execute(source, state);
      accounts = state.finalize();
    } else {
      replay::PartitionedDriver driver{replay::PartitionedDriver::Config{
          .workers = cfg->processing.workers,
          .queue_depth = cfg->processing.queue_depth,
          .arena_bytes = cfg->processing.arena_bytes,
      }};
      driver.set_telemetry(sink);
      driver.set_outcome_handler(log_ignored);
      driver.execute(source);
      accounts = driver.accounts();
    }

    const auto& read_stats = reader.stats();
    if (sink) {
      sink->increment(telemetry::Metric::kMalformedRecords, static_cast<std::int64_t>(read_stats.malformed));
    }
    if (read_stats.malformed > 0) {
      std::cerr << "Skipped " << read_stats.malformed << " malformed row(s)\n";
      if (cfg->logging.verbose) {
        for (const auto& err : reader.errors()) {
          std::cerr << "  line " << err.line << ": " << err.message << "\n";
        }
      }
    }

    const auto rows = report::project(accounts);
    report::write_csv(std::cout, rows);

    if (cfg->output.digest) {
      std::cerr << "State digest: " << report::to_hex(report::state_digest(rows)) << "\n";
    }
    if (sink) {
      print_telemetry(*sink);
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
