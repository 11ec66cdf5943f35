#include "cli_shared.hpp"

#include "trip_atlas/config/configuration.hpp"
#include "trip_atlas/core/errors.hpp"
#include "trip_atlas/core/events.hpp"
#include "trip_atlas/core/types.hpp"
#include "trip_atlas/core/utils.hpp"
#include "trip_atlas/engine/trip_engine.hpp"
#include "trip_atlas/io/capture_io.hpp"

#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

using trip_atlas::FirstSeenMap;
using trip_atlas::Phase;

namespace cli = trip_atlas::cli;
namespace config = trip_atlas::config;
namespace core = trip_atlas::core;
namespace engine = trip_atlas::engine;
namespace io = trip_atlas::io;

config::Config load_config_or_default(const std::string &config_path) {
  config::Config cfg;
  if (!config_path.empty()) {
    cfg = config::Config::load(config_path);
  }
  cfg.validate();
  return cfg;
}

// Event stream on stdout, mirrored to `log_path` when one is given
class EventSink {
public:
  explicit EventSink(const std::string &log_path) {
    if (!log_path.empty()) {
      fs::path p(log_path);
      std::error_code ec;
      if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
      }
      if (ec) {
        throw trip_atlas::IOError("Cannot create log directory: " + ec.message());
      }
      log_file_ = std::make_unique<std::ofstream>(p);
      if (!*log_file_) {
        throw trip_atlas::IOError("Cannot create log file: " + log_path);
      }
    }
    tee_ = std::make_unique<cli::TeeBuf>(
        std::cout.rdbuf(), log_file_ ? log_file_->rdbuf() : nullptr);
    out_ = std::make_unique<std::ostream>(tee_.get());
  }

  std::ostream &out() { return *out_; }

private:
  std::unique_ptr<std::ofstream> log_file_;
  std::unique_ptr<cli::TeeBuf> tee_;
  std::unique_ptr<std::ostream> out_;
};

int synthesize_command(const std::string &captures_path,
                       const std::string &config_path,
                       const std::string &out_path,
                       const std::string &first_seen_path,
                       const std::string &log_path) {
  config::Config cfg;
  try {
    cfg = load_config_or_default(config_path);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  const trip_atlas::TripOptions options = cfg.trip_options();

  std::unique_ptr<EventSink> sink;
  try {
    sink = std::make_unique<EventSink>(log_path);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  core::EventEmitter emitter(core::get_run_id(), sink->out());
  emitter.run_start({{"captures_path", captures_path},
                     {"config_path", config_path},
                     {"out_path", out_path},
                     {"cluster_radius_km", options.cluster_radius_km},
                     {"extra_capture_policy",
                      trip_atlas::extra_capture_policy_to_string(options.extra_capture_policy)},
                     {"parallel_workers", options.parallel_workers}});

  // LOAD_INPUT
  emitter.phase_start(Phase::LOAD_INPUT);
  io::CaptureArchive archive;
  try {
    archive = io::load_capture_archive(captures_path);
  } catch (const std::exception &e) {
    emitter.phase_failed(Phase::LOAD_INPUT, e.what(), {{"captures_path", captures_path}});
    std::cerr << "Error during LOAD_INPUT: " << e.what() << std::endl;
    return 1;
  }
  emitter.phase_end(Phase::LOAD_INPUT, "ok",
                    {{"captures", archive.captures.size()},
                     {"first_seen_supplied", archive.first_seen.has_value()}});

  // FIRST_SEEN
  emitter.phase_start(Phase::FIRST_SEEN);
  io::FirstSeenSelection first_seen;
  try {
    first_seen = io::select_first_seen(archive, first_seen_path, options.time);
  } catch (const std::exception &e) {
    emitter.phase_failed(Phase::FIRST_SEEN, e.what());
    std::cerr << "Error during FIRST_SEEN: " << e.what() << std::endl;
    return 1;
  }
  emitter.phase_end(Phase::FIRST_SEEN, "ok",
                    {{"species", first_seen.days.size()},
                     {"source", io::first_seen_source_to_string(first_seen.source)}});

  // SYNTHESIZE
  emitter.phase_start(Phase::SYNTHESIZE);
  trip_atlas::TripSynthesis synthesis;
  try {
    synthesis = engine::synthesize_trips(archive.captures, first_seen.days, options);
  } catch (const std::exception &e) {
    emitter.phase_failed(Phase::SYNTHESIZE, e.what());
    std::cerr << "Error during SYNTHESIZE: " << e.what() << std::endl;
    return 1;
  }
  emitter.synthesis_done(synthesis.stats);

  // WRITE_OUTPUT
  emitter.phase_start(Phase::WRITE_OUTPUT);
  const trip_atlas::TripArchiveSummary summary =
      engine::summarize_trips(synthesis.trips);
  try {
    io::write_json(out_path, io::trips_document(synthesis, summary),
                   cfg.output.json_indent);
  } catch (const std::exception &e) {
    emitter.phase_failed(Phase::WRITE_OUTPUT, e.what(), {{"out_path", out_path}});
    std::cerr << "Error during WRITE_OUTPUT: " << e.what() << std::endl;
    return 1;
  }
  emitter.phase_end(Phase::WRITE_OUTPUT, "ok",
                    {{"out_path", out_path}, {"summary", io::summary_to_json(summary)}});

  emitter.run_end(true, "ok");

  std::cerr << "Run ID: " << emitter.run_id() << std::endl;
  std::cerr << "Stats: " << cli::format_counts(core::stats_payload(synthesis.stats))
            << std::endl;
  std::cerr << "Output: " << out_path << std::endl;
  return 0;
}

int first_seen_command(const std::string &captures_path,
                       const std::string &config_path,
                       const std::string &out_path) {
  try {
    const config::Config cfg = load_config_or_default(config_path);
    const io::CaptureArchive archive = io::load_capture_archive(captures_path);
    const FirstSeenMap first_seen =
        engine::compute_first_seen_days(archive.captures, cfg.trip_options().time);
    const core::json doc = io::first_seen_to_json(first_seen);
    if (out_path.empty()) {
      cli::print_json(doc, cfg.output.json_indent);
    } else {
      io::write_json(out_path, doc, cfg.output.json_indent);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

int validate_config_command(const std::string &path, bool strict_exit) {
  core::json result;
  result["valid"] = false;
  result["errors"] = core::json::array();
  result["path"] = path;

  try {
    config::Config cfg = config::Config::load(path);
    cfg.validate();
    result["valid"] = true;
  } catch (const trip_atlas::TripAtlasError &e) {
    result["errors"].push_back(e.what());
  }

  cli::print_json(result, 2);
  if (strict_exit) {
    return result["valid"].get<bool>() ? 0 : 1;
  }
  return 0;
}

int get_schema_command() {
  std::cout << config::get_schema_json() << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Trip Atlas: field trip synthesis for photo archives"};
  app.require_subcommand(1);

  std::string captures_path, config_path, out_path, first_seen_path, log_path;
  bool strict_exit = false;

  auto synth_cmd = app.add_subcommand("synthesize", "Infer trips from a capture archive");
  synth_cmd->add_option("--captures", captures_path, "Capture archive JSON")
      ->required();
  synth_cmd->add_option("--config", config_path, "Path to config.yaml");
  synth_cmd->add_option("--out", out_path, "Output trips JSON")->required();
  synth_cmd->add_option("--first-seen", first_seen_path,
                        "Species to first-seen day JSON (overrides the input map)");
  synth_cmd->add_option("--log", log_path, "Mirror JSON-lines events to this file");

  auto first_seen_cmd = app.add_subcommand("first-seen",
                                           "Derive first-seen days per species");
  first_seen_cmd->add_option("--captures", captures_path, "Capture archive JSON")
      ->required();
  first_seen_cmd->add_option("--config", config_path, "Path to config.yaml");
  first_seen_cmd->add_option("--out", out_path, "Output JSON (stdout when omitted)");

  auto validate_cmd = app.add_subcommand("validate-config", "Validate a config.yaml");
  validate_cmd->add_option("--path", config_path, "Path to config.yaml")->required();
  validate_cmd->add_flag("--strict-exit-codes", strict_exit,
                         "Exit 1 when the config is invalid");

  auto schema_cmd = app.add_subcommand("get-schema", "Print the config JSON schema");

  CLI11_PARSE(app, argc, argv);

  if (synth_cmd->parsed()) {
    return synthesize_command(captures_path, config_path, out_path,
                              first_seen_path, log_path);
  }
  if (first_seen_cmd->parsed()) {
    return first_seen_command(captures_path, config_path, out_path);
  }
  if (validate_cmd->parsed()) {
    return validate_config_command(config_path, strict_exit);
  }
  if (schema_cmd->parsed()) {
    return get_schema_command();
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
