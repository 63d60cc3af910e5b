/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "chunk/recovery_log.hpp"
#include "collaborators/command_runner.hpp"
#include "common/config.hpp"
#include "distributed/coordinator.hpp"
#include "logging/logger.hpp"
#include "utils/env.hpp"

#include <asio.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace dgen;

using namespace std;

struct Config {
  string config_file;
  string in_dir;
  string out_dir = "chunk_logs";
  string raw;
  bool skip_ingest = false;
  bool skip_schema = false;
  bool keep_csv = false;
  int port = -1;
  string log_level = Env::get<string>("DGEN_LOG_LEVEL", "info");
};

void print_usage(const char *program_name) {
  cout << "Usage: " << program_name << " [options]" << endl;
  cout << endl;
  cout << "Options:" << endl;
  cout << "  -c, --config <file>    JSON configuration file" << endl;
  cout << "  -i, --in-dir <dir>     Chunk logs of an earlier run (target.clg required)" << endl;
  cout << "  -o, --out-dir <dir>    Where chunk logs are written (default: chunk_logs)" << endl;
  cout << "  -r, --raw <list>       Chunks to generate, e.g. 0:1000,4321,6832" << endl;
  cout << "  -k, --skip-ingest      Generate and partition only" << endl;
  cout << "  -s, --skip-schema      Do not register the database and table schemas" << endl;
  cout << "  -z, --keep-csv         Keep intermediate files on the workers" << endl;
  cout << "  -p, --port <N>         Override the configured listen port" << endl;
  cout << "  --log-level <level>    trace, debug, info, warn, error or critical" << endl;
  cout << "  -h, --help             Show this help message" << endl;
  cout << endl;
  cout << "Examples:" << endl;
  cout << "  " << program_name << " -c server.json -r 0:999" << endl;
  cout << "  " << program_name << " -c server.json -i chunk_logs -o chunk_logs_2" << endl;
}

bool parse_arguments(int argc, char *argv[], Config &cfg) {
  int c;

  static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                         {"in-dir", required_argument, 0, 'i'},
                                         {"out-dir", required_argument, 0, 'o'},
                                         {"raw", required_argument, 0, 'r'},
                                         {"skip-ingest", no_argument, 0, 'k'},
                                         {"skip-schema", no_argument, 0, 's'},
                                         {"keep-csv", no_argument, 0, 'z'},
                                         {"port", required_argument, 0, 'p'},
                                         {"log-level", required_argument, 0, 'l'},
                                         {"help", no_argument, 0, 'h'},
                                         {0, 0, 0, 0}};

  optind = 1;

  while ((c = getopt_long(argc, argv, "c:i:o:r:kszp:h", long_options, nullptr)) != -1) {
    switch (c) {
    case 'c':
      cfg.config_file = optarg;
      break;
    case 'i':
      cfg.in_dir = optarg;
      break;
    case 'o':
      cfg.out_dir = optarg;
      break;
    case 'r':
      cfg.raw = optarg;
      break;
    case 'k':
      cfg.skip_ingest = true;
      break;
    case 's':
      cfg.skip_schema = true;
      break;
    case 'z':
      cfg.keep_csv = true;
      break;
    case 'p':
      try {
        cfg.port = stoi(optarg);
      } catch (const exception &) {
        cerr << "--port requires a valid number argument" << endl;
        return false;
      }
      if (cfg.port < 0 || cfg.port > 65535) {
        cerr << "Invalid port number: " << optarg << endl;
        return false;
      }
      break;
    case 'l':
      cfg.log_level = optarg;
      break;
    case 'h':
      print_usage(argv[0]);
      return false;
    case '?':
      return false;
    default:
      return false;
    }
  }

  if (optind < argc) {
    cerr << "Unexpected argument: " << argv[optind] << endl;
    print_usage(argv[0]);
    return false;
  }

  if (cfg.raw.empty() && cfg.in_dir.empty()) {
    cerr << "Either --raw or --in-dir is required" << endl;
    print_usage(argv[0]);
    return false;
  }

  return true;
}

int main(int argc, char *argv[]) {
  Config cfg;

  if (!parse_arguments(argc, argv, cfg)) {
    return 1;
  }

  GlobalLogger::set_level(parse_log_level(cfg.log_level));

  try {
    ServerConfig server_config;
    if (!cfg.config_file.empty()) {
      server_config = ServerConfig::load_from_file(cfg.config_file);
    }
    if (cfg.port >= 0) {
      server_config.server.port = static_cast<uint16_t>(cfg.port);
    }
    if (cfg.skip_ingest) {
      server_config.ingest.skip = true;
    }
    if (cfg.skip_schema) {
      server_config.ingest.skip_schema = true;
    }
    if (cfg.keep_csv) {
      server_config.keep_csv = true;
    }

    RecoverySnapshot prior;
    optional<ChunkSet> target_log;
    if (!cfg.in_dir.empty()) {
      prior = RecoveryLogStore(cfg.in_dir).load(true);
      target_log = prior.target;
      GlobalLogger::info("Chunk logs from {}:\n{}", cfg.in_dir, prior.report());
    }

    optional<string> raw;
    if (!cfg.raw.empty()) {
      raw = cfg.raw;
    }
    ChunkSet range = resolve_requested_range(raw, target_log);
    if (set_difference(range, prior.completed).empty()) {
      GlobalLogger::info("No chunks to generate");
      return 0;
    }

    auto run_config = make_shared<const RunConfiguration>(server_config.build_run_configuration());

    filesystem::create_directories(cfg.out_dir);
    GlobalLogger::add_file_sink((filesystem::path(cfg.out_dir) / "server.log").string());
    auto transitions = make_shared<Logger>(
        "chunks", (filesystem::path(cfg.out_dir) / "transitions.log").string(), LogLevel::debug);

    auto ingest_admin =
        make_shared<CommandIngestAdmin>(server_config.ingest_admin_command, server_config.ingest);
    Coordinator coordinator(server_config.server, range, prior, run_config,
                            filesystem::path(cfg.out_dir), transitions, ingest_admin);

    asio::io_context signal_context;
    asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&coordinator](const error_code &ec, int signal_number) {
      if (!ec) {
        GlobalLogger::warn("Received signal {}, stopping", signal_number);
        coordinator.stop();
      }
    });
    thread signal_thread([&signal_context]() { signal_context.run(); });

    exception_ptr failure;
    try {
      coordinator.run();
    } catch (const exception &) {
      failure = current_exception();
    }

    error_code ec;
    signals.cancel(ec);
    signal_context.stop();
    signal_thread.join();
    transitions->flush();

    if (failure) {
      rethrow_exception(failure);
    }
  } catch (const exception &e) {
    GlobalLogger::critical("Server failed: {}", e.what());
    GlobalLogger::flush();
    return 1;
  }

  return 0;
}
