/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "collaborators/command_runner.hpp"
#include "common/config.hpp"
#include "distributed/worker.hpp"
#include "logging/logger.hpp"
#include "utils/env.hpp"

#include <cstdlib>
#include <exception>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

using namespace dgen;

using namespace std;

struct Config {
  WorkerConfig worker;
  string log_level = Env::get<string>("DGEN_LOG_LEVEL", "info");
};

void print_usage(const char *program_name) {
  cout << "Usage: " << program_name << " [options]" << endl;
  cout << endl;
  cout << "Options:" << endl;
  cout << "  -H, --host <host>        Coordinator host (default: 127.0.0.1)" << endl;
  cout << "  -P, --port <N>           Coordinator port (default: 13042)" << endl;
  cout << "  -C, --chunks <N>         Chunks asked for per request (default: 1)" << endl;
  cout << "  -j, --parallelism <N>    Chunks processed at once (default: 1)" << endl;
  cout << "  -f, --max-failures <N>   Give up after N failures in a row (default: 5)" << endl;
  cout << "  -w, --work-dir <dir>     Working directory (default: dgen_work)" << endl;
  cout << "  -r, --retry              Keep retrying until the coordinator is reachable" << endl;
  cout << "  --log-level <level>      trace, debug, info, warn, error or critical" << endl;
  cout << "  -h, --help               Show this help message" << endl;
  cout << endl;
  cout << "Defaults can also be set with DGEN_SERVER_HOST, DGEN_SERVER_PORT," << endl;
  cout << "DGEN_CHUNKS_PER_REQUEST, DGEN_PARALLELISM, DGEN_MAX_FAILURES, DGEN_WORK_DIR," << endl;
  cout << "DGEN_GENERATOR_COMMAND, DGEN_PARTITIONER_COMMAND and DGEN_INGEST_COMMAND." << endl;
}

bool parse_count(const char *flag, const char *value, uint32_t &out) {
  try {
    int parsed = stoi(value);
    if (parsed <= 0) {
      cerr << "Invalid " << flag << " value: " << value << endl;
      return false;
    }
    out = static_cast<uint32_t>(parsed);
  } catch (const exception &) {
    cerr << flag << " requires a valid number argument" << endl;
    return false;
  }
  return true;
}

bool parse_arguments(int argc, char *argv[], Config &cfg) {
  int c;

  static struct option long_options[] = {{"host", required_argument, 0, 'H'},
                                         {"port", required_argument, 0, 'P'},
                                         {"chunks", required_argument, 0, 'C'},
                                         {"parallelism", required_argument, 0, 'j'},
                                         {"max-failures", required_argument, 0, 'f'},
                                         {"work-dir", required_argument, 0, 'w'},
                                         {"retry", no_argument, 0, 'r'},
                                         {"log-level", required_argument, 0, 'l'},
                                         {"help", no_argument, 0, 'h'},
                                         {0, 0, 0, 0}};

  optind = 1;

  uint32_t value = 0;
  while ((c = getopt_long(argc, argv, "H:P:C:j:f:w:rh", long_options, nullptr)) != -1) {
    switch (c) {
    case 'H':
      cfg.worker.server_host = optarg;
      break;
    case 'P':
      if (!parse_count("--port", optarg, value) || value > 65535) {
        return false;
      }
      cfg.worker.server_port = static_cast<uint16_t>(value);
      break;
    case 'C':
      if (!parse_count("--chunks", optarg, cfg.worker.chunks_per_request)) {
        return false;
      }
      break;
    case 'j':
      if (!parse_count("--parallelism", optarg, value)) {
        return false;
      }
      cfg.worker.parallelism = value;
      break;
    case 'f':
      if (!parse_count("--max-failures", optarg, cfg.worker.max_consecutive_failures)) {
        return false;
      }
      break;
    case 'w':
      cfg.worker.work_dir = optarg;
      break;
    case 'r':
      cfg.worker.retry = true;
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

  return true;
}

int main(int argc, char *argv[]) {
  Config cfg;
  try {
    cfg.worker = WorkerConfig::from_env();
  } catch (const exception &e) {
    cerr << "Invalid environment: " << e.what() << endl;
    return 1;
  }

  if (!parse_arguments(argc, argv, cfg)) {
    return 1;
  }

  GlobalLogger::set_level(parse_log_level(cfg.log_level));

  cout << "Data generation client" << endl;
  cout << "Coordinator: " << cfg.worker.server_host << ":" << cfg.worker.server_port << endl;
  cout << "Chunks per request: " << cfg.worker.chunks_per_request << endl;
  cout << "Parallelism: " << cfg.worker.parallelism << endl;
  cout << "Work dir: " << cfg.worker.work_dir.string() << endl;

  try {
    auto runner = make_shared<const CommandRunner>();
    Worker worker(cfg.worker, make_shared<CommandGenerator>(cfg.worker.generator_command, runner),
                  make_shared<CommandPartitioner>(cfg.worker.partitioner_command, runner),
                  make_shared<CommandIngest>(cfg.worker.ingest_command, runner));
    worker.run();
    if (worker.stats().gave_up) {
      return 2;
    }
  } catch (const exception &e) {
    GlobalLogger::critical("Client failed: {}", e.what());
    GlobalLogger::flush();
    return 1;
  }

  return 0;
}
