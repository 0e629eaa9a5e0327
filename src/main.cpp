#include "maestro/cli/commands.hpp"
#include "maestro/util/log.hpp"

#include <fmt/core.h>

#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  fmt::print("Maestro - DAG workflow scheduler for agent teams\n");
  fmt::print("Usage: {} <command> [OPTIONS]\n", prog);
  fmt::print("\n");
  fmt::print("Commands:\n");
  fmt::print("  run -p <plan> [-c <config>] [--fail <task_id>]...\n");
  fmt::print("                        Run a plan and print the final status\n");
  fmt::print("  validate -p <plan>    Check plan dependencies\n");
  fmt::print("  agents [-c <config>]  List registered agents\n");
  fmt::print("  route <text> [-c <config>]\n");
  fmt::print("                        Show which agent a task goes to\n");
  fmt::print("\n");
  fmt::print("Options:\n");
  fmt::print("  -p, --plan <file>     Plan file (YAML)\n");
  fmt::print("  -c, --config <file>   Config file (YAML)\n");
  fmt::print("  --fail <task_id>      Make every attempt of a task fail\n");
  fmt::print("  -v, --version         Show version and exit\n");
  fmt::print("  -h, --help            Show this help message\n");
}

void print_version() {
  fmt::print("Maestro v0.1.0\n");
}

struct Options {
  std::string command;
  std::string plan_file;
  std::string config_file;
  std::string text;
  std::vector<std::string> fail_tasks;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    fmt::print(stderr, "Error: {} requires an argument\n", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-p" || arg == "--plan") {
      opts.plan_file = require_value(i, argc, argv, "--plan");
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, "--config");
    } else if (arg == "--fail") {
      opts.fail_tasks.push_back(require_value(i, argc, argv, "--fail"));
    } else if (!arg.empty() && arg.front() == '-') {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      print_usage(argv[0]);
      std::exit(1);
    } else if (opts.command.empty()) {
      opts.command = arg;
    } else if (opts.command == "route" && opts.text.empty()) {
      opts.text = arg;
    } else {
      fmt::print(stderr, "Unexpected argument: {}\n", arg);
      std::exit(1);
    }
  }

  return opts;
}

auto dispatch(const Options& opts, const char* prog) -> int {
  namespace cli = maestro::cli;

  if (opts.command == "run" || opts.command == "validate") {
    if (opts.plan_file.empty()) {
      fmt::print(stderr, "Error: {} requires -p <plan>\n", opts.command);
      return 1;
    }
  }

  if (opts.command == "run") {
    return cli::cmd_run({.plan_file = opts.plan_file,
                         .config_file = opts.config_file,
                         .fail_tasks = opts.fail_tasks});
  }
  if (opts.command == "validate") {
    return cli::cmd_validate({.plan_file = opts.plan_file});
  }
  if (opts.command == "agents") {
    return cli::cmd_agents({.config_file = opts.config_file});
  }
  if (opts.command == "route") {
    if (opts.text.empty()) {
      fmt::print(stderr, "Error: route requires a task text\n");
      return 1;
    }
    return cli::cmd_route({.text = opts.text,
                           .config_file = opts.config_file});
  }

  print_usage(prog);
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  maestro::log::start();
  int rc = dispatch(opts, argv[0]);
  maestro::log::stop();
  return rc;
}
