#include "agency/cli/commands.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog) {
  std::println("agency - run AI agents and multi-step recipes");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  run        Run one agent on a task");
  std::println("  batch      Run several agents on the same task");
  std::println("  recipe     Execute a recipe file");
  std::println("  validate   Validate a recipe and print its plan");
  std::println("");
  std::println("Options:");
  std::println("  -a, --agent <name>      Agent (batch: comma-separated list)");
  std::println("  -t, --task <text>       Task description");
  std::println("  -c, --context <path>    Context file or directory");
  std::println("  -o, --output <path>     Output file");
  std::println("  -r, --recipe <file>     Recipe YAML file");
  std::println("  -p, --parallel <n>      Concurrency limit");
  std::println("  --timeout <ms>          Per-task timeout");
  std::println("  --format <fmt>          text | json | markdown");
  std::println("  --var <key=value>       Variable (repeatable)");
  std::println("  --config <file>         Config file (YAML)");
  std::println("  --log-level <level>     trace | debug | info | warn | error");
  std::println("  -h, --help              Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} run -a architect -t \"Design the cache\" -c docs/", prog);
  std::println("  {} batch -a tester,security -t \"Review\" -p 2", prog);
  std::println("  {} recipe -r recipes/feature.yaml --var name=auth", prog);
}

struct Args {
  std::string command;
  agency::cli::GlobalOptions global;
  std::string agent;
  std::string task;
  std::string context;
  std::string output;
  std::string recipe;
  std::string format{"text"};
  std::optional<std::size_t> parallel;
  std::optional<std::int64_t> timeout_ms;
  agency::cli::VariableArgs variables;
};

[[noreturn]] void die(std::string_view msg) {
  std::println(stderr, "Error: {}", msg);
  std::exit(1);
}

template <typename T>
auto parse_number(std::string_view flag, std::string_view s) -> T {
  T value{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    die(std::format("{} expects a number, got '{}'", flag, s));
  }
  return value;
}

auto split_list(std::string_view s) -> std::vector<std::string> {
  std::vector<std::string> out;
  while (!s.empty()) {
    auto comma = s.find(',');
    auto item = s.substr(0, comma);
    if (!item.empty()) {
      out.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    s.remove_prefix(comma + 1);
  }
  return out;
}

auto parse_args(int argc, char* argv[]) -> Args {
  Args args;
  if (argc < 2) {
    print_usage(argv[0]);
    std::exit(1);
  }

  int i = 1;
  std::string_view first = argv[1];
  if (first == "-h" || first == "--help") {
    print_usage(argv[0]);
    std::exit(0);
  }
  args.command = first;
  ++i;

  auto value = [&](std::string_view flag) -> std::string_view {
    if (++i >= argc) {
      die(std::format("{} requires an argument", flag));
    }
    return argv[i];
  };

  for (; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-a" || arg == "--agent" || arg == "--agents") {
      args.agent = value(arg);
    } else if (arg == "-t" || arg == "--task") {
      args.task = value(arg);
    } else if (arg == "-c" || arg == "--context") {
      args.context = value(arg);
    } else if (arg == "-o" || arg == "--output") {
      args.output = value(arg);
    } else if (arg == "-r" || arg == "--recipe") {
      args.recipe = value(arg);
    } else if (arg == "-p" || arg == "--parallel") {
      args.parallel = parse_number<std::size_t>(arg, value(arg));
    } else if (arg == "--timeout") {
      args.timeout_ms = parse_number<std::int64_t>(arg, value(arg));
    } else if (arg == "--format") {
      args.format = value(arg);
    } else if (arg == "--var") {
      auto kv = value(arg);
      auto eq = kv.find('=');
      if (eq == std::string_view::npos || eq == 0) {
        die(std::format("--var expects key=value, got '{}'", kv));
      }
      args.variables.emplace_back(std::string(kv.substr(0, eq)),
                                  std::string(kv.substr(eq + 1)));
    } else if (arg == "--config") {
      args.global.config_file = value(arg);
    } else if (arg == "--log-level") {
      args.global.log_level = value(arg);
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto args = parse_args(argc, argv);

  if (args.command == "run") {
    if (args.agent.empty() || args.task.empty()) {
      die("run requires --agent and --task");
    }
    return agency::cli::cmd_run({
        .global = args.global,
        .agent = args.agent,
        .task = args.task,
        .context_path = args.context,
        .output_path = args.output,
        .timeout_ms = args.timeout_ms,
        .format = args.format,
        .variables = args.variables,
    });
  }
  if (args.command == "batch") {
    if (args.agent.empty() || args.task.empty()) {
      die("batch requires --agent and --task");
    }
    return agency::cli::cmd_batch({
        .global = args.global,
        .agents = split_list(args.agent),
        .task = args.task,
        .context_path = args.context,
        .output_path = args.output,
        .parallel = args.parallel,
        .timeout_ms = args.timeout_ms,
        .variables = args.variables,
    });
  }
  if (args.command == "recipe") {
    if (args.recipe.empty()) {
      die("recipe requires --recipe");
    }
    return agency::cli::cmd_recipe({
        .global = args.global,
        .recipe_file = args.recipe,
        .context_path = args.context,
        .output_path = args.output,
        .parallel = args.parallel,
        .variables = args.variables,
    });
  }
  if (args.command == "validate") {
    if (args.recipe.empty()) {
      die("validate requires --recipe");
    }
    return agency::cli::cmd_validate({
        .global = args.global,
        .recipe_file = args.recipe,
        .variables = args.variables,
    });
  }

  std::println(stderr, "Unknown command: {}", args.command);
  print_usage(argv[0]);
  return 1;
}
