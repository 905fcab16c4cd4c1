#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "network/engine.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string config_path;
  std::string log_file{"ghostnet.log"};
  bool verbose{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-c <config>] [-l <logfile>] [-v]\n"
        << "Optional arguments:\n"
        << "  -c, --config    Settings file (default ~/.ghostnet/settings.json)\n"
        << "  -l, --log       Log file (default ghostnet.log)\n"
        << "  -v, --verbose   Also log debug output to the console\n"
        << "Example: " << program_name << " -c ./settings.json -v\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {"-c", "--config", "-l", "--log"};

  ProgramOptions options;
  options.config_path = (ghostnet::config::Config::home_dir() / ".ghostnet" / "settings.json").string();

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-v" || flag == "--verbose") {
      options.verbose = true;
      continue;
    }
    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (flag == "-c" || flag == "--config") {
      options.config_path = value;
    } else {
      options.log_file = value;
    }
  }

  options.valid = true;
  return options;
}

bool run_engine(const ProgramOptions& options) {
  try {
    ghostnet::logging::init_logging(options.log_file,
                                    options.verbose ? boost::log::trivial::debug : boost::log::trivial::info,
                                    options.verbose);

    ghostnet::config::Config config(options.config_path);
    ghostnet::network::Engine engine(config);
    ghostnet::cli::CLI cli(engine, config);

    engine.start();
    std::cout << "GhostNet " << engine.username() << " on " << engine.local_ip()
              << " (" << engine.status() << "). Type 'help' for commands.\n";

    cli.run();
    engine.stop();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to run engine: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_engine(options)) {
    return 1;
  }
  return 0;
}
