#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/local_store.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string store_path;
  std::size_t chunk_size{dagsync::dag::BuilderConfig::DEFAULT_CHUNK_SIZE};
  std::size_t concurrency{4};
  std::string log_file;
  bool verbose{false};
  // Command to run instead of the interactive shell
  std::string command;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " --store <dir> [options] [command...]\n"
            << "Required arguments:\n"
            << "  -s, --store        Directory of the local object store\n"
            << "Options:\n"
            << "  -c, --chunk-size   Chunk size in bytes (default 262144)\n"
            << "  -j, --concurrency  Store operations in flight (default 4)\n"
            << "  -l, --log          Log to this file\n"
            << "  -v, --verbose      Log debug output to the console\n"
            << "Without a command an interactive shell starts.\n"
            << "Example: " << program_name << " --store ./objects upload photos --compress\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-s", "--store", "-c", "--chunk-size", "-j", "--concurrency", "-l", "--log"
  };

  ProgramOptions options;
  int i = 1;
  for (; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-v" || flag == "--verbose") {
      options.verbose = true;
      continue;
    }
    if (flag.rfind("-", 0) != 0) {
      break;  // first command word
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
    try {
      if (flag == "-s" || flag == "--store") {
        options.store_path = value;
      } else if (flag == "-c" || flag == "--chunk-size") {
        options.chunk_size = static_cast<std::size_t>(std::stoull(value));
      } else if (flag == "-j" || flag == "--concurrency") {
        options.concurrency = static_cast<std::size_t>(std::stoull(value));
      } else {
        options.log_file = value;
      }
    } catch (const std::exception&) {
      std::cerr << "Error: Invalid number for " << flag << ": " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  for (; i < argc; ++i) {
    if (!options.command.empty()) {
      options.command += ' ';
    }
    options.command += argv[i];
  }

  if (options.store_path.empty()) {
    std::cerr << "Error: --store is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    if (!options.log_file.empty()) {
      dagsync::logging::init_logging(options.log_file, options.verbose
          ? dagsync::logging::severity_level::debug : dagsync::logging::severity_level::info);
    } else {
      dagsync::logging::init_console_logging(options.verbose
          ? dagsync::logging::severity_level::debug : dagsync::logging::severity_level::warning);
    }

    dagsync::transfer::TransferConfig config;
    config.store = std::make_shared<dagsync::store::LocalStore>(options.store_path);
    config.builder.chunk_size = options.chunk_size;
    config.concurrency = options.concurrency;

    dagsync::cli::CLI cli(config);
    if (!options.command.empty()) {
      cli.execute(options.command);
      // One-shot mode reports the command's outcome in the exit status
      return !cli.last_command_failed();
    }
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
