#include "config/config.hpp"
#include "logger/logger.hpp"
#include "network/server.hpp"
#include "transfer/file_discovery.hpp"
#include "transfer/local_file_system.hpp"
#include "transfer/transfer_error.hpp"
#include "transfer/transfer_plan.hpp"
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <iterator>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

struct ProgramOptions {
  std::string root;
  std::string config_file;
  std::string log_file{"pneumatic.log"};
  std::string log_level{"info"};
  bool serve{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " <root> [-c <file>] [-l <file>] [-v <level>]\n"
        << "       " << program_name << " --serve [-c <file>] [-l <file>] [-v <level>]\n"
        << "Arguments:\n"
        << "  <root>            Directory to scan (optional when the config lists roots)\n"
        << "  -s, --serve       Accept sessions on the configured address and port until interrupted\n"
        << "  -c, --config      JSON configuration file\n"
        << "  -l, --log-file    Log file, or - for the console (default: pneumatic.log)\n"
        << "  -v, --log-level   trace, debug, info, warning, error or fatal (default: info)\n"
        << "Example: " << program_name << " ./data -c pneumatic.json\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string ProgramOptions::*> flag_map = {
    {"-c", &ProgramOptions::config_file},
    {"--config", &ProgramOptions::config_file},
    {"-l", &ProgramOptions::log_file},
    {"--log-file", &ProgramOptions::log_file},
    {"-v", &ProgramOptions::log_level},
    {"--log-level", &ProgramOptions::log_level}
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    if (arg == "-s" || arg == "--serve") {
      options.serve = true;
    } else if (auto it = flag_map.find(arg); it != flag_map.end()) {
      if (i + 1 >= argc) {
        std::cerr << "Error: Missing value for " << arg << '\n';
        print_usage(argv[0]);
        return options;
      }
      options.*(it->second) = argv[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Error: Unknown argument: " << arg << '\n';
      print_usage(argv[0]);
      return options;
    } else if (options.root.empty()) {
      options.root = arg;
    } else {
      std::cerr << "Error: Only one root may be given\n";
      print_usage(argv[0]);
      return options;
    }
  }

  if (options.serve && !options.root.empty()) {
    std::cerr << "Error: --serve does not take a root directory\n";
    print_usage(argv[0]);
    return options;
  }

  if (!options.serve && options.root.empty() && options.config_file.empty()) {
    std::cerr << "Error: A root directory or a config file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_discovery(const ProgramOptions& options) {
  try {
    pneumatic::config::ServerConfig config;
    if (!options.config_file.empty()) {
      config = pneumatic::config::load_config(options.config_file);
    }

    std::vector<std::string> roots = config.roots;
    if (!options.root.empty()) {
      roots = {options.root};
    }
    if (roots.empty()) {
      std::cerr << "Error: No root directory given\n";
      return false;
    }

    const auto start = std::chrono::steady_clock::now();

    std::vector<pneumatic::transfer::FileMetadata> files;
    for (const auto& root : roots) {
      auto file_system = std::make_shared<pneumatic::transfer::LocalFileSystem>(root);
      pneumatic::transfer::FileDiscovery discovery(file_system, config.discovery_workers);
      auto found = discovery.collect();
      files.insert(files.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
    std::cout << "Discovered " << files.size() << " files in " << elapsed.count() << "ms\n";

    const auto plan = pneumatic::transfer::TransferPlan::create(std::move(files), config.plan_thresholds());
    std::cout << "Small files:        " << plan.small_files().size() << '\n'
              << "Single-chunk files: " << plan.single_chunk_files().size() << '\n'
              << "Large files:        " << plan.large_files().size() << '\n'
              << "Total size:         " << plan.total_size() << " bytes\n";
    return true;
  } catch (const pneumatic::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  } catch (const pneumatic::transfer::TransferError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  } catch (const std::exception& e) {
    std::cerr << "Error: Discovery failed: " << e.what() << '\n';
    return false;
  }
}

bool run_server(const ProgramOptions& options) {
  try {
    pneumatic::config::ServerConfig config;
    if (!options.config_file.empty()) {
      config = pneumatic::config::load_config(options.config_file);
    }

    pneumatic::network::Server server(config.address, config.port, config.unsupported_protocol_policy());
    if (!server.start_listener()) {
      std::cerr << "Error: Failed to listen on " << config.address << ":" << config.port << '\n';
      return false;
    }
    std::cout << "Listening on " << config.address << ":" << server.local_port() << '\n';

    // Block until interrupted
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& error, int signal_number) {
      if (!error) {
        BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number << ", shutting down";
      }
    });
    signal_context.run();

    server.shutdown();
    return true;
  } catch (const pneumatic::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  } catch (const std::exception& e) {
    std::cerr << "Error: Server failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    const auto level = pneumatic::logging::parse_severity(options.log_level);
    if (options.log_file == "-") {
      pneumatic::logging::init_console_logging(level);
    } else {
      pneumatic::logging::init_logging(options.log_file, level);
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to open log file: " << e.what() << '\n';
    return 1;
  }

  if (options.serve) {
    return run_server(options) ? 0 : 1;
  }
  return run_discovery(options) ? 0 : 1;
}
