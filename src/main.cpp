#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <limits>
#include <optional>
#include <string>
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] [<id>=]<ip:port> ...\n"
      << "\n"
      << "Waits until every target accepts a TCP connection.\n"
      << "Targets without an id are numbered from 1.\n"
      << "\n"
      << "Options:\n"
      << "  --timeout=<ms>       Give up after this long (default: 0 = wait forever)\n"
      << "  --interval=<ms>      Poll interval (default: 100)\n"
      << "  --loginterval=<ms>   Minimum time between progress logs (default: 1000)\n"
      << "  --json               Print one JSON object per target\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical,off)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: probe, app, all\n"
      << "                       Can be comma-separated: --debug=probe,app\n"
      << "  --logfile=<path>     Log to a rotating file instead of stderr\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << "\n"
      << "Exit status: 0 if every target is live, 1 otherwise, 2 on usage errors\n"
      << std::endl;
}

static std::optional<std::chrono::milliseconds>
ParseMillis(const std::string &value, int64_t min) {
  auto ms = liveprobe::util::SafeParseInt64(value, min,
                                            std::numeric_limits<int32_t>::max());
  if (!ms) {
    return std::nullopt;
  }
  return std::chrono::milliseconds(*ms);
}

int main(int argc, char *argv[]) {
  try {
    liveprobe::app::AppConfig config;
    std::string log_level = "info";
    std::string log_file;
    std::vector<std::string> debug_components;
    std::vector<std::string> target_specs;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << liveprobe::GetFullVersionString() << std::endl;
        std::cout << liveprobe::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--timeout=") == 0) {
        auto ms = ParseMillis(arg.substr(10), 0);
        if (!ms) {
          std::cerr << "Error: Invalid timeout: " << arg.substr(10) << std::endl;
          return 2;
        }
        config.timeout = *ms;
      } else if (arg.find("--interval=") == 0) {
        auto ms = ParseMillis(arg.substr(11), 1);
        if (!ms) {
          std::cerr << "Error: Invalid poll interval: " << arg.substr(11) << std::endl;
          std::cerr << "Interval must be a positive number of milliseconds" << std::endl;
          return 2;
        }
        config.probe_options.poll_interval = *ms;
      } else if (arg.find("--loginterval=") == 0) {
        auto ms = ParseMillis(arg.substr(14), 0);
        if (!ms) {
          std::cerr << "Error: Invalid log interval: " << arg.substr(14) << std::endl;
          return 2;
        }
        config.probe_options.log_interval = *ms;
      } else if (arg == "--json") {
        config.json_output = true;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Parse comma-separated components: --debug=probe,app
        std::string components = arg.substr(8);
        size_t pos = 0;
        while (pos < components.length()) {
          size_t comma = components.find(',', pos);
          if (comma == std::string::npos) {
            debug_components.push_back(components.substr(pos));
            break;
          }
          debug_components.push_back(components.substr(pos, comma - pos));
          pos = comma + 1;
        }
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 2;
      } else {
        target_specs.push_back(arg);
      }
    }

    std::string target_error;
    if (!liveprobe::app::ParseTargets(target_specs, config.targets, target_error)) {
      std::cerr << "Error: " << target_error << std::endl;
      return 2;
    }
    if (config.targets.empty()) {
      std::cerr << "Error: No targets specified" << std::endl;
      print_usage(argv[0]);
      return 2;
    }

    liveprobe::util::LogManager::Initialize(log_level, !log_file.empty(), log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        liveprobe::util::LogManager::SetLogLevel("trace");
      } else if (!liveprobe::util::LogManager::SetComponentLevel(component, "trace")) {
        LOG_WARN("Unknown log component: {}", component);
      }
    }

    int exit_code = 0;
    // Nested scope: app (and its probes) must be gone before the logger
    {
      liveprobe::app::Application app(config);

      if (app.initialize()) {
        exit_code = app.run(std::cout);
      } else {
        LOG_ERROR("Failed to initialize application");
        exit_code = 2;
      }
    }

    liveprobe::util::LogManager::Shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    liveprobe::util::LogManager::Shutdown();
    return 1;
  }
}
