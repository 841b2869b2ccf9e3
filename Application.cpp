#include "Application.hpp"

#include <cstddef>
#include <cstdio>
#include <exception>
#include <exiv2/exiv2.hpp>
#include <format>
#include <print>
#include <string_view>
#include <utility>

#include "CommandLine.hpp"
#include "IOManager.hpp"
#include "Organizer.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace {
int fail(std::string_view message) {
  IOManager::log(std::format("CRITICAL: {}", message));
  std::println(stderr, "Error: {}", message);
  return kExitFatal;
}

int usage_error(const InvalidInputError& e) {
  std::println(stderr, "Error: {}\n", e.what());
  std::print(stderr, "{}", usage());
  return kExitFatal;
}

int organize(const Options& options, const CommandLine& cli,
             std::ostream& out) {
  try {
    IOManager::log(std::format("--- {} started ---", kVersion));
    Organizer organizer(options);
    const std::size_t errors = organizer.run(cli.directories, out);
    out.flush();
    if (errors > 0) {
      std::println(stderr, "total errors: {}", errors);
      IOManager::log(std::format("Finished with {} errors", errors));
      return kExitFileErrors;
    }
    IOManager::log("--- Finished without errors ---");
    return kExitSuccess;
  } catch (const PatternSyntaxError& e) {
    return fail(e.what());
  } catch (const InvalidInputError& e) {
    return fail(e.what());
  } catch (const std::exception& e) {
    return fail(std::format("unexpected failure: {}", e.what()));
  }
}
}  // namespace

int run_application(int argc, char* argv[], std::ostream& out) {
  CommandLine cli;
  try {
    cli = parse_command_line(argc, argv);
  } catch (const InvalidInputError& e) {
    return usage_error(e);
  }

  if (cli.show_help) {
    std::print(out, "{}", usage());
    return kExitSuccess;
  }
  if (cli.show_version) {
    std::println(out, "{}", kVersion);
    return kExitSuccess;
  }

  Options base;
  if (cli.config_path) {
    auto configOpt = IOManager::load_config(*cli.config_path);
    if (!configOpt) {
      return fail(std::format("failed to load configuration from {}",
                              quote_path(*cli.config_path)));
    }
    base = std::move(*configOpt);
  }

  Options options;
  try {
    options = resolve_options(cli, std::move(base));
  } catch (const InvalidInputError& e) {
    return usage_error(e);
  }

  if (!options.log_file.empty() &&
      !IOManager::initialize_logger(options.log_file)) {
    return fail(std::format("cannot open log file {}",
                            quote_path(options.log_file)));
  }
  if (options.verbose) {
    IOManager::set_log_handler(
        [](std::string_view message) { std::println(stderr, "{}", message); });
  }

  Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
  Exiv2::XmpParser::initialize();
  const int exitCode = organize(options, cli, out);
  Exiv2::XmpParser::terminate();
  return exitCode;
}
