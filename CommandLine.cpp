#include "CommandLine.hpp"

#include <getopt.h>

#include <charconv>
#include <format>
#include <string_view>
#include <system_error>
#include <utility>

#include "errors.hpp"

namespace {
const option kLongOptions[] = {
    {"output-dir", required_argument, nullptr, 'O'},
    {"pattern", required_argument, nullptr, 'p'},
    {"not-pattern", required_argument, nullptr, 'P'},
    {"strip", required_argument, nullptr, 's'},
    {"oldest", no_argument, nullptr, 'o'},
    {"newest", no_argument, nullptr, 'n'},
    {"exif", no_argument, nullptr, 'e'},
    {"per-directory", no_argument, nullptr, 'g'},
    {"dry-run", no_argument, nullptr, 'd'},
    {"force", no_argument, nullptr, 'f'},
    {"config", required_argument, nullptr, 'c'},
    {"log-file", required_argument, nullptr, 'l'},
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, 0}};

constexpr const char* kShortOptions = ":O:p:P:s:onegdfc:l:vhV";

std::size_t parse_strip(std::string_view value) {
  std::size_t strip = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), strip);
  if (value.empty() || ec != std::errc() ||
      ptr != value.data() + value.size()) {
    throw InvalidInputError(std::format(
        "--strip expects a non-negative integer, got '{}'", value));
  }
  return strip;
}

void set_policy(CommandLine& cli, AgePolicy policy) {
  if (cli.policy && *cli.policy != policy) {
    throw InvalidInputError(
        "--oldest, --newest and --exif are mutually exclusive");
  }
  cli.policy = policy;
}
}  // namespace

CommandLine parse_command_line(int argc, char* argv[]) {
  CommandLine cli;
  // Reset getopt so the parser can be invoked more than once per process.
  optind = 0;
  opterr = 0;

  int opt;
  while ((opt = getopt_long(argc, argv, kShortOptions, kLongOptions,
                            nullptr)) != -1) {
    switch (opt) {
      case 'O':
        cli.output_dir = fs::path(optarg);
        break;
      case 'p':
        cli.patterns.emplace_back(optarg);
        break;
      case 'P':
        cli.not_patterns.emplace_back(optarg);
        break;
      case 's':
        cli.strip = parse_strip(optarg);
        break;
      case 'o':
        set_policy(cli, AgePolicy::OLDEST);
        break;
      case 'n':
        set_policy(cli, AgePolicy::NEWEST);
        break;
      case 'e':
        set_policy(cli, AgePolicy::EXIF);
        break;
      case 'g':
        cli.per_directory = true;
        break;
      case 'd':
        cli.dry_run = true;
        break;
      case 'f':
        cli.force = true;
        break;
      case 'c':
        cli.config_path = fs::path(optarg);
        break;
      case 'l':
        cli.log_file = fs::path(optarg);
        break;
      case 'v':
        cli.verbose = true;
        break;
      case 'h':
        cli.show_help = true;
        break;
      case 'V':
        cli.show_version = true;
        break;
      case ':':
        throw InvalidInputError(
            std::format("option '{}' requires a value", argv[optind - 1]));
      default:
        if (optopt != 0) {
          throw InvalidInputError(std::format(
              "unrecognized option '-{}'", static_cast<char>(optopt)));
        }
        throw InvalidInputError(
            std::format("unrecognized option '{}'", argv[optind - 1]));
    }
  }

  for (int i = optind; i < argc; ++i) {
    cli.directories.emplace_back(argv[i]);
  }
  return cli;
}

Options resolve_options(const CommandLine& cli, Options base) {
  Options options = std::move(base);
  if (cli.output_dir) options.output_dir = *cli.output_dir;
  if (cli.strip) options.strip = *cli.strip;
  if (cli.policy) options.policy = *cli.policy;
  if (cli.log_file) options.log_file = *cli.log_file;
  options.per_directory = options.per_directory || cli.per_directory;
  options.dry_run = options.dry_run || cli.dry_run;
  options.force = options.force || cli.force;
  options.verbose = options.verbose || cli.verbose;
  options.patterns.insert(options.patterns.end(), cli.patterns.begin(),
                          cli.patterns.end());
  options.not_patterns.insert(options.not_patterns.end(),
                              cli.not_patterns.begin(),
                              cli.not_patterns.end());

  if (cli.directories.empty()) {
    throw InvalidInputError("no source directory given");
  }
  if (options.output_dir.empty()) {
    throw InvalidInputError(
        "an output directory is required (--output-dir or \"output_dir\" in "
        "the configuration file)");
  }
  return options;
}

std::string usage() {
  return R"(Organize folders by the time stamps of their files.

Usage:
  organize-by-time [--oldest | --newest | --exif] [--per-directory]
                   [--pattern=PATTERN]... [--not-pattern=PATTERN]...
                   [--output-dir=OUTPUT] [--strip=N] [--dry-run] [--force]
                   [--config=FILE] [--log-file=FILE] [--verbose]
                   <directory>...
  organize-by-time (-h | --help)
  organize-by-time --version

Options:
  -O OUTPUT --output-dir=OUTPUT     Output directory (required).
  -p PATTERN --pattern=PATTERN      Only consider files with this pattern.
  -P PATTERN --not-pattern=PATTERN  Ignore files with this pattern.
  -s N --strip=N                    Strip N leftmost directories [default: 0].
  -o --oldest                       Use the oldest of mtime, ctime and atime.
  -n --newest                       Use the newest of mtime, ctime and atime.
  -e --exif                         Use the EXIF capture date of images.
  -g --per-directory                Date the files of each directory (up to
                                    two levels below a source) together,
                                    by the oldest (or with --newest, the
                                    newest) time among them.
  -d --dry-run                      Only print, do not move any files.
  -f --force                        Overwrite files if conflict found.
  -c FILE --config=FILE             Read defaults from a JSON file.
  -l FILE --log-file=FILE           Append a log of every step to FILE.
  -v --verbose                      Echo the log to stderr.
  -h --help                         Show this screen.
  -V --version                      Show version.
)";
}
