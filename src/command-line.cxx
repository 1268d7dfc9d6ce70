#include <splittar/command-line.hxx>
#include <splittar/error.hxx>
#include <splittar/size-parser.hxx>

#include <charconv>
#include <getopt.h>
#include <string>
#include <system_error>
#include <vector>

namespace splittar {
namespace {

enum LongOnlyOption { retry_short_writes = 256, verify_archive };

const struct option long_options[] = {
    {"bytes", required_argument, nullptr, 'b'},
    {"suffix-length", required_argument, nullptr, 'a'},
    {"naming", required_argument, nullptr, 'n'},
    {"prefix", required_argument, nullptr, 'p'},
    {"log-level", required_argument, nullptr, 'l'},
    {"retry-short-writes", no_argument, nullptr, retry_short_writes},
    {"verify", no_argument, nullptr, verify_archive},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}};

// Leading ':' makes getopt report a missing argument as ':' instead of '?'.
constexpr const char *short_options = ":hb:a:n:p:l:";

int parse_width(const std::string &text) {
  int width = 0;
  auto const *last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, width);
  if (text.empty() || ec != std::errc() || ptr != last)
    throw ConfigError("invalid suffix length \"" + text + "\"");
  if (width <= 0)
    throw ConfigError("suffix length cannot be <= 0: " + text);
  return width;
}

/**
 * @brief Name of the option getopt_long stopped at, for error messages.
 */
std::string offending_option(char *argv[], int index) {
  if (optopt > 0 && optopt < 256)
    return std::string("-") + static_cast<char>(optopt);
  return argv[index - 1];
}

} // unnamed namespace

CommandLine parse_command_line(int argc, char *argv[]) {
  CommandLine command_line;
  auto &split = command_line.config.split;
  bool width_given = false;

  optind = 0; // full reinitialization in glibc
  opterr = 0;
  int opt;
  while ((opt = ::getopt_long(argc, argv, short_options, long_options,
                              nullptr)) != -1) {
    switch (opt) {
    case 'b':
      split.chunk_size = parse_size(optarg);
      break;
    case 'a':
      split.suffix_width = parse_width(optarg);
      width_given = true;
      break;
    case 'n':
      split.naming = parse_entry_naming(optarg);
      break;
    case 'p':
      split.naming = EntryNaming::BaseName;
      split.base_name = optarg;
      break;
    case 'l':
      command_line.log_level = parse_log_level(optarg);
      break;
    case retry_short_writes:
      split.short_write_policy = ShortWritePolicy::Retry;
      break;
    case verify_archive:
      command_line.config.verify = true;
      break;
    case 'h':
      command_line.show_help = true;
      break;
    case ':':
      throw ConfigError("option " + offending_option(argv, optind) +
                        " requires an argument");
    default:
      throw ConfigError("unknown option " + offending_option(argv, optind));
    }
  }

  if (!width_given)
    split.suffix_width = split.naming == EntryNaming::BaseName
                             ? default_basename_width
                             : default_index_width;

  std::vector<std::string> positionals(argv + optind, argv + argc);
  if (positionals.size() > 2)
    throw ConfigError("at most 2 positional arguments are accepted, got " +
                      std::to_string(positionals.size()));
  if (positionals.size() > 0)
    command_line.config.source = Endpoint::from_path(positionals[0]);
  if (positionals.size() > 1)
    command_line.config.target = Endpoint::from_path(positionals[1]);

  return command_line;
}

std::string usage(std::string_view program) {
  std::string text = "usage:\n    ";
  text += program;
  text += R"( [ -h ] [ -b SIZE ] [ -a N ] [ -n index|basename ] [ -p NAME ]
        [ --retry-short-writes ] [ --verify ] [ -l LEVEL ]
        [ SOURCE_FILE | - ] [ TARGET_FILE | - ]

Split a source file (or standard input) into chunks of at most SIZE bytes and
write them as consecutive entries of one tar archive (or standard output).

Positional arguments:

    SOURCE_FILE:    The file that is read and segmented into entries of the
                    output tar. Defaults to standard input.

    TARGET_FILE:    The tar file to create. Defaults to standard output.

Optional arguments:

    -b, --bytes SIZE        Maximum bytes per entry (default 64M). SIZE takes
                            an optional suffix: b k m g t p (powers of 1000)
                            or B K M G T P (powers of 1024). Each chunk is
                            held in memory whole, so SIZE bytes are
                            allocated up front.
    -a, --suffix-length N   Digits in the entry index (default 8, or 2 with
                            basename naming).
    -n, --naming MODE       "index" names entries 00000000, 00000001, ...;
                            "basename" names them SOURCE_FILE.00, .01, ...
    -p, --prefix NAME       Use NAME instead of the source file name;
                            implies basename naming.
    --retry-short-writes    Keep writing after a short write instead of
                            failing.
    --verify                Read the target file back and check it.
    -l, --log-level LEVEL   trace, debug, info, warning, error or fatal
                            (default warning). Logs go to standard error.
    -h, --help              This help documentation.
)";
  return text;
}

} // namespace splittar
