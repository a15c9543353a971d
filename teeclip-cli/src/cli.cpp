/**
 * @file cli.cpp
 * @brief getopt_long based flag parsing
 */

#include "cli.h"
#include <getopt.h>
#include <sstream>

namespace teeclip {
namespace cli {

namespace {

// Long-only options
enum LongOnly : int {
  OPT_NO_CLIP = 256,
  OPT_OSC52,
};

constexpr const char *CLIPBOARD_HINT =
    "Hint: install wl-clipboard (wl-copy) or xclip/xsel, or use a terminal "
    "that supports OSC 52.";

} // namespace

ParseResult parse_args(int argc, char *argv[], TeeclipConfig &config) {
  static const struct option long_opts[] = {
      {"quiet", no_argument, nullptr, 'q'},
      {"strip", no_argument, nullptr, 's'},
      {"no-strip", no_argument, nullptr, 'S'},
      {"trim", no_argument, nullptr, 't'},
      {"notify", no_argument, nullptr, 'n'},
      {"file", required_argument, nullptr, 'f'},
      {"append", no_argument, nullptr, 'a'},
      {"no-clip", no_argument, nullptr, OPT_NO_CLIP},
      {"osc52", no_argument, nullptr, OPT_OSC52},
      {"verbose", no_argument, nullptr, 'v'},
      {"version", no_argument, nullptr, 'V'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0}};

  ParseResult result;

  // 0 makes glibc reinitialise its scanner state
  optind = 0;
  opterr = 1;

  int opt;
  while ((opt = getopt_long(argc, argv, "qsStnf:avVh", long_opts, nullptr)) !=
         -1) {
    switch (opt) {
    case 'q':
      config.quiet = true;
      break;
    case 's':
      config.strip_ansi = true;
      break;
    case 'S':
      config.strip_ansi = false;
      break;
    case 't':
      config.trim = true;
      break;
    case 'n':
      config.notify = true;
      break;
    case 'f':
      config.output_file = optarg;
      break;
    case 'a':
      config.append = true;
      break;
    case OPT_NO_CLIP:
      config.copy_to_clipboard = false;
      break;
    case OPT_OSC52:
      config.force_osc52 = true;
      break;
    case 'v':
      config.verbose = true;
      break;
    case 'V':
      result.action = ParseAction::ShowVersion;
      return result;
    case 'h':
      result.action = ParseAction::ShowHelp;
      return result;
    default:
      result.action = ParseAction::UsageError;
      return result;
    }
  }

  if (optind < argc) {
    result.action = ParseAction::UsageError;
    result.message = std::string("unexpected argument '") + argv[optind] + "'";
    return result;
  }

  if (config.output_file.empty() && config.append) {
    // -a only means something together with -f
    config.append = false;
  }

  auto valid = config.validate();
  if (valid.is_error()) {
    result.action = ParseAction::UsageError;
    result.message = valid.error().to_string();
  }

  return result;
}

std::string usage_text(const std::string &prog) {
  std::ostringstream out;
  out << prog
      << " - copy piped output to the system clipboard and optionally log "
         "it.\n"
      << "\n"
      << "Usage:\n"
      << "  some_command | " << prog << " [options]\n"
      << "\n"
      << "Examples:\n"
      << "  ls -la | " << prog
      << "                     # copy stdout to clipboard\n"
      << "  mytool 2>&1 | " << prog
      << "                 # copy both stdout and stderr\n"
      << "  some_cmd | " << prog
      << " -f output.log      # save a copy to a file and copy to clipboard\n"
      << "  some_cmd | " << prog
      << " -q --no-clip -f x  # only save to a file, print nothing\n"
      << "  ssh host cat notes.txt | " << prog
      << " --osc52  # copy through the terminal\n"
      << "\n"
      << "Options:\n"
      << "  -q, --quiet       don't print piped input to stdout\n"
      << "  -s, --strip       strip ANSI control sequences before copying "
         "(default)\n"
      << "  -S, --no-strip    keep ANSI control sequences\n"
      << "  -t, --trim        trim leading/trailing whitespace before "
         "copying\n"
      << "  -n, --notify      send a desktop notification after copying\n"
      << "  -f, --file FILE   save output to FILE (overwrites unless -a)\n"
      << "  -a, --append      append to FILE when used with -f\n"
      << "      --no-clip     do not copy to clipboard (useful with -f)\n"
      << "      --osc52       skip clipboard helpers, copy via OSC 52 only\n"
      << "  -v, --verbose     print diagnostics to stderr\n"
      << "  -V, --version     print version and exit\n"
      << "  -h, --help        show this help\n"
      << "\n"
      << "Environment:\n"
      << "  " << logging::LOG_LEVEL_ENV
      << "  diagnostic level (trace, debug, info, warning, error, off)\n"
      << "  " << TTY_PATH_ENV
      << "        terminal device for OSC 52 (default " << DEFAULT_TTY_PATH
      << ")\n";
  return out.str();
}

std::string describe_failure(const Error &error, const std::string &prog) {
  switch (error.code) {
  case ErrorCode::NoPipedInput:
    return "No piped input detected. Use: some_command | " + prog +
           "\nUse -h for help and examples.";
  case ErrorCode::InputError:
    return "read error: " + error.to_string();
  case ErrorCode::FileWriteError:
    return "file write error: " + error.to_string();
  case ErrorCode::ClipboardUnavailable:
    return "clipboard error: " + error.to_string() + "\n" + CLIPBOARD_HINT;
  default:
    return "error: " + error.to_string();
  }
}

} // namespace cli
} // namespace teeclip
