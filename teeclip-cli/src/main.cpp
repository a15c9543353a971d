/**
 * @file main.cpp
 * @brief teeclip command-line entry point
 */

#include "cli.h"
#include <csignal>
#include <iostream>
#include <teeclip/teeclip.h>

int main(int argc, char *argv[]) {
  using namespace teeclip;

  // Broken pipes (helper gone, stdout reader gone) are reported as EPIPE
  std::signal(SIGPIPE, SIG_IGN);

  const std::string prog = argc > 0 ? argv[0] : "teeclip";

  TeeclipConfig config;
  config.load_defaults();
  config.apply_environment();

  auto parsed = cli::parse_args(argc, argv, config);
  switch (parsed.action) {
  case cli::ParseAction::ShowHelp:
    std::cout << cli::usage_text(prog);
    return 0;
  case cli::ParseAction::ShowVersion:
    std::cout << "teeclip " << VERSION_STRING << " (" << TEECLIP_PLATFORM_NAME
              << ", " << TEECLIP_COMPILER_NAME << ")" << std::endl;
    return 0;
  case cli::ParseAction::UsageError:
    if (!parsed.message.empty()) {
      std::cerr << prog << ": " << parsed.message << "\n";
    }
    std::cerr << cli::usage_text(prog);
    return cli::EXIT_USAGE;
  case cli::ParseAction::Run:
    break;
  }

  logging::init(config.verbose, config.quiet);

  auto report = run_pipeline(config);
  if (report.is_error()) {
    logging::console()->error(cli::describe_failure(report.error(), prog));
    return 1;
  }

  return 0;
}
