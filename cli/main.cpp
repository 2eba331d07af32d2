#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

#include "cli_args.h"
#include "commands.h"
#include "feedctl/errors.h"
#include "feedctl/feed_client.h"
#include "feedctl/version.h"
#include "ui/color.h"

using namespace feedctl::cli;

/// Entry point that parses CLI options and dispatches the selected operation.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    std::cerr << "Run 'feedctl --help' for usage.\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "feedctl " << feedctl::version_string() << std::endl;
    return 0;
  }

  const bool color = options.color && isatty(STDERR_FILENO);
  for (const auto& warning : collect_option_warnings(options)) {
    if (color) std::cerr << kColor.yellow;
    std::cerr << "Warning: " << warning << std::endl;
    if (color) std::cerr << kColor.reset;
  }

  std::ofstream output_file;
  if (!options.output.empty()) {
    output_file.open(options.output, std::ios::binary | std::ios::trunc);
    if (!output_file) {
      std::cerr << "Error: Failed to open output file: " << options.output << std::endl;
      return 2;
    }
  }
  std::ostream& out = options.output.empty() ? std::cout : output_file;

  const std::string target = options.output.empty() ? "stdout" : options.output;

  try {
    feedctl::HttpClientOptions client_options;
    client_options.timeout_ms = options.timeout_ms;
    client_options.user_agent = "feedctl/" + feedctl::get_version_info().version;
    feedctl::HttpFeedClient client(client_options);
    int code = run_operation(options, client, out);
    finish_output(out, target);
    if (output_file.is_open()) {
      output_file.close();
      if (!output_file) {
        throw feedctl::IoError(feedctl::IoError::Kind::WriteFailed, target,
                               "Failed to close output file: " + target);
      }
    }
    return code;
  } catch (const std::exception& ex) {
    if (color) std::cerr << kColor.red;
    std::cerr << "Error: " << ex.what() << std::endl;
    if (color) std::cerr << kColor.reset;
    return exit_code_for(ex);
  }
}
