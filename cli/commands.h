#pragma once

#include <exception>
#include <ostream>
#include <string>
#include <vector>

#include "cli_args.h"
#include "feedctl/feed_client.h"

namespace feedctl::cli {

/// Lists options that are accepted but have no effect for the selected
/// operation, so main can report them as warnings.
std::vector<std::string> collect_option_warnings(const CliOptions& options);

/// Runs the selected operation against client and renders the result to out.
/// MUST throw on the first failure (load, parse, client or sink) and MUST not
/// write partial results for failed loads or requests.
/// Returns the process exit code for successful runs.
int run_operation(const CliOptions& options, FeedClient& client, std::ostream& out);

/// Flushes out and raises IoError(WriteFailed) naming target when buffered
/// output could not be delivered.
void finish_output(std::ostream& out, const std::string& target);

/// Maps a failure escaping run_operation to the process exit code.
/// Unreadable inputs exit 2; write failures and other runtime errors exit 1.
int exit_code_for(const std::exception& ex);

}  // namespace feedctl::cli
