#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace feedctl::cli {

/// Operations selected with --op.
enum class Operation {
  None,
  GetFeed,
  GetEntry,
  Insert,
  Update,
  Delete,
  Expand,
  Print,
};

/// Typed command-line options.
/// Defaults MUST match the values documented in print_help.
struct CliOptions {
  std::string url;
  Operation operation = Operation::None;
  std::string entry_file;
  std::string output;
  int timeout_ms = 30000;
  size_t max_embed_depth = 32;
  bool color = true;
  bool quiet = false;
  bool show_help = false;
  bool show_version = false;
};

/// Maps an --op value (e.g. "getFeed") to an operation.
std::optional<Operation> parse_operation(const std::string& name);
/// Returns the --op spelling of an operation.
std::string operation_name(Operation op);
/// True for operations that talk to the feed server.
bool operation_needs_url(Operation op);
/// True for operations that read --entry-file.
bool operation_needs_entry_file(Operation op);

/// Prints the banner shown when feedctl runs without arguments.
void print_startup_help(std::ostream& os);
/// Prints the usage requested by --help.
void print_help(std::ostream& os);
/// Parses argv into options.
/// MUST return false with a message for unknown flags, missing or invalid
/// values and inconsistent combinations; never throws.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace feedctl::cli
