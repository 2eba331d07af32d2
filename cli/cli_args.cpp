#include "cli_args.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <string>

namespace feedctl::cli {

namespace {

constexpr const char* kAllOperations =
    "getFeed, getEntry, insert, update, delete, expand or print";

bool parse_number(const std::string& text, long long min_value, long long& out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') return false;
  if (value < min_value || value > INT_MAX) return false;
  out = value;
  return true;
}

}  // namespace

std::optional<Operation> parse_operation(const std::string& name) {
  if (name == "getFeed") return Operation::GetFeed;
  if (name == "getEntry") return Operation::GetEntry;
  if (name == "insert") return Operation::Insert;
  if (name == "update") return Operation::Update;
  if (name == "delete") return Operation::Delete;
  if (name == "expand") return Operation::Expand;
  if (name == "print") return Operation::Print;
  return std::nullopt;
}

std::string operation_name(Operation op) {
  switch (op) {
    case Operation::GetFeed: return "getFeed";
    case Operation::GetEntry: return "getEntry";
    case Operation::Insert: return "insert";
    case Operation::Update: return "update";
    case Operation::Delete: return "delete";
    case Operation::Expand: return "expand";
    case Operation::Print: return "print";
    case Operation::None: break;
  }
  return "";
}

bool operation_needs_url(Operation op) {
  return op == Operation::GetFeed || op == Operation::GetEntry || op == Operation::Insert ||
         op == Operation::Update || op == Operation::Delete;
}

bool operation_needs_entry_file(Operation op) {
  return op == Operation::Insert || op == Operation::Update || op == Operation::Expand ||
         op == Operation::Print;
}

void print_startup_help(std::ostream& os) {
  os << "feedctl - command line client for entity feeds\n\n";
  os << "Usage:\n";
  os << "  feedctl --op getFeed|getEntry|delete --url <url>\n";
  os << "  feedctl --op insert|update --url <url> --entry-file <file.xml>\n";
  os << "  feedctl --op expand|print --entry-file <file.xml>\n";
  os << "  feedctl --help | --version\n\n";
  os << "Notes:\n";
  os << "  - Entry files may embed other files: <field>@relative/path.xml</field>.\n";
  os << "  - Exit codes: 0=success, 1=runtime error, 2=CLI/IO usage error.\n\n";
  os << "Examples:\n";
  os << "  feedctl --op getFeed --url http://localhost:8080/feeds/contacts\n";
  os << "  feedctl --op insert --url http://localhost:8080/feeds/contacts --entry-file ./contact.xml\n";
  os << "  feedctl --op expand --entry-file ./gadget.xml\n";
}

void print_help(std::ostream& os) {
  os << "Usage: feedctl --op <operation> [--url <url>] [--entry-file <file.xml>]\n";
  os << "               [--output <file>] [--timeout-ms <n>] [--max-embed-depth <n>]\n";
  os << "               [--quiet] [--color=disabled]\n";
  os << "       feedctl --help | --version\n";
  os << "Operations:\n";
  os << "  getFeed   print every entity of the feed at --url\n";
  os << "  getEntry  print the entity at --url\n";
  os << "  insert    insert the entity in --entry-file into the feed at --url\n";
  os << "  update    replace the entity at --url with --entry-file\n";
  os << "  delete    delete the entity at --url\n";
  os << "  expand    print --entry-file with embedded files resolved\n";
  os << "  print     parse --entry-file and print it as entities\n";
  os << "--entryFilePath is accepted as an alias of --entry-file.\n";
  os << "--timeout-ms defaults to 30000; --max-embed-depth defaults to 32.\n";
  os << "Exit codes: 0=success, 1=runtime error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--url") {
      if (i + 1 >= argc) {
        error = "Missing value for --url";
        return false;
      }
      parsed.url = argv[++i];
    } else if (arg == "--op") {
      if (i + 1 >= argc) {
        error = "Missing value for --op";
        return false;
      }
      std::string name = argv[++i];
      auto op = parse_operation(name);
      if (!op.has_value()) {
        error = "Unknown operation: " + name + ". Must use " + kAllOperations + ".";
        return false;
      }
      parsed.operation = *op;
    } else if (arg == "--entry-file" || arg == "--entryFilePath") {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      parsed.entry_file = argv[++i];
    } else if (arg == "--output") {
      if (i + 1 >= argc) {
        error = "Missing value for --output";
        return false;
      }
      parsed.output = argv[++i];
    } else if (arg == "--timeout-ms") {
      if (i + 1 >= argc) {
        error = "Missing value for --timeout-ms";
        return false;
      }
      long long value = 0;
      if (!parse_number(argv[++i], 1, value)) {
        error = "Invalid --timeout-ms value (use a positive integer)";
        return false;
      }
      parsed.timeout_ms = static_cast<int>(value);
    } else if (arg == "--max-embed-depth") {
      if (i + 1 >= argc) {
        error = "Missing value for --max-embed-depth";
        return false;
      }
      long long value = 0;
      if (!parse_number(argv[++i], 0, value)) {
        error = "Invalid --max-embed-depth value (use a non-negative integer)";
        return false;
      }
      parsed.max_embed_depth = static_cast<size_t>(value);
    } else if (arg == "--color=disabled") {
      parsed.color = false;
    } else if (arg == "--quiet") {
      parsed.quiet = true;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (!parsed.show_help && !parsed.show_version) {
    if (parsed.operation == Operation::None) {
      error = "Missing --op (use " + std::string(kAllOperations) + ")";
      return false;
    }
    if (operation_needs_url(parsed.operation) && parsed.url.empty()) {
      error = "--op " + operation_name(parsed.operation) + " requires --url";
      return false;
    }
    if (operation_needs_entry_file(parsed.operation) && parsed.entry_file.empty()) {
      error = "--op " + operation_name(parsed.operation) + " requires --entry-file";
      return false;
    }
  }
  options = parsed;
  return true;
}

}  // namespace feedctl::cli
