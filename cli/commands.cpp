#include "commands.h"

#include <stdexcept>

#include "feedctl/embed.h"
#include "feedctl/entity_xml.h"
#include "feedctl/errors.h"
#include "feedctl/xml_render.h"

namespace feedctl::cli {

namespace {

EntityPtr load_entry_file(const CliOptions& options) {
  EmbedOptions embed_options;
  embed_options.max_depth = options.max_embed_depth;
  return parse_entity_document(load_document(options.entry_file, embed_options));
}

const Entity& require_entity(const EntityPtr& entity, const std::string& url) {
  if (!entity) {
    throw ClientError("No entity returned for " + url, 0);
  }
  return *entity;
}

void check_sink(std::ostream& out) {
  if (!out) {
    throw IoError(IoError::Kind::WriteFailed, "", "Failed to write output");
  }
}

}  // namespace

std::vector<std::string> collect_option_warnings(const CliOptions& options) {
  std::vector<std::string> warnings;
  const std::string op = operation_name(options.operation);
  if (!options.url.empty() && !operation_needs_url(options.operation)) {
    warnings.push_back("--url is ignored for --op " + op);
  }
  if (!options.entry_file.empty() && !operation_needs_entry_file(options.operation)) {
    warnings.push_back("--entry-file is ignored for --op " + op);
  }
  return warnings;
}

int run_operation(const CliOptions& options, FeedClient& client, std::ostream& out) {
  XmlRenderer renderer(out);
  switch (options.operation) {
    case Operation::GetFeed:
      renderer.render_feed(client.get_feed(options.url));
      return 0;
    case Operation::GetEntry:
      renderer.render_entity(require_entity(client.get_entry(options.url), options.url));
      return 0;
    case Operation::Insert: {
      EntityPtr entity = load_entry_file(options);
      renderer.render_entity(
          require_entity(client.insert_entry(options.url, *entity), options.url));
      return 0;
    }
    case Operation::Update: {
      EntityPtr entity = load_entry_file(options);
      renderer.render_entity(
          require_entity(client.update_entry(options.url, *entity), options.url));
      return 0;
    }
    case Operation::Delete:
      client.delete_entry(options.url);
      if (!options.quiet) {
        out << "Deleted: " << options.url << "\n";
        check_sink(out);
      }
      return 0;
    case Operation::Expand: {
      EmbedOptions embed_options;
      embed_options.max_depth = options.max_embed_depth;
      std::string expanded = load_document(options.entry_file, embed_options);
      out << expanded;
      check_sink(out);
      return 0;
    }
    case Operation::Print: {
      EmbedOptions embed_options;
      embed_options.max_depth = options.max_embed_depth;
      renderer.render_feed(parse_feed_document(load_document(options.entry_file, embed_options)));
      return 0;
    }
    case Operation::None:
      break;
  }
  throw std::invalid_argument("No operation selected");
}

void finish_output(std::ostream& out, const std::string& target) {
  out.flush();
  if (!out) {
    throw IoError(IoError::Kind::WriteFailed, target, "Failed to write output to " + target);
  }
}

int exit_code_for(const std::exception& ex) {
  if (const auto* io = dynamic_cast<const IoError*>(&ex)) {
    return io->kind() == IoError::Kind::WriteFailed ? 1 : 2;
  }
  return 1;
}

}  // namespace feedctl::cli
