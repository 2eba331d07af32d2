#pragma once

#include <ostream>
#include <string>

#include "feedctl/entity.h"

namespace feedctl {

/// Number of spaces added per nesting level.
constexpr int kIndentStep = 2;

/// Renders entities and feeds as indented, escaped XML onto an output sink.
/// Each renderer owns its indentation cursor, so concurrent renders on
/// separate instances never share state.
/// MUST leave the cursor at its pre-call value after every public call and
/// MUST throw IoError(WriteFailed) when the sink rejects a write.
class XmlRenderer {
 public:
  explicit XmlRenderer(std::ostream& out, int initial_indent = 0);

  /// Emits `<entities>`, every entity in order, then `</entities>`.
  /// A null member renders as an empty `<entity>` so the count is kept.
  void render_feed(const Feed& feed);
  /// Emits `<entity>`, every field in insertion order, then `</entity>`.
  void render_entity(const Entity& entity);
  /// Emits one field; repeated values emit one element per item with
  /// `repeatable="true"` on the first.
  void render_field(const std::string& name, const Value& value);

  int indentation() const { return indent_; }

 private:
  class IndentScope;

  void render_fields(const Entity& entity);
  void render_repeated(const std::string& name, const std::vector<Value>& items);
  void write_indentation();
  void write(const std::string& text);
  void write_line(const std::string& text);
  void check_sink();

  std::ostream& out_;
  int indent_ = 0;
};

/// Renders a feed into a string using a fresh cursor.
std::string render_feed_xml(const Feed& feed);
/// Renders a single entity into a string using a fresh cursor.
std::string render_entity_xml(const Entity& entity);
/// Escapes `&`, `<`, `>`, `"` and `'` as XML entities.
std::string escape_xml(const std::string& text);

}  // namespace feedctl
