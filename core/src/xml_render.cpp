#include "feedctl/xml_render.h"

#include <sstream>

#include "feedctl/errors.h"
#include "util/string_util.h"

namespace feedctl {

/// Raises the indentation for the lifetime of the scope.
/// Restores it on unwinding too, so a failed sink never leaves the cursor shifted.
class XmlRenderer::IndentScope {
 public:
  explicit IndentScope(XmlRenderer& renderer) : renderer_(renderer) {
    renderer_.indent_ += kIndentStep;
  }
  ~IndentScope() { renderer_.indent_ -= kIndentStep; }

  IndentScope(const IndentScope&) = delete;
  IndentScope& operator=(const IndentScope&) = delete;

 private:
  XmlRenderer& renderer_;
};

XmlRenderer::XmlRenderer(std::ostream& out, int initial_indent)
    : out_(out), indent_(initial_indent < 0 ? 0 : initial_indent) {}

void XmlRenderer::render_feed(const Feed& feed) {
  write_line("<entities>");
  {
    IndentScope scope(*this);
    // A null member keeps its slot as an empty entity.
    static const Entity kEmptyEntity{};
    for (const auto& entity : feed) {
      render_entity(entity ? *entity : kEmptyEntity);
    }
  }
  write_line("</entities>");
}

void XmlRenderer::render_entity(const Entity& entity) {
  write_line("<entity>");
  {
    IndentScope scope(*this);
    render_fields(entity);
  }
  write_line("</entity>");
}

void XmlRenderer::render_field(const std::string& name, const Value& value) {
  switch (value.kind()) {
    case Value::Kind::Repeated:
      render_repeated(name, value.as_repeated());
      return;
    case Value::Kind::Entity:
      write_line("<" + name + ">");
      {
        IndentScope scope(*this);
        render_fields(value.as_entity());
      }
      write_line("</" + name + ">");
      return;
    case Value::Kind::Scalar:
    case Value::Kind::Null:
      write_line("<" + name + ">" + util::escape_xml(value.text_or_empty()) + "</" + name + ">");
      return;
  }
}

void XmlRenderer::render_fields(const Entity& entity) {
  for (const auto& field : entity.fields()) {
    render_field(field.name, field.value);
  }
}

void XmlRenderer::render_repeated(const std::string& name, const std::vector<Value>& items) {
  for (size_t i = 0; i < items.size(); ++i) {
    const Value& item = items[i];
    const std::string open = "<" + name + (i == 0 ? " repeatable=\"true\"" : "") + ">";
    const std::string close = "</" + name + ">";
    switch (item.kind()) {
      case Value::Kind::Entity:
        write_line(open);
        {
          IndentScope scope(*this);
          render_fields(item.as_entity());
        }
        write_line(close);
        break;
      case Value::Kind::Repeated:
        write_line(open);
        {
          IndentScope scope(*this);
          render_repeated(name, item.as_repeated());
        }
        write_line(close);
        break;
      case Value::Kind::Scalar:
      case Value::Kind::Null:
        write_line(open + util::escape_xml(item.text_or_empty()) + close);
        break;
    }
  }
}

void XmlRenderer::write_indentation() {
  for (int i = 0; i < indent_; ++i) {
    out_.put(' ');
  }
}

void XmlRenderer::write(const std::string& text) {
  write_indentation();
  out_ << text;
  check_sink();
}

void XmlRenderer::write_line(const std::string& text) {
  write(text);
  out_ << '\n';
  check_sink();
}

void XmlRenderer::check_sink() {
  if (!out_) {
    throw IoError(IoError::Kind::WriteFailed, "", "Failed to write rendered XML to output");
  }
}

std::string render_feed_xml(const Feed& feed) {
  std::ostringstream out;
  XmlRenderer renderer(out);
  renderer.render_feed(feed);
  return out.str();
}

std::string render_entity_xml(const Entity& entity) {
  std::ostringstream out;
  XmlRenderer renderer(out);
  renderer.render_entity(entity);
  return out.str();
}

std::string escape_xml(const std::string& text) {
  return util::escape_xml(text);
}

}  // namespace feedctl
