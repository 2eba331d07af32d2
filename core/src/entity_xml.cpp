#include "feedctl/entity_xml.h"

#include <climits>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include "feedctl/errors.h"
#include "feedctl/xml_render.h"
#include "util/string_util.h"

namespace feedctl {

namespace {

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const {
    if (doc) xmlFreeDoc(doc);
  }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

XmlDocPtr read_xml(const std::string& xml) {
  if (xml.size() > static_cast<size_t>(INT_MAX)) {
    throw ParseError("XML document is too large");
  }
  XmlDocPtr doc(xmlReadMemory(xml.data(),
                              static_cast<int>(xml.size()),
                              nullptr,
                              nullptr,
                              XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
  if (!doc) {
    std::string detail = "unknown error";
    const xmlError* error = xmlGetLastError();
    if (error && error->message) {
      detail = util::trim_ws(error->message);
      if (error->line > 0) {
        detail += " at line " + std::to_string(error->line);
      }
    }
    throw ParseError("Malformed XML: " + detail);
  }
  return doc;
}

std::string node_name(const xmlNode* node) {
  return node && node->name ? reinterpret_cast<const char*>(node->name) : "";
}

bool is_element(const xmlNode* node, const char* name) {
  return node && node->type == XML_ELEMENT_NODE && node_name(node) == name;
}

bool has_element_children(const xmlNode* node) {
  for (const xmlNode* child = node->children; child != nullptr; child = child->next) {
    if (child->type == XML_ELEMENT_NODE) return true;
  }
  return false;
}

bool is_marked_repeatable(xmlNode* node) {
  xmlChar* raw = xmlGetProp(node, reinterpret_cast<const xmlChar*>("repeatable"));
  if (!raw) return false;
  std::string value = util::to_lower(reinterpret_cast<const char*>(raw));
  xmlFree(raw);
  return value == "true";
}

std::string text_content(xmlNode* node) {
  xmlChar* raw = xmlNodeGetContent(node);
  if (!raw) return "";
  std::string out = reinterpret_cast<const char*>(raw);
  xmlFree(raw);
  return out;
}

EntityPtr entity_from_element(xmlNode* element);

Value value_from_element(xmlNode* element) {
  if (has_element_children(element)) {
    return Value::entity(entity_from_element(element));
  }
  return Value::scalar(text_content(element));
}

EntityPtr entity_from_element(xmlNode* element) {
  std::vector<std::string> order;
  std::unordered_map<std::string, std::vector<xmlNode*>> groups;
  std::unordered_set<std::string> repeatable;
  for (xmlNode* child = element->children; child != nullptr; child = child->next) {
    if (child->type != XML_ELEMENT_NODE) continue;
    std::string name = node_name(child);
    auto& group = groups[name];
    if (group.empty()) order.push_back(name);
    group.push_back(child);
    if (is_marked_repeatable(child)) repeatable.insert(name);
  }

  auto entity = std::make_shared<Entity>();
  for (const auto& name : order) {
    const auto& nodes = groups[name];
    if (nodes.size() > 1 || repeatable.count(name) > 0) {
      std::vector<Value> items;
      items.reserve(nodes.size());
      for (xmlNode* node : nodes) {
        items.push_back(value_from_element(node));
      }
      entity->set(name, Value::repeated(std::move(items)));
    } else {
      entity->set(name, value_from_element(nodes.front()));
    }
  }
  return entity;
}

xmlNode* first_child_element(xmlNode* parent, const char* name) {
  for (xmlNode* child = parent->children; child != nullptr; child = child->next) {
    if (is_element(child, name)) return child;
  }
  return nullptr;
}

EntityPtr entity_from_entry(xmlNode* entry) {
  xmlNode* content = first_child_element(entry, "content");
  if (!content) {
    throw ParseError("Atom entry has no <content> element");
  }
  xmlNode* entity = first_child_element(content, "entity");
  if (!entity) {
    throw ParseError("Atom entry content has no <entity> element");
  }
  return entity_from_element(entity);
}

xmlNode* root_element(const XmlDocPtr& doc) {
  xmlNode* root = xmlDocGetRootElement(doc.get());
  if (!root) {
    throw ParseError("XML document has no root element");
  }
  return root;
}

}  // namespace

EntityPtr parse_entity_document(const std::string& xml) {
  XmlDocPtr doc = read_xml(xml);
  xmlNode* root = root_element(doc);
  if (is_element(root, "entity")) return entity_from_element(root);
  if (is_element(root, "entry")) return entity_from_entry(root);
  throw ParseError("Expected <entity> or Atom <entry> root element, found <" +
                   node_name(root) + ">");
}

Feed parse_feed_document(const std::string& xml) {
  XmlDocPtr doc = read_xml(xml);
  xmlNode* root = root_element(doc);
  Feed feed;
  if (is_element(root, "entities")) {
    for (xmlNode* child = root->children; child != nullptr; child = child->next) {
      if (is_element(child, "entity")) feed.push_back(entity_from_element(child));
    }
  } else if (is_element(root, "feed")) {
    for (xmlNode* child = root->children; child != nullptr; child = child->next) {
      if (is_element(child, "entry")) feed.push_back(entity_from_entry(child));
    }
  } else if (is_element(root, "entity")) {
    feed.push_back(entity_from_element(root));
  } else if (is_element(root, "entry")) {
    feed.push_back(entity_from_entry(root));
  } else {
    throw ParseError("Expected <entities>, <entity> or an Atom feed, found <" +
                     node_name(root) + ">");
  }
  return feed;
}

std::string build_entry_document(const Entity& entity) {
  std::ostringstream out;
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  out << "<entry xmlns=\"" << kAtomNamespace << "\">\n";
  out << "  <content type=\"application/xml\">\n";
  XmlRenderer renderer(out, 2 * kIndentStep);
  renderer.render_entity(entity);
  out << "  </content>\n";
  out << "</entry>\n";
  return out.str();
}

}  // namespace feedctl
