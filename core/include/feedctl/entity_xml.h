#pragma once

#include <string>

#include "feedctl/entity.h"

namespace feedctl {

/// Atom namespace used by entry envelopes.
constexpr const char* kAtomNamespace = "http://www.w3.org/2005/Atom";

/// Parses an `<entity>` document, or an Atom `<entry>` whose `<content>` holds
/// an `<entity>` element.
/// Elements with element children become nested entities; elements marked
/// `repeatable="true"` or whose name repeats among siblings become repeated
/// groups; all other elements become scalars of their decoded text.
/// MUST throw ParseError for malformed XML or an unexpected root element.
EntityPtr parse_entity_document(const std::string& xml);

/// Parses an `<entities>` document, an Atom `<feed>`, or a single entity/entry
/// document into a feed, preserving document order.
/// MUST throw ParseError for malformed XML or an unexpected root element.
Feed parse_feed_document(const std::string& xml);

/// Wraps the rendered entity into an Atom entry envelope for insert/update.
std::string build_entry_document(const Entity& entity);

}  // namespace feedctl
