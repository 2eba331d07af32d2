#pragma once

#include <cstddef>
#include <string>

namespace feedctl {

/// Limits applied while expanding embedded-file placeholders.
struct EmbedOptions {
  /// Maximum nesting of embedded files below the top-level document.
  size_t max_depth = 32;
};

/// Replaces every `>@relative/path<` placeholder with the XML-escaped,
/// recursively expanded content of that file, resolved against base_dir.
/// Each embedded file is expanded relative to its own parent directory.
/// MUST throw IoError for unreadable files and RecursionLimitError when a file
/// embeds itself (directly or transitively) or nesting exceeds max_depth;
/// nothing is returned on failure.
std::string expand_embedded_files(const std::string& content,
                                   const std::string& base_dir,
                                   const EmbedOptions& options = {});

/// Reads a document from disk and expands its placeholders relative to the
/// document's own directory.
/// MUST throw IoError(NotFound) for a missing file.
std::string load_document(const std::string& path, const EmbedOptions& options = {});

}  // namespace feedctl
