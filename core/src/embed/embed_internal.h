#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "feedctl/embed.h"

namespace feedctl::embed_internal {

/// Per-call expansion state; never shared between expansions.
struct ExpansionContext {
  EmbedOptions options;
  /// Canonical paths of the files currently being expanded, outermost first.
  std::vector<std::string> chain;
  /// Number of embedded files entered below the top-level document.
  size_t depth = 0;
};

/// Expands placeholders in content relative to base_dir using ctx.
std::string expand(const std::string& content,
                   const std::filesystem::path& base_dir,
                   ExpansionContext& ctx);

/// Starts a fresh expansion. root_path, when non-empty, names the document
/// the content came from so that it cannot embed itself.
std::string expand_root(const std::string& content,
                        const std::filesystem::path& base_dir,
                        const EmbedOptions& options,
                        const std::string& root_path);

}  // namespace feedctl::embed_internal
