#include "feedctl/embed.h"

#include <filesystem>

#include "embed_internal.h"
#include "feedctl_internal.h"

namespace feedctl {

std::string load_document(const std::string& path, const EmbedOptions& options) {
  std::string content = internal::read_file(path);
  const std::filesystem::path parent = std::filesystem::path(path).parent_path();
  return embed_internal::expand_root(content, parent, options, path);
}

}  // namespace feedctl
