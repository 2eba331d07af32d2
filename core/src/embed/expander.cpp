#include "embed_internal.h"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "feedctl/errors.h"
#include "feedctl_internal.h"
#include "util/string_util.h"

namespace feedctl::embed_internal {

namespace fs = std::filesystem;

namespace {

/// Position of one `>@path<` placeholder inside a document.
/// gt is the index of the `>`; path spans [gt + 2, lt); lt is the index of the `<`.
struct Placeholder {
  size_t gt = 0;
  size_t lt = 0;
};

/// Finds the next placeholder at or after `from`.
/// A candidate whose path is interrupted by a line break is skipped; the
/// scanner never backtracks, so the whole pass is linear in the input size.
std::optional<Placeholder> find_placeholder(const std::string& content, size_t from) {
  size_t pos = from;
  while (pos < content.size()) {
    size_t gt = content.find(">@", pos);
    if (gt == std::string::npos) return std::nullopt;
    size_t stop = content.find_first_of("<\n\r", gt + 2);
    if (stop == std::string::npos) return std::nullopt;
    if (content[stop] == '<') {
      return Placeholder{gt, stop};
    }
    pos = stop + 1;
  }
  return std::nullopt;
}

std::string canonical_key(const fs::path& path) {
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(path, ec);
  if (ec) return path.lexically_normal().string();
  return canonical.string();
}

/// Keeps the expansion chain in sync with the recursion even when reading or
/// expanding an embedded file throws.
class ChainEntry {
 public:
  ChainEntry(ExpansionContext& ctx, std::string key) : ctx_(ctx) {
    ctx_.chain.push_back(std::move(key));
    ++ctx_.depth;
  }
  ~ChainEntry() {
    ctx_.chain.pop_back();
    --ctx_.depth;
  }

  ChainEntry(const ChainEntry&) = delete;
  ChainEntry& operator=(const ChainEntry&) = delete;

 private:
  ExpansionContext& ctx_;
};

std::string expand_file(const fs::path& path, ExpansionContext& ctx) {
  std::string key = canonical_key(path);
  if (std::find(ctx.chain.begin(), ctx.chain.end(), key) != ctx.chain.end()) {
    std::vector<std::string> chain = ctx.chain;
    chain.push_back(key);
    throw RecursionLimitError("Embedded file includes itself: " + path.string(), chain);
  }
  if (ctx.depth >= ctx.options.max_depth) {
    std::vector<std::string> chain = ctx.chain;
    chain.push_back(key);
    throw RecursionLimitError("Embedded files nested deeper than " +
                                  std::to_string(ctx.options.max_depth) + " levels at " +
                                  path.string(),
                              chain);
  }
  std::string content = internal::read_file(path.string());
  ChainEntry entry(ctx, key);
  return expand(content, path.parent_path(), ctx);
}

}  // namespace

std::string expand(const std::string& content, const fs::path& base_dir, ExpansionContext& ctx) {
  std::string out;
  out.reserve(content.size());
  size_t copied = 0;
  size_t pos = 0;
  while (auto placeholder = find_placeholder(content, pos)) {
    // Keep the '>' that opens the placeholder; drop "@path".
    out.append(content, copied, placeholder->gt + 1 - copied);
    const size_t path_start = placeholder->gt + 2;
    fs::path relative(content.substr(path_start, placeholder->lt - path_start));
    // Embedded paths always resolve under the base directory.
    fs::path resolved = base_dir / relative.relative_path();
    out += util::escape_xml(expand_file(resolved, ctx));
    copied = placeholder->lt;
    pos = placeholder->lt;
  }
  out.append(content, copied, std::string::npos);
  return out;
}

std::string expand_root(const std::string& content,
                        const fs::path& base_dir,
                        const EmbedOptions& options,
                        const std::string& root_path) {
  ExpansionContext ctx;
  ctx.options = options;
  if (!root_path.empty()) {
    ctx.chain.push_back(canonical_key(root_path));
  }
  return expand(content, base_dir, ctx);
}

}  // namespace feedctl::embed_internal

namespace feedctl {

std::string expand_embedded_files(const std::string& content,
                                   const std::string& base_dir,
                                   const EmbedOptions& options) {
  return embed_internal::expand_root(content, base_dir, options, "");
}

}  // namespace feedctl
