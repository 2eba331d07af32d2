#pragma once

#include <string>

namespace feedctl {

/// Captures build version, source provenance and the optional backends
/// compiled into this build.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
  std::string libxml2_version;
  bool has_network = false;
};

/// Returns compile-time version/provenance for the current build.
/// MUST not perform IO.
VersionInfo get_version_info();
/// Returns e.g. `0.1.0 (abc1234) libxml2 2.9.14, network on`.
std::string version_string();

}  // namespace feedctl
