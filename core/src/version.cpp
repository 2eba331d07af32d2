#include "feedctl/version.h"

#include <libxml/xmlversion.h>

#ifndef FEEDCTL_VERSION
#define FEEDCTL_VERSION "0.0.0"
#endif

#ifndef FEEDCTL_GIT_COMMIT
#define FEEDCTL_GIT_COMMIT "unknown"
#endif

#ifndef FEEDCTL_GIT_DIRTY
#define FEEDCTL_GIT_DIRTY 0
#endif

namespace feedctl {

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = FEEDCTL_VERSION;
  info.git_commit = FEEDCTL_GIT_COMMIT;
  info.git_dirty = (FEEDCTL_GIT_DIRTY != 0);
  info.libxml2_version = LIBXML_DOTTED_VERSION;
#ifdef FEEDCTL_USE_CURL
  info.has_network = true;
#endif
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ") libxml2 " + info.libxml2_version;
  out += info.has_network ? ", network on" : ", network off";
  return out;
}

}  // namespace feedctl
