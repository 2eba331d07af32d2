#pragma once

#include <string>

namespace feedctl::internal {

/// Loads the full byte content of a file as text.
/// MUST throw IoError(NotFound) for missing paths and IoError(ReadFailed) for
/// directories or unreadable files; performs no network access.
std::string read_file(const std::string& path);

}  // namespace feedctl::internal
