#include "feedctl_internal.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "feedctl/errors.h"

namespace feedctl::internal {

std::string read_file(const std::string& path) {
  namespace fs = std::filesystem;
  std::error_code ec;
  const fs::file_status status = fs::status(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw IoError(IoError::Kind::ReadFailed, path, "Cannot access " + path + ": " + ec.message());
  }
  if (!fs::exists(status)) {
    throw IoError(IoError::Kind::NotFound, path, "File not found: " + path);
  }
  if (fs::is_directory(status)) {
    throw IoError(IoError::Kind::ReadFailed, path, "Not a regular file: " + path);
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw IoError(IoError::Kind::ReadFailed, path, "Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw IoError(IoError::Kind::ReadFailed, path, "Failed to read file: " + path);
  }
  return buffer.str();
}

}  // namespace feedctl::internal
