#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace feedctl {

/// Base class for every error raised by the feedctl core.
/// MUST carry a human-readable message suitable for `Error: <message>` output.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Raised when a file cannot be read or an output sink rejects a write.
/// MUST carry the offending path (empty for anonymous sinks).
class IoError : public Error {
 public:
  enum class Kind { NotFound, ReadFailed, WriteFailed };

  IoError(Kind kind, std::string path, const std::string& message)
      : Error(message), kind_(kind), path_(std::move(path)) {}

  Kind kind() const { return kind_; }
  const std::string& path() const { return path_; }

 private:
  Kind kind_;
  std::string path_;
};

/// Raised when embedded files include themselves or nest deeper than allowed.
/// The chain lists the files being expanded, outermost first, ending with the
/// file that could not be entered.
class RecursionLimitError : public Error {
 public:
  RecursionLimitError(const std::string& message, std::vector<std::string> chain)
      : Error(message), chain_(std::move(chain)) {}

  const std::vector<std::string>& chain() const { return chain_; }

 private:
  std::vector<std::string> chain_;
};

/// Raised when an XML document is malformed or does not have an entity shape.
class ParseError : public Error {
 public:
  explicit ParseError(const std::string& message) : Error(message) {}
};

/// Raised by feed clients on transport failures and HTTP error statuses.
/// status() is 0 when no HTTP response was received.
class ClientError : public Error {
 public:
  ClientError(const std::string& message, long status)
      : Error(message), status_(status) {}

  long status() const { return status_; }

 private:
  long status_ = 0;
};

}  // namespace feedctl
