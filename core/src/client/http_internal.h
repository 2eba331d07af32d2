#pragma once

#include <string>

namespace feedctl::internal {

/// Lowercases a Content-Type header value and strips its parameters.
std::string normalize_content_type(const char* raw);

/// Validates a completed HTTP exchange.
/// MUST throw ClientError carrying status for status >= 400, and for a
/// non-XML content type. An empty content_type means none was reported.
void check_response(const std::string& method, const std::string& url, long status,
                    const std::string& content_type);

}  // namespace feedctl::internal
