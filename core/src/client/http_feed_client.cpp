#include "feedctl/feed_client.h"

#include <memory>
#include <string>
#include <utility>

#ifdef FEEDCTL_USE_CURL
#include <curl/curl.h>
#endif

#include "client/http_internal.h"
#include "feedctl/entity_xml.h"
#include "feedctl/errors.h"
#include "util/string_util.h"

namespace feedctl {

namespace {

#ifdef FEEDCTL_USE_CURL

/// Appends curl response bytes into a caller-provided buffer.
/// MUST return the full byte count or curl treats it as an error.
size_t write_to_string(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total = size * nmemb;
  auto* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), total);
  return total;
}

struct CurlDeleter {
  void operator()(CURL* curl) const {
    if (curl) curl_easy_cleanup(curl);
  }
};

struct CurlListDeleter {
  void operator()(curl_slist* list) const {
    if (list) curl_slist_free_all(list);
  }
};

#endif

bool is_xml_content_type(const std::string& content_type) {
  return content_type == "application/atom+xml" ||
         content_type == "application/xml" ||
         content_type == "text/xml";
}

void require_body(const std::string& body, const std::string& url) {
  if (util::is_blank(body)) {
    throw ClientError("Empty response body from " + url, 0);
  }
}

}  // namespace

namespace internal {

std::string normalize_content_type(const char* raw) {
  if (!raw) return "";
  std::string value(raw);
  size_t end = value.find(';');
  if (end != std::string::npos) {
    value = value.substr(0, end);
  }
  return util::to_lower(util::trim_ws(value));
}

void check_response(const std::string& method, const std::string& url, long status,
                    const std::string& content_type) {
  if (status >= 400) {
    throw ClientError(method + " " + url + " returned HTTP " + std::to_string(status), status);
  }
  if (!content_type.empty() && !is_xml_content_type(content_type)) {
    throw ClientError("Unsupported Content-Type from " + url + ": " + content_type, status);
  }
}

}  // namespace internal

HttpFeedClient::HttpFeedClient(HttpClientOptions options) : options_(std::move(options)) {}

Feed HttpFeedClient::get_feed(const std::string& url) {
  Response response = perform("GET", url, nullptr);
  require_body(response.body, url);
  return parse_feed_document(response.body);
}

EntityPtr HttpFeedClient::get_entry(const std::string& url) {
  Response response = perform("GET", url, nullptr);
  require_body(response.body, url);
  return parse_entity_document(response.body);
}

EntityPtr HttpFeedClient::insert_entry(const std::string& url, const Entity& entity) {
  const std::string body = build_entry_document(entity);
  Response response = perform("POST", url, &body);
  require_body(response.body, url);
  return parse_entity_document(response.body);
}

EntityPtr HttpFeedClient::update_entry(const std::string& url, const Entity& entity) {
  const std::string body = build_entry_document(entity);
  Response response = perform("PUT", url, &body);
  require_body(response.body, url);
  return parse_entity_document(response.body);
}

void HttpFeedClient::delete_entry(const std::string& url) {
  perform("DELETE", url, nullptr);
}

HttpFeedClient::Response HttpFeedClient::perform(const std::string& method,
                                                 const std::string& url,
                                                 const std::string* body) {
#ifdef FEEDCTL_USE_CURL
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw ClientError("Failed to initialize curl", 0);
  }
  Response response;
  std::unique_ptr<curl_slist, CurlListDeleter> headers;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
  // Standard verbs let curl switch to GET on a 301/302/303 redirect.
  if (method == "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  } else if (method == "POST") {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
  }
  if (body) {
    headers.reset(curl_slist_append(nullptr, "Content-Type: application/atom+xml; charset=UTF-8"));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
  }
  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw ClientError(method + " " + url + " failed: " + curl_easy_strerror(res), 0);
  }
  if (curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status) != CURLE_OK) {
    throw ClientError("Failed to read HTTP status for " + url, 0);
  }
  std::string content_type;
  if (method != "DELETE" && !response.body.empty()) {
    const char* raw = nullptr;
    if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &raw) == CURLE_OK) {
      content_type = internal::normalize_content_type(raw);
    }
  }
  internal::check_response(method, url, response.status, content_type);
  return response;
#else
  (void)body;
  throw ClientError(method + " " + url + " failed: network support is disabled (libcurl not available)", 0);
#endif
}

}  // namespace feedctl
