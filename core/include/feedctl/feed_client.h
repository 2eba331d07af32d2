#pragma once

#include <string>

#include "feedctl/entity.h"

namespace feedctl {

/// CRUD access to a remote entity feed.
/// MUST throw ClientError on transport failures and HTTP error statuses and
/// ParseError when a response is not an entity/feed document.
class FeedClient {
 public:
  virtual ~FeedClient() = default;

  virtual Feed get_feed(const std::string& url) = 0;
  virtual EntityPtr get_entry(const std::string& url) = 0;
  /// Inserts a new entry into the feed at url and returns the stored entity.
  virtual EntityPtr insert_entry(const std::string& url, const Entity& entity) = 0;
  /// Replaces the entry at url and returns the stored entity.
  virtual EntityPtr update_entry(const std::string& url, const Entity& entity) = 0;
  virtual void delete_entry(const std::string& url) = 0;
};

/// Options for the HTTP transport.
struct HttpClientOptions {
  int timeout_ms = 30000;
  std::string user_agent = "feedctl";
};

/// FeedClient over HTTP using libcurl; entries travel as Atom documents.
/// When feedctl is built without libcurl every operation throws ClientError.
class HttpFeedClient : public FeedClient {
 public:
  explicit HttpFeedClient(HttpClientOptions options = {});

  Feed get_feed(const std::string& url) override;
  EntityPtr get_entry(const std::string& url) override;
  EntityPtr insert_entry(const std::string& url, const Entity& entity) override;
  EntityPtr update_entry(const std::string& url, const Entity& entity) override;
  void delete_entry(const std::string& url) override;

 private:
  struct Response {
    long status = 0;
    std::string body;
  };

  Response perform(const std::string& method, const std::string& url, const std::string* body);

  HttpClientOptions options_;
};

}  // namespace feedctl
