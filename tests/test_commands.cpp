#include "test_harness.h"
#include "test_utils.h"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>

#include "commands.h"
#include "feedctl/errors.h"
#include "feedctl/xml_render.h"

namespace {

using feedctl::Entity;
using feedctl::EntityPtr;
using feedctl::Feed;
using feedctl::Value;
using feedctl::cli::CliOptions;
using feedctl::cli::Operation;

/// Records every call and answers from canned data.
class FakeFeedClient : public feedctl::FeedClient {
 public:
  Feed get_feed(const std::string& url) override {
    calls.push_back("getFeed " + url);
    return feed;
  }
  EntityPtr get_entry(const std::string& url) override {
    calls.push_back("getEntry " + url);
    return entry;
  }
  EntityPtr insert_entry(const std::string& url, const Entity& entity) override {
    calls.push_back("insert " + url);
    sent = feedctl::render_entity_xml(entity);
    return stored(entity);
  }
  EntityPtr update_entry(const std::string& url, const Entity& entity) override {
    calls.push_back("update " + url);
    sent = feedctl::render_entity_xml(entity);
    return stored(entity);
  }
  void delete_entry(const std::string& url) override {
    calls.push_back("delete " + url);
    if (fail_delete) throw feedctl::ClientError("DELETE " + url + " returned HTTP 404", 404);
  }

  Feed feed;
  EntityPtr entry;
  std::vector<std::string> calls;
  std::string sent;
  bool fail_delete = false;

 private:
  EntityPtr stored(const Entity& entity) {
    auto copy = std::make_shared<Entity>(entity);
    copy->set("id", Value::scalar("42"));
    return copy;
  }
};

/// Buffers every write but cannot deliver it: sync always fails, as a full
/// disk does once buffered output is flushed.
class UndeliverableBuffer : public std::streambuf {
 public:
  UndeliverableBuffer() { setp(data_, data_ + sizeof(data_)); }

 protected:
  int overflow(int c) override {
    setp(data_, data_ + sizeof(data_));
    if (!traits_type::eq_int_type(c, traits_type::eof())) {
      sputc(traits_type::to_char_type(c));
    }
    return traits_type::not_eof(c);
  }
  int sync() override { return -1; }

 private:
  char data_[256];
};

CliOptions make_options(Operation op, const std::string& url, const std::string& entry_file = "") {
  CliOptions options;
  options.operation = op;
  options.url = url;
  options.entry_file = entry_file;
  return options;
}

void test_run_get_feed_renders_entities() {
  FakeFeedClient client;
  client.feed = {make_example_entity()};
  std::ostringstream out;
  int code = feedctl::cli::run_operation(make_options(Operation::GetFeed, "http://h/f"), client, out);
  expect_eq(static_cast<size_t>(code), 0, "getFeed succeeds");
  expect_eq(out.str(), feedctl::render_feed_xml(client.feed), "feed rendered to the sink");
  expect_eq(client.calls.size(), 1, "one request");
  expect_eq(client.calls[0], "getFeed http://h/f", "feed url used");
}

void test_run_get_entry_renders_entity() {
  FakeFeedClient client;
  client.entry = make_example_entity();
  std::ostringstream out;
  feedctl::cli::run_operation(make_options(Operation::GetEntry, "http://h/f/1"), client, out);
  expect_eq(out.str(), feedctl::render_entity_xml(*client.entry), "entry rendered");
}

void test_run_get_entry_without_entity_fails() {
  FakeFeedClient client;
  std::ostringstream out;
  expect_throws<feedctl::ClientError>(
      [&] {
        feedctl::cli::run_operation(make_options(Operation::GetEntry, "http://h/f/1"), client, out);
      },
      "missing server entity is a client error");
}

void test_run_insert_expands_and_parses_entry_file() {
  TempDir dir;
  dir.write("body.html", "<p>Hi & bye</p>");
  auto path = dir.write("entry.xml",
                        "<entity>\n  <title>New</title>\n  <body>@body.html</body>\n</entity>\n");
  FakeFeedClient client;
  std::ostringstream out;
  feedctl::cli::run_operation(make_options(Operation::Insert, "http://h/f", path.string()), client,
                              out);
  std::string expected_sent =
      "<entity>\n"
      "  <title>New</title>\n"
      "  <body>&lt;p&gt;Hi &amp; bye&lt;/p&gt;</body>\n"
      "</entity>\n";
  expect_eq(client.sent, expected_sent, "embedded file arrives as escaped text");
  expect_true(out.str().find("<id>42</id>") != std::string::npos, "server result rendered");
  expect_eq(client.calls[0], "insert http://h/f", "insert url used");
}

void test_run_update_uses_entry_url() {
  TempDir dir;
  auto path = dir.write("entry.xml", "<entity><title>Changed</title></entity>");
  FakeFeedClient client;
  std::ostringstream out;
  feedctl::cli::run_operation(make_options(Operation::Update, "http://h/f/7", path.string()),
                              client, out);
  expect_eq(client.calls[0], "update http://h/f/7", "update url used");
  expect_true(client.sent.find("<title>Changed</title>") != std::string::npos, "entity sent");
}

void test_run_insert_missing_embedded_file_sends_nothing() {
  TempDir dir;
  auto path = dir.write("entry.xml", "<entity><body>@missing.txt</body></entity>");
  FakeFeedClient client;
  std::ostringstream out;
  expect_throws<feedctl::IoError>(
      [&] {
        feedctl::cli::run_operation(make_options(Operation::Insert, "http://h/f", path.string()),
                                    client, out);
      },
      "missing embedded file fails the insert");
  expect_eq(client.calls.size(), 0, "no request is made");
  expect_eq(out.str(), "", "no output is written");
}

void test_run_delete_reports_and_respects_quiet() {
  FakeFeedClient client;
  std::ostringstream out;
  feedctl::cli::run_operation(make_options(Operation::Delete, "http://h/f/1"), client, out);
  expect_eq(out.str(), "Deleted: http://h/f/1\n", "delete confirmation printed");
  CliOptions quiet = make_options(Operation::Delete, "http://h/f/2");
  quiet.quiet = true;
  std::ostringstream quiet_out;
  feedctl::cli::run_operation(quiet, client, quiet_out);
  expect_eq(quiet_out.str(), "", "quiet suppresses the confirmation");
  expect_eq(client.calls.size(), 2, "both deletes sent");
}

void test_run_delete_failure_propagates() {
  FakeFeedClient client;
  client.fail_delete = true;
  std::ostringstream out;
  bool threw = false;
  try {
    feedctl::cli::run_operation(make_options(Operation::Delete, "http://h/f/1"), client, out);
  } catch (const feedctl::ClientError& ex) {
    threw = true;
    expect_eq(static_cast<size_t>(ex.status()), 404, "status carried");
  }
  expect_true(threw, "client failure propagates");
  expect_eq(out.str(), "", "nothing printed for a failed delete");
}

void test_run_expand_and_print_offline() {
  TempDir dir;
  dir.write("note.txt", "a<b");
  auto path = dir.write("doc.xml", "<entity><note>@note.txt</note></entity>");
  FakeFeedClient client;
  std::ostringstream expanded;
  feedctl::cli::run_operation(make_options(Operation::Expand, "", path.string()), client, expanded);
  expect_eq(expanded.str(), "<entity><note>a&lt;b</note></entity>", "expanded document printed");

  std::ostringstream printed;
  feedctl::cli::run_operation(make_options(Operation::Print, "", path.string()), client, printed);
  std::string expected =
      "<entities>\n"
      "  <entity>\n"
      "    <note>a&lt;b</note>\n"
      "  </entity>\n"
      "</entities>\n";
  expect_eq(printed.str(), expected, "parsed document rendered as entities");
  expect_eq(client.calls.size(), 0, "offline operations make no requests");
}

void test_collect_option_warnings() {
  CliOptions options = make_options(Operation::GetFeed, "http://h/f", "unused.xml");
  auto warnings = feedctl::cli::collect_option_warnings(options);
  expect_eq(warnings.size(), 1, "one warning for the unused entry file");
  if (!warnings.empty()) {
    expect_eq(warnings[0], "--entry-file is ignored for --op getFeed", "warning text");
  }
  CliOptions offline = make_options(Operation::Expand, "http://h/f", "doc.xml");
  auto offline_warnings = feedctl::cli::collect_option_warnings(offline);
  expect_eq(offline_warnings.size(), 1, "one warning for the unused url");
}

void test_finish_output_reports_lost_buffered_output() {
  TempDir dir;
  auto path = dir.write("doc.xml", "<entity><note>kept in the buffer</note></entity>");
  FakeFeedClient client;
  UndeliverableBuffer buffer;
  std::ostream out(&buffer);
  int code =
      feedctl::cli::run_operation(make_options(Operation::Print, "", path.string()), client, out);
  expect_eq(static_cast<size_t>(code), 0, "rendering into the buffer succeeds");
  expect_true(static_cast<bool>(out), "buffered writes are accepted");
  bool threw = false;
  try {
    feedctl::cli::finish_output(out, "out.xml");
  } catch (const feedctl::IoError& ex) {
    threw = true;
    expect_true(ex.kind() == feedctl::IoError::Kind::WriteFailed, "lost output is a write failure");
    expect_eq(ex.path(), "out.xml", "error names the output target");
    expect_eq(static_cast<size_t>(feedctl::cli::exit_code_for(ex)), 1, "write failure exits 1");
  }
  expect_true(threw, "failed flush is reported");
}

void test_finish_output_accepts_delivered_output() {
  std::ostringstream out;
  out << "<entities>\n</entities>\n";
  bool ok = true;
  try {
    feedctl::cli::finish_output(out, "stdout");
  } catch (const std::exception& ex) {
    ok = false;
    record_failure(std::string("delivered output raised: ") + ex.what());
  }
  expect_true(ok, "healthy sink finishes quietly");
}

void test_exit_code_for_failures() {
  using feedctl::IoError;
  using feedctl::cli::exit_code_for;
  expect_eq(static_cast<size_t>(exit_code_for(IoError(IoError::Kind::NotFound, "a.xml", "missing"))),
            2, "missing entry file is a usage error");
  expect_eq(
      static_cast<size_t>(exit_code_for(IoError(IoError::Kind::ReadFailed, "dir", "unreadable"))),
      2, "unreadable entry file is a usage error");
  expect_eq(
      static_cast<size_t>(exit_code_for(IoError(IoError::Kind::WriteFailed, "out.xml", "full"))),
      1, "write failure is a runtime error");
  expect_eq(static_cast<size_t>(exit_code_for(feedctl::ParseError("bad xml"))), 1,
            "parse failure is a runtime error");
  expect_eq(static_cast<size_t>(exit_code_for(
                feedctl::RecursionLimitError("loop", {"a.xml", "a.xml"}))),
            1, "embedding loop is a runtime error");
  expect_eq(static_cast<size_t>(exit_code_for(feedctl::ClientError("HTTP 500", 500))), 1,
            "server failure is a runtime error");
  expect_eq(static_cast<size_t>(exit_code_for(std::invalid_argument("other"))), 1,
            "any other failure is a runtime error");
}

}  // namespace

void register_commands_tests(std::vector<TestCase>& tests) {
  tests.push_back({"run_get_feed_renders_entities", test_run_get_feed_renders_entities});
  tests.push_back({"run_get_entry_renders_entity", test_run_get_entry_renders_entity});
  tests.push_back({"run_get_entry_without_entity_fails", test_run_get_entry_without_entity_fails});
  tests.push_back({"run_insert_expands_and_parses_entry_file",
                   test_run_insert_expands_and_parses_entry_file});
  tests.push_back({"run_update_uses_entry_url", test_run_update_uses_entry_url});
  tests.push_back({"run_insert_missing_embedded_file_sends_nothing",
                   test_run_insert_missing_embedded_file_sends_nothing});
  tests.push_back({"run_delete_reports_and_respects_quiet",
                   test_run_delete_reports_and_respects_quiet});
  tests.push_back({"run_delete_failure_propagates", test_run_delete_failure_propagates});
  tests.push_back({"run_expand_and_print_offline", test_run_expand_and_print_offline});
  tests.push_back({"collect_option_warnings", test_collect_option_warnings});
  tests.push_back({"finish_output_reports_lost_buffered_output",
                   test_finish_output_reports_lost_buffered_output});
  tests.push_back({"finish_output_accepts_delivered_output",
                   test_finish_output_accepts_delivered_output});
  tests.push_back({"exit_code_for_failures", test_exit_code_for_failures});
}
