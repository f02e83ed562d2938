#include "errors.hpp"
#include "fake_gerrit.hpp"
#include "navigator.hpp"
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gnav;
using gnav::test::FakeGerritServer;

namespace {

/// Credential store returning a fixed credential for one id and counting
/// lookups.
class CountingStore : public CredentialStore {
public:
  mutable int lookups{0};
  mutable std::string last_url;

  std::optional<UsernamePassword>
  lookup(const std::string &server_url,
         const std::string &credentials_id) const override {
    ++lookups;
    last_url = server_url;
    if (credentials_id == "bot") {
      return UsernamePassword{"bot", "secret"};
    }
    return std::nullopt;
  }
};

/// Navigator whose clients talk to @p server, recording their settings.
GerritNavigator make_navigator(FakeGerritServer &server,
                               NavigatorSettings settings,
                               std::shared_ptr<const CredentialStore> store,
                               std::size_t page_size,
                               std::vector<ConnectionSettings> *seen) {
  ScanOptions options;
  options.pager.page_size = page_size;
  GerritNavigator navigator(std::move(settings), std::move(store), options);
  navigator.set_client_factory([&server, seen](ConnectionSettings conn) {
    if (seen != nullptr) {
      seen->push_back(conn);
    }
    return std::make_shared<GerritClient>(std::move(conn), server.transport());
  });
  return navigator;
}

NavigatorSettings settings_for(const std::string &url) {
  NavigatorSettings settings;
  settings.server_url = url;
  return settings;
}

/// Observer that cancels the token after a number of submissions.
class CancellingObserver : public CollectingSourceObserver {
public:
  CancellingObserver(CancellationToken token, std::size_t cancel_after)
      : token_(std::move(token)), cancel_after_(cancel_after) {}

  bool process(const RemoteProject &project, const CandidateFactory &factory,
               const DiscoveryContext &context) override {
    bool stop = CollectingSourceObserver::process(project, factory, context);
    if (candidates().size() == cancel_after_) {
      token_.cancel();
    }
    return stop;
  }

private:
  CancellationToken token_;
  std::size_t cancel_after_;
};

} // namespace

TEST_CASE("navigator submits every project of the example server") {
  FakeGerritServer server({"a", "b", "c"});
  auto nav = make_navigator(server, settings_for("https://example.org/gerrit"),
                            nullptr, 2, nullptr);
  CollectingSourceObserver observer;
  nav.visit_sources(observer);

  REQUIRE(observer.candidates().size() == 3);
  REQUIRE(observer.candidates()[0].project_name == "a");
  REQUIRE(observer.candidates()[1].project_name == "b");
  REQUIRE(observer.candidates()[2].project_name == "c");
  REQUIRE(observer.candidates()[2].id ==
          "server-url=https://example.org/gerrit::credentials-id=null::c");
  REQUIRE(observer.candidates()[0].endpoint.web_base() ==
          "https://example.org/gerrit");
  REQUIRE(server.requests.size() == 2);
  REQUIRE(observer.sessions_opened() == 1);
  REQUIRE(observer.sessions_closed() == 1);
  REQUIRE(observer.outcome() == ScanOutcome::Completed);
}

TEST_CASE("navigator id reflects url and credentials") {
  NavigatorSettings settings = settings_for("  https://example.org/  ");
  settings.credentials_id = "   ";
  GerritNavigator anonymous(settings);
  REQUIRE(anonymous.id() ==
          "server-url=https://example.org/::credentials-id=null");
  REQUIRE_FALSE(anonymous.settings().credentials_id.has_value());

  settings.credentials_id = " bot ";
  GerritNavigator authed(settings);
  REQUIRE(authed.id() == "server-url=https://example.org/::credentials-id=bot");
}

TEST_CASE("navigator rejects unusable paging options") {
  ScanOptions no_page;
  no_page.pager.page_size = 0;
  REQUIRE_THROWS_AS(
      GerritNavigator(settings_for("https://example.org"), nullptr, no_page),
      std::invalid_argument);
  ScanOptions no_cap;
  no_cap.pager.max_pages = 0;
  REQUIRE_THROWS_AS(
      GerritNavigator(settings_for("https://example.org"), nullptr, no_cap),
      std::invalid_argument);
}

TEST_CASE("navigator stops when the observer asks") {
  FakeGerritServer server({"p0", "p1", "p2", "p3", "p4", "p5", "p6"});
  auto nav = make_navigator(server, settings_for("https://example.org"),
                            nullptr, 2, nullptr);
  CollectingSourceObserver observer(3);
  nav.visit_sources(observer);
  REQUIRE(observer.candidates().size() == 3);
  // Page two holds the third project; page three is never requested.
  REQUIRE(server.requests.size() == 2);
  REQUIRE(observer.outcome() == ScanOutcome::Stopped);
  REQUIRE(observer.sessions_closed() == 1);
}

TEST_CASE("navigator stopping on a page boundary fetches nothing more") {
  FakeGerritServer server({"p0", "p1", "p2", "p3"});
  auto nav = make_navigator(server, settings_for("https://example.org"),
                            nullptr, 2, nullptr);
  CollectingSourceObserver observer(2);
  nav.visit_sources(observer);
  REQUIRE(observer.candidates().size() == 2);
  REQUIRE(server.requests.size() == 1);
}

TEST_CASE("navigator honours cancellation between projects") {
  FakeGerritServer server({"p0", "p1", "p2", "p3", "p4"});
  auto nav = make_navigator(server, settings_for("https://example.org"),
                            nullptr, 2, nullptr);
  CancellationToken token;
  CancellingObserver observer(token, 3);
  try {
    nav.visit_sources(observer, token);
    FAIL("expected ScanCancelled");
  } catch (const ScanCancelled &e) {
    REQUIRE(e.submitted() == 3);
  }
  REQUIRE(observer.candidates().size() == 3);
  REQUIRE(server.requests.size() == 2);
  REQUIRE(observer.outcome() == ScanOutcome::Cancelled);
  REQUIRE(observer.sessions_closed() == 1);
}

TEST_CASE("navigator cancelled before the first project submits one") {
  FakeGerritServer server({"p0", "p1"});
  auto nav = make_navigator(server, settings_for("https://example.org"),
                            nullptr, 10, nullptr);
  CancellationToken token;
  token.cancel();
  CollectingSourceObserver observer;
  REQUIRE_THROWS_AS(nav.visit_sources(observer, token), ScanCancelled);
  REQUIRE(observer.candidates().size() == 1);
}

TEST_CASE("navigator reports malformed urls before any request") {
  FakeGerritServer server({"a"});
  auto nav = make_navigator(server, settings_for("ftp://example.org"), nullptr,
                            2, nullptr);
  CollectingSourceObserver observer;
  REQUIRE_THROWS_AS(nav.visit_sources(observer), ResolutionFailure);
  REQUIRE(server.requests.empty());
  REQUIRE(observer.sessions_opened() == 0);
}

TEST_CASE("navigator maps a first page failure to a connection failure") {
  FakeGerritServer server({"a", "b", "c"});
  server.fail_request = 0;
  auto nav = make_navigator(server, settings_for("https://example.org"),
                            nullptr, 2, nullptr);
  CollectingSourceObserver observer;
  REQUIRE_THROWS_AS(nav.visit_sources(observer), ConnectionFailure);
  REQUIRE(observer.candidates().empty());
  REQUIRE(observer.sessions_closed() == 1);
  REQUIRE(observer.outcome() == ScanOutcome::Failed);
}

TEST_CASE("navigator keeps earlier candidates when page 2 of 3 fails") {
  FakeGerritServer server({"p0", "p1", "p2", "p3", "p4", "p5"});
  server.fail_request = 1;
  server.fail_status = 500;
  auto nav = make_navigator(server, settings_for("https://example.org"),
                            nullptr, 2, nullptr);
  CollectingSourceObserver observer;
  try {
    nav.visit_sources(observer);
    FAIL("expected PageFetchFailure");
  } catch (const PageFetchFailure &e) {
    REQUIRE(e.page() == 1);
  }
  REQUIRE(observer.candidates().size() == 2);
  REQUIRE(observer.outcome() == ScanOutcome::Failed);
  REQUIRE(observer.sessions_closed() == 1);
}

TEST_CASE("navigator closes the session when the page cap is hit") {
  FakeGerritServer server({"p0", "p1", "p2", "p3", "p4"});
  ScanOptions options;
  options.pager.page_size = 1;
  options.pager.max_pages = 2;
  GerritNavigator nav(settings_for("https://example.org"), nullptr, options);
  nav.set_client_factory([&server](ConnectionSettings conn) {
    return std::make_shared<GerritClient>(std::move(conn), server.transport());
  });
  CollectingSourceObserver observer;
  REQUIRE_THROWS_AS(nav.visit_sources(observer), PaginationLimitExceeded);
  REQUIRE(observer.candidates().size() == 2);
  REQUIRE(observer.outcome() == ScanOutcome::Failed);
}

TEST_CASE("navigator maps client construction errors") {
  GerritNavigator nav(settings_for("https://example.org"));
  nav.set_client_factory([](ConnectionSettings) -> std::shared_ptr<GerritClient> {
    throw std::runtime_error("no transport");
  });
  CollectingSourceObserver observer;
  REQUIRE_THROWS_AS(nav.visit_sources(observer), ConnectionFailure);
  REQUIRE(observer.sessions_opened() == 0);
}

TEST_CASE("navigator resolves credentials once and uses the /a root") {
  FakeGerritServer server({"a", "b", "c"});
  auto store = std::make_shared<CountingStore>();
  NavigatorSettings settings = settings_for("https://example.org/gerrit");
  settings.credentials_id = "bot";
  settings.insecure_https = true;
  std::vector<ConnectionSettings> seen;
  auto nav = make_navigator(server, settings, store, 1, &seen);
  CollectingSourceObserver observer;
  nav.visit_sources(observer);

  REQUIRE(store->lookups == 1);
  REQUIRE(store->last_url == "https://example.org/gerrit");
  REQUIRE(seen.size() == 1);
  REQUIRE(seen[0].credentials.has_value());
  REQUIRE(seen[0].credentials->username == "bot");
  REQUIRE(seen[0].insecure_https);
  REQUIRE(server.requests.size() == 3);
  for (const auto &url : server.requests) {
    REQUIRE(url.rfind("https://example.org/gerrit/a/projects/", 0) == 0);
  }
  REQUIRE(observer.candidates()[0].credentials_id ==
          std::optional<std::string>("bot"));
  REQUIRE(observer.candidates()[0].insecure_https);
}

TEST_CASE("navigator scans anonymously when the credential is missing") {
  FakeGerritServer server({"a"});
  auto store = std::make_shared<CountingStore>();
  NavigatorSettings settings = settings_for("https://example.org");
  settings.credentials_id = "unknown";
  std::vector<ConnectionSettings> seen;
  auto nav = make_navigator(server, settings, store, 10, &seen);
  CollectingSourceObserver observer;
  nav.visit_sources(observer);
  REQUIRE(store->lookups == 1);
  REQUIRE_FALSE(seen[0].credentials.has_value());
  REQUIRE(server.requests[0].rfind("https://example.org/projects/", 0) == 0);
}

TEST_CASE("navigator passes traits through unchanged") {
  FakeGerritServer server({"a", "b"});
  NavigatorSettings settings = settings_for("https://example.org");
  settings.traits = {nlohmann::json{{"kind", "branches"}},
                     nlohmann::json("tags")};
  auto nav = make_navigator(server, settings, nullptr, 10, nullptr);
  CollectingSourceObserver observer;
  nav.visit_sources(observer);
  for (const auto &candidate : observer.candidates()) {
    REQUIRE(candidate.traits == settings.traits);
  }
}

TEST_CASE("candidates outlive the scan") {
  FakeGerritServer server({"a"});
  CandidateFactory kept;
  {
    auto nav = make_navigator(server, settings_for("https://example.org/r"),
                              nullptr, 10, nullptr);
    class KeepFactory : public SourceObserver {
    public:
      explicit KeepFactory(CandidateFactory &out) : out_(out) {}
      bool process(const RemoteProject &, const CandidateFactory &factory,
                   const DiscoveryContext &) override {
        out_ = factory;
        return false;
      }

    private:
      CandidateFactory &out_;
    } observer(kept);
    nav.visit_sources(observer);
  }
  REQUIRE(static_cast<bool>(kept));
  CandidateSource candidate = kept();
  REQUIRE(candidate.project_name == "a");
  REQUIRE(candidate.endpoint.web_base() == "https://example.org/r");
}

TEST_CASE("check_server_url validates without network access") {
  REQUIRE_FALSE(
      GerritNavigator::check_server_url("https://example.org").has_value());
  auto error = GerritNavigator::check_server_url("example.org");
  REQUIRE(error.has_value());
  REQUIRE(error->find("missing scheme") != std::string::npos);
}
