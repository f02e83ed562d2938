#include "app.hpp"
#include "fake_gerrit.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

using namespace gnav;
using gnav::test::FakeGerritServer;

namespace {

/// Route clients to the fake server registered for their web base.
ClientFactory
fake_factory(std::map<std::string, std::shared_ptr<FakeGerritServer>> servers) {
  return [servers](ConnectionSettings settings) {
    auto server = servers.at(settings.endpoint.web_base());
    return std::make_shared<GerritClient>(std::move(settings),
                                          server->transport());
  };
}

std::vector<std::string> lines_of(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

} // namespace

TEST_CASE("app prints accepted projects as text") {
  auto server = std::make_shared<FakeGerritServer>(
      std::vector<std::string>{"a", "b", "c"});
  std::ostringstream out;
  App app(out);
  app.set_client_factory(
      fake_factory({{"https://review.example.org", server}}));

  char prog[] = "gerritnav";
  char server_flag[] = "--server-url";
  char url[] = "https://review.example.org/";
  char page_flag[] = "--page-size";
  char page[] = "2";
  char *argv[] = {prog, server_flag, url, page_flag, page};
  REQUIRE(app.run(5, argv) == 0);
  REQUIRE_FALSE(app.should_exit());

  auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 3);
  REQUIRE(lines[0] ==
          "server-url=https://review.example.org/::credentials-id=null::a\ta"
          "\thttps://review.example.org");
  REQUIRE(server->requests.size() == 2);
}

TEST_CASE("app prints JSON lines and applies filters") {
  auto server = std::make_shared<FakeGerritServer>(std::vector<std::string>{
      "platform/build", "platform/old-archive", "tools/repo"});
  std::ostringstream out;
  App app(out);
  app.set_client_factory(
      fake_factory({{"https://example.org/gerrit", server}}));

  char prog[] = "gerritnav";
  char server_flag[] = "-s";
  char url[] = "https://example.org/gerrit";
  char format_flag[] = "--format";
  char json[] = "json";
  char include_flag[] = "--include";
  char include[] = "platform/*";
  char exclude_flag[] = "--exclude";
  char exclude[] = "suffix:-archive";
  char *argv[] = {prog,         server_flag, url,          format_flag,
                  json,         include_flag, include,     exclude_flag,
                  exclude};
  REQUIRE(app.run(9, argv) == 0);

  auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 1);
  auto j = nlohmann::json::parse(lines[0]);
  REQUIRE(j["project"] == "platform/build");
  REQUIRE(j["server_url"] == "https://example.org/gerrit");
  REQUIRE(j["web_base"] == "https://example.org/gerrit");
  REQUIRE(j["api_base"] == "https://example.org/gerrit");
  REQUIRE(j["insecure_https"] == false);
  REQUIRE(j["credentials_id"].is_null());
  REQUIRE(j["traits"].empty());
}

TEST_CASE("app limit stops the scan early") {
  auto server = std::make_shared<FakeGerritServer>(
      std::vector<std::string>{"p0", "p1", "p2", "p3", "p4", "p5"});
  std::ostringstream out;
  App app(out);
  app.set_client_factory(fake_factory({{"https://example.org", server}}));

  char prog[] = "gerritnav";
  char server_flag[] = "-s";
  char url[] = "https://example.org";
  char page_flag[] = "--page-size";
  char page[] = "2";
  char limit_flag[] = "--limit";
  char limit[] = "3";
  char *argv[] = {prog, server_flag, url, page_flag, page, limit_flag, limit};
  REQUIRE(app.run(7, argv) == 0);
  REQUIRE(lines_of(out.str()).size() == 3);
  REQUIRE(server->requests.size() == 2);
}

TEST_CASE("app reports a failing server but scans the others") {
  auto broken = std::make_shared<FakeGerritServer>(
      std::vector<std::string>{"x"});
  broken->fail_request = 0;
  broken->fail_status = 503;
  auto healthy = std::make_shared<FakeGerritServer>(
      std::vector<std::string>{"y"});
  std::ostringstream out;
  App app(out);
  app.set_client_factory(fake_factory({{"https://broken.example.org", broken},
                                       {"https://ok.example.org", healthy}}));

  char prog[] = "gerritnav";
  char server_flag[] = "-s";
  char bad[] = "https://broken.example.org";
  char good[] = "https://ok.example.org";
  char *argv[] = {prog, server_flag, bad, server_flag, good};
  REQUIRE(app.run(5, argv) == 1);
  auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 1);
  REQUIRE(lines[0].find("\ty\t") != std::string::npos);
}

TEST_CASE("app scans servers in parallel") {
  auto first = std::make_shared<FakeGerritServer>(
      std::vector<std::string>{"a1", "a2"});
  auto second = std::make_shared<FakeGerritServer>(
      std::vector<std::string>{"b1", "b2", "b3"});
  std::ostringstream out;
  App app(out);
  app.set_client_factory(fake_factory({{"https://one.example.org", first},
                                       {"https://two.example.org", second}}));

  char prog[] = "gerritnav";
  char server_flag[] = "-s";
  char one[] = "https://one.example.org";
  char two[] = "https://two.example.org";
  char parallel[] = "--parallel";
  char *argv[] = {prog, server_flag, one, server_flag, two, parallel};
  REQUIRE(app.run(6, argv) == 0);
  REQUIRE(lines_of(out.str()).size() == 5);
}

TEST_CASE("app cancellation yields the cancelled exit code") {
  auto server = std::make_shared<FakeGerritServer>(
      std::vector<std::string>{"a", "b", "c"});
  std::ostringstream out;
  App app(out);
  app.set_client_factory(fake_factory({{"https://example.org", server}}));
  app.cancellation().cancel();

  char prog[] = "gerritnav";
  char server_flag[] = "-s";
  char url[] = "https://example.org";
  char *argv[] = {prog, server_flag, url};
  REQUIRE(app.run(3, argv) == kExitCancelled);
  REQUIRE(lines_of(out.str()).size() == 1);
}

TEST_CASE("app check-url prints derived URIs") {
  std::ostringstream out;
  App app(out);
  char prog[] = "gerritnav";
  char check[] = "--check-url";
  char server_flag[] = "-s";
  char url[] = "https://Example.org/gerrit/a/";
  char *argv[] = {prog, check, server_flag, url};
  REQUIRE(app.run(4, argv) == 0);
  REQUIRE(app.should_exit());
  REQUIRE(out.str() == "https://Example.org/gerrit/a/\thttps://example.org/gerrit"
                       "\thttps://example.org/gerrit"
                       "\thttps://example.org/gerrit/a\n");

  std::ostringstream bad_out;
  App bad(bad_out);
  char invalid[] = "ftp://example.org";
  char *argv_bad[] = {prog, check, server_flag, invalid};
  REQUIRE(bad.run(4, argv_bad) == 1);
  REQUIRE(bad_out.str().empty());
}

TEST_CASE("app fails without servers or with a malformed one") {
  std::ostringstream out;
  App app(out);
  char prog[] = "gerritnav";
  char *argv[] = {prog};
  REQUIRE(app.run(1, argv) == 1);

  App malformed(out);
  char server_flag[] = "-s";
  char url[] = "not a url";
  char *argv_bad[] = {prog, server_flag, url};
  REQUIRE(malformed.run(3, argv_bad) == 1);
  REQUIRE(out.str().empty());
}

TEST_CASE("app loads servers from a config file") {
  const char *path = "test_app_config.json";
  {
    std::ofstream f(path);
    f << R"({"servers": [{"server_url": "https://example.org",
                          "traits": [{"kind": "branches"}]}],
             "discovery": {"page_size": 1}})";
  }
  auto server = std::make_shared<FakeGerritServer>(
      std::vector<std::string>{"a", "b"});
  std::ostringstream out;
  App app(out);
  app.set_client_factory(fake_factory({{"https://example.org", server}}));
  char prog[] = "gerritnav";
  char config_flag[] = "--config";
  char config[] = "test_app_config.json";
  char format_flag[] = "--format";
  char json[] = "json";
  char *argv[] = {prog, config_flag, config, format_flag, json};
  int rc = app.run(5, argv);
  std::remove(path);
  REQUIRE(rc == 0);
  REQUIRE(app.config().page_size() == 1);
  auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 2);
  REQUIRE(nlohmann::json::parse(lines[1])["traits"][0]["kind"] == "branches");
  REQUIRE(server->requests.size() == 2);

  std::ostringstream missing_out;
  App missing(missing_out);
  char absent[] = "does_not_exist.yaml";
  char *argv_missing[] = {prog, config_flag, absent};
  REQUIRE(missing.run(3, argv_missing) == 1);
  REQUIRE(missing.should_exit());
}
