#include "credentials.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

using namespace gnav;

TEST_CASE("credential scopes") {
  CHECK(credential_scope_matches("", "https://review.example.org"));
  CHECK(credential_scope_matches("https://review.example.org",
                                 "https://review.example.org/gerrit"));
  CHECK(credential_scope_matches("https://review.example.org/gerrit",
                                 "https://review.example.org/gerrit/"));
  CHECK(credential_scope_matches("https://review.example.org/gerrit",
                                 "https://review.example.org/gerrit/sub"));
  CHECK_FALSE(credential_scope_matches("https://review.example.org/gerrit",
                                       "https://review.example.org/gerrit2"));
  CHECK_FALSE(credential_scope_matches("https://review.example.org",
                                       "http://review.example.org"));
  CHECK_FALSE(credential_scope_matches("https://review.example.org",
                                       "https://review.example.org:8443"));
  CHECK_FALSE(credential_scope_matches("https://other.example.org",
                                       "https://review.example.org"));
  CHECK_FALSE(credential_scope_matches("not a url",
                                       "https://review.example.org"));
}

TEST_CASE("file store looks credentials up by id and scope") {
  FileCredentialStore store({{"bot", "robot", "s3cret", ""},
                             {"scoped", "alice", "pw1",
                              "https://one.example.org"},
                             {"scoped", "bob", "pw2",
                              "https://two.example.org"}});
  auto bot = store.lookup("https://any.example.org", "bot");
  REQUIRE(bot.has_value());
  REQUIRE(bot->username == "robot");
  REQUIRE(bot->password == "s3cret");

  auto two = store.lookup("https://two.example.org/gerrit", "scoped");
  REQUIRE(two.has_value());
  REQUIRE(two->username == "bob");

  REQUIRE_FALSE(
      store.lookup("https://three.example.org", "scoped").has_value());
  REQUIRE_FALSE(
      store.lookup("https://one.example.org", "missing").has_value());
}

TEST_CASE("file store loads YAML") {
  const char *path = "test_credentials.yaml";
  {
    std::ofstream f(path);
    f << "credentials:\n"
         "  - id: review-bot\n"
         "    username: bot\n"
         "    password: \"0123\"\n"
         "    url: https://review.example.org\n";
  }
  auto store = FileCredentialStore::from_file(path);
  REQUIRE(store.entries().size() == 1);
  REQUIRE(store.entries()[0].password == "0123");
  auto cred = store.lookup("https://review.example.org/r", "review-bot");
  REQUIRE(cred.has_value());
  REQUIRE(cred->username == "bot");
  std::remove(path);
}

TEST_CASE("file store loads TOML and JSON") {
  const char *toml_path = "test_credentials.toml";
  {
    std::ofstream f(toml_path);
    f << "[[credentials]]\n"
         "id = \"bot\"\n"
         "username = \"robot\"\n"
         "password = \"pw\"\n";
  }
  auto toml_store = FileCredentialStore::from_file(toml_path);
  REQUIRE(toml_store.entries().size() == 1);
  REQUIRE(toml_store.entries()[0].username == "robot");
  std::remove(toml_path);

  const char *json_path = "test_credentials.json";
  {
    std::ofstream f(json_path);
    f << R"([{"id": "bot", "username": "robot", "password": "pw"},
             {"id": "ci", "username": "jenkins", "password": "x"}])";
  }
  auto json_store = FileCredentialStore::from_file(json_path);
  REQUIRE(json_store.entries().size() == 2);
  REQUIRE(json_store.entries()[1].id == "ci");
  std::remove(json_path);
}

TEST_CASE("file store reads passwords from the environment") {
#ifdef _WIN32
  _putenv_s("GERRITNAV_TEST_SECRET", "from-env");
#else
  setenv("GERRITNAV_TEST_SECRET", "from-env", 1);
#endif
  const char *path = "test_credentials_env.json";
  {
    std::ofstream f(path);
    f << R"({"credentials": [{"id": "bot", "username": "robot",
             "password_env": "GERRITNAV_TEST_SECRET"}]})";
  }
  auto store = FileCredentialStore::from_file(path);
  REQUIRE(store.lookup("https://example.org", "bot")->password == "from-env");
  std::remove(path);
}

TEST_CASE("file store rejects incomplete entries") {
  const char *path = "test_credentials_bad.json";
  {
    std::ofstream f(path);
    f << R"({"credentials": [{"id": "bot", "password": "pw"}]})";
  }
  REQUIRE_THROWS_AS(FileCredentialStore::from_file(path), std::runtime_error);
  {
    std::ofstream f(path);
    f << R"({"users": []})";
  }
  REQUIRE_THROWS_AS(FileCredentialStore::from_file(path), std::runtime_error);
  std::remove(path);
  REQUIRE_THROWS_AS(FileCredentialStore::from_file("missing.json"),
                    std::runtime_error);
}
