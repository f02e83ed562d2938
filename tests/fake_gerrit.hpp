#ifndef GERRITNAV_TESTS_FAKE_GERRIT_HPP
#define GERRITNAV_TESTS_FAKE_GERRIT_HPP

#include "errors.hpp"
#include "gerrit_client.hpp"
#include "http_client.hpp"
#include "server_endpoint.hpp"

#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace gnav::test {

/// Body of a `GET /projects/` response listing @p names.
inline std::string project_page_body(const std::vector<std::string> &names,
                                     bool more) {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  for (const auto &name : names) {
    j[name] = {{"id", name}, {"state", "ACTIVE"}};
  }
  if (more && !names.empty()) {
    j[names.back()]["_more_projects"] = true;
  }
  return ")]}'\n" + j.dump();
}

/// Value of query parameter @p key in @p url, or an empty string.
inline std::string query_param(const std::string &url, const std::string &key) {
  auto q = url.find('?');
  if (q == std::string::npos) {
    return {};
  }
  std::size_t pos = q + 1;
  while (pos < url.size()) {
    auto amp = url.find('&', pos);
    std::string pair = url.substr(pos, amp == std::string::npos
                                           ? std::string::npos
                                           : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos && pair.substr(0, eq) == key) {
      return pair.substr(eq + 1);
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return {};
}

/**
 * In-memory Gerrit server answering project listings like the real one.
 *
 * Pages honour `n` and `S`; the last entry of a page carries
 * `_more_projects` while projects remain. Requests are recorded.
 */
class FakeGerritServer {
public:
  explicit FakeGerritServer(std::vector<std::string> projects)
      : projects(std::move(projects)) {}

  std::vector<std::string> projects;
  std::vector<std::string> requests;
  std::vector<std::vector<std::string>> request_headers;
  int fail_request{-1}; ///< Zero-based request index that fails
  int fail_status{0};   ///< HTTP status of the failure (0 = transport error)

  std::string handle(const std::string &url,
                     const std::vector<std::string> &headers) {
    int index = static_cast<int>(requests.size());
    requests.push_back(url);
    request_headers.push_back(headers);
    if (index == fail_request) {
      if (fail_status != 0) {
        throw HttpStatusError(fail_status,
                              "HTTP " + std::to_string(fail_status));
      }
      throw TransientNetworkError("connection reset");
    }
    std::size_t limit = std::stoul(query_param(url, "n"));
    std::size_t skip = std::stoul(query_param(url, "S"));
    std::vector<std::string> page;
    for (std::size_t i = skip; i < projects.size() && page.size() < limit;
         ++i) {
      page.push_back(projects[i]);
    }
    return project_page_body(page, skip + page.size() < projects.size());
  }

  /// Transport forwarding to this server; the server must outlive it.
  std::unique_ptr<HttpClient> transport() {
    class Forwarder : public HttpClient {
    public:
      explicit Forwarder(FakeGerritServer &server) : server_(server) {}
      std::string get(const std::string &url,
                      const std::vector<std::string> &headers) override {
        return server_.handle(url, headers);
      }

    private:
      FakeGerritServer &server_;
    };
    return std::make_unique<Forwarder>(*this);
  }
};

/// HTTP client replaying canned bodies in order, recording request URLs.
class ScriptedHttpClient : public HttpClient {
public:
  explicit ScriptedHttpClient(std::vector<std::string> bodies)
      : bodies_(std::move(bodies)) {}

  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override {
    (void)headers;
    urls->push_back(url);
    if (next_ >= bodies_.size()) {
      throw TransientNetworkError("no scripted response for " + url);
    }
    return bodies_[next_++];
  }

  std::shared_ptr<std::vector<std::string>> urls =
      std::make_shared<std::vector<std::string>>();

private:
  std::vector<std::string> bodies_;
  std::size_t next_{0};
};

/// Client for @p server_url talking to @p server.
inline std::shared_ptr<GerritClient>
fake_client(FakeGerritServer &server,
            const std::string &server_url = "https://review.example.org") {
  ConnectionSettings settings(resolve_endpoint(server_url));
  return std::make_shared<GerritClient>(std::move(settings),
                                        server.transport());
}

} // namespace gnav::test

#endif // GERRITNAV_TESTS_FAKE_GERRIT_HPP
