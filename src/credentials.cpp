#include "credentials.hpp"
#include "document_loader.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "server_endpoint.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gnav {

namespace {

std::shared_ptr<spdlog::logger> credentials_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("credentials");
  }();
  return logger;
}

CredentialEntry parse_entry(const nlohmann::json &item, std::size_t index) {
  if (!item.is_object()) {
    throw std::runtime_error("Credential entry " + std::to_string(index) +
                             " must be a table");
  }
  CredentialEntry entry;
  entry.id = string_member(item, "id");
  entry.username = string_member(item, "username");
  entry.password = string_member(item, "password");
  entry.url = string_member(item, "url");
  const std::string env_name = string_member(item, "password_env");
  if (!env_name.empty()) {
    const char *value = std::getenv(env_name.c_str());
    if (value == nullptr) {
      credentials_log()->warn("Environment variable {} for credential '{}' "
                              "is not set",
                              env_name, entry.id);
    } else {
      entry.password = value;
    }
  }
  if (entry.id.empty() || entry.username.empty()) {
    throw std::runtime_error("Credential entry " + std::to_string(index) +
                             " requires 'id' and 'username'");
  }
  return entry;
}

} // namespace

bool credential_scope_matches(const std::string &scope_url,
                              const std::string &server_url) {
  if (scope_url.empty()) {
    return true;
  }
  try {
    const ServerEndpoint scope = resolve_endpoint(scope_url);
    const ServerEndpoint server = resolve_endpoint(server_url);
    if (scope.scheme() != server.scheme() || scope.host() != server.host() ||
        scope.port() != server.port()) {
      return false;
    }
    const std::string &prefix = scope.path();
    const std::string &path = server.path();
    if (prefix.empty() || path == prefix) {
      return true;
    }
    return path.size() > prefix.size() && path.compare(0, prefix.size(),
                                                       prefix) == 0 &&
           path[prefix.size()] == '/';
  } catch (const MalformedEndpoint &e) {
    credentials_log()->warn("Ignoring credential scope: {}", e.what());
    return false;
  }
}

FileCredentialStore::FileCredentialStore(std::vector<CredentialEntry> entries)
    : entries_(std::move(entries)) {}

FileCredentialStore FileCredentialStore::from_file(const std::string &path) {
  credentials_log()->debug("Loading credentials from {}", path);
  nlohmann::json doc = load_document(path);
  const nlohmann::json *list = &doc;
  if (doc.is_object()) {
    auto it = doc.find("credentials");
    if (it == doc.end()) {
      throw std::runtime_error("Credentials file " + path +
                               " has no 'credentials' entry");
    }
    list = &*it;
  }
  if (!list->is_array()) {
    throw std::runtime_error("Credentials in " + path + " must be a list");
  }
  std::vector<CredentialEntry> entries;
  entries.reserve(list->size());
  std::size_t index = 0;
  for (const auto &item : *list) {
    entries.push_back(parse_entry(item, index++));
  }
  credentials_log()->info("Loaded {} credential(s) from {}", entries.size(),
                          path);
  return FileCredentialStore(std::move(entries));
}

std::optional<UsernamePassword>
FileCredentialStore::lookup(const std::string &server_url,
                            const std::string &credentials_id) const {
  for (const auto &entry : entries_) {
    if (entry.id != credentials_id) {
      continue;
    }
    if (!credential_scope_matches(entry.url, server_url)) {
      credentials_log()->debug("Credential '{}' scoped to {} does not apply "
                               "to {}",
                               entry.id, entry.url, server_url);
      continue;
    }
    return UsernamePassword{entry.username, entry.password};
  }
  return std::nullopt;
}

} // namespace gnav
