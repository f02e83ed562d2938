/**
 * @file credentials.hpp
 * @brief Credential lookup for Gerrit servers.
 *
 * Declares the CredentialStore interface used by the navigator and a store
 * backed by a JSON, YAML or TOML file.
 */
#ifndef GERRITNAV_CREDENTIALS_HPP
#define GERRITNAV_CREDENTIALS_HPP

#include <optional>
#include <string>
#include <vector>

namespace gnav {

/// Username/secret pair resolved for one scan.
struct UsernamePassword {
  std::string username;
  std::string password;
};

/** Source of credentials, keyed by credential identifier. */
class CredentialStore {
public:
  virtual ~CredentialStore() = default;

  /**
   * Look up a credential usable against a server.
   *
   * Implementations must be free of side effects; the navigator calls this
   * once per scan before any network traffic.
   *
   * @param server_url Server the credential will be sent to.
   * @param credentials_id Identifier selected by the user.
   * @return Matching credential or `std::nullopt`.
   */
  virtual std::optional<UsernamePassword>
  lookup(const std::string &server_url,
         const std::string &credentials_id) const = 0;
};

/// One entry of a credentials file.
struct CredentialEntry {
  std::string id;
  std::string username;
  std::string password;
  std::string url; ///< Optional scope; empty matches every server
};

/**
 * Credential store holding entries loaded from a file.
 *
 * An entry matches a lookup when its id is equal to the requested id and,
 * if the entry has a `url` scope, the server has the same scheme and host
 * (and port) and its path starts with the scope's path.
 */
class FileCredentialStore : public CredentialStore {
public:
  explicit FileCredentialStore(std::vector<CredentialEntry> entries = {});

  /**
   * Load entries from a credentials file.
   *
   * Supported formats are JSON, YAML and TOML, chosen by file extension. The
   * document holds a `credentials` array (or is itself an array) of tables
   * with `id`, `username`, `password` and an optional `url`. A `password_env`
   * key may name an environment variable holding the secret instead.
   *
   * @param path Filesystem path of the credentials file.
   * @throws std::runtime_error on unreadable files, unknown formats or
   *         entries missing `id` or `username`.
   */
  static FileCredentialStore from_file(const std::string &path);

  std::optional<UsernamePassword>
  lookup(const std::string &server_url,
         const std::string &credentials_id) const override;

  const std::vector<CredentialEntry> &entries() const { return entries_; }

private:
  std::vector<CredentialEntry> entries_;
};

/**
 * Check whether a credential scope applies to a server URL.
 *
 * @param scope_url Scope configured on the credential; empty matches all.
 * @param server_url Server the credential would be sent to.
 */
bool credential_scope_matches(const std::string &scope_url,
                              const std::string &server_url);

} // namespace gnav

#endif // GERRITNAV_CREDENTIALS_HPP
