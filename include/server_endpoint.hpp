/**
 * @file server_endpoint.hpp
 * @brief Derivation of the web and REST base URIs of a Gerrit server.
 */
#ifndef GERRITNAV_SERVER_ENDPOINT_HPP
#define GERRITNAV_SERVER_ENDPOINT_HPP

#include <string>

namespace gnav {

/**
 * Immutable set of URIs derived from one parse of a server URL.
 *
 * Instances are only produced by resolve_endpoint(), so every ServerEndpoint
 * in the program is complete and consistent.
 */
class ServerEndpoint {
public:
  /// URL exactly as configured by the user.
  const std::string &server_url() const { return server_url_; }

  /// Base URI for browsing, e.g. `https://example.org/gerrit`.
  const std::string &web_base() const { return web_base_; }

  /// REST root for anonymous calls.
  const std::string &api_base() const { return api_base_; }

  /// REST root for authenticated calls (Gerrit's `/a` prefix).
  const std::string &authenticated_api_base() const {
    return authenticated_api_base_;
  }

  /// REST root to use depending on whether a credential is present.
  const std::string &api_base_for(bool authenticated) const {
    return authenticated ? authenticated_api_base_ : api_base_;
  }

  const std::string &scheme() const { return scheme_; }
  const std::string &host() const { return host_; }

  /// Explicit non-default port, or 0.
  int port() const { return port_; }

  /// Normalised context path without trailing separator (may be empty).
  const std::string &path() const { return path_; }

  bool operator==(const ServerEndpoint &other) const {
    return server_url_ == other.server_url_ && web_base_ == other.web_base_ &&
           api_base_ == other.api_base_ &&
           authenticated_api_base_ == other.authenticated_api_base_;
  }
  bool operator!=(const ServerEndpoint &other) const {
    return !(*this == other);
  }

private:
  friend ServerEndpoint resolve_endpoint(const std::string &server_url);
  ServerEndpoint() = default;

  std::string server_url_;
  std::string scheme_;
  std::string host_;
  int port_{0};
  std::string path_;
  std::string web_base_;
  std::string api_base_;
  std::string authenticated_api_base_;
};

/**
 * Resolve a user supplied Gerrit server URL.
 *
 * The input must be an absolute `http` or `https` URL with a host. User info,
 * query and fragment are dropped, scheme and host are lowercased, default
 * ports are omitted, duplicate and trailing `/` are removed and a trailing
 * `/a` segment (Gerrit's authenticated REST prefix) is stripped.
 *
 * @param server_url Raw server URL.
 * @return Fully derived endpoint.
 * @throws MalformedEndpoint if the URL cannot be used.
 */
ServerEndpoint resolve_endpoint(const std::string &server_url);

} // namespace gnav

#endif // GERRITNAV_SERVER_ENDPOINT_HPP
