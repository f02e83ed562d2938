/**
 * @file document_loader.hpp
 * @brief Reads YAML, TOML or JSON files into a JSON document.
 *
 * Configuration and credential files share one loader so every format is
 * validated by the same JSON based code.
 */
#ifndef GERRITNAV_DOCUMENT_LOADER_HPP
#define GERRITNAV_DOCUMENT_LOADER_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace gnav {

/**
 * Load a structured document, choosing the parser from the file extension.
 *
 * `.yaml`/`.yml` use yaml-cpp, `.toml`/`.tml` use toml++ and `.json` uses
 * nlohmann::json. YAML and TOML trees are converted to the equivalent JSON
 * value; quoted YAML scalars always stay strings.
 *
 * @param path Filesystem path of the document.
 * @return Parsed document.
 * @throws std::runtime_error on unknown extensions, unreadable files or parse
 *         errors.
 */
nlohmann::json load_document(const std::string &path);

/**
 * Read an optional string member, accepting numbers and booleans as text.
 *
 * @param object JSON object to read from.
 * @param key Member name.
 * @param fallback Value returned when the member is missing or null.
 * @throws std::runtime_error when the member is an array or object.
 */
std::string string_member(const nlohmann::json &object, const std::string &key,
                          const std::string &fallback = "");

} // namespace gnav

#endif // GERRITNAV_DOCUMENT_LOADER_HPP
