#include "document_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace gnav {

namespace {

std::string extension_of(const std::string &path) {
  auto slash = path.find_last_of("/\\");
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos || (slash != std::string::npos && pos < slash)) {
    return {};
  }
  std::string ext = path.substr(pos + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Plain scalars are typed (bool, integer, floating point, string); quoted
 * scalars carry the non-specific tag "!" and are kept as strings.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (node.Tag() == "!")
      return s;
    if (s == "true" || s == "True" || s == "TRUE")
      return true;
    if (s == "false" || s == "False" || s == "FALSE")
      return false;
    if (s == "~" || s == "null")
      return nullptr;
    try {
      size_t idx = 0;
      long long i = std::stoll(s, &idx, 10);
      if (idx == s.size())
        return i;
    } catch (const std::exception &) {
    }
    try {
      size_t idx = 0;
      double d = std::stod(s, &idx);
      if (idx == s.size())
        return d;
    } catch (const std::exception &) {
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();

  auto stringify = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };
  if (const auto *value = node.as_date())
    return stringify(value->get());
  if (const auto *value = node.as_time())
    return stringify(value->get());
  if (const auto *value = node.as_date_time())
    return stringify(value->get());
  return nullptr;
}

} // namespace

nlohmann::json load_document(const std::string &path) {
  const std::string ext = extension_of(path);
  if (ext.empty()) {
    throw std::runtime_error("Unknown file extension for " + path);
  }
  try {
    if (ext == "yaml" || ext == "yml") {
      return yaml_to_json(YAML::LoadFile(path));
    }
    if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      return toml_to_json(tbl);
    }
    if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open " + path);
      }
      return nlohmann::json::parse(f);
    }
  } catch (const std::runtime_error &) {
    throw;
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to parse " + path + ": " + e.what());
  }
  throw std::runtime_error("Unsupported file format '." + ext + "' for " +
                           path);
}

std::string string_member(const nlohmann::json &object, const std::string &key,
                          const std::string &fallback) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return fallback;
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number() || it->is_boolean()) {
    return it->dump();
  }
  throw std::runtime_error("'" + key + "' must be a string");
}

} // namespace gnav
