#include "util/duration.hpp"

#include <cctype>
#include <stdexcept>

namespace gnav {

std::chrono::milliseconds parse_timeout(const std::string &str) {
  using std::chrono::milliseconds;
  if (str.empty()) {
    return milliseconds{0};
  }

  long long total = 0;
  std::size_t i = 0;
  bool has_unit = false;
  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::invalid_argument("Invalid duration '" + str + "'");
    }
    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      ++i;
    }
    if (i == str.size()) {
      if (has_unit) {
        throw std::invalid_argument("Missing unit in duration '" + str + "'");
      }
      total += value * 1000;
      break;
    }

    char unit = static_cast<char>(
        std::tolower(static_cast<unsigned char>(str[i])));
    ++i;
    if (unit == 'm' && i < str.size() &&
        std::tolower(static_cast<unsigned char>(str[i])) == 's') {
      ++i;
      total += value;
    } else if (unit == 's') {
      total += value * 1000;
    } else if (unit == 'm') {
      total += value * 60 * 1000;
    } else if (unit == 'h') {
      total += value * 3600 * 1000;
    } else {
      throw std::invalid_argument("Invalid duration unit in '" + str + "'");
    }
    has_unit = true;
  }
  return milliseconds{total};
}

} // namespace gnav
