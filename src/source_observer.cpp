#include "source_observer.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <utility>

#include <spdlog/spdlog.h>

namespace gnav {

namespace {

std::shared_ptr<spdlog::logger> observer_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("observer");
  }();
  return logger;
}

std::string to_lower_copy(const std::string &value) {
  std::string out = value;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

/**
 * Convert a shell-style glob into an anchored regular expression.
 *
 * `*` matches any run of characters, `/` included, so `platform/*` covers
 * nested projects too.
 */
std::regex glob_to_regex(const std::string &glob) {
  std::string rx = "^";
  for (char c : glob) {
    switch (c) {
    case '*':
      rx += ".*";
      break;
    case '?':
      rx += '.';
      break;
    case '.':
    case '+':
    case '(':
    case ')':
    case '{':
    case '}':
    case '^':
    case '$':
    case '|':
    case '\\':
    case '[':
    case ']':
      rx += '\\';
      rx += c;
      break;
    default:
      rx += c;
    }
  }
  rx += '$';
  return std::regex(rx);
}

bool matches_one(const std::string &name, const std::string &pattern) {
  auto colon = pattern.find(':');
  if (colon != std::string::npos) {
    const std::string tag = to_lower_copy(pattern.substr(0, colon));
    const std::string value = pattern.substr(colon + 1);
    if (tag == "prefix") {
      return name.rfind(value, 0) == 0;
    }
    if (tag == "suffix") {
      return name.size() >= value.size() &&
             name.compare(name.size() - value.size(), value.size(), value) ==
                 0;
    }
    if (tag == "contains") {
      return name.find(value) != std::string::npos;
    }
    if (tag == "literal") {
      return name == value;
    }
    if (tag == "glob") {
      return std::regex_match(name, glob_to_regex(value));
    }
    if (tag == "regex") {
      try {
        return std::regex_match(name, std::regex(value));
      } catch (const std::regex_error &e) {
        observer_log()->warn("Invalid regex pattern '{}': {}", value,
                             e.what());
        return false;
      }
    }
    // Unknown tag: the whole pattern is matched as written.
  }
  if (pattern.find_first_of("*?") != std::string::npos) {
    return std::regex_match(name, glob_to_regex(pattern));
  }
  return name == pattern;
}

} // namespace

std::string to_string(ScanOutcome outcome) {
  switch (outcome) {
  case ScanOutcome::Completed:
    return "completed";
  case ScanOutcome::Stopped:
    return "stopped";
  case ScanOutcome::Cancelled:
    return "cancelled";
  case ScanOutcome::Failed:
    return "failed";
  }
  return "failed";
}

bool matches_pattern(const std::string &name,
                     const std::vector<std::string> &patterns) {
  return std::any_of(
      patterns.begin(), patterns.end(),
      [&name](const std::string &pattern) { return matches_one(name, pattern); });
}

PatternSourceObserver::PatternSourceObserver(std::vector<std::string> include,
                                             std::vector<std::string> exclude,
                                             std::size_t limit, Sink sink)
    : include_(std::move(include)), exclude_(std::move(exclude)),
      limit_(limit), sink_(std::move(sink)) {}

bool PatternSourceObserver::process(const RemoteProject &project,
                                    const CandidateFactory &factory,
                                    const DiscoveryContext &context) {
  (void)context;
  const bool included =
      include_.empty() || matches_pattern(project.name, include_);
  if (!included || matches_pattern(project.name, exclude_)) {
    ++rejected_;
    observer_log()->debug("Skipping project {}", project.name);
    return false;
  }
  CandidateSource candidate = factory();
  ++accepted_;
  if (sink_) {
    sink_(std::move(candidate));
  }
  return limit_ > 0 && accepted_ >= limit_;
}

void PatternSourceObserver::on_session_close(const DiscoveryContext &context,
                                             ScanOutcome outcome) {
  observer_log()->info("{}: {} accepted, {} skipped ({})",
                       context.endpoint.web_base(), accepted_, rejected_,
                       to_string(outcome));
}

bool CollectingSourceObserver::process(const RemoteProject &project,
                                       const CandidateFactory &factory,
                                       const DiscoveryContext &context) {
  (void)project;
  (void)context;
  candidates_.push_back(factory());
  return stop_after_ > 0 && candidates_.size() >= stop_after_;
}

void CollectingSourceObserver::on_session_open(
    const DiscoveryContext &context) {
  (void)context;
  ++opened_;
}

void CollectingSourceObserver::on_session_close(
    const DiscoveryContext &context, ScanOutcome outcome) {
  (void)context;
  ++closed_;
  outcome_ = outcome;
}

} // namespace gnav
