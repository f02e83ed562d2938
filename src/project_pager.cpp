#include "project_pager.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace gnav {

namespace {

std::shared_ptr<spdlog::logger> pager_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("pager");
  }();
  return logger;
}

} // namespace

bool ProjectPager::Traversal::fill() {
  while (index >= page.size()) {
    if (pages > 0 && !more) {
      pager_log()->debug("Listing complete after {} page(s), {} project(s)",
                         pages, yielded);
      return false;
    }
    if (pages >= options.max_pages) {
      pager_log()->error("Server still reports more projects after {} pages",
                         pages);
      throw PaginationLimitExceeded(options.max_pages);
    }
    ProjectPage next;
    try {
      next = client->list_projects(options.page_size, received, options.type);
    } catch (const std::exception &e) {
      pager_log()->error("Fetching project page {} failed: {}", pages,
                         e.what());
      throw PageFetchFailure(pages, "Fetching project page " +
                                        std::to_string(pages + 1) +
                                        " failed: " + e.what());
    }
    ++pages;
    received += next.projects.size();
    page = std::move(next.projects);
    index = 0;
    more = next.more;
    pager_log()->trace("Page {} holds {} project(s), more={}", pages,
                       page.size(), more);
  }
  return true;
}

ProjectPager::ProjectPager(std::shared_ptr<GerritClient> client,
                           PagerOptions options)
    : client_(std::move(client)), options_(options) {
  if (!client_) {
    throw std::invalid_argument("ProjectPager requires a client");
  }
  if (options_.page_size == 0) {
    throw std::invalid_argument("Page size must be positive");
  }
  if (options_.max_pages == 0) {
    throw std::invalid_argument("Page cap must be positive");
  }
}

ProjectPager::iterator ProjectPager::begin() {
  auto state = std::make_shared<Traversal>();
  state->client = client_;
  state->options = options_;
  last_ = state;
  if (!state->fill()) {
    return end();
  }
  state->yielded = 1;
  return iterator(std::move(state));
}

std::size_t ProjectPager::pages_fetched() const {
  return last_ ? last_->pages : 0;
}

std::size_t ProjectPager::items_yielded() const {
  return last_ ? last_->yielded : 0;
}

ProjectPager::iterator::reference ProjectPager::iterator::operator*() const {
  if (!state_ || state_->index >= state_->page.size()) {
    throw std::out_of_range("Dereferencing an exhausted project iterator");
  }
  return state_->page[state_->index];
}

ProjectPager::iterator &ProjectPager::iterator::operator++() {
  if (!state_) {
    return *this;
  }
  ++state_->index;
  bool has_next = false;
  try {
    has_next = state_->fill();
  } catch (const DiscoveryError &) {
    // A failed fetch ends the traversal; the iterator becomes end().
    state_.reset();
    throw;
  }
  if (!has_next) {
    state_.reset();
    return *this;
  }
  ++state_->yielded;
  return *this;
}

} // namespace gnav
