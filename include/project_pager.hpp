/**
 * @file project_pager.hpp
 * @brief Lazy, page-by-page traversal of a Gerrit project listing.
 */
#ifndef GERRITNAV_PROJECT_PAGER_HPP
#define GERRITNAV_PROJECT_PAGER_HPP

#include "gerrit_client.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace gnav {

/// Paging parameters of a project listing traversal.
struct PagerOptions {
  std::size_t page_size{50};   ///< Projects requested per page
  std::size_t max_pages{10000}; ///< Hard cap on page fetches per traversal
  ProjectType type{ProjectType::Code};
};

/**
 * Single-pass sequence of the projects of a Gerrit server.
 *
 * Pages are fetched on demand while iterating; only the current page is held
 * in memory. Every call to begin() restarts from the first page and issues
 * fresh requests. Continuation is decided solely by the page's `more` flag,
 * so a short page does not end the sequence on its own. An empty page ends
 * it, since there is no last entry to carry the flag.
 *
 * Fetch failures are thrown from begin() or operator++ as PageFetchFailure;
 * exceeding PagerOptions::max_pages throws PaginationLimitExceeded. Either
 * error is terminal: the iterator compares equal to end() afterwards.
 *
 * @code
 * ProjectPager pager(client, {25});
 * for (const RemoteProject &project : pager) {
 *   ...
 * }
 * @endcode
 */
class ProjectPager {
  struct Traversal;

public:
  /// Input iterator over RemoteProject values.
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = RemoteProject;
    using difference_type = std::ptrdiff_t;
    using pointer = const RemoteProject *;
    using reference = const RemoteProject &;

    iterator() = default;

    reference operator*() const;
    pointer operator->() const { return &**this; }

    /// Advance, fetching the next page when the current one is exhausted.
    iterator &operator++();

    /// Post-increment; the returned iterator must not be dereferenced.
    void operator++(int) { ++*this; }

    bool operator==(const iterator &other) const {
      return state_ == other.state_;
    }
    bool operator!=(const iterator &other) const { return !(*this == other); }

  private:
    friend class ProjectPager;
    explicit iterator(std::shared_ptr<Traversal> state)
        : state_(std::move(state)) {}

    std::shared_ptr<Traversal> state_; ///< Null once exhausted
  };

  /**
   * @param client Client used for every page request.
   * @param options Page size, page cap and project type.
   * @throws std::invalid_argument if page size or page cap is zero or the
   *         client is null.
   */
  ProjectPager(std::shared_ptr<GerritClient> client, PagerOptions options = {});

  /**
   * Start a new traversal, fetching the first page.
   *
   * @throws PageFetchFailure if the first page cannot be fetched.
   */
  iterator begin();

  iterator end() const { return iterator(); }

  /// Pages fetched by the most recent traversal.
  std::size_t pages_fetched() const;

  /// Projects yielded so far by the most recent traversal.
  std::size_t items_yielded() const;

  const PagerOptions &options() const { return options_; }

private:
  struct Traversal {
    std::shared_ptr<GerritClient> client;
    PagerOptions options;
    std::vector<RemoteProject> page; ///< Current page
    std::size_t index{0};            ///< Position inside the page
    bool more{false};                ///< Server reported further pages
    std::size_t pages{0};            ///< Pages fetched so far
    std::size_t received{0};         ///< Projects received, the next skip
    std::size_t yielded{0};          ///< Projects handed out so far

    /// Fetch pages until one yields a project or the listing ends.
    /// Returns false at the end of the listing.
    bool fill();
  };

  std::shared_ptr<GerritClient> client_;
  PagerOptions options_;
  std::shared_ptr<Traversal> last_;
};

} // namespace gnav

#endif // GERRITNAV_PROJECT_PAGER_HPP
