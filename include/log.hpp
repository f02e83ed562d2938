/**
 * @file log.hpp
 * @brief Logging setup for gerritnav.
 *
 * Declares the default logger initialisation, per-component category loggers
 * and category level overrides.
 */

#ifndef GERRITNAV_LOG_HPP
#define GERRITNAV_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace gnav {

/// Options describing where and how log output is written.
struct LogOptions {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string pattern;        ///< Empty keeps the spdlog default pattern
  std::string file;           ///< Optional log file; empty disables it
  std::size_t rotate_files{3}; ///< Rotated files to keep (0 = single file)
  bool compress_rotations{false}; ///< gzip rotated files
};

/**
 * Initialise the `gnav` default logger.
 *
 * The logger always writes to a colour stderr sink. When
 * LogOptions::file is set a rotating (or plain, when rotation is disabled)
 * file sink is attached as well. Calling this again updates the level and
 * pattern, and swaps the sinks of every logger when the file changed.
 *
 * @param options Sink and verbosity configuration.
 */
void init_logger(const LogOptions &options);

/**
 * Retrieve or create the logger for a component category.
 *
 * Category loggers are named `gnav.<category>`, share the default logger's
 * sinks and start at its level.
 *
 * @param category Component name, e.g. `pager`.
 * @return Shared category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply per-category level overrides.
 *
 * @param overrides Mapping of category name to level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/// Create the default logger with info level if nobody initialised it yet.
void ensure_default_logger();

} // namespace gnav

#endif // GERRITNAV_LOG_HPP
