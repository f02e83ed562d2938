#include "log.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

constexpr const char *kDefaultLoggerName = "gnav";
constexpr std::size_t kRotateBytes = 1024 * 1024 * 5;

std::mutex g_logger_mutex;
std::string g_log_file;

namespace fs = std::filesystem;

// Caller holds g_logger_mutex. The pool is recreated after spdlog::shutdown().
std::shared_ptr<spdlog::details::thread_pool> ensure_thread_pool_locked() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
    pool = spdlog::thread_pool();
  }
  return pool;
}

/**
 * Path of the rotated log file with the given index.
 *
 * Index 0 is the live file, `gerritnav.log` becomes `gerritnav.1.log`,
 * `gerritnav.2.log` and so on.
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  std::string stem = base_path.stem().string();
  std::string ext = base_path.extension().string();
  if (stem.empty()) {
    stem = base_path.filename().string();
    ext.clear();
  }
  return base_path.parent_path() /
         (stem + "." + std::to_string(index) + ext);
}

/// Shift `<base>.N.log.gz` archives up by one, dropping the oldest.
void shift_compressed_logs(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path from(rotated_path(base, i - 1).string() + ".gz");
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to(rotated_path(base, i).string() + ".gz");
    fs::remove(to, ec);
    fs::rename(from, to, ec);
  }
}

/**
 * gzip a rotated log file next to itself and remove the original.
 *
 * Runs inside the sink's file event handler, so problems are reported on
 * stderr instead of through the logger that is being rotated.
 */
bool gzip_file(const std::string &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return false;
  }
  const std::string gz_path = path + ".gz";
  gzFile gz = gzopen(gz_path.c_str(), "wb");
  if (gz == nullptr) {
    std::fprintf(stderr, "gerritnav: cannot open %s for compression\n",
                 gz_path.c_str());
    return false;
  }
  char buffer[16 * 1024];
  while (input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize got = input.gcount();
    if (got <= 0) {
      continue;
    }
    int written = gzwrite(gz, buffer, static_cast<unsigned>(got));
    if (written != got) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      std::fprintf(stderr, "gerritnav: compressing %s failed: %s\n",
                   path.c_str(), msg != nullptr ? msg : "unknown");
      gzclose(gz);
      std::error_code ec;
      fs::remove(gz_path, ec);
      return false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  fs::remove(path, ec);
  return !ec;
}

std::vector<spdlog::sink_ptr> make_sinks(const gnav::LogOptions &options) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (options.file.empty()) {
    return sinks;
  }
  if (options.rotate_files == 0) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.file, false));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (options.compress_rotations) {
    const std::size_t keep = options.rotate_files;
    handlers.before_open = [keep](const spdlog::filename_t &filename) {
      const auto base = spdlog::details::os::filename_to_str(filename);
      shift_compressed_logs(base, keep);
      std::error_code ec;
      fs::path newest = rotated_path(base, 1);
      if (fs::exists(newest, ec)) {
        gzip_file(newest.string());
      }
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      options.file, kRotateBytes, options.rotate_files, false, handlers));
  return sinks;
}

} // namespace

namespace gnav {

void init_logger(const LogOptions &options) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto pool = ensure_thread_pool_locked();
  auto logger = spdlog::get(kDefaultLoggerName);
  if (!logger) {
    auto sinks = make_sinks(options);
    logger = std::make_shared<spdlog::async_logger>(
        kDefaultLoggerName, sinks.begin(), sinks.end(), pool,
        spdlog::async_overflow_policy::block);
    spdlog::register_logger(logger);
    g_log_file = options.file;
  } else if (options.file != g_log_file) {
    // Re-target every registered logger, category loggers included.
    logger->flush();
    auto sinks = make_sinks(options);
    spdlog::apply_all([&sinks](std::shared_ptr<spdlog::logger> l) {
      l->sinks() = sinks;
    });
    g_log_file = options.file;
  }
  spdlog::set_default_logger(logger);
  lock.unlock();

  spdlog::apply_all([&options](std::shared_ptr<spdlog::logger> l) {
    l->set_level(options.level);
  });
  if (!options.pattern.empty()) {
    spdlog::set_pattern(options.pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={}, "
                "compress={})",
                spdlog::level::to_string_view(options.level), options.file,
                options.rotate_files, options.compress_rotations);
}

void ensure_default_logger() {
  {
    std::scoped_lock lock(g_logger_mutex);
    auto current = spdlog::default_logger();
    if (current && current->name() == kDefaultLoggerName &&
        spdlog::thread_pool()) {
      return;
    }
  }
  init_logger(LogOptions{});
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_default_logger();
  std::scoped_lock lock(g_logger_mutex);
  const std::string name = std::string(kDefaultLoggerName) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto parent = spdlog::get(kDefaultLoggerName);
  auto pool = ensure_thread_pool_locked();
  std::vector<spdlog::sink_ptr> sinks;
  if (parent) {
    sinks = parent->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), pool,
      spdlog::async_overflow_policy::block);
  logger->set_level(parent ? parent->level() : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
}

} // namespace gnav
