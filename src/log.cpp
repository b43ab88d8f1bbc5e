#include "log.hpp"
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
constexpr const char *kRootLoggerName = "adoi";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::once_flag g_thread_pool_once;

void ensure_thread_pool() {
  std::call_once(g_thread_pool_once, [] {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  });
}

namespace fs = std::filesystem;

/**
 * Compute the path of the rotated log file with the given index.
 *
 * `inventory.log` rotated once becomes `inventory.1.log`.
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  fs::path rotated = base_path.stem();
  rotated += "." + std::to_string(index);
  rotated += base_path.extension();
  return base_path.has_parent_path() ? base_path.parent_path() / rotated
                                     : rotated;
}

/// Shift compressed archives up by one slot, dropping the oldest.
void shift_compressed_logs(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path from = rotated_path(base, i - 1).string() + ".gz";
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to = rotated_path(base, i).string() + ".gz";
    fs::remove(to, ec);
    fs::rename(from, to, ec);
  }
}

/**
 * Gzip a rotated log file in place of the original.
 *
 * @param path Log file to compress; removed once the archive is complete.
 * @return `true` when the archive was written.
 */
bool gzip_rotated_file(const std::string &path) {
  auto log = adoi::category_logger("logging");
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log->warn("Failed to open log file {} for compression", path);
    return false;
  }
  const std::string archive = path + ".gz";
  gzFile gz = gzopen(archive.c_str(), "wb");
  if (!gz) {
    log->warn("Failed to open compressed log {}", archive);
    return false;
  }
  char buffer[16 * 1024];
  while (input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize read = input.gcount();
    if (read <= 0) {
      continue;
    }
    int written = gzwrite(gz, buffer, static_cast<unsigned>(read));
    if (written != read) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Failed to compress log {}: {}", path, msg ? msg : "unknown");
      gzclose(gz);
      std::error_code ec;
      fs::remove(archive, ec);
      return false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    log->warn("Failed to remove {} after compression: {}", path, ec.message());
  }
  log->debug("Compressed rotated log '{}'", archive);
  return true;
}

std::shared_ptr<spdlog::logger>
make_async_logger(const std::string &name,
                  const std::vector<spdlog::sink_ptr> &sinks) {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    ensure_thread_pool();
    pool = spdlog::thread_pool();
  }
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), pool,
      spdlog::async_overflow_policy::block);
}
} // namespace

namespace adoi {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!file.empty()) {
      if (rotate_files > 0) {
        spdlog::file_event_handlers handlers;
        if (compress_rotations) {
          handlers.before_open = [rotate_files](
                                     const spdlog::filename_t &filename) {
            const auto base = spdlog::details::os::filename_to_str(filename);
            shift_compressed_logs(base, rotate_files);
            fs::path newest = rotated_path(base, 1);
            std::error_code ec;
            if (fs::exists(newest, ec)) {
              gzip_rotated_file(newest.string());
            }
          };
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file, kMaxLogFileSize, rotate_files, false, handlers));
      } else {
        sinks.push_back(
            std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
      }
    }
    logger = make_async_logger(kRootLoggerName, sinks);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  spdlog::set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={}, "
                "compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto default_logger = spdlog::default_logger();
  if (!default_logger) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    default_logger = spdlog::default_logger();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (default_logger) {
    sinks = default_logger->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto logger = make_async_logger(name, sinks);
  logger->set_level(default_logger ? default_logger->level()
                                   : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} log category override(s)",
                                      overrides.size());
  }
}

} // namespace adoi
