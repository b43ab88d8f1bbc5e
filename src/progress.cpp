#include "progress.hpp"
#include "log.hpp"

#include <sstream>

namespace adoi {

namespace {

std::shared_ptr<spdlog::logger> progress_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("progress");
  }();
  return logger;
}

} // namespace

std::string format_summary(const RunSummary &summary) {
  std::ostringstream oss;
  oss << summary.succeeded << " succeeded, " << summary.failed << " failed, "
      << summary.total_records << " record(s)";
  return oss.str();
}

std::string format_progress(std::size_t processed, std::size_t total,
                            const std::string &label) {
  std::size_t pct = total == 0 ? 100 : processed * 100 / total;
  std::ostringstream oss;
  oss << label << ": " << processed << '/' << total << " (" << pct << "%)";
  return oss.str();
}

void ProgressReporter::report(std::size_t processed, std::size_t total,
                              const std::string &label) const {
  if (quiet_) {
    return;
  }
  progress_log()->info(format_progress(processed, total, label));
}

void ProgressReporter::summarize(const RunSummary &summary) const {
  progress_log()->info(format_summary(summary));
  if (summary.timed_out > 0) {
    progress_log()->warn("{} task(s) timed out", summary.timed_out);
  }
  if (summary.skipped_projects > 0) {
    progress_log()->warn("{} project(s) skipped during enumeration",
                         summary.skipped_projects);
  }
  for (const auto &f : summary.failures) {
    std::string name = f.resource.parent_name.empty() ||
                               f.resource.parent_name == f.resource.name
                           ? f.resource.name
                           : f.resource.parent_name + "/" + f.resource.name;
    progress_log()->warn("  {} [{}]: {}", name, failure_kind_name(f.failure),
                         f.error);
  }
}

} // namespace adoi
