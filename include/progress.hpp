/**
 * @file progress.hpp
 * @brief Progress and end-of-run summary reporting.
 */
#ifndef ADOINVENTORY_PROGRESS_HPP
#define ADOINVENTORY_PROGRESS_HPP

#include "aggregator.hpp"

#include <cstddef>
#include <string>

namespace adoi {

/// Summary line: `{succeeded} succeeded, {failed} failed, {records} record(s)`.
std::string format_summary(const RunSummary &summary);

/// Progress line: `label: processed/total (pct%)`.
std::string format_progress(std::size_t processed, std::size_t total,
                            const std::string &label);

/**
 * Reports dispatcher progress and the final run summary on the `progress`
 * log category.
 */
class ProgressReporter {
public:
  /**
   * @param quiet Suppress intermediate progress lines; the summary is still
   *        reported.
   */
  explicit ProgressReporter(bool quiet = false) : quiet_(quiet) {}

  /// Report that `processed` of `total` tasks are done.
  void report(std::size_t processed, std::size_t total,
              const std::string &label) const;

  /// Report the summary line followed by one line per failed resource.
  void summarize(const RunSummary &summary) const;

private:
  bool quiet_;
};

} // namespace adoi

#endif // ADOINVENTORY_PROGRESS_HPP
