/**
 * @file aggregator.hpp
 * @brief Fan-in of dispatcher results into one record collection and a run
 * summary.
 */
#ifndef ADOINVENTORY_AGGREGATOR_HPP
#define ADOINVENTORY_AGGREGATOR_HPP

#include "dispatcher.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace adoi {

/// Failed child resource with the reason it failed.
struct FailedResource {
  ChildResource resource;
  std::string error;
  FailureKind failure{FailureKind::None};
};

/// Counters describing a completed run.
struct RunSummary {
  std::size_t total_child_resources{0};
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::size_t total_records{0};
  std::size_t timed_out{0};
  std::size_t permission_denied{0};
  std::size_t skipped_projects{0}; ///< Projects whose children could not be listed
  std::vector<FailedResource> failures;
};

/// Records of every successful task plus the summary of the run.
template <typename Record> struct Aggregate {
  std::vector<Record> records;
  RunSummary summary;
};

/**
 * Merge task results.
 *
 * Records of successful results are concatenated; failed results only count
 * towards the summary.
 */
template <typename Record>
Aggregate<Record> aggregate(std::vector<TaskResult<Record>> results) {
  Aggregate<Record> out;
  out.summary.total_child_resources = results.size();
  for (auto &result : results) {
    if (result.succeeded()) {
      ++out.summary.succeeded;
      for (auto &record : result.records) {
        out.records.push_back(std::move(record));
      }
      continue;
    }
    ++out.summary.failed;
    if (result.failure == FailureKind::TimedOut) {
      ++out.summary.timed_out;
    } else if (result.failure == FailureKind::PermissionDenied) {
      ++out.summary.permission_denied;
    }
    out.summary.failures.push_back(
        {result.resource, *result.error, result.failure});
  }
  out.summary.total_records = out.records.size();
  return out;
}

} // namespace adoi

#endif // ADOINVENTORY_AGGREGATOR_HPP
