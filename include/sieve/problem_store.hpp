#pragma once

// sieve/problem_store.hpp - Problem records loaded from JSON files.
//
// FILE FORMAT (one problem per file):
//   {"spec": str, "problem": str, "perturbations": [str, ...], "id"?: str}
//   "problem" is the reference implementation. "id" defaults to the file stem.
//
// LOADING:
//   A directory location contributes every *.json file in sorted filename
//   order; a file location contributes itself. Invalid records are skipped
//   and reported through skipped(); a location that yields no valid record
//   at all is a DatasetError. Source syntax is not checked here; it surfaces
//   as errored outcomes at execution time.
//
// THREAD SAFETY: immutable after load(). Shared read-only between
// controllers as std::shared_ptr<const ProblemStore>.

#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "sieve/types.hpp"

namespace sieve {

struct ProblemStoreOptions {
  std::size_t expected_perturbations{0};  // 0 = any non-zero count
};

struct SkippedRecord {
  std::string source_path;
  std::string reason;
};

class ProblemStore {
 public:
  // Throws DatasetError when the location is missing or unreadable, holds no
  // candidate files, or yields zero valid records.
  static ProblemStore load(const std::string& location, const ProblemStoreOptions& options = {});

  // Builds a store from already-parsed records. Records must carry at least
  // one perturbation; duplicates by id are skipped like in load().
  static ProblemStore from_records(std::vector<ProblemRecord> records);

  // Uniform choice driven by the caller's generator. Throws EmptyDatasetError
  // when nothing is loaded.
  const ProblemRecord& sample(std::mt19937_64& rng) const;

  // Throws InvalidInputError when index is out of range.
  const ProblemRecord& at(std::size_t index) const;
  const ProblemRecord* find(const std::string& id) const;

  std::size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }
  const std::vector<ProblemRecord>& records() const { return records_; }
  const std::vector<SkippedRecord>& skipped() const { return skipped_; }
  const std::string& location() const { return location_; }

 private:
  bool add(ProblemRecord record);

  std::string location_;
  std::vector<ProblemRecord> records_;
  std::vector<SkippedRecord> skipped_;
};

// Parses one problem file body. On failure returns nullopt and sets *reason.
std::optional<ProblemRecord> parse_problem_record(const std::string& text,
                                                  const std::string& source_path,
                                                  const ProblemStoreOptions& options,
                                                  std::string* reason);

// Offline validation of one file: reports every problem found, including
// empty or whitespace-only fields the loader would accept.
struct RecordReport {
  std::string path;
  std::string id;
  bool ok{false};
  std::size_t num_perturbations{0};
  std::vector<std::string> errors;
};

RecordReport validate_problem_file(const std::string& path, std::size_t expected_perturbations = 0);

// *.json files under a directory in sorted order, or the path itself.
// Throws DatasetError when the location does not exist.
std::vector<std::string> list_problem_files(const std::string& location);

std::string record_report_to_json(const RecordReport& report);

}  // namespace sieve
