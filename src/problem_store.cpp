#include "sieve/problem_store.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include "sieve/errors.hpp"
#include "sieve/hash.hpp"
#include "sieve/jsonlite.hpp"
#include "sieve/observability.hpp"

namespace fs = std::filesystem;

namespace sieve {

namespace {

bool read_file(const std::string& path, std::string* out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) return false;
  std::ostringstream buf;
  buf << ifs.rdbuf();
  if (ifs.bad()) return false;
  *out = buf.str();
  return true;
}

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string canonical_record(const ProblemRecord& r) {
  jsonlite::Object obj;
  jsonlite::Array perts;
  for (const auto& p : r.perturbations) perts.push_back(jsonlite::Value{p});
  obj["id"] = jsonlite::Value{r.id};
  obj["spec"] = jsonlite::Value{r.spec};
  obj["problem"] = jsonlite::Value{r.reference_code};
  obj["perturbations"] = jsonlite::Value{std::move(perts)};
  return jsonlite::to_json(jsonlite::Value{std::move(obj)});
}

}  // namespace

std::vector<std::string> list_problem_files(const std::string& location) {
  std::error_code ec;
  const fs::path root(location);
  if (!fs::exists(root, ec)) throw DatasetError("dataset location does not exist: " + location);
  if (!fs::is_directory(root, ec)) return {location};

  std::vector<std::string> files;
  fs::directory_iterator it(root, ec);
  if (ec) throw DatasetError("cannot read dataset directory " + location + ": " + ec.message());
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) throw DatasetError("cannot read dataset directory " + location + ": " + ec.message());
    if (it->path().extension() == ".json" && it->is_regular_file(ec)) {
      files.push_back(it->path().string());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::optional<ProblemRecord> parse_problem_record(const std::string& text,
                                                  const std::string& source_path,
                                                  const ProblemStoreOptions& options,
                                                  std::string* reason) {
  auto fail = [&](const std::string& why) -> std::optional<ProblemRecord> {
    if (reason) *reason = why;
    return std::nullopt;
  };

  std::optional<jsonlite::JsonError> err;
  jsonlite::Object obj = jsonlite::parse(text, &err);
  if (err) return fail(err->code + ": " + err->message);

  const jsonlite::Value* spec = jsonlite::find(obj, "spec");
  if (!spec || !jsonlite::is_string(*spec)) return fail("missing or non-string field: spec");
  const jsonlite::Value* problem = jsonlite::find(obj, "problem");
  if (!problem || !jsonlite::is_string(*problem)) return fail("missing or non-string field: problem");
  const jsonlite::Value* perts = jsonlite::find(obj, "perturbations");
  if (!perts || !jsonlite::is_array(*perts)) return fail("missing or non-array field: perturbations");

  ProblemRecord rec;
  rec.source_path = source_path;
  rec.spec = std::get<std::string>(spec->v);
  rec.reference_code = std::get<std::string>(problem->v);
  // Blank code would make every step throw at execute time.
  if (is_blank(rec.spec)) return fail("field is empty: spec");
  if (is_blank(rec.reference_code)) return fail("field is empty: problem");
  const auto& items = std::get<jsonlite::Array>(perts->v);
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (!jsonlite::is_string(items[i])) {
      return fail("perturbation " + std::to_string(i) + " is not a string");
    }
    if (is_blank(std::get<std::string>(items[i].v))) {
      return fail("perturbation " + std::to_string(i) + " is empty");
    }
    rec.perturbations.push_back(std::get<std::string>(items[i].v));
  }
  if (rec.perturbations.empty()) return fail("perturbations is empty");
  if (options.expected_perturbations != 0 &&
      rec.perturbations.size() != options.expected_perturbations) {
    return fail("expected " + std::to_string(options.expected_perturbations) +
                " perturbations, found " + std::to_string(rec.perturbations.size()));
  }

  if (const jsonlite::Value* id = jsonlite::find(obj, "id")) {
    if (!jsonlite::is_string(*id) || std::get<std::string>(id->v).empty()) {
      return fail("id must be a non-empty string");
    }
    rec.id = std::get<std::string>(id->v);
  } else {
    rec.id = fs::path(source_path).stem().string();
  }
  rec.content_digest = problem_digest(canonical_record(rec));
  return rec;
}

ProblemStore ProblemStore::load(const std::string& location, const ProblemStoreOptions& options) {
  ProblemStore store;
  store.location_ = location;

  const std::vector<std::string> files = list_problem_files(location);
  if (files.empty()) throw DatasetError("no *.json problem files in " + location);

  std::uint64_t load_ns = 0;
  {
    ScopeTimer timer(load_ns);
    for (const auto& path : files) {
      std::string text;
      std::string reason;
      if (!read_file(path, &text)) {
        reason = "unreadable file";
      } else if (auto rec = parse_problem_record(text, path, options, &reason)) {
        const std::string id = rec->id;
        if (store.add(std::move(*rec))) continue;
        reason = "duplicate id: " + id;
      }
      log_warn("dataset", "skipping " + path + ": " + reason);
      store.skipped_.push_back({path, reason});
    }
  }

  if (store.records_.empty()) {
    throw DatasetError("no valid problem records in " + location + " (" +
                       std::to_string(store.skipped_.size()) + " skipped)");
  }
  log_info("dataset", "loaded " + std::to_string(store.records_.size()) + " problems from " +
                          location + ", skipped " + std::to_string(store.skipped_.size()) + " in " +
                          std::to_string(load_ns / 1000000) + " ms");
  return store;
}

ProblemStore ProblemStore::from_records(std::vector<ProblemRecord> records) {
  ProblemStore store;
  for (auto& rec : records) {
    const std::string source = rec.source_path;
    if (rec.perturbations.empty()) {
      store.skipped_.push_back({source, "perturbations is empty"});
      continue;
    }
    if (is_blank(rec.reference_code)) {
      store.skipped_.push_back({source, "field is empty: problem"});
      continue;
    }
    const auto blank = std::find_if(rec.perturbations.begin(), rec.perturbations.end(), is_blank);
    if (blank != rec.perturbations.end()) {
      store.skipped_.push_back({source, "perturbation " +
                                            std::to_string(blank - rec.perturbations.begin()) +
                                            " is empty"});
      continue;
    }
    if (rec.content_digest.empty()) rec.content_digest = problem_digest(canonical_record(rec));
    const std::string id = rec.id;
    if (!store.add(std::move(rec))) store.skipped_.push_back({source, "duplicate id: " + id});
  }
  return store;
}

bool ProblemStore::add(ProblemRecord record) {
  if (find(record.id) != nullptr) return false;
  records_.push_back(std::move(record));
  return true;
}

const ProblemRecord& ProblemStore::sample(std::mt19937_64& rng) const {
  if (records_.empty()) throw EmptyDatasetError("problem store is empty");
  std::uniform_int_distribution<std::size_t> dist(0, records_.size() - 1);
  return records_[dist(rng)];
}

const ProblemRecord& ProblemStore::at(std::size_t index) const {
  if (index >= records_.size()) {
    throw InvalidInputError("problem index " + std::to_string(index) + " out of range (size " +
                            std::to_string(records_.size()) + ")");
  }
  return records_[index];
}

const ProblemRecord* ProblemStore::find(const std::string& id) const {
  for (const auto& r : records_) {
    if (r.id == id) return &r;
  }
  return nullptr;
}

RecordReport validate_problem_file(const std::string& path, std::size_t expected_perturbations) {
  RecordReport report;
  report.path = path;
  report.id = fs::path(path).stem().string();

  std::string text;
  if (!read_file(path, &text)) {
    report.errors.push_back("unreadable file");
    return report;
  }
  std::optional<jsonlite::JsonError> err;
  jsonlite::Object obj = jsonlite::parse(text, &err);
  if (err) {
    report.errors.push_back(err->code + ": " + err->message);
    return report;
  }

  for (const char* key : {"spec", "problem"}) {
    const jsonlite::Value* v = jsonlite::find(obj, key);
    if (!v) {
      report.errors.push_back(std::string("missing field: ") + key);
    } else if (!jsonlite::is_string(*v)) {
      report.errors.push_back(std::string("field is not a string: ") + key);
    } else if (is_blank(std::get<std::string>(v->v))) {
      report.errors.push_back(std::string("field is empty: ") + key);
    }
  }

  if (const jsonlite::Value* id = jsonlite::find(obj, "id")) {
    if (jsonlite::is_string(*id) && !std::get<std::string>(id->v).empty()) {
      report.id = std::get<std::string>(id->v);
    } else {
      report.errors.push_back("id must be a non-empty string");
    }
  }

  const jsonlite::Value* perts = jsonlite::find(obj, "perturbations");
  if (!perts) {
    report.errors.push_back("missing field: perturbations");
  } else if (!jsonlite::is_array(*perts)) {
    report.errors.push_back("field is not an array: perturbations");
  } else {
    const auto& items = std::get<jsonlite::Array>(perts->v);
    report.num_perturbations = items.size();
    if (items.empty()) report.errors.push_back("perturbations is empty");
    if (expected_perturbations != 0 && items.size() != expected_perturbations) {
      report.errors.push_back("expected " + std::to_string(expected_perturbations) +
                              " perturbations, found " + std::to_string(items.size()));
    }
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (!jsonlite::is_string(items[i])) {
        report.errors.push_back("perturbation " + std::to_string(i) + " is not a string");
      } else if (is_blank(std::get<std::string>(items[i].v))) {
        report.errors.push_back("perturbation " + std::to_string(i) + " is empty");
      }
    }
  }

  report.ok = report.errors.empty();
  return report;
}

std::string record_report_to_json(const RecordReport& r) {
  std::string out = "{\"path\":\"" + jsonlite::escape(r.path) + "\",\"id\":\"" +
                    jsonlite::escape(r.id) + "\",\"ok\":" + (r.ok ? "true" : "false") +
                    ",\"num_perturbations\":" + std::to_string(r.num_perturbations) +
                    ",\"errors\":[";
  for (std::size_t i = 0; i < r.errors.size(); ++i) {
    if (i) out += ",";
    out += "\"" + jsonlite::escape(r.errors[i]) + "\"";
  }
  out += "]}";
  return out;
}

}  // namespace sieve
