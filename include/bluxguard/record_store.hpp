#pragma once

// bluxguard/record_store.hpp - Indexed object store for audit entries.
//
// The second audit sink. Every entry appended to the chain is also stored as
// an object keyed by its chain digest:
//
//   <root>/AB/CD/<digest>     the entry's canonical line, byte for byte
//   <root>/index.ndjson       {"action","digest","seq","ts"} per object
//
// INVARIANTS:
//   1. Objects are written atomically (tmp + rename); a reader never sees a
//      partial object.
//   2. get() re-derives the chain digest from the stored line (its "prev"
//      field plus its bytes) and returns nothing on mismatch. Integrity
//      failure is indistinguishable from absence to callers: fail closed.
//   3. Objects are never rewritten. A put() for an existing digest succeeds
//      only if the stored bytes are identical.

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bluxguard {

struct RecordIndexEntry {
  std::uint64_t seq{0};
  std::string digest;
  std::string action;
  std::uint64_t ts{0};
};

class RecordStore {
 public:
  explicit RecordStore(std::string root);

  // Store `line` under `entry.digest`. Returns false (with *error set) on I/O
  // failure or when the line does not hash to the digest.
  bool put(const std::string& line, const RecordIndexEntry& entry, std::string* error);

  std::optional<std::string> get(const std::string& digest) const;
  bool contains(const std::string& digest) const;

  std::vector<RecordIndexEntry> find_by_action(const std::string& action) const;
  std::size_t count() const;

  const std::string& root() const { return root_; }
  std::string object_path(const std::string& digest) const;

 private:
  std::string index_path() const;
  std::vector<RecordIndexEntry> load_index() const;

  std::string root_;
  mutable std::mutex index_mu_;
};

// Chain digest a stored line claims for itself: chain_digest(line.prev, line).
// Empty when the line is not a JSON object with a string "prev".
std::string digest_for_line(const std::string& line);

}  // namespace bluxguard
