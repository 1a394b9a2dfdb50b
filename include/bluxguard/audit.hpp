#pragma once

// bluxguard/audit.hpp - Append-only, hash-chained audit log.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: there is no update or delete operation. Lines are only
//      ever added at the end of the file.
//   2. CHAINED: each line is the canonical JSON of one entry, and carries
//      "prev", the chain digest of everything before it:
//        digest_0 = chain_digest("", line_0)
//        digest_n = chain_digest(digest_{n-1}, line_n)
//      Altering, dropping or reordering any line changes every later digest.
//   3. SERIALIZED: "read last digest, compute, append" runs under a process
//      mutex and an exclusive flock(2) on the log file, so concurrent writers
//      (threads or processes) never fork the chain. If another process grew
//      the file since our last write, the chain state is re-derived from disk
//      before appending.
//   4. FAIL-SAFE: an unwritable sink returns log_unavailable and emits an
//      audit.append_failed event. Callers decide whether that blocks them; the
//      receipt engine does not (see receipt.hpp).
//   5. TWO SINKS: after the line is durable, the entry is also stored in the
//      indexed RecordStore under its chain digest. Record store failure does
//      not undo the line.

#include <cstdint>
#include <memory>
#include <string>

#include "bluxguard/jsonlite.hpp"
#include "bluxguard/record_store.hpp"
#include "bluxguard/types.hpp"

namespace bluxguard {

struct AuditEntry {
  std::string level{"info"};
  std::string actor;
  std::string action;
  std::string stream{"audit"};
  std::string correlation_id;  // empty: BLUXGUARD_CORRELATION_ID, else fresh id
  jsonlite::Object payload;
};

struct AppendResult {
  bool ok{false};
  ErrorCode error{ErrorCode::none};
  std::string message;
  std::uint64_t seq{0};
  std::string digest;
  std::string line;
  bool indexed{false};
};

class AuditLog {
 public:
  // record_dir empty: no record store.
  explicit AuditLog(std::string path, std::string record_dir = "");
  ~AuditLog();

  AuditLog(const AuditLog&) = delete;
  AuditLog& operator=(const AuditLog&) = delete;

  AppendResult append(const AuditEntry& entry);

  const std::string& path() const;
  std::string last_digest() const;
  std::uint64_t entry_count() const;
  std::uint64_t failure_count() const;

  // nullptr when constructed without a record directory.
  const RecordStore* records() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

struct ChainReport {
  std::string status;  // "missing" | "empty" | "clean" | "broken"
  std::string digest;  // recomputed over every non-empty line
  std::uint64_t line_count{0};
  std::uint64_t first_bad_line{0};  // 1-based; 0 when not broken

  std::string to_json() const;
};

// Recompute the chain from scratch. Never modifies the file.
ChainReport verify_chain(const std::string& path);

}  // namespace bluxguard
