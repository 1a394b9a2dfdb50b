#include "bluxguard/audit.hpp"

#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>

#include "bluxguard/hash.hpp"
#include "bluxguard/mac.hpp"
#include "bluxguard/observability.hpp"

namespace fs = std::filesystem;

namespace bluxguard {

namespace {

std::uint64_t now_ms() {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::system_clock::now().time_since_epoch())
                                        .count());
}

std::string resolve_correlation_id(const std::string& given) {
  if (!given.empty()) return given;
  const char* env = std::getenv("BLUXGUARD_CORRELATION_ID");
  if (env && env[0]) return env;
  return random_id();
}

// Holds flock(LOCK_EX) for the lifetime of the guard.
class FileLock {
 public:
  explicit FileLock(FILE* f) : fd_(fileno(f)) { locked_ = (flock(fd_, LOCK_EX) == 0); }
  ~FileLock() {
    if (locked_) flock(fd_, LOCK_UN);
  }
  bool locked() const { return locked_; }

 private:
  int fd_;
  bool locked_{false};
};

}  // namespace

struct AuditLog::Impl {
  std::mutex mu;
  std::string path;
  std::unique_ptr<RecordStore> records;
  std::uint64_t seq{0};
  std::string last_digest;  // chain seed is the empty string
  std::uint64_t known_size{0};
  bool synced{false};
  std::uint64_t entry_count{0};
  std::uint64_t failure_count{0};

  // Re-derive seq and last_digest from the file contents.
  void resync() {
    const ChainReport report = verify_chain(path);
    seq = report.line_count;
    last_digest = report.digest;
    if (report.status == "broken") {
      emit_event(GuardEvent{"audit", "audit.chain_broken", "error", "",
                            {{"path", path}, {"first_bad_line", std::to_string(report.first_bad_line)}}});
    }
  }
};

AuditLog::AuditLog(std::string path, std::string record_dir) : impl_(std::make_unique<Impl>()) {
  impl_->path = std::move(path);
  if (!record_dir.empty()) impl_->records = std::make_unique<RecordStore>(std::move(record_dir));
}

AuditLog::~AuditLog() = default;

const std::string& AuditLog::path() const { return impl_->path; }

std::string AuditLog::last_digest() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->last_digest;
}

std::uint64_t AuditLog::entry_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->entry_count;
}

std::uint64_t AuditLog::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

const RecordStore* AuditLog::records() const { return impl_->records.get(); }

AppendResult AuditLog::append(const AuditEntry& entry) {
  AppendResult result;
  auto fail = [&](const std::string& msg) {
    ++impl_->failure_count;
    result.ok = false;
    result.error = ErrorCode::log_unavailable;
    result.message = msg;
    return result;
  };

  {
    std::lock_guard<std::mutex> lk(impl_->mu);

    std::error_code ec;
    const fs::path parent = fs::path(impl_->path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    if (ec) {
      fail("cannot create log directory: " + ec.message());
    } else if (FILE* f = std::fopen(impl_->path.c_str(), "a")) {
      {
        FileLock lock(f);
        struct stat st {};
        if (!lock.locked() || fstat(fileno(f), &st) != 0) {
          fail("cannot lock audit log");
        } else {
          const auto size = static_cast<std::uint64_t>(st.st_size);
          if (!impl_->synced || size != impl_->known_size) impl_->resync();

          jsonlite::Object o;
          o["seq"] = impl_->seq + 1;
          o["ts"] = now_ms();
          o["level"] = entry.level;
          o["actor"] = entry.actor;
          o["action"] = entry.action;
          o["stream"] = entry.stream;
          o["correlation_id"] = resolve_correlation_id(entry.correlation_id);
          o["payload"] = entry.payload;
          o["prev"] = impl_->last_digest;
          const std::string line = jsonlite::to_json(o);
          const std::string framed = line + "\n";

          const bool written = std::fwrite(framed.data(), 1, framed.size(), f) == framed.size() &&
                               std::fflush(f) == 0;
          struct stat after {};
          if (written && ::fsync(fileno(f)) != 0) {
            // Not durable: the chain state stays at the previous entry.
            impl_->synced = false;
            fail("audit fsync failed");
          } else if (!written || fstat(fileno(f), &after) != 0 ||
              static_cast<std::uint64_t>(after.st_size) < size + framed.size()) {
            // The file may now hold a torn line; force a resync next time.
            impl_->synced = false;
            fail("audit write failed");
          } else {
            impl_->seq += 1;
            impl_->last_digest = chain_digest(impl_->last_digest, line);
            impl_->known_size = static_cast<std::uint64_t>(after.st_size);
            impl_->synced = true;
            ++impl_->entry_count;
            result.ok = true;
            result.seq = impl_->seq;
            result.digest = impl_->last_digest;
            result.line = line;
          }
        }
      }
      std::fclose(f);
    } else {
      fail("cannot open audit log: " + impl_->path);
    }
  }

  if (!result.ok) {
    emit_event(GuardEvent{"audit", "audit.append_failed", "error", "",
                          {{"action", entry.action}, {"path", impl_->path}, {"message", result.message}}});
    return result;
  }

  if (impl_->records) {
    std::string err;
    RecordIndexEntry idx{result.seq, result.digest, entry.action, 0};
    std::optional<jsonlite::JsonError> perr;
    idx.ts = jsonlite::get_u64(jsonlite::parse(result.line, &perr), "ts");
    result.indexed = impl_->records->put(result.line, idx, &err);
    if (!result.indexed) {
      emit_event(GuardEvent{"audit", "audit.index_failed", "warn", "",
                            {{"digest", result.digest}, {"message", err}}});
    }
  }

  emit_event(GuardEvent{"audit", "audit.appended", "info", "",
                        {{"action", entry.action}, {"seq", std::to_string(result.seq)}}});
  return result;
}

ChainReport verify_chain(const std::string& path) {
  ChainReport report;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    report.status = "missing";
    return report;
  }
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    report.status = "missing";
    return report;
  }

  std::string running;
  std::string line;
  std::uint64_t n = 0;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    ++n;
    if (report.first_bad_line == 0) {
      std::optional<jsonlite::JsonError> err;
      const jsonlite::Object obj = jsonlite::parse(line, &err);
      const jsonlite::Value* prev = err ? nullptr : jsonlite::find(obj, "prev");
      if (!prev || !prev->is_string() || prev->as_string() != running) {
        report.first_bad_line = n;
      }
    }
    running = chain_digest(running, line);
  }

  report.line_count = n;
  report.digest = running;
  if (n == 0) report.status = "empty";
  else if (report.first_bad_line != 0) report.status = "broken";
  else report.status = "clean";
  return report;
}

std::string ChainReport::to_json() const {
  jsonlite::Object o;
  o["status"] = status;
  o["digest"] = digest;
  o["line_count"] = line_count;
  if (first_bad_line != 0) o["first_bad_line"] = first_bad_line;
  return jsonlite::to_json(o);
}

}  // namespace bluxguard
