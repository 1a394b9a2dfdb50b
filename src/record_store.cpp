#include "bluxguard/record_store.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#include "bluxguard/hash.hpp"
#include "bluxguard/jsonlite.hpp"

namespace fs = std::filesystem;

namespace bluxguard {

namespace {

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<std::uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file in the same directory, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_all(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

}  // namespace

std::string digest_for_line(const std::string& line) {
  std::optional<jsonlite::JsonError> err;
  const jsonlite::Object obj = jsonlite::parse(line, &err);
  if (err) return {};
  const jsonlite::Value* prev = jsonlite::find(obj, "prev");
  if (!prev || !prev->is_string()) return {};
  return chain_digest(prev->as_string(), line);
}

RecordStore::RecordStore(std::string root) : root_(std::move(root)) {}

std::string RecordStore::object_path(const std::string& digest) const {
  return (fs::path(root_) / digest.substr(0, 2) / digest.substr(2, 2) / digest).string();
}

std::string RecordStore::index_path() const {
  return (fs::path(root_) / "index.ndjson").string();
}

bool RecordStore::put(const std::string& line, const RecordIndexEntry& entry, std::string* error) {
  auto fail = [&](const std::string& msg) {
    if (error) *error = msg;
    return false;
  };
  if (!is_hex_digest(entry.digest)) return fail("invalid digest");
  if (digest_for_line(line) != entry.digest) return fail("line does not hash to digest");

  const fs::path target = object_path(entry.digest);
  std::error_code ec;
  if (fs::exists(target, ec)) {
    auto existing = read_all(target);
    if (!existing || *existing != line) return fail("existing object differs");
    return true;
  }
  if (!atomic_write(target, line)) return fail("object write failed: " + target.string());

  jsonlite::Object idx;
  idx["seq"] = entry.seq;
  idx["digest"] = entry.digest;
  idx["action"] = entry.action;
  idx["ts"] = entry.ts;
  const std::string idx_line = jsonlite::to_json(idx) + "\n";

  std::lock_guard<std::mutex> lk(index_mu_);
  std::ofstream ofs(index_path(), std::ios::binary | std::ios::app);
  if (!ofs) return fail("index open failed");
  ofs.write(idx_line.data(), static_cast<std::streamsize>(idx_line.size()));
  ofs.flush();
  if (!ofs) return fail("index write failed");
  return true;
}

std::optional<std::string> RecordStore::get(const std::string& digest) const {
  if (!is_hex_digest(digest)) return std::nullopt;
  auto data = read_all(object_path(digest));
  if (!data) return std::nullopt;
  if (digest_for_line(*data) != digest) return std::nullopt;
  return data;
}

bool RecordStore::contains(const std::string& digest) const {
  if (!is_hex_digest(digest)) return false;
  std::error_code ec;
  return fs::exists(object_path(digest), ec);
}

std::vector<RecordIndexEntry> RecordStore::load_index() const {
  std::vector<RecordIndexEntry> out;
  std::lock_guard<std::mutex> lk(index_mu_);
  std::ifstream ifs(index_path());
  if (!ifs) return out;
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.empty()) continue;
    std::optional<jsonlite::JsonError> err;
    const jsonlite::Object obj = jsonlite::parse(line, &err);
    if (err) continue;  // torn trailing line from a crashed writer
    RecordIndexEntry e;
    e.seq = jsonlite::get_u64(obj, "seq");
    e.digest = jsonlite::get_string(obj, "digest");
    e.action = jsonlite::get_string(obj, "action");
    e.ts = jsonlite::get_u64(obj, "ts");
    if (!e.digest.empty()) out.push_back(std::move(e));
  }
  return out;
}

std::vector<RecordIndexEntry> RecordStore::find_by_action(const std::string& action) const {
  std::vector<RecordIndexEntry> out;
  for (auto& e : load_index()) {
    if (e.action == action) out.push_back(std::move(e));
  }
  return out;
}

std::size_t RecordStore::count() const {
  return load_index().size();
}

}  // namespace bluxguard
