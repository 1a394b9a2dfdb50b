#include <sys/stat.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "bluxguard/audit.hpp"
#include "bluxguard/channel.hpp"
#include "bluxguard/config.hpp"
#include "bluxguard/constraints.hpp"
#include "bluxguard/decision.hpp"
#include "bluxguard/document.hpp"
#include "bluxguard/hash.hpp"
#include "bluxguard/jsonlite.hpp"
#include "bluxguard/mac.hpp"
#include "bluxguard/observability.hpp"
#include "bluxguard/process.hpp"
#include "bluxguard/receipt.hpp"
#include "bluxguard/record_store.hpp"
#include "bluxguard/schema.hpp"
#include "bluxguard/token_verifier.hpp"
#include "bluxguard/trip_engine.hpp"
#include "bluxguard/version.hpp"

namespace fs = std::filesystem;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// Every event goes to this hook so the suite runs silently and tests can
// assert on degrade signals.
std::mutex g_events_mu;
std::vector<bluxguard::GuardEvent> g_events;

void capture_event(const bluxguard::GuardEvent& ev) {
  std::lock_guard<std::mutex> lock(g_events_mu);
  g_events.push_back(ev);
}

void clear_events() {
  std::lock_guard<std::mutex> lock(g_events_mu);
  g_events.clear();
}

std::size_t count_events(const std::string& action) {
  std::lock_guard<std::mutex> lock(g_events_mu);
  std::size_t n = 0;
  for (const auto& ev : g_events) {
    if (ev.action == action) ++n;
  }
  return n;
}

fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string read_text(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void write_text(const fs::path& path, const std::string& data) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << data;
}

std::vector<std::string> read_lines(const fs::path& path) {
  std::vector<std::string> lines;
  std::ifstream ifs(path);
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

void write_lines(const fs::path& path, const std::vector<std::string>& lines) {
  std::string out;
  for (const auto& l : lines) out += l + "\n";
  write_text(path, out);
}

std::string write_script(const fs::path& dir, const std::string& name, const std::string& body) {
  const fs::path p = dir / name;
  write_text(p, "#!/bin/sh\n" + body);
  chmod(p.c_str(), 0755);
  return p.string();
}

bluxguard::jsonlite::Value value_of(const std::string& text) {
  std::optional<bluxguard::jsonlite::JsonError> err;
  auto v = bluxguard::jsonlite::parse_value(text, &err);
  expect(!err && v.has_value(), "test fixture must be valid JSON: " + text);
  return *v;
}

bluxguard::jsonlite::Object object_of(const std::string& text) {
  auto v = value_of(text);
  expect(v.is_object(), "test fixture must be a JSON object");
  return v.as_object();
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
  for (const auto& x : v) {
    if (x == s) return true;
  }
  return false;
}

// Shared fixture for receipt tests.
struct GuardFixture {
  bluxguard::SchemaRegistry schemas;
  bluxguard::InMemoryTokenAuthority authority;
  bluxguard::StaticKeyProvider keys{"receipt-test-key"};

  GuardFixture() {
    authority.add_valid("tok-ok", "cap-ref-1");
    authority.add_invalid("tok-bad", {"token.expired"});
  }
};

bluxguard::EvaluationRequest basic_request(std::vector<std::string> tokens) {
  bluxguard::EvaluationRequest req;
  req.envelope = object_of(R"({"trace_id":"trace-1","command":"ls","working_dir":"/tmp"})");
  req.tokens = std::move(tokens);
  return req;
}

// ============================================================================
// Phase 1: Crypto primitives
// ============================================================================

void test_blake3_known_vectors() {
  expect(bluxguard::hash_domain("", "") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(bluxguard::hash_domain("", "hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(bluxguard::hash_runtime_info().primitive == "blake3", "hash primitive reported");
}

void test_hash_domain_separation() {
  const std::string payload = "same bytes";
  const std::string chained = bluxguard::chain_digest("", payload);
  expect(chained == bluxguard::hash_domain("chain:", payload), "empty seed chains as domain hash");
  expect(chained != bluxguard::hash_domain("", payload), "chain digest is domain-separated");
  expect(bluxguard::constraints_hash(payload) != bluxguard::hash_domain("chain:", payload),
         "cons: and chain: domains differ");
  expect(bluxguard::is_hex_digest(chained), "chain digest is 64 lowercase hex");
  expect(!bluxguard::is_hex_digest("ABC"), "short digest rejected");
}

void test_hmac_rfc4231_vector() {
  // RFC 4231 test case 2.
  const std::string tag = bluxguard::hmac_sha256_hex("Jefe", "what do ya want for nothing?");
  expect(tag == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
         "HMAC-SHA256 RFC 4231 case 2");
  expect(bluxguard::hmac_sha256("Jefe", "what do ya want for nothing?").size() == 32, "raw tag is 32 bytes");
}

void test_constant_time_equals() {
  expect(bluxguard::constant_time_equals("abcdef", "abcdef"), "equal tags");
  expect(!bluxguard::constant_time_equals("abcdef", "abcdeg"), "last byte differs");
  expect(!bluxguard::constant_time_equals("abc", "abcdef"), "length mismatch");
}

void test_base64_vectors() {
  expect(bluxguard::base64_encode("") == "", "base64 empty");
  expect(bluxguard::base64_encode("fo") == "Zm8=", "base64 one pad");
  expect(bluxguard::base64_encode("foobar") == "Zm9vYmFy", "base64 no pad");
  auto decoded = bluxguard::base64_decode("Zm8=");
  expect(decoded.has_value() && *decoded == "fo", "base64 decode with padding");
  expect(!bluxguard::base64_decode("!!!!").has_value(), "base64 rejects non-alphabet input");
}

void test_random_id_shape() {
  const std::string a = bluxguard::random_id();
  const std::string b = bluxguard::random_id();
  expect(a.size() == 36 && a[14] == '4', "random id is a v4 uuid");
  expect(a != b, "random ids differ");
}

// ============================================================================
// Phase 2: Canonical JSON and bounded documents
// ============================================================================

std::string canonical_of(const std::string& text, std::optional<bluxguard::jsonlite::JsonError>* err) {
  const auto v = bluxguard::jsonlite::parse_value(text, err);
  return v ? bluxguard::jsonlite::to_json(*v) : std::string();
}

void test_canonical_json() {
  std::optional<bluxguard::jsonlite::JsonError> err;
  const std::string canon =
      canonical_of(R"({ "b": 1, "a": [true, null, "x"], "c": {"z": -2, "y": 1.5} })", &err);
  expect(!err, "canonicalize valid input");
  expect(canon == R"({"a":[true,null,"x"],"b":1,"c":{"y":1.5,"z":-2}})", "keys sorted, no whitespace");

  const std::string again = canonical_of(canon, &err);
  expect(!err && again == canon, "canonical form is a fixed point");

  const std::string escaped = bluxguard::jsonlite::to_json(bluxguard::jsonlite::Value("line\n\"q\""));
  expect(escaped == "\"line\\n\\\"q\\\"\"", "control characters and quotes escaped");
}

void test_json_strictness() {
  std::optional<bluxguard::jsonlite::JsonError> err;
  bluxguard::jsonlite::parse_value(R"({"a":1,"a":2})", &err);
  expect(err && err->code == "json_duplicate_key", "duplicate key rejected");

  err.reset();
  bluxguard::jsonlite::parse_value(R"({"a":1} trailing)", &err);
  expect(err && err->code == "json_parse_error", "trailing data rejected");

  err.reset();
  bluxguard::jsonlite::parse_value("NaN", &err);
  expect(err.has_value(), "NaN rejected");
}

void test_dotted_path_and_truthiness() {
  const auto event = object_of(R"({"network":{"remote_ips_count":80,"iface":""},"flag":false})");
  const auto* v = bluxguard::jsonlite::get_path(event, "network.remote_ips_count");
  expect(v && v->as_double() == 80.0, "nested lookup");
  expect(bluxguard::jsonlite::get_path(event, "network.missing") == nullptr, "missing leaf");
  expect(bluxguard::jsonlite::get_path(event, "flag.deeper") == nullptr, "traversal through scalar");
  expect(!bluxguard::jsonlite::truthy(*bluxguard::jsonlite::get_path(event, "network.iface")), "empty string falsy");
  expect(!bluxguard::jsonlite::truthy(*bluxguard::jsonlite::get_path(event, "flag")), "false falsy");
  expect(bluxguard::jsonlite::truthy(*v), "non-zero number truthy");
}

void test_document_limits() {
  const auto big = bluxguard::parse_json_document(std::string(bluxguard::kMaxDocumentBytes + 1, ' '));
  expect(!big.ok() && big.error == bluxguard::ErrorCode::quota_exceeded, "oversized document rejected");

  const auto dup = bluxguard::parse_json_document(R"({"decision":"ALLOW","decision":"BLOCK"})");
  expect(!dup.ok() && dup.error == bluxguard::ErrorCode::json_duplicate_key, "duplicate key document rejected");

  const auto bad = bluxguard::parse_json_document("{");
  expect(!bad.ok() && bad.error == bluxguard::ErrorCode::json_parse_error, "truncated document rejected");

  const auto missing = bluxguard::load_json_file("/nonexistent/bluxguard/envelope.json");
  expect(!missing.ok() && missing.error == bluxguard::ErrorCode::missing_input, "missing file reported");

  const fs::path dir = fresh_dir("bluxguard_doc_test");
  write_text(dir / "ok.json", R"({"trace_id":"t"})");
  const auto ok = bluxguard::load_json_file((dir / "ok.json").string());
  expect(ok.ok() && ok.value->is_object(), "file document loaded");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 3: Schema validation
// ============================================================================

void test_envelope_schema_violations() {
  bluxguard::SchemaRegistry schemas;
  const auto issues = schemas.validate(
      bluxguard::Contract::request_envelope,
      value_of(R"({"timeout_s":"soon","network":{"egress":"open"},"surprise":true})"));
  expect(issues.size() == 3, "every failing field is reported");

  bool saw_timeout = false, saw_egress = false, saw_extra = false;
  for (const auto& i : issues) {
    expect(i.document == bluxguard::contract_name(bluxguard::Contract::request_envelope), "issue names document");
    if (i.path == "timeout_s" && i.keyword == "type") saw_timeout = true;
    if (i.path == "network/egress" && i.keyword == "enum") saw_egress = true;
    if (i.path == "surprise" && i.keyword == "additionalProperties") saw_extra = true;
  }
  expect(saw_timeout && saw_egress && saw_extra, "issue paths and keywords");

  expect(schemas.validate(bluxguard::Contract::request_envelope, value_of("{}")).empty(),
         "empty envelope is structurally valid");
  expect(!schemas.validate(bluxguard::Contract::request_envelope, value_of("[]")).empty(),
         "non-object envelope rejected");
}

void test_discernment_schema_violations() {
  bluxguard::SchemaRegistry schemas;
  const auto issues = schemas.validate(bluxguard::Contract::discernment_report,
                                       value_of(R"({"risk_level":"extreme","requires_confirmation":"yes"})"));
  expect(issues.size() == 2, "risk band and confirmation flag both reported");

  expect(schemas.validate(bluxguard::Contract::discernment_report,
                          value_of(R"({"band":"medium","posture":"degraded","extra":1})"))
             .empty(),
         "band alias and extra fields accepted");
}

void test_receipt_schema_required_fields() {
  bluxguard::SchemaRegistry schemas;
  const auto issues = schemas.validate(bluxguard::Contract::guard_receipt, value_of("{}"));
  expect(!issues.empty(), "empty receipt rejected");
  for (const auto& i : issues) expect(i.keyword == "required", "only required issues for empty object");
  const std::string schema = schemas.schema_json(bluxguard::Contract::guard_receipt);
  expect(schema.find(bluxguard::kReceiptSchemaId) != std::string::npos, "receipt schema carries its id");
}

// ============================================================================
// Phase 4: Decision mapping
// ============================================================================

bluxguard::DecisionInput valid_token_input() {
  bluxguard::DecisionInput in;
  in.tokens_missing = false;
  in.tokens_valid = true;
  in.token_reason_codes = {"token.valid"};
  return in;
}

bluxguard::DiscernmentReport report(const std::string& risk, const std::string& posture = "") {
  bluxguard::DiscernmentReport r;
  r.risk_level = risk;
  if (!posture.empty()) r.posture = posture;
  return r;
}

void test_decision_table() {
  const bluxguard::DecisionPolicy policy;
  struct Row {
    std::string risk;
    std::string posture;
    bluxguard::Decision expected;
    std::string reason;
  };
  const std::vector<Row> rows = {
      {"critical", "", bluxguard::Decision::block, "risk.critical"},
      {"high", "", bluxguard::Decision::require_confirm, "risk.high"},
      {"medium", "degraded", bluxguard::Decision::require_confirm, "posture.low"},
      {"medium", "low", bluxguard::Decision::require_confirm, "posture.low"},
      {"medium", "nominal", bluxguard::Decision::warn, "risk.medium"},
      {"low", "", bluxguard::Decision::allow, "risk.low"},
  };
  for (const auto& row : rows) {
    auto in = valid_token_input();
    in.discernment = report(row.risk, row.posture);
    const auto out = bluxguard::decide(in, policy);
    expect(out.decision == row.expected, "decision for risk " + row.risk + "/" + row.posture);
    expect(contains(out.reason_codes, row.reason), "reason " + row.reason);
  }
}

void test_decision_tokens_fail_closed() {
  const bluxguard::DecisionPolicy policy;
  bluxguard::DecisionInput missing;
  missing.discernment = report("low");
  auto out = bluxguard::decide(missing, policy);
  expect(out.decision == bluxguard::Decision::block, "missing token blocks");
  expect(contains(out.reason_codes, "token.missing"), "token.missing reason");
  expect(!contains(out.reason_codes, "risk.low"), "no allow reason once blocked");

  bluxguard::DecisionInput invalid;
  invalid.tokens_missing = false;
  invalid.token_reason_codes = {"token.verifier_unavailable"};
  invalid.discernment = report("high");
  out = bluxguard::decide(invalid, policy);
  expect(out.decision == bluxguard::Decision::block, "invalid token blocks even with confirmable risk");
  expect(contains(out.reason_codes, "token.invalid"), "token.invalid reason");
  expect(contains(out.reason_codes, "token.verifier_unavailable"), "authority reason carried");
  expect(contains(out.reason_codes, "risk.high"), "risk reason still recorded");
}

void test_decision_confirmation_and_policy() {
  auto in = valid_token_input();
  bluxguard::DiscernmentReport r;
  r.requires_confirmation = true;
  in.discernment = r;
  auto out = bluxguard::decide(in, {});
  expect(out.decision == bluxguard::Decision::require_confirm, "explicit confirmation request");
  expect(contains(out.reason_codes, "discernment.confirmation"), "confirmation reason");

  auto none = valid_token_input();
  out = bluxguard::decide(none, {});
  expect(out.decision == bluxguard::Decision::allow, "default policy without report");
  expect(out.reason_codes == std::vector<std::string>({"token.valid", "risk.low", "discernment.none"}),
         "discernment.none appended to the default allow reason");

  bluxguard::DecisionPolicy strict;
  strict.no_discernment_decision = bluxguard::Decision::warn;
  out = bluxguard::decide(none, strict);
  expect(out.decision == bluxguard::Decision::warn, "configured no-discernment decision");
  expect(!contains(out.reason_codes, "risk.low") && contains(out.reason_codes, "discernment.none"),
         "non-allow default carries only discernment.none");
}

void test_decision_is_pure() {
  auto in = valid_token_input();
  auto r = report("medium", "nominal");
  r.uncertainty = "high";
  in.discernment = r;
  const auto a = bluxguard::decide(in, {});
  const auto b = bluxguard::decide(in, {});
  expect(a.decision == b.decision && a.reason_codes == b.reason_codes, "identical inputs, identical output");

  r.uncertainty.reset();
  in.discernment = r;
  const auto c = bluxguard::decide(in, {});
  expect(c.decision == a.decision, "uncertainty does not move the decision");
}

// ============================================================================
// Phase 5: Constraint resolution
// ============================================================================

void test_constraints_paths_and_limits() {
  bluxguard::RequestEnvelope env;
  env.working_dir = "/work/./proj/";
  env.allowed_paths = std::vector<std::string>{"src", "/etc/../tmp/"};
  env.memory_mb = 1024;
  env.command = "make";
  const auto c = bluxguard::resolve_constraints(env, bluxguard::Decision::allow);
  expect(c.working_dir == "/work/proj", "working dir normalized");
  expect(c.allowed_paths.size() == 2 && c.allowed_paths[0] == "/work/proj/src" && c.allowed_paths[1] == "/tmp",
         "allowed paths resolved against working dir");
  expect(c.allowed_commands.size() == 1 && c.allowed_commands[0] == "make", "command becomes allowlist");
  expect(c.resource_limits.cpu_seconds == 120 && c.resource_limits.memory_mb == 1024 &&
             c.resource_limits.processes == 64,
         "partial resource limits override only given keys");
  expect(c.timeout_s == 300 && c.sandbox_profile == "userland", "defaults applied");
  expect(c.network.egress == "restricted", "network defaults to restricted");
  expect(c.receipt_required && c.allowlist_execution, "receipt and allowlist always required");
}

void test_constraints_integral_float_limits() {
  const std::string text = R"({"timeout_s":600.0,"resource_limits":{"memory_mb":2048.0},"working_dir":"/w"})";
  bluxguard::SchemaRegistry schemas;
  expect(schemas.validate(bluxguard::Contract::request_envelope, value_of(text)).empty(),
         "integral floats pass the integer schema");
  const auto env = bluxguard::envelope_from_json(object_of(text));
  expect(env.timeout_s && *env.timeout_s == 600, "600.0 read as timeout_s");
  expect(env.memory_mb && *env.memory_mb == 2048, "2048.0 read as memory_mb");
  const auto c = bluxguard::resolve_constraints(env, bluxguard::Decision::allow);
  expect(c.timeout_s == 600 && c.resource_limits.memory_mb == 2048, "integral floats reach constraints");

  const auto fractional = bluxguard::envelope_from_json(object_of(R"({"timeout_s":1.5})"));
  expect(!fractional.timeout_s, "fractional timeout not read as integer");
}

void test_constraints_default_path_only_on_allow() {
  bluxguard::RequestEnvelope env;
  env.working_dir = "/srv/app";
  auto c = bluxguard::resolve_constraints(env, bluxguard::Decision::allow);
  expect(c.allowed_paths.size() == 1 && c.allowed_paths[0] == "/srv/app", "allow defaults to working dir");

  c = bluxguard::resolve_constraints(env, bluxguard::Decision::block);
  expect(c.allowed_paths.empty(), "no implicit grant on block");
  const auto o = c.to_json_object();
  expect(o.find("allowed_paths") == o.end() && o.find("allowed_commands") == o.end(), "empty lists omitted");

  c = bluxguard::resolve_constraints(env, bluxguard::Decision::require_confirm);
  expect(c.confirmation_required, "confirmation flag follows decision");
}

void test_constraints_environment_deny_wins() {
  bluxguard::RequestEnvelope env;
  env.env_allowlist = std::vector<std::string>{"PATH", "GITHUB_TOKEN", "MY_API_KEY", "EDITOR"};
  const auto c = bluxguard::resolve_constraints(env, bluxguard::Decision::allow);
  expect(c.environment.allowlist == std::vector<std::string>({"PATH", "EDITOR"}),
         "denied and secret-shaped names removed from allowlist");
  expect(c.environment.denylist == bluxguard::default_env_denylist(), "default denylist applied");
  expect(bluxguard::is_secret_env_name("DB_PASSWORD"), "password suffix is secret");
  expect(!bluxguard::is_secret_env_name("LANG"), "LANG is not secret");
}

// ============================================================================
// Phase 6: Capability tokens
// ============================================================================

void test_token_in_memory_statuses() {
  bluxguard::InMemoryTokenAuthority authority;
  authority.add_valid("tok-a", "ref-a");
  authority.add_valid("tok-b", "ref-b");

  auto results = bluxguard::verify_tokens({"tok-a"}, {}, authority);
  expect(results.size() == 1 && results[0].valid && results[0].token_ref == "ref-a", "valid token");
  expect(bluxguard::summarize_token_status({"tok-a"}, results) == "valid", "status valid");

  results = bluxguard::verify_tokens({"tok-a", "tok-b"}, {"tok-b"}, authority);
  expect(!results[1].valid && results[1].reason_codes[0] == "token.revoked", "revoked token");
  expect(bluxguard::summarize_token_status({"tok-a", "tok-b"}, results) == "invalid", "mixed is invalid");

  results = bluxguard::verify_tokens({"tok-a"}, {"ref-a"}, authority);
  expect(!results[0].valid && results[0].reason_codes[0] == "token.revoked", "revoked by resolved reference");

  results = bluxguard::verify_tokens({"tok-unknown"}, {}, authority);
  expect(!results[0].valid && results[0].reason_codes[0] == "token.invalid", "unknown token invalid");

  results = bluxguard::verify_tokens({}, {}, authority);
  expect(results.size() == 1 && results[0].reason_codes[0] == "token.missing", "no token is missing");
  expect(bluxguard::summarize_token_status({}, results) == "missing", "status missing");
}

void test_token_authority_unavailable() {
  clear_events();
  bluxguard::InMemoryTokenAuthority authority;
  authority.add_valid("tok-a", "ref-a");
  authority.set_available(false);
  const auto results = bluxguard::verify_tokens({"tok-a"}, {}, authority);
  expect(results[0].authority_unavailable(), "unavailable flagged");
  expect(bluxguard::summarize_token_status({"tok-a"}, results) == "unavailable", "status unavailable");
  expect(count_events("token.verifier_unavailable") == 1, "degrade event emitted");
  expect(authority.calls() == 1, "authority consulted once");
}

void test_token_response_parsing() {
  auto v = bluxguard::parse_authority_response(
      "tok", R"({"status":"valid","id":"ref-9","reason_codes":"token.scoped","tier":3})");
  expect(v.valid && v.token_ref == "ref-9", "status=valid and id reference");
  expect(v.reason_codes == std::vector<std::string>({"token.scoped"}), "string reason code");
  expect(v.metadata["tier"] == "3", "scalar metadata kept");

  v = bluxguard::parse_authority_response("tok", R"({"state":"active"})");
  expect(v.valid && v.token_ref == "tok" && v.reason_codes[0] == "token.valid", "state=active defaults");

  for (const char* body : {R"({"valid":"false"})", R"({"valid":"no"})", R"({"valid":1})",
                           R"({"valid":{"ok":true}})"}) {
    v = bluxguard::parse_authority_response("tok", body);
    expect(!v.valid && v.reason_codes[0] == "token.invalid", std::string("non-boolean valid rejected: ") + body);
  }
  v = bluxguard::parse_authority_response("tok", R"({"valid":true})");
  expect(v.valid, "boolean true accepted");

  v = bluxguard::parse_authority_response("tok", "not json at all");
  expect(!v.valid && v.metadata["status"] == "unknown" && v.reason_codes[0] == "token.invalid",
         "non-JSON response is invalid");
}

void test_token_process_authority() {
  clear_events();
  const fs::path dir = fresh_dir("bluxguard_token_test");
  const std::string ok = write_script(
      dir, "ok.sh",
      "if [ \"$1\" != verify ] || [ \"$2\" != --token ]; then exit 64; fi\n"
      "echo \"{\\\"valid\\\": true, \\\"token_ref\\\": \\\"ref-$3\\\"}\"\n");
  const std::string denied = write_script(dir, "denied.sh", "echo denied >&2\nexit 3\n");
  const std::string slow = write_script(dir, "slow.sh", "sleep 5\n");

  bluxguard::ProcessTokenAuthority good(ok, 5000);
  auto v = good.verify("abc");
  expect(v.valid && v.token_ref == "ref-abc", "authority process response parsed");

  bluxguard::ProcessTokenAuthority failing(denied, 5000);
  v = failing.verify("abc");
  expect(!v.valid && v.reason_codes[0] == "token.verify_failed", "non-zero exit is verify_failed");
  expect(!v.authority_unavailable(), "verify_failed is not unavailability");

  bluxguard::ProcessTokenAuthority hanging(slow, 200);
  v = hanging.verify("abc");
  expect(v.authority_unavailable(), "timeout maps to unavailable");

  // Closing stdio early must not let the authority outlive its deadline.
  const std::string detached =
      write_script(dir, "detached.sh", "exec >/dev/null 2>&1\nsleep 5\n");
  bluxguard::ProcessTokenAuthority silent(detached, 200);
  const auto started = std::chrono::steady_clock::now();
  v = silent.verify("abc");
  const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started).count();
  expect(v.authority_unavailable(), "closed-stdio authority times out as unavailable");
  expect(waited < 2000, "closed-stdio authority bounded by deadline");

  bluxguard::ProcessTokenAuthority absent((dir / "no-such-verifier").string(), 1000);
  v = absent.verify("abc");
  expect(v.authority_unavailable(), "missing executable maps to unavailable");
  expect(count_events("token.verifier_unavailable") == 3, "one event per unavailable call");

  fs::remove_all(dir);
}

void test_token_process_authority_parallel() {
  const fs::path dir = fresh_dir("bluxguard_token_parallel_test");
  const std::string fast = write_script(dir, "fast.sh", "echo '{\"valid\": true}'\n");
  const std::string slow = write_script(dir, "slow.sh", "sleep 2\necho '{\"valid\": true}'\n");

  // A slow call forking concurrently must not hold a fast call's pipes open.
  std::atomic<bool> stop{false};
  std::atomic<int> slow_failures{0};
  std::thread background([&] {
    bluxguard::ProcessTokenAuthority lagging(slow, 10000);
    while (!stop.load()) {
      if (!lagging.verify("bg").valid) slow_failures.fetch_add(1);
    }
  });

  bluxguard::ProcessTokenAuthority quick(fast, 1000);
  int failures = 0;
  for (int i = 0; i < 60; ++i) {
    if (!quick.verify("fg-" + std::to_string(i)).valid) ++failures;
  }
  stop.store(true);
  background.join();

  expect(failures == 0, "fast authority never blocked by a concurrent slow one");
  expect(slow_failures.load() == 0, "slow authority unaffected by concurrent calls");
  fs::remove_all(dir);
}

void test_revocation_documents() {
  auto revoked = bluxguard::parse_revocations(value_of(R"(["a","b"])"));
  expect(revoked.size() == 2 && revoked.count("a") == 1, "array form");
  revoked = bluxguard::parse_revocations(value_of(R"({"revoked_tokens":["c"]})"));
  expect(revoked.size() == 1 && revoked.count("c") == 1, "object form");
  revoked = bluxguard::parse_revocations(value_of(R"({"other":1})"));
  expect(revoked.empty(), "unrelated object yields nothing");
}

// ============================================================================
// Phase 7: Guard receipts
// ============================================================================

void test_receipt_sign_and_verify() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  const auto result = engine.evaluate(basic_request({"tok-ok"}));
  expect(result.ok, "evaluation succeeds");
  expect(result.receipt.decision == bluxguard::Decision::allow, "valid token without report allows");
  expect(result.receipt.token_status == "valid", "token status valid");
  expect(result.receipt.capability_token_ref == "cap-ref-1", "token ref from authority");
  expect(result.receipt.signature_alg == "HMAC-SHA256", "signature algorithm");

  const auto obj = result.receipt.to_object();
  expect(result.receipt.signature_value ==
             bluxguard::hmac_sha256_hex("receipt-test-key",
                                        bluxguard::jsonlite::to_json(result.receipt.unsigned_object())),
         "signature covers canonical receipt minus signature");

  const auto verified = engine.verify(obj);
  expect(verified.ok && verified.reason == "ok", "receipt verifies");
}

void test_receipt_round_trip_through_text() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  const auto result = engine.evaluate(basic_request({"tok-ok"}));
  const std::string text = bluxguard::jsonlite::to_pretty_json(result.receipt.to_object());
  std::optional<bluxguard::jsonlite::JsonError> err;
  const auto parsed = bluxguard::jsonlite::parse(text, &err);
  expect(!err, "pretty receipt parses");
  expect(engine.verify(parsed).ok, "receipt verifies after a text round trip");
}

void test_receipt_tamper_detection() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  const auto obj = engine.evaluate(basic_request({"tok-ok"})).receipt.to_object();

  auto tampered = obj;
  auto& cons = std::get<bluxguard::jsonlite::Object>(tampered["constraints"].v);
  cons["timeout_s"] = 301;
  auto v = engine.verify(tampered);
  expect(!v.ok && v.reason == "signature_mismatch", "constraint edit breaks signature");

  auto missing = obj;
  missing.erase("decision");
  v = engine.verify(missing);
  expect(!v.ok && v.reason == "missing_fields", "missing field reported");

  auto bad_alg = obj;
  auto& sig = std::get<bluxguard::jsonlite::Object>(bad_alg["signature"].v);
  sig["alg"] = "HMAC-MD5";
  v = engine.verify(bad_alg);
  expect(!v.ok && v.reason == "invalid_signature_metadata", "wrong algorithm rejected");

  auto bad_enum = obj;
  bad_enum["decision"] = "MAYBE";
  v = engine.verify(bad_enum);
  expect(!v.ok && v.reason == "schema_violation", "structural violation reported");

  bluxguard::StaticKeyProvider other("another-key");
  bluxguard::GuardEngine other_engine(fx.schemas, fx.authority, other);
  v = other_engine.verify(obj);
  expect(!v.ok && v.reason == "signature_mismatch", "different key rejects");
}

void test_receipt_schema_rejection() {
  clear_events();
  GuardFixture fx;
  const fs::path dir = fresh_dir("bluxguard_reject_test");
  bluxguard::AuditLog audit((dir / "audit.jsonl").string());
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys, &audit);

  bluxguard::EvaluationRequest req;
  req.envelope = object_of(R"({"timeout_s":"soon","network":{"egress":"open"},"surprise":true})");
  req.discernment = object_of(R"({"risk_level":"extreme","requires_confirmation":"yes"})");
  req.tokens = {"tok-ok"};
  const auto result = engine.evaluate(req);
  expect(!result.ok && result.error_code == bluxguard::ErrorCode::schema_violation, "schema violation");
  expect(result.violations.size() == 5, "violations of both documents listed");
  expect(fx.authority.calls() == 0, "no token lookup before structure passes");
  expect(bluxguard::verify_chain((dir / "audit.jsonl").string()).status == "missing", "nothing audited");
  expect(count_events("receipt.rejected") == 1, "rejection event emitted");
  fs::remove_all(dir);
}

void test_receipt_token_sources() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);

  bluxguard::EvaluationRequest req;
  req.envelope = object_of(R"({"capability_token":"tok-ok"})");
  auto r = engine.evaluate(req).receipt;
  expect(r.token_status == "valid", "single capability_token honored");

  req.envelope = object_of(R"({"capability_tokens":["tok-ok","tok-bad"]})");
  r = engine.evaluate(req).receipt;
  expect(r.token_status == "invalid" && r.decision == bluxguard::Decision::block, "one bad token blocks");
  expect(contains(r.reason_codes, "token.expired"), "authority reason carried into receipt");

  req.tokens = {"tok-ok"};
  r = engine.evaluate(req).receipt;
  expect(r.token_status == "valid", "explicit tokens take precedence over envelope");

  bluxguard::EvaluationRequest bare;
  bare.envelope = object_of(R"({"capability_token_ref":"declared-ref"})");
  r = engine.evaluate(bare).receipt;
  expect(r.capability_token_ref == "declared-ref", "envelope reference used without tokens");
  expect(!r.trace_id.empty(), "trace id generated when absent");
}

void test_receipt_bindings_and_echo() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  bluxguard::EvaluationRequest req;
  req.envelope = object_of(
      R"({"trace_id":"trace-b","envelope_hash":"abc123","capability_refs":["cap-1","cap-2"]})");
  req.discernment = object_of(R"({"band":"low","posture":"Nominal","summary":"routine"})");
  req.tokens = {"tok-ok"};
  const auto result = engine.evaluate(req);
  expect(result.ok, "evaluation succeeds");
  const auto& b = result.receipt.bindings;
  expect(bluxguard::jsonlite::get_string(b, "trace_id") == "trace-b", "trace bound");
  expect(bluxguard::jsonlite::get_string(b, "envelope_hash") == "abc123", "envelope hash bound");
  expect(bluxguard::jsonlite::get_string_array(b, "capability_refs").size() == 2, "capability refs bound");
  const auto& d = result.receipt.discernment;
  expect(bluxguard::jsonlite::get_string(d, "risk_level") == "low", "band lowercased into risk level");
  expect(bluxguard::jsonlite::get_string(d, "posture") == "nominal", "posture echoed");
  expect(bluxguard::jsonlite::get_string(d, "summary") == "routine", "summary echoed");
}

void test_receipt_audit_entry() {
  GuardFixture fx;
  const fs::path dir = fresh_dir("bluxguard_receipt_audit_test");
  bluxguard::AuditLog audit((dir / "audit.jsonl").string(), (dir / "records").string());
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys, &audit);

  const auto result = engine.evaluate(basic_request({"tok-ok"}));
  expect(result.ok && result.audit_recorded, "receipt audited");

  const auto report = bluxguard::verify_chain((dir / "audit.jsonl").string());
  expect(report.status == "clean" && report.line_count == 1, "one clean audit line");

  const auto lines = read_lines(dir / "audit.jsonl");
  const auto entry = object_of(lines[0]);
  expect(bluxguard::jsonlite::get_string(entry, "action") == "guard.receipt.issued", "audit action");
  expect(bluxguard::jsonlite::get_string(entry, "correlation_id") == "trace-1", "correlated by trace");
  const auto* payload = bluxguard::jsonlite::find_object(entry, "payload");
  expect(payload != nullptr, "payload present");
  expect(bluxguard::jsonlite::get_string(*payload, "constraints_hash") ==
             bluxguard::constraints_hash(
                 bluxguard::jsonlite::to_json(result.receipt.constraints.to_json_object())),
         "constraints hash recorded");
  expect(audit.records()->find_by_action("guard.receipt.issued").size() == 1, "indexed in record store");
  fs::remove_all(dir);
}

void test_receipt_audit_unwritable_continues() {
  clear_events();
  GuardFixture fx;
  const fs::path dir = fresh_dir("bluxguard_audit_blocked_test");
  write_text(dir / "blocker", "not a directory");
  bluxguard::AuditLog audit((dir / "blocker" / "audit.jsonl").string());
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys, &audit);

  const auto result = engine.evaluate(basic_request({"tok-ok"}));
  expect(result.ok, "receipt still issued");
  expect(!result.audit_recorded, "audit failure reported");
  expect(audit.failure_count() == 1, "failure counted");
  expect(count_events("audit.append_failed") == 1, "append_failed event emitted");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 8: Audit chain
// ============================================================================

std::vector<bluxguard::AppendResult> append_steps(bluxguard::AuditLog& log, int n) {
  std::vector<bluxguard::AppendResult> out;
  for (int i = 0; i < n; ++i) {
    bluxguard::AuditEntry e;
    e.actor = "tester";
    e.action = "test.step";
    e.correlation_id = "corr-1";
    e.payload["i"] = i;
    out.push_back(log.append(e));
    expect(out.back().ok, "append " + std::to_string(i));
  }
  return out;
}

void test_audit_chain_recompute() {
  const fs::path dir = fresh_dir("bluxguard_chain_test");
  const std::string path = (dir / "audit.jsonl").string();
  bluxguard::AuditLog log(path);
  const auto results = append_steps(log, 5);

  const auto report = bluxguard::verify_chain(path);
  expect(report.status == "clean" && report.line_count == 5, "clean chain of 5");
  expect(report.digest == log.last_digest(), "independent recompute matches writer");
  expect(results.back().digest == report.digest, "append result carries running digest");
  expect(results[4].seq == 5, "sequence numbers are 1-based");

  const auto first = object_of(read_lines(path)[0]);
  expect(bluxguard::jsonlite::get_string(first, "prev").empty(), "chain seeded with empty prefix");
  fs::remove_all(dir);
}

void test_audit_chain_tamper_detection() {
  const fs::path dir = fresh_dir("bluxguard_chain_tamper_test");
  const fs::path path = dir / "audit.jsonl";
  {
    bluxguard::AuditLog log(path.string());
    append_steps(log, 5);
  }
  const std::string anchor = bluxguard::verify_chain(path.string()).digest;
  const auto original = read_lines(path);

  auto edited = original;
  const auto pos = edited[2].find("\"tester\"");
  edited[2].replace(pos, 8, "\"mallory\"");
  write_lines(path, edited);
  auto report = bluxguard::verify_chain(path.string());
  expect(report.status == "broken" && report.first_bad_line == 4, "edit detected at next line");
  expect(report.digest != anchor, "edit changes final digest");

  auto reordered = original;
  std::swap(reordered[1], reordered[2]);
  write_lines(path, reordered);
  report = bluxguard::verify_chain(path.string());
  expect(report.status == "broken" && report.first_bad_line == 2, "reorder detected");
  expect(report.digest != anchor, "reorder changes final digest");

  auto truncated = original;
  truncated.pop_back();
  write_lines(path, truncated);
  report = bluxguard::verify_chain(path.string());
  expect(report.status == "clean" && report.line_count == 4, "truncated prefix is self-consistent");
  expect(report.digest != anchor, "truncation visible against anchor");

  write_lines(path, original);
  expect(bluxguard::verify_chain(path.string()).digest == anchor, "restored log matches anchor");
  fs::remove_all(dir);
}

void test_audit_chain_missing_and_empty() {
  const fs::path dir = fresh_dir("bluxguard_chain_empty_test");
  expect(bluxguard::verify_chain((dir / "nope.jsonl").string()).status == "missing", "missing log");
  write_text(dir / "empty.jsonl", "");
  const auto report = bluxguard::verify_chain((dir / "empty.jsonl").string());
  expect(report.status == "empty" && report.line_count == 0 && report.digest.empty(), "empty log");
  fs::remove_all(dir);
}

void test_audit_append_requires_durable_write() {
  clear_events();
  // /dev/null accepts writes but rejects fsync, so the entry is never durable.
  bluxguard::AuditLog log("/dev/null");
  bluxguard::AuditEntry e;
  e.actor = "tester";
  e.action = "test.durable";
  const auto r = log.append(e);
  expect(!r.ok && r.error == bluxguard::ErrorCode::log_unavailable, "unsynced append reported unavailable");
  expect(r.message.find("fsync") != std::string::npos, "failure names the sync step");
  expect(log.failure_count() == 1, "failure counted");
  expect(count_events("audit.append_failed") == 1, "append_failed event emitted");
}

void test_audit_concurrent_appends() {
  const fs::path dir = fresh_dir("bluxguard_chain_concurrent_test");
  const std::string path = (dir / "audit.jsonl").string();
  bluxguard::AuditLog log(path);

  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        bluxguard::AuditEntry e;
        e.actor = "worker-" + std::to_string(t);
        e.action = "test.concurrent";
        e.correlation_id = "c";
        e.payload["i"] = i;
        if (!log.append(e).ok) ++failures;
      }
    });
  }
  for (auto& th : threads) th.join();

  expect(failures.load() == 0, "no append failures");
  const auto report = bluxguard::verify_chain(path);
  expect(report.status == "clean", "concurrent writers never fork the chain");
  expect(report.line_count == kThreads * kPerThread, "every entry present");
  expect(log.entry_count() == kThreads * kPerThread, "entry count matches");
  fs::remove_all(dir);
}

void test_audit_two_writers_resync() {
  const fs::path dir = fresh_dir("bluxguard_chain_resync_test");
  const std::string path = (dir / "audit.jsonl").string();
  bluxguard::AuditLog a(path);
  bluxguard::AuditLog b(path);
  append_steps(a, 1);
  append_steps(b, 1);
  const auto last = append_steps(a, 1);

  const auto report = bluxguard::verify_chain(path);
  expect(report.status == "clean" && report.line_count == 3, "interleaved writers keep one chain");
  expect(last.back().seq == 3, "writer resynced its sequence");
  expect(a.last_digest() == report.digest, "writer resynced its digest");
  fs::remove_all(dir);
}

void test_audit_correlation_from_environment() {
  const fs::path dir = fresh_dir("bluxguard_corr_test");
  bluxguard::AuditLog log((dir / "audit.jsonl").string());
  setenv("BLUXGUARD_CORRELATION_ID", "env-corr-42", 1);
  bluxguard::AuditEntry e;
  e.actor = "tester";
  e.action = "test.corr";
  const auto r1 = log.append(e);
  unsetenv("BLUXGUARD_CORRELATION_ID");
  const auto r2 = log.append(e);

  expect(bluxguard::jsonlite::get_string(object_of(r1.line), "correlation_id") == "env-corr-42",
         "correlation id from environment");
  const std::string generated = bluxguard::jsonlite::get_string(object_of(r2.line), "correlation_id");
  expect(generated.size() == 36, "fresh correlation id otherwise");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 9: Record store
// ============================================================================

void test_record_store_integrity() {
  const fs::path dir = fresh_dir("bluxguard_records_test");
  bluxguard::AuditLog log((dir / "audit.jsonl").string(), (dir / "records").string());
  const auto results = append_steps(log, 3);
  const bluxguard::RecordStore* store = log.records();
  expect(store != nullptr, "record store attached");
  expect(store->count() == 3, "every entry indexed");

  for (const auto& r : results) {
    expect(r.indexed, "append reports indexing");
    auto line = store->get(r.digest);
    expect(line.has_value() && *line == r.line, "record matches appended line");
  }
  expect(store->find_by_action("test.step").size() == 3, "query by action");
  expect(store->find_by_action("other").empty(), "unknown action empty");

  write_text(store->object_path(results[1].digest), results[1].line + " ");
  expect(!store->get(results[1].digest).has_value(), "corrupted record fails closed");
  expect(store->contains(results[1].digest), "object still present on disk");

  bluxguard::RecordStore direct((dir / "direct").string());
  std::string err;
  const bool stored =
      direct.put(results[0].line, bluxguard::RecordIndexEntry{1, bluxguard::hash_domain("", "x"), "a", 0}, &err);
  expect(!stored && !err.empty(), "line that does not hash to its key is refused");
  expect(!direct.put("x", bluxguard::RecordIndexEntry{1, "not-hex", "a", 0}, &err), "invalid key refused");
  fs::remove_all(dir);
}

// ============================================================================
// Phase 10: Trip rule engine
// ============================================================================

const char* kBurstRules = R"({"rules":[{"id":"net-burst","name":"Network burst","condition":
  {"type":"threshold","field":"network.remote_ips_count","op":"gt","value":5,"window_s":60}}]})";

const char* kBurstEvent = R"({"uid":"com.example","network":{"remote_ips_count":80}})";

void test_trip_window_triggers() {
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(value_of(kBurstRules)), keys);
  const auto event = object_of(kBurstEvent);
  for (int i = 0; i < 5; ++i) {
    const auto out = engine.process_event(event, 1000.0 + i * 10);
    expect(out.alerts.empty(), "below threshold: no trip (" + std::to_string(i) + ")");
  }
  const auto out = engine.process_event(event, 1050.0);
  expect(out.alerts.size() == 1 && out.incidents.size() == 1, "sixth event within 60s trips");
  expect(engine.window_size("com.example", "network.remote_ips_count") == 6, "window holds six");
}

void test_trip_window_expires() {
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(value_of(kBurstRules)), keys);
  const auto event = object_of(kBurstEvent);
  for (int i = 0; i < 5; ++i) engine.process_event(event, 1000.0 + i * 10);
  const auto out = engine.process_event(event, 1061.0);
  expect(out.alerts.empty(), "sixth event 61s after the first does not trip");
  expect(engine.window_size("com.example", "network.remote_ips_count") == 5, "oldest entry pruned");
}

void test_trip_window_keys() {
  const auto rules = value_of(R"({"rules":[{"id":"hits","condition":
      {"type":"threshold","field":"hits","op":"gte","value":100}}]})");
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(rules), keys);

  engine.process_event(object_of(R"({"uid":"z","hits":0})"), 10.0);
  engine.process_event(object_of(R"({"uid":"z","hits":""})"), 11.0);
  expect(engine.window_size("z", "hits") == 0, "falsy values are not recorded");
  engine.process_event(object_of(R"({"uid":"z","hits":3})"), 12.0);
  engine.process_event(object_of(R"({"uid":"y","hits":true})"), 12.0);
  engine.process_event(object_of(R"({"hits":{"n":1}})"), 12.0);
  expect(engine.window_size("z", "hits") == 1, "subject z counted");
  expect(engine.window_size("y", "hits") == 1, "subjects are isolated");
  expect(engine.window_size("<unknown>", "hits") == 1, "missing uid uses placeholder subject");
}

void test_trip_window_seconds_key() {
  const auto rules = value_of(R"({"rules":[{"id":"short","condition":
      {"type":"threshold","field":"hits","op":"gt","value":1,"window_s":5}}]})");
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(rules), keys);
  expect(engine.rules().rules[0].condition.window_s == 5.0, "window_s read");
  engine.process_event(object_of(R"({"uid":"s","hits":1})"), 100.0);
  auto out = engine.process_event(object_of(R"({"uid":"s","hits":1})"), 130.0);
  expect(out.alerts.empty(), "events 30s apart fall outside a 5s window");
  out = engine.process_event(object_of(R"({"uid":"s","hits":1})"), 132.0);
  expect(out.alerts.size() == 1, "two events within 5s trip");

  auto rule = bluxguard::parse_rule(value_of(
      R"({"id":"c","condition":{"type":"threshold","field":"f","value":1,"window_s":5,"window":60}})"));
  expect(!rule.valid && !rule.error.empty(), "conflicting window keys are malformed");
  rule = bluxguard::parse_rule(value_of(
      R"({"id":"c","condition":{"type":"threshold","field":"f","value":1,"window_s":30,"window":30}})"));
  expect(rule.valid && rule.condition.window_s == 30.0, "agreeing window keys accepted");
  rule = bluxguard::parse_rule(value_of(
      R"({"id":"c","condition":{"type":"threshold","field":"f","value":1,"window_s":0}})"));
  expect(!rule.valid, "non-positive window_s is malformed");
}

void test_trip_windows_released() {
  const auto rules = value_of(R"({"rules":[{"id":"hits","condition":
      {"type":"threshold","field":"hits","op":"gte","value":100,"window_s":10}}]})");
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(rules), keys);

  for (int i = 0; i < 50; ++i) {
    engine.process_event(object_of(R"({"uid":"quiet-)" + std::to_string(i) + R"(","hits":0})"), 100.0);
  }
  expect(engine.window_count() == 0, "subjects with nothing recorded hold no window");

  engine.process_event(object_of(R"({"uid":"a","hits":1})"), 100.0);
  engine.process_event(object_of(R"({"uid":"b","hits":1})"), 100.0);
  expect(engine.window_count() == 2, "recorded subjects keep their windows");

  engine.process_event(object_of(R"({"uid":"a","hits":0})"), 200.0);
  expect(engine.window_count() == 1, "window dropped once pruned to empty");
  expect(engine.window_size("a", "hits") == 0 && engine.window_size("b", "hits") == 1, "other subject untouched");
}

void test_trip_condition_tree() {
  const auto rules = value_of(R"({"rules":[
    {"id":"r-and","name":"exec with path","condition":{"type":"and","clauses":[
      {"type":"match","field":"event_type","value":"exec"},
      {"type":"exists","field":"proc.path"}]}},
    {"id":"r-or","name":"netcat","condition":{"type":"or","clauses":[
      {"type":"match","field":"proc.name","value":"nc"},
      {"type":"match","field":"proc.name","value":"ncat"}]}},
    {"id":"r-quiet","name":"no heartbeat","condition":
      {"type":"threshold","field":"heartbeat","op":"lt","value":1,"window":30}}]})");
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(rules), keys);

  auto out = engine.process_event(
      object_of(R"({"uid":"a","event_type":"exec","proc":{"path":"/bin/nc","name":"nc"},"heartbeat":true})"),
      100.0);
  expect(out.incidents.size() == 2, "and + or match");
  expect(bluxguard::jsonlite::get_string(out.incidents[0], "rule_id") == "r-and", "rule order kept");
  expect(bluxguard::jsonlite::get_string(out.incidents[1], "rule_id") == "r-or", "second rule");

  out = engine.process_event(object_of(R"({"uid":"b","event_type":"open","proc":{"name":"vim"},"heartbeat":1})"),
                             101.0);
  expect(out.alerts.empty(), "no rule matched: explicit no-trip");

  out = engine.process_event(object_of(R"({"uid":"a","event_type":"exec","proc":{"name":"ncat","path":null}})"),
                             200.0);
  expect(out.incidents.size() == 2, "or + lt threshold match");
  expect(bluxguard::jsonlite::get_string(out.incidents[0], "rule_id") == "r-or", "null path fails exists");
  expect(bluxguard::jsonlite::get_string(out.incidents[1], "rule_id") == "r-quiet", "empty window below 1");
}

void test_trip_malformed_rules() {
  clear_events();
  const auto rules = bluxguard::RuleSet::from_json(value_of(R"({"rules":[
    {"id":"good","condition":{"type":"exists","field":"uid"}},
    {"id":"bogus","condition":{"type":"bogus"}},
    {"id":"no-condition"},
    {"id":"no-value","condition":{"type":"threshold","field":"x"}},
    {"id":"empty-and","condition":{"type":"and","clauses":[]}},
    {"id":"bad-op","condition":{"type":"threshold","field":"x","value":1,"op":"approx"}}]})"));
  expect(rules.rules.size() == 6 && rules.valid_count() == 1, "only the good rule is valid");
  expect(count_events("trip.rule_malformed") == 5, "each malformed rule reported");

  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(rules, keys);
  const auto out = engine.process_event(object_of(R"({"uid":"u"})"), 1.0);
  expect(out.incidents.size() == 1, "malformed rules never match and never stop evaluation");
}

void test_trip_rules_file() {
  clear_events();
  const auto missing = bluxguard::RuleSet::load_file("/nonexistent/bluxguard/rules.json");
  expect(missing.rules.empty(), "missing rules file yields empty set");
  expect(count_events("trip.rules_missing") == 1, "missing file warned");

  const fs::path dir = fresh_dir("bluxguard_rules_test");
  write_text(dir / "rules.json", kBurstRules);
  const auto loaded = bluxguard::RuleSet::load_file((dir / "rules.json").string());
  expect(loaded.valid_count() == 1, "rules file loaded");
  expect(loaded.rules[0].condition.window_s == 60.0 && loaded.rules[0].condition.limit == 5.0,
         "threshold parameters parsed");
  fs::remove_all(dir);
}

void test_trip_alert_framing() {
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(value_of(kBurstRules)), keys);
  const auto event = object_of(kBurstEvent);
  bluxguard::TripOutcome out;
  for (int i = 0; i < 6; ++i) out = engine.process_event(event, 1000.5 + i);
  expect(out.alerts.size() == 1, "trip produced");

  const auto& incident = out.incidents[0];
  expect(bluxguard::jsonlite::get_string(incident, "rule_id") == "net-burst", "incident rule id");
  expect(bluxguard::jsonlite::get_string(incident, "rule_name") == "Network burst", "incident rule name");
  expect(bluxguard::jsonlite::get_u64(incident, "timestamp") == 1005, "timestamp is integer seconds");
  expect(bluxguard::jsonlite::get_string(incident, "uid") == "com.example", "incident uid");
  const auto* snapshot = bluxguard::jsonlite::find_object(incident, "event_snapshot");
  expect(snapshot && *snapshot == event, "event snapshot kept verbatim");
  const auto* meta = bluxguard::jsonlite::find_object(incident, "meta");
  expect(meta && bluxguard::jsonlite::get_string(*meta, "note") == "rule_triggered", "incident note");

  const std::string& alert = out.alerts[0];
  const auto dot = alert.find('.');
  expect(dot != std::string::npos, "alert is payload.tag");
  const auto payload = bluxguard::base64_decode(alert.substr(0, dot));
  expect(payload && *payload == bluxguard::jsonlite::to_json(incident), "payload is canonical incident");
  const auto tag = bluxguard::base64_decode(alert.substr(dot + 1));
  expect(tag && *tag == bluxguard::hmac_sha256("trip-key", *payload), "tag is raw HMAC of payload");

  const auto opened = bluxguard::open_compact_alert(alert, "trip-key");
  expect(opened.has_value() && *opened == incident, "alert verifies");
  expect(!bluxguard::open_compact_alert(alert, "wrong-key").has_value(), "wrong key rejected");
  std::string tampered = alert;
  tampered[0] = tampered[0] == 'e' ? 'f' : 'e';
  expect(!bluxguard::open_compact_alert(tampered, "trip-key").has_value(), "tampered alert rejected");
  expect(!bluxguard::open_compact_alert("no-dot", "trip-key").has_value(), "unframed alert rejected");
}

void test_trip_incident_sinks() {
  const fs::path dir = fresh_dir("bluxguard_incident_test");
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::AuditLog audit((dir / "audit.jsonl").string(), (dir / "records").string());
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(value_of(kBurstRules)), keys, &audit,
                               (dir / "incidents.jsonl").string());
  const auto event = object_of(kBurstEvent);
  bluxguard::TripOutcome out;
  for (int i = 0; i < 6; ++i) out = engine.process_event(event, 2000.0 + i);
  expect(out.incidents.size() == 1, "trip produced");

  const auto lines = read_lines(dir / "incidents.jsonl");
  expect(lines.size() == 1, "one incident line");
  const auto sep = lines[0].rfind("  ");
  const std::string canonical = lines[0].substr(0, sep);
  expect(canonical == bluxguard::jsonlite::to_json(out.incidents[0]), "incident line is canonical JSON");
  expect(lines[0].substr(sep + 2) == bluxguard::hmac_sha256_hex("trip-key", canonical),
         "incident line carries hex HMAC");
  expect(bluxguard::incident_log_line(out.incidents[0], "trip-key") == lines[0], "line helper agrees");

  const auto report = bluxguard::verify_chain((dir / "audit.jsonl").string());
  expect(report.status == "clean" && report.line_count == 1, "incident chained into audit log");
  expect(audit.records()->find_by_action("trip.incident").size() == 1, "incident indexed");
  fs::remove_all(dir);
}

void test_trip_malformed_events() {
  clear_events();
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(value_of(kBurstRules)), keys);
  auto out = engine.process_line("{not json");
  expect(out.malformed && !out.error.empty(), "invalid JSON line flagged");
  out = engine.process_line("[1,2,3]");
  expect(out.malformed, "non-object line flagged");
  out = engine.process_line(kBurstEvent);
  expect(!out.malformed && out.alerts.empty(), "valid line after malformed ones still processed");
  expect(count_events("trip.event_malformed") == 2, "malformed events reported");
}

void test_trip_concurrent_ingestion() {
  const auto rules = value_of(R"({"rules":[{"id":"exact","condition":
      {"type":"threshold","field":"hits","op":"eq","value":800,"window":3600}}]})");
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(rules), keys);
  const auto event = object_of(R"({"uid":"svc","hits":1})");

  constexpr int kThreads = 8;
  constexpr int kPerThread = 100;
  std::atomic<int> trips{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < kPerThread; ++i) {
        trips += static_cast<int>(engine.process_event(event, 5000.0).incidents.size());
      }
    });
  }
  for (auto& th : threads) th.join();

  expect(engine.window_size("svc", "hits") == kThreads * kPerThread, "no event lost or double counted");
  expect(trips.load() == 1, "exactly one event observed the exact count");
}

void test_channel_backpressure() {
  bluxguard::BoundedChannel<int> ch(2);
  expect(ch.try_push(1) && ch.try_push(2), "fills to capacity");
  expect(!ch.try_push(3), "full channel refuses non-blocking push");

  std::atomic<bool> pushed{false};
  std::thread producer([&]() {
    ch.push(3);
    pushed = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  expect(!pushed.load(), "producer blocks while full");
  expect(ch.pop().value_or(0) == 1, "fifo order");
  producer.join();
  expect(pushed.load(), "producer resumes after a pop");

  ch.close();
  expect(!ch.push(4), "push after close fails");
  expect(ch.pop().value_or(0) == 2 && ch.pop().value_or(0) == 3, "queued items drain after close");
  expect(!ch.pop().has_value(), "closed and empty");
}

void test_ingest_worker_pipeline() {
  const auto rules = value_of(R"({"rules":[{"id":"last","condition":
      {"type":"match","field":"n","value":49}}]})");
  bluxguard::StaticKeyProvider keys("trip-key");
  bluxguard::TripEngine engine(bluxguard::RuleSet::from_json(rules), keys);
  bluxguard::BoundedChannel<std::string> channel(4);

  std::vector<bluxguard::TripOutcome> outcomes;
  bluxguard::IngestWorker worker(engine, channel,
                                 [&](const bluxguard::TripOutcome& out) { outcomes.push_back(out); });
  worker.start();

  std::thread producer([&]() {
    for (int i = 0; i < 50; ++i) {
      if (i == 25) channel.push("{broken");
      channel.push("{\"uid\":\"w\",\"n\":" + std::to_string(i) + "}");
    }
    channel.push("   ");
    channel.close();
  });
  producer.join();
  worker.join();

  expect(outcomes.size() == 51, "every non-blank line produced an outcome");
  int malformed = 0;
  for (const auto& o : outcomes) malformed += o.malformed ? 1 : 0;
  expect(malformed == 1, "one malformed line");
  expect(outcomes.back().alerts.size() == 1, "outcomes delivered in channel order");
}

// ============================================================================
// Phase 11: Configuration, observability, process plumbing
// ============================================================================

void test_config_from_env() {
  clear_events();
  setenv("BLUXGUARD_LOG_DIR", "/tmp/bluxguard-cfg", 1);
  setenv("BLUXGUARD_VERIFIER", "/opt/reg/bin/blux-reg", 1);
  setenv("BLUXGUARD_VERIFIER_TIMEOUT_MS", "soon", 1);
  setenv("BLUXGUARD_NO_DISCERNMENT_DECISION", "WARN", 1);
  const auto cfg = bluxguard::GuardConfig::from_env();
  unsetenv("BLUXGUARD_LOG_DIR");
  unsetenv("BLUXGUARD_VERIFIER");
  unsetenv("BLUXGUARD_VERIFIER_TIMEOUT_MS");
  unsetenv("BLUXGUARD_NO_DISCERNMENT_DECISION");

  expect(cfg.audit_log_path() == "/tmp/bluxguard-cfg/audit.jsonl", "audit path under log dir");
  expect(cfg.incident_log_path() == "/tmp/bluxguard-cfg/incidents.jsonl", "incident path under log dir");
  expect(cfg.record_store_dir() == "/tmp/bluxguard-cfg/records", "records under log dir");
  expect(cfg.verifier == "/opt/reg/bin/blux-reg", "verifier override");
  expect(cfg.verifier_timeout_ms == 5000, "bad timeout keeps default");
  expect(cfg.warnings.size() == 1, "bad value warned");
  expect(count_events("config.invalid_value") == 1, "warning emitted as event");
  expect(cfg.no_discernment_decision == bluxguard::Decision::warn, "decision override");

  const auto defaults = bluxguard::GuardConfig::from_env();
  expect(defaults.verifier == "blux-reg" && defaults.warnings.empty(), "defaults when unset");
}

void test_key_provider_rotation() {
  bluxguard::EnvKeyProvider keys("BLUXGUARD_TEST_KEY", "BLUXGUARD_TEST_FALLBACK");
  unsetenv("BLUXGUARD_TEST_KEY");
  unsetenv("BLUXGUARD_TEST_FALLBACK");
  expect(keys.current_key() == bluxguard::kDevSecret, "development secret when unset");
  setenv("BLUXGUARD_TEST_FALLBACK", "fallback", 1);
  expect(keys.current_key() == "fallback", "fallback variable");
  setenv("BLUXGUARD_TEST_KEY", "k1", 1);
  expect(keys.current_key() == "k1", "primary variable");
  setenv("BLUXGUARD_TEST_KEY", "k2", 1);
  expect(keys.current_key() == "k2", "rotation without restart");
  unsetenv("BLUXGUARD_TEST_KEY");
  unsetenv("BLUXGUARD_TEST_FALLBACK");
}

void test_guard_stats() {
  auto& stats = bluxguard::global_guard_stats();
  stats.reset();
  bluxguard::emit_event(bluxguard::GuardEvent{"guard", "receipt.issued", "info", "t", {{"decision", "BLOCK"}}});
  bluxguard::emit_event(bluxguard::GuardEvent{"trip", "trip.triggered", "info", "", {}});
  expect(stats.receipts_issued.load() == 1 && stats.decisions_block.load() == 1, "receipt counters");
  expect(stats.trips.load() == 1, "trip counter");
  const std::string json = stats.to_json();
  expect(json.find("\"receipts_issued\":1") != std::string::npos, "stats serialized");

  const std::string ev = bluxguard::GuardEvent{"audit", "audit.append_failed", "error", "", {{"path", "/x"}}}.to_json();
  const auto parsed = object_of(ev);
  expect(bluxguard::jsonlite::get_string(parsed, "action") == "audit.append_failed", "event JSON action");
  expect(bluxguard::jsonlite::get_string(parsed, "level") == "error", "event JSON level");
}

void test_process_runner() {
  bluxguard::ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", "echo hi; echo err >&2; exit 7"};
  auto r = bluxguard::run_process(spec);
  expect(r.error == bluxguard::ErrorCode::none, "process spawned");
  expect(r.exit_code == 7 && r.stdout_text == "hi\n" && r.stderr_text == "err\n", "exit code and streams");

  spec.argv = {"-c", "sleep 5"};
  spec.timeout_ms = 100;
  r = bluxguard::run_process(spec);
  expect(r.timed_out && r.exit_code == 124 && r.error == bluxguard::ErrorCode::timeout, "deadline enforced");

  spec.command = "bluxguard-definitely-not-installed";
  r = bluxguard::run_process(spec);
  expect(r.error == bluxguard::ErrorCode::spawn_failed && r.exit_code == 127, "missing executable");
  expect(bluxguard::resolve_executable("sh").has_value(), "PATH lookup");
}

void test_version_manifest() {
  const auto m = bluxguard::version::current_manifest("9.9.9");
  const auto o = object_of(bluxguard::version::manifest_to_json(m));
  expect(bluxguard::jsonlite::get_string(o, "semver") == "9.9.9", "semver carried");
  expect(bluxguard::jsonlite::get_string(o, "signature_alg") == "HMAC-SHA256", "signature alg listed");
  expect(bluxguard::jsonlite::get_u64(o, "audit_log_version") == bluxguard::version::AUDIT_LOG_VERSION,
         "audit log version listed");
}

// ============================================================================
// Phase 12: End-to-end scenarios
// ============================================================================

void test_scenario_no_token_blocks() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  const auto r = engine.evaluate(basic_request({})).receipt;
  expect(r.token_status == "missing", "token status missing");
  expect(r.decision == bluxguard::Decision::block, "blocked");
  expect(contains(r.reason_codes, "token.missing"), "token.missing reason");
  expect(engine.verify(r.to_object()).ok, "blocked receipt is still signed");
}

void test_scenario_high_risk_requires_confirmation() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  auto req = basic_request({"tok-ok"});
  req.discernment = object_of(R"({"risk_level":"high"})");
  const auto r = engine.evaluate(req).receipt;
  expect(r.decision == bluxguard::Decision::require_confirm, "require confirm");
  expect(r.constraints.confirmation_required, "constraints demand confirmation");
  expect(contains(r.reason_codes, "risk.high"), "risk.high reason");
}

void test_scenario_critical_always_blocks() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  auto req = basic_request({"tok-ok"});
  req.discernment = object_of(R"({"risk_level":"critical","posture":"nominal"})");
  const auto r = engine.evaluate(req).receipt;
  expect(r.decision == bluxguard::Decision::block, "critical blocks with valid token");
  expect(contains(r.reason_codes, "risk.critical"), "risk.critical reason");
}

void test_scenario_unavailable_authority_fails_closed() {
  GuardFixture fx;
  fx.authority.set_available(false);
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  auto req = basic_request({"tok-ok"});
  req.discernment = object_of(R"({"risk_level":"low"})");
  const auto r = engine.evaluate(req).receipt;
  expect(r.token_status == "unavailable", "token status unavailable");
  expect(r.decision == bluxguard::Decision::block, "fail closed");
  expect(contains(r.reason_codes, "token.verifier_unavailable"), "unavailability reason");
}

void test_scenario_revoked_token_blocks() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  auto req = basic_request({"tok-ok"});
  req.revocations = {"tok-ok"};
  const auto r = engine.evaluate(req).receipt;
  expect(r.token_status == "invalid" && r.decision == bluxguard::Decision::block, "revoked blocks");
  expect(contains(r.reason_codes, "token.revoked"), "token.revoked reason");
}

void test_scenario_deterministic_evaluation() {
  GuardFixture fx;
  bluxguard::GuardEngine engine(fx.schemas, fx.authority, fx.keys);
  auto req = basic_request({"tok-ok"});
  req.discernment = object_of(R"({"risk_level":"medium","posture":"nominal"})");
  const auto a = engine.evaluate(req).receipt;
  const auto b = engine.evaluate(req).receipt;
  expect(a.decision == b.decision && a.reason_codes == b.reason_codes, "decision and reasons stable");
  expect(bluxguard::jsonlite::to_json(a.constraints.to_json_object()) ==
             bluxguard::jsonlite::to_json(b.constraints.to_json_object()),
         "constraints bit-identical");
  expect(a.receipt_id != b.receipt_id, "receipt ids unique");
}

}  // namespace

int main() {
  bluxguard::set_event_hook(&capture_event);
  std::cout << "=== BLUX Guard Test Suite ===\n";

  std::cout << "\n[Phase 1] Crypto primitives\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("hash domain separation", test_hash_domain_separation);
  run_test("HMAC-SHA256 RFC 4231 vector", test_hmac_rfc4231_vector);
  run_test("constant-time compare", test_constant_time_equals);
  run_test("base64 vectors", test_base64_vectors);
  run_test("random id shape", test_random_id_shape);

  std::cout << "\n[Phase 2] Canonical JSON and documents\n";
  run_test("canonical JSON", test_canonical_json);
  run_test("strict JSON parsing", test_json_strictness);
  run_test("dotted path + truthiness", test_dotted_path_and_truthiness);
  run_test("document limits", test_document_limits);

  std::cout << "\n[Phase 3] Schema validation\n";
  run_test("envelope violations listed", test_envelope_schema_violations);
  run_test("discernment violations listed", test_discernment_schema_violations);
  run_test("receipt required fields", test_receipt_schema_required_fields);

  std::cout << "\n[Phase 4] Decision mapping\n";
  run_test("risk table", test_decision_table);
  run_test("tokens fail closed", test_decision_tokens_fail_closed);
  run_test("confirmation + policy", test_decision_confirmation_and_policy);
  run_test("decision is pure", test_decision_is_pure);

  std::cout << "\n[Phase 5] Constraint resolution\n";
  run_test("paths + resource limits", test_constraints_paths_and_limits);
  run_test("constraints from integral float limits", test_constraints_integral_float_limits);
  run_test("default path only on allow", test_constraints_default_path_only_on_allow);
  run_test("environment deny wins", test_constraints_environment_deny_wins);

  std::cout << "\n[Phase 6] Capability tokens\n";
  run_test("in-memory statuses", test_token_in_memory_statuses);
  run_test("authority unavailable", test_token_authority_unavailable);
  run_test("authority response parsing", test_token_response_parsing);
  run_test("process authority (ok/failed/timeout/missing)", test_token_process_authority);
  run_test("process authority calls in parallel", test_token_process_authority_parallel);
  run_test("revocation documents", test_revocation_documents);

  std::cout << "\n[Phase 7] Guard receipts\n";
  run_test("sign + verify", test_receipt_sign_and_verify);
  run_test("text round trip", test_receipt_round_trip_through_text);
  run_test("tamper detection", test_receipt_tamper_detection);
  run_test("schema rejection", test_receipt_schema_rejection);
  run_test("token sources", test_receipt_token_sources);
  run_test("bindings + discernment echo", test_receipt_bindings_and_echo);
  run_test("audit entry", test_receipt_audit_entry);
  run_test("unwritable audit continues", test_receipt_audit_unwritable_continues);

  std::cout << "\n[Phase 8] Audit chain\n";
  run_test("chain recompute", test_audit_chain_recompute);
  run_test("tamper detection", test_audit_chain_tamper_detection);
  run_test("missing + empty", test_audit_chain_missing_and_empty);
  run_test("append requires durable write", test_audit_append_requires_durable_write);
  run_test("concurrent appends (8x25)", test_audit_concurrent_appends);
  run_test("two writers resync", test_audit_two_writers_resync);
  run_test("correlation id from env", test_audit_correlation_from_environment);

  std::cout << "\n[Phase 9] Record store\n";
  run_test("record store integrity", test_record_store_integrity);

  std::cout << "\n[Phase 10] Trip rule engine\n";
  run_test("window triggers", test_trip_window_triggers);
  run_test("window expires", test_trip_window_expires);
  run_test("window keys", test_trip_window_keys);
  run_test("window_s key", test_trip_window_seconds_key);
  run_test("drained windows released", test_trip_windows_released);
  run_test("condition tree", test_trip_condition_tree);
  run_test("malformed rules", test_trip_malformed_rules);
  run_test("rules file", test_trip_rules_file);
  run_test("alert framing", test_trip_alert_framing);
  run_test("incident sinks", test_trip_incident_sinks);
  run_test("malformed events", test_trip_malformed_events);
  run_test("concurrent ingestion (8x100)", test_trip_concurrent_ingestion);
  run_test("channel backpressure", test_channel_backpressure);
  run_test("ingest worker pipeline", test_ingest_worker_pipeline);

  std::cout << "\n[Phase 11] Config, observability, process\n";
  run_test("config from env", test_config_from_env);
  run_test("key provider rotation", test_key_provider_rotation);
  run_test("guard stats", test_guard_stats);
  run_test("process runner", test_process_runner);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Phase 12] Scenarios\n";
  run_test("no token blocks", test_scenario_no_token_blocks);
  run_test("high risk requires confirmation", test_scenario_high_risk_requires_confirmation);
  run_test("critical always blocks", test_scenario_critical_always_blocks);
  run_test("unavailable authority fails closed", test_scenario_unavailable_authority_fails_closed);
  run_test("revoked token blocks", test_scenario_revoked_token_blocks);
  run_test("deterministic evaluation", test_scenario_deterministic_evaluation);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
