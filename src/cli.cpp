#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "bluxguard/audit.hpp"
#include "bluxguard/config.hpp"
#include "bluxguard/document.hpp"
#include "bluxguard/jsonlite.hpp"
#include "bluxguard/receipt.hpp"
#include "bluxguard/schema.hpp"
#include "bluxguard/token_verifier.hpp"
#include "bluxguard/version.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRejected = 2;

void print_usage() {
  std::cerr << "usage:\n"
               "  bluxguard evaluate --request-envelope <file> [--token <tok>]...\n"
               "                     [--discernment <file>] [--revocations <file>]\n"
               "  bluxguard verify-receipt --receipt <file>\n"
               "  bluxguard version\n";
}

int fail(int exit_code, const std::string& error, const std::string& message,
         const std::vector<bluxguard::SchemaIssue>& violations = {}) {
  bluxguard::jsonlite::Object o;
  o["error"] = error;
  if (!message.empty()) o["message"] = message;
  o["violations"] = bluxguard::schema_issues_to_json(violations);
  std::cerr << bluxguard::jsonlite::to_json(o) << "\n";
  return exit_code;
}

// Unreadable files are I/O errors; anything that was read but is not an
// acceptable JSON object is rejected input.
std::optional<bluxguard::jsonlite::Value> load_document(const std::string& path, const std::string& what,
                                                        int* exit_code) {
  auto doc = bluxguard::load_json_file(path);
  if (!doc.ok()) {
    const bool io = doc.error == bluxguard::ErrorCode::missing_input;
    *exit_code = fail(io ? kExitUsage : kExitRejected, bluxguard::to_string(doc.error),
                      what + ": " + doc.message);
    return std::nullopt;
  }
  return doc.value;
}

std::optional<bluxguard::jsonlite::Object> load_object(const std::string& path, const std::string& what,
                                                       int* exit_code) {
  auto value = load_document(path, what, exit_code);
  if (!value) return std::nullopt;
  if (!value->is_object()) {
    *exit_code = fail(kExitRejected, bluxguard::to_string(bluxguard::ErrorCode::schema_violation),
                      what + " must be a JSON object");
    return std::nullopt;
  }
  return value->as_object();
}

int cmd_evaluate(int argc, char** argv) {
  std::string envelope_path, discernment_path, revocations_path;
  std::vector<std::string> tokens;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--request-envelope" && i + 1 < argc)
      envelope_path = argv[++i];
    else if (arg == "--token" && i + 1 < argc)
      tokens.push_back(argv[++i]);
    else if (arg == "--discernment" && i + 1 < argc)
      discernment_path = argv[++i];
    else if (arg == "--revocations" && i + 1 < argc)
      revocations_path = argv[++i];
    else
      return fail(kExitUsage, "usage", "unexpected argument: " + arg);
  }
  if (envelope_path.empty()) return fail(kExitUsage, "usage", "--request-envelope <file> required");

  int exit_code = kExitOk;
  bluxguard::EvaluationRequest request;
  auto envelope = load_object(envelope_path, "request envelope", &exit_code);
  if (!envelope) return exit_code;
  request.envelope = std::move(*envelope);
  request.tokens = std::move(tokens);

  if (!discernment_path.empty()) {
    auto discernment = load_object(discernment_path, "discernment report", &exit_code);
    if (!discernment) return exit_code;
    request.discernment = std::move(*discernment);
  }
  if (!revocations_path.empty()) {
    auto revocations = load_document(revocations_path, "revocations", &exit_code);
    if (!revocations) return exit_code;
    request.revocations = bluxguard::parse_revocations(*revocations);
  }

  const auto config = bluxguard::GuardConfig::from_env();
  const bluxguard::SchemaRegistry schemas;
  bluxguard::EnvKeyProvider keys("BLUXGUARD_RECEIPT_SECRET");
  bluxguard::ProcessTokenAuthority authority(config.verifier, config.verifier_timeout_ms);
  bluxguard::AuditLog audit(config.audit_log_path(), config.record_store_dir());
  bluxguard::GuardEngine engine(schemas, authority, keys, &audit,
                                bluxguard::DecisionPolicy{config.no_discernment_decision});

  const auto result = engine.evaluate(request);
  if (!result.ok) {
    return fail(kExitRejected, bluxguard::to_string(result.error_code), result.message, result.violations);
  }
  std::cout << bluxguard::jsonlite::to_pretty_json(result.receipt.to_object()) << "\n";
  return kExitOk;
}

int cmd_verify_receipt(int argc, char** argv) {
  std::string receipt_path;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--receipt" && i + 1 < argc)
      receipt_path = argv[++i];
    else
      return fail(kExitUsage, "usage", "unexpected argument: " + arg);
  }
  if (receipt_path.empty()) return fail(kExitUsage, "usage", "--receipt <file> required");

  int exit_code = kExitOk;
  auto receipt = load_object(receipt_path, "receipt", &exit_code);
  if (!receipt) return exit_code;

  const auto config = bluxguard::GuardConfig::from_env();
  const bluxguard::SchemaRegistry schemas;
  bluxguard::EnvKeyProvider keys("BLUXGUARD_RECEIPT_SECRET");
  bluxguard::ProcessTokenAuthority authority(config.verifier, config.verifier_timeout_ms);
  bluxguard::GuardEngine engine(schemas, authority, keys);

  const auto result = engine.verify(*receipt);
  std::cout << result.to_json() << "\n";
  return result.ok ? kExitOk : kExitRejected;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return kExitUsage;
  }
  const std::string cmd = argv[1];

  if (cmd == "evaluate") return cmd_evaluate(argc, argv);
  if (cmd == "verify-receipt") return cmd_verify_receipt(argc, argv);
  if (cmd == "version") {
    std::cout << bluxguard::version::manifest_to_json(bluxguard::version::current_manifest()) << "\n";
    return kExitOk;
  }
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    print_usage();
    return kExitOk;
  }
  print_usage();
  return kExitUsage;
}
