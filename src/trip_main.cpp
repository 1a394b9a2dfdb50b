// bluxguard_trip - Trip rule engine over a stdin event stream.
//
// One JSON event object per line in; per line out, one compact alert per
// triggered rule, or "OK". Malformed lines are reported on stderr and skipped.

#include <iostream>
#include <string>

#include "bluxguard/audit.hpp"
#include "bluxguard/channel.hpp"
#include "bluxguard/config.hpp"
#include "bluxguard/trip_engine.hpp"
#include "bluxguard/version.hpp"

namespace {

constexpr std::size_t kChannelCapacity = 256;

void print_usage() {
  std::cerr << "usage: bluxguard_trip [--rules <file>] [--version]\n"
               "  events are read from stdin, one JSON object per line\n";
}

}  // namespace

int main(int argc, char** argv) {
  auto config = bluxguard::GuardConfig::from_env();
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--rules" && i + 1 < argc) {
      config.rules_path = argv[++i];
    } else if (arg == "--version") {
      std::cout << bluxguard::version::manifest_to_json(bluxguard::version::current_manifest()) << "\n";
      return 0;
    } else {
      print_usage();
      return 1;
    }
  }

  bluxguard::EnvKeyProvider keys("BLUXGUARD_TRIP_SECRET", "BLUXGUARD_RECEIPT_SECRET");
  bluxguard::AuditLog audit(config.audit_log_path(), config.record_store_dir());
  bluxguard::RuleSet rules = bluxguard::RuleSet::load_file(config.rules_path);
  std::cerr << "[trip] rules loaded: " << rules.rules.size() << " (" << rules.valid_count()
            << " valid) from " << config.rules_path << "\n";
  std::cerr << "[trip] incidents: " << config.incident_log_path() << "\n";

  bluxguard::TripEngine engine(std::move(rules), keys, &audit, config.incident_log_path());
  bluxguard::BoundedChannel<std::string> channel(kChannelCapacity);

  // The worker is the only writer to stdout, so output order follows input order.
  bluxguard::IngestWorker worker(engine, channel, [](const bluxguard::TripOutcome& out) {
    if (out.malformed) {
      std::cerr << "[trip] skipping malformed event: " << out.error << "\n";
      return;
    }
    if (out.alerts.empty()) {
      std::cout << "OK" << std::endl;
      return;
    }
    for (const auto& alert : out.alerts) std::cout << alert << "\n";
    std::cout.flush();
  });
  worker.start();

  std::string line;
  while (std::getline(std::cin, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    if (!channel.push(std::move(line))) break;
    line.clear();
  }
  channel.close();
  worker.join();
  return 0;
}
