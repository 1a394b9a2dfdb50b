#pragma once

// bluxguard/process.hpp - Bounded child-process execution.
//
// Used to reach the external capability-token authority. The call is bounded
// in time (the child's process group is killed at the deadline) and in output
// (stdout/stderr are capped), so a hung or chatty authority cannot stall an
// evaluation.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bluxguard/types.hpp"

namespace bluxguard {

struct ProcessSpec {
  std::string command;            // absolute path, or a name resolved via PATH
  std::vector<std::string> argv;  // arguments after argv[0]
  std::string cwd;
  std::uint64_t timeout_ms{5000};
  std::size_t max_output_bytes{64 * 1024};
};

struct ProcessResult {
  int exit_code{0};
  bool timed_out{false};
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  std::string stdout_text;
  std::string stderr_text;
  // spawn_failed when the executable is missing or fork/pipe fail; timeout
  // when the deadline expired. exit_code is 124 on timeout.
  ErrorCode error{ErrorCode::none};
  std::string error_message;
};

// Search PATH for an executable name. Names containing '/' are checked as-is.
std::optional<std::string> resolve_executable(const std::string& name);

ProcessResult run_process(const ProcessSpec& spec);

}  // namespace bluxguard
