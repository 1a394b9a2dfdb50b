#pragma once

// bluxguard/document.hpp - Bounded loading of untrusted JSON input.

#include <cstddef>
#include <optional>
#include <string>

#include "bluxguard/jsonlite.hpp"
#include "bluxguard/types.hpp"

namespace bluxguard {

// Envelopes, reports, receipts, rule files and single events are all far
// below this; anything larger is rejected before parsing.
inline constexpr std::size_t kMaxDocumentBytes = 1 * 1024 * 1024;

struct LoadedDocument {
  std::optional<jsonlite::Value> value;
  ErrorCode error{ErrorCode::none};
  std::string message;

  bool ok() const { return value.has_value(); }
};

// missing_input when the file cannot be read, quota_exceeded above the cap,
// json_parse_error / json_duplicate_key on malformed text.
LoadedDocument load_json_file(const std::string& path, std::size_t max_bytes = kMaxDocumentBytes);
LoadedDocument parse_json_document(const std::string& text, std::size_t max_bytes = kMaxDocumentBytes);

}  // namespace bluxguard
