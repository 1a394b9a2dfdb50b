#include "bluxguard/document.hpp"

#include <fstream>

namespace bluxguard {

LoadedDocument parse_json_document(const std::string& text, std::size_t max_bytes) {
  LoadedDocument doc;
  if (text.size() > max_bytes) {
    doc.error = ErrorCode::quota_exceeded;
    doc.message = "document exceeds " + std::to_string(max_bytes) + " bytes";
    return doc;
  }
  std::optional<jsonlite::JsonError> err;
  doc.value = jsonlite::parse_value(text, &err);
  if (err) {
    doc.value.reset();
    doc.error = err->code == "json_duplicate_key" ? ErrorCode::json_duplicate_key
                                                  : ErrorCode::json_parse_error;
    doc.message = err->message;
  }
  return doc;
}

LoadedDocument load_json_file(const std::string& path, std::size_t max_bytes) {
  LoadedDocument doc;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    doc.error = ErrorCode::missing_input;
    doc.message = "cannot read " + path;
    return doc;
  }
  // Read one byte past the cap so oversize input is detected without
  // loading all of it.
  std::string text;
  text.resize(max_bytes + 1);
  ifs.read(text.data(), static_cast<std::streamsize>(text.size()));
  text.resize(static_cast<std::size_t>(ifs.gcount()));
  if (ifs.bad()) {
    doc.error = ErrorCode::missing_input;
    doc.message = "read error on " + path;
    return doc;
  }
  return parse_json_document(text, max_bytes);
}

}  // namespace bluxguard
