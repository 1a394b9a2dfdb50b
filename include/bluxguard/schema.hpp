#pragma once

// bluxguard/schema.hpp - Versioned structural contracts for guard documents.
//
// The three contracts (request envelope, discernment report, guard receipt)
// are embedded JSON Schema documents. The validator implements the subset of
// draft 2020-12 those contracts use:
//   type, required, properties, additionalProperties, enum, const, items,
//   minItems, minimum, minLength, uniqueItems.
//
// A SchemaRegistry is built once at startup and passed by reference to every
// component that validates. It holds no mutable state after construction, so
// concurrent validate() calls are safe.
//
// INVARIANT: validate() reports every failing field, not just the first. A
// node whose "type" check fails is not descended into, so one wrong type
// yields one issue rather than a cascade.

#include <map>
#include <string>
#include <vector>

#include "bluxguard/jsonlite.hpp"
#include "bluxguard/types.hpp"

namespace bluxguard {

enum class Contract {
  request_envelope,
  discernment_report,
  guard_receipt,
};

inline constexpr const char* kRequestEnvelopeSchemaId = "blux://contracts/request_envelope.schema.json";
inline constexpr const char* kDiscernmentSchemaId = "blux://contracts/discernment_report.schema.json";
inline constexpr const char* kReceiptSchemaId = "blux://contracts/guard_receipt.schema.json";

std::string contract_name(Contract c);

class SchemaRegistry {
 public:
  SchemaRegistry();

  std::vector<SchemaIssue> validate(Contract contract, const jsonlite::Value& document) const;

  // Canonical schema text, for `--print-schema` style tooling and tests.
  std::string schema_json(Contract contract) const;

 private:
  std::map<Contract, jsonlite::Object> schemas_;
};

}  // namespace bluxguard
