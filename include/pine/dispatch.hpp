#pragma once

// pine/dispatch.hpp: JSON request front end over pine/operations.hpp.
//
// REQUEST:  {"op":"<name>","caller":"<owner>", ...operation fields}
// RESPONSE: {"ok":true|false, ...} as one compact JSON line.
//
// Mutations answer with OperationResult::to_json(). Queries answer with
// {"ok":true,"result":<value>}. Malformed requests answer with error_code
// json_parse_error (bad JSON, unknown op, missing or mistyped field) and
// never touch the state.

#include <string>
#include <vector>

#include "pine/jsonlite.hpp"
#include "pine/state.hpp"
#include "pine/types.hpp"

namespace pine {

struct DispatchResult {
  Status status;
  std::string response;  // always a complete JSON object
};

DispatchResult apply_operation(AnalyticsState& state, const jsonlite::Object& request);
DispatchResult apply_operation_json(AnalyticsState& state, const std::string& line);

// Every op name apply_operation accepts, sorted.
std::vector<std::string> supported_operations();

}  // namespace pine
