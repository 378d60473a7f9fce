#pragma once

#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

namespace rulegraph::effects {

/*
  RFC 6902 JSON Patch over protobuf Struct documents.

  Operations: add, remove, replace, copy, move, test. Pointers use the
  ~0 / ~1 escapes; "-" appends to an array.
*/

// Throws util::EvaluationError for the first malformed operation.
void ValidatePatch(const google::protobuf::ListValue& patch);

// Applies the patch to a copy of document. Throws util::EvaluationError
// when an operation cannot be applied or a test fails.
google::protobuf::Struct ApplyPatch(const google::protobuf::Struct& document, const google::protobuf::ListValue& patch);

// Sorted top-level keys whose values differ between the documents.
std::vector<std::string> ChangedFields(const google::protobuf::Struct& before, const google::protobuf::Struct& after);

} // namespace rulegraph::effects
