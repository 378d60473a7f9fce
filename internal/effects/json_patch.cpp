#include "internal/effects/json_patch.hpp"

#include <algorithm>
#include <set>

#include "internal/expr/value.hpp"
#include "internal/util/errors.hpp"

namespace rulegraph::effects {

using expr::Value;
using util::EvaluationError;

namespace {

const std::set<std::string> kOps = {"add", "remove", "replace", "copy", "move", "test"};

const Value* Member(const google::protobuf::Struct& op, const char* name) {
  auto it = op.fields().find(name);
  return it == op.fields().end() ? nullptr : &it->second;
}

std::string StringMember(const google::protobuf::Struct& op, const char* name) {
  const Value* v = Member(op, name);
  return v && expr::IsString(*v) ? v->string_value() : std::string();
}

// Array index token: "0" or digits without a leading zero. Longer tokens
// than any repeated field can index are rejected.
bool ParseIndex(const std::string& token, std::size_t& out) {
  if (token.empty() || token.size() > 9 || (token.size() > 1 && token.front() == '0')) return false;
  if (!std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; })) return false;
  out = std::stoul(token);
  return true;
}

class Document {
 public:
  explicit Document(const google::protobuf::Struct& doc) {
    *root_.mutable_struct_value() = doc;
  }

  google::protobuf::Struct Result() const {
    return root_.struct_value();
  }

  Value Get(const std::string& pointer) const {
    const Value* v = Find(pointer);
    if (!v) throw EvaluationError("path not found: " + pointer);
    return *v;
  }

  bool Has(const std::string& pointer) const {
    return Find(pointer) != nullptr;
  }

  void Add(const std::string& pointer, Value value) {
    auto [parent, token] = Parent(pointer);
    if (expr::IsStruct(*parent)) {
      (*parent->mutable_struct_value()->mutable_fields())[token] = std::move(value);
      return;
    }
    auto*       list = parent->mutable_list_value()->mutable_values();
    std::size_t index = 0;
    if (token == "-") {
      index = static_cast<std::size_t>(list->size());
    } else if (!ParseIndex(token, index) || index > static_cast<std::size_t>(list->size())) {
      throw EvaluationError("array index out of range: " + pointer);
    }
    *list->Add() = std::move(value);
    for (int i = list->size() - 1; i > static_cast<int>(index); --i) list->SwapElements(i, i - 1);
  }

  void Remove(const std::string& pointer) {
    auto [parent, token] = Parent(pointer);
    if (expr::IsStruct(*parent)) {
      if (parent->mutable_struct_value()->mutable_fields()->erase(token) == 0) throw EvaluationError("path not found: " + pointer);
      return;
    }
    auto*       list = parent->mutable_list_value()->mutable_values();
    std::size_t index = 0;
    if (!ParseIndex(token, index) || index >= static_cast<std::size_t>(list->size())) {
      throw EvaluationError("array index out of range: " + pointer);
    }
    list->DeleteSubrange(static_cast<int>(index), 1);
  }

  void Replace(const std::string& pointer, Value value) {
    if (!Has(pointer)) throw EvaluationError("path not found: " + pointer);
    Remove(pointer);
    Add(pointer, std::move(value));
  }

 private:
  const Value* Find(const std::string& pointer) const {
    const Value* cur = &root_;
    for (const auto& token : expr::SplitPointer(pointer)) {
      if (expr::IsStruct(*cur)) {
        auto it = cur->struct_value().fields().find(token);
        if (it == cur->struct_value().fields().end()) return nullptr;
        cur = &it->second;
      } else if (expr::IsList(*cur)) {
        std::size_t index = 0;
        if (!ParseIndex(token, index) || index >= static_cast<std::size_t>(cur->list_value().values_size())) return nullptr;
        cur = &cur->list_value().values(static_cast<int>(index));
      } else {
        return nullptr;
      }
    }
    return cur;
  }

  // Container holding the last token; it must exist and be an object or array.
  std::pair<Value*, std::string> Parent(const std::string& pointer) {
    auto tokens = expr::SplitPointer(pointer);
    if (tokens.empty()) throw EvaluationError("cannot patch the document root");

    Value* cur = &root_;
    for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
      const auto& token = tokens[i];
      if (expr::IsStruct(*cur)) {
        auto* fields = cur->mutable_struct_value()->mutable_fields();
        auto  it     = fields->find(token);
        if (it == fields->end()) throw EvaluationError("path not found: " + pointer);
        cur = &it->second;
      } else if (expr::IsList(*cur)) {
        std::size_t index = 0;
        if (!ParseIndex(token, index) || index >= static_cast<std::size_t>(cur->list_value().values_size())) {
          throw EvaluationError("path not found: " + pointer);
        }
        cur = cur->mutable_list_value()->mutable_values(static_cast<int>(index));
      } else {
        throw EvaluationError("path not found: " + pointer);
      }
    }
    if (!expr::IsStruct(*cur) && !expr::IsList(*cur)) throw EvaluationError("parent is not a container: " + pointer);
    return {cur, tokens.back()};
  }

  Value root_;
};

} // namespace

void ValidatePatch(const google::protobuf::ListValue& patch) {
  for (int i = 0; i < patch.values_size(); ++i) {
    const auto  where = "patch operation " + std::to_string(i);
    const auto& entry = patch.values(i);
    if (!expr::IsStruct(entry)) throw EvaluationError(where + " is not an object");
    const auto& op = entry.struct_value();

    const auto kind = StringMember(op, "op");
    if (!kOps.contains(kind)) throw EvaluationError(where + ": unknown op '" + kind + "'");

    const Value* path = Member(op, "path");
    if (!path || !expr::IsString(*path)) throw EvaluationError(where + ": path must be a string");
    if (path->string_value().empty() || path->string_value().front() != '/') {
      throw EvaluationError(where + ": path must start with '/'");
    }

    if ((kind == "add" || kind == "replace" || kind == "test") && !Member(op, "value")) {
      throw EvaluationError(where + ": " + kind + " requires a value");
    }
    if (kind == "copy" || kind == "move") {
      const Value* from = Member(op, "from");
      if (!from || !expr::IsString(*from)) throw EvaluationError(where + ": " + kind + " requires from");
    }
  }
}

google::protobuf::Struct ApplyPatch(const google::protobuf::Struct& document, const google::protobuf::ListValue& patch) {
  ValidatePatch(patch);

  Document doc(document);
  for (const auto& entry : patch.values()) {
    const auto& op   = entry.struct_value();
    const auto  kind = StringMember(op, "op");
    const auto  path = StringMember(op, "path");

    if (kind == "add") {
      doc.Add(path, *Member(op, "value"));
    } else if (kind == "remove") {
      doc.Remove(path);
    } else if (kind == "replace") {
      doc.Replace(path, *Member(op, "value"));
    } else if (kind == "copy") {
      doc.Add(path, doc.Get(StringMember(op, "from")));
    } else if (kind == "move") {
      const auto from = StringMember(op, "from");
      if (path.rfind(from + "/", 0) == 0) throw EvaluationError("cannot move " + from + " into itself");
      Value v = doc.Get(from);
      doc.Remove(from);
      doc.Add(path, std::move(v));
    } else if (kind == "test") {
      if (!doc.Has(path) || !expr::DeepEquals(doc.Get(path), *Member(op, "value"))) {
        throw EvaluationError("test failed at " + path);
      }
    }
  }
  return doc.Result();
}

std::vector<std::string> ChangedFields(const google::protobuf::Struct& before, const google::protobuf::Struct& after) {
  std::set<std::string> changed;
  for (const auto& [key, value] : before.fields()) {
    auto it = after.fields().find(key);
    if (it == after.fields().end() || !expr::DeepEquals(value, it->second)) changed.insert(key);
  }
  for (const auto& [key, _] : after.fields()) {
    if (before.fields().count(key) == 0) changed.insert(key);
  }
  return {changed.begin(), changed.end()};
}

} // namespace rulegraph::effects
