#include "guards/json_schema_check.h"

#include "guards/text_util.h"

#include <cmath>
#include <cstddef>

namespace llmguard {
namespace {

using json = nlohmann::json;

const char* TypeName(const json& value) {
  if (value.is_object()) return "object";
  if (value.is_array()) return "array";
  if (value.is_string()) return "string";
  if (value.is_boolean()) return "boolean";
  if (value.is_null()) return "null";
  if (value.is_number_integer()) return "integer";
  if (value.is_number()) return "number";
  return "unknown";
}

bool TypeMatches(const json& value, const std::string& type) {
  if (type == "object") return value.is_object();
  if (type == "array") return value.is_array();
  if (type == "string") return value.is_string();
  if (type == "boolean") return value.is_boolean();
  if (type == "null") return value.is_null();
  if (type == "number") return value.is_number();
  if (type == "integer") {
    if (value.is_number_integer()) {
      return true;
    }
    if (value.is_number_float()) {
      double d = value.get<double>();
      return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
  }
  // Unknown type names do not constrain.
  return true;
}

std::string ChildPath(const std::string& path, const std::string& key) {
  return path + "." + key;
}

std::string IndexPath(const std::string& path, std::size_t index) {
  return path + "[" + std::to_string(index) + "]";
}

void Report(const std::string& path, const std::string& message,
            std::vector<std::string>* problems) {
  problems->push_back(path + ": " + message);
}

bool CheckType(const json& value, const json& type_spec, const std::string& path,
               std::vector<std::string>* problems) {
  std::string expected;
  bool ok = false;
  if (type_spec.is_string()) {
    expected = type_spec.get<std::string>();
    ok = TypeMatches(value, expected);
  } else if (type_spec.is_array()) {
    for (const auto& t : type_spec) {
      if (!t.is_string()) {
        continue;
      }
      if (!expected.empty()) {
        expected += "|";
      }
      expected += t.get<std::string>();
      ok = ok || TypeMatches(value, t.get<std::string>());
    }
    if (expected.empty()) {
      return true;
    }
  } else {
    return true;
  }
  if (!ok) {
    Report(path, std::string("expected ") + expected + ", got " + TypeName(value), problems);
  }
  return ok;
}

void CheckNode(const json& value, const json& schema, const std::string& path,
               std::vector<std::string>* problems) {
  if (schema.is_boolean()) {
    if (!schema.get<bool>()) {
      Report(path, "schema forbids any value here", problems);
    }
    return;
  }
  if (!schema.is_object()) {
    return;
  }

  if (schema.contains("type") && !CheckType(value, schema["type"], path, problems)) {
    // Remaining keywords assume the declared type.
    return;
  }

  if (schema.contains("enum") && schema["enum"].is_array()) {
    bool found = false;
    for (const auto& candidate : schema["enum"]) {
      if (candidate == value) {
        found = true;
        break;
      }
    }
    if (!found) {
      Report(path, "value is not one of the enumerated values", problems);
    }
  }

  if (value.is_string()) {
    std::size_t length = CodePointCount(value.get<std::string>());
    if (schema.contains("minLength") && schema["minLength"].is_number_unsigned() &&
        length < schema["minLength"].get<std::size_t>()) {
      Report(path, "string shorter than minLength " + schema["minLength"].dump(), problems);
    }
    if (schema.contains("maxLength") && schema["maxLength"].is_number_unsigned() &&
        length > schema["maxLength"].get<std::size_t>()) {
      Report(path, "string longer than maxLength " + schema["maxLength"].dump(), problems);
    }
  }

  if (value.is_number()) {
    double number = value.get<double>();
    if (schema.contains("minimum") && schema["minimum"].is_number() &&
        number < schema["minimum"].get<double>()) {
      Report(path, "value below minimum " + schema["minimum"].dump(), problems);
    }
    if (schema.contains("maximum") && schema["maximum"].is_number() &&
        number > schema["maximum"].get<double>()) {
      Report(path, "value above maximum " + schema["maximum"].dump(), problems);
    }
  }

  if (value.is_array()) {
    if (schema.contains("minItems") && schema["minItems"].is_number_unsigned() &&
        value.size() < schema["minItems"].get<std::size_t>()) {
      Report(path, "array has fewer than " + schema["minItems"].dump() + " items", problems);
    }
    if (schema.contains("maxItems") && schema["maxItems"].is_number_unsigned() &&
        value.size() > schema["maxItems"].get<std::size_t>()) {
      Report(path, "array has more than " + schema["maxItems"].dump() + " items", problems);
    }
    if (schema.contains("items") && (schema["items"].is_object() || schema["items"].is_boolean())) {
      for (std::size_t i = 0; i < value.size(); ++i) {
        CheckNode(value[i], schema["items"], IndexPath(path, i), problems);
      }
    }
  }

  if (value.is_object()) {
    if (schema.contains("required") && schema["required"].is_array()) {
      for (const auto& key : schema["required"]) {
        if (key.is_string() && !value.contains(key.get<std::string>())) {
          Report(path, "required key missing: '" + key.get<std::string>() + "'", problems);
        }
      }
    }
    const json* properties = nullptr;
    if (schema.contains("properties") && schema["properties"].is_object()) {
      properties = &schema["properties"];
    }
    const json* additional = schema.contains("additionalProperties")
                                 ? &schema["additionalProperties"]
                                 : nullptr;
    for (auto it = value.begin(); it != value.end(); ++it) {
      if (properties && properties->contains(it.key())) {
        CheckNode(it.value(), (*properties)[it.key()], ChildPath(path, it.key()), problems);
      } else if (additional && additional->is_boolean() && !additional->get<bool>()) {
        Report(path, "unexpected key '" + it.key() + "'", problems);
      } else if (additional && additional->is_object()) {
        CheckNode(it.value(), *additional, ChildPath(path, it.key()), problems);
      }
    }
  }
}

}  // namespace

void CheckAgainstSchema(const json& value, const json& schema,
                        std::vector<std::string>* problems) {
  if (!problems) {
    return;
  }
  CheckNode(value, schema, "$", problems);
}

void CheckDocumentAgainstSchema(const std::string& document_text,
                                const std::string& schema_text,
                                std::vector<std::string>* problems) {
  if (!problems) {
    return;
  }
  json schema;
  try {
    schema = json::parse(schema_text);
  } catch (const json::exception& ex) {
    problems->push_back(std::string("Invalid schema JSON: ") + ex.what());
    return;
  }
  if (!schema.is_object() && !schema.is_boolean()) {
    problems->push_back("Invalid schema JSON: expected an object or boolean schema");
    return;
  }
  json document;
  try {
    document = json::parse(document_text);
  } catch (const json::exception& ex) {
    problems->push_back(std::string("Output is not valid JSON: ") + ex.what());
    return;
  }
  CheckAgainstSchema(document, schema, problems);
}

}  // namespace llmguard
