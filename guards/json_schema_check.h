#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace llmguard {

// Structural check of a JSON value against a JSON Schema subset:
// type, enum, required, properties, additionalProperties, items,
// minLength/maxLength, minimum/maximum, minItems/maxItems. Unknown keywords
// are ignored. Each problem is reported as "<path>: <message>" with the path
// rooted at "$".
void CheckAgainstSchema(const nlohmann::json& value, const nlohmann::json& schema,
                        std::vector<std::string>* problems);

// Parses `schema_text` and `document_text`, then runs CheckAgainstSchema.
// Parse failures are appended to `problems` like any other finding; this
// function never throws.
void CheckDocumentAgainstSchema(const std::string& document_text,
                                const std::string& schema_text,
                                std::vector<std::string>* problems);

}  // namespace llmguard
