#include "guards/redaction_mapping.h"

namespace llmguard {

bool RedactionMapping::Insert(const std::string& placeholder, const std::string& original) {
  if (index_.count(placeholder) > 0) {
    return false;
  }
  index_.emplace(placeholder, entries_.size());
  entries_.emplace_back(placeholder, original);
  return true;
}

const std::string* RedactionMapping::Find(const std::string& placeholder) const {
  auto it = index_.find(placeholder);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].second;
}

void RedactionMapping::Clear() {
  entries_.clear();
  index_.clear();
}

}  // namespace llmguard
