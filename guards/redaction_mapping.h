#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace llmguard {

// Ordered placeholder -> original value mapping produced by one Redact call.
// The caller owns it; nothing inside llmguard keeps a copy, so dropping the
// object erases the values.
class RedactionMapping {
 public:
  using Entry = std::pair<std::string, std::string>;

  // Returns false and leaves the mapping unchanged if `placeholder` is
  // already present.
  bool Insert(const std::string& placeholder, const std::string& original);

  // Original value for `placeholder`, or nullptr.
  const std::string* Find(const std::string& placeholder) const;
  bool Contains(const std::string& placeholder) const { return Find(placeholder) != nullptr; }

  const std::vector<Entry>& Entries() const { return entries_; }
  std::size_t Size() const { return entries_.size(); }
  bool Empty() const { return entries_.empty(); }
  void Clear();

  bool operator==(const RedactionMapping& other) const { return entries_ == other.entries_; }
  bool operator!=(const RedactionMapping& other) const { return !(*this == other); }

 private:
  std::vector<Entry> entries_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace llmguard
