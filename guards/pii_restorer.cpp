#include "guards/pii_restorer.h"

#include <unordered_set>

namespace llmguard {
namespace {

bool IsUpper(char c) { return c >= 'A' && c <= 'Z'; }
bool IsDigit(char c) { return c >= '0' && c <= '9'; }

}  // namespace

std::string PIIRestorer::MakePlaceholder(const std::string& label, std::size_t index) {
  return "<<" + label + "_" + std::to_string(index) + ">>";
}

std::size_t PIIRestorer::PlaceholderLengthAt(const std::string& text, std::size_t pos) {
  if (pos + 2 > text.size() || text[pos] != '<' || text[pos + 1] != '<') {
    return 0;
  }
  std::size_t body_begin = pos + 2;
  std::size_t j = body_begin;
  while (j < text.size() && (IsUpper(text[j]) || IsDigit(text[j]) || text[j] == '_')) {
    ++j;
  }
  if (j + 2 > text.size() || text[j] != '>' || text[j + 1] != '>') {
    return 0;
  }
  if (j == body_begin || !IsUpper(text[body_begin]) || !IsDigit(text[j - 1])) {
    return 0;
  }
  std::size_t k = j;
  while (k > body_begin && IsDigit(text[k - 1])) {
    --k;
  }
  // Need "_" between label and index, and a non-empty label before it.
  if (k - 1 <= body_begin || text[k - 1] != '_') {
    return 0;
  }
  return j + 2 - pos;
}

std::string PIIRestorer::Restore(const std::string& text, const RedactionMapping& mapping) {
  if (mapping.Empty()) {
    return text;
  }
  std::string out;
  out.reserve(text.size());
  std::size_t copied = 0;
  std::size_t pos = text.find("<<");
  while (pos != std::string::npos) {
    std::size_t len = PlaceholderLengthAt(text, pos);
    if (len == 0) {
      pos = text.find("<<", pos + 1);
      continue;
    }
    const std::string* original = mapping.Find(text.substr(pos, len));
    if (original) {
      out.append(text, copied, pos - copied);
      out += *original;
      copied = pos + len;
    }
    pos = text.find("<<", pos + len);
  }
  out.append(text, copied, std::string::npos);
  return out;
}

std::vector<std::string> PIIRestorer::FindUnresolvedPlaceholders(const std::string& text,
                                                                 const RedactionMapping& mapping) {
  std::vector<std::string> unresolved;
  std::unordered_set<std::string> seen;
  std::size_t pos = text.find("<<");
  while (pos != std::string::npos) {
    std::size_t len = PlaceholderLengthAt(text, pos);
    if (len == 0) {
      pos = text.find("<<", pos + 1);
      continue;
    }
    std::string token = text.substr(pos, len);
    if (!mapping.Contains(token) && seen.insert(token).second) {
      unresolved.push_back(std::move(token));
    }
    pos = text.find("<<", pos + len);
  }
  return unresolved;
}

}  // namespace llmguard
