#pragma once

#include <cstddef>
#include <string>

namespace llmguard {

// Number of UTF-8 code points; continuation bytes are not counted.
std::size_t CodePointCount(const std::string& text);

// ASCII lower-casing; other bytes pass through unchanged.
std::string ToLower(std::string value);

}  // namespace llmguard
