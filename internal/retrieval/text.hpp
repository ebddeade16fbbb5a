#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ragturn::retrieval {

// Strips quote markers, normalizes spacing and trims.
std::string CleanPassageText(std::string_view text);

/*
  Lowercases, applies Unicode NFKD, and splits on anything outside
  [a-z0-9]. Accented letters fold to their base letter because their
  combining marks become separators. Tokens of length <= 1 and stopwords
  are dropped; order and duplicates are kept.
*/
std::vector<std::string> Tokenize(std::string_view text);

bool IsStopword(std::string_view token);

// Unicode lowercase under the root locale; UTF-8 in and out.
std::string LowerCase(std::string_view text);

std::size_t CodePointCount(std::string_view text);

// At most the first `count` code points of `text`, never splitting a sequence.
std::string TruncateCodePoints(std::string_view text, std::size_t count);

// Collapses every whitespace run to a single space and trims.
std::string CompactWhitespace(std::string_view text);

/*
  Excerpt around the earliest occurrence of any term in `text`
  (case-insensitive), or the head of the text when nothing matches.
*/
std::string BuildSnippet(std::string_view text, const std::vector<std::string>& terms);

} // namespace ragturn::retrieval
