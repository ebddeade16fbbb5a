#include "text.hpp"

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/unistr.h>

#include <algorithm>
#include <array>
#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace ragturn::retrieval {

namespace {

constexpr std::array<std::string_view, 33> kStopwords = {
    "a",  "an",   "and",  "are", "as",   "at",   "be",    "by",   "for",  "from",  "how",
    "i",  "if",   "in",   "is",  "it",   "of",   "on",    "or",   "that", "the",   "this",
    "to", "was",  "what", "when", "where", "which", "who", "why", "with", "you", "your",
};

constexpr std::size_t kSnippetWindow     = 280;
constexpr std::size_t kSnippetLeadIn     = 90;
constexpr std::size_t kSnippetFallback   = 220;
constexpr std::string_view kNbspUtf8     = "\xC2\xA0";

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Moves a byte offset back to the start of the UTF-8 sequence it falls in.
std::size_t AlignToCodePoint(std::string_view text, std::size_t pos) {
  while (pos > 0 && pos < text.size() && IsContinuationByte(text[pos])) --pos;
  return pos;
}

std::string ReplaceAll(std::string_view text, std::string_view from, std::string_view to) {
  std::string out;
  out.reserve(text.size());
  std::size_t start = 0;
  for (;;) {
    auto pos = text.find(from, start);
    if (pos == std::string_view::npos) {
      out.append(text.substr(start));
      return out;
    }
    out.append(text.substr(start, pos - start));
    out.append(to);
    start = pos + from.size();
  }
}

std::string StripQuoteMarkers(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool line_start = true;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (line_start && text[i] == '>') {
      // "> " and ">" both go; a swallowed newline still starts a new line
      if (i + 1 < text.size() && IsSpace(text[i + 1])) {
        ++i;
        line_start = text[i] == '\n';
      } else {
        line_start = false;
      }
      continue;
    }
    out.push_back(text[i]);
    line_start = text[i] == '\n';
  }
  return out;
}

icu::UnicodeString FromUtf8(std::string_view text) {
  return icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
}

const icu::Normalizer2& Nfkd() {
  UErrorCode              status     = U_ZERO_ERROR;
  const icu::Normalizer2* normalizer = icu::Normalizer2::getNFKDInstance(status);
  if (U_FAILURE(status) || normalizer == nullptr) {
    throw util::InvalidState("icu_unavailable", std::string("ICU NFKD normalizer unavailable: ") + u_errorName(status));
  }
  return *normalizer;
}

} // namespace

std::string CleanPassageText(std::string_view text) {
  auto cleaned = StripQuoteMarkers(text);
  cleaned      = ReplaceAll(cleaned, kNbspUtf8, " ");
  cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\r'), cleaned.end());

  // collapse [ \t]+ to one space and \n{3,} to a blank line
  std::string out;
  out.reserve(cleaned.size());
  std::size_t newline_run = 0;
  for (char c : cleaned) {
    if (c == ' ' || c == '\t') {
      newline_run = 0;
      if (out.empty() || out.back() != ' ') out.push_back(' ');
      continue;
    }
    if (c == '\n') {
      if (++newline_run > 2) continue;
    } else {
      newline_run = 0;
    }
    out.push_back(c);
  }
  return util::Trim(out);
}

std::vector<std::string> Tokenize(std::string_view text) {
  icu::UnicodeString unicode = FromUtf8(text);
  unicode.toLower(icu::Locale::getRoot());

  UErrorCode         status     = U_ZERO_ERROR;
  icu::UnicodeString normalized = Nfkd().normalize(unicode, status);
  if (U_FAILURE(status)) {
    throw util::InvalidArgument("normalization_failed", std::string("NFKD normalization failed: ") + u_errorName(status));
  }

  std::vector<std::string> tokens;
  std::string              current;
  auto                     flush = [&] {
    if (current.size() > 1 && !IsStopword(current)) tokens.push_back(current);
    current.clear();
  };

  for (int32_t i = 0; i < normalized.length(); ++i) {
    const char16_t c = normalized.charAt(i);
    if ((c >= u'a' && c <= u'z') || (c >= u'0' && c <= u'9')) {
      current.push_back(static_cast<char>(c));
    } else {
      flush();
    }
  }
  flush();
  return tokens;
}

bool IsStopword(std::string_view token) {
  return std::find(kStopwords.begin(), kStopwords.end(), token) != kStopwords.end();
}

std::string LowerCase(std::string_view text) {
  auto unicode = FromUtf8(text);
  unicode.toLower(icu::Locale::getRoot());
  std::string out;
  unicode.toUTF8String(out);
  return out;
}

std::size_t CodePointCount(std::string_view text) {
  const auto unicode = FromUtf8(text);
  return static_cast<std::size_t>(unicode.countChar32());
}

std::string TruncateCodePoints(std::string_view text, std::size_t count) {
  const auto    unicode = FromUtf8(text);
  const int32_t limit   = static_cast<int32_t>(std::min<std::size_t>(count, static_cast<std::size_t>(unicode.length())));
  std::string   out;
  unicode.tempSubString(0, unicode.moveIndex32(0, limit)).toUTF8String(out);
  return out;
}

std::string CompactWhitespace(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (char c : text) {
    if (IsSpace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out.push_back(' ');
    pending_space = false;
    out.push_back(c);
  }
  return out;
}

std::string BuildSnippet(std::string_view text, const std::vector<std::string>& terms) {
  const auto  lower     = util::ToLowerAscii(text);
  std::size_t first_hit = std::string::npos;
  for (const auto& term : terms) {
    if (term.empty()) continue;
    auto idx = lower.find(term);
    if (idx != std::string::npos && (first_hit == std::string::npos || idx < first_hit)) first_hit = idx;
  }

  if (first_hit == std::string::npos) {
    auto compact = CompactWhitespace(text);
    if (compact.size() <= kSnippetFallback) return compact;
    return compact.substr(0, AlignToCodePoint(compact, kSnippetFallback)) + "...";
  }

  const auto start = AlignToCodePoint(text, first_hit > kSnippetLeadIn ? first_hit - kSnippetLeadIn : 0);
  const auto end   = AlignToCodePoint(text, std::min(text.size(), start + kSnippetWindow));

  std::string snippet;
  if (start > 0) snippet += "...";
  snippet += CompactWhitespace(text.substr(start, end - start));
  if (end < text.size()) snippet += "...";
  return snippet;
}

} // namespace ragturn::retrieval
