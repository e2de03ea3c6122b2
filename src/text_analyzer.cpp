#include <ragrank/text_analyzer.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>

namespace ragrank::internal {

namespace {

inline bool IsAsciiAlnum(uint8_t c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Ligatures U+FB00-FB06, encoded 0xEF 0xAC 0x80..0x86
constexpr const char* kLigatures[7] = {"ff", "fi", "fl", "ffi", "ffl", "st", "st"};

// Sorted for binary search
constexpr std::string_view kStopwords[] = {
    "a",    "about", "an",   "are",  "as",    "at",   "be",   "by",
    "can",  "do",    "does", "for",  "from",  "how",  "i",    "in",
    "is",   "it",    "its",  "of",   "on",    "or",   "that", "the",
    "this", "to",    "was",  "what", "when",  "where", "which", "who",
    "why",  "will",  "with"};

}  // namespace

std::string FoldCase(std::string_view input) {
  std::string out;
  out.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    const uint8_t c = static_cast<uint8_t>(input[i]);
    if (c < 0x80) {
      out.push_back(c >= 'A' && c <= 'Z' ? static_cast<char>(c + 0x20)
                                         : static_cast<char>(c));
      ++i;
      continue;
    }

    // Latin-1 uppercase (except multiplication sign 0x97)
    if (c == 0xC3 && i + 1 < input.size()) {
      const uint8_t n = static_cast<uint8_t>(input[i + 1]);
      out.push_back(static_cast<char>(c));
      if (n >= 0x80 && n <= 0x9E && n != 0x97) {
        out.push_back(static_cast<char>(n + 0x20));
      } else {
        out.push_back(static_cast<char>(n));
      }
      i += 2;
      continue;
    }

    if (c == 0xEF && i + 2 < input.size() &&
        static_cast<uint8_t>(input[i + 1]) == 0xAC) {
      const uint8_t n = static_cast<uint8_t>(input[i + 2]);
      if (n >= 0x80 && n <= 0x86) {
        out.append(kLigatures[n - 0x80]);
        i += 3;
        continue;
      }
    }

    out.push_back(static_cast<char>(c));
    ++i;
  }
  return out;
}

std::string TrimWhitespace(std::string_view input) {
  constexpr std::string_view kSpace = " \t\n\r\f\v";
  const size_t b = input.find_first_not_of(kSpace);
  if (b == std::string_view::npos) return {};
  const size_t e = input.find_last_not_of(kSpace);
  return std::string(input.substr(b, e - b + 1));
}

bool IsStopword(std::string_view term) {
  return std::binary_search(std::begin(kStopwords), std::end(kStopwords), term);
}

std::vector<std::string> AnalyzeText(std::string_view text, bool drop_stopwords) {
  const std::string folded = FoldCase(text);
  std::vector<std::string> terms;

  std::string current;
  auto flush = [&]() {
    if (current.empty()) return;
    if (!drop_stopwords || !IsStopword(current)) {
      terms.push_back(std::move(current));
    }
    current.clear();
  };

  for (char ch : folded) {
    const uint8_t c = static_cast<uint8_t>(ch);
    if (c >= 0x80 || IsAsciiAlnum(c)) {
      current.push_back(ch);
    } else {
      flush();
    }
  }
  flush();
  return terms;
}

}  // namespace ragrank::internal
