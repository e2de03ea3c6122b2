#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ragrank::internal {

/**
 * Fold text for term matching: ASCII A-Z -> a-z, Latin-1 uppercase letters
 * (UTF-8 0xC3 0x80..0x9E) to lowercase, and the common Latin ligatures
 * (U+FB00..FB06) to their letter pairs. Other bytes pass through unchanged.
 */
std::string FoldCase(std::string_view input);

/** Copy of input without leading/trailing ASCII whitespace. */
std::string TrimWhitespace(std::string_view input);

/** True for a small fixed set of English function words. */
bool IsStopword(std::string_view term);

/**
 * Split text into index terms.
 *
 * Text is case-folded, then split on every ASCII byte that is not a letter or
 * digit. Multi-byte UTF-8 sequences are kept inside terms. Stopwords are
 * dropped when drop_stopwords is set.
 */
std::vector<std::string> AnalyzeText(std::string_view text, bool drop_stopwords = true);

}  // namespace ragrank::internal
