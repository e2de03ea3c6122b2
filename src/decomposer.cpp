#include <ragrank/decomposer.hpp>

#include <ragrank/errors.hpp>
#include <ragrank/text_analyzer.hpp>

#include <algorithm>
#include <cmath>
#include <regex>
#include <unordered_set>

#include <json/json.h>

namespace ragrank {

namespace {

// Longer inputs skip the pattern rules (std::regex backtracks recursively).
constexpr size_t kMaxRuleQueryLength = 1024;

std::string Trim(std::string_view s) { return internal::TrimWhitespace(s); }

// Trim, collapse whitespace runs and drop trailing sentence punctuation.
std::string Clean(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  bool space = false;
  for (char c : s) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      space = !out.empty();
      continue;
    }
    if (space) out.push_back(' ');
    space = false;
    out.push_back(c);
  }
  while (!out.empty() && (out.back() == '?' || out.back() == '!' || out.back() == '.')) {
    out.pop_back();
  }
  return Trim(out);
}

const std::regex& ComparisonPattern() {
  static const std::regex re(
      R"(^(.+?)\s+(?:vs\.?|versus|compared to|compared with)\s+(.+?)(?:\s+(?:for|in terms of|regarding|in)\s+(.+))?$)",
      std::regex::icase);
  return re;
}

const std::regex& DifferencePattern() {
  static const std::regex re(
      R"(\bdifferences? between\s+(.+?)\s+and\s+(.+?)(?:\s+(?:for|in terms of|regarding|in)\s+(.+))?$)",
      std::regex::icase);
  return re;
}

const std::regex& AspectPattern() {
  static const std::regex re(
      R"(^(?:(.+?)\s+)?(?:for|regarding|in terms of)\s+(.+?)\s+and\s+(.+)$)",
      std::regex::icase);
  return re;
}

const std::regex& ConjunctionPattern() {
  static const std::regex re(
      R"(\s+(?:and also|and|or|also|as well as|in addition to|together with)\s+)",
      std::regex::icase);
  return re;
}

SubQuery RuleSubQuery(std::string text) {
  SubQuery sq;
  sq.text = std::move(text);
  sq.origin = SubQueryOrigin::kRule;
  return sq;
}

// Two compared terms, each carrying the shared context when present.
std::vector<SubQuery> CompareTerms(const std::smatch& m) {
  std::string context = m.size() > 3 && m[3].matched ? Trim(m[3].str()) : std::string();
  std::vector<SubQuery> out;
  for (size_t g = 1; g <= 2; ++g) {
    std::string term = Trim(m[g].str());
    if (term.empty()) continue;
    out.push_back(RuleSubQuery(context.empty() ? term : term + " " + context));
  }
  return out;
}

std::vector<SubQuery> RuleCandidates(const std::string& query, size_t min_fragment) {
  std::smatch m;

  if (std::regex_search(query, m, DifferencePattern())) return CompareTerms(m);
  if (std::regex_match(query, m, ComparisonPattern())) return CompareTerms(m);

  if (std::regex_match(query, m, AspectPattern())) {
    const std::string base = m[1].matched ? Trim(m[1].str()) : std::string();
    std::vector<SubQuery> out;
    for (size_t g = 2; g <= 3; ++g) {
      std::string aspect = Trim(m[g].str());
      if (aspect.empty()) continue;
      out.push_back(RuleSubQuery(base.empty() ? aspect : base + " " + aspect));
    }
    return out;
  }

  std::vector<SubQuery> parts;
  std::sregex_token_iterator it(query.begin(), query.end(), ConjunctionPattern(), -1);
  for (std::sregex_token_iterator end; it != end; ++it) {
    std::string part = Trim(it->str());
    if (part.size() >= min_fragment) parts.push_back(RuleSubQuery(std::move(part)));
  }
  // A single surviving fragment is not a decomposition.
  if (parts.size() < 2) parts.clear();
  return parts;
}

bool ParseJsonArray(std::string_view response, size_t max_sub_queries,
                    std::vector<SubQuery>* out) {
  const size_t open = response.find('[');
  const size_t close = response.rfind(']');
  if (open == std::string_view::npos || close == std::string_view::npos || close <= open) {
    return false;
  }

  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errs;
  if (!reader->parse(response.data() + open, response.data() + close + 1, &root, &errs) ||
      !root.isArray()) {
    return false;
  }

  for (const auto& item : root) {
    if (out->size() >= max_sub_queries) break;
    SubQuery sq;
    sq.origin = SubQueryOrigin::kLLM;
    if (item.isString()) {
      sq.text = Clean(item.asString());
    } else if (item.isObject() && item["text"].isString()) {
      sq.text = Clean(item["text"].asString());
      if (item["weight"].isNumeric()) sq.weight = item["weight"].asDouble();
    } else {
      continue;
    }
    if (!sq.text.empty()) out->push_back(std::move(sq));
  }
  return !out->empty();
}

std::string StripListMarker(std::string line) {
  static const std::regex numbering(R"(^\s*(?:\d+[.):]|[-*+])\s*)");
  static constexpr std::string_view kBullet = "\xE2\x80\xA2";
  line = std::regex_replace(line, numbering, "", std::regex_constants::format_first_only);
  if (std::string_view(line).substr(0, kBullet.size()) == kBullet) {
    line.erase(0, kBullet.size());
  }
  line = Trim(line);
  while (line.size() >= 2 && (line.front() == '"' || line.front() == '\'') &&
         line.back() == line.front()) {
    line = Trim(std::string_view(line).substr(1, line.size() - 2));
  }
  return line;
}

}  // namespace

rocksdb::Status ParseDecompositionStrategy(std::string_view name,
                                           DecompositionStrategy* out) {
  const std::string key = internal::FoldCase(Trim(name));
  if (key == "none") {
    *out = DecompositionStrategy::kNone;
  } else if (key == "rule" || key == "rule_based" || key == "rules") {
    *out = DecompositionStrategy::kRuleBased;
  } else if (key == "llm") {
    *out = DecompositionStrategy::kLLM;
  } else {
    return ConfigurationError("unknown decomposition strategy: " + std::string(name));
  }
  return rocksdb::Status::OK();
}

std::string_view DecompositionStrategyName(DecompositionStrategy strategy) {
  switch (strategy) {
    case DecompositionStrategy::kNone:
      return "none";
    case DecompositionStrategy::kRuleBased:
      return "rule";
    case DecompositionStrategy::kLLM:
      return "llm";
  }
  return "unknown";
}

std::vector<SubQuery> ParseSubQueryResponse(std::string_view response,
                                            size_t max_sub_queries) {
  std::vector<SubQuery> out;
  if (max_sub_queries == 0) return out;
  if (ParseJsonArray(response, max_sub_queries, &out)) return out;
  out.clear();

  size_t start = 0;
  while (start <= response.size() && out.size() < max_sub_queries) {
    size_t end = response.find('\n', start);
    if (end == std::string_view::npos) end = response.size();
    std::string line = Trim(response.substr(start, end - start));
    start = end + 1;

    if (line.empty() || line.back() == ':') continue;
    line = Clean(StripListMarker(std::move(line)));
    if (line.empty()) continue;

    SubQuery sq;
    sq.text = std::move(line);
    sq.origin = SubQueryOrigin::kLLM;
    out.push_back(std::move(sq));
  }
  return out;
}

// ---------------------------------------------------------------------------
// QueryDecomposer
// ---------------------------------------------------------------------------

QueryDecomposer::QueryDecomposer(const DecomposerOptions& opt,
                                 std::shared_ptr<const SubQueryGenerator> generator)
    : opt_(opt), generator_(std::move(generator)) {}

rocksdb::Status QueryDecomposer::Validate() const {
  if (opt_.max_sub_queries == 0) {
    return ConfigurationError("max_sub_queries must be >= 1");
  }
  return rocksdb::Status::OK();
}

std::vector<SubQuery> QueryDecomposer::Decompose(std::string_view query) const {
  if (opt_.strategy == DecompositionStrategy::kNone) {
    return {RuleSubQuery(std::string(query))};
  }

  if (opt_.strategy == DecompositionStrategy::kLLM && generator_) {
    GenerationResult r = generator_->Generate(query, opt_.max_sub_queries);
    if (r.success) {
      for (auto& sq : r.sub_queries) {
        sq.origin = SubQueryOrigin::kLLM;
        if (!std::isfinite(sq.weight) || sq.weight <= 0.0) sq.weight = 1.0;
      }
      std::vector<SubQuery> out = Finalize(std::move(r.sub_queries));
      if (!out.empty()) return out;
    }
  }

  return DecomposeWithRules(query);
}

std::vector<SubQuery> QueryDecomposer::DecomposeWithRules(std::string_view query) const {
  const std::string cleaned = Clean(query);
  std::vector<SubQuery> out;
  if (cleaned.size() <= kMaxRuleQueryLength) {
    out = Finalize(RuleCandidates(cleaned, opt_.min_fragment_length));
  }
  if (out.empty()) out.push_back(RuleSubQuery(std::string(query)));
  return out;
}

std::vector<SubQuery> QueryDecomposer::Finalize(std::vector<SubQuery> candidates) const {
  std::vector<SubQuery> out;
  std::unordered_set<std::string> seen;
  const size_t limit = std::max<size_t>(opt_.max_sub_queries, 1);
  for (auto& sq : candidates) {
    if (out.size() >= limit) break;
    sq.text = Clean(sq.text);
    if (sq.text.empty()) continue;
    if (!seen.insert(internal::FoldCase(sq.text)).second) continue;
    out.push_back(std::move(sq));
  }
  return out;
}

}  // namespace ragrank
