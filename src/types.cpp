#include <ragrank/types.hpp>

namespace ragrank {

std::string_view AdapterName(AdapterKind kind) {
  switch (kind) {
    case AdapterKind::kSemantic:
      return "semantic";
    case AdapterKind::kLexical:
      return "lexical";
  }
  return "unknown";
}

std::string_view MetricName(NativeMetric metric) {
  switch (metric) {
    case NativeMetric::kCosine:
      return "cosine";
    case NativeMetric::kL2:
      return "l2";
    case NativeMetric::kDot:
      return "dot";
    case NativeMetric::kUnknownRange:
      return "unknown_range";
  }
  return "unknown_range";
}

bool MatchesFilter(const Chunk& chunk, const MetadataFilter& filter) {
  for (const auto& [key, value] : filter) {
    if (key == kDocumentIdFilterKey) {
      if (chunk.source_document_id != value) return false;
      continue;
    }
    auto it = chunk.metadata.find(key);
    if (it == chunk.metadata.end() || it->second != value) return false;
  }
  return true;
}

bool RankedList::Append(std::string chunk_id, double raw_score,
                        double normalised_score) {
  if (ids_.count(chunk_id)) return false;
  ids_.insert(chunk_id);

  ScoredResult r;
  r.chunk_id = std::move(chunk_id);
  r.raw_score = raw_score;
  r.normalised_score = normalised_score;
  r.rank = items_.size() + 1;
  r.source.adapter = adapter_;
  items_.push_back(std::move(r));
  return true;
}

void RankedList::SetSubQueryIndex(size_t index) {
  for (auto& item : items_) {
    item.source.sub_query_index = index;
  }
}

void RankedList::Truncate(size_t n) {
  while (items_.size() > n) {
    ids_.erase(items_.back().chunk_id);
    items_.pop_back();
  }
}

}  // namespace ragrank
