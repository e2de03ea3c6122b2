#include <ragrank/fusion.hpp>

#include <ragrank/errors.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace ragrank {

rocksdb::Status FusionEngine::Validate() const {
  if (!std::isfinite(k_rrf_) || k_rrf_ <= 0.0) {
    return ConfigurationError("k_rrf must be a finite value > 0, got " +
                              std::to_string(k_rrf_));
  }
  return rocksdb::Status::OK();
}

rocksdb::Status FusionEngine::Fuse(const std::vector<LabeledList>& lists,
                                   std::vector<FusedResult>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  rocksdb::Status s = Validate();
  if (!s.ok()) return s;

  std::unordered_map<std::string, size_t> index;  // chunk_id -> position in out
  // Rank of the occurrence behind best_*_scores, per adapter.
  std::vector<std::map<AdapterKind, size_t>> best_rank;

  for (const auto& labeled : lists) {
    if (labeled.list.Empty()) continue;
    const AdapterKind adapter = labeled.list.Adapter();

    for (const auto& item : labeled.list) {
      auto [it, inserted] = index.emplace(item.chunk_id, out->size());
      if (inserted) {
        FusedResult r;
        r.chunk_id = item.chunk_id;
        out->push_back(std::move(r));
        best_rank.emplace_back();
      }
      FusedResult& r = (*out)[it->second];
      r.fused_score += 1.0 / (k_rrf_ + static_cast<double>(item.rank));
      r.contributing_lists.push_back(labeled.list_id);
      r.contributions.push_back(ListContribution{labeled.list_id, adapter, item.rank,
                                                 item.raw_score, item.normalised_score});

      auto& ranks = best_rank[it->second];
      auto br = ranks.find(adapter);
      if (br == ranks.end() || item.rank < br->second) {
        ranks[adapter] = item.rank;
        r.best_raw_scores[adapter] = item.raw_score;
        r.best_normalised_scores[adapter] = item.normalised_score;
      }
    }
  }

  std::sort(out->begin(), out->end(), [](const FusedResult& a, const FusedResult& b) {
    if (a.fused_score != b.fused_score) return a.fused_score > b.fused_score;
    return a.chunk_id < b.chunk_id;
  });
  return rocksdb::Status::OK();
}

}  // namespace ragrank
