#include <ragrank/aggregator.hpp>

#include <ragrank/errors.hpp>
#include <ragrank/text_analyzer.hpp>

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace ragrank {

rocksdb::Status ParseAggregationMethod(std::string_view name, AggregationMethod* out) {
  const std::string key = internal::FoldCase(name);
  if (key == "max") {
    *out = AggregationMethod::kMax;
  } else if (key == "sum") {
    *out = AggregationMethod::kSum;
  } else if (key == "weighted") {
    *out = AggregationMethod::kWeighted;
  } else {
    return ConfigurationError("unknown aggregation method: " + std::string(name));
  }
  return rocksdb::Status::OK();
}

std::string_view AggregationMethodName(AggregationMethod method) {
  switch (method) {
    case AggregationMethod::kMax:
      return "max";
    case AggregationMethod::kSum:
      return "sum";
    case AggregationMethod::kWeighted:
      return "weighted";
  }
  return "unknown";
}

rocksdb::Status Aggregator::Validate() const {
  if (!(opt_.weighted_decay > 0.0 && opt_.weighted_decay <= 1.0)) {
    return ConfigurationError("weighted_decay must be in (0, 1], got " +
                              std::to_string(opt_.weighted_decay));
  }
  return rocksdb::Status::OK();
}

double Aggregator::EffectiveWeight(const SubQuery& sub_query, size_t index) const {
  if (opt_.method != AggregationMethod::kWeighted) return sub_query.weight;
  return sub_query.weight * std::pow(opt_.weighted_decay, static_cast<double>(index));
}

rocksdb::Status Aggregator::Aggregate(const std::vector<SubQuery>& sub_queries,
                                      const std::vector<std::vector<FusedResult>>& fused,
                                      std::vector<AggregatedResult>* out) const {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  rocksdb::Status s = Validate();
  if (!s.ok()) return s;
  if (sub_queries.size() != fused.size()) {
    return rocksdb::Status::InvalidArgument(
        "expected one fused list per sub-query: " + std::to_string(sub_queries.size()) +
        " sub-queries, " + std::to_string(fused.size()) + " lists");
  }
  for (size_t i = 0; i < sub_queries.size(); ++i) {
    const double w = sub_queries[i].weight;
    if (!std::isfinite(w) || w <= 0.0) {
      return ConfigurationError("sub-query " + std::to_string(i) +
                                " weight must be a finite value > 0");
    }
  }

  std::unordered_map<std::string, size_t> index;
  for (size_t i = 0; i < sub_queries.size(); ++i) {
    const double weight = EffectiveWeight(sub_queries[i], i);

    for (const auto& f : fused[i]) {
      auto [it, inserted] = index.emplace(f.chunk_id, out->size());
      if (inserted) {
        AggregatedResult r;
        r.chunk_id = f.chunk_id;
        out->push_back(std::move(r));
      }
      AggregatedResult& r = (*out)[it->second];

      const double score = weight * f.fused_score;
      // A chunk appears at most once per fused list; keep the best if not.
      auto sq = r.sub_query_scores.find(i);
      if (sq == r.sub_query_scores.end()) {
        r.sub_query_scores.emplace(i, score);
        r.matched_sub_queries.push_back(i);
      } else {
        sq->second = std::max(sq->second, score);
      }

      for (const auto& c : f.contributions) {
        r.attributions.push_back(
            Attribution{i, c.adapter, c.rank, c.raw_score, c.normalised_score});
      }
    }
  }

  for (auto& r : *out) {
    double agg = 0.0;
    for (const auto& [i, score] : r.sub_query_scores) {
      if (opt_.method == AggregationMethod::kMax) {
        agg = std::max(agg, score);
      } else {
        agg += score;
      }
    }
    r.aggregate_score = agg;
    std::sort(r.matched_sub_queries.begin(), r.matched_sub_queries.end());
  }

  std::sort(out->begin(), out->end(),
            [](const AggregatedResult& a, const AggregatedResult& b) {
              if (a.aggregate_score != b.aggregate_score) {
                return a.aggregate_score > b.aggregate_score;
              }
              return a.chunk_id < b.chunk_id;
            });
  return rocksdb::Status::OK();
}

}  // namespace ragrank
