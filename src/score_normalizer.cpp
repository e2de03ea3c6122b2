#include <ragrank/score_normalizer.hpp>

#include <algorithm>
#include <cmath>

namespace ragrank {

namespace {

inline double Clamp01(double v) {
  if (v < 0.0) return 0.0;
  if (v > 1.0) return 1.0;
  return v;
}

double MinMax(double raw, const BatchContext& batch) {
  if (batch.size <= 1) return 1.0;
  double spread = batch.max - batch.min;
  if (!(spread > 0.0) || !std::isfinite(spread)) return 1.0;
  if (std::isinf(raw)) return raw > 0 ? 1.0 : 0.0;
  return Clamp01((raw - batch.min) / spread);
}

}  // namespace

BatchContext BatchContext::FromScores(const std::vector<double>& raw_scores) {
  BatchContext ctx;
  for (double s : raw_scores) {
    if (!std::isfinite(s)) continue;
    if (ctx.size == 0) {
      ctx.min = ctx.max = s;
    } else {
      ctx.min = std::min(ctx.min, s);
      ctx.max = std::max(ctx.max, s);
    }
    ++ctx.size;
  }
  return ctx;
}

double NormalizeScore(double raw_score, NativeMetric metric, const BatchContext& batch) {
  if (std::isnan(raw_score)) return 0.0;

  switch (metric) {
    case NativeMetric::kCosine: {
      double s = std::max(-1.0, std::min(1.0, raw_score));
      return Clamp01((s + 1.0) / 2.0);
    }
    case NativeMetric::kL2: {
      if (std::isinf(raw_score)) return raw_score > 0 ? 0.0 : 1.0;
      double d = std::max(0.0, raw_score);
      return Clamp01(1.0 / (1.0 + d));
    }
    case NativeMetric::kDot:
    case NativeMetric::kUnknownRange:
      return MinMax(raw_score, batch);
  }
  return 0.0;
}

std::vector<double> NormalizeScores(const std::vector<double>& raw_scores,
                                    NativeMetric metric) {
  BatchContext batch = BatchContext::FromScores(raw_scores);
  std::vector<double> out;
  out.reserve(raw_scores.size());
  for (double s : raw_scores) {
    out.push_back(NormalizeScore(s, metric, batch));
  }
  return out;
}

}  // namespace ragrank
